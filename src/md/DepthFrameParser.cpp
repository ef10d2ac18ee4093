#include "lobsync/md/DepthFrameParser.hpp"

#include <iostream>

#include "lobsync/md/Errors.hpp"
#include "lobsync/utils/DebugConfigUtils.hpp"

using json = nlohmann::json;

namespace lobsync {
    namespace {
        /// [["price", "qty", ...], ...] -> levels. Throws std::invalid_argument with a short reason.
        std::vector<Level> parse_levels(const json &arr, const char *field) {
            if (!arr.is_array()) {
                throw std::invalid_argument(std::string("'") + field + "' is not an array");
            }

            std::vector<Level> out;
            out.reserve(arr.size());
            for (const auto &lvl: arr) {
                if (!lvl.is_array() || lvl.size() < 2 || !lvl[0].is_string() || !lvl[1].is_string()) {
                    throw std::invalid_argument(std::string("bad level entry in '") + field + "'");
                }
                const auto &px_str = lvl[0].get_ref<const std::string &>();
                const auto &qty_str = lvl[1].get_ref<const std::string &>();

                const auto px = Decimal::parse(px_str);
                const auto qty = Decimal::parse(qty_str);
                if (!px || !qty) {
                    throw std::invalid_argument("non-decimal level [" + px_str + ", " + qty_str + "]");
                }
                out.push_back(Level{*px, *qty});
            }
            return out;
        }

        std::uint64_t u64_or_zero(const json &j, const char *key) {
            const auto it = j.find(key);
            if (it == j.end() || !it->is_number_unsigned()) return 0;
            return it->get<std::uint64_t>();
        }
    } // namespace

    json parse_frame(std::string_view raw, MarketKind kind) {
        json j = json::parse(raw.begin(), raw.end(), nullptr, false);
        if (j.is_discarded()) {
            if (debug::dbg_on()) {
                std::cerr << "[DepthFrameParser] json parse failed\n";
                debug::dbg_raw(raw);
            }
            throw MalformedFrameError("frame is not valid JSON");
        }
        if (!j.is_object()) {
            throw MalformedFrameError("frame is not a JSON object");
        }

        if (kind == MarketKind::DERIVATIVE) {
            auto it = j.find("data");
            if (it == j.end() || !it->is_object()) {
                throw MalformedFrameError("derivative frame has no 'data' object");
            }
            return std::move(*it);
        }
        return j;
    }

    bool is_depth_update(const json &payload) noexcept {
        const auto it = payload.find("e");
        return it != payload.end() && it->is_string() && it->get_ref<const std::string &>() == "depthUpdate";
    }

    DepthDelta parse_depth_delta(const json &payload) {
        DepthDelta update;

        const auto s = payload.find("s");
        if (s == payload.end() || !s->is_string()) {
            throw MalformedFrameError("depth update without symbol 's'");
        }
        if (!payload.contains("b") || !payload.contains("a")) {
            throw MalformedFrameError("depth update without 'b'/'a' arrays");
        }

        update.symbol = s->get<std::string>();

        const auto e = payload.find("E");
        if (e != payload.end() && e->is_number_integer()) update.event_time_ms = e->get<std::int64_t>();
        update.first_update_id = u64_or_zero(payload, "U");
        update.last_update_id = u64_or_zero(payload, "u");

        try {
            update.bids = parse_levels(payload["b"], "b");
            update.asks = parse_levels(payload["a"], "a");
        } catch (const std::invalid_argument &ex) {
            throw MalformedFrameError(std::string("depth update for ") + update.symbol + ": " + ex.what());
        }

        if (debug::dbg_on()) {
            static std::uint64_t inc_cnt = 0;
            if (debug::dbg_sample(inc_cnt)) {
                std::cerr << "[DepthFrameParser][INC#" << inc_cnt << "] " << update.symbol;
                if (debug::show_seq.load(std::memory_order_relaxed)) {
                    std::cerr << " first=" << update.first_update_id
                            << " last=" << update.last_update_id;
                }
                std::cerr << " b=" << update.bids.size()
                        << " a=" << update.asks.size() << "\n";
            }
        }

        return update;
    }

    DepthSnapshot parse_depth_snapshot(std::string_view body, int http_status) {
        json j = json::parse(body.begin(), body.end(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            throw SnapshotFetchError("snapshot body is not a JSON object", http_status, std::string(body));
        }
        if (!j.contains("bids") || !j.contains("asks")) {
            throw SnapshotFetchError("snapshot body has no 'bids'/'asks'", http_status, std::string(body));
        }

        DepthSnapshot snap;
        snap.lastUpdateId = u64_or_zero(j, "lastUpdateId");
        try {
            snap.bids = parse_levels(j["bids"], "bids");
            snap.asks = parse_levels(j["asks"], "asks");
        } catch (const std::invalid_argument &ex) {
            throw SnapshotFetchError(std::string("malformed snapshot: ") + ex.what(), http_status, std::string(body));
        }

        if (debug::dbg_on()) {
            std::cerr << "[DepthFrameParser][SNAPSHOT] "
                    << "seqId=" << snap.lastUpdateId
                    << " bids=" << snap.bids.size()
                    << " asks=" << snap.asks.size() << "\n";
            debug::dbg_levels("bid", snap.bids);
            debug::dbg_levels("ask", snap.asks);
            debug::dbg_raw(body);
        }

        return snap;
    }
} // namespace lobsync
