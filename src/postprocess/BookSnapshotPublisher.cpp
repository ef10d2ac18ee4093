#include "lobsync/postprocess/BookSnapshotPublisher.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "lobsync/md/DepthFrameParser.hpp"
#include "lobsync/utils/DebugConfigUtils.hpp"

namespace lobsync {
    namespace {
        nlohmann::json levels_to_json(const std::vector<Level> &levels) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &lvl: levels) {
                arr.push_back(nlohmann::json::array({lvl.price.to_string(), lvl.quantity.to_string()}));
            }
            return arr;
        }
    } // namespace

    std::string format_exchange_ts(std::int64_t ms_since_epoch) {
        const std::chrono::system_clock::time_point tp{std::chrono::milliseconds(ms_since_epoch)};
        const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
        std::int64_t millis = ms_since_epoch % 1000;
        if (millis < 0) millis += 1000;

        std::tm utc{};
        gmtime_r(&secs, &utc);

        std::ostringstream os;
        os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
                << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return os.str();
    }

    BookSnapshotPublisher::BookSnapshotPublisher(std::shared_ptr<IPublishSink> sink, std::size_t top_n)
        : sink_(std::move(sink)),
          top_n_(top_n) {
    }

    nlohmann::json BookSnapshotPublisher::make_payload(const std::string &symbol,
                                                       std::int64_t event_time_ms,
                                                       const PriceLevelBook &book,
                                                       std::size_t top_n) {
        nlohmann::json j;
        j["symbol"] = symbol;
        j["exchange_ts_ms"] = event_time_ms;
        j["exchange_ts"] = format_exchange_ts(event_time_ms);

        // Undefined with an empty side; never a made-up number.
        if (const auto spread = book.spread()) {
            j["spread"] = spread->to_string();
        } else {
            j["spread"] = nullptr;
        }

        j["bids"] = levels_to_json(book.top_bids(top_n));
        j["asks"] = levels_to_json(book.top_asks(top_n));
        return j;
    }

    void BookSnapshotPublisher::operator()(const nlohmann::json &frame, const PriceLevelBook &book) {
        if (!sink_ || !is_depth_update(frame)) return;

        const auto s = frame.find("s");
        if (s == frame.end() || !s->is_string()) return;
        const std::string &symbol = s->get_ref<const std::string &>();

        std::int64_t event_time_ms = 0;
        const auto e = frame.find("E");
        if (e != frame.end() && e->is_number_integer()) event_time_ms = e->get<std::int64_t>();

        if (debug::dbg_on() && book.is_crossed()) {
            std::cerr << "[BookSnapshotPublisher] " << symbol << " book is crossed at E=" << event_time_ms << "\n";
        }

        sink_->publish(symbol, make_payload(symbol, event_time_ms, book, top_n_).dump());
        ++published_;
    }
} // namespace lobsync
