#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lobsync/md/MarketEndpoints.hpp"
#include "lobsync/orderbook/PriceLevelBook.hpp"

namespace lobsync {
    /// REST depth snapshot.
    struct DepthSnapshot {
        std::uint64_t lastUpdateId{0};
        std::vector<Level> bids;
        std::vector<Level> asks;
    };

    /// One "depthUpdate" event. Quantities are absolute; 0 removes the level.
    struct DepthDelta {
        std::string symbol;
        std::int64_t event_time_ms{0};
        std::uint64_t first_update_id{0}; // "U", informational
        std::uint64_t last_update_id{0}; // "u", informational
        std::vector<Level> bids;
        std::vector<Level> asks;
    };

    /**
     * Decodes a websocket text frame into the event payload.
     * Derivative combined-stream frames are unwrapped from their "data" envelope.
     * Throws MalformedFrameError when the frame is not a JSON object of the expected shape.
     */
    nlohmann::json parse_frame(std::string_view raw, MarketKind kind);

    /// True for {"e": "depthUpdate", ...} payloads.
    bool is_depth_update(const nlohmann::json &payload) noexcept;

    /// Throws MalformedFrameError on missing fields or non-decimal levels.
    DepthDelta parse_depth_delta(const nlohmann::json &payload);

    /// Throws SnapshotFetchError (carrying the raw body) when the body is not a depth snapshot.
    DepthSnapshot parse_depth_snapshot(std::string_view body, int http_status = 200);
} // namespace lobsync
