#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "lobsync/abstract/PublishSink.hpp"
#include "lobsync/orderbook/PriceLevelBook.hpp"

namespace lobsync {
    /**
     * @brief Frame callback that publishes {timestamp, spread, book} per symbol.
     *
     * Payload (JSON):
     *   {"symbol": "BTCUSDT", "exchange_ts_ms": 1700000000123, "exchange_ts": "2023-11-14T22:13:20.123Z",
     *    "spread": "0.01" | null, "bids": [["100.5","2"], ...], "asks": [["100.51","1"], ...]}
     *
     * bids are highest price first, asks lowest first, each cut to `top_n` levels (0 = all).
     * Only depth updates are published.
     */
    class BookSnapshotPublisher {
    public:
        BookSnapshotPublisher(std::shared_ptr<IPublishSink> sink, std::size_t top_n);

        void operator()(const nlohmann::json &frame, const PriceLevelBook &book);

        static nlohmann::json make_payload(const std::string &symbol,
                                           std::int64_t event_time_ms,
                                           const PriceLevelBook &book,
                                           std::size_t top_n);

        [[nodiscard]] std::uint64_t published() const noexcept { return published_; }

    private:
        std::shared_ptr<IPublishSink> sink_;
        std::size_t top_n_{10};
        std::uint64_t published_{0};
    };

    /// 1700000000123 -> "2023-11-14T22:13:20.123Z"
    std::string format_exchange_ts(std::int64_t ms_since_epoch);
} // namespace lobsync
