#pragma once

#include <string>
#include <string_view>

namespace lobsync {
    /**
     * @brief Key-value publish target for per-symbol book snapshots.
     * The payload is opaque to the sink; the latest payload per key wins.
     */
    struct IPublishSink {
        virtual ~IPublishSink() = default;

        virtual void publish(std::string_view key, std::string payload) = 0;
    };
} // namespace lobsync
