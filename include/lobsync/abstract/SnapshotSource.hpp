#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <string>

#include "lobsync/md/DepthFrameParser.hpp"
#include "lobsync/md/MarketEndpoints.hpp"

namespace lobsync {
    struct SnapshotRequest {
        std::string symbol;
        MarketKind kind{MarketKind::SPOT};
        std::size_t depth_limit{1000};
    };

    /**
     * @brief One-shot depth snapshot provider.
     *
     * The handler runs exactly once, on the event loop. On failure `error` holds a
     * SnapshotFetchError and the snapshot is empty.
     */
    struct ISnapshotSource {
        using FetchHandler = std::function<void(std::exception_ptr error, DepthSnapshot snapshot)>;

        virtual ~ISnapshotSource() = default;

        virtual void async_fetch(const SnapshotRequest &req, FetchHandler handler) = 0;
    };
} // namespace lobsync
