#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <string_view>

#include "lobsync/abstract/SnapshotSource.hpp"
#include "lobsync/md/MarketEndpoints.hpp"

namespace lobsync {
    /**
     * @brief REST depth snapshot over HTTPS.
     *
     * One GET per call against the spot or derivative depth endpoint. Each call uses
     * its own RestClient, so sessions bootstrapping at the same time do not contend.
     * Failures are never retried here: the handler gets a SnapshotFetchError carrying
     * the HTTP status and raw body.
     */
    class SnapshotFetcher final : public ISnapshotSource {
    public:
        using LogFn = std::function<void(std::string_view)>;

        explicit SnapshotFetcher(boost::asio::io_context &ioc, EndpointOverrides overrides = {});

        void set_logger(LogFn fn) { logger_ = std::move(fn); }
        void set_timeout(std::chrono::milliseconds t) { timeout_ = t; }

        void async_fetch(const SnapshotRequest &req, FetchHandler handler) override;

    private:
        boost::asio::io_context &ioc_;
        EndpointOverrides overrides_;
        std::chrono::milliseconds timeout_{5000};
        LogFn logger_;
    };
} // namespace lobsync
