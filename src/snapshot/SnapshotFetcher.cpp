#include "lobsync/snapshot/SnapshotFetcher.hpp"

#include <iostream>

#include "lobsync/client_connection_handlers/RestClient.hpp"
#include "lobsync/md/Errors.hpp"

namespace lobsync {
    SnapshotFetcher::SnapshotFetcher(boost::asio::io_context &ioc, EndpointOverrides overrides)
        : ioc_(ioc),
          overrides_(std::move(overrides)) {
    }

    void SnapshotFetcher::async_fetch(const SnapshotRequest &req, FetchHandler handler) {
        const EndPoint rest = rest_endpoint(req.kind, overrides_);
        const std::string target = rest_snapshot_target(req.kind, req.symbol, req.depth_limit);

        auto client = RestClient::create(ioc_);
        client->set_timeout(timeout_);
        if (logger_) client->set_logger(logger_);

        std::cout << "[SnapshotFetcher] GET " << to_url({rest.host, rest.port, target}, "https") << "\n";

        // The lambda keeps the client alive until its single completion.
        client->async_get(rest, target,
                          [client, symbol = req.symbol, handler = std::move(handler)](
                      boost::system::error_code ec, int status, std::string body) {
                              if (ec) {
                                  std::cerr << "[SnapshotFetcher][GET][ERR] " << symbol
                                          << " status=" << status << " " << ec.message() << "\n";
                                  const std::string what = "snapshot request for " + symbol + " failed: " + ec.message()
                                                           + (status != 0 ? " (HTTP " + std::to_string(status) + ")" : "");
                                  handler(std::make_exception_ptr(SnapshotFetchError(what, status, std::move(body))), {});
                                  return;
                              }

                              DepthSnapshot snap;
                              try {
                                  snap = parse_depth_snapshot(body, status);
                              } catch (const SnapshotFetchError &) {
                                  std::cerr << "[SnapshotFetcher] malformed snapshot body for " << symbol << "\n";
                                  handler(std::current_exception(), {});
                                  return;
                              }

                              std::cout << "[SnapshotFetcher] " << symbol << " snapshot lastUpdateId=" << snap.lastUpdateId
                                      << " bids=" << snap.bids.size() << " asks=" << snap.asks.size() << "\n";
                              handler(nullptr, std::move(snap));
                          });
    }
} // namespace lobsync
