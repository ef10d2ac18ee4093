#include "lobsync/CmdLine.hpp"
#include "lobsync/Dispatcher.hpp"
#include "lobsync/client_connection_handlers/WsClient.hpp"
#include "lobsync/postprocess/BookSnapshotPublisher.hpp"
#include "lobsync/postprocess/FilePersistSink.hpp"
#include "lobsync/postprocess/MemoryPublishSink.hpp"
#include "lobsync/snapshot/SnapshotFetcher.hpp"
#include "lobsync/utils/DebugConfigUtils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>

int main(int argc, char **argv) {
    lobsync::CmdOptions options;
    if (!lobsync::parse_cmdline(argc, argv, options)) {
        return 1;
    }
    if (options.show_help) {
        return 0;
    }
    const lobsync::ReplicatorConfig &cfg = options.cfg;

    lobsync::debug::enabled.store(cfg.debug);
    lobsync::debug::raw.store(cfg.debug_raw);
    lobsync::debug::every.store(cfg.debug_every);
    lobsync::debug::raw_max.store(cfg.debug_raw_max);
    lobsync::debug::top_levels.store(cfg.debug_top);
    lobsync::debug::show_seq.store(cfg.debug_seq);

    std::cout << "[LOBSYNC] Starting\n"
            << "  symbols     = " << cfg.symbols.size() << "\n"
            << "  depth_limit = " << cfg.depth_limit << "\n"
            << "  pace_ms     = " << cfg.pace.count() << "\n"
            << "  publish_top = " << cfg.publish_top << "\n"
            << "  persist     = " << (cfg.persist_path.empty() ? "(none)" : cfg.persist_path) << "\n";

    boost::asio::io_context ioc;

    auto log = [](std::string_view msg) { std::cout << msg << "\n"; };

    auto snapshots = std::make_shared<lobsync::SnapshotFetcher>(ioc, cfg.endpoints);
    snapshots->set_logger(log);
    snapshots->set_timeout(cfg.rest_timeout);

    auto fanout = std::make_shared<lobsync::FanoutPublishSink>();
    fanout->add(std::make_shared<lobsync::MemoryPublishSink>());
    if (!cfg.persist_path.empty()) {
        auto file = std::make_shared<lobsync::FilePersistSink>(cfg.persist_path);
        if (!file->is_open()) {
            std::cerr << "[LOBSYNC] Warning: cannot open " << cfg.persist_path << ", persistence disabled\n";
        } else {
            fanout->add(std::move(file));
        }
    }
    auto publisher = std::make_shared<lobsync::BookSnapshotPublisher>(fanout, cfg.publish_top);

    lobsync::Dispatcher dispatcher(
        ioc, cfg,
        [&ioc, &cfg, log](const lobsync::SessionConfig &) {
            auto ws = lobsync::WsClient::create(ioc);
            ws->set_logger(log);
            ws->set_connect_timeout(cfg.connect_timeout);
            ws->set_idle_ping(cfg.ping_interval);
            return std::static_pointer_cast<lobsync::IStreamTransport>(ws);
        },
        snapshots,
        [publisher](const nlohmann::json &frame, const lobsync::PriceLevelBook &book) {
            (*publisher)(frame, book);
        });

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    dispatcher.set_on_all_closed([&signals] {
        std::cout << "[LOBSYNC] All sessions closed\n";
        signals.cancel();
    });

    if (dispatcher.start() != lobsync::Status::OK) {
        return 1;
    }

    // First signal: graceful stop. A second one while sessions unwind stops the loop outright.
    std::function<void(const boost::system::error_code &, int)> on_signal;
    on_signal = [&](const boost::system::error_code &ec, int sig) {
        if (ec) return;
        if (dispatcher.stop() == lobsync::Status::OK) {
            std::cout << "[LOBSYNC] Signal " << sig << " received, shutting down\n";
            signals.async_wait(on_signal);
            return;
        }
        std::cerr << "[LOBSYNC] Signal " << sig << " received again, forcing exit\n";
        ioc.stop();
    };
    signals.async_wait(on_signal);

    // Returns once every session has closed.
    ioc.run();

    std::cout << "[LOBSYNC] Stopped. published=" << publisher->published()
            << " failed_sessions=" << dispatcher.failed_sessions() << "\n";
    return dispatcher.failed_sessions() == 0 ? 0 : 2;
}
