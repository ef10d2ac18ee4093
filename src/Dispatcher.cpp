#include "lobsync/Dispatcher.hpp"

#include <iostream>

namespace lobsync {
    Dispatcher::Dispatcher(boost::asio::io_context &ioc,
                           ReplicatorConfig cfg,
                           TransportFactory make_transport,
                           std::shared_ptr<ISnapshotSource> snapshots,
                           StreamSession::FrameCallback on_frame)
        : ioc_(ioc),
          cfg_(std::move(cfg)),
          make_transport_(std::move(make_transport)),
          snapshots_(std::move(snapshots)),
          on_frame_(std::move(on_frame)),
          registry_(ioc) {
    }

    Status Dispatcher::start() {
        if (started_) return Status::ERROR;

        if (const std::string problem = validate(cfg_); !problem.empty()) {
            std::cerr << "[Dispatcher] invalid config: " << problem << "\n";
            return Status::ERROR;
        }
        if (!make_transport_ || !snapshots_) {
            std::cerr << "[Dispatcher] no transport factory or snapshot source\n";
            return Status::ERROR;
        }
        started_ = true;

        for (const auto &symbol: cfg_.symbols) {
            SessionConfig sc;
            sc.symbol = symbol;
            sc.kind = infer_market_kind(symbol);
            sc.depth_limit = cfg_.depth_limit;
            sc.pace = cfg_.pace;
            sc.endpoints = cfg_.endpoints;

            const std::string id = make_session_id(sc.kind, sc.symbol);
            if (sessions_.count(id) > 0) {
                std::cerr << "[Dispatcher] Warning: " << symbol << " listed twice, keeping the first session\n";
                continue;
            }

            auto session = StreamSession::create(ioc_, registry_, make_transport_(sc), snapshots_, sc, on_frame_);
            session->set_on_terminated([this](const std::string &sid, std::exception_ptr error) {
                if (error) {
                    ++failed_;
                    try {
                        std::rethrow_exception(error);
                    } catch (const std::exception &ex) {
                        std::cerr << "[Dispatcher] session " << sid << " stopped: " << ex.what()
                                << " (other symbols unaffected)\n";
                    }
                }
                if (++closed_ == sessions_.size() && on_all_closed_) on_all_closed_();
            });

            if (!registry_.start(id, [session] { session->start(); })) continue;
            sessions_.emplace(id, std::move(session));
        }

        std::cout << "[Dispatcher] started " << sessions_.size() << " session(s)\n";
        return Status::OK;
    }

    Status Dispatcher::stop() {
        if (!started_ || stopped_) return Status::ERROR;
        stopped_ = true;

        registry_.shutdown();
        return Status::OK;
    }

    std::shared_ptr<StreamSession> Dispatcher::find(const std::string &symbol) const {
        const auto it = sessions_.find(make_session_id(infer_market_kind(symbol), symbol));
        return it == sessions_.end() ? nullptr : it->second;
    }
} // namespace lobsync
