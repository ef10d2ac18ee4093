#include "lobsync/session/StreamSession.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <iostream>

#include "lobsync/md/Errors.hpp"

namespace lobsync {
    const char *to_string(StreamSession::State s) {
        switch (s) {
            case StreamSession::State::CREATED: return "CREATED";
            case StreamSession::State::CONNECTING: return "CONNECTING";
            case StreamSession::State::OPEN: return "OPEN";
            case StreamSession::State::CLOSING: return "CLOSING";
            case StreamSession::State::CLOSED: return "CLOSED";
            default: return "UNKNOWN";
        }
    }

    std::shared_ptr<StreamSession> StreamSession::create(boost::asio::io_context &ioc,
                                                         SessionRegistry &registry,
                                                         std::shared_ptr<IStreamTransport> transport,
                                                         std::shared_ptr<ISnapshotSource> snapshots,
                                                         SessionConfig cfg,
                                                         FrameCallback on_frame) {
        return std::shared_ptr<StreamSession>(new StreamSession(ioc, registry, std::move(transport),
                                                                std::move(snapshots), std::move(cfg),
                                                                std::move(on_frame)));
    }

    StreamSession::StreamSession(boost::asio::io_context &ioc,
                                 SessionRegistry &registry,
                                 std::shared_ptr<IStreamTransport> transport,
                                 std::shared_ptr<ISnapshotSource> snapshots,
                                 SessionConfig cfg,
                                 FrameCallback on_frame)
        : ioc_(ioc),
          strand_(ioc.get_executor()),
          pace_timer_(ioc),
          registry_(registry),
          transport_(std::move(transport)),
          snapshots_(std::move(snapshots)),
          cfg_(std::move(cfg)),
          id_(make_session_id(cfg_.kind, cfg_.symbol)),
          on_frame_cb_(std::move(on_frame)) {
    }

    void StreamSession::start() {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self] {
            if (self->state_ != State::CREATED) {
                std::cerr << "[StreamSession] " << self->id_ << " start() in state "
                        << to_string(self->state_) << ", ignored\n";
                return;
            }

            /// CREATED -> CONNECTING: resolve the stream endpoint, book starts empty.
            self->state_ = State::CONNECTING;
            self->endpoint_ = ws_endpoint(self->cfg_.kind, self->cfg_.symbol, self->cfg_.endpoints);
            self->book_.clear();

            std::cout << "[StreamSession] Starting stream: " << to_url(self->endpoint_, "wss") << "\n";

            self->transport_->async_connect(self->endpoint_, [self](boost::system::error_code ec) {
                boost::asio::dispatch(self->strand_, [self, ec] { self->on_connect_(ec); });
            });

            // Closing the transport completes the connect with operation_aborted.
            std::weak_ptr<IStreamTransport> weak = self->transport_;
            if (!self->registry_.set_connecting(self->id_, [weak] {
                if (auto t = weak.lock()) t->close();
            })) {
                self->transport_->close();
            }
        });
    }

    void StreamSession::on_connect_(boost::system::error_code ec) {
        if (state_ != State::CONNECTING) return;

        if (ec) {
            if (ec == boost::asio::error::operation_aborted || registry_.is_shut_down()) {
                finish_(nullptr);
                return;
            }
            std::cerr << "[StreamSession] " << id_ << " connect failed: " << ec.message() << "\n";
            finish_(std::make_exception_ptr(
                ConnectionError("connect to " + to_url(endpoint_, "wss") + " failed: " + ec.message())));
            return;
        }

        /// CONNECTING -> OPEN
        try {
            if (!registry_.register_open(id_)) {
                std::cout << "[StreamSession] " << id_ << " cancelled before open\n";
                finish_(nullptr);
                return;
            }
        } catch (const DuplicateSessionError &ex) {
            std::cerr << "[StreamSession] Warning: " << ex.what() << ", discarding new connection\n";
            finish_(std::current_exception(), /*release*/false);
            return;
        }

        state_ = State::OPEN;
        std::cout << "[StreamSession] " << id_ << " open\n";
        receive_next_();
    }

    void StreamSession::receive_next_() {
        if (state_ != State::OPEN) return;

        // Loop condition: a shutdown removed us from the open set.
        if (!registry_.is_open(id_)) {
            finish_(nullptr);
            return;
        }

        auto self = shared_from_this();
        transport_->async_receive([self](boost::system::error_code ec, std::string raw) {
            boost::asio::dispatch(self->strand_, [self, ec, raw = std::move(raw)]() mutable {
                self->on_frame_(ec, std::move(raw));
            });
        });

        std::weak_ptr<IStreamTransport> weak = transport_;
        const bool recorded = registry_.set_pending(id_, [weak] {
            if (auto t = weak.lock()) t->cancel_receive();
        });
        if (!recorded) {
            // Shutdown won the race between the loop check and recording the receive.
            transport_->cancel_receive();
        }
    }

    void StreamSession::on_frame_(boost::system::error_code ec, std::string raw) {
        registry_.clear_pending(id_);
        if (state_ != State::OPEN) return;

        if (ec == boost::asio::error::operation_aborted || !registry_.is_open(id_)) {
            std::cout << "[StreamSession] " << id_ << " receive cancelled\n";
            finish_(nullptr);
            return;
        }

        if (ec) {
            std::cerr << "[StreamSession] " << id_ << " receive failed: " << ec.message() << "\n";
            finish_(std::make_exception_ptr(ConnectionError(id_ + ": receive failed: " + ec.message())));
            return;
        }

        nlohmann::json payload;
        DepthDelta delta;
        bool is_depth = false;
        try {
            payload = parse_frame(raw, cfg_.kind);
            if (is_depth_update(payload)) {
                delta = parse_depth_delta(payload);
                is_depth = true;

                if (!boost::algorithm::iequals(delta.symbol, cfg_.symbol)) {
                    throw MalformedFrameError("depth update for " + delta.symbol + " on the " + cfg_.symbol + " stream");
                }
            }
        } catch (const MalformedFrameError &ex) {
            std::cerr << "[StreamSession] " << id_ << " malformed frame: " << ex.what() << "\n";
            finish_(std::current_exception());
            return;
        }

        if (is_depth && book_.is_empty()) {
            bootstrap_(std::move(payload), std::move(delta));
            return;
        }

        if (is_depth) apply_delta_(delta);
        deliver_(payload);
        schedule_next_();
    }

    void StreamSession::bootstrap_(nlohmann::json payload, DepthDelta delta) {
        std::cout << "[StreamSession] " << id_ << " book empty, requesting REST snapshot...\n";

        // No receive is armed until the snapshot lands, so later deltas wait in the socket.
        SnapshotRequest req{cfg_.symbol, cfg_.kind, cfg_.depth_limit};
        auto self = shared_from_this();
        snapshots_->async_fetch(req, [self, payload = std::move(payload), delta = std::move(delta)](
                            std::exception_ptr error, DepthSnapshot snap) mutable {
                                    boost::asio::dispatch(self->strand_, [self, error, snap = std::move(snap),
                                                              payload = std::move(payload),
                                                              delta = std::move(delta)]() mutable {
                                                              self->on_snapshot_(error, std::move(snap),
                                                                                 std::move(payload), std::move(delta));
                                                          });
                                });
    }

    void StreamSession::on_snapshot_(std::exception_ptr error, DepthSnapshot snap,
                                     nlohmann::json payload, DepthDelta delta) {
        if (state_ != State::OPEN) return;

        if (error) {
            try {
                std::rethrow_exception(error);
            } catch (const SnapshotFetchError &ex) {
                std::cerr << "[StreamSession] " << id_ << " snapshot failed: " << ex.what()
                        << " body=" << ex.body() << "\n";
            } catch (const std::exception &ex) {
                std::cerr << "[StreamSession] " << id_ << " snapshot failed: " << ex.what() << "\n";
            }
            finish_(error);
            return;
        }

        try {
            book_.apply_snapshot(snap.bids, snap.asks);
        } catch (const BookInvariantError &ex) {
            std::cerr << "[StreamSession] " << id_ << " " << ex.what() << "\n";
            finish_(std::current_exception());
            return;
        }
        ++snapshots_applied_;

        std::cout << "[StreamSession] " << id_ << " snapshot applied lastUpdateId=" << snap.lastUpdateId
                << " bids=" << book_.bid_count() << " asks=" << book_.ask_count() << "\n";

        // Snapshot first, then the delta that triggered it.
        apply_delta_(delta);
        deliver_(payload);
        schedule_next_();
    }

    void StreamSession::apply_delta_(const DepthDelta &delta) {
        for (const Level &lvl: delta.asks) book_.apply_delta(Side::ASK, lvl.price, lvl.quantity);
        for (const Level &lvl: delta.bids) book_.apply_delta(Side::BID, lvl.price, lvl.quantity);
    }

    void StreamSession::deliver_(const nlohmann::json &payload) {
        ++frames_delivered_;
        if (!on_frame_cb_) return;

        try {
            on_frame_cb_(payload, book_);
        } catch (const std::exception &ex) {
            // The consumer's failure does not corrupt the replica; keep streaming.
            std::cerr << "[StreamSession] " << id_ << " frame callback threw: " << ex.what() << "\n";
        }
    }

    void StreamSession::schedule_next_() {
        auto self = shared_from_this();
        if (cfg_.pace.count() <= 0) {
            boost::asio::post(strand_, [self] { self->receive_next_(); });
            return;
        }

        pace_timer_.expires_after(cfg_.pace);
        pace_timer_.async_wait(boost::asio::bind_executor(strand_, [self](const boost::system::error_code &ec) {
            if (ec) return; // canceled by finish_()
            self->receive_next_();
        }));
    }

    void StreamSession::finish_(std::exception_ptr error, bool release) {
        if (state_ == State::CLOSED || state_ == State::CLOSING) return;

        /// OPEN -> CLOSING -> CLOSED
        state_ = State::CLOSING;
        pace_timer_.cancel();
        if (release) registry_.release(id_);
        transport_->close();

        last_error_ = error;
        state_ = State::CLOSED;

        if (error) {
            std::cerr << "[StreamSession] " << id_ << " closed with error\n";
        } else {
            std::cout << "[StreamSession] " << id_ << " closed\n";
        }

        if (on_terminated_) on_terminated_(id_, error);
    }
} // namespace lobsync
