#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "lobsync/abstract/SnapshotSource.hpp"
#include "lobsync/abstract/StreamTransport.hpp"
#include "lobsync/md/DepthFrameParser.hpp"
#include "lobsync/md/MarketEndpoints.hpp"
#include "lobsync/orderbook/PriceLevelBook.hpp"
#include "lobsync/session/SessionRegistry.hpp"

namespace lobsync {
    struct SessionConfig {
        std::string symbol; ///< e.g. "BTCUSDT", "BTCUSD_PERP"
        MarketKind kind{MarketKind::SPOT};
        std::size_t depth_limit{1000}; ///< REST snapshot depth
        std::chrono::milliseconds pace{100}; ///< delay after each processed frame
        EndpointOverrides endpoints;
    };

    /**
     * @brief One websocket, one symbol, one book replica.
     *
     * Lifecycle: CREATED -> CONNECTING -> OPEN -> CLOSING -> CLOSED.
     *
     * While OPEN the loop keeps exactly one receive outstanding, recorded in the
     * SessionRegistry as the session's pending operation. Each frame is parsed, merged
     * into the book (the first depth update on an empty book bootstraps it from a REST
     * snapshot before the update itself is applied), handed to the frame callback and
     * followed by a short pacing delay. The loop exits when the id leaves the registry's
     * open set; a receive aborted by shutdown is not an error.
     *
     * Terminal errors (stored in last_error()): SnapshotFetchError, MalformedFrameError,
     * ConnectionError, DuplicateSessionError. None of them affect other sessions.
     */
    class StreamSession : public std::enable_shared_from_this<StreamSession> {
    public:
        /// Runs inline on the session's loop after the frame has been merged; must not block.
        using FrameCallback = std::function<void(const nlohmann::json &frame, const PriceLevelBook &book)>;
        /// error == nullptr for a cancelled (clean) close.
        using TerminateHandler = std::function<void(const std::string &session_id, std::exception_ptr error)>;

        enum class State : std::uint8_t {
            CREATED,
            CONNECTING,
            OPEN,
            CLOSING,
            CLOSED
        };

        static std::shared_ptr<StreamSession> create(boost::asio::io_context &ioc,
                                                     SessionRegistry &registry,
                                                     std::shared_ptr<IStreamTransport> transport,
                                                     std::shared_ptr<ISnapshotSource> snapshots,
                                                     SessionConfig cfg,
                                                     FrameCallback on_frame);

        StreamSession(const StreamSession &) = delete;

        StreamSession &operator=(const StreamSession &) = delete;

        void set_on_terminated(TerminateHandler h) { on_terminated_ = std::move(h); }

        /// CREATED -> CONNECTING. Normally invoked as the registry's runner.
        void start();

        [[nodiscard]] const std::string &id() const noexcept { return id_; }
        [[nodiscard]] const std::string &symbol() const noexcept { return cfg_.symbol; }
        [[nodiscard]] MarketKind kind() const noexcept { return cfg_.kind; }
        [[nodiscard]] const EndPoint &endpoint() const noexcept { return endpoint_; }
        [[nodiscard]] State state() const noexcept { return state_; }
        [[nodiscard]] const PriceLevelBook &book() const noexcept { return book_; }
        [[nodiscard]] std::exception_ptr last_error() const noexcept { return last_error_; }

        [[nodiscard]] std::uint64_t frames_delivered() const noexcept { return frames_delivered_; }
        [[nodiscard]] std::uint64_t snapshots_applied() const noexcept { return snapshots_applied_; }

    private:
        StreamSession(boost::asio::io_context &ioc,
                      SessionRegistry &registry,
                      std::shared_ptr<IStreamTransport> transport,
                      std::shared_ptr<ISnapshotSource> snapshots,
                      SessionConfig cfg,
                      FrameCallback on_frame);

        void on_connect_(boost::system::error_code ec);

        void receive_next_();

        void on_frame_(boost::system::error_code ec, std::string raw);

        void bootstrap_(nlohmann::json payload, DepthDelta delta);

        void on_snapshot_(std::exception_ptr error, DepthSnapshot snap, nlohmann::json payload, DepthDelta delta);

        void apply_delta_(const DepthDelta &delta);

        void deliver_(const nlohmann::json &payload);

        void schedule_next_();

        /// Any state -> CLOSED. `release` is false when the id belongs to another session.
        void finish_(std::exception_ptr error, bool release = true);

    private:
        boost::asio::io_context &ioc_;
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        boost::asio::steady_timer pace_timer_;

        SessionRegistry &registry_;
        std::shared_ptr<IStreamTransport> transport_;
        std::shared_ptr<ISnapshotSource> snapshots_;

        SessionConfig cfg_;
        std::string id_;
        EndPoint endpoint_;

        FrameCallback on_frame_cb_;
        TerminateHandler on_terminated_;

        State state_{State::CREATED};
        PriceLevelBook book_;
        std::exception_ptr last_error_;

        std::uint64_t frames_delivered_{0};
        std::uint64_t snapshots_applied_{0};
    };

    const char *to_string(StreamSession::State s);
} // namespace lobsync
