#pragma once

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "lobsync/Config.hpp"
#include "lobsync/abstract/SnapshotSource.hpp"
#include "lobsync/abstract/StreamTransport.hpp"
#include "lobsync/session/SessionRegistry.hpp"
#include "lobsync/session/StreamSession.hpp"

namespace lobsync {
    /**
     * @brief Wires the configured symbols to stream sessions.
     *
     * Lifecycle:
     *   1) start() : one session per configured symbol (duplicates collapse by session id).
     *   2) stop()  : SessionRegistry::shutdown(); idempotent, does not block.
     *
     * A session that terminates with an error is logged and left closed; the others keep running.
     */
    class Dispatcher {
    public:
        using TransportFactory = std::function<std::shared_ptr<IStreamTransport>(const SessionConfig &)>;

        Dispatcher(boost::asio::io_context &ioc,
                   ReplicatorConfig cfg,
                   TransportFactory make_transport,
                   std::shared_ptr<ISnapshotSource> snapshots,
                   StreamSession::FrameCallback on_frame);

        Dispatcher(const Dispatcher &) = delete;

        Dispatcher &operator=(const Dispatcher &) = delete;

        /// Runs once every started session has reached CLOSED, cleanly or not.
        void set_on_all_closed(std::function<void()> fn) { on_all_closed_ = std::move(fn); }

        Status start();

        Status stop();

        [[nodiscard]] SessionRegistry &registry() noexcept { return registry_; }
        [[nodiscard]] const std::map<std::string, std::shared_ptr<StreamSession> > &sessions() const noexcept {
            return sessions_;
        }

        /// nullptr when no session was created for that symbol.
        [[nodiscard]] std::shared_ptr<StreamSession> find(const std::string &symbol) const;

        [[nodiscard]] std::size_t failed_sessions() const noexcept { return failed_; }
        [[nodiscard]] std::size_t closed_sessions() const noexcept { return closed_; }

    private:
        boost::asio::io_context &ioc_;
        ReplicatorConfig cfg_;
        TransportFactory make_transport_;
        std::shared_ptr<ISnapshotSource> snapshots_;
        StreamSession::FrameCallback on_frame_;

        SessionRegistry registry_;
        std::map<std::string, std::shared_ptr<StreamSession> > sessions_;

        bool started_{false};
        bool stopped_{false};
        std::size_t failed_{0};
        std::size_t closed_{0};
        std::function<void()> on_all_closed_;
    };
} // namespace lobsync
