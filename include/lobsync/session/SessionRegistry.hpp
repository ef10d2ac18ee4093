#pragma once

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lobsync {
    /**
     * @brief Process-wide table of live stream sessions.
     *
     * Holds the open set (session ids whose loop may re-arm) and, per open id, the
     * cancel handle of its single in-flight receive. Constructed at process start and
     * passed by reference to whatever spawns sessions; shutdown() at process end.
     *
     * Mutations are serialized with a mutex, so shutdown() may come from a signal
     * handler thread while sessions run on the event loop.
     */
    class SessionRegistry {
    public:
        using Runner = std::function<void()>;
        using CancelFn = std::function<void()>;

        explicit SessionRegistry(boost::asio::io_context &ioc) : ioc_(ioc) {
        }

        SessionRegistry(const SessionRegistry &) = delete;

        SessionRegistry &operator=(const SessionRegistry &) = delete;

        /**
         * Launch `runner` as its own unit of work on the event loop.
         * Returns false (and logs) when `session_id` is already open or starting.
         */
        bool start(const std::string &session_id, Runner runner);

        /**
         * Move a starting session into the open set once its connection is up.
         * Throws DuplicateSessionError when the id is already open.
         * Returns false when the id is no longer expected (shutdown raced the connect).
         */
        bool register_open(const std::string &session_id);

        /// Record how to abort a starting session's connect (ignored for ids not launched by start()).
        /// Returns false once shutdown has begun; the caller must abort the connect itself.
        bool set_connecting(const std::string &session_id, CancelFn abort);

        /// Called by a session loop when it terminates on its own (error, peer close).
        void release(const std::string &session_id);

        [[nodiscard]] bool is_open(const std::string &session_id) const;

        /// Record the in-flight receive of an open session. At most one per id.
        /// Returns false when the id is not open; the caller must cancel the receive itself.
        bool set_pending(const std::string &session_id, CancelFn cancel);

        void clear_pending(const std::string &session_id);

        [[nodiscard]] bool has_pending(const std::string &session_id) const;

        /**
         * Cancel every pending receive, abort connects still in progress and clear the open set.
         * Does not wait for the loops to unwind; each observes closure on its next check.
         */
        void shutdown();

        [[nodiscard]] bool is_shut_down() const;

        [[nodiscard]] std::size_t open_count() const;
        [[nodiscard]] std::size_t pending_count() const;
        [[nodiscard]] std::vector<std::string> open_ids() const;

    private:
        boost::asio::io_context &ioc_;

        mutable std::mutex mx_;
        std::unordered_set<std::string> starting_;
        std::unordered_set<std::string> open_;
        std::unordered_map<std::string, CancelFn> pending_;
        std::unordered_map<std::string, CancelFn> connecting_;
        bool shut_down_{false};
    };
} // namespace lobsync
