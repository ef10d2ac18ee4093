#pragma once

#include <stdexcept>
#include <string>

namespace lobsync {
    /// REST bootstrap failed: transport error, non-2xx status or a body that is not a depth snapshot.
    class SnapshotFetchError : public std::runtime_error {
    public:
        SnapshotFetchError(const std::string &what, int http_status, std::string body)
            : std::runtime_error(what),
              http_status_(http_status),
              body_(std::move(body)) {
        }

        /// 0 when no HTTP response was received.
        [[nodiscard]] int http_status() const noexcept { return http_status_; }
        [[nodiscard]] const std::string &body() const noexcept { return body_; }

    private:
        int http_status_{0};
        std::string body_;
    };

    /// A session id that is already open was registered a second time.
    class DuplicateSessionError : public std::runtime_error {
    public:
        explicit DuplicateSessionError(const std::string &session_id)
            : std::runtime_error("session already open: " + session_id),
              session_id_(session_id) {
        }

        [[nodiscard]] const std::string &session_id() const noexcept { return session_id_; }

    private:
        std::string session_id_;
    };

    /// A received frame is not the structured data we expect.
    class MalformedFrameError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// The websocket transport failed (connect, read, ping) or was closed by the peer.
    class ConnectionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Programming error against the book's preconditions.
    class BookInvariantError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };
} // namespace lobsync
