#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "lobsync/md/MarketEndpoints.hpp"

namespace lobsync {
    /**
     * @brief One-shot HTTPS GET.
     *
     * Create one instance per request. The handler runs exactly once, on the client's strand:
     *  - ec == errc::protocol_error for a non-2xx response; status and body are kept.
     *  - ec == errc::timed_out when the request deadline passes.
     *  - status == 0 when no response was read.
     */
    class RestClient : public std::enable_shared_from_this<RestClient> {
    public:
        using ResponseHandler = std::function<void(boost::system::error_code ec, int status, std::string body)>;
        using LogFn = std::function<void(std::string_view)>;

        static std::shared_ptr<RestClient> create(boost::asio::io_context &ioc) {
            return std::shared_ptr<RestClient>(new RestClient(ioc));
        }

        RestClient(const RestClient &) = delete;

        RestClient &operator=(const RestClient &) = delete;

        void set_logger(LogFn fn) { logger_ = std::move(fn); }
        void set_timeout(std::chrono::milliseconds t) { timeout_ = t; }
        void set_body_limit(std::size_t bytes) { body_limit_ = bytes; }

        /// `server` supplies host and port; `target` is path plus query.
        void async_get(const EndPoint &server, std::string target, ResponseHandler handler);

    private:
        explicit RestClient(boost::asio::io_context &ioc);

        void on_resolve_(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);

        void on_connect_(boost::beast::error_code ec, boost::asio::ip::tcp::endpoint);

        void on_handshake_(boost::beast::error_code ec);

        void on_write_(boost::beast::error_code ec, std::size_t);

        void on_read_(boost::beast::error_code ec, std::size_t);

        void on_shutdown_(boost::beast::error_code ec);

        /// Before the TLS session exists there is nothing to shut down.
        void abort_(boost::beast::error_code ec);

        void complete_(boost::beast::error_code ec);

        void log_(std::string_view msg) const {
            if (logger_) logger_(msg);
        }

    private:
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        boost::asio::ssl::context tls_;
        boost::asio::ip::tcp::resolver resolver_;
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream_;

        boost::beast::flat_buffer buffer_;
        boost::beast::http::request<boost::beast::http::empty_body> request_;
        boost::beast::http::response_parser<boost::beast::http::string_body> parser_;

        std::string host_;
        ResponseHandler handler_;
        bool started_{false};

        /// Depth-1000 snapshots run to a few hundred KiB.
        std::size_t body_limit_{8 * 1024 * 1024};
        std::chrono::milliseconds timeout_{5000};

        LogFn logger_;
    };
} // namespace lobsync
