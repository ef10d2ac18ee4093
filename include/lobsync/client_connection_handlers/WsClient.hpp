#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "lobsync/abstract/StreamTransport.hpp"

namespace lobsync {
    /**
     * @brief TLS websocket client driven one frame at a time.
     *
     * Every operation is serialized on an internal strand, so the public methods are
     * safe to call from any thread. Handlers run on that strand.
     *
     * The connect timeout bounds resolve-to-upgrade, DNS included. With an idle ping interval set, the
     * stream pings after that much silence and fails the pending read when no pong follows.
     */
    class WsClient final : public IStreamTransport, public std::enable_shared_from_this<WsClient> {
    public:
        using LogFn = std::function<void(std::string_view)>;

        static std::shared_ptr<WsClient> create(boost::asio::io_context &ioc) {
            return std::shared_ptr<WsClient>(new WsClient(ioc));
        }

        WsClient(const WsClient &) = delete;

        WsClient &operator=(const WsClient &) = delete;

        void set_logger(LogFn fn) { logger_ = std::move(fn); }

        void set_connect_timeout(std::chrono::milliseconds t) { connect_timeout_ = t; }
        void set_idle_ping(std::chrono::milliseconds interval) { ping_interval_ = interval; }

        void async_connect(const EndPoint &endpoint, ConnectHandler handler) override;

        void async_receive(ReceiveHandler handler) override;

        void cancel_receive() override;

        void close() override;

    private:
        explicit WsClient(boost::asio::io_context &ioc);

        void on_connect_deadline_(boost::beast::error_code ec);

        void on_resolve_(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);

        void on_tcp_connect_(boost::beast::error_code ec, boost::asio::ip::tcp::endpoint);

        void on_tls_handshake_(boost::beast::error_code ec);

        void on_ws_handshake_(boost::beast::error_code ec);

        void on_read_(boost::beast::error_code ec, std::size_t);

        void on_close_(boost::beast::error_code ec);

        /// Connect-phase failure: drop the socket and report to the connect handler.
        void fail_connect_(boost::beast::error_code ec, std::string_view step);

        void finish_connect_(boost::beast::error_code ec);

        void finish_receive_(boost::beast::error_code ec, std::string frame);

        void log_(std::string_view msg) const {
            if (logger_) logger_(msg);
        }

    private:
        using ws_stream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream> >;

        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        boost::asio::ssl::context tls_;
        boost::asio::ip::tcp::resolver resolver_;
        boost::asio::steady_timer connect_timer_;
        ws_stream ws_;

        boost::beast::flat_buffer buffer_;
        EndPoint endpoint_;

        enum class Phase { IDLE, CONNECTING, OPEN, CLOSED } phase_{Phase::IDLE};

        /// Sticky: a read failure ends the stream, later receives see the same code.
        boost::beast::error_code broken_;

        std::chrono::milliseconds connect_timeout_{5000};
        std::chrono::milliseconds ping_interval_{0}; // 0 = disabled

        ConnectHandler connect_handler_;
        ReceiveHandler receive_handler_;
        LogFn logger_;
    };
} // namespace lobsync
