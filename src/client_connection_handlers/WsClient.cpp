#include "lobsync/client_connection_handlers/WsClient.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h> // X509_check_host

#include <exception>

namespace lobsync {
    using tcp = boost::asio::ip::tcp;
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace ssl = boost::asio::ssl;

    WsClient::WsClient(boost::asio::io_context &ioc)
        : strand_(boost::asio::make_strand(ioc)),
          tls_(ssl::context::tls_client),
          resolver_(strand_),
          connect_timer_(strand_),
          ws_(strand_, tls_) {
        tls_.set_default_verify_paths();
        tls_.set_verify_mode(ssl::verify_peer);

        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
            req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " lobsync");
        }));
    }

    void WsClient::async_connect(const EndPoint &endpoint, ConnectHandler handler) {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, endpoint, handler = std::move(handler)]() mutable {
            if (self->phase_ != Phase::IDLE) {
                boost::asio::post(self->strand_, [handler = std::move(handler)] {
                    handler(make_error_code(boost::system::errc::operation_in_progress));
                });
                return;
            }
            self->phase_ = Phase::CONNECTING;
            self->endpoint_ = endpoint;
            self->connect_handler_ = std::move(handler);

            auto &tls_layer = self->ws_.next_layer();
            tls_layer.set_verify_callback([host = endpoint.host](bool preverified, ssl::verify_context &ctx) {
                if (!preverified) return false;
                X509_STORE_CTX *store = ctx.native_handle();
                if (X509_STORE_CTX_get_error_depth(store) != 0) return true;
                X509 *leaf = X509_STORE_CTX_get_current_cert(store);
                return leaf && X509_check_host(leaf, host.c_str(), host.size(), 0, nullptr) == 1;
            });
            if (!SSL_set_tlsext_host_name(tls_layer.native_handle(), endpoint.host.c_str())) {
                self->fail_connect_({static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()},
                                    "sni");
                return;
            }

            self->log_("[WsClient] connecting " + to_url(endpoint, "wss"));

            // One deadline spans resolve, TCP, TLS and the upgrade.
            self->connect_timer_.expires_after(self->connect_timeout_);
            self->connect_timer_.async_wait(beast::bind_front_handler(&WsClient::on_connect_deadline_, self));

            self->resolver_.async_resolve(endpoint.host, endpoint.port,
                                          beast::bind_front_handler(&WsClient::on_resolve_, self));
        });
    }

    void WsClient::on_connect_deadline_(beast::error_code ec) {
        if (ec == boost::asio::error::operation_aborted || phase_ != Phase::CONNECTING) return;
        fail_connect_(make_error_code(boost::system::errc::timed_out), "connect deadline");
    }

    void WsClient::on_resolve_(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail_connect_(ec, "resolve");

        beast::get_lowest_layer(ws_).async_connect(
            results, beast::bind_front_handler(&WsClient::on_tcp_connect_, shared_from_this()));
    }

    void WsClient::on_tcp_connect_(beast::error_code ec, tcp::endpoint) {
        if (ec) return fail_connect_(ec, "tcp_connect");
        ws_.next_layer().async_handshake(
            ssl::stream_base::client, beast::bind_front_handler(&WsClient::on_tls_handshake_, shared_from_this()));
    }

    void WsClient::on_tls_handshake_(beast::error_code ec) {
        if (ec) return fail_connect_(ec, "tls_handshake");

        websocket::stream_base::timeout opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
        opt.handshake_timeout = connect_timeout_;
        if (ping_interval_.count() > 0) {
            // Beast pings after half the idle timeout and fails the read if no pong arrives.
            opt.idle_timeout = ping_interval_ * 2;
            opt.keep_alive_pings = true;
        }
        ws_.set_option(opt);

        ws_.async_handshake(endpoint_.host, endpoint_.target,
                            beast::bind_front_handler(&WsClient::on_ws_handshake_, shared_from_this()));
    }

    void WsClient::on_ws_handshake_(beast::error_code ec) {
        if (ec) return fail_connect_(ec, "ws_handshake");
        if (phase_ != Phase::CONNECTING) return finish_connect_(boost::asio::error::operation_aborted);

        ws_.text(true);
        phase_ = Phase::OPEN;
        finish_connect_({});
    }

    void WsClient::async_receive(ReceiveHandler handler) {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, handler = std::move(handler)]() mutable {
            beast::error_code reject;
            if (self->receive_handler_) reject = make_error_code(boost::system::errc::operation_in_progress);
            else if (self->broken_) reject = self->broken_;
            else if (self->phase_ != Phase::OPEN) reject = make_error_code(boost::system::errc::not_connected);

            if (reject) {
                boost::asio::post(self->strand_, [handler = std::move(handler), reject] { handler(reject, {}); });
                return;
            }

            self->receive_handler_ = std::move(handler);
            self->ws_.async_read(self->buffer_, beast::bind_front_handler(&WsClient::on_read_, self));
        });
    }

    void WsClient::on_read_(beast::error_code ec, std::size_t) {
        if (ec) {
            buffer_.clear();
            if (ec == websocket::error::closed) log_("[WsClient] closed by peer");
            else if (ec != boost::asio::error::operation_aborted) log_("[WsClient] read: " + ec.message());

            // Beast marks the stream failed after any read error, an abort included.
            broken_ = ec;
            return finish_receive_(ec, {});
        }

        std::string frame = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        finish_receive_({}, std::move(frame));
    }

    void WsClient::cancel_receive() {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self] {
            if (!self->receive_handler_) return;
            beast::get_lowest_layer(self->ws_).cancel();
        });
    }

    void WsClient::close() {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self] {
            const Phase was = self->phase_;
            if (was == Phase::CLOSED) return;
            self->phase_ = Phase::CLOSED;

            if (was == Phase::OPEN && !self->broken_) {
                self->ws_.async_close(websocket::close_code::normal,
                                      beast::bind_front_handler(&WsClient::on_close_, self));
                return;
            }

            self->connect_timer_.cancel();
            self->resolver_.cancel();
            beast::get_lowest_layer(self->ws_).close();
        });
    }

    void WsClient::on_close_(beast::error_code ec) {
        if (ec && ec != boost::asio::error::operation_aborted) log_("[WsClient] close: " + ec.message());
        beast::get_lowest_layer(ws_).close();
    }

    void WsClient::fail_connect_(beast::error_code ec, std::string_view step) {
        if (!connect_handler_) return; // already reported; this is a step aborted by the first failure
        if (ec == beast::error::timeout) ec = make_error_code(boost::system::errc::timed_out);
        log_("[WsClient] " + std::string(step) + ": " + ec.message());

        if (phase_ == Phase::CONNECTING) phase_ = Phase::CLOSED;
        connect_timer_.cancel();
        resolver_.cancel();
        beast::get_lowest_layer(ws_).close();
        finish_connect_(ec);
    }

    void WsClient::finish_connect_(beast::error_code ec) {
        connect_timer_.cancel();
        if (!connect_handler_) return;
        auto handler = std::move(connect_handler_);
        connect_handler_ = nullptr;

        try {
            handler(ec);
        } catch (const std::exception &ex) {
            // A throwing handler must not unwind through Asio.
            log_(std::string("[WsClient] connect handler threw: ") + ex.what());
        }
    }

    void WsClient::finish_receive_(beast::error_code ec, std::string frame) {
        if (!receive_handler_) return;
        auto handler = std::move(receive_handler_);
        receive_handler_ = nullptr;

        try {
            handler(ec, std::move(frame));
        } catch (const std::exception &ex) {
            log_(std::string("[WsClient] receive handler threw: ") + ex.what());
        }
    }
} // namespace lobsync
