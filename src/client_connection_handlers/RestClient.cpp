#include "lobsync/client_connection_handlers/RestClient.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h> // X509_check_host

#include <exception>

namespace lobsync {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    RestClient::RestClient(boost::asio::io_context &ioc)
        : strand_(boost::asio::make_strand(ioc)),
          tls_(ssl::context::tls_client),
          resolver_(strand_),
          stream_(strand_, tls_) {
        tls_.set_default_verify_paths();
        tls_.set_verify_mode(ssl::verify_peer);
    }

    void RestClient::async_get(const EndPoint &server, std::string target, ResponseHandler handler) {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, server, target = std::move(target), handler = std::move(handler)]() mutable {
            if (self->started_) {
                boost::asio::post(self->strand_, [handler = std::move(handler)] {
                    handler(make_error_code(boost::system::errc::operation_in_progress), 0, {});
                });
                return;
            }
            self->started_ = true;
            self->handler_ = std::move(handler);
            self->host_ = server.host;

            if (target.empty() || target.front() != '/') {
                self->abort_(make_error_code(boost::system::errc::invalid_argument));
                return;
            }

            self->parser_.body_limit(self->body_limit_);

            self->request_.version(11);
            self->request_.method(http::verb::get);
            self->request_.target(target);
            self->request_.set(http::field::host,
                               server.port == "443" ? server.host : server.host + ":" + server.port);
            self->request_.set(http::field::accept, "application/json");
            self->request_.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " lobsync");
            self->request_.set(http::field::connection, "close");

            // Verify the leaf certificate against the host we asked for.
            self->stream_.set_verify_callback([host = server.host](bool preverified, ssl::verify_context &ctx) {
                if (!preverified) return false;
                X509_STORE_CTX *store = ctx.native_handle();
                if (X509_STORE_CTX_get_error_depth(store) != 0) return true;
                X509 *leaf = X509_STORE_CTX_get_current_cert(store);
                return leaf && X509_check_host(leaf, host.c_str(), host.size(), 0, nullptr) == 1;
            });

            if (!SSL_set_tlsext_host_name(self->stream_.native_handle(), self->host_.c_str())) {
                self->abort_({static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()});
                return;
            }

            self->resolver_.async_resolve(server.host, server.port,
                                          beast::bind_front_handler(&RestClient::on_resolve_, self));
        });
    }

    void RestClient::on_resolve_(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return abort_(ec);

        // One deadline for connect, handshake, write and read together.
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::get_lowest_layer(stream_).async_connect(
            results, beast::bind_front_handler(&RestClient::on_connect_, shared_from_this()));
    }

    void RestClient::on_connect_(beast::error_code ec, tcp::endpoint) {
        if (ec) return abort_(ec);
        stream_.async_handshake(ssl::stream_base::client,
                                beast::bind_front_handler(&RestClient::on_handshake_, shared_from_this()));
    }

    void RestClient::on_handshake_(beast::error_code ec) {
        if (ec) return abort_(ec);
        http::async_write(stream_, request_, beast::bind_front_handler(&RestClient::on_write_, shared_from_this()));
    }

    void RestClient::on_write_(beast::error_code ec, std::size_t) {
        if (ec) return abort_(ec);
        http::async_read(stream_, buffer_, parser_, beast::bind_front_handler(&RestClient::on_read_, shared_from_this()));
    }

    void RestClient::on_read_(beast::error_code ec, std::size_t) {
        if (ec) return abort_(ec);

        const int status = parser_.get().result_int();
        if (status < 200 || status >= 300) {
            log_("[RestClient] GET " + host_ + " -> HTTP " + std::to_string(status));
        }

        // The response is complete; the TLS close only gets a short grace period.
        beast::get_lowest_layer(stream_).expires_after(std::chrono::milliseconds(200));
        stream_.async_shutdown(beast::bind_front_handler(&RestClient::on_shutdown_, shared_from_this()));
    }

    void RestClient::on_shutdown_(beast::error_code ec) {
        // Servers routinely skip close_notify; none of this affects a response we already hold.
        if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated &&
            ec != beast::error::timeout) {
            log_("[RestClient] TLS shutdown: " + ec.message());
        }

        const int status = parser_.get().result_int();
        complete_(status >= 200 && status < 300
                      ? beast::error_code{}
                      : make_error_code(boost::system::errc::protocol_error));
    }

    void RestClient::abort_(beast::error_code ec) {
        if (ec == beast::error::timeout) ec = make_error_code(boost::system::errc::timed_out);
        log_("[RestClient] GET " + host_ + " failed: " + ec.message());

        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
        complete_(ec);
    }

    void RestClient::complete_(beast::error_code ec) {
        if (!handler_) return;
        auto handler = std::move(handler_);
        handler_ = nullptr;

        int status = 0;
        std::string body;
        if (parser_.is_header_done()) {
            status = parser_.get().result_int();
            body = std::move(parser_.get().body());
        }

        try {
            handler(ec, status, std::move(body));
        } catch (const std::exception &ex) {
            log_(std::string("[RestClient] response handler threw: ") + ex.what());
        }
    }
} // namespace lobsync
