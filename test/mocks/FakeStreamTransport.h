#pragma once

#include "lobsync/abstract/StreamTransport.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace lobsync::test {
    /// @brief Scripted IStreamTransport. Frames queued with push()/fail() are handed out one per
    ///        async_receive(); completions are always posted, never run inline.
    class FakeStreamTransport : public IStreamTransport {
    public:
        explicit FakeStreamTransport(boost::asio::io_context &ioc) : ioc_(ioc) {
        }

        void set_connect_error(boost::system::error_code ec) { connect_ec_ = ec; }

        /// Park connects until complete_connect() or close(), like a stalled handshake.
        void hold_connect() { hold_connect_ = true; }

        void async_connect(const EndPoint &endpoint, ConnectHandler handler) override {
            connects.push_back(endpoint);
            if (hold_connect_) {
                connect_handler_ = std::move(handler);
                return;
            }
            boost::asio::post(ioc_, [h = std::move(handler), ec = connect_ec_] { h(ec); });
        }

        void complete_connect() {
            if (!connect_handler_) return;
            auto h = std::move(connect_handler_);
            connect_handler_ = nullptr;
            boost::asio::post(ioc_, [h = std::move(h), ec = connect_ec_] { h(ec); });
        }

        [[nodiscard]] bool connect_pending() const noexcept { return static_cast<bool>(connect_handler_); }

        void async_receive(ReceiveHandler handler) override {
            if (handler_) ++overlapping_receives;
            ++receives_armed;
            handler_ = std::move(handler);
            pump_();
        }

        void cancel_receive() override {
            ++cancels;
            if (!handler_) return;
            auto h = std::move(handler_);
            handler_ = nullptr;
            boost::asio::post(ioc_, [h = std::move(h)] {
                h(boost::asio::error::operation_aborted, std::string{});
            });
        }

        void close() override {
            ++closes;
            if (!connect_handler_) return;
            auto h = std::move(connect_handler_);
            connect_handler_ = nullptr;
            boost::asio::post(ioc_, [h = std::move(h)] { h(boost::asio::error::operation_aborted); });
        }

        void push(std::string frame) {
            inbox_.emplace_back(boost::system::error_code{}, std::move(frame));
            pump_();
        }

        void fail(boost::system::error_code ec) {
            inbox_.emplace_back(ec, std::string{});
            pump_();
        }

        [[nodiscard]] bool receive_pending() const noexcept { return static_cast<bool>(handler_); }

        std::vector<EndPoint> connects;
        int receives_armed{0};
        int overlapping_receives{0};
        int cancels{0};
        int closes{0};

    private:
        void pump_() {
            if (!handler_ || inbox_.empty()) return;
            auto h = std::move(handler_);
            handler_ = nullptr;
            auto item = std::move(inbox_.front());
            inbox_.pop_front();
            boost::asio::post(ioc_, [h = std::move(h), item = std::move(item)] {
                h(item.first, item.second);
            });
        }

        boost::asio::io_context &ioc_;
        boost::system::error_code connect_ec_;
        bool hold_connect_{false};
        ConnectHandler connect_handler_;
        ReceiveHandler handler_;
        std::deque<std::pair<boost::system::error_code, std::string> > inbox_;
    };
} // namespace lobsync::test
