#pragma once

#include <boost/system/error_code.hpp>

#include <functional>
#include <string>

#include "lobsync/md/MarketEndpoints.hpp"

namespace lobsync {
    /**
     * @brief One websocket connection, read one frame at a time.
     *
     * Contract:
     *   - async_connect(...) completes exactly once.
     *   - At most one async_receive(...) is outstanding; the caller re-arms after each completion.
     *   - cancel_receive() completes an outstanding receive with boost::asio::error::operation_aborted;
     *     it is not a transport failure.
     *   - close() is idempotent and never throws.
     */
    struct IStreamTransport {
        using ConnectHandler = std::function<void(boost::system::error_code)>;
        using ReceiveHandler = std::function<void(boost::system::error_code, std::string)>;

        virtual ~IStreamTransport() = default;

        virtual void async_connect(const EndPoint &endpoint, ConnectHandler handler) = 0;

        virtual void async_receive(ReceiveHandler handler) = 0;

        virtual void cancel_receive() = 0;

        virtual void close() = 0;
    };
} // namespace lobsync
