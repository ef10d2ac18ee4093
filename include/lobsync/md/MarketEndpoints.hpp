#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lobsync {
    enum class MarketKind : std::uint8_t {
        SPOT,
        DERIVATIVE // coin-margined perpetual / delivery, e.g. "BTCUSD_PERP"
    };

    inline const char *to_string(MarketKind k) {
        switch (k) {
            case MarketKind::SPOT: return "spot";
            case MarketKind::DERIVATIVE: return "derivative";
            default: return "UNKNOWN";
        }
    }

    struct EndPoint {
        std::string host;
        std::string port;
        std::string target; /// Can be both WS or REST target
    };

    /**
     * @brief Host/port overrides per market kind; "" = default.
     */
    struct EndpointOverrides {
        std::string spot_ws_host;
        std::string spot_ws_port;
        std::string spot_rest_host;
        std::string spot_rest_port;

        std::string deriv_ws_host;
        std::string deriv_ws_port;
        std::string deriv_rest_host;
        std::string deriv_rest_port;
    };

    /// Symbols with an underscore ("BTCUSD_PERP", "ETHUSD_240628") trade on the derivative venue.
    MarketKind infer_market_kind(std::string_view symbol) noexcept;

    /// Stream topics use "btcusdt", REST uses "BTCUSDT".
    std::string map_ws_symbol(std::string_view symbol);
    std::string map_rest_symbol(std::string_view symbol);

    /// "depth_btcusdt" for spot, "depth_perp_btcusd_perp" for derivative.
    std::string make_session_id(MarketKind kind, std::string_view symbol);

    /**
     * - spot:       stream.binance.com:9443  /ws/<sym>@depth
     * - derivative: dstream.binance.com:443  /stream?streams=<sym>@depth
     */
    EndPoint ws_endpoint(MarketKind kind, std::string_view symbol, const EndpointOverrides &ovr = {});

    /// Host/port of the REST depth endpoint; the target is per request (see rest_snapshot_target).
    EndPoint rest_endpoint(MarketKind kind, const EndpointOverrides &ovr = {});

    /// "/api/v3/depth?symbol=BTCUSDT&limit=1000" or "/dapi/v1/depth?symbol=BTCUSD_PERP&limit=1000"
    std::string rest_snapshot_target(MarketKind kind, std::string_view symbol, std::size_t depth_limit);

    /// "wss://host:port/target", for logs.
    std::string to_url(const EndPoint &e, std::string_view scheme);
} // namespace lobsync
