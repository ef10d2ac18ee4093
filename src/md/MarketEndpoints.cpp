#include "lobsync/md/MarketEndpoints.hpp"

#include <boost/algorithm/string.hpp>

namespace lobsync {
    MarketKind infer_market_kind(std::string_view symbol) noexcept {
        return symbol.find('_') != std::string_view::npos ? MarketKind::DERIVATIVE : MarketKind::SPOT;
    }

    std::string map_ws_symbol(std::string_view symbol) {
        return boost::algorithm::to_lower_copy(std::string(symbol));
    }

    std::string map_rest_symbol(std::string_view symbol) {
        return boost::algorithm::to_upper_copy(std::string(symbol));
    }

    std::string make_session_id(MarketKind kind, std::string_view symbol) {
        const std::string sym = map_ws_symbol(symbol);
        return kind == MarketKind::DERIVATIVE ? "depth_perp_" + sym : "depth_" + sym;
    }

    EndPoint ws_endpoint(MarketKind kind, std::string_view symbol, const EndpointOverrides &ovr) {
        EndPoint e;
        const std::string sym = map_ws_symbol(symbol);

        if (kind == MarketKind::DERIVATIVE) {
            e.host = ovr.deriv_ws_host.empty() ? "dstream.binance.com" : ovr.deriv_ws_host;
            e.port = ovr.deriv_ws_port.empty() ? "443" : ovr.deriv_ws_port;
            // Combined-stream endpoint: payload arrives wrapped as {"stream": ..., "data": {...}}
            e.target = "/stream?streams=" + sym + "@depth";
            return e;
        }

        // Binance "classic" WS endpoint is :9443
        e.host = ovr.spot_ws_host.empty() ? "stream.binance.com" : ovr.spot_ws_host;
        e.port = ovr.spot_ws_port.empty() ? "9443" : ovr.spot_ws_port;
        e.target = "/ws/" + sym + "@depth";
        return e;
    }

    EndPoint rest_endpoint(MarketKind kind, const EndpointOverrides &ovr) {
        EndPoint e;
        if (kind == MarketKind::DERIVATIVE) {
            e.host = ovr.deriv_rest_host.empty() ? "dapi.binance.com" : ovr.deriv_rest_host;
            e.port = ovr.deriv_rest_port.empty() ? "443" : ovr.deriv_rest_port;
        } else {
            e.host = ovr.spot_rest_host.empty() ? "api.binance.com" : ovr.spot_rest_host;
            e.port = ovr.spot_rest_port.empty() ? "443" : ovr.spot_rest_port;
        }
        return e;
    }

    std::string rest_snapshot_target(MarketKind kind, std::string_view symbol, std::size_t depth_limit) {
        const std::string rest_sym = map_rest_symbol(symbol);
        const char *path = kind == MarketKind::DERIVATIVE ? "/dapi/v1/depth" : "/api/v3/depth";

        // Depth limit must be one of the venue's allowed values; validated upstream.
        return std::string(path) + "?symbol=" + rest_sym + "&limit=" + std::to_string(depth_limit);
    }

    std::string to_url(const EndPoint &e, std::string_view scheme) {
        std::string url(scheme);
        url += "://";
        url += e.host;
        url += ':';
        url += e.port;
        url += e.target;
        return url;
    }
} // namespace lobsync
