#include "lobsync/Config.hpp"

namespace lobsync {
    std::string validate(const ReplicatorConfig &cfg) {
        if (cfg.symbols.empty()) return "no symbols configured";
        for (const auto &s: cfg.symbols) {
            if (s.empty()) return "empty symbol";
            for (const char c: s) {
                const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
                if (!ok) return "invalid character in symbol '" + s + "'";
            }
        }
        if (cfg.depth_limit == 0) return "depth_limit must be > 0";
        if (cfg.pace.count() < 0) return "pace must be >= 0";
        if (cfg.connect_timeout.count() <= 0) return "connect_timeout must be > 0";
        if (cfg.rest_timeout.count() <= 0) return "rest_timeout must be > 0";
        if (cfg.ping_interval.count() < 0) return "ping_interval must be >= 0";
        if (cfg.debug_every < 0) return "debug_every must be >= 0";
        if (cfg.debug_raw_max < 0) return "debug_raw_max must be >= 0";
        if (cfg.debug_top < 0) return "debug_top must be >= 0";
        return {};
    }
} // namespace lobsync
