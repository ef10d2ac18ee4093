#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "lobsync/md/MarketEndpoints.hpp"

namespace lobsync {
    /**
     * @brief Return code for lifecycle operations.
     *
     *  - OK    : accepted (async work enqueued) or completed.
     *  - ERROR : precondition failed (already started, invalid config).
     *
     * Per-session failures are reported through logs and the session's last_error().
     */
    enum class Status {
        OK,
        ERROR
    };

    /**
     * @brief Process configuration, filled from the command line.
     */
    struct ReplicatorConfig {
        std::vector<std::string> symbols; ///< "BTCUSDT" (spot), "BTCUSD_PERP" (derivative)

        std::size_t depth_limit{1000}; ///< REST snapshot depth
        std::chrono::milliseconds pace{100}; ///< delay after each processed frame
        std::size_t publish_top{10}; ///< levels per side in published payloads, 0 = all

        std::string persist_path; ///< optional JSONL output, "" = disabled

        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds ping_interval{0}; ///< 0 = disabled
        std::chrono::milliseconds rest_timeout{5000};

        EndpointOverrides endpoints;

        bool debug{false};
        bool debug_raw{false};
        int debug_every{200}; ///< log 1/N parsed updates, 0 = never
        int debug_raw_max{512}; ///< raw frame truncation
        int debug_top{3}; ///< levels per side in snapshot dumps
        bool debug_seq{true}; ///< include U/u in sampled update logs
    };

    /// Empty string when valid, otherwise the first problem found.
    std::string validate(const ReplicatorConfig &cfg);
} // namespace lobsync
