#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>
#include <string_view>

#include "lobsync/orderbook/PriceLevelBook.hpp"

namespace lobsync::debug {
    inline std::atomic<bool> enabled{false}; // master switch
    inline std::atomic<bool> raw{false}; // print truncated raw msg
    inline std::atomic<int> every{200}; // log 1/N parsed messages
    inline std::atomic<int> raw_max{512}; // truncate raw output
    inline std::atomic<int> top_levels{3}; // print top-of-book levels
    inline std::atomic<bool> show_seq{true}; // print U/u update ids

    inline bool dbg_on() noexcept {
        return enabled.load(std::memory_order_relaxed);
    }

    inline bool dbg_sample(std::uint64_t &counter) noexcept {
        const int n = every.load(std::memory_order_relaxed);
        return n > 0 && (++counter % static_cast<std::uint64_t>(n) == 0);
    }

    inline void dbg_raw(std::string_view msg) {
        if (!raw.load(std::memory_order_relaxed)) return;
        int maxc = raw_max.load(std::memory_order_relaxed);
        if (maxc <= 0) return;
        if (static_cast<int>(msg.size()) > maxc) msg = msg.substr(0, static_cast<std::size_t>(maxc));
        std::cerr << "  raw=\"" << msg << "\"\n";
    }

    inline void dbg_levels(const char *side, const std::vector<Level> &v) {
        const int top = top_levels.load(std::memory_order_relaxed);
        if (top <= 0) return;
        std::cerr << "  " << side << " top" << top << ":\n";
        for (int i = 0; i < top && i < static_cast<int>(v.size()); ++i) {
            std::cerr << "    " << i << " " << v[i].price.to_string() << " x " << v[i].quantity.to_string() << "\n";
        }
    }
}
