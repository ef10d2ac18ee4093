#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "lobsync/orderbook/Decimal.hpp"

namespace lobsync {
    enum class Side {
        BID,
        ASK
    };

    struct Level {
        Decimal price;
        Decimal quantity;

        bool operator==(const Level &) const = default;
    };

    /**
     * Per-symbol price -> quantity replica for both sides.
     *
     * Invariants:
     *  - no stored level has quantity <= 0; absence means no liquidity at that price
     *  - bids iterate highest price first, asks lowest price first
     *
     * A crossed book is not corrected here; is_crossed() / validate() let a consumer detect it.
     */
    class PriceLevelBook {
    public:
        using BidMap = std::map<Decimal, Decimal, std::greater<>>;
        using AskMap = std::map<Decimal, Decimal, std::less<>>;

        /**
         * 'apply_snapshot' loads the initial book.
         * Only valid while both sides are empty; throws BookInvariantError otherwise.
         * Levels whose quantity is not positive are skipped.
         */
        void apply_snapshot(const std::vector<Level> &bids, const std::vector<Level> &asks);

        /**
         * 'apply_delta' sets the absolute quantity at a price.
         * qty > 0 inserts or replaces; qty <= 0 removes the level, and removing an
         * absent level is a no-op (the feed may report levels we never had).
         */
        void apply_delta(Side side, Decimal price, Decimal qty);

        template<Side S>
        void update(const Level &level) {
            if constexpr (S == Side::BID) {
                update_side_(bids_, level);
            } else {
                update_side_(asks_, level);
            }
        }

        [[nodiscard]] std::optional<Decimal> best_bid() const noexcept;
        [[nodiscard]] std::optional<Decimal> best_ask() const noexcept;

        /// best ask - best bid; std::nullopt unless both sides have liquidity.
        [[nodiscard]] std::optional<Decimal> spread() const noexcept;

        [[nodiscard]] bool is_empty() const noexcept { return bids_.empty() && asks_.empty(); }
        [[nodiscard]] std::size_t bid_count() const noexcept { return bids_.size(); }
        [[nodiscard]] std::size_t ask_count() const noexcept { return asks_.size(); }

        [[nodiscard]] const BidMap &bids() const noexcept { return bids_; }
        [[nodiscard]] const AskMap &asks() const noexcept { return asks_; }

        /// First n levels in read order; n == 0 returns the whole side.
        [[nodiscard]] std::vector<Level> top_bids(std::size_t n) const;
        [[nodiscard]] std::vector<Level> top_asks(std::size_t n) const;

        [[nodiscard]] std::optional<Decimal> quantity_at(Side side, Decimal price) const;

        [[nodiscard]] bool is_crossed() const noexcept;

        /**
         * Check the book invariants: positive quantities only, not crossed.
         */
        [[nodiscard]] bool validate() const noexcept;

        void clear() noexcept {
            bids_.clear();
            asks_.clear();
        }

    private:
        template<typename Map>
        static void update_side_(Map &side, const Level &level) {
            if (!level.quantity.is_positive()) {
                side.erase(level.price);
                return;
            }
            side.insert_or_assign(level.price, level.quantity);
        }

        template<typename Map>
        static std::vector<Level> top_(const Map &side, std::size_t n) {
            std::vector<Level> out;
            const std::size_t count = (n == 0 || n > side.size()) ? side.size() : n;
            out.reserve(count);
            for (auto it = side.begin(); it != side.end() && out.size() < count; ++it) {
                out.push_back(Level{it->first, it->second});
            }
            return out;
        }

        /// sorted descending by price
        BidMap bids_;

        /// sorted ascending by price
        AskMap asks_;
    };
} // namespace lobsync
