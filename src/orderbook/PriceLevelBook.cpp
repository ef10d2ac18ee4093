#include "lobsync/orderbook/PriceLevelBook.hpp"

#include "lobsync/md/Errors.hpp"

namespace lobsync {
    void PriceLevelBook::apply_snapshot(const std::vector<Level> &bids, const std::vector<Level> &asks) {
        if (!is_empty()) {
            throw BookInvariantError("apply_snapshot on a non-empty book");
        }

        for (const Level &lvl: bids) {
            if (lvl.quantity.is_positive()) bids_.insert_or_assign(lvl.price, lvl.quantity);
        }
        for (const Level &lvl: asks) {
            if (lvl.quantity.is_positive()) asks_.insert_or_assign(lvl.price, lvl.quantity);
        }
    }

    void PriceLevelBook::apply_delta(Side side, Decimal price, Decimal qty) {
        if (side == Side::BID) {
            update<Side::BID>(Level{price, qty});
        } else {
            update<Side::ASK>(Level{price, qty});
        }
    }

    std::optional<Decimal> PriceLevelBook::best_bid() const noexcept {
        if (bids_.empty()) return std::nullopt;
        return bids_.begin()->first;
    }

    std::optional<Decimal> PriceLevelBook::best_ask() const noexcept {
        if (asks_.empty()) return std::nullopt;
        return asks_.begin()->first;
    }

    std::optional<Decimal> PriceLevelBook::spread() const noexcept {
        const auto bid = best_bid();
        const auto ask = best_ask();
        if (!bid || !ask) return std::nullopt;
        return *ask - *bid;
    }

    std::vector<Level> PriceLevelBook::top_bids(std::size_t n) const { return top_(bids_, n); }
    std::vector<Level> PriceLevelBook::top_asks(std::size_t n) const { return top_(asks_, n); }

    std::optional<Decimal> PriceLevelBook::quantity_at(Side side, Decimal price) const {
        if (side == Side::BID) {
            const auto it = bids_.find(price);
            if (it == bids_.end()) return std::nullopt;
            return it->second;
        }
        const auto it = asks_.find(price);
        if (it == asks_.end()) return std::nullopt;
        return it->second;
    }

    bool PriceLevelBook::is_crossed() const noexcept {
        const auto bid = best_bid();
        const auto ask = best_ask();
        return bid && ask && *bid >= *ask;
    }

    bool PriceLevelBook::validate() const noexcept {
        // 1) Reject empty levels lingering in book
        for (const auto &[px, qty]: bids_) if (!qty.is_positive()) return false;
        for (const auto &[px, qty]: asks_) if (!qty.is_positive()) return false;

        // 2) Best bid strictly below best ask
        return !is_crossed();
    }
} // namespace lobsync
