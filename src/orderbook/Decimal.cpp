#include "lobsync/orderbook/Decimal.hpp"

#include <limits>
#include <stdexcept>

namespace lobsync {
    std::optional<Decimal> Decimal::parse(std::string_view text) noexcept {
        if (text.empty()) return std::nullopt;

        bool negative = false;
        if (text.front() == '-' || text.front() == '+') {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        if (text.empty()) return std::nullopt;

        constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

        std::int64_t whole = 0;
        std::size_t i = 0;
        std::size_t int_digits = 0;
        for (; i < text.size() && text[i] != '.'; ++i) {
            const char c = text[i];
            if (c < '0' || c > '9') return std::nullopt;
            const int digit = c - '0';
            if (whole > (kMax - digit) / 10) return std::nullopt;
            whole = whole * 10 + digit;
            ++int_digits;
        }

        std::int64_t frac = 0;
        int frac_digits = 0;
        if (i < text.size()) {
            ++i; // '.'
            for (; i < text.size(); ++i) {
                const char c = text[i];
                if (c < '0' || c > '9') return std::nullopt;
                if (frac_digits == kScale) {
                    /// Trailing zeros beyond the scale are exact; anything else is not representable.
                    if (c != '0') return std::nullopt;
                    continue;
                }
                frac = frac * 10 + (c - '0');
                ++frac_digits;
            }
            if (int_digits == 0 && frac_digits == 0) return std::nullopt;
        }
        if (int_digits == 0 && frac_digits == 0) return std::nullopt;

        for (int d = frac_digits; d < kScale; ++d) frac *= 10;

        if (whole > (kMax - frac) / kUnitsPerOne) return std::nullopt;
        const std::int64_t units = whole * kUnitsPerOne + frac;

        return from_units(negative ? -units : units);
    }

    std::string Decimal::to_string() const {
        const bool negative = units_ < 0;
        /// Magnitude as unsigned so INT64_MIN does not overflow on negation.
        const std::uint64_t mag = negative
                                      ? static_cast<std::uint64_t>(-(units_ + 1)) + 1u
                                      : static_cast<std::uint64_t>(units_);

        const std::uint64_t whole = mag / static_cast<std::uint64_t>(kUnitsPerOne);
        std::uint64_t frac = mag % static_cast<std::uint64_t>(kUnitsPerOne);

        std::string out;
        if (negative) out += '-';
        out += std::to_string(whole);

        if (frac != 0) {
            std::string digits(kScale, '0');
            for (int pos = kScale - 1; pos >= 0; --pos) {
                digits[static_cast<std::size_t>(pos)] = static_cast<char>('0' + frac % 10);
                frac /= 10;
            }
            while (!digits.empty() && digits.back() == '0') digits.pop_back();
            out += '.';
            out += digits;
        }
        return out;
    }

    Decimal parse_decimal_or_throw(std::string_view text) {
        auto d = Decimal::parse(text);
        if (!d) {
            throw std::invalid_argument("not an exact decimal: '" + std::string(text) + "'");
        }
        return *d;
    }
} // namespace lobsync
