#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lobsync {
    /**
     * Exact decimal for prices and quantities.
     *
     * Stored as a signed count of 1e-8 units, which covers every precision the
     * exchange publishes. Parsing never goes through floating point.
     */
    class Decimal {
    public:
        static constexpr int kScale = 8;
        static constexpr std::int64_t kUnitsPerOne = 100'000'000;

        constexpr Decimal() noexcept = default;

        /// Build from raw 1e-8 units.
        static constexpr Decimal from_units(std::int64_t units) noexcept {
            Decimal d;
            d.units_ = units;
            return d;
        }

        /// Parses "12345.67", "-0.5", "100". Returns std::nullopt on anything else
        /// (empty, stray characters, more than kScale fractional digits, overflow).
        static std::optional<Decimal> parse(std::string_view text) noexcept;

        /// Shortest exact representation: "2.5", "100", "0.00000001".
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
        [[nodiscard]] constexpr bool is_positive() const noexcept { return units_ > 0; }
        [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }

        friend constexpr Decimal operator+(Decimal a, Decimal b) noexcept { return from_units(a.units_ + b.units_); }
        friend constexpr Decimal operator-(Decimal a, Decimal b) noexcept { return from_units(a.units_ - b.units_); }

        friend constexpr bool operator==(const Decimal &, const Decimal &) noexcept = default;
        friend constexpr std::strong_ordering operator<=>(const Decimal &, const Decimal &) noexcept = default;

    private:
        std::int64_t units_{0};
    };

    /// Throws std::invalid_argument; for literals in tests and config.
    Decimal parse_decimal_or_throw(std::string_view text);
} // namespace lobsync
