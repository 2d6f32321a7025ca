#pragma once

/// @file include/pricenorm/decimal.hpp
/// @brief Exact arbitrary-precision decimal number.
///
/// # Module: Decimal
///
/// ## Responsibility
/// Represent monetary quantities exactly as `unscaled × 10^-scale`, where
/// `unscaled` is a GMP arbitrary-precision integer. Binary floating point is
/// never involved, so "1234.56" parsed under any convention compares equal to
/// every other reading of the same digits.
///
/// ## Canonical Form
/// Trailing fractional zeros are stripped on construction (`1.50` is stored as
/// `150 × 10^-2` → `15 × 10^-1`), and zero always has scale 0. Structural
/// equality is therefore numeric equality.
///
/// ## Guarantees
/// - Value type: copyable, movable, immutable through its public API
/// - Total ordering via `operator<=>`
/// - Rounding is half away from zero

#include <gmpxx.h>

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace pricenorm::money {

class Decimal {
public:
    /// Zero.
    Decimal() = default;

    /// Construct `unscaled × 10^-scale` and canonicalize.
    Decimal(mpz_class unscaled, unsigned scale);

    /// Construct an integral value.
    explicit Decimal(long value);

    /// Parse a plain decimal literal: `[+|-] digits [. digits]`.
    ///
    /// No whitespace, grouping or exponent is accepted. At least one digit
    /// must be present on either side of the point (`".5"`, `"5."` are valid).
    ///
    /// # Returns
    /// `nullopt` on any syntax error.
    [[nodiscard]] static std::optional<Decimal> from_string(std::string_view text);

    [[nodiscard]] const mpz_class& unscaled() const noexcept { return unscaled_; }
    [[nodiscard]] unsigned scale() const noexcept { return scale_; }

    [[nodiscard]] bool is_zero() const noexcept;
    [[nodiscard]] bool is_negative() const noexcept;

    /// Negated copy.
    [[nodiscard]] Decimal negated() const;

    /// Round to `places` fractional digits, half away from zero.
    [[nodiscard]] Decimal rounded(unsigned places) const;

    /// Plain canonical rendering, e.g. `"-1234.5"`.
    [[nodiscard]] std::string to_string() const;

    /// Render with exactly `places` fractional digits and thousands grouping.
    ///
    /// The value is first rounded with `rounded(places)`. Negative values are
    /// prefixed with `-`, e.g. `to_grouped_string(2) == "-1,234.50"`.
    [[nodiscard]] std::string to_grouped_string(unsigned places,
                                                 char group   = ',',
                                                 char decimal = '.') const;

    [[nodiscard]] bool operator==(const Decimal& other) const noexcept;
    [[nodiscard]] std::strong_ordering operator<=>(const Decimal& other) const;

private:
    mpz_class unscaled_{0};
    unsigned  scale_{0};

    /// Strip trailing fractional zeros.
    void canonicalize();
};

} // namespace pricenorm::money
