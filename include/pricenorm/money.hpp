#pragma once

/// @file include/pricenorm/money.hpp
/// @brief MonetaryAmount value type and the typed parse-error model.
///
/// # Module: Money
///
/// ## Responsibility
/// - `MonetaryAmount`: immutable (Decimal, currency code) pair whose currency
///   is always one of `constants::SUPPORTED_CURRENCIES`.
/// - `ParseError`: tagged failure carrying the original input.
/// - `ParseResult<T>`: success value or `ParseError`. All fallible parsing
///   operations return it instead of throwing; callers dispatch on the tag.

#include "pricenorm/decimal.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pricenorm::money {

// ─── ParseError ───────────────────────────────────────────────────────────────

/// Kind of a single-item parse failure.
enum class ParseErrorKind {
    EmptyInput,          ///< Input is empty or whitespace-only
    UnsupportedCurrency, ///< Currency code outside the supported set
    UnparsableAmount,    ///< No convention could read the numeric part
    AmbiguousFormat,     ///< Conventions disagree on the value
};

/// Stable name of a ParseErrorKind, e.g. `"AmbiguousFormat"`.
[[nodiscard]] const char* to_string(ParseErrorKind kind) noexcept;

/// A recoverable single-item failure.
struct ParseError {
    ParseErrorKind kind;
    std::string input;                        ///< Original input (or rejected code)
    std::vector<std::string> interpretations; ///< Conflicting labels (AmbiguousFormat only)

    /// Human-readable reason, e.g. `"Could not parse amount from: abc"`.
    [[nodiscard]] std::string message() const;
};

/// Success value or tagged error.
template <typename T>
using ParseResult = std::variant<T, ParseError>;

/// True if `result` holds a value.
template <typename T>
[[nodiscard]] bool succeeded(const ParseResult<T>& result) noexcept {
    return std::holds_alternative<T>(result);
}

// ─── MonetaryAmount ───────────────────────────────────────────────────────────

/// Immutable currency-tagged exact amount.
class MonetaryAmount {
public:
    /// Build an amount, uppercasing `currency_code`.
    ///
    /// # Returns
    /// `ParseError{UnsupportedCurrency}` if the uppercased code is not in
    /// `constants::SUPPORTED_CURRENCIES`.
    [[nodiscard]] static ParseResult<MonetaryAmount>
    make(Decimal amount, std::string_view currency_code);

    [[nodiscard]] const Decimal& amount() const noexcept { return amount_; }
    [[nodiscard]] const std::string& currency_code() const noexcept { return currency_; }

    /// `"{CODE} {amount}"` with `,` grouping and two decimals: `"USD 1,234.56"`.
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const MonetaryAmount& other) const noexcept = default;

private:
    MonetaryAmount(Decimal amount, std::string currency)
        : amount_(std::move(amount)), currency_(std::move(currency)) {}

    Decimal     amount_;
    std::string currency_;
};

} // namespace pricenorm::money
