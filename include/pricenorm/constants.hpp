#pragma once

#include <array>
#include <cstddef>
#include <string_view>

/// @file include/pricenorm/constants.hpp
/// @brief Fixed configuration constants for the price normalization system.

namespace pricenorm::constants {

// ─── Currencies ───────────────────────────────────────────────────────────────

/// Currency codes a MonetaryAmount may carry. Stored uppercase.
static constexpr std::array<std::string_view, 7> SUPPORTED_CURRENCIES = {
    "USD", "EUR", "GBP", "JPY", "PHP", "CAD", "AUD",
};

/// Returns true if `code` (already uppercase) is in SUPPORTED_CURRENCIES.
[[nodiscard]] constexpr bool is_supported_currency(std::string_view code) noexcept {
    for (auto c : SUPPORTED_CURRENCIES) {
        if (c == code) return true;
    }
    return false;
}

// ─── Display ──────────────────────────────────────────────────────────────────

/// Fractional digits used when rendering any MonetaryAmount, JPY included.
static constexpr unsigned DISPLAY_DECIMALS = 2;

/// Grouping and decimal characters of the invariant display format.
static constexpr char DISPLAY_GROUP_SEPARATOR   = ',';
static constexpr char DISPLAY_DECIMAL_SEPARATOR = '.';

// ─── Parsing ──────────────────────────────────────────────────────────────────

/// Inputs longer than this (in bytes) are rejected by every convention.
static constexpr std::size_t MAX_INPUT_LENGTH = 256;

/// Digits per thousands group after the leading group.
static constexpr std::size_t GROUP_WIDTH = 3;

/// Label of the locale-independent dot-decimal convention.
static constexpr std::string_view INVARIANT_LABEL = "Format: invariant";

} // namespace pricenorm::constants
