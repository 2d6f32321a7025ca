/// @file src/money/monetary_amount.cpp
/// @brief MonetaryAmount construction and rendering, ParseError messages.

#include "pricenorm/money.hpp"
#include "pricenorm/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace pricenorm::money {

// ─── ParseErrorKind ───────────────────────────────────────────────────────────

const char* to_string(ParseErrorKind kind) noexcept {
    switch (kind) {
        case ParseErrorKind::EmptyInput:          return "EmptyInput";
        case ParseErrorKind::UnsupportedCurrency: return "UnsupportedCurrency";
        case ParseErrorKind::UnparsableAmount:    return "UnparsableAmount";
        case ParseErrorKind::AmbiguousFormat:     return "AmbiguousFormat";
    }
    return "Unknown";
}

// ─── ParseError ───────────────────────────────────────────────────────────────

std::string ParseError::message() const {
    switch (kind) {
        case ParseErrorKind::EmptyInput:
            return "Input cannot be empty";
        case ParseErrorKind::UnsupportedCurrency:
            return fmt::format("Unsupported currency: {}", input);
        case ParseErrorKind::UnparsableAmount:
            return fmt::format("Could not parse amount from: {}", input);
        case ParseErrorKind::AmbiguousFormat:
            return fmt::format("Ambiguous format - multiple valid interpretations: {}",
                               fmt::join(interpretations, ", "));
    }
    return fmt::format("Unknown parse error for: {}", input);
}

// ─── MonetaryAmount ───────────────────────────────────────────────────────────

ParseResult<MonetaryAmount>
MonetaryAmount::make(Decimal amount, std::string_view currency_code) {
    std::string code(currency_code);
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (!constants::is_supported_currency(code)) {
        return ParseError{ParseErrorKind::UnsupportedCurrency, std::move(code), {}};
    }
    return MonetaryAmount(std::move(amount), std::move(code));
}

std::string MonetaryAmount::to_string() const {
    return fmt::format("{} {}", currency_,
                       amount_.to_grouped_string(constants::DISPLAY_DECIMALS,
                                                 constants::DISPLAY_GROUP_SEPARATOR,
                                                 constants::DISPLAY_DECIMAL_SEPARATOR));
}

} // namespace pricenorm::money
