#pragma once

/// @file include/pricenorm/money_parser.hpp
/// @brief Single-item price parsing: extraction → multi-locale parse →
///        disambiguation → MonetaryAmount.
///
/// # Module: Money Parser
///
/// ## Usage
/// ```cpp
/// pricenorm::parse::MoneyParser parser;            // standard table
/// auto result = parser.parse("EUR 1.234,56");
/// if (auto* m = std::get_if<pricenorm::money::MonetaryAmount>(&result))
///     fmt::print("{}\n", m->to_string());          // EUR 1,234.56
/// ```
///
/// ## Guarantees
/// - Never throws for malformed input; every failure is a `ParseError`
/// - Owns its LocaleTable; `parse` is `const` and safe to call concurrently
/// - Same input always yields the same result and the same error kind

#include "pricenorm/locale_table.hpp"
#include "pricenorm/money.hpp"

#include <string_view>

namespace pricenorm::parse {

class MoneyParser {
public:
    /// Parser over the standard table.
    MoneyParser();

    /// Parser over an alternate table.
    explicit MoneyParser(locale::LocaleTable table);

    [[nodiscard]] money::ParseResult<money::MonetaryAmount>
    parse(std::string_view raw) const;

    [[nodiscard]] const locale::LocaleTable& table() const noexcept { return table_; }

private:
    locale::LocaleTable table_;
};

} // namespace pricenorm::parse

namespace pricenorm {

/// Parse one price string with the standard table.
[[nodiscard]] money::ParseResult<money::MonetaryAmount>
parse_money(std::string_view raw);

} // namespace pricenorm
