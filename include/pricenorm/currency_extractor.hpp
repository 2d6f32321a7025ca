#pragma once

/// @file include/pricenorm/currency_extractor.hpp
/// @brief Currency Extractor: split a raw price into currency hint and number.
///
/// # Module: Currency Extractor
///
/// ## Algorithm
/// 1. Trim. Empty input → `ParseErrorKind::EmptyInput`.
/// 2. A leading run of 2–3 uppercase ASCII letters (greedy), optionally
///    followed by whitespace, is consumed if the letters name a code in the
///    locale table: `"EUR 1.234,56"` → (EUR, `"1.234,56"`).
/// 3. Otherwise the first of `$`, `€`, `£` (in that priority) present anywhere
///    in the string is removed everywhere and the rest trimmed:
///    `"1,000 $"` → (USD, `"1,000"`).
/// 4. Otherwise no currency; the trimmed input passes through unchanged.
///
/// ## Guarantees
/// - Pure and deterministic
/// - Holds a reference to the table; the table must outlive the extractor

#include "pricenorm/locale_table.hpp"
#include "pricenorm/money.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pricenorm::parse {

/// Output of CurrencyExtractor::extract.
struct Extraction {
    std::optional<std::string> currency_code; ///< Detected code, uppercase
    std::string numeric;                      ///< Residual numeric substring
};

class CurrencyExtractor {
public:
    explicit CurrencyExtractor(const locale::LocaleTable& table) noexcept
        : table_(&table) {}

    [[nodiscard]] money::ParseResult<Extraction>
    extract(std::string_view raw) const;

private:
    const locale::LocaleTable* table_;

    /// Step 2. Returns nullopt when no known code prefixes `text`.
    [[nodiscard]] std::optional<Extraction>
    match_code_prefix(std::string_view text) const;

    /// Step 3. Returns nullopt when no recognised symbol occurs in `text`.
    [[nodiscard]] static std::optional<Extraction>
    match_symbol(std::string_view text);
};

} // namespace pricenorm::parse
