#pragma once

/// @file include/pricenorm/locale_table.hpp
/// @brief Locale Numeric Table: currency code → numeric-format convention.
///
/// # Module: Locale Table
///
/// ## Responsibility
/// Hold the fixed set of locale conventions used both to recognise formatted
/// numbers and to label parse candidates. The table is an explicitly
/// constructed, read-only object: parsers receive it at construction time, and
/// tests may build alternate tables with `LocaleTable::make`.
///
/// ## Declared Order
/// Enumeration order is the order the conventions were supplied in. It is
/// significant: when several conventions read an input to the same value, the
/// first one in declared order supplies the default currency.
///
/// ## Guarantees
/// - Immutable after construction; `const` access is safe from any thread
/// - Lookup by code is case-insensitive
/// - No duplicate codes; decimal and group separators always differ

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pricenorm::locale {

// ─── LocaleConvention ─────────────────────────────────────────────────────────

/// How one region writes formatted currency amounts.
struct LocaleConvention {
    std::string currency_code;    ///< Uppercase ISO 4217 code, e.g. "EUR"
    std::string locale_name;      ///< Display locale identifier, e.g. "de-DE"
    char        decimal_separator;
    char        group_separator;
    std::string currency_symbol;  ///< UTF-8, e.g. "€"
    unsigned    display_decimals; ///< Fractional digits used for rendering

    /// Candidate label, e.g. `"Format: de-DE (€)"`.
    [[nodiscard]] std::string label() const;
};

// ─── LocaleTable ──────────────────────────────────────────────────────────────

class LocaleTable {
public:
    /// Build a table from `conventions` in the given order.
    ///
    /// # Returns
    /// `nullopt` if the list is empty, a code repeats (case-insensitively), or
    /// any convention uses the same character for decimal and group separator.
    [[nodiscard]] static std::optional<LocaleTable>
    make(std::vector<LocaleConvention> conventions);

    /// The standard table: USD, EUR, GBP, JPY, PHP, CAD, AUD.
    [[nodiscard]] static const LocaleTable& defaults();

    /// Case-insensitive lookup. Returns nullptr for unknown codes.
    [[nodiscard]] const LocaleConvention* find(std::string_view code) const noexcept;

    [[nodiscard]] bool contains(std::string_view code) const noexcept {
        return find(code) != nullptr;
    }

    /// All conventions in declared order.
    [[nodiscard]] const std::vector<LocaleConvention>& conventions() const noexcept {
        return conventions_;
    }

    /// Currency of the first declared convention.
    [[nodiscard]] const std::string& default_currency() const noexcept {
        return conventions_.front().currency_code;
    }

    [[nodiscard]] std::size_t size() const noexcept { return conventions_.size(); }

private:
    explicit LocaleTable(std::vector<LocaleConvention> conventions) noexcept
        : conventions_(std::move(conventions)) {}

    std::vector<LocaleConvention> conventions_;
};

} // namespace pricenorm::locale
