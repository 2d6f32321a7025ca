#pragma once

/// @file include/pricenorm/number_parser.hpp
/// @brief Multi-Locale Number Parser: read a numeric substring under every
///        supported convention.
///
/// # Module: Number Parser
///
/// ## Responsibility
/// Interpret a numeric substring under each locale convention of the table
/// (declared order), then under the invariant dot-decimal convention, and
/// return the distinct values obtained.
///
/// ## Grammar (locale conventions)
/// ```
/// number  := ws* ( '(' ws* body ws* ')' | sign? ws* body ) ws*
/// body    := symbol? ws* digits ws* symbol?      // at most one symbol
/// digits  := int ( DEC frac? )? | DEC frac
/// int     := D+ | D{1,3} ( GRP D{3} )+
/// frac    := D+
/// ```
/// The invariant convention accepts only `sign? D+ ('.' D*)? | sign? '.' D+`,
/// with no grouping, symbol or parentheses.
///
/// ## Deduplication
/// Candidates are unique by *value*: `"100"` reads as 100 under every
/// convention and yields one candidate; `"1.234"` yields 1.234 (en-US) and
/// 1234 (de-DE). The first convention to produce a value labels it.
///
/// ## Guarantees
/// - Pure; no shared mutable state
/// - Bounded: inputs longer than `constants::MAX_INPUT_LENGTH` yield no candidates

#include "pricenorm/decimal.hpp"
#include "pricenorm/locale_table.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pricenorm::parse {

// ─── NumberGrammar ────────────────────────────────────────────────────────────

/// Separator rules for one parse attempt.
struct NumberGrammar {
    char                decimal_separator{'.'};
    std::optional<char> group_separator;   ///< nullopt → grouping not allowed
    std::string         currency_symbol;   ///< empty → no symbol allowed
    bool                allow_parentheses{false};

    /// Grammar of a table convention.
    [[nodiscard]] static NumberGrammar
    from_convention(const locale::LocaleConvention& convention);

    /// Plain dot-decimal grammar with no grouping.
    [[nodiscard]] static NumberGrammar invariant() noexcept;
};

/// Parse `text` under `grammar`.
///
/// # Returns
/// The exact value, or `nullopt` if `text` is not a valid number under the
/// grammar's rules.
[[nodiscard]] std::optional<money::Decimal>
parse_number(std::string_view text, const NumberGrammar& grammar);

// ─── ParseCandidate ───────────────────────────────────────────────────────────

/// One distinct reading of a numeric substring.
struct ParseCandidate {
    std::string                label;          ///< e.g. "Format: en-US ($)"
    money::Decimal             value;
    std::optional<std::string> currency_code;  ///< nullopt for the invariant convention
};

// ─── MultiLocaleParser ────────────────────────────────────────────────────────

class MultiLocaleParser {
public:
    /// The table must outlive the parser.
    explicit MultiLocaleParser(const locale::LocaleTable& table) noexcept
        : table_(&table) {}

    /// All distinct readings of `numeric`, in convention order.
    [[nodiscard]] std::vector<ParseCandidate> parse(std::string_view numeric) const;

private:
    const locale::LocaleTable* table_;
};

} // namespace pricenorm::parse
