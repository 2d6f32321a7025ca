#pragma once

/// @file include/pricenorm/resolver.hpp
/// @brief Ambiguity Resolver: collapse parse candidates to a single value.
///
/// # Module: Ambiguity Resolver
///
/// | candidates | result                                   |
/// |------------|------------------------------------------|
/// | 0          | `ParseErrorKind::UnparsableAmount`       |
/// | 1          | the candidate                            |
/// | ≥ 2        | `ParseErrorKind::AmbiguousFormat` + labels |
///
/// Currency selection for an accepted candidate:
///   detected code → candidate's convention currency → table default.

#include "pricenorm/locale_table.hpp"
#include "pricenorm/money.hpp"
#include "pricenorm/number_parser.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pricenorm::parse {

class AmbiguityResolver {
public:
    /// Reduce `candidates` for the original `input`.
    [[nodiscard]] static money::ParseResult<ParseCandidate>
    resolve(std::vector<ParseCandidate> candidates, std::string_view input);

    /// Pick the currency for an accepted candidate.
    ///
    /// The explicitly detected code wins; otherwise the currency of the
    /// convention that first produced the value; otherwise (invariant-only
    /// reading) `table.default_currency()`.
    [[nodiscard]] static std::string
    select_currency(const std::optional<std::string>& detected,
                    const ParseCandidate& accepted,
                    const locale::LocaleTable& table);
};

} // namespace pricenorm::parse
