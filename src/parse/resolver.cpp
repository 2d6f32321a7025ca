/// @file src/parse/resolver.cpp
/// @brief Candidate-count disambiguation and currency selection.

#include "pricenorm/resolver.hpp"

#include <utility>

namespace pricenorm::parse {

money::ParseResult<ParseCandidate>
AmbiguityResolver::resolve(std::vector<ParseCandidate> candidates, std::string_view input) {
    if (candidates.empty()) {
        return money::ParseError{money::ParseErrorKind::UnparsableAmount,
                                 std::string(input), {}};
    }

    if (candidates.size() > 1) {
        std::vector<std::string> labels;
        labels.reserve(candidates.size());
        for (auto& c : candidates) {
            labels.push_back(std::move(c.label));
        }
        return money::ParseError{money::ParseErrorKind::AmbiguousFormat,
                                 std::string(input), std::move(labels)};
    }

    return std::move(candidates.front());
}

std::string AmbiguityResolver::select_currency(const std::optional<std::string>& detected,
                                               const ParseCandidate& accepted,
                                               const locale::LocaleTable& table) {
    if (detected) return *detected;
    // Candidates keep the currency of the first convention, in table order,
    // that produced their value.
    if (accepted.currency_code) return *accepted.currency_code;
    return table.default_currency();
}

} // namespace pricenorm::parse
