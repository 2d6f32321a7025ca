/// @file src/parse/money_parser.cpp
/// @brief MoneyParser: composes extraction, multi-locale parsing and
///        disambiguation into one typed result.

#include "pricenorm/money_parser.hpp"
#include "pricenorm/currency_extractor.hpp"
#include "pricenorm/number_parser.hpp"
#include "pricenorm/resolver.hpp"

#include <utility>
#include <variant>

namespace pricenorm::parse {

MoneyParser::MoneyParser() : table_(locale::LocaleTable::defaults()) {}

MoneyParser::MoneyParser(locale::LocaleTable table) : table_(std::move(table)) {}

money::ParseResult<money::MonetaryAmount>
MoneyParser::parse(std::string_view raw) const {
    const CurrencyExtractor extractor(table_);
    auto extracted = extractor.extract(raw);
    if (auto* err = std::get_if<money::ParseError>(&extracted)) {
        return std::move(*err);
    }
    auto& extraction = std::get<Extraction>(extracted);

    const MultiLocaleParser numbers(table_);
    auto resolved = AmbiguityResolver::resolve(numbers.parse(extraction.numeric), raw);
    if (auto* err = std::get_if<money::ParseError>(&resolved)) {
        return std::move(*err);
    }
    auto& accepted = std::get<ParseCandidate>(resolved);

    const std::string currency =
        AmbiguityResolver::select_currency(extraction.currency_code, accepted, table_);
    return money::MonetaryAmount::make(std::move(accepted.value), currency);
}

} // namespace pricenorm::parse

namespace pricenorm {

money::ParseResult<money::MonetaryAmount> parse_money(std::string_view raw) {
    static const parse::MoneyParser parser;
    return parser.parse(raw);
}

} // namespace pricenorm
