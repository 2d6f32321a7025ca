/// @file src/parse/number_parser.cpp
/// @brief Strict per-convention number grammar and multi-locale candidate
///        collection.
///
/// Each attempt:
///   1. Rejects over-long input, trims surrounding whitespace
///   2. Strips accounting parentheses or a leading sign
///   3. Strips the convention's currency symbol (prefix or suffix, once)
///   4. Validates digit groups and the decimal separator, then builds an
///      exact Decimal from the separator-free digits

#include "pricenorm/number_parser.hpp"
#include "pricenorm/constants.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace pricenorm::parse {

namespace {

bool all_digits(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

bool starts_with_sign(std::string_view s) noexcept {
    return !s.empty() && (s.front() == '+' || s.front() == '-');
}

/// Validate a grouped integer part: D{1,3} (GRP D{3})+.
bool valid_groups(std::string_view int_part, char group) noexcept {
    std::size_t start = 0;
    bool first = true;
    while (true) {
        const std::size_t sep = int_part.find(group, start);
        const std::string_view chunk = int_part.substr(
            start, sep == std::string_view::npos ? std::string_view::npos : sep - start);

        if (!all_digits(chunk)) return false;
        if (first) {
            if (chunk.empty() || chunk.size() > constants::GROUP_WIDTH) return false;
        } else if (chunk.size() != constants::GROUP_WIDTH) {
            return false;
        }

        if (sep == std::string_view::npos) return true;
        start = sep + 1;
        first = false;
    }
}

/// Parse the separator-bearing digit body (no whitespace, sign or symbol).
std::optional<money::Decimal>
parse_digits(std::string_view body, char decimal, std::optional<char> group) {
    if (body.empty()) return std::nullopt;

    const std::size_t dec_pos = body.find(decimal);
    std::string_view int_part = body;
    std::string_view frac_part;
    if (dec_pos != std::string_view::npos) {
        int_part  = body.substr(0, dec_pos);
        frac_part = body.substr(dec_pos + 1);
        if (frac_part.find(decimal) != std::string_view::npos) return std::nullopt;
    }

    if (!all_digits(frac_part)) return std::nullopt;

    std::string digits;
    digits.reserve(body.size());

    if (group && int_part.find(*group) != std::string_view::npos) {
        if (!valid_groups(int_part, *group)) return std::nullopt;
        for (char c : int_part) {
            if (c != *group) digits.push_back(c);
        }
    } else {
        if (!all_digits(int_part)) return std::nullopt;
        digits.append(int_part);
    }

    if (digits.empty() && frac_part.empty()) return std::nullopt;

    if (!frac_part.empty()) {
        digits.push_back('.');
        digits.append(frac_part);
    }
    return money::Decimal::from_string(digits);
}

/// Strip `symbol` from the front of `s`. Returns true if stripped.
bool strip_prefix(std::string_view& s, std::string_view symbol) noexcept {
    if (symbol.empty() || s.substr(0, symbol.size()) != symbol) return false;
    s.remove_prefix(symbol.size());
    s = text::trim_left(s);
    return true;
}

/// Strip `symbol` from the back of `s`. Returns true if stripped.
bool strip_suffix(std::string_view& s, std::string_view symbol) noexcept {
    if (symbol.empty() || s.size() < symbol.size() ||
        s.substr(s.size() - symbol.size()) != symbol) {
        return false;
    }
    s.remove_suffix(symbol.size());
    s = text::trim_right(s);
    return true;
}

} // namespace

// ─── NumberGrammar ────────────────────────────────────────────────────────────

NumberGrammar NumberGrammar::from_convention(const locale::LocaleConvention& convention) {
    return NumberGrammar{
        .decimal_separator = convention.decimal_separator,
        .group_separator   = convention.group_separator,
        .currency_symbol   = convention.currency_symbol,
        .allow_parentheses = true,
    };
}

NumberGrammar NumberGrammar::invariant() noexcept {
    return NumberGrammar{
        .decimal_separator = '.',
        .group_separator   = std::nullopt,
        .currency_symbol   = {},
        .allow_parentheses = false,
    };
}

// ─── parse_number ─────────────────────────────────────────────────────────────

std::optional<money::Decimal>
parse_number(std::string_view text, const NumberGrammar& grammar) {
    if (text.size() > constants::MAX_INPUT_LENGTH) return std::nullopt;

    std::string_view s = text::trim(text);
    if (s.empty()) return std::nullopt;

    bool negative = false;
    bool signed_or_wrapped = false;

    if (grammar.allow_parentheses && s.front() == '(') {
        if (s.size() < 2 || s.back() != ')') return std::nullopt;
        s = text::trim(s.substr(1, s.size() - 2));
        negative = true;
        signed_or_wrapped = true;
    } else if (starts_with_sign(s)) {
        negative = s.front() == '-';
        s = text::trim_left(s.substr(1));
        signed_or_wrapped = true;
    }

    // "$-5" is accepted as well as "-$5".
    const bool prefixed = strip_prefix(s, grammar.currency_symbol);
    if (prefixed && !signed_or_wrapped && starts_with_sign(s)) {
        negative = s.front() == '-';
        s = text::trim_left(s.substr(1));
    }
    if (!prefixed) {
        strip_suffix(s, grammar.currency_symbol);
    }

    auto value = parse_digits(s, grammar.decimal_separator, grammar.group_separator);
    if (!value) return std::nullopt;
    if (negative) return value->negated();
    return value;
}

// ─── MultiLocaleParser ────────────────────────────────────────────────────────

std::vector<ParseCandidate> MultiLocaleParser::parse(std::string_view numeric) const {
    std::vector<ParseCandidate> candidates;

    auto add = [&candidates](std::string label,
                             money::Decimal value,
                             std::optional<std::string> currency) {
        const bool seen = std::any_of(candidates.begin(), candidates.end(),
                                      [&value](const ParseCandidate& c) {
                                          return c.value == value;
                                      });
        if (!seen) {
            candidates.push_back(ParseCandidate{
                std::move(label), std::move(value), std::move(currency)});
        }
    };

    for (const auto& convention : table_->conventions()) {
        auto value = parse_number(numeric, NumberGrammar::from_convention(convention));
        if (value) {
            add(convention.label(), std::move(*value), convention.currency_code);
        }
    }

    if (auto value = parse_number(numeric, NumberGrammar::invariant())) {
        add(std::string(constants::INVARIANT_LABEL), std::move(*value), std::nullopt);
    }

    return candidates;
}

} // namespace pricenorm::parse
