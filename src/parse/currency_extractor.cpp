/// @file src/parse/currency_extractor.cpp
/// @brief Leading-code and symbol detection for raw price strings.

#include "pricenorm/currency_extractor.hpp"
#include "text_util.hpp"

#include <array>
#include <cstddef>
#include <utility>

namespace pricenorm::parse {

namespace {

struct SymbolMapping {
    std::string_view symbol;
    std::string_view currency_code;
};

/// Recognised symbols in priority order.
constexpr std::array<SymbolMapping, 3> SYMBOLS = {{
    {"$",            "USD"},
    {"\xE2\x82\xAC", "EUR"}, // €
    {"\xC2\xA3",     "GBP"}, // £
}};

bool is_upper_ascii(char c) noexcept {
    return c >= 'A' && c <= 'Z';
}

/// `text` with every occurrence of `needle` removed.
std::string remove_all(std::string_view text, std::string_view needle) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t hit = text.find(needle, pos);
        if (hit == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, hit - pos));
        pos = hit + needle.size();
    }
    return out;
}

} // namespace

// ─── extract ──────────────────────────────────────────────────────────────────

money::ParseResult<Extraction>
CurrencyExtractor::extract(std::string_view raw) const {
    const std::string_view text = text::trim(raw);
    if (text.empty()) {
        return money::ParseError{money::ParseErrorKind::EmptyInput, std::string(raw), {}};
    }

    if (auto by_code = match_code_prefix(text)) {
        return std::move(*by_code);
    }
    if (auto by_symbol = match_symbol(text)) {
        return std::move(*by_symbol);
    }
    return Extraction{std::nullopt, std::string(text)};
}

// ─── match_code_prefix ────────────────────────────────────────────────────────

std::optional<Extraction>
CurrencyExtractor::match_code_prefix(std::string_view text) const {
    std::size_t letters = 0;
    while (letters < text.size() && letters < 3 && is_upper_ascii(text[letters])) {
        ++letters;
    }
    if (letters < 2) return std::nullopt;

    const std::string_view code = text.substr(0, letters);
    if (!table_->contains(code)) return std::nullopt;

    std::string_view rest = text.substr(letters);
    rest = text::trim_left(rest);
    return Extraction{std::string(code), std::string(rest)};
}

// ─── match_symbol ─────────────────────────────────────────────────────────────

std::optional<Extraction>
CurrencyExtractor::match_symbol(std::string_view text) {
    for (const auto& m : SYMBOLS) {
        if (text.find(m.symbol) == std::string_view::npos) continue;
        const std::string stripped = remove_all(text, m.symbol);
        return Extraction{std::string(m.currency_code), std::string(text::trim(stripped))};
    }
    return std::nullopt;
}

} // namespace pricenorm::parse
