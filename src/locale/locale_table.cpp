/// @file src/locale/locale_table.cpp
/// @brief LocaleTable construction, validation and the standard table.

#include "pricenorm/locale_table.hpp"
#include "pricenorm/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace pricenorm::locale {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

} // namespace

// ─── LocaleConvention ─────────────────────────────────────────────────────────

std::string LocaleConvention::label() const {
    return fmt::format("Format: {} ({})", locale_name, currency_symbol);
}

// ─── LocaleTable::make ────────────────────────────────────────────────────────

std::optional<LocaleTable> LocaleTable::make(std::vector<LocaleConvention> conventions) {
    if (conventions.empty()) return std::nullopt;

    for (std::size_t i = 0; i < conventions.size(); ++i) {
        auto& c = conventions[i];
        if (c.currency_code.empty()) return std::nullopt;
        if (c.decimal_separator == c.group_separator) return std::nullopt;

        std::transform(c.currency_code.begin(), c.currency_code.end(),
                       c.currency_code.begin(), [](unsigned char ch) {
                           return static_cast<char>(std::toupper(ch));
                       });

        for (std::size_t j = 0; j < i; ++j) {
            if (iequals(conventions[j].currency_code, c.currency_code)) {
                return std::nullopt;
            }
        }
    }

    return LocaleTable(std::move(conventions));
}

// ─── LocaleTable::defaults ────────────────────────────────────────────────────

const LocaleTable& LocaleTable::defaults() {
    static const LocaleTable table = [] {
        const unsigned d = constants::DISPLAY_DECIMALS;
        std::vector<LocaleConvention> v{
            {"USD", "en-US", '.', ',', "$",            d},
            {"EUR", "de-DE", ',', '.', "\xE2\x82\xAC", d}, // €
            {"GBP", "en-GB", '.', ',', "\xC2\xA3",     d}, // £
            {"JPY", "ja-JP", '.', ',', "\xC2\xA5",     d}, // ¥
            {"PHP", "en-PH", '.', ',', "\xE2\x82\xB1", d}, // ₱
            {"CAD", "en-CA", '.', ',', "$",            d},
            {"AUD", "en-AU", '.', ',', "$",            d},
        };
        return LocaleTable(std::move(v));
    }();
    return table;
}

// ─── LocaleTable::find ────────────────────────────────────────────────────────

const LocaleConvention* LocaleTable::find(std::string_view code) const noexcept {
    for (const auto& c : conventions_) {
        if (iequals(c.currency_code, code)) return &c;
    }
    return nullptr;
}

} // namespace pricenorm::locale
