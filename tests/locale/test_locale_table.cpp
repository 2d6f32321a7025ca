/// @file tests/locale/test_locale_table.cpp
/// @brief Unit tests for LocaleTable construction and lookup.

#include <gtest/gtest.h>
#include "pricenorm/locale_table.hpp"

#include <string>
#include <vector>

using namespace pricenorm::locale;

TEST(LocaleTable, DefaultsCoverSupportedCurrenciesInOrder) {
    const auto& table = LocaleTable::defaults();
    ASSERT_EQ(table.size(), 7u);

    const std::vector<std::string> expected{"USD", "EUR", "GBP", "JPY", "PHP", "CAD", "AUD"};
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(table.conventions()[i].currency_code, expected[i]);
        EXPECT_EQ(table.conventions()[i].display_decimals, 2u);
    }
    EXPECT_EQ(table.default_currency(), "USD");
}

TEST(LocaleTable, EuroUsesDecimalComma) {
    const auto* eur = LocaleTable::defaults().find("EUR");
    ASSERT_NE(eur, nullptr);
    EXPECT_EQ(eur->locale_name, "de-DE");
    EXPECT_EQ(eur->decimal_separator, ',');
    EXPECT_EQ(eur->group_separator, '.');
    EXPECT_EQ(eur->currency_symbol, "\xE2\x82\xAC");
}

TEST(LocaleTable, LookupIsCaseInsensitive) {
    const auto& table = LocaleTable::defaults();
    EXPECT_TRUE(table.contains("usd"));
    EXPECT_TRUE(table.contains("Gbp"));
    EXPECT_FALSE(table.contains("CHF"));
    EXPECT_FALSE(table.contains(""));
    EXPECT_EQ(table.find("php")->locale_name, "en-PH");
}

TEST(LocaleTable, LabelNamesLocaleAndSymbol) {
    EXPECT_EQ(LocaleTable::defaults().find("USD")->label(), "Format: en-US ($)");
    EXPECT_EQ(LocaleTable::defaults().find("EUR")->label(),
              "Format: de-DE (\xE2\x82\xAC)");
}

TEST(LocaleTable, MakeRejectsInvalidTables) {
    EXPECT_FALSE(LocaleTable::make({}).has_value());
    EXPECT_FALSE(LocaleTable::make({
        {"USD", "en-US", '.', ',', "$", 2},
        {"usd", "en-CA", '.', ',', "$", 2},
    }).has_value());
    EXPECT_FALSE(LocaleTable::make({{"USD", "xx", '.', '.', "$", 2}}).has_value());
}

TEST(LocaleTable, MakeKeepsDeclaredOrderAndUppercases) {
    auto table = LocaleTable::make({
        {"eur", "de-DE", ',', '.', "\xE2\x82\xAC", 2},
        {"USD", "en-US", '.', ',', "$", 2},
    });
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->default_currency(), "EUR");
    EXPECT_EQ(table->conventions()[1].currency_code, "USD");
}
