/**
 * @file  prop_round_trip.cpp
 * @brief Property: ∀ code ∈ SUPPORTED, ∀ A ≥ 0 with ≤ 2 decimals:
 *        parse("{code} {A}") == (A, code), and parse(to_string(m)) == m.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_round_trip
 *
 * Basis:
 *   Rendered amounts always carry exactly two fractional digits, which no
 *   thousands-grouping convention can read as a group of three, so the
 *   rendered form is never ambiguous.
 */

#include <rapidcheck.h>

#include <string>
#include <variant>
#include <vector>

#include "pricenorm/constants.hpp"
#include "pricenorm/money_parser.hpp"

using namespace pricenorm;
using namespace pricenorm::money;

namespace {

const std::vector<std::string> CODES(constants::SUPPORTED_CURRENCIES.begin(),
                                     constants::SUPPORTED_CURRENCIES.end());

} // namespace

int main() {
    bool ok = true;

    // ── Property 1: plain dot-decimal with a code prefix round-trips ─────────
    ok &= rc::check(
        "round_trip: parse(\"CODE units.cents\") yields the same exact amount",
        [] {
            const auto code  = *rc::gen::elementOf(CODES);
            const auto units = *rc::gen::inRange<long>(0, 1000);
            const auto cents = *rc::gen::inRange<long>(0, 100);

            const std::string literal = std::to_string(units) + "." +
                                        (cents < 10 ? "0" : "") + std::to_string(cents);
            const auto expected = Decimal::from_string(literal);
            RC_ASSERT(expected.has_value());

            auto r = parse_money(code + " " + literal);
            RC_ASSERT(succeeded(r));
            const auto& m = std::get<MonetaryAmount>(r);
            RC_ASSERT(m.currency_code() == code);
            RC_ASSERT(m.amount() == *expected);
        });

    // ── Property 2: to_string output parses back to the same value ───────────
    ok &= rc::check(
        "round_trip: parse(m.to_string()) == m for any two-decimal amount",
        [] {
            const auto code      = *rc::gen::elementOf(CODES);
            const auto hundredth = *rc::gen::inRange<long>(0, 1'000'000'000'000L);

            auto made = MonetaryAmount::make(Decimal(mpz_class(hundredth), 2), code);
            RC_ASSERT(succeeded(made));
            const auto& m = std::get<MonetaryAmount>(made);

            auto r = parse_money(m.to_string());
            RC_ASSERT(succeeded(r));
            RC_ASSERT(std::get<MonetaryAmount>(r) == m);
        });

    return ok ? 0 : 1;
}
