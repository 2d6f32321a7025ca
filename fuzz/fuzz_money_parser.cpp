/**
 * @file  fuzz_money_parser.cpp
 * @brief libFuzzer target for parse_money and normalize_and_sort
 *
 * Build:
 *   cmake -DPRICENORM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_money_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_money_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. A successful parse carries a supported currency and re-parses from
 *      its rendered form to the same amount, rounded to two decimals.
 *   3. An AmbiguousFormat error lists at least two interpretations.
 *   4. Parsing the same input twice yields the same outcome.
 *   5. The batch form never loses an item: amounts + failures == lines.
 *
 * Fuzzer strategy:
 *   Input bytes are used directly as one price string, then split on '\n'
 *   into a batch. Exercises binary garbage, UTF-8 fragments of currency
 *   symbols, very long digit runs and mixed separators.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "pricenorm/constants.hpp"
#include "pricenorm/money_parser.hpp"
#include "pricenorm/normalizer.hpp"

using namespace pricenorm;
using namespace pricenorm::money;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    // ── Test 1: single-item parse ─────────────────────────────────────────────
    const auto result = parse_money(input);
    if (const auto* m = std::get_if<MonetaryAmount>(&result)) {
        assert(constants::is_supported_currency(m->currency_code()));

        // Grouping can push very long digit runs past the input bound.
        const auto rendered = m->to_string();
        if (rendered.size() <= constants::MAX_INPUT_LENGTH) {
            const auto again = parse_money(rendered);
            assert(succeeded(again));
            assert(std::get<MonetaryAmount>(again).amount() ==
                   m->amount().rounded(constants::DISPLAY_DECIMALS));
        }
    } else {
        const auto& err = std::get<ParseError>(result);
        if (err.kind == ParseErrorKind::AmbiguousFormat) {
            assert(err.interpretations.size() >= 2);
        }
    }

    // ── Test 2: determinism ───────────────────────────────────────────────────
    const auto repeat = parse_money(input);
    assert(result.index() == repeat.index());

    // ── Test 3: batch never drops items ───────────────────────────────────────
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= input.size()) {
        const std::size_t nl = input.find('\n', start);
        const std::size_t end = nl == std::string_view::npos ? input.size() : nl;
        lines.emplace_back(input.substr(start, end - start));
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    const auto batch = normalize_and_sort(lines);
    assert(batch.amounts.size() + batch.failures.size() == lines.size());

    return 0;
}
