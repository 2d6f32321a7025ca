#pragma once

/// @file include/pricenorm/normalizer.hpp
/// @brief Batch Normalizer: parse a list of price strings and sort the results.
///
/// # Module: Batch Normalizer
///
/// ## Responsibility
/// Apply MoneyParser to every input in order. A failing item becomes a
/// `ParseFailure` entry and processing continues; one bad input never aborts
/// the batch. Successful amounts are stable-sorted ascending by value, so
/// equal amounts (in any currency) keep their input order.
///
/// ## Guarantees
/// - Never throws for malformed input; always returns both lists
/// - Sorting compares exact decimals only; currencies are not converted
///
/// ## NOT Responsible For
/// - Reading or printing lines (see src/main.cpp)

#include "pricenorm/money.hpp"
#include "pricenorm/money_parser.hpp"

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace pricenorm {

/// One rejected input.
struct ParseFailure {
    std::string           input;  ///< Original string as supplied
    money::ParseErrorKind kind;
    std::string           reason; ///< ParseError::message()
};

/// Output of a batch run.
struct BatchResult {
    std::vector<money::MonetaryAmount> amounts;  ///< Ascending by amount
    std::vector<ParseFailure>          failures; ///< Input order
};

class BatchNormalizer {
public:
    /// Normalizer over the standard table.
    BatchNormalizer() = default;

    explicit BatchNormalizer(parse::MoneyParser parser)
        : parser_(std::move(parser)) {}

    [[nodiscard]] BatchResult
    normalize_and_sort(std::span<const std::string> inputs) const;

private:
    parse::MoneyParser parser_;
};

/// Batch entry point over the standard table.
[[nodiscard]] BatchResult normalize_and_sort(std::span<const std::string> inputs);

} // namespace pricenorm
