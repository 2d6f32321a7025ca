/// @file src/normalizer/batch_normalizer.cpp
/// @brief BatchNormalizer: per-item parse with failure collection, then a
///        stable ascending sort by amount.

#include "pricenorm/normalizer.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

namespace pricenorm {

BatchResult BatchNormalizer::normalize_and_sort(std::span<const std::string> inputs) const {
    BatchResult out;
    out.amounts.reserve(inputs.size());

    for (const auto& input : inputs) {
        std::visit(
            [&](auto&& result) {
                using T = std::decay_t<decltype(result)>;
                if constexpr (std::is_same_v<T, money::MonetaryAmount>) {
                    out.amounts.push_back(std::move(result));
                } else {
                    static_assert(std::is_same_v<T, money::ParseError>);
                    out.failures.push_back(
                        ParseFailure{input, result.kind, result.message()});
                }
            },
            parser_.parse(input));
    }

    std::stable_sort(out.amounts.begin(), out.amounts.end(),
                     [](const money::MonetaryAmount& a, const money::MonetaryAmount& b) {
                         return a.amount() < b.amount();
                     });
    return out;
}

BatchResult normalize_and_sort(std::span<const std::string> inputs) {
    static const BatchNormalizer normalizer;
    return normalizer.normalize_and_sort(inputs);
}

} // namespace pricenorm
