#pragma once

/// @file src/parse/text_util.hpp
/// @brief Whitespace helpers shared by the parsing stages (internal).

#include <cctype>
#include <string_view>

namespace pricenorm::text {

[[nodiscard]] inline bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] inline std::string_view trim_left(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    return s;
}

[[nodiscard]] inline std::string_view trim_right(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    return trim_right(trim_left(s));
}

} // namespace pricenorm::text
