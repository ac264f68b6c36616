#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace prodconf::utils {

/// @brief Join a vector of strings into a single string using a delimiter.
/// @param lines The lines to join.
/// @param delim The delimiter to join the lines.
/// @return The joined lines as a single string.
auto join(const std::vector<std::string>& lines, std::string_view delim = "\n") noexcept -> std::string;

/// @brief Split on any run of blanks (space, tab, newline).
/// @param str The string to split.
/// @return The non-empty words in input order.
auto split_words(std::string_view str) noexcept -> std::vector<std::string>;

/// @brief Lowercase an ASCII string.
auto to_lower(std::string_view str) noexcept -> std::string;

constexpr auto is_blank(char ch) noexcept -> bool {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\v' || ch == '\f';
}

/// @brief Strip leading and trailing blanks.
constexpr auto trim(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && is_blank(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_blank(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

}  // namespace prodconf::utils

#endif  // STRING_UTILS_HPP
