#include "prodconf/string_utils.hpp"

#include <algorithm>  // for transform
#include <cctype>     // for tolower

namespace prodconf::utils {

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    std::string res{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            res += delim;
        }
        res += lines[i];
    }
    return res;
}

auto split_words(std::string_view str) noexcept -> std::vector<std::string> {
    std::vector<std::string> words{};
    std::size_t pos = 0;
    while (pos < str.size()) {
        while (pos < str.size() && is_blank(str[pos])) {
            ++pos;
        }
        const auto start = pos;
        while (pos < str.size() && !is_blank(str[pos])) {
            ++pos;
        }
        if (pos > start) {
            words.emplace_back(str.substr(start, pos - start));
        }
    }
    return words;
}

auto to_lower(std::string_view str) noexcept -> std::string {
    std::string res{str};
    std::ranges::transform(res, res.begin(),
        [](char char_elem) { return static_cast<char>(std::tolower(static_cast<unsigned char>(char_elem))); });
    return res;
}

}  // namespace prodconf::utils
