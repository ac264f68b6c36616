#include "prodconf/config_file.hpp"
#include "prodconf/string_utils.hpp"

#include <algorithm>  // for find_if
#include <iterator>   // for make_move_iterator

using namespace std::string_view_literals;

namespace prodconf {

auto Section::find(std::string_view key) const noexcept -> const Entry* {
    const auto it = std::ranges::find_if(entries, [key](auto&& entry) { return entry.key == key; });
    return (it != entries.end()) ? &*it : nullptr;
}

auto Section::find(std::string_view key) noexcept -> Entry* {
    const auto it = std::ranges::find_if(entries, [key](auto&& entry) { return entry.key == key; });
    return (it != entries.end()) ? &*it : nullptr;
}

auto ConfigFile::find_section(std::string_view name) const noexcept -> const Section* {
    const auto it = std::ranges::find_if(sections, [name](auto&& section) { return section.name == name; });
    return (it != sections.end()) ? &*it : nullptr;
}

auto ConfigFile::find(std::string_view section, std::string_view key) const noexcept -> const Value* {
    const auto* section_ptr = find_section(section);
    if (section_ptr == nullptr) {
        return nullptr;
    }
    const auto* entry = section_ptr->find(key);
    return (entry != nullptr) ? &entry->value : nullptr;
}

auto value_to_string(const Value& value) noexcept -> std::string {
    if (const auto* str = std::get_if<std::string>(&value)) {
        return *str;
    }
    if (const auto* list = std::get_if<ValueList>(&value)) {
        return utils::join(*list, " ");
    }
    return units::quantity_to_string(std::get<Quantity>(value));
}

auto value_to_words(const Value& value) noexcept -> std::vector<std::string> {
    if (const auto* list = std::get_if<ValueList>(&value)) {
        std::vector<std::string> words{};
        for (const auto& item : *list) {
            auto item_words = utils::split_words(item);
            words.insert(words.end(), std::make_move_iterator(item_words.begin()), std::make_move_iterator(item_words.end()));
        }
        return words;
    }
    return utils::split_words(value_to_string(value));
}

auto value_to_lines(const Value& value) noexcept -> std::vector<std::string> {
    std::vector<std::string> lines{};
    if (const auto* list = std::get_if<ValueList>(&value)) {
        for (const auto& item : *list) {
            const auto trimmed = utils::trim(item);
            if (!trimmed.empty()) {
                lines.emplace_back(trimmed);
            }
        }
        return lines;
    }

    const auto& rendered = value_to_string(value);
    const auto trimmed   = utils::trim(rendered);
    if (!trimmed.empty()) {
        lines.emplace_back(trimmed);
    }
    return lines;
}

auto parse_bool(std::string_view text) noexcept -> std::optional<bool> {
    const auto& lowered = utils::to_lower(utils::trim(text));
    if (lowered == "true"sv || lowered == "yes"sv || lowered == "on"sv || lowered == "1"sv) {
        return true;
    }
    if (lowered == "false"sv || lowered == "no"sv || lowered == "off"sv || lowered == "0"sv) {
        return false;
    }
    return std::nullopt;
}

}  // namespace prodconf
