#include "prodconf/config_merger.hpp"

#include <algorithm>  // for any_of, find_if
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

auto is_additive(const std::vector<prodconf::KeyRef>& additive_keys, std::string_view section, std::string_view key) noexcept -> bool {
    return std::ranges::any_of(additive_keys, [&](auto&& key_ref) { return key_ref.section == section && key_ref.key == key; });
}

void append_unique(prodconf::ValueList& list, std::vector<std::string>&& items) noexcept {
    for (auto& item : items) {
        if (std::ranges::find(list, item) == list.end()) {
            list.emplace_back(std::move(item));
        }
    }
}

auto find_or_add_section(std::vector<prodconf::Section>& sections, std::string_view name) noexcept -> prodconf::Section& {
    const auto it = std::ranges::find_if(sections, [name](auto&& section) { return section.name == name; });
    if (it != sections.end()) {
        return *it;
    }
    return sections.emplace_back(prodconf::Section{.name = std::string{name}});
}

}  // namespace

namespace prodconf {

auto default_additive_keys() noexcept -> std::vector<KeyRef> {
    return {
        {"Payload", "default_repositories"},
        {"Payload", "updates_repositories"},
        {"User Interface", "default_help_pages"},
    };
}

auto EffectiveConfig::find_section(std::string_view name) const noexcept -> const Section* {
    const auto it = std::ranges::find_if(sections, [name](auto&& section) { return section.name == name; });
    return (it != sections.end()) ? &*it : nullptr;
}

auto EffectiveConfig::find_entry(std::string_view section, std::string_view key) const noexcept -> const Entry* {
    const auto* section_ptr = find_section(section);
    return (section_ptr != nullptr) ? section_ptr->find(key) : nullptr;
}

auto EffectiveConfig::find(std::string_view section, std::string_view key) const noexcept -> const Value* {
    const auto* entry = find_entry(section, key);
    return (entry != nullptr) ? &entry->value : nullptr;
}

auto merge(const ProductChain& chain, const MergeOptions& options) noexcept -> EffectiveConfig {
    EffectiveConfig result{};

    for (const auto& config_file : chain.entries) {
        result.sources.push_back(config_file.path);

        for (const auto& section : config_file.sections) {
            if (section.name == "Base Product"sv) {
                continue;
            }
            auto& target = find_or_add_section(result.sections, section.name);

            for (const auto& entry : section.entries) {
                const bool additive = is_additive(options.additive_keys, section.name, entry.key);
                auto* existing      = target.find(entry.key);

                if (additive) {
                    ValueList merged{};
                    if (existing != nullptr) {
                        append_unique(merged, value_to_words(existing->value));
                    }
                    append_unique(merged, value_to_words(entry.value));

                    if (existing != nullptr) {
                        existing->value  = std::move(merged);
                        existing->origin = entry.origin;
                    } else {
                        target.entries.emplace_back(Entry{.key = entry.key, .value = std::move(merged), .origin = entry.origin});
                    }
                    continue;
                }

                if (existing != nullptr) {
                    spdlog::debug("[{}] {} overridden by '{}'", section.name, entry.key, entry.origin.path);
                    existing->value  = entry.value;
                    existing->origin = entry.origin;
                } else {
                    target.entries.push_back(entry);
                }
            }
        }
    }

    spdlog::info("Merged {} file(s) into {} section(s)", result.sources.size(), result.sections.size());
    return result;
}

auto to_config_text(const EffectiveConfig& config) noexcept -> std::string {
    std::string content{};
    for (const auto& section : config.sections) {
        if (!content.empty()) {
            content += '\n';
        }
        content += fmt::format(FMT_COMPILE("[{}]\n"), section.name);

        for (const auto& entry : section.entries) {
            if (const auto* list = std::get_if<ValueList>(&entry.value)) {
                content += fmt::format(FMT_COMPILE("{} =\n"), entry.key);
                for (const auto& item : *list) {
                    content += fmt::format(FMT_COMPILE("    {}\n"), item);
                }
                continue;
            }
            const auto& rendered = value_to_string(entry.value);
            if (rendered.empty()) {
                content += fmt::format(FMT_COMPILE("{} =\n"), entry.key);
            } else {
                content += fmt::format(FMT_COMPILE("{} = {}\n"), entry.key, rendered);
            }
        }
    }
    return content;
}

}  // namespace prodconf
