#ifndef CONFIG_FILE_HPP
#define CONFIG_FILE_HPP

#include "prodconf/quantity.hpp"

#include <cstddef>      // for size_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <variant>      // for variant
#include <vector>       // for vector

namespace prodconf {

using ValueList = std::vector<std::string>;

/// Raw value of a key: a single string, a multi-line list or a size literal.
using Value = std::variant<std::string, ValueList, Quantity>;

/// @brief Where a value was read from.
struct SourceLocation final {
    std::string path{};
    std::size_t line{};

    bool operator==(const SourceLocation&) const = default;
};

struct Entry final {
    std::string key{};
    Value value{};
    SourceLocation origin{};

    bool operator==(const Entry&) const = default;
};

/// @brief Keys of one section, in the order they first appeared.
struct Section final {
    std::string name{};
    std::vector<Entry> entries{};

    [[nodiscard]] auto find(std::string_view key) const noexcept -> const Entry*;
    [[nodiscard]] auto find(std::string_view key) noexcept -> Entry*;

    bool operator==(const Section&) const = default;
};

/// @brief One parsed configuration file. Immutable once parsed.
struct ConfigFile final {
    std::string path{};
    std::vector<Section> sections{};

    [[nodiscard]] auto find_section(std::string_view name) const noexcept -> const Section*;
    [[nodiscard]] auto find(std::string_view section, std::string_view key) const noexcept -> const Value*;

    bool operator==(const ConfigFile&) const = default;
};

/// @brief Single line rendering of a value.
/// Lists are joined with a single space, quantities rendered with their unit.
[[nodiscard]] auto value_to_string(const Value& value) noexcept -> std::string;

/// @brief Split a value into blank separated words.
/// `root_device_types = LVM LVM_THINP` and the multi-line form give the same words.
[[nodiscard]] auto value_to_words(const Value& value) noexcept -> std::vector<std::string>;

/// @brief Split a value into its non-empty lines, a single line value gives one line.
[[nodiscard]] auto value_to_lines(const Value& value) noexcept -> std::vector<std::string>;

/// @brief Interpret `True/False`, `yes/no`, `on/off` and `1/0`, ignoring case.
/// @return std::nullopt for anything else.
[[nodiscard]] auto parse_bool(std::string_view text) noexcept -> std::optional<bool>;

}  // namespace prodconf

#endif  // CONFIG_FILE_HPP
