#ifndef CONFIG_MERGER_HPP
#define CONFIG_MERGER_HPP

#include "prodconf/config_file.hpp"
#include "prodconf/product_registry.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace prodconf {

/// @brief Names a key inside a section.
struct KeyRef final {
    std::string section{};
    std::string key{};

    bool operator==(const KeyRef&) const = default;
};

/// Repository and help page lists, which accumulate along the chain
/// instead of being replaced.
[[nodiscard]] auto default_additive_keys() noexcept -> std::vector<KeyRef>;

struct MergeOptions final {
    std::vector<KeyRef> additive_keys{default_additive_keys()};
};

/// @brief Open section -> key -> value mapping produced by merging a chain.
///
/// Keys the library knows nothing about are kept as they are.
struct EffectiveConfig final {
    std::vector<Section> sections{};
    /// Paths of the merged files, in chain order
    std::vector<std::string> sources{};

    [[nodiscard]] auto find_section(std::string_view name) const noexcept -> const Section*;
    [[nodiscard]] auto find_entry(std::string_view section, std::string_view key) const noexcept -> const Entry*;
    [[nodiscard]] auto find(std::string_view section, std::string_view key) const noexcept -> const Value*;

    bool operator==(const EffectiveConfig&) const = default;
};

/// @brief Merge a chain into one configuration.
///
/// Later entries replace the values of earlier ones. Additive keys are
/// concatenated in chain order with exact duplicates removed, keeping the first
/// occurrence. The `[Base Product]` section is not carried over.
[[nodiscard]] auto merge(const ProductChain& chain, const MergeOptions& options = {}) noexcept -> EffectiveConfig;

/// @brief Render a merged configuration in the configuration file format.
/// The output is deterministic and parses back to the same values.
[[nodiscard]] auto to_config_text(const EffectiveConfig& config) noexcept -> std::string;

}  // namespace prodconf

#endif  // CONFIG_MERGER_HPP
