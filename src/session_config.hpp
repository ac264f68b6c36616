#ifndef SESSION_CONFIG_HPP
#define SESSION_CONFIG_HPP

#include "prodconf/constraint_validator.hpp"
#include "prodconf/product_registry.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace session {

inline constexpr std::string_view DEFAULT_LOG_FILE = "/tmp/product-config.log";

/// Converts a string to OnRootPolicy.
/// @param policy_str "strict", "nested" or "ignore".
/// @return The policy or std::nullopt if invalid.
[[nodiscard]] auto on_root_policy_from_string(std::string_view policy_str) noexcept
    -> std::optional<prodconf::storage::OnRootPolicy>;

/// Converts OnRootPolicy to string.
[[nodiscard]] auto on_root_policy_to_string(prodconf::storage::OnRootPolicy policy) noexcept -> std::string_view;

/// Settings of one product-config run.
struct SessionConfig {
    // Product selection, the registry default when empty
    std::string product{};
    std::string variant{};

    // Where to look for configuration files
    prodconf::RegistryPaths paths{};

    prodconf::storage::OnRootPolicy on_root_policy{prodconf::storage::OnRootPolicy::Strict};

    std::string log_file{DEFAULT_LOG_FILE};
    std::optional<std::string> export_path{};
};

/// Parses session settings from JSON string content.
/// @param json_content The JSON settings content.
/// @return SessionConfig on success, or error string on failure.
[[nodiscard]] auto parse_session_config(std::string_view json_content) noexcept
    -> std::expected<SessionConfig, std::string>;

/// Reads session settings from a file.
/// A missing file gives the defaults, an unreadable or malformed one is an error.
[[nodiscard]] auto read_session_config(std::string_view file_path) noexcept
    -> std::expected<SessionConfig, std::string>;

/// Returns default SessionConfig.
[[nodiscard]] auto get_default_session_config() noexcept -> SessionConfig;

}  // namespace session

#endif  // SESSION_CONFIG_HPP
