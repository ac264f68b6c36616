#ifndef CONFIG_EXPORT_HPP
#define CONFIG_EXPORT_HPP

#include "prodconf/product_config.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace session {

/// @brief Render the resolved configuration as pretty-printed JSON.
///
/// Contains the product identity, the resolved chain, every merged key
/// and the validated storage configuration.
[[nodiscard]] auto export_to_json(const prodconf::ProductConfig& config) noexcept -> std::string;

/// @brief Write the JSON export to a file.
/// @return void on success, or error string on failure.
[[nodiscard]] auto write_export(const prodconf::ProductConfig& config, std::string_view file_path) noexcept
    -> std::expected<void, std::string>;

}  // namespace session

#endif  // CONFIG_EXPORT_HPP
