#ifndef UNIT_PARSER_HPP
#define UNIT_PARSER_HPP

#include "prodconf/config_file.hpp"
#include "prodconf/error.hpp"

#include <expected>     // for expected
#include <string_view>  // for string_view

namespace prodconf {

struct ParseOptions final {
    /// Let a repeated key replace the earlier value instead of failing
    bool allow_duplicate_keys{false};
};

/// @brief Parse the text of one configuration file.
///
/// Format:
///   [Section Name]
///   key = value
///   list_key =
///       first item
///       second item
///   size_key = 6 GiB
///
/// Lines starting with `#` and blank lines are discarded. Indented lines continue
/// the previous key and turn its value into a list. A trailing backslash joins the
/// next line into the current one.
///
/// The result depends on the text and path only.
/// @param text The file content.
/// @param path The path recorded in the result and in error messages.
/// @param options Parser behaviour switches.
/// @return The parsed file, or ErrorKind::Parse with file and line context.
[[nodiscard]] auto parse_config_text(std::string_view text, std::string_view path, const ParseOptions& options = {}) noexcept
    -> std::expected<ConfigFile, Error>;

/// @brief Read and parse a configuration file from disk.
/// @return The parsed file, ErrorKind::Io if it can't be read, or ErrorKind::Parse.
[[nodiscard]] auto parse_config_file(std::string_view path, const ParseOptions& options = {}) noexcept
    -> std::expected<ConfigFile, Error>;

}  // namespace prodconf

#endif  // UNIT_PARSER_HPP
