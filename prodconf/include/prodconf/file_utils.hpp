#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace prodconf::file_utils {

// Returns std::nullopt if the file cannot be opened or read.
auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string>;

// If the file doesn't exist, then it create one and write into it.
// If the file exists already, then it will overwrite file content with provided data.
auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool;

// Regular files in dir_path having the given extension, sorted by file name.
// A missing directory yields an empty list.
auto list_files_with_extension(std::string_view dir_path, std::string_view extension) noexcept -> std::vector<std::string>;

}  // namespace prodconf::file_utils

#endif  // FILE_UTILS_HPP
