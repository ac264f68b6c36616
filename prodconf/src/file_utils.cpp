#include "prodconf/file_utils.hpp"

#include <algorithm>     // for sort
#include <array>         // for array
#include <cerrno>        // for errno
#include <cstdio>        // for fopen, fread, fclose
#include <cstring>       // for strerror
#include <filesystem>    // for directory_iterator, is_regular_file
#include <fstream>       // for ofstream
#include <system_error>  // for error_code

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace prodconf::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    std::error_code ec{};
    if (!fs::is_regular_file(fs::path{filepath}, ec)) {
        spdlog::error("[READWHOLEFILE] '{}' is not a regular file", filepath);
        return std::nullopt;
    }

    // Use std::fopen because it's faster than std::ifstream
    const std::string path{filepath};
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    const bool seek_ok = std::fseek(file, 0, SEEK_END) == 0;
    const auto size    = seek_ok ? std::ftell(file) : -1L;
    if (size < 0 || std::fseek(file, 0, SEEK_SET) != 0) {
        spdlog::error("[READWHOLEFILE] '{}' size query failed", filepath);
        std::fclose(file);
        return std::nullopt;
    }

    std::string buf;
    buf.resize(static_cast<std::size_t>(size));
    std::size_t read = std::fread(buf.data(), sizeof(char), buf.size(), file);

    // files like the ones in /proc report a size of 0
    std::array<char, 4096> chunk{};
    while (read == buf.size() && std::feof(file) == 0 && std::ferror(file) == 0) {
        const auto chunk_read = std::fread(chunk.data(), sizeof(char), chunk.size(), file);
        buf.append(chunk.data(), chunk_read);
        read += chunk_read;
    }

    const bool failed = std::ferror(file) != 0;
    std::fclose(file);
    if (failed || read != buf.size()) {
        spdlog::error("[READWHOLEFILE] '{}' read failed", filepath);
        return std::nullopt;
    }

    return buf;
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    std::ofstream file{std::string{filepath}, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        spdlog::error("[WRITE_TO_FILE] '{}' open failed", filepath);
        return false;
    }
    file << data;
    return static_cast<bool>(file);
}

auto list_files_with_extension(std::string_view dir_path, std::string_view extension) noexcept -> std::vector<std::string> {
    std::vector<std::string> files{};

    std::error_code ec{};
    if (!fs::is_directory(fs::path{dir_path}, ec)) {
        spdlog::debug("'{}' is not a directory, nothing to list", dir_path);
        return files;
    }

    for (auto it = fs::directory_iterator{fs::path{dir_path}, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec{};
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        const auto& entry_path = it->path();
        if (entry_path.extension() == extension) {
            files.emplace_back(entry_path.string());
        }
    }
    if (ec) {
        spdlog::error("Failed to list '{}': {}", dir_path, ec.message());
    }

    std::ranges::sort(files, [](const auto& lhs, const auto& rhs) {
        return fs::path{lhs}.filename() < fs::path{rhs}.filename();
    });
    return files;
}

}  // namespace prodconf::file_utils
