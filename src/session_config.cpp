#include "session_config.hpp"

// import prodconf
#include "prodconf/file_utils.hpp"

#include <expected>     // for expected, unexpected
#include <filesystem>   // for exists
#include <string_view>  // for string_view
#include <utility>      // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

// Reads an optional string member.
auto read_string_member(const rapidjson::Document& doc, const char* name, std::string& target) noexcept
    -> std::expected<void, std::string> {
    if (!doc.HasMember(name)) {
        return {};
    }
    if (!doc[name].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), name));
    }
    target = doc[name].GetString();
    return {};
}

}  // namespace

namespace session {

auto on_root_policy_from_string(std::string_view policy_str) noexcept
    -> std::optional<prodconf::storage::OnRootPolicy> {
    if (policy_str == "strict"sv) {
        return prodconf::storage::OnRootPolicy::Strict;
    }
    if (policy_str == "nested"sv) {
        return prodconf::storage::OnRootPolicy::Nested;
    }
    if (policy_str == "ignore"sv) {
        return prodconf::storage::OnRootPolicy::Ignore;
    }
    return std::nullopt;
}

auto on_root_policy_to_string(prodconf::storage::OnRootPolicy policy) noexcept -> std::string_view {
    switch (policy) {
    case prodconf::storage::OnRootPolicy::Strict:
        return "strict"sv;
    case prodconf::storage::OnRootPolicy::Nested:
        return "nested"sv;
    case prodconf::storage::OnRootPolicy::Ignore:
        return "ignore"sv;
    }
    return "unknown"sv;
}

auto get_default_session_config() noexcept -> SessionConfig {
    return SessionConfig{};
}

auto parse_session_config(std::string_view json_content) noexcept
    -> std::expected<SessionConfig, std::string> {
    if (json_content.empty()) {
        return get_default_session_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"), doc.GetErrorOffset(),
            rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_session_config();

    // Product selection
    if (auto result = read_string_member(doc, "product", config.product); !result) {
        return std::unexpected(std::move(result.error()));
    }
    if (auto result = read_string_member(doc, "variant", config.variant); !result) {
        return std::unexpected(std::move(result.error()));
    }
    if (!config.variant.empty() && config.product.empty()) {
        return std::unexpected("'variant' requires 'product'");
    }

    // Configuration locations
    if (doc.HasMember("defaults_file")) {
        std::string defaults_file{};
        if (auto result = read_string_member(doc, "defaults_file", defaults_file); !result) {
            return std::unexpected(std::move(result.error()));
        }
        config.paths.defaults_file = std::move(defaults_file);
    }
    if (auto result = read_string_member(doc, "product_dir", config.paths.product_dir); !result) {
        return std::unexpected(std::move(result.error()));
    }
    // an empty directory disables local overrides
    if (auto result = read_string_member(doc, "drop_in_dir", config.paths.drop_in_dir); !result) {
        return std::unexpected(std::move(result.error()));
    }

    // Validation
    if (doc.HasMember("on_root_policy")) {
        if (!doc["on_root_policy"].IsString()) {
            return std::unexpected("'on_root_policy' must be a string");
        }
        const std::string_view policy_str{doc["on_root_policy"].GetString(), doc["on_root_policy"].GetStringLength()};
        const auto policy = on_root_policy_from_string(policy_str);
        if (!policy) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid on_root_policy '{}', expected 'strict', 'nested' or 'ignore'"), policy_str));
        }
        config.on_root_policy = *policy;
    }

    // Output
    if (auto result = read_string_member(doc, "log_file", config.log_file); !result) {
        return std::unexpected(std::move(result.error()));
    }
    if (config.log_file.empty()) {
        return std::unexpected("'log_file' must not be empty");
    }
    if (doc.HasMember("export_path")) {
        std::string export_path{};
        if (auto result = read_string_member(doc, "export_path", export_path); !result) {
            return std::unexpected(std::move(result.error()));
        }
        config.export_path = std::move(export_path);
    }

    return config;
}

auto read_session_config(std::string_view file_path) noexcept
    -> std::expected<SessionConfig, std::string> {
    std::error_code ec{};
    if (!fs::exists(file_path, ec)) {
        spdlog::info("Session settings '{}' not found, using defaults", file_path);
        return get_default_session_config();
    }

    const auto& content = prodconf::file_utils::read_whole_file(file_path);
    if (!content) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read session settings '{}'"), file_path));
    }

    auto config = parse_session_config(*content);
    if (!config) {
        return std::unexpected(fmt::format(FMT_COMPILE("{}: {}"), file_path, config.error()));
    }
    return config;
}

}  // namespace session
