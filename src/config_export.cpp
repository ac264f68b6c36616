#include "config_export.hpp"

// import prodconf
#include "prodconf/file_utils.hpp"
#include "prodconf/partition_spec.hpp"
#include "prodconf/quantity.hpp"

#include <optional>  // for optional
#include <variant>   // for get_if

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view str) noexcept {
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

void write_key(JsonWriter& writer, std::string_view key) noexcept {
    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
}

void write_quantity(JsonWriter& writer, const std::optional<prodconf::Quantity>& quantity) noexcept {
    if (!quantity) {
        writer.Null();
        return;
    }
    writer.StartObject();
    write_key(writer, "bytes");
    writer.Uint64(quantity->bytes);
    write_key(writer, "text");
    write_string(writer, prodconf::units::quantity_to_string(*quantity));
    writer.EndObject();
}

void write_string_array(JsonWriter& writer, const std::vector<std::string>& items) noexcept {
    writer.StartArray();
    for (const auto& item : items) {
        write_string(writer, item);
    }
    writer.EndArray();
}

void write_value(JsonWriter& writer, const prodconf::Value& value) noexcept {
    if (const auto* str = std::get_if<std::string>(&value)) {
        write_string(writer, *str);
    } else if (const auto* list = std::get_if<prodconf::ValueList>(&value)) {
        write_string_array(writer, *list);
    } else {
        write_quantity(writer, std::get<prodconf::Quantity>(value));
    }
}

void write_product(JsonWriter& writer, const prodconf::ProductSettings& product) noexcept {
    write_key(writer, "product");
    writer.StartObject();
    write_key(writer, "name");
    write_string(writer, product.product_name);
    write_key(writer, "variant");
    write_string(writer, product.variant_name);
    writer.EndObject();

    write_key(writer, "chain");
    writer.StartArray();
    for (const auto& product_id : product.chain) {
        writer.StartObject();
        write_key(writer, "name");
        write_string(writer, product_id.name);
        write_key(writer, "variant");
        write_string(writer, product_id.variant);
        write_key(writer, "path");
        write_string(writer, product_id.path);
        writer.EndObject();
    }
    writer.EndArray();

    write_key(writer, "sources");
    write_string_array(writer, product.sources);
}

void write_sections(JsonWriter& writer, const prodconf::EffectiveConfig& config) noexcept {
    write_key(writer, "sections");
    writer.StartObject();
    for (const auto& section : config.sections) {
        write_key(writer, section.name);
        writer.StartObject();
        for (const auto& entry : section.entries) {
            write_key(writer, entry.key);
            write_value(writer, entry.value);
        }
        writer.EndObject();
    }
    writer.EndObject();
}

void write_storage(JsonWriter& writer, const prodconf::storage::ValidatedStorageConfig& storage) noexcept {
    write_key(writer, "storage");
    writer.StartObject();
    write_key(writer, "default_scheme");
    write_string(writer, storage.default_scheme);
    write_key(writer, "file_system_type");
    write_string(writer, storage.file_system_type);
    write_key(writer, "swap_recommended");
    writer.Bool(storage.swap_recommended);
    write_key(writer, "is_valid");
    writer.Bool(storage.is_valid);

    write_key(writer, "rules");
    writer.StartArray();
    for (const auto& check : storage.rules) {
        writer.StartObject();
        write_key(writer, "mount_point");
        write_string(writer, check.rule.mount_point);
        write_key(writer, "kind");
        write_string(writer, prodconf::storage::size_kind_to_string(check.rule.kind));
        write_key(writer, "size");
        write_quantity(writer, check.rule.size);
        write_key(writer, "max_size");
        write_quantity(writer, check.rule.max_size);
        write_key(writer, "effective_min");
        write_quantity(writer, check.effective_min);
        write_key(writer, "passed");
        writer.Bool(check.passed);
        writer.EndObject();
    }
    writer.EndArray();

    write_key(writer, "violations");
    writer.StartArray();
    for (const auto& violation : storage.violations) {
        writer.StartObject();
        write_key(writer, "kind");
        write_string(writer, prodconf::violation_kind_to_string(violation.kind));
        write_key(writer, "subject");
        write_string(writer, violation.subject);
        write_key(writer, "message");
        write_string(writer, violation.message);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
}

}  // namespace

namespace session {

auto export_to_json(const prodconf::ProductConfig& config) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    write_product(writer, config.product());
    write_key(writer, "partitioning_scheme");
    write_string(writer, prodconf::partitioning_scheme_to_string(config.partitioning_scheme()));
    write_sections(writer, config.raw());
    write_storage(writer, config.storage());
    writer.EndObject();

    return std::string{buffer.GetString(), buffer.GetSize()};
}

auto write_export(const prodconf::ProductConfig& config, std::string_view file_path) noexcept
    -> std::expected<void, std::string> {
    const auto& content = export_to_json(config);
    if (!prodconf::file_utils::create_file_for_overwrite(file_path, content)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to write export to '{}'"), file_path));
    }
    spdlog::info("Exported configuration to '{}'", file_path);
    return {};
}

}  // namespace session
