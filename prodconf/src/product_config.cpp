#include "prodconf/product_config.hpp"
#include "prodconf/string_utils.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

auto invalid_value(const prodconf::Entry& entry, std::string_view section, std::string message) noexcept -> prodconf::Error {
    return prodconf::Error{
        .kind    = prodconf::ErrorKind::InvalidValue,
        .message = std::move(message),
        .path    = entry.origin.path,
        .line    = entry.origin.line,
        .section = std::string{section},
        .key     = entry.key,
        .value   = prodconf::value_to_string(entry.value),
    };
}

template <typename Enum, typename Parser>
auto read_token(const prodconf::EffectiveConfig& config, std::string_view section, std::string_view key, Enum default_value, Parser&& parser) noexcept
    -> std::expected<Enum, prodconf::Error> {
    const auto* entry = config.find_entry(section, key);
    if (entry == nullptr) {
        return default_value;
    }
    const auto& token = prodconf::value_to_string(entry->value);
    if (prodconf::utils::trim(token).empty()) {
        return default_value;
    }
    const auto parsed = parser(prodconf::utils::trim(token));
    if (!parsed) {
        return std::unexpected(invalid_value(*entry, section, fmt::format(FMT_COMPILE("unrecognized value '{}'"), prodconf::utils::trim(token))));
    }
    return *parsed;
}

}  // namespace

namespace prodconf {

auto partitioning_scheme_from_string(std::string_view token) noexcept -> std::optional<PartitioningScheme> {
    if (token == "PLAIN"sv) {
        return PartitioningScheme::Plain;
    } else if (token == "BTRFS"sv) {
        return PartitioningScheme::Btrfs;
    } else if (token == "LVM"sv) {
        return PartitioningScheme::Lvm;
    } else if (token == "LVM_THINP"sv) {
        return PartitioningScheme::LvmThinp;
    }
    return std::nullopt;
}

auto partitioning_scheme_to_string(PartitioningScheme scheme) noexcept -> std::string_view {
    switch (scheme) {
    case PartitioningScheme::Plain:
        return "PLAIN"sv;
    case PartitioningScheme::Btrfs:
        return "BTRFS"sv;
    case PartitioningScheme::Lvm:
        return "LVM"sv;
    case PartitioningScheme::LvmThinp:
        return "LVM_THINP"sv;
    }
    return "LVM"sv;
}

auto payload_source_from_string(std::string_view token) noexcept -> std::optional<PayloadSource> {
    if (token == "CLOSEST_MIRROR"sv) {
        return PayloadSource::ClosestMirror;
    } else if (token == "CDN"sv) {
        return PayloadSource::Cdn;
    } else if (token == "CDROM"sv) {
        return PayloadSource::Cdrom;
    } else if (token == "HDD"sv) {
        return PayloadSource::Hdd;
    } else if (token == "NFS"sv) {
        return PayloadSource::Nfs;
    } else if (token == "URL"sv) {
        return PayloadSource::Url;
    }
    return std::nullopt;
}

auto payload_source_to_string(PayloadSource source) noexcept -> std::string_view {
    switch (source) {
    case PayloadSource::ClosestMirror:
        return "CLOSEST_MIRROR"sv;
    case PayloadSource::Cdn:
        return "CDN"sv;
    case PayloadSource::Cdrom:
        return "CDROM"sv;
    case PayloadSource::Hdd:
        return "HDD"sv;
    case PayloadSource::Nfs:
        return "NFS"sv;
    case PayloadSource::Url:
        return "URL"sv;
    }
    return "CLOSEST_MIRROR"sv;
}

auto network_on_boot_from_string(std::string_view token) noexcept -> std::optional<NetworkOnBoot> {
    if (token == "NONE"sv) {
        return NetworkOnBoot::None;
    } else if (token == "DEFAULT_ROUTE_DEVICE"sv) {
        return NetworkOnBoot::DefaultRouteDevice;
    } else if (token == "FIRST_WIRED_WITH_LINK"sv) {
        return NetworkOnBoot::FirstWiredWithLink;
    } else if (token == "ALL"sv) {
        return NetworkOnBoot::All;
    }
    return std::nullopt;
}

auto network_on_boot_to_string(NetworkOnBoot on_boot) noexcept -> std::string_view {
    switch (on_boot) {
    case NetworkOnBoot::None:
        return "NONE"sv;
    case NetworkOnBoot::DefaultRouteDevice:
        return "DEFAULT_ROUTE_DEVICE"sv;
    case NetworkOnBoot::FirstWiredWithLink:
        return "FIRST_WIRED_WITH_LINK"sv;
    case NetworkOnBoot::All:
        return "ALL"sv;
    }
    return "NONE"sv;
}

auto ProductConfig::get_string(std::string_view section, std::string_view key, std::string_view default_value) const noexcept -> std::string {
    const auto* value = m_config.find(section, key);
    if (value == nullptr) {
        return std::string{default_value};
    }
    const auto& text = value_to_string(*value);
    const auto trimmed = utils::trim(text);
    return trimmed.empty() ? std::string{default_value} : std::string{trimmed};
}

auto ProductConfig::get_list(std::string_view section, std::string_view key, const std::vector<std::string>& default_value) const noexcept
    -> std::vector<std::string> {
    const auto* value = m_config.find(section, key);
    if (value == nullptr) {
        return default_value;
    }
    // an empty value clears the list
    return value_to_words(*value);
}

auto ProductConfig::get_bool(std::string_view section, std::string_view key, bool default_value) const noexcept -> std::expected<bool, Error> {
    return read_token(m_config, section, key, default_value, [](std::string_view token) { return parse_bool(token); });
}

auto ProductConfig::get_quantity(std::string_view section, std::string_view key, Quantity default_value) const noexcept
    -> std::expected<Quantity, Error> {
    const auto* entry = m_config.find_entry(section, key);
    if (entry == nullptr) {
        return default_value;
    }
    if (const auto* quantity = std::get_if<Quantity>(&entry->value)) {
        return *quantity;
    }
    if (utils::trim(value_to_string(entry->value)).empty()) {
        return default_value;
    }
    return std::unexpected(invalid_value(*entry, section, "expected a size such as '10 GiB'"));
}

auto ProductConfig::require_string(std::string_view section, std::string_view key) const noexcept -> std::expected<std::string, Error> {
    auto value = get_string(section, key);
    if (value.empty()) {
        return std::unexpected(Error{
            .kind    = ErrorKind::MissingRequiredKey,
            .message = fmt::format(FMT_COMPILE("required key '{}' is missing from section [{}]"), key, section),
            .section = std::string{section},
            .key     = std::string{key},
        });
    }
    return value;
}

auto ProductConfig::create(EffectiveConfig config, storage::ValidatedStorageConfig storage, std::vector<ProductId> chain) noexcept
    -> std::expected<ProductConfig, Error> {
    ProductConfig product_config{};
    product_config.m_config  = std::move(config);
    product_config.m_storage = std::move(storage);

    // [Product]
    auto product_name = product_config.require_string("Product"sv, "product_name"sv);
    if (!product_name) {
        spdlog::error("{}", product_name.error().describe());
        return std::unexpected(std::move(product_name.error()));
    }
    product_config.m_product = ProductSettings{
        .product_name = std::move(*product_name),
        .variant_name = product_config.get_string("Product"sv, "variant_name"sv),
        .chain        = std::move(chain),
        .sources      = product_config.m_config.sources,
    };

    // [Storage]
    auto scheme = read_token(product_config.m_config, "Storage"sv, "default_scheme"sv, PartitioningScheme::Lvm, partitioning_scheme_from_string);
    if (!scheme) {
        return std::unexpected(std::move(scheme.error()));
    }
    product_config.m_scheme = *scheme;

    // [User Interface]
    auto& user_interface              = product_config.m_user_interface;
    user_interface.help_directory     = product_config.get_string("User Interface"sv, "help_directory"sv, user_interface.help_directory);
    user_interface.custom_stylesheet  = product_config.get_string("User Interface"sv, "custom_stylesheet"sv);
    user_interface.hidden_spokes      = product_config.get_list("User Interface"sv, "hidden_spokes"sv);
    user_interface.hidden_webui_pages = product_config.get_list("User Interface"sv, "hidden_webui_pages"sv);
    user_interface.default_help_pages = product_config.get_list("User Interface"sv, "default_help_pages"sv);
    auto blivet_gui = product_config.get_bool("User Interface"sv, "blivet_gui_supported"sv, user_interface.blivet_gui_supported);
    if (!blivet_gui) {
        return std::unexpected(std::move(blivet_gui.error()));
    }
    user_interface.blivet_gui_supported = *blivet_gui;

    // [Payload]
    auto& payload = product_config.m_payload;
    auto source   = read_token(product_config.m_config, "Payload"sv, "default_source"sv, payload.default_source, payload_source_from_string);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    payload.default_source = *source;
    auto closest_mirror    = product_config.get_bool("Payload"sv, "enable_closest_mirror"sv, payload.enable_closest_mirror);
    if (!closest_mirror) {
        return std::unexpected(std::move(closest_mirror.error()));
    }
    payload.enable_closest_mirror = *closest_mirror;
    auto verify_ssl               = product_config.get_bool("Payload"sv, "verify_ssl"sv, payload.verify_ssl);
    if (!verify_ssl) {
        return std::unexpected(std::move(verify_ssl.error()));
    }
    payload.verify_ssl           = *verify_ssl;
    payload.default_rpm_gpg_keys = product_config.get_list("Payload"sv, "default_rpm_gpg_keys"sv);
    payload.default_repositories = product_config.get_list("Payload"sv, "default_repositories"sv);
    payload.updates_repositories = product_config.get_list("Payload"sv, "updates_repositories"sv);
    payload.ignored_packages     = product_config.get_list("Payload"sv, "ignored_packages"sv);

    // [License]
    product_config.m_license.eula = product_config.get_string("License"sv, "eula"sv);

    // [Network]
    auto on_boot = read_token(product_config.m_config, "Network"sv, "default_on_boot"sv, NetworkOnBoot::None, network_on_boot_from_string);
    if (!on_boot) {
        return std::unexpected(std::move(on_boot.error()));
    }
    product_config.m_network.default_on_boot = *on_boot;

    // [Bootloader]
    auto& bootloader   = product_config.m_bootloader;
    bootloader.efi_dir = product_config.get_string("Bootloader"sv, "efi_dir"sv, bootloader.efi_dir);
    auto auto_hide     = product_config.get_bool("Bootloader"sv, "menu_auto_hide"sv, bootloader.menu_auto_hide);
    if (!auto_hide) {
        return std::unexpected(std::move(auto_hide.error()));
    }
    bootloader.menu_auto_hide = *auto_hide;

    spdlog::info("Configuration of '{}' is ready", product_config.m_product.product_name);
    return product_config;
}

}  // namespace prodconf
