#include "prodconf/product_registry.hpp"
#include "prodconf/file_utils.hpp"
#include "prodconf/string_utils.hpp"

#include <algorithm>     // for find, find_if, reverse
#include <filesystem>    // for is_directory
#include <system_error>  // for error_code
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

// NOLINTNEXTLINE
static constexpr auto BUILTIN_DEFAULTS = R"(# Defaults for every product.
# Product files only need to list what differs from these values.

[Anaconda]
debug = False

[Storage]
default_scheme = LVM
file_system_type =
default_partitioning =
    /     (min 1 GiB, max 70 GiB)
    /home (min 500 MiB)
    swap

[Storage Constraints]
root_device_types =
must_not_be_on_root =
must_be_on_root =
    /bin /dev /sbin /etc /lib /root /mnt lost+found /proc
req_partition_sizes =
swap_is_recommended = True

[User Interface]
help_directory = /usr/share/anaconda/help
custom_stylesheet =
hidden_spokes =
hidden_webui_pages =
default_help_pages =
blivet_gui_supported = True

[Payload]
default_source = CLOSEST_MIRROR
enable_closest_mirror = True
verify_ssl = True
default_rpm_gpg_keys =
default_repositories =
updates_repositories =
ignored_packages =

[License]
eula =

[Network]
default_on_boot = NONE

[Bootloader]
efi_dir = default
menu_auto_hide = False
)"sv;

auto value_or_empty(const prodconf::ConfigFile& file, std::string_view section, std::string_view key) noexcept -> std::string {
    const auto* value = file.find(section, key);
    if (value == nullptr) {
        return {};
    }
    return std::string{prodconf::utils::trim(prodconf::value_to_string(*value))};
}

auto product_label(std::string_view name, std::string_view variant) noexcept -> std::string {
    if (variant.empty()) {
        return std::string{name};
    }
    return fmt::format(FMT_COMPILE("{} ({})"), name, variant);
}

auto parse_directory(std::string_view dir_path, const prodconf::ParseOptions& options) noexcept
    -> std::expected<std::vector<prodconf::ConfigFile>, prodconf::Error> {
    std::vector<prodconf::ConfigFile> files{};
    for (const auto& file_path : prodconf::file_utils::list_files_with_extension(dir_path, ".conf"sv)) {
        auto config_file = prodconf::parse_config_file(file_path, options);
        if (!config_file) {
            return std::unexpected(std::move(config_file.error()));
        }
        files.emplace_back(std::move(*config_file));
    }
    return files;
}

}  // namespace

namespace prodconf {

auto builtin_defaults_text() noexcept -> std::string_view {
    return BUILTIN_DEFAULTS;
}

auto ProductRegistry::discover(const RegistryPaths& paths, const ParseOptions& options) noexcept
    -> std::expected<ProductRegistry, Error> {
    auto defaults = paths.defaults_file
        ? parse_config_file(*paths.defaults_file, options)
        : parse_config_text(BUILTIN_DEFAULTS, BUILTIN_DEFAULTS_PATH, options);
    if (!defaults) {
        return std::unexpected(std::move(defaults.error()));
    }

    auto products = parse_directory(paths.product_dir, options);
    if (!products) {
        return std::unexpected(std::move(products.error()));
    }
    if (products->empty()) {
        spdlog::warn("No product configuration found in '{}'", paths.product_dir);
    }

    std::vector<ConfigFile> drop_ins{};
    if (!paths.drop_in_dir.empty()) {
        std::error_code ec{};
        if (!fs::is_directory(fs::path{paths.drop_in_dir}, ec)) {
            spdlog::warn("Local override directory '{}' does not exist", paths.drop_in_dir);
        }
        auto parsed_drop_ins = parse_directory(paths.drop_in_dir, options);
        if (!parsed_drop_ins) {
            return std::unexpected(std::move(parsed_drop_ins.error()));
        }
        drop_ins = std::move(*parsed_drop_ins);
        spdlog::debug("Found {} local override(s) in '{}'", drop_ins.size(), paths.drop_in_dir);
    }

    return from_files(std::move(*defaults), std::move(*products), std::move(drop_ins));
}

auto ProductRegistry::from_files(ConfigFile defaults, std::vector<ConfigFile> products, std::vector<ConfigFile> drop_ins) noexcept
    -> std::expected<ProductRegistry, Error> {
    ProductRegistry registry{};
    registry.m_defaults = std::move(defaults);
    registry.m_drop_ins = std::move(drop_ins);

    for (auto& product : products) {
        ProductId product_id{
            .name    = value_or_empty(product, "Product"sv, "product_name"sv),
            .variant = value_or_empty(product, "Product"sv, "variant_name"sv),
            .path    = product.path,
        };
        if (product_id.name.empty()) {
            spdlog::error("Product configuration '{}' has no product name", product.path);
            return std::unexpected(Error{
                .kind    = ErrorKind::MissingRequiredKey,
                .message = "product configuration without a product name",
                .path    = product.path,
                .section = "Product",
                .key     = "product_name",
            });
        }

        const auto duplicate = std::ranges::find_if(registry.m_ids, [&product_id](auto&& known) {
            return known.name == product_id.name && known.variant == product_id.variant;
        });
        if (duplicate != registry.m_ids.end()) {
            spdlog::error("Product '{}' is defined twice: '{}' and '{}'", product_id.name, duplicate->path, product_id.path);
            return std::unexpected(Error{
                .kind    = ErrorKind::DuplicateProduct,
                .message = fmt::format(FMT_COMPILE("product '{}' is already defined in '{}'"), product_label(product_id.name, product_id.variant), duplicate->path),
                .path    = product_id.path,
                .section = "Product",
                .key     = "product_name",
                .value   = product_id.name,
            });
        }

        spdlog::debug("Discovered product '{}' in '{}'", product_label(product_id.name, product_id.variant), product_id.path);
        registry.m_ids.emplace_back(std::move(product_id));
        registry.m_products.emplace_back(std::move(product));
    }
    return registry;
}

void ProductRegistry::set_default_product(std::string product_name, std::string variant) noexcept {
    m_default_product = std::move(product_name);
    m_default_variant = std::move(variant);
}

auto ProductRegistry::find_product(std::string_view product_name, std::string_view variant) const noexcept
    -> std::expected<std::size_t, Error> {
    std::vector<std::size_t> candidates{};
    for (std::size_t i = 0; i < m_ids.size(); ++i) {
        if (m_ids[i].name == product_name) {
            candidates.push_back(i);
        }
    }

    for (const auto index : candidates) {
        if (m_ids[index].variant == variant) {
            return index;
        }
    }
    // a name alone picks the only variant there is
    if (variant.empty() && candidates.size() == 1) {
        return candidates.front();
    }

    auto error = Error{
        .kind    = ErrorKind::UnknownProduct,
        .message = fmt::format(FMT_COMPILE("no configuration for product '{}'"), product_label(product_name, variant)),
        .value   = std::string{product_name},
    };
    if (variant.empty() && candidates.size() > 1) {
        error.message = fmt::format(FMT_COMPILE("product '{}' has {} variants, a variant name is required"), product_name, candidates.size());
    }
    return std::unexpected(std::move(error));
}

auto ProductRegistry::resolve(std::string_view product_name, std::string_view variant) const noexcept
    -> std::expected<ProductChain, Error> {
    if (product_name.empty()) {
        product_name = m_default_product;
        variant      = m_default_variant;
    }

    ProductChain chain{};
    chain.entries.push_back(m_defaults);

    if (product_name.empty()) {
        spdlog::info("No product requested, using defaults only");
    } else {
        auto active_index = find_product(product_name, variant);
        if (!active_index) {
            spdlog::error("{}", active_index.error().message);
            return std::unexpected(std::move(active_index.error()));
        }

        // walk from the active product towards the root
        std::vector<std::size_t> lineage{*active_index};
        while (true) {
            const auto& current   = m_products[lineage.back()];
            const auto base_name  = value_or_empty(current, "Base Product"sv, "product_name"sv);
            const auto base_label = product_label(base_name, value_or_empty(current, "Base Product"sv, "variant_name"sv));
            if (base_name.empty()) {
                break;
            }

            auto base_index = find_product(base_name, value_or_empty(current, "Base Product"sv, "variant_name"sv));
            if (!base_index) {
                auto error    = std::move(base_index.error());
                error.message = fmt::format(FMT_COMPILE("base product '{}' not found"), base_label);
                error.path    = current.path;
                error.section = "Base Product";
                error.key     = "product_name";
                spdlog::error("{}", error.describe());
                return std::unexpected(std::move(error));
            }

            const bool revisits = std::ranges::find(lineage, *base_index) != lineage.end();
            if (revisits || lineage.size() >= MAX_BASE_PRODUCT_DEPTH) {
                std::vector<std::string> cycle_path{};
                for (const auto index : lineage) {
                    cycle_path.emplace_back(product_label(m_ids[index].name, m_ids[index].variant));
                }
                cycle_path.emplace_back(base_label);

                auto error = Error{
                    .kind    = ErrorKind::BaseProductCycle,
                    .message = revisits
                        ? fmt::format(FMT_COMPILE("base product cycle: {}"), utils::join(cycle_path, " -> "))
                        : fmt::format(FMT_COMPILE("base product chain deeper than {}: {}"), MAX_BASE_PRODUCT_DEPTH, utils::join(cycle_path, " -> ")),
                    .path    = current.path,
                    .section = "Base Product",
                    .key     = "product_name",
                    .value   = base_name,
                };
                spdlog::error("{}", error.describe());
                return std::unexpected(std::move(error));
            }
            lineage.push_back(*base_index);
        }

        std::ranges::reverse(lineage);
        for (const auto index : lineage) {
            chain.entries.push_back(m_products[index]);
            chain.products.push_back(m_ids[index]);
        }
    }

    chain.entries.insert(chain.entries.end(), m_drop_ins.begin(), m_drop_ins.end());

    spdlog::info("Resolved configuration chain of {} file(s) for '{}'", chain.entries.size(), product_label(product_name, variant));
    for (const auto& entry : chain.entries) {
        spdlog::debug("  chain: {}", entry.path);
    }
    return chain;
}

}  // namespace prodconf
