#ifndef PRODUCT_CONFIG_HPP
#define PRODUCT_CONFIG_HPP

#include "prodconf/config_merger.hpp"
#include "prodconf/constraint_validator.hpp"
#include "prodconf/error.hpp"
#include "prodconf/product_registry.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace prodconf {

/// Valid values of `[Storage] default_scheme`.
enum class PartitioningScheme : std::uint8_t {
    Plain,
    Btrfs,
    Lvm,
    LvmThinp
};

/// Valid values of `[Payload] default_source`.
enum class PayloadSource : std::uint8_t {
    ClosestMirror,
    Cdn,
    Cdrom,
    Hdd,
    Nfs,
    Url
};

/// Valid values of `[Network] default_on_boot`.
enum class NetworkOnBoot : std::uint8_t {
    None,
    DefaultRouteDevice,
    FirstWiredWithLink,
    All
};

[[nodiscard]] auto partitioning_scheme_from_string(std::string_view token) noexcept -> std::optional<PartitioningScheme>;
[[nodiscard]] auto partitioning_scheme_to_string(PartitioningScheme scheme) noexcept -> std::string_view;
[[nodiscard]] auto payload_source_from_string(std::string_view token) noexcept -> std::optional<PayloadSource>;
[[nodiscard]] auto payload_source_to_string(PayloadSource source) noexcept -> std::string_view;
[[nodiscard]] auto network_on_boot_from_string(std::string_view token) noexcept -> std::optional<NetworkOnBoot>;
[[nodiscard]] auto network_on_boot_to_string(NetworkOnBoot on_boot) noexcept -> std::string_view;

struct ProductSettings final {
    std::string product_name{};
    std::string variant_name{};
    /// Products of the resolved chain, base first
    std::vector<ProductId> chain{};
    /// Every merged file, in chain order
    std::vector<std::string> sources{};
};

struct UserInterfaceSettings final {
    std::string help_directory{"/usr/share/anaconda/help"};
    std::string custom_stylesheet{};
    std::vector<std::string> hidden_spokes{};
    std::vector<std::string> hidden_webui_pages{};
    std::vector<std::string> default_help_pages{};
    bool blivet_gui_supported{true};
};

struct PayloadSettings final {
    PayloadSource default_source{PayloadSource::ClosestMirror};
    bool enable_closest_mirror{true};
    bool verify_ssl{true};
    std::vector<std::string> default_rpm_gpg_keys{};
    std::vector<std::string> default_repositories{};
    std::vector<std::string> updates_repositories{};
    std::vector<std::string> ignored_packages{};
};

struct LicenseSettings final {
    /// Path of the EULA, empty when the product has none
    std::string eula{};
};

struct NetworkSettings final {
    NetworkOnBoot default_on_boot{NetworkOnBoot::None};
};

struct BootloaderSettings final {
    std::string efi_dir{"default"};
    bool menu_auto_hide{false};
};

/// @brief Read-only view over the merged and validated configuration.
///
/// Built once at startup; afterwards any number of threads may read it.
/// Typed accessors return the documented default of a key that is absent or empty.
class ProductConfig final {
 public:
    /// @brief Build the typed settings.
    /// @param config The merged configuration.
    /// @param storage The validated storage configuration of `config`.
    /// @param chain Products the configuration was resolved from.
    /// @return The facade, MissingRequiredKey without `[Product] product_name`,
    /// or InvalidValue for an unrecognized boolean or enumerated token.
    [[nodiscard]] static auto create(EffectiveConfig config, storage::ValidatedStorageConfig storage, std::vector<ProductId> chain = {}) noexcept
        -> std::expected<ProductConfig, Error>;

    /* clang-format off */

    auto product() const noexcept -> const ProductSettings&
    { return m_product; }
    auto storage() const noexcept -> const storage::ValidatedStorageConfig&
    { return m_storage; }
    auto partitioning_scheme() const noexcept -> PartitioningScheme
    { return m_scheme; }
    auto user_interface() const noexcept -> const UserInterfaceSettings&
    { return m_user_interface; }
    auto payload() const noexcept -> const PayloadSettings&
    { return m_payload; }
    auto license() const noexcept -> const LicenseSettings&
    { return m_license; }
    auto network() const noexcept -> const NetworkSettings&
    { return m_network; }
    auto bootloader() const noexcept -> const BootloaderSettings&
    { return m_bootloader; }

    // Merged data, including sections without a typed accessor.
    auto raw() const noexcept -> const EffectiveConfig&
    { return m_config; }

    /* clang-format on */

    [[nodiscard]] auto get_string(std::string_view section, std::string_view key, std::string_view default_value = {}) const noexcept -> std::string;
    [[nodiscard]] auto get_list(std::string_view section, std::string_view key, const std::vector<std::string>& default_value = {}) const noexcept
        -> std::vector<std::string>;
    [[nodiscard]] auto get_bool(std::string_view section, std::string_view key, bool default_value) const noexcept -> std::expected<bool, Error>;
    [[nodiscard]] auto get_quantity(std::string_view section, std::string_view key, Quantity default_value) const noexcept
        -> std::expected<Quantity, Error>;

    /// @brief Value of a key the schema requires.
    /// @return The value, or MissingRequiredKey if it is absent or empty.
    [[nodiscard]] auto require_string(std::string_view section, std::string_view key) const noexcept -> std::expected<std::string, Error>;

 private:
    ProductConfig() = default;

    EffectiveConfig m_config{};
    storage::ValidatedStorageConfig m_storage{};
    PartitioningScheme m_scheme{PartitioningScheme::Lvm};

    ProductSettings m_product{};
    UserInterfaceSettings m_user_interface{};
    PayloadSettings m_payload{};
    LicenseSettings m_license{};
    NetworkSettings m_network{};
    BootloaderSettings m_bootloader{};
};

}  // namespace prodconf

#endif  // PRODUCT_CONFIG_HPP
