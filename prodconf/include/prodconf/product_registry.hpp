#ifndef PRODUCT_REGISTRY_HPP
#define PRODUCT_REGISTRY_HPP

#include "prodconf/config_file.hpp"
#include "prodconf/error.hpp"
#include "prodconf/unit_parser.hpp"

#include <cstddef>      // for size_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace prodconf {

/// Longest allowed chain of base products, guards against malformed pointers
inline constexpr std::size_t MAX_BASE_PRODUCT_DEPTH = 16;

/// Path recorded for the embedded defaults
inline constexpr std::string_view BUILTIN_DEFAULTS_PATH = "<builtin>";

/// @brief Identity of a discovered product configuration.
struct ProductId final {
    std::string name{};
    std::string variant{};
    std::string path{};

    bool operator==(const ProductId&) const = default;
};

/// @brief Where the registry looks for configuration files.
struct RegistryPaths final {
    /// Defaults file, the embedded defaults are used when unset
    std::optional<std::string> defaults_file{};
    /// Directory with one `*.conf` file per product
    std::string product_dir{"/etc/anaconda/product.d"};
    /// Directory with local override `*.conf` files, empty disables them
    std::string drop_in_dir{"/etc/anaconda/conf.d"};
};

/// @brief Files to merge, most general first.
///
/// Order: defaults, base products (root-most first), the active product,
/// then local overrides sorted by file name.
struct ProductChain final {
    std::vector<ConfigFile> entries{};
    /// Product identities in chain order, defaults and overrides excluded
    std::vector<ProductId> products{};

    bool operator==(const ProductChain&) const = default;
};

/// @brief Knows every product configuration and resolves the active one.
class ProductRegistry final {
 public:
    /// @brief Load the defaults, all product files and all local overrides.
    /// @return The registry, or the first parse/discovery error.
    [[nodiscard]] static auto discover(const RegistryPaths& paths, const ParseOptions& options = {}) noexcept
        -> std::expected<ProductRegistry, Error>;

    /// @brief Build a registry from already parsed files.
    /// Fails with MissingRequiredKey if a product lacks `[Product] product_name`,
    /// and with DuplicateProduct if two files declare the same product and variant.
    [[nodiscard]] static auto from_files(ConfigFile defaults, std::vector<ConfigFile> products, std::vector<ConfigFile> drop_ins = {}) noexcept
        -> std::expected<ProductRegistry, Error>;

    /// @brief Resolve the chain for a product.
    /// @param product_name Requested product, the designated default is used when empty.
    /// @param variant Requested variant, may be empty.
    /// @return The chain, UnknownProduct or BaseProductCycle.
    [[nodiscard]] auto resolve(std::string_view product_name = {}, std::string_view variant = {}) const noexcept
        -> std::expected<ProductChain, Error>;

    /// Product used by resolve() when none is requested.
    void set_default_product(std::string product_name, std::string variant = {}) noexcept;

    /* clang-format off */

    // Discovered products, in discovery order.
    auto products() const noexcept -> const std::vector<ProductId>&
    { return m_ids; }
    auto defaults() const noexcept -> const ConfigFile&
    { return m_defaults; }
    auto drop_ins() const noexcept -> const std::vector<ConfigFile>&
    { return m_drop_ins; }

    /* clang-format on */

 private:
    [[nodiscard]] auto find_product(std::string_view product_name, std::string_view variant) const noexcept
        -> std::expected<std::size_t, Error>;

    ConfigFile m_defaults{};
    std::vector<ConfigFile> m_products{};
    std::vector<ProductId> m_ids{};
    std::vector<ConfigFile> m_drop_ins{};

    std::string m_default_product{};
    std::string m_default_variant{};
};

/// @brief Text of the embedded defaults, used when no defaults file is configured.
[[nodiscard]] auto builtin_defaults_text() noexcept -> std::string_view;

}  // namespace prodconf

#endif  // PRODUCT_REGISTRY_HPP
