#ifndef LOADER_HPP
#define LOADER_HPP

#include "prodconf/config_merger.hpp"
#include "prodconf/constraint_validator.hpp"
#include "prodconf/error.hpp"
#include "prodconf/product_config.hpp"
#include "prodconf/product_registry.hpp"

#include <expected>     // for expected
#include <string_view>  // for string_view

namespace prodconf {

struct LoadOptions final {
    MergeOptions merge{};
    storage::ValidationOptions validation{};
};

/// @brief Resolve, merge and validate the configuration of a product.
/// @param registry The discovered products.
/// @param product_name Requested product, the registry default is used when empty.
/// @param variant Requested variant, may be empty.
/// @param options Merge and validation options.
/// @return The effective configuration, or the first error of the pipeline.
[[nodiscard]] auto load_product_config(const ProductRegistry& registry, std::string_view product_name = {}, std::string_view variant = {},
    const LoadOptions& options = {}) noexcept -> std::expected<ProductConfig, Error>;

}  // namespace prodconf

#endif  // LOADER_HPP
