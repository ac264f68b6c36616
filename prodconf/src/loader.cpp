#include "prodconf/loader.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace prodconf {

auto load_product_config(const ProductRegistry& registry, std::string_view product_name, std::string_view variant, const LoadOptions& options) noexcept
    -> std::expected<ProductConfig, Error> {
    auto chain = registry.resolve(product_name, variant);
    if (!chain) {
        return std::unexpected(std::move(chain.error()));
    }

    auto config = merge(*chain, options.merge);

    auto storage = storage::validate(config.find_section("Storage"sv), config.find_section("Storage Constraints"sv), options.validation);
    if (!storage) {
        spdlog::error("Storage configuration rejected: {}", storage.error().message);
        return std::unexpected(std::move(storage.error()));
    }

    return ProductConfig::create(std::move(config), std::move(*storage), std::move(chain->products));
}

}  // namespace prodconf
