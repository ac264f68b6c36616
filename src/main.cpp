#include "config_export.hpp"   // for write_export
#include "definitions.hpp"     // for error_inter
#include "session_config.hpp"  // for read_session_config

// import prodconf
#include "prodconf/loader.hpp"
#include "prodconf/logger.hpp"
#include "prodconf/partition_spec.hpp"
#include "prodconf/product_registry.hpp"

#include <chrono>       // for seconds
#include <string_view>  // for string_view

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

namespace {

void print_summary(const prodconf::ProductConfig& config) noexcept {
    const auto& product = config.product();
    if (product.variant_name.empty()) {
        info_inter("Product: {}\n", product.product_name);
    } else {
        info_inter("Product: {} ({})\n", product.product_name, product.variant_name);
    }

    output_inter("Configuration chain:\n");
    for (const auto& source : product.sources) {
        output_inter("  {}\n", source);
    }

    const auto& storage = config.storage();
    output_inter("Partitioning scheme: {}\n", prodconf::partitioning_scheme_to_string(config.partitioning_scheme()));
    output_inter("Default partitioning:\n");
    for (const auto& check : storage.rules) {
        output_inter("  {}\n", prodconf::storage::rule_to_string(check.rule));
    }
    if (!storage.swap_recommended) {
        warning_inter("Swap is not recommended for this product\n");
    }
    success_inter("Storage configuration is valid\n");
}

}  // namespace

int main(int argc, char** argv) {
    const std::string_view session_file = (argc > 1) ? argv[1] : DEFAULT_SESSION_FILE;

    auto session_config = session::read_session_config(session_file);
    if (!session_config) {
        error_inter("Failed to read session settings: {}\n", session_config.error());
        return 1;
    }

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("prodconf_logger", session_config->log_file);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_every(std::chrono::seconds(5));

    // Set prodconf logger.
    prodconf::logger::set_logger(logger);

    spdlog::info("product-config {} started, session '{}'", PRODCONF_VERSION, session_file);

    auto registry = prodconf::ProductRegistry::discover(session_config->paths);
    if (!registry) {
        error_inter("{}\n", registry.error().describe());
        spdlog::shutdown();
        return 1;
    }
    if (!session_config->product.empty()) {
        registry->set_default_product(session_config->product, session_config->variant);
    }

    const prodconf::LoadOptions options{.validation = {.on_root_policy = session_config->on_root_policy}};
    const auto& config = prodconf::load_product_config(*registry, {}, {}, options);
    if (!config) {
        error_inter("{}\n", config.error().describe());
        spdlog::shutdown();
        return 1;
    }
    spdlog::debug("Effective configuration:\n{}", prodconf::to_config_text(config->raw()));

    print_summary(*config);

    if (session_config->export_path) {
        if (auto result = session::write_export(*config, *session_config->export_path); !result) {
            error_inter("{}\n", result.error());
            spdlog::shutdown();
            return 1;
        }
        info_inter("Configuration exported to {}\n", *session_config->export_path);
    }

    spdlog::shutdown();
    return 0;
}
