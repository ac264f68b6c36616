#include "doctest_compatibility.h"

#include "prodconf/config_merger.hpp"
#include "prodconf/logger.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace prodconf;

static constexpr auto BASE_TEST = R"(
[Product]
product_name = Base

[Storage]
default_scheme = LVM
file_system_type = xfs

[Payload]
default_repositories = a b
enable_closest_mirror = True
)"sv;

static constexpr auto DERIVED_TEST = R"(
[Product]
product_name = Derived

[Base Product]
product_name = Base

[Storage]
default_scheme = LVM_THINP

[Payload]
default_repositories =
    b
    c

[Custom Section]
unknown_key = kept as is
)"sv;

namespace {

auto parse_text(std::string_view text, std::string_view path) -> ConfigFile {
    auto result = parse_config_text(text, path);
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto make_chain() -> ProductChain {
    return ProductChain{.entries = {parse_text(BASE_TEST, "base.conf"sv), parse_text(DERIVED_TEST, "derived.conf"sv)}};
}

}  // namespace

TEST_CASE("config merger test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    prodconf::logger::set_logger(logger);

    SECTION("later entries take precedence")
    {
        const auto& config = merge(make_chain());
        REQUIRE_EQ(config.sources, (std::vector<std::string>{"base.conf", "derived.conf"}));
        REQUIRE_EQ(value_to_string(*config.find("Storage"sv, "default_scheme"sv)), "LVM_THINP");
        REQUIRE_EQ(value_to_string(*config.find("Product"sv, "product_name"sv)), "Derived");

        // untouched keys keep the base value and origin
        const auto* file_system = config.find_entry("Storage"sv, "file_system_type"sv);
        REQUIRE(file_system != nullptr);
        REQUIRE_EQ(value_to_string(file_system->value), "xfs");
        REQUIRE_EQ(file_system->origin.path, "base.conf");

        const auto* scheme = config.find_entry("Storage"sv, "default_scheme"sv);
        REQUIRE_EQ(scheme->origin.path, "derived.conf");
        REQUIRE_EQ(scheme->origin.line, 9);
    }
    SECTION("additive keys accumulate")
    {
        const auto& config = merge(make_chain());
        const auto* repositories = config.find("Payload"sv, "default_repositories"sv);
        REQUIRE(repositories != nullptr);
        REQUIRE_EQ(*repositories, (Value{ValueList{"a", "b", "c"}}));
    }
    SECTION("additive keys can be turned off")
    {
        const auto& config = merge(make_chain(), MergeOptions{.additive_keys = {}});
        REQUIRE_EQ(value_to_words(*config.find("Payload"sv, "default_repositories"sv)), (std::vector<std::string>{"b", "c"}));
    }
    SECTION("base product section is dropped")
    {
        const auto& config = merge(make_chain());
        REQUIRE(config.find_section("Base Product"sv) == nullptr);
    }
    SECTION("unknown sections are kept")
    {
        const auto& config = merge(make_chain());
        REQUIRE_EQ(value_to_string(*config.find("Custom Section"sv, "unknown_key"sv)), "kept as is");
        REQUIRE_EQ(config.sections.back().name, "Custom Section");
    }
    SECTION("merging is deterministic")
    {
        REQUIRE(merge(make_chain()) == merge(make_chain()));
    }
    SECTION("empty chain")
    {
        const auto& config = merge(ProductChain{});
        REQUIRE(config.sections.empty());
        REQUIRE(config.sources.empty());
    }
}

TEST_CASE("config rendering test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("default", callback_sink));

    static constexpr auto expected_text = R"([Product]
product_name = Derived

[Storage]
default_scheme = LVM_THINP
file_system_type = xfs

[Payload]
default_repositories =
    a
    b
    c
enable_closest_mirror = True

[Custom Section]
unknown_key = kept as is
)"sv;

    SECTION("rendered text")
    {
        REQUIRE_EQ(to_config_text(merge(make_chain())), expected_text);
    }
    SECTION("merging the rendered text again changes nothing")
    {
        const auto& rendered = to_config_text(merge(make_chain()));

        const auto& reparsed = parse_config_text(rendered, "merged.conf"sv);
        REQUIRE(reparsed.has_value());
        const auto& remerged = merge(ProductChain{.entries = {*reparsed}});
        REQUIRE_EQ(to_config_text(remerged), rendered);
    }
    SECTION("sizes survive rendering")
    {
        const auto& config = merge(ProductChain{.entries = {parse_text("[Storage Constraints]\nmin_ram = 1536 MiB\n"sv, "sizes.conf"sv)}});
        const auto& reparsed = parse_config_text(to_config_text(config), "rendered.conf"sv);
        REQUIRE(reparsed.has_value());
        REQUIRE_EQ(*reparsed->find("Storage Constraints"sv, "min_ram"sv), Value{units::mebibytes(1536)});
    }
}
