#include "doctest_compatibility.h"

#include "prodconf/constraint_validator.hpp"
#include "prodconf/logger.hpp"
#include "prodconf/unit_parser.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace prodconf;
using namespace prodconf::storage;

namespace {

auto parse_text(std::string_view text) -> ConfigFile {
    auto result = parse_config_text(text, "storage.conf"sv);
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto check_text(std::string_view text, const ValidationOptions& options = {}) -> std::expected<ValidatedStorageConfig, Error> {
    const auto& config = parse_text(text);
    return check_storage(config.find_section("Storage"sv), config.find_section("Storage Constraints"sv), options);
}

auto validate_text(std::string_view text, const ValidationOptions& options = {}) -> std::expected<ValidatedStorageConfig, Error> {
    const auto& config = parse_text(text);
    return validate(config.find_section("Storage"sv), config.find_section("Storage Constraints"sv), options);
}

}  // namespace

TEST_CASE("storage constraints test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    prodconf::logger::set_logger(logger);

    SECTION("valid configuration")
    {
        static constexpr auto text = R"(
[Storage]
default_scheme = LVM_THINP
file_system_type = xfs
default_partitioning =
    /     (min 6 GiB)
    /var  (size 15 GiB)
    /home (min 1 GiB, max 50 GiB)

[Storage Constraints]
root_device_types = LVM_THINP
must_not_be_on_root = /var
req_partition_sizes =
    /var 10 GiB
    /boot (min 1 GiB)
swap_is_recommended = False
)"sv;
        const auto& result = validate_text(text);
        REQUIRE(result.has_value());
        REQUIRE(result->is_valid);
        REQUIRE(result->violations.empty());
        REQUIRE_EQ(result->default_scheme, "LVM_THINP");
        REQUIRE_EQ(result->file_system_type, "xfs");
        REQUIRE(!result->swap_recommended);

        REQUIRE_EQ(result->rules.size(), 3);
        REQUIRE(result->rules[1].passed);
        REQUIRE_EQ(result->rules[1].rule.kind, SizeKind::Fixed);
        REQUIRE_EQ(result->rules[1].effective_min, units::gibibytes(15));
        REQUIRE_EQ(result->rules[2].effective_min, units::gibibytes(1));
    }
    SECTION("unsupported root scheme")
    {
        static constexpr auto text = R"(
[Storage]
default_scheme = BTRFS

[Storage Constraints]
root_device_types = LVM_THINP
)"sv;
        const auto& result = validate_text(text);
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error().kind, ErrorKind::ConstraintViolation);
        REQUIRE_EQ(result.error().violations.size(), 1);
        REQUIRE_EQ(result.error().violations[0].kind, ViolationKind::UnsupportedRootScheme);
        REQUIRE_EQ(result.error().violations[0].subject, "BTRFS");
    }
    SECTION("empty allow list accepts any scheme")
    {
        const auto& result = validate_text("[Storage]\ndefault_scheme = BTRFS\n[Storage Constraints]\nroot_device_types =\n"sv);
        REQUIRE(result.has_value());
        REQUIRE(result->is_valid);
    }
    SECTION("committed size below the requirement")
    {
        static constexpr auto text = R"(
[Storage]
default_partitioning =
    /     (min 6 GiB)
    /var  (size 5 GiB)

[Storage Constraints]
req_partition_sizes = /var 10 GiB
)"sv;
        const auto& checked = check_text(text);
        REQUIRE(checked.has_value());
        REQUIRE(!checked->is_valid);
        REQUIRE_EQ(checked->violations.size(), 1);
        REQUIRE_EQ(checked->violations[0].kind, ViolationKind::BelowMinimumSize);
        REQUIRE_EQ(checked->violations[0].subject, "/var");
        REQUIRE_EQ(checked->violations[0].message, "'/var' requires 10 GiB, committed 5 GiB");
        REQUIRE(checked->rules[0].passed);
        REQUIRE(!checked->rules[1].passed);
        REQUIRE_EQ(checked->rules[1].effective_min, units::gibibytes(10));

        const auto& validated = validate_text(text);
        REQUIRE(!validated.has_value());
        REQUIRE_EQ(validated.error().section, "Storage Constraints");
    }
    SECTION("minimum raised to the requirement")
    {
        static constexpr auto text = R"(
[Storage]
default_partitioning =
    /var  (min 4 GiB)

[Storage Constraints]
req_partition_sizes = /var 10 GiB
)"sv;
        // a minimum below the requirement is a violation as well
        const auto& checked = check_text(text);
        REQUIRE(checked.has_value());
        REQUIRE_EQ(checked->violations.size(), 1);
        REQUIRE_EQ(checked->rules[0].effective_min, units::gibibytes(10));
    }
    SECTION("requirement without a partition rule")
    {
        const auto& result = validate_text("[Storage]\ndefault_partitioning = /\n[Storage Constraints]\nreq_partition_sizes = /var 10 GiB\n"sv);
        REQUIRE(result.has_value());
    }
    SECTION("mount point that needs its own volume")
    {
        static constexpr auto text = R"(
[Storage]
default_partitioning =
    /     (min 6 GiB)
    /home (min 1 GiB)

[Storage Constraints]
must_not_be_on_root = /var
)"sv;
        const auto& strict = check_text(text);
        REQUIRE(strict.has_value());
        REQUIRE_EQ(strict->violations.size(), 1);
        REQUIRE_EQ(strict->violations[0].kind, ViolationKind::RequiresDedicatedVolume);
        REQUIRE_EQ(strict->violations[0].subject, "/var");

        const auto& nested = check_text(text, ValidationOptions{.on_root_policy = OnRootPolicy::Nested});
        REQUIRE(nested.has_value());
        REQUIRE_EQ(nested->violations.size(), 1);

        const auto& ignored = check_text(text, ValidationOptions{.on_root_policy = OnRootPolicy::Ignore});
        REQUIRE(ignored.has_value());
        REQUIRE(ignored->is_valid);
    }
    SECTION("nested mount point under a ruled parent")
    {
        static constexpr auto text = R"(
[Storage]
default_partitioning =
    /     (min 6 GiB)
    /var  (min 10 GiB)

[Storage Constraints]
must_not_be_on_root = /var/log
)"sv;
        const auto& strict = check_text(text);
        REQUIRE(strict.has_value());
        REQUIRE(!strict->is_valid);
        REQUIRE_EQ(strict->violations.size(), 1);
        REQUIRE_EQ(strict->violations[0].kind, ViolationKind::RequiresDedicatedVolume);
        REQUIRE_EQ(strict->violations[0].subject, "/var/log");

        const auto& nested = validate_text(text, ValidationOptions{.on_root_policy = OnRootPolicy::Nested});
        REQUIRE(nested.has_value());

        const auto& ignored = validate_text(text, ValidationOptions{.on_root_policy = OnRootPolicy::Ignore});
        REQUIRE(ignored.has_value());
    }
    SECTION("root itself never gets a volume of its own")
    {
        static constexpr auto text = "[Storage]\ndefault_partitioning = /\n[Storage Constraints]\nmust_not_be_on_root = /\n"sv;
        const auto& strict = check_text(text);
        REQUIRE(strict.has_value());
        REQUIRE_EQ(strict->violations.size(), 1);
        REQUIRE_EQ(strict->violations[0].subject, "/");
    }
    SECTION("mount point that must stay on root")
    {
        static constexpr auto text = R"(
[Storage]
default_partitioning =
    /     (min 6 GiB)
    /etc  (size 1 GiB)

[Storage Constraints]
must_be_on_root = / /etc /bin
)"sv;
        const auto& result = check_text(text);
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->violations.size(), 1);
        REQUIRE_EQ(result->violations[0].kind, ViolationKind::MustBeOnRoot);
        REQUIRE_EQ(result->violations[0].subject, "/etc");
        REQUIRE(!result->rules[1].passed);
    }
    SECTION("all violations are reported")
    {
        static constexpr auto text = R"(
[Storage]
default_scheme = BTRFS
default_partitioning =
    /     (min 6 GiB)
    /tmp  (size 1 GiB)
    /etc

[Storage Constraints]
root_device_types = LVM LVM_THINP
must_not_be_on_root = /var
must_be_on_root = /etc
req_partition_sizes = /tmp 2 GiB
)"sv;
        const auto& result = validate_text(text);
        REQUIRE(!result.has_value());

        const auto& violations = result.error().violations;
        REQUIRE_EQ(violations.size(), 4);
        REQUIRE_EQ(violations[0].kind, ViolationKind::UnsupportedRootScheme);
        REQUIRE_EQ(violations[1].kind, ViolationKind::RequiresDedicatedVolume);
        REQUIRE_EQ(violations[2].kind, ViolationKind::MustBeOnRoot);
        REQUIRE_EQ(violations[3].kind, ViolationKind::BelowMinimumSize);
        REQUIRE_EQ(result.error().message, "4 storage constraint violation(s)");
    }
    SECTION("invalid rule syntax")
    {
        const auto& result = check_text("[Storage]\ndefault_partitioning =\n    /home (min 1 GiB\n"sv);
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error().kind, ErrorKind::PartitionSyntax);
        REQUIRE_EQ(result.error().section, "Storage");
        REQUIRE_EQ(result.error().key, "default_partitioning");
        REQUIRE_EQ(result.error().path, "storage.conf");
    }
    SECTION("invalid swap recommendation")
    {
        const auto& result = check_text("[Storage Constraints]\nswap_is_recommended = maybe\n"sv);
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error().kind, ErrorKind::InvalidValue);
        REQUIRE_EQ(result.error().value, "maybe");
    }
    SECTION("missing sections give an empty valid result")
    {
        const auto& result = check_storage(nullptr, nullptr);
        REQUIRE(result.has_value());
        REQUIRE(result->is_valid);
        REQUIRE(result->rules.empty());
        REQUIRE(result->swap_recommended);
    }
}

TEST_CASE("root volume placement test")
{
    const auto& rules = parse_partition_rules({"/", "/var", "/home"});
    REQUIRE(rules.has_value());

    REQUIRE(lives_on_root("/"sv, *rules));
    REQUIRE(lives_on_root("/usr"sv, *rules));
    REQUIRE(!lives_on_root("/var"sv, *rules));
    REQUIRE(!lives_on_root("/var/log"sv, *rules));
    REQUIRE(lives_on_root("/variable"sv, *rules));
}
