#include "prodconf/constraint_validator.hpp"
#include "prodconf/string_utils.hpp"

#include <algorithm>  // for find, find_if, max, none_of
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using prodconf::Error;
using prodconf::ErrorKind;
using prodconf::Violation;
using prodconf::ViolationKind;
using namespace prodconf::storage;

auto add_entry_context(Error error, std::string_view section_name, const prodconf::Entry& entry) noexcept -> Error {
    error.path    = entry.origin.path;
    error.line    = entry.origin.line;
    error.section = std::string{section_name};
    error.key     = entry.key;
    return error;
}

auto parse_rule_entry(const prodconf::Section* section, std::string_view key, RuleSyntax syntax) noexcept
    -> std::expected<std::vector<PartitionRule>, Error> {
    const auto* entry = (section != nullptr) ? section->find(key) : nullptr;
    if (entry == nullptr) {
        return std::vector<PartitionRule>{};
    }
    auto rules = parse_partition_rules(prodconf::value_to_lines(entry->value), syntax);
    if (!rules) {
        auto error = add_entry_context(std::move(rules.error()), section->name, *entry);
        spdlog::error("{}", error.describe());
        return std::unexpected(std::move(error));
    }
    return rules;
}

auto words_of(const prodconf::Section* section, std::string_view key) noexcept -> std::vector<std::string> {
    const auto* entry = (section != nullptr) ? section->find(key) : nullptr;
    return (entry != nullptr) ? prodconf::value_to_words(entry->value) : std::vector<std::string>{};
}

auto find_check(std::vector<RuleCheck>& checks, std::string_view mount_point) noexcept -> RuleCheck* {
    const auto it = std::ranges::find_if(checks, [mount_point](auto&& check) { return check.rule.mount_point == mount_point; });
    return (it != checks.end()) ? &*it : nullptr;
}

void check_root_scheme(ValidatedStorageConfig& result) noexcept {
    const auto& allowed = result.constraints.root_device_types;
    if (allowed.empty() || result.default_scheme.empty()) {
        return;
    }
    if (std::ranges::find(allowed, result.default_scheme) == allowed.end()) {
        result.violations.emplace_back(Violation{
            .kind    = ViolationKind::UnsupportedRootScheme,
            .subject = result.default_scheme,
            .message = fmt::format(FMT_COMPILE("default scheme '{}' is not one of the root device types: {}"), result.default_scheme, prodconf::utils::join(allowed, " ")),
        });
    }
}

void check_root_placement(ValidatedStorageConfig& result, const std::vector<PartitionRule>& rule_list, OnRootPolicy policy) noexcept {
    for (const auto& mount_point : result.constraints.must_not_be_on_root) {
        if (policy == OnRootPolicy::Ignore && find_rule(rule_list, mount_point) == nullptr) {
            spdlog::debug("'{}' has no partitioning rule, skipped", mount_point);
            continue;
        }
        const bool on_root = (policy == OnRootPolicy::Nested) ? lives_on_root(mount_point, rule_list)
                                                              : (mount_point == "/"sv || find_rule(rule_list, mount_point) == nullptr);
        if (on_root) {
            result.violations.emplace_back(Violation{
                .kind    = ViolationKind::RequiresDedicatedVolume,
                .subject = mount_point,
                .message = fmt::format(FMT_COMPILE("'{}' must not be on the root volume, but the partitioning has no rule for it"), mount_point),
            });
        }
    }

    for (const auto& mount_point : result.constraints.must_be_on_root) {
        if (mount_point == "/"sv) {
            continue;
        }
        if (find_rule(rule_list, mount_point) != nullptr) {
            result.violations.emplace_back(Violation{
                .kind    = ViolationKind::MustBeOnRoot,
                .subject = mount_point,
                .message = fmt::format(FMT_COMPILE("'{}' must be on the root volume, but the partitioning gives it a volume of its own"), mount_point),
            });
            if (auto* check = find_check(result.rules, mount_point)) {
                check->passed = false;
            }
        }
    }
}

void check_required_sizes(ValidatedStorageConfig& result) noexcept {
    for (const auto& requirement : result.constraints.req_partition_sizes) {
        const auto required = requirement.size.value_or(prodconf::Quantity{});
        auto* check         = find_check(result.rules, requirement.mount_point);

        // without a sized rule the requirement itself is the commitment
        const auto committed = (check != nullptr && check->rule.size) ? *check->rule.size : required;
        if (committed < required) {
            result.violations.emplace_back(Violation{
                .kind    = ViolationKind::BelowMinimumSize,
                .subject = requirement.mount_point,
                .message = fmt::format(FMT_COMPILE("'{}' requires {}, committed {}"), requirement.mount_point,
                    prodconf::units::quantity_to_string(required), prodconf::units::quantity_to_string(committed)),
            });
        }
        if (check != nullptr) {
            check->effective_min = std::max(check->effective_min.value_or(prodconf::Quantity{}), required);
            if (committed < required) {
                check->passed = false;
            }
        }
    }
}

}  // namespace

namespace prodconf::storage {

auto lives_on_root(std::string_view mount_point, const std::vector<PartitionRule>& rules) noexcept -> bool {
    if (mount_point == "/"sv) {
        return true;
    }
    if (find_rule(rules, mount_point) != nullptr) {
        return false;
    }
    // e.g /var/log lives on the /var volume
    return std::ranges::none_of(rules, [mount_point](auto&& rule) {
        const std::string_view rule_mount{rule.mount_point};
        return rule_mount != "/"sv && rule_mount.starts_with('/') && mount_point.starts_with(rule_mount)
            && mount_point.size() > rule_mount.size() && mount_point[rule_mount.size()] == '/';
    });
}

auto parse_constraints(const Section* constraints_section) noexcept -> std::expected<StorageConstraints, Error> {
    StorageConstraints constraints{
        .root_device_types   = words_of(constraints_section, "root_device_types"sv),
        .must_not_be_on_root = words_of(constraints_section, "must_not_be_on_root"sv),
        .must_be_on_root     = words_of(constraints_section, "must_be_on_root"sv),
    };

    auto requirements = parse_rule_entry(constraints_section, "req_partition_sizes"sv, RuleSyntax::Requirements);
    if (!requirements) {
        return std::unexpected(std::move(requirements.error()));
    }
    constraints.req_partition_sizes = std::move(*requirements);

    const auto* swap_entry = (constraints_section != nullptr) ? constraints_section->find("swap_is_recommended"sv) : nullptr;
    if (swap_entry != nullptr && !utils::trim(value_to_string(swap_entry->value)).empty()) {
        const auto& swap_text = value_to_string(swap_entry->value);
        const auto swap_flag  = parse_bool(swap_text);
        if (!swap_flag) {
            auto error  = add_entry_context(make_error(ErrorKind::InvalidValue, "expected a boolean"), constraints_section->name, *swap_entry);
            error.value = swap_text;
            return std::unexpected(std::move(error));
        }
        constraints.swap_is_recommended = *swap_flag;
    }
    return constraints;
}

auto check_storage(const Section* storage_section, const Section* constraints_section, const ValidationOptions& options) noexcept
    -> std::expected<ValidatedStorageConfig, Error> {
    ValidatedStorageConfig result{};

    const auto* scheme_entry = (storage_section != nullptr) ? storage_section->find("default_scheme"sv) : nullptr;
    if (scheme_entry != nullptr) {
        result.default_scheme = std::string{utils::trim(value_to_string(scheme_entry->value))};
    }
    const auto* fs_entry = (storage_section != nullptr) ? storage_section->find("file_system_type"sv) : nullptr;
    if (fs_entry != nullptr) {
        result.file_system_type = std::string{utils::trim(value_to_string(fs_entry->value))};
    }

    auto rules = parse_rule_entry(storage_section, "default_partitioning"sv, RuleSyntax::Partitioning);
    if (!rules) {
        return std::unexpected(std::move(rules.error()));
    }
    for (const auto& rule : *rules) {
        result.rules.emplace_back(RuleCheck{.rule = rule, .effective_min = rule.size});
    }

    auto constraints = parse_constraints(constraints_section);
    if (!constraints) {
        return std::unexpected(std::move(constraints.error()));
    }
    result.constraints      = std::move(*constraints);
    result.swap_recommended = result.constraints.swap_is_recommended;

    check_root_scheme(result);
    check_root_placement(result, *rules, options.on_root_policy);
    check_required_sizes(result);
    if (!result.swap_recommended) {
        spdlog::debug("Swap is not recommended for this product");
    }

    result.is_valid = result.violations.empty();
    spdlog::info("Storage validation: {} rule(s), {} violation(s)", result.rules.size(), result.violations.size());
    return result;
}

auto validate(const Section* storage_section, const Section* constraints_section, const ValidationOptions& options) noexcept
    -> std::expected<ValidatedStorageConfig, Error> {
    auto result = check_storage(storage_section, constraints_section, options);
    if (!result) {
        return result;
    }
    if (!result->is_valid) {
        auto error = Error{
            .kind       = ErrorKind::ConstraintViolation,
            .message    = fmt::format(FMT_COMPILE("{} storage constraint violation(s)"), result->violations.size()),
            .section    = "Storage Constraints",
            .violations = result->violations,
        };
        for (const auto& violation : error.violations) {
            spdlog::error("{}: {}", violation_kind_to_string(violation.kind), violation.message);
        }
        return std::unexpected(std::move(error));
    }
    return result;
}

}  // namespace prodconf::storage
