#ifndef CONSTRAINT_VALIDATOR_HPP
#define CONSTRAINT_VALIDATOR_HPP

#include "prodconf/config_file.hpp"
#include "prodconf/error.hpp"
#include "prodconf/partition_spec.hpp"

#include <cstdint>   // for uint8_t
#include <expected>  // for expected
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

namespace prodconf::storage {

/// @brief How `must_not_be_on_root` treats a mount point without its own rule.
enum class OnRootPolicy : std::uint8_t {
    /// Lives on the root volume, only an exact rule gives it a volume of its own
    Strict,
    /// Lives on the root volume, unless an ancestor mount point other than `/` has a rule
    Nested,
    /// Not enough information, the mount point is skipped
    Ignore
};

struct ValidationOptions final {
    OnRootPolicy on_root_policy{OnRootPolicy::Strict};
};

/// @brief Content of the `[Storage Constraints]` section.
struct StorageConstraints final {
    /// Allowed values of `default_scheme`, empty means anything goes
    std::vector<std::string> root_device_types{};
    std::vector<std::string> must_not_be_on_root{};
    std::vector<std::string> must_be_on_root{};
    /// Minimum sizes, every rule is SizeKind::Min
    std::vector<PartitionRule> req_partition_sizes{};
    bool swap_is_recommended{true};

    bool operator==(const StorageConstraints&) const = default;
};

/// @brief A partitioning rule annotated with the outcome of the checks.
struct RuleCheck final {
    PartitionRule rule{};
    bool passed{true};
    /// Larger of the rule's own lower bound and the matching requirement
    std::optional<Quantity> effective_min{};

    bool operator==(const RuleCheck&) const = default;
};

/// @brief Storage configuration after constraint checking. Never mutated once built.
struct ValidatedStorageConfig final {
    std::string default_scheme{};
    std::string file_system_type{};
    std::vector<RuleCheck> rules{};
    StorageConstraints constraints{};
    /// Downstream planning must not add a swap partition when false
    bool swap_recommended{true};
    std::vector<Violation> violations{};
    bool is_valid{true};

    bool operator==(const ValidatedStorageConfig&) const = default;
};

/// @brief Read the `[Storage Constraints]` section, a missing section gives the defaults.
/// @return The constraints, PartitionSyntax for a bad `req_partition_sizes`
/// or InvalidValue for a bad `swap_is_recommended`.
[[nodiscard]] auto parse_constraints(const Section* constraints_section) noexcept -> std::expected<StorageConstraints, Error>;

/// @brief Run every storage check and annotate the rules.
///
/// Checks, in order:
///  1. `default_scheme` is one of `root_device_types`
///  2. no `must_not_be_on_root` mount point lives on the root volume,
///     then no `must_be_on_root` mount point has a volume of its own
///  3. each `req_partition_sizes` entry is met by the committed size
///  4. `swap_is_recommended` is passed through
///
/// All violations are collected, the result is invalid if there is any.
/// @return The annotated result, or a syntax error in one of the rule lists.
[[nodiscard]] auto check_storage(const Section* storage_section, const Section* constraints_section, const ValidationOptions& options = {}) noexcept
    -> std::expected<ValidatedStorageConfig, Error>;

/// @brief Like check_storage, but an invalid result is an error.
/// @return The valid result, or ConstraintViolation carrying every violation found.
[[nodiscard]] auto validate(const Section* storage_section, const Section* constraints_section, const ValidationOptions& options = {}) noexcept
    -> std::expected<ValidatedStorageConfig, Error>;

/// @brief Whether a mount point ends up on the root volume under the given rules,
/// following the volume of its closest ruled ancestor.
[[nodiscard]] auto lives_on_root(std::string_view mount_point, const std::vector<PartitionRule>& rules) noexcept -> bool;

}  // namespace prodconf::storage

#endif  // CONSTRAINT_VALIDATOR_HPP
