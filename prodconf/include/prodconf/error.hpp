#ifndef ERROR_HPP
#define ERROR_HPP

#include <cstddef>      // for size_t
#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace prodconf {

/// Failure classes reported by the resolution pipeline.
/// None of them is transient, so callers must never retry.
enum class ErrorKind : std::uint8_t {
    Parse,
    PartitionSyntax,
    UnknownProduct,
    BaseProductCycle,
    DuplicateProduct,
    ConstraintViolation,
    MissingRequiredKey,
    InvalidValue,
    Io
};

/// Storage constraint checks, in the order they are evaluated.
enum class ViolationKind : std::uint8_t {
    UnsupportedRootScheme,
    RequiresDedicatedVolume,
    MustBeOnRoot,
    BelowMinimumSize
};

/// @brief One failed storage constraint check.
struct Violation final {
    ViolationKind kind{ViolationKind::UnsupportedRootScheme};
    /// Mount point or scheme the violation is about
    std::string subject{};
    std::string message{};

    bool operator==(const Violation&) const = default;
};

/// @brief Error carried by every fallible call of the library.
struct Error final {
    ErrorKind kind{ErrorKind::Parse};
    std::string message{};

    // diagnostic context, empty when not applicable
    std::string path{};
    std::size_t line{};
    std::string section{};
    std::string key{};
    std::string value{};

    /// Every violation found, only set for ErrorKind::ConstraintViolation
    std::vector<Violation> violations{};

    /// @brief Render the error with all of its context in one diagnostic.
    [[nodiscard]] auto describe() const noexcept -> std::string;

    bool operator==(const Error&) const = default;
};

/// @brief Name of the error kind, e.g "ParseError".
[[nodiscard]] auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view;

/// @brief Short description of the violated check, e.g "unsupported root scheme".
[[nodiscard]] auto violation_kind_to_string(ViolationKind kind) noexcept -> std::string_view;

/// @brief Construct an error with a message only.
[[nodiscard]] auto make_error(ErrorKind kind, std::string message) noexcept -> Error;

}  // namespace prodconf

#endif  // ERROR_HPP
