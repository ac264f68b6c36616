#include "prodconf/error.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace prodconf {

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ErrorKind::Parse:
        return "ParseError"sv;
    case ErrorKind::PartitionSyntax:
        return "PartitionSyntaxError"sv;
    case ErrorKind::UnknownProduct:
        return "UnknownProductError"sv;
    case ErrorKind::BaseProductCycle:
        return "BaseProductCycleError"sv;
    case ErrorKind::DuplicateProduct:
        return "DuplicateProductError"sv;
    case ErrorKind::ConstraintViolation:
        return "ConstraintViolation"sv;
    case ErrorKind::MissingRequiredKey:
        return "MissingRequiredKeyError"sv;
    case ErrorKind::InvalidValue:
        return "InvalidValueError"sv;
    case ErrorKind::Io:
        return "IoError"sv;
    }
    return "UnknownError"sv;
}

auto violation_kind_to_string(ViolationKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ViolationKind::UnsupportedRootScheme:
        return "unsupported root scheme"sv;
    case ViolationKind::RequiresDedicatedVolume:
        return "mount point requires dedicated volume"sv;
    case ViolationKind::MustBeOnRoot:
        return "mount point must reside on root volume"sv;
    case ViolationKind::BelowMinimumSize:
        return "below minimum required size"sv;
    }
    return "unknown violation"sv;
}

auto make_error(ErrorKind kind, std::string message) noexcept -> Error {
    return Error{.kind = kind, .message = std::move(message)};
}

auto Error::describe() const noexcept -> std::string {
    std::string res = fmt::format(FMT_COMPILE("{}: {}"), error_kind_to_string(kind), message);

    if (!path.empty()) {
        if (line != 0) {
            res += fmt::format(FMT_COMPILE(" (at {}:{})"), path, line);
        } else {
            res += fmt::format(FMT_COMPILE(" (in {})"), path);
        }
    }
    if (!section.empty()) {
        res += fmt::format(FMT_COMPILE(" [{}]"), section);
        if (!key.empty()) {
            res += fmt::format(FMT_COMPILE(" {}"), key);
        }
    }
    if (!value.empty()) {
        res += fmt::format(FMT_COMPILE(" value '{}'"), value);
    }
    for (const auto& violation : violations) {
        res += fmt::format(FMT_COMPILE("\n  - {}: {}"), violation_kind_to_string(violation.kind), violation.message);
    }
    return res;
}

}  // namespace prodconf
