#include "prodconf/quantity.hpp"
#include "prodconf/string_utils.hpp"

#include <array>     // for array
#include <charconv>  // for from_chars
#include <limits>    // for numeric_limits
#include <utility>   // for pair

#include <fmt/compile.h>
#include <fmt/format.h>

#include <ctre.hpp>

using namespace std::string_view_literals;

namespace {

static constexpr auto QUANTITY_PATTERN = ctll::fixed_string{"([0-9]+)(?:\\.([0-9]+))?\\s*([A-Za-z]?i?B)"};

// NOLINTNEXTLINE
static constexpr std::array<std::pair<std::string_view, std::uint64_t>, 12> UNIT_TABLE{{
    {"B"sv, 1ULL},
    {"KiB"sv, prodconf::units::KiB},
    {"MiB"sv, prodconf::units::MiB},
    {"GiB"sv, prodconf::units::GiB},
    {"TiB"sv, prodconf::units::TiB},
    {"PiB"sv, prodconf::units::PiB},
    {"kB"sv, 1000ULL},
    {"KB"sv, 1000ULL},
    {"MB"sv, 1000ULL * 1000ULL},
    {"GB"sv, 1000ULL * 1000ULL * 1000ULL},
    {"TB"sv, 1000ULL * 1000ULL * 1000ULL * 1000ULL},
    {"PB"sv, 1000ULL * 1000ULL * 1000ULL * 1000ULL * 1000ULL},
}};

// NOLINTNEXTLINE
static constexpr std::array<std::pair<std::string_view, std::uint64_t>, 5> RENDER_TABLE{{
    {"PiB"sv, prodconf::units::PiB},
    {"TiB"sv, prodconf::units::TiB},
    {"GiB"sv, prodconf::units::GiB},
    {"MiB"sv, prodconf::units::MiB},
    {"KiB"sv, prodconf::units::KiB},
}};

constexpr std::size_t MAX_FRACTION_DIGITS = 3;

}  // namespace

namespace prodconf::units {

auto unit_multiplier(std::string_view unit) noexcept -> std::uint64_t {
    for (const auto& [name, multiplier] : UNIT_TABLE) {
        if (name == unit) {
            return multiplier;
        }
    }
    return 0;
}

auto looks_like_quantity(std::string_view text) noexcept -> bool {
    return static_cast<bool>(ctre::match<QUANTITY_PATTERN>(utils::trim(text)));
}

auto parse_quantity(std::string_view text) noexcept -> std::expected<Quantity, std::string> {
    const auto trimmed = utils::trim(text);

    auto [whole, integral_part, fraction_part, unit_part] = ctre::match<QUANTITY_PATTERN>(trimmed);
    if (!whole) {
        return std::unexpected(fmt::format(FMT_COMPILE("malformed quantity '{}'"), trimmed));
    }

    const auto unit       = unit_part.to_view();
    const auto multiplier = unit_multiplier(unit);
    if (multiplier == 0) {
        return std::unexpected(fmt::format(FMT_COMPILE("unrecognized quantity unit '{}'"), unit));
    }

    const auto integral = integral_part.to_view();
    std::uint64_t count{};
    if (auto [ptr, ec] = std::from_chars(integral.data(), integral.data() + integral.size(), count); ec != std::errc{}) {
        return std::unexpected(fmt::format(FMT_COMPILE("quantity '{}' is out of range"), trimmed));
    }
    if (count > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return std::unexpected(fmt::format(FMT_COMPILE("quantity '{}' is out of range"), trimmed));
    }
    std::uint64_t bytes = count * multiplier;

    if (fraction_part) {
        auto fraction = fraction_part.to_view();
        if (fraction.size() > MAX_FRACTION_DIGITS) {
            fraction = fraction.substr(0, MAX_FRACTION_DIGITS);
        }
        std::uint64_t numerator{};
        std::uint64_t denominator{1};
        for (const char digit : fraction) {
            numerator = numerator * 10 + static_cast<std::uint64_t>(digit - '0');
            denominator *= 10;
        }
        const auto extra = numerator * (multiplier / denominator) + (numerator * (multiplier % denominator)) / denominator;
        if (bytes > std::numeric_limits<std::uint64_t>::max() - extra) {
            return std::unexpected(fmt::format(FMT_COMPILE("quantity '{}' is out of range"), trimmed));
        }
        bytes += extra;
    }

    return Quantity{.bytes = bytes};
}

auto quantity_to_string(Quantity quantity) noexcept -> std::string {
    if (quantity.bytes != 0) {
        for (const auto& [name, multiplier] : RENDER_TABLE) {
            if (quantity.bytes % multiplier == 0) {
                return fmt::format(FMT_COMPILE("{} {}"), quantity.bytes / multiplier, name);
            }
        }
    }
    return fmt::format(FMT_COMPILE("{} B"), quantity.bytes);
}

}  // namespace prodconf::units
