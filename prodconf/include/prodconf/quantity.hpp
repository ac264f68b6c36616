#ifndef QUANTITY_HPP
#define QUANTITY_HPP

#include <compare>      // for strong_ordering
#include <cstdint>      // for uint64_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace prodconf {

/// @brief A size literal such as `6 GiB`, normalized to a byte count.
struct Quantity final {
    std::uint64_t bytes{};

    constexpr auto operator<=>(const Quantity&) const = default;
};

}  // namespace prodconf

namespace prodconf::units {

inline constexpr std::uint64_t KiB = 1024ULL;
inline constexpr std::uint64_t MiB = KiB * 1024ULL;
inline constexpr std::uint64_t GiB = MiB * 1024ULL;
inline constexpr std::uint64_t TiB = GiB * 1024ULL;
inline constexpr std::uint64_t PiB = TiB * 1024ULL;

constexpr auto mebibytes(std::uint64_t count) noexcept -> Quantity {
    return Quantity{.bytes = count * MiB};
}

constexpr auto gibibytes(std::uint64_t count) noexcept -> Quantity {
    return Quantity{.bytes = count * GiB};
}

/// @brief Byte multiplier of a unit name (B, KiB..PiB, kB/KB..PB).
/// @return Zero if the unit is not recognized.
[[nodiscard]] auto unit_multiplier(std::string_view unit) noexcept -> std::uint64_t;

/// @brief Check whether the text has the shape `<number> <unit>`,
/// where unit is any word ending in `B`. The unit itself is not checked.
[[nodiscard]] auto looks_like_quantity(std::string_view text) noexcept -> bool;

/// @brief Parse `<number> <unit>` into a Quantity.
/// Fractions are accepted ("1.5 GiB"), digits past the third decimal are ignored
/// and the byte count is truncated.
/// @return The quantity, or a message describing why the literal is invalid.
[[nodiscard]] auto parse_quantity(std::string_view text) noexcept -> std::expected<Quantity, std::string>;

/// @brief Render with the largest binary unit that divides the byte count exactly.
/// e.g "10 GiB", "1536 MiB", "7 B"
[[nodiscard]] auto quantity_to_string(Quantity quantity) noexcept -> std::string;

}  // namespace prodconf::units

#endif  // QUANTITY_HPP
