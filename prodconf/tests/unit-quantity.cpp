#include "doctest_compatibility.h"

#include "prodconf/quantity.hpp"

#include <string_view>

using namespace std::string_view_literals;
using namespace prodconf;

TEST_CASE("quantity parsing test")
{
    SECTION("binary units")
    {
        REQUIRE_EQ(units::parse_quantity("512 B"sv), Quantity{.bytes = 512});
        REQUIRE_EQ(units::parse_quantity("4 KiB"sv), Quantity{.bytes = 4 * units::KiB});
        REQUIRE_EQ(units::parse_quantity("500 MiB"sv), units::mebibytes(500));
        REQUIRE_EQ(units::parse_quantity("10 GiB"sv), units::gibibytes(10));
        REQUIRE_EQ(units::parse_quantity("2 TiB"sv), Quantity{.bytes = 2 * units::TiB});
        REQUIRE_EQ(units::parse_quantity("1 PiB"sv), Quantity{.bytes = units::PiB});
    }
    SECTION("decimal units")
    {
        REQUIRE_EQ(units::parse_quantity("1 kB"sv), Quantity{.bytes = 1000});
        REQUIRE_EQ(units::parse_quantity("1 KB"sv), Quantity{.bytes = 1000});
        REQUIRE_EQ(units::parse_quantity("3 MB"sv), Quantity{.bytes = 3000000});
        REQUIRE_EQ(units::parse_quantity("2 GB"sv), Quantity{.bytes = 2000000000});
    }
    SECTION("spacing")
    {
        REQUIRE_EQ(units::parse_quantity("10GiB"sv), units::gibibytes(10));
        REQUIRE_EQ(units::parse_quantity("  10   GiB  "sv), units::gibibytes(10));
    }
    SECTION("fractions are truncated")
    {
        REQUIRE_EQ(units::parse_quantity("1.5 GiB"sv), units::mebibytes(1536));
        REQUIRE_EQ(units::parse_quantity("0.5 KiB"sv), Quantity{.bytes = 512});
        REQUIRE_EQ(units::parse_quantity("1.5 B"sv), Quantity{.bytes = 1});
        // only three decimals count
        REQUIRE_EQ(units::parse_quantity("1.0009 kB"sv), Quantity{.bytes = 1000});
    }
    SECTION("invalid literals")
    {
        REQUIRE(!units::parse_quantity("GiB"sv).has_value());
        REQUIRE(!units::parse_quantity("ten GiB"sv).has_value());
        REQUIRE(!units::parse_quantity("10"sv).has_value());
        REQUIRE(!units::parse_quantity("-1 GiB"sv).has_value());

        const auto& unknown_unit = units::parse_quantity("10 XB"sv);
        REQUIRE(!unknown_unit.has_value());
        REQUIRE_EQ(unknown_unit.error(), "unrecognized quantity unit 'XB'");

        REQUIRE(!units::parse_quantity("99999999999 PiB"sv).has_value());
    }
    SECTION("shape detection")
    {
        REQUIRE(units::looks_like_quantity("10 GiB"sv));
        REQUIRE(units::looks_like_quantity("10 XB"sv));
        REQUIRE(units::looks_like_quantity("10 XiB"sv));
        REQUIRE(!units::looks_like_quantity("2 web"sv));
        REQUIRE(!units::looks_like_quantity("2 WEB"sv));
        REQUIRE(!units::looks_like_quantity("10 gib"sv));
        REQUIRE(!units::looks_like_quantity("3 bulb"sv));
        REQUIRE(!units::looks_like_quantity("LVM"sv));
        REQUIRE(!units::looks_like_quantity("/ (min 1 GiB)"sv));
        REQUIRE(!units::looks_like_quantity("10"sv));
    }
    SECTION("ordering")
    {
        REQUIRE(units::gibibytes(1) > units::mebibytes(1023));
        REQUIRE(units::gibibytes(1) == units::mebibytes(1024));
        REQUIRE(Quantity{} < Quantity{.bytes = 1});
    }
}

TEST_CASE("quantity rendering test")
{
    REQUIRE_EQ(units::quantity_to_string(units::gibibytes(10)), "10 GiB");
    REQUIRE_EQ(units::quantity_to_string(units::mebibytes(1536)), "1536 MiB");
    REQUIRE_EQ(units::quantity_to_string(Quantity{.bytes = 7}), "7 B");
    REQUIRE_EQ(units::quantity_to_string(Quantity{.bytes = 1000}), "1000 B");
    REQUIRE_EQ(units::quantity_to_string(Quantity{}), "0 B");
    REQUIRE_EQ(units::quantity_to_string(Quantity{.bytes = units::PiB}), "1 PiB");
}
