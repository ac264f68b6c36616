#include "doctest_compatibility.h"

#include "prodconf/partition_spec.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;
using namespace prodconf;
using namespace prodconf::storage;

namespace {

auto parse_single(std::string_view line, RuleSyntax syntax = RuleSyntax::Partitioning) -> std::expected<std::vector<PartitionRule>, Error> {
    return parse_partition_rules({std::string{line}}, syntax);
}

}  // namespace

TEST_CASE("partitioning rules test")
{
    SECTION("minimum with upper bound")
    {
        const auto& rules = parse_single("/home (min 1 GiB, max 50 GiB)"sv);
        REQUIRE(rules.has_value());
        REQUIRE_EQ(rules->size(), 1);

        const auto& rule = rules->front();
        REQUIRE_EQ(rule.mount_point, "/home");
        REQUIRE_EQ(rule.kind, SizeKind::Min);
        REQUIRE_EQ(rule.size, units::gibibytes(1));
        REQUIRE_EQ(rule.max_size, units::gibibytes(50));
    }
    SECTION("fixed size")
    {
        const auto& rules = parse_single("/var (size 15 GiB)"sv);
        REQUIRE(rules.has_value());
        REQUIRE_EQ(rules->front().kind, SizeKind::Fixed);
        REQUIRE_EQ(rules->front().size, units::gibibytes(15));
        REQUIRE(!rules->front().max_size.has_value());
    }
    SECTION("mount point only")
    {
        const auto& rules = parse_single("/srv"sv);
        REQUIRE(rules.has_value());
        REQUIRE_EQ(rules->front().kind, SizeKind::Unspecified);
        REQUIRE(!rules->front().size.has_value());

        const auto& swap = parse_single("swap"sv);
        REQUIRE(swap.has_value());
        REQUIRE_EQ(swap->front().mount_point, "swap");
    }
    SECTION("order is kept and blank lines skipped")
    {
        const std::vector<std::string> lines{"/     (min 1 GiB, max 70 GiB)", "", "/home (min 500 MiB)", "swap"};
        const auto& rules = parse_partition_rules(lines);
        REQUIRE(rules.has_value());
        REQUIRE_EQ(rules->size(), 3);
        REQUIRE_EQ((*rules)[0].mount_point, "/");
        REQUIRE_EQ((*rules)[1].mount_point, "/home");
        REQUIRE_EQ((*rules)[1].size, units::mebibytes(500));
        REQUIRE_EQ((*rules)[2].mount_point, "swap");
    }
    SECTION("rejected rules")
    {
        // every failure is a PartitionSyntax error naming the line
        const std::vector<std::string_view> invalid{
            "/home (min 1 GiB"sv,
            "/home (1 GiB)"sv,
            "/home ()"sv,
            "/home (avg 1 GiB)"sv,
            "/home (min 1 GiB, min 2 GiB)"sv,
            "/home (min 1 GiB, size 2 GiB)"sv,
            "/home (max 2 GiB)"sv,
            "/home (size 2 GiB, max 4 GiB)"sv,
            "/home (min 4 GiB, max 2 GiB)"sv,
            "/home (min 4 XB)"sv,
            "home (min 1 GiB)"sv,
            "/home (min 1 GiB) trailing"sv,
        };
        for (const auto line : invalid) {
            const auto& rules = parse_single(line);
            REQUIRE(!rules.has_value());
            REQUIRE_EQ(rules.error().kind, ErrorKind::PartitionSyntax);
            REQUIRE_EQ(rules.error().value, line);
        }
    }
    SECTION("duplicate mount point")
    {
        const std::vector<std::string> lines{"/home (min 1 GiB)", "/home (size 2 GiB)"};
        const auto& rules = parse_partition_rules(lines);
        REQUIRE(!rules.has_value());
        REQUIRE_EQ(rules.error().kind, ErrorKind::PartitionSyntax);
        REQUIRE_EQ(rules.error().value, "/home (size 2 GiB)");
    }
    SECTION("mount points are case sensitive")
    {
        const std::vector<std::string> lines{"/Data", "/data"};
        REQUIRE(parse_partition_rules(lines).has_value());
    }
}

TEST_CASE("size requirements test")
{
    SECTION("bare and qualified forms")
    {
        const std::vector<std::string> lines{"/var 10 GiB", "/tmp (min 2 GiB)"};
        const auto& rules = parse_partition_rules(lines, RuleSyntax::Requirements);
        REQUIRE(rules.has_value());
        REQUIRE_EQ(rules->size(), 2);
        REQUIRE_EQ((*rules)[0].mount_point, "/var");
        REQUIRE_EQ((*rules)[0].kind, SizeKind::Min);
        REQUIRE_EQ((*rules)[0].size, units::gibibytes(10));
        REQUIRE_EQ((*rules)[1].size, units::gibibytes(2));
    }
    SECTION("only minimums are accepted")
    {
        REQUIRE(!parse_single("/var (size 10 GiB)"sv, RuleSyntax::Requirements).has_value());
        REQUIRE(!parse_single("/var (min 1 GiB, max 10 GiB)"sv, RuleSyntax::Requirements).has_value());
        REQUIRE(!parse_single("/var"sv, RuleSyntax::Requirements).has_value());
        REQUIRE(!parse_single("/var 10 XB"sv, RuleSyntax::Requirements).has_value());
    }
    SECTION("bare form is not a partitioning rule")
    {
        REQUIRE(!parse_single("/var 10 GiB"sv).has_value());
    }
}

TEST_CASE("partition rule rendering test")
{
    const std::vector<std::string> lines{"/ (min 1 GiB, max 70 GiB)", "/var (size 1536 MiB)", "/home (min 500 MiB)", "swap"};
    const auto& rules = parse_partition_rules(lines);
    REQUIRE(rules.has_value());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        REQUIRE_EQ(rule_to_string((*rules)[i]), lines[i]);
    }
    REQUIRE_EQ(size_kind_to_string(SizeKind::Fixed), "size");
}
