#include <catch2/catch_test_macros.hpp>
#include "sectrust/section/trusted_keys.hpp"
#include "helpers/section_fixture.hpp"
using namespace sectrust;
using namespace sectrust::routing;
using sectrust::test_helpers::ElderGroup;

TEST_CASE("TrustedKeyTable - Snapshots", "[section][trust]") {
    TrustedKeyTable table;
    const auto first = ElderGroup::Create(3);
    const auto second = ElderGroup::Create(3);
    const Prefix p0 = Prefix().Pushed(false);
    const Prefix p1 = Prefix().Pushed(true);

    SECTION("Update adds and replaces per prefix") {
        table.Update(p0, first.Key());
        table.Update(p1, first.Key());
        REQUIRE(table.Size() == 2);
        table.Update(p0, second.Key());
        REQUIRE(table.Size() == 2);
        const auto snapshot = table.Snapshot();
        REQUIRE(snapshot->front().key == second.Key());
    }
    SECTION("Snapshots are not affected by later writes") {
        table.Update(p0, first.Key());
        const auto before = table.Snapshot();
        table.Update(p0, second.Key());
        table.Update(p1, second.Key());
        REQUIRE(before->size() == 1);
        REQUIRE(before->front().key == first.Key());
        REQUIRE(table.Snapshot()->size() == 2);
    }
    SECTION("Prune removes a prefix and its descendants") {
        table.Update(p1, first.Key());
        table.Update(p1.Pushed(false), first.Key());
        table.Update(p0, first.Key());
        table.Prune(p1);
        REQUIRE(table.Size() == 1);
        REQUIRE(table.Snapshot()->front().prefix == p0);
    }
    SECTION("Formatting lists prefix and key") {
        table.Update(p1, first.Key());
        const auto snapshot = table.Snapshot();
        const auto text = FormatTrustedKeys(*snapshot);
        REQUIRE(text.find("(1 -> SectionKey(") == 0);
    }
}
