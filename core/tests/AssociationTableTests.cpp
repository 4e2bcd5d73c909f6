#include "avrdeck/core/AssociationTable.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using avrdeck::core::AssociationTable;

TEST_CASE("AssociationTable keeps one host per control", "[associations]") {
    AssociationTable table;

    REQUIRE_FALSE(table.bind("A", "192.168.1.50").has_value());
    CHECK(table.hostOf("A") == "192.168.1.50");

    SECTION("rebinding replaces the previous host") {
        const auto previous = table.bind("A", "192.168.1.60");
        REQUIRE(previous.has_value());
        CHECK(*previous == "192.168.1.50");
        CHECK(table.hostOf("A") == "192.168.1.60");
        CHECK(table.size() == 1);
        CHECK(table.controlsBoundTo("192.168.1.50").empty());
        CHECK(table.countForHost("192.168.1.50") == 0);
    }

    SECTION("binding the same host again reports it as previous") {
        const auto previous = table.bind("A", "192.168.1.50");
        REQUIRE(previous.has_value());
        CHECK(*previous == "192.168.1.50");
        CHECK(table.size() == 1);
    }

    SECTION("unbind removes the entry and is idempotent") {
        const auto removed = table.unbind("A");
        REQUIRE(removed.has_value());
        CHECK(*removed == "192.168.1.50");
        CHECK_FALSE(table.lookupByControl("A").has_value());
        CHECK_FALSE(table.unbind("A").has_value());
        CHECK(table.size() == 0);
    }
}

TEST_CASE("AssociationTable allows many controls per host", "[associations]") {
    AssociationTable table;
    table.bind("B", "192.168.1.50");
    table.bind("A", "192.168.1.50");
    table.bind("C", "192.168.1.60");

    CHECK(table.controlsBoundTo("192.168.1.50") == std::vector<std::string>{"A", "B"});
    CHECK(table.countForHost("192.168.1.50") == 2);

    table.unbind("A");
    CHECK(table.controlsBoundTo("192.168.1.50") == std::vector<std::string>{"B"});

    const auto snapshot = table.snapshot();
    REQUIRE(snapshot.size() == 2);
    CHECK(snapshot[0].controlId == "B");
    CHECK(snapshot[1].controlId == "C");
    CHECK(snapshot[1].host == "192.168.1.60");
}

TEST_CASE("AssociationTable rejects empty keys", "[associations]") {
    AssociationTable table;
    CHECK_THROWS_AS(table.bind("", "192.168.1.50"), std::invalid_argument);
    CHECK_THROWS_AS(table.bind("A", ""), std::invalid_argument);
    CHECK(table.size() == 0);
}
