#include "avrdeck/core/DiscoveryCoordinator.h"
#include "avrdeck/sim/SimulatedDiscovery.h"

#include "TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>

#include <vector>

using avrdeck::core::CoordinatorState;
using avrdeck::core::DiscoveredItem;
using avrdeck::core::DiscoveryCoordinator;
using avrdeck::discovery::SessionState;
using avrdeck::sim::SimulatedDiscoveryTransport;
using avrdeck::testing::drain;

namespace {

struct DiscoveryFixture {
    DiscoveryFixture() : transport(io), coordinator(io, transport) {
        coordinator.setListChangedHandler([this] { ++listChanges; });
        transport.setDisplayName("192.168.1.77", "Living Room");
        transport.setDisplayName("192.168.1.78", "Bedroom");
    }

    boost::asio::io_context io;
    SimulatedDiscoveryTransport transport;
    DiscoveryCoordinator coordinator;
    int listChanges{0};
};

}  // namespace

TEST_CASE("DiscoveryCoordinator defers the search start to the next loop turn", "[discovery]") {
    DiscoveryFixture f;
    CHECK(f.coordinator.state() == CoordinatorState::Idle);

    f.coordinator.startSearching();
    auto* session = f.transport.activeSession();
    REQUIRE(session != nullptr);
    CHECK(session->state() == SessionState::Created);
    CHECK(f.coordinator.state() == CoordinatorState::Searching);

    drain(f.io);
    CHECK(session->state() == SessionState::Searching);
    CHECK(session->startCount() == 1);

    SECTION("starting again while searching is a no-op") {
        f.coordinator.startSearching();
        drain(f.io);
        CHECK(f.transport.sessionsCreated() == 1);
        CHECK(session->startCount() == 1);
    }

    SECTION("stop leaves the session alive") {
        f.coordinator.stopSearching();
        CHECK(session->state() == SessionState::Stopped);
        CHECK(f.coordinator.state() == CoordinatorState::Idle);
        CHECK(f.transport.activeSession() == session);
    }
}

TEST_CASE("DiscoveryCoordinator lists receivers behind a sentinel entry", "[discovery]") {
    DiscoveryFixture f;
    CHECK(f.coordinator.getDiscoveredList().empty());

    f.coordinator.startSearching();
    drain(f.io);
    f.transport.announce("192.168.1.77");
    f.transport.announce("192.168.1.78");
    drain(f.io);

    const std::vector<DiscoveredItem> expected{
        {"Select a receiver", ""},
        {"Living Room", "192.168.1.77"},
        {"Bedroom", "192.168.1.78"},
    };
    CHECK(f.coordinator.getDiscoveredList() == expected);
    CHECK(f.listChanges == 2);
}

TEST_CASE("DiscoveryCoordinator clears the set when discovery restarts", "[discovery]") {
    DiscoveryFixture f;
    f.coordinator.startSearching();
    drain(f.io);
    f.transport.announce("192.168.1.77");
    drain(f.io);
    REQUIRE(f.coordinator.discovered().size() == 1);

    f.coordinator.stopSearching();
    CHECK(f.coordinator.discovered().size() == 1);

    f.coordinator.startSearching();
    CHECK(f.coordinator.discovered().empty());
    CHECK(f.coordinator.getDiscoveredList().empty());
    drain(f.io);

    CHECK(f.transport.sessionsCreated() == 1);
    REQUIRE(f.transport.activeSession() != nullptr);
    CHECK(f.transport.activeSession()->startCount() == 2);
}

TEST_CASE("DiscoveryCoordinator replaces a destroyed session", "[discovery]") {
    DiscoveryFixture f;
    f.coordinator.startSearching();
    drain(f.io);

    f.transport.destroyActiveSession();
    CHECK(f.coordinator.state() == CoordinatorState::SessionDestroyed);

    f.coordinator.stopSearching();
    CHECK(f.coordinator.state() == CoordinatorState::SessionDestroyed);

    f.coordinator.startSearching();
    drain(f.io);

    CHECK(f.transport.sessionsCreated() == 2);
    CHECK(f.coordinator.sessionsCreated() == 2);
    REQUIRE(f.transport.activeSession() != nullptr);
    CHECK(f.transport.activeSession()->state() == SessionState::Searching);
    CHECK(f.coordinator.state() == CoordinatorState::Searching);

    f.transport.announce("192.168.1.77");
    drain(f.io);
    CHECK(f.coordinator.discovered().size() == 1);
}

TEST_CASE("DiscoveryCoordinator resolves each address once while a lookup is pending", "[discovery]") {
    DiscoveryFixture f;
    f.coordinator.startSearching();
    drain(f.io);

    f.transport.holdResolutions(true);
    f.transport.announce("192.168.1.77");
    f.transport.announce("192.168.1.77");
    drain(f.io);

    CHECK(f.transport.resolveCount("192.168.1.77") == 1);
    CHECK(f.coordinator.pendingResolutions() == 1);
    CHECK(f.coordinator.discovered().empty());

    f.transport.releaseResolutions();
    drain(f.io);
    REQUIRE(f.coordinator.discovered().size() == 1);
    CHECK(f.coordinator.pendingResolutions() == 0);

    SECTION("a resolved address is not looked up again") {
        f.transport.announce("192.168.1.77");
        drain(f.io);
        CHECK(f.transport.resolveCount("192.168.1.77") == 1);
        CHECK(f.coordinator.discovered().size() == 1);
    }
}

TEST_CASE("DiscoveryCoordinator falls back to the address and renames later", "[discovery]") {
    DiscoveryFixture f;
    f.transport.setDisplayName("192.168.1.90", std::nullopt);
    f.coordinator.startSearching();
    drain(f.io);

    f.transport.announce("192.168.1.90");
    drain(f.io);
    REQUIRE(f.coordinator.discovered().size() == 1);
    CHECK(f.coordinator.discovered().front().name == "192.168.1.90");
    CHECK_FALSE(f.coordinator.discovered().front().nameResolved);

    f.transport.setDisplayName("192.168.1.90", "Studio");
    f.transport.announce("192.168.1.90");
    drain(f.io);

    REQUIRE(f.coordinator.discovered().size() == 1);
    CHECK(f.coordinator.discovered().front().name == "Studio");
    CHECK(f.coordinator.discovered().front().nameResolved);
    CHECK(f.transport.resolveCount("192.168.1.90") == 2);
    CHECK(f.listChanges == 2);
}

TEST_CASE("DiscoveryCoordinator drops names resolved before a restart", "[discovery]") {
    DiscoveryFixture f;
    f.coordinator.startSearching();
    drain(f.io);

    f.transport.holdResolutions(true);
    f.transport.announce("192.168.1.77");
    drain(f.io);

    f.coordinator.stopSearching();
    f.coordinator.startSearching();
    drain(f.io);

    f.transport.releaseResolutions();
    drain(f.io);

    CHECK(f.coordinator.discovered().empty());
    CHECK(f.listChanges == 0);
}

TEST_CASE("DiscoveryCoordinator cancels a deferred start when stopped first", "[discovery]") {
    DiscoveryFixture f;
    f.coordinator.startSearching();
    f.coordinator.stopSearching();
    drain(f.io);

    auto* session = f.transport.activeSession();
    REQUIRE(session != nullptr);
    CHECK(session->state() == SessionState::Created);
    CHECK(session->startCount() == 0);
    CHECK(f.coordinator.state() == CoordinatorState::Idle);
}

TEST_CASE("DiscoveryCoordinator uses the configured placeholder label", "[discovery]") {
    boost::asio::io_context io;
    SimulatedDiscoveryTransport transport(io);
    DiscoveryCoordinator coordinator(io, transport, "Choose...");
    transport.setDisplayName("192.168.1.77", "Living Room");

    coordinator.startSearching();
    drain(io);
    transport.announce("192.168.1.77");
    drain(io);

    const auto items = coordinator.getDiscoveredList();
    REQUIRE(items.size() == 2);
    CHECK(items.front() == DiscoveredItem{"Choose...", ""});
}
