#include "avrdeck/core/ConnectionRegistry.h"
#include "avrdeck/sim/SimulatedReceiver.h"

#include "TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using avrdeck::core::ConnectionRegistry;
using avrdeck::receiver::ReceiverConnection;
using avrdeck::sim::SimulatedConnectionFactory;
using avrdeck::testing::drain;
using avrdeck::testing::runFor;

namespace {

constexpr const char* kHost = "192.168.1.50";

}  // namespace

TEST_CASE("ConnectionRegistry creates one connection for concurrent requests", "[registry]") {
    boost::asio::io_context io;
    SimulatedConnectionFactory factory(io);
    ConnectionRegistry registry(io, factory);

    std::vector<ReceiverConnection*> results;
    registry.getOrCreate(kHost, "Den", [&](ReceiverConnection* c) { results.push_back(c); });
    registry.getOrCreate(kHost, "Other", [&](ReceiverConnection* c) { results.push_back(c); });

    CHECK(registry.isPending(kHost));
    CHECK(results.empty());
    CHECK(factory.createCount(kHost) == 1);

    drain(io);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0] != nullptr);
    CHECK(results[0] == results[1]);
    CHECK(registry.size() == 1);
    CHECK_FALSE(registry.isPending(kHost));
    CHECK(registry.find(kHost) == results[0]);
    CHECK(results[0]->displayName() == "Den");
}

TEST_CASE("ConnectionRegistry returns the cached connection and ignores the name hint", "[registry]") {
    boost::asio::io_context io;
    SimulatedConnectionFactory factory(io);
    ConnectionRegistry registry(io, factory);

    ReceiverConnection* first = nullptr;
    registry.getOrCreate(kHost, "Den", [&](ReceiverConnection* c) { first = c; });
    drain(io);
    REQUIRE(first != nullptr);

    ReceiverConnection* second = nullptr;
    registry.getOrCreate(kHost, "Kitchen", [&](ReceiverConnection* c) { second = c; });
    // Cache hits complete immediately.
    CHECK(second == first);
    CHECK(second->displayName() == "Den");
    CHECK(factory.createCount(kHost) == 1);
}

TEST_CASE("ConnectionRegistry does not cache failed connections", "[registry]") {
    boost::asio::io_context io;
    SimulatedConnectionFactory factory(io);
    ConnectionRegistry registry(io, factory);
    factory.setFailing(kHost, true);

    bool called = false;
    ReceiverConnection* result = nullptr;
    registry.getOrCreate(kHost, "", [&](ReceiverConnection* c) {
        called = true;
        result = c;
    });
    drain(io);

    CHECK(called);
    CHECK(result == nullptr);
    CHECK(registry.size() == 0);
    CHECK_FALSE(registry.isPending(kHost));

    factory.setFailing(kHost, false);
    registry.getOrCreate(kHost, "", [&](ReceiverConnection* c) { result = c; });
    drain(io);

    CHECK(result != nullptr);
    CHECK(factory.createCount(kHost) == 2);
}

TEST_CASE("ConnectionRegistry forwards receiver events with their host", "[registry]") {
    boost::asio::io_context io;
    SimulatedConnectionFactory factory(io);
    ConnectionRegistry registry(io, factory);

    std::vector<std::string> hosts;
    std::vector<avrdeck::receiver::ReceiverEvent> events;
    registry.setEventSink([&](const std::string& host, const avrdeck::receiver::ReceiverEvent& event) {
        hosts.push_back(host);
        events.push_back(event);
    });

    registry.getOrCreate(kHost, "", [](ReceiverConnection*) {});
    drain(io);

    auto* receiver = factory.receiver(kHost);
    REQUIRE(receiver != nullptr);
    receiver->markConnected();
    receiver->toggleMute();
    drain(io);

    REQUIRE(events.size() == 2);
    CHECK(hosts == std::vector<std::string>{kHost, kHost});
    CHECK(std::holds_alternative<avrdeck::receiver::ConnectedEvent>(events[0]));
    REQUIRE(std::holds_alternative<avrdeck::receiver::MuteChangedEvent>(events[1]));
    CHECK(std::get<avrdeck::receiver::MuteChangedEvent>(events[1]).muted);
}

TEST_CASE("ConnectionRegistry rejects an empty host", "[registry]") {
    boost::asio::io_context io;
    SimulatedConnectionFactory factory(io);
    ConnectionRegistry registry(io, factory);

    CHECK_THROWS_AS(registry.getOrCreate("", "", [](ReceiverConnection*) {}), std::invalid_argument);
    CHECK(factory.createCount("") == 0);
}

TEST_CASE("ConnectionRegistry keeps unreferenced connections without an idle timeout", "[registry]") {
    boost::asio::io_context io;
    SimulatedConnectionFactory factory(io);
    ConnectionRegistry registry(io, factory);

    registry.getOrCreate(kHost, "", [&](ReceiverConnection*) { registry.acquire(kHost); });
    drain(io);
    CHECK(registry.references(kHost) == 1);

    registry.release(kHost);
    runFor(io, std::chrono::milliseconds(50));

    CHECK(registry.references(kHost) == 0);
    REQUIRE(registry.find(kHost) != nullptr);
    REQUIRE(factory.receiver(kHost) != nullptr);
    CHECK_FALSE(factory.receiver(kHost)->closed());
}

TEST_CASE("ConnectionRegistry closes idle connections after the timeout", "[registry]") {
    boost::asio::io_context io;
    SimulatedConnectionFactory factory(io);
    ConnectionRegistry registry(io, factory);

    SECTION("released connection is torn down") {
        registry.setIdleTimeout(std::chrono::milliseconds(10));
        registry.getOrCreate(kHost, "", [&](ReceiverConnection*) { registry.acquire(kHost); });
        drain(io);
        REQUIRE(registry.references(kHost) == 1);

        registry.release(kHost);
        const auto pendingTeardown = registry.snapshot();
        REQUIRE(pendingTeardown.size() == 1);
        CHECK(pendingTeardown.front().teardownScheduled);

        runFor(io, std::chrono::milliseconds(500));
        CHECK(registry.find(kHost) == nullptr);
        CHECK(registry.size() == 0);
        CHECK(factory.receiver(kHost) == nullptr);
    }

    SECTION("re-acquiring before the timeout keeps the connection") {
        registry.setIdleTimeout(std::chrono::seconds(30));
        registry.getOrCreate(kHost, "", [&](ReceiverConnection*) { registry.acquire(kHost); });
        drain(io);

        registry.release(kHost);
        registry.acquire(kHost);
        drain(io);

        const auto snapshot = registry.snapshot();
        REQUIRE(snapshot.size() == 1);
        CHECK_FALSE(snapshot.front().teardownScheduled);
        CHECK(snapshot.front().references == 1);
        CHECK(factory.createCount(kHost) == 1);
    }

    SECTION("a connection nobody bound to is scheduled for teardown") {
        registry.setIdleTimeout(std::chrono::milliseconds(10));
        registry.getOrCreate(kHost, "", [](ReceiverConnection*) {});
        drain(io);
        REQUIRE(registry.size() == 1);

        runFor(io, std::chrono::milliseconds(500));
        CHECK(registry.size() == 0);
    }

    SECTION("a re-release after the timer expired starts a fresh grace period") {
        registry.setIdleTimeout(std::chrono::milliseconds(50));
        registry.getOrCreate(kHost, "", [&](ReceiverConnection*) { registry.acquire(kHost); });
        drain(io);
        registry.release(kHost);

        // Let the timer expire without dispatching its completion.
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        for (int i = 0; i < 3; ++i) {
            boost::asio::post(io, [&] {
                registry.acquire(kHost);
                registry.release(kHost);
            });
        }
        drain(io);

        const auto snapshot = registry.snapshot();
        REQUIRE(snapshot.size() == 1);
        CHECK(snapshot.front().references == 0);
        CHECK(snapshot.front().teardownScheduled);
        REQUIRE(factory.receiver(kHost) != nullptr);
        CHECK_FALSE(factory.receiver(kHost)->closed());

        runFor(io, std::chrono::milliseconds(500));
        CHECK(registry.size() == 0);
    }
}
