#pragma once

#include "avrdeck/receiver/ReceiverConnection.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace avrdeck::core {

/**
 * @brief Owns at most one live ReceiverConnection per host.
 *
 * All members must be called on the thread running @p ioContext. Connection
 * construction is asynchronous; concurrent getOrCreate() calls for a host whose
 * construction is in flight are parked and complete with the same connection.
 *
 * Bound controls are counted through acquire()/release(). With an idle timeout
 * configured, a connection nobody references is closed once the timeout elapses;
 * without one, connections stay open for the lifetime of the registry.
 */
class ConnectionRegistry {
public:
    /// Receives null when the connection could not be created.
    using ConnectionHandler = std::function<void(receiver::ReceiverConnection* connection)>;
    using EventSink = std::function<void(const std::string& host, const receiver::ReceiverEvent& event)>;

    struct ConnectionInfo {
        std::string host;
        std::string displayName;
        std::string statusText;
        std::size_t references{0};
        bool teardownScheduled{false};
    };

    ConnectionRegistry(boost::asio::io_context& ioContext, receiver::ConnectionFactory& factory);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    void setEventSink(EventSink sink);
    void setIdleTimeout(std::optional<std::chrono::milliseconds> timeout);

    void getOrCreate(const std::string& host, const std::string& nameHint, ConnectionHandler handler);

    receiver::ReceiverConnection* find(const std::string& host) const;
    bool isPending(const std::string& host) const;

    void acquire(const std::string& host);
    void release(const std::string& host);
    std::size_t references(const std::string& host) const;

    std::vector<ConnectionInfo> snapshot() const;
    std::size_t size() const noexcept { return connections_.size(); }

private:
    struct Entry {
        std::unique_ptr<receiver::ReceiverConnection> connection;
        std::size_t references{0};
        std::unique_ptr<boost::asio::steady_timer> idleTimer;
        // Bumped on every arm and cancel; a timer completion only acts if it still matches.
        std::uint64_t teardownGeneration{0};
    };

    void handleCreated(const std::string& host,
                       std::unique_ptr<receiver::ReceiverConnection> connection,
                       const std::string& error);
    void scheduleTeardown(const std::string& host, Entry& entry);
    void cancelTeardown(Entry& entry);
    void teardown(const std::string& host);

    boost::asio::io_context& ioContext_;
    receiver::ConnectionFactory& factory_;
    EventSink eventSink_;
    std::optional<std::chrono::milliseconds> idleTimeout_;
    std::unordered_map<std::string, Entry> connections_;
    std::unordered_map<std::string, std::vector<ConnectionHandler>> pending_;
};

}  // namespace avrdeck::core
