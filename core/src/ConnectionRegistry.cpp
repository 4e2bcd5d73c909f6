#include "avrdeck/core/ConnectionRegistry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace avrdeck::core {

ConnectionRegistry::ConnectionRegistry(boost::asio::io_context& ioContext,
                                       receiver::ConnectionFactory& factory)
    : ioContext_(ioContext), factory_(factory) {}

ConnectionRegistry::~ConnectionRegistry() {
    for (auto& [host, entry] : connections_) {
        if (entry.idleTimer) {
            entry.idleTimer->cancel();
        }
        entry.connection->setEventHandler({});
    }
}

void ConnectionRegistry::setEventSink(EventSink sink) {
    eventSink_ = std::move(sink);
}

void ConnectionRegistry::setIdleTimeout(std::optional<std::chrono::milliseconds> timeout) {
    idleTimeout_ = timeout;
    for (auto& [host, entry] : connections_) {
        if (entry.references > 0) {
            continue;
        }
        if (idleTimeout_) {
            scheduleTeardown(host, entry);
        } else {
            cancelTeardown(entry);
        }
    }
}

void ConnectionRegistry::getOrCreate(const std::string& host,
                                     const std::string& nameHint,
                                     ConnectionHandler handler) {
    if (host.empty()) {
        throw std::invalid_argument("Receiver host must not be empty");
    }

    if (auto it = connections_.find(host); it != connections_.end()) {
        handler(it->second.connection.get());
        return;
    }

    if (auto it = pending_.find(host); it != pending_.end()) {
        spdlog::debug("Connection to {} already in flight, waiting for it", host);
        it->second.push_back(std::move(handler));
        return;
    }

    spdlog::info("Creating new receiver connection to {}.", host);
    pending_[host].push_back(std::move(handler));
    factory_.create(host, nameHint,
                    [this, host](std::unique_ptr<receiver::ReceiverConnection> connection,
                                 const std::string& error) {
                        handleCreated(host, std::move(connection), error);
                    });
}

void ConnectionRegistry::handleCreated(const std::string& host,
                                       std::unique_ptr<receiver::ReceiverConnection> connection,
                                       const std::string& error) {
    std::vector<ConnectionHandler> waiters;
    if (auto it = pending_.find(host); it != pending_.end()) {
        waiters = std::move(it->second);
        pending_.erase(it);
    }

    if (!connection) {
        spdlog::warn("Failed to create receiver connection to {}: {}", host,
                     error.empty() ? "unknown error" : error);
        for (auto& waiter : waiters) {
            waiter(nullptr);
        }
        return;
    }

    connection->setEventHandler([this, host](const receiver::ReceiverEvent& event) {
        if (eventSink_) {
            eventSink_(host, event);
        }
    });

    auto [it, inserted] = connections_.try_emplace(host);
    it->second.connection = std::move(connection);
    auto* raw = it->second.connection.get();

    for (auto& waiter : waiters) {
        waiter(raw);
    }

    // Nobody bound to it (every waiter was superseded or failed).
    auto created = connections_.find(host);
    if (idleTimeout_ && created != connections_.end() && created->second.references == 0 &&
        !created->second.idleTimer) {
        scheduleTeardown(host, created->second);
    }
}

receiver::ReceiverConnection* ConnectionRegistry::find(const std::string& host) const {
    auto it = connections_.find(host);
    if (it == connections_.end()) {
        return nullptr;
    }
    return it->second.connection.get();
}

bool ConnectionRegistry::isPending(const std::string& host) const {
    return pending_.find(host) != pending_.end();
}

void ConnectionRegistry::acquire(const std::string& host) {
    auto it = connections_.find(host);
    if (it == connections_.end()) {
        spdlog::warn("acquire() for unknown receiver {}", host);
        return;
    }
    auto& entry = it->second;
    ++entry.references;
    if (entry.idleTimer) {
        spdlog::debug("Receiver {} back in use, cancelling idle teardown", host);
        cancelTeardown(entry);
    }
}

void ConnectionRegistry::release(const std::string& host) {
    auto it = connections_.find(host);
    if (it == connections_.end() || it->second.references == 0) {
        return;
    }
    auto& entry = it->second;
    if (--entry.references == 0 && idleTimeout_) {
        scheduleTeardown(host, entry);
    }
}

std::size_t ConnectionRegistry::references(const std::string& host) const {
    auto it = connections_.find(host);
    return it == connections_.end() ? 0 : it->second.references;
}

void ConnectionRegistry::scheduleTeardown(const std::string& host, Entry& entry) {
    cancelTeardown(entry);
    const auto generation = ++entry.teardownGeneration;
    entry.idleTimer = std::make_unique<boost::asio::steady_timer>(ioContext_);
    entry.idleTimer->expires_after(*idleTimeout_);
    entry.idleTimer->async_wait([this, host, generation](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        // Completions of a superseded arming can still be queued here.
        auto it = connections_.find(host);
        if (it == connections_.end() || it->second.teardownGeneration != generation ||
            it->second.references > 0) {
            return;
        }
        teardown(host);
    });
}

void ConnectionRegistry::cancelTeardown(Entry& entry) {
    if (!entry.idleTimer) {
        return;
    }
    ++entry.teardownGeneration;
    entry.idleTimer->cancel();
    entry.idleTimer.reset();
}

void ConnectionRegistry::teardown(const std::string& host) {
    auto it = connections_.find(host);
    if (it == connections_.end()) {
        return;
    }
    spdlog::info("Closing idle receiver connection to {}.", host);
    auto connection = std::move(it->second.connection);
    connections_.erase(it);
    connection->setEventHandler({});
    connection->close();
}

std::vector<ConnectionRegistry::ConnectionInfo> ConnectionRegistry::snapshot() const {
    std::vector<ConnectionInfo> out;
    out.reserve(connections_.size());
    for (const auto& [host, entry] : connections_) {
        ConnectionInfo info;
        info.host = host;
        info.displayName = entry.connection->displayName();
        info.statusText = entry.connection->statusText();
        info.references = entry.references;
        info.teardownScheduled = static_cast<bool>(entry.idleTimer);
        out.push_back(std::move(info));
    }
    std::sort(out.begin(), out.end(), [](const ConnectionInfo& a, const ConnectionInfo& b) {
        return a.host < b.host;
    });
    return out;
}

}  // namespace avrdeck::core
