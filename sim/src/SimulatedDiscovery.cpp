#include "avrdeck/sim/SimulatedDiscovery.h"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace avrdeck::sim {

using discovery::SessionState;

SimulatedDiscoverySession::SimulatedDiscoverySession(boost::asio::io_context& ioContext)
    : ioContext_(ioContext), alive_(std::make_shared<bool>(true)) {}

SimulatedDiscoverySession::~SimulatedDiscoverySession() = default;

void SimulatedDiscoverySession::setAddressHandler(AddressHandler handler) {
    handler_ = std::move(handler);
}

bool SimulatedDiscoverySession::transition(SessionState next) {
    if (!discovery::isTransitionAllowed(state_, next)) {
        spdlog::debug("Simulated discovery ignoring {} -> {}",
                      discovery::toString(state_), discovery::toString(next));
        return false;
    }
    state_ = next;
    return true;
}

void SimulatedDiscoverySession::startSearching() {
    if (transition(SessionState::Searching)) {
        ++startCount_;
    }
}

void SimulatedDiscoverySession::stopSearching() {
    transition(SessionState::Stopped);
}

void SimulatedDiscoverySession::destroy() {
    transition(SessionState::Destroyed);
}

void SimulatedDiscoverySession::announce(const std::string& address) {
    boost::asio::post(ioContext_, [this, alive = std::weak_ptr<bool>(alive_), address] {
        if (alive.expired() || state_ != SessionState::Searching) {
            return;
        }
        if (handler_) {
            handler_(address);
        }
    });
}

SimulatedDiscoveryTransport::SimulatedDiscoveryTransport(boost::asio::io_context& ioContext)
    : ioContext_(ioContext) {}

std::unique_ptr<discovery::DiscoverySession> SimulatedDiscoveryTransport::createSession() {
    auto session = std::make_unique<SimulatedDiscoverySession>(ioContext_);
    active_ = session.get();
    activeAlive_ = session->lifetime();
    ++sessionsCreated_;
    return session;
}

void SimulatedDiscoveryTransport::resolveDisplayName(const std::string& address, NameHandler handler) {
    ++resolveCounts_[address];
    if (hold_) {
        held_.push_back(HeldResolution{address, std::move(handler)});
        return;
    }
    boost::asio::post(ioContext_, [this, address, handler = std::move(handler)]() mutable {
        complete(address, std::move(handler));
    });
}

void SimulatedDiscoveryTransport::complete(const std::string& address, NameHandler handler) {
    auto it = names_.find(address);
    if (it == names_.end()) {
        handler(std::nullopt);
        return;
    }
    handler(it->second);
}

void SimulatedDiscoveryTransport::setDisplayName(const std::string& address, std::optional<std::string> name) {
    names_[address] = std::move(name);
}

void SimulatedDiscoveryTransport::holdResolutions(bool hold) {
    hold_ = hold;
}

void SimulatedDiscoveryTransport::releaseResolutions() {
    auto held = std::move(held_);
    held_.clear();
    for (auto& resolution : held) {
        boost::asio::post(ioContext_, [this, resolution = std::move(resolution)]() mutable {
            complete(resolution.address, std::move(resolution.handler));
        });
    }
}

bool SimulatedDiscoveryTransport::announce(const std::string& address) {
    auto* session = activeSession();
    if (!session) {
        return false;
    }
    session->announce(address);
    return true;
}

bool SimulatedDiscoveryTransport::destroyActiveSession() {
    auto* session = activeSession();
    if (!session) {
        return false;
    }
    session->destroy();
    return true;
}

SimulatedDiscoverySession* SimulatedDiscoveryTransport::activeSession() const {
    if (activeAlive_.expired()) {
        return nullptr;
    }
    return active_;
}

std::size_t SimulatedDiscoveryTransport::resolveCount(const std::string& address) const {
    auto it = resolveCounts_.find(address);
    return it == resolveCounts_.end() ? 0 : it->second;
}

}  // namespace avrdeck::sim
