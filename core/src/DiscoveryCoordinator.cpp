#include "avrdeck/core/DiscoveryCoordinator.h"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace avrdeck::core {

using discovery::SessionState;

std::string_view toString(CoordinatorState state) {
    switch (state) {
    case CoordinatorState::Idle:
        return "idle";
    case CoordinatorState::Searching:
        return "searching";
    case CoordinatorState::SessionDestroyed:
        return "session-destroyed";
    }
    return "idle";
}

DiscoveryCoordinator::DiscoveryCoordinator(boost::asio::io_context& ioContext,
                                           discovery::DiscoveryTransport& transport,
                                           std::string placeholderLabel)
    : ioContext_(ioContext), transport_(transport), placeholderLabel_(std::move(placeholderLabel)) {}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    if (session_) {
        session_->setAddressHandler({});
    }
}

void DiscoveryCoordinator::setListChangedHandler(ListChangedHandler handler) {
    listChanged_ = std::move(handler);
}

CoordinatorState DiscoveryCoordinator::state() const {
    if (!session_) {
        return CoordinatorState::Idle;
    }
    const auto sessionState = session_->state();
    if (sessionState == SessionState::Destroyed) {
        return CoordinatorState::SessionDestroyed;
    }
    if (startPending_ || sessionState == SessionState::Searching) {
        return CoordinatorState::Searching;
    }
    return CoordinatorState::Idle;
}

void DiscoveryCoordinator::ensureLiveSession() {
    if (session_ && session_->state() != SessionState::Destroyed) {
        return;
    }
    if (session_) {
        spdlog::info("Discovery session was destroyed, creating a replacement");
        session_->setAddressHandler({});
    }

    session_ = transport_.createSession();
    ++sessionsCreated_;
    session_->setAddressHandler([this](const std::string& address) { handleAddressObserved(address); });
}

void DiscoveryCoordinator::startSearching() {
    if (state() == CoordinatorState::Searching) {
        spdlog::debug("Discovery already searching");
        return;
    }

    ensureLiveSession();
    discovered_.clear();
    pendingResolution_.clear();
    ++generation_;
    startPending_ = true;

    // Sockets may still be initialising; start on the next turn of the loop,
    // after the address handler is in place.
    boost::asio::post(ioContext_, [this, generation = generation_] {
        if (!startPending_ || generation != generation_) {
            return;
        }
        startPending_ = false;
        if (!session_ || session_->state() == SessionState::Destroyed) {
            spdlog::warn("Discovery session destroyed before searching started");
            return;
        }
        session_->startSearching();
        spdlog::info("Searching for receivers");
    });
}

void DiscoveryCoordinator::stopSearching() {
    if (!session_) {
        return;
    }
    startPending_ = false;
    if (session_->state() == SessionState::Searching) {
        session_->stopSearching();
        spdlog::info("Stopped searching for receivers");
    }
}

std::vector<DiscoveredItem> DiscoveryCoordinator::getDiscoveredList() const {
    std::vector<DiscoveredItem> items;
    if (discovered_.empty()) {
        return items;
    }
    items.reserve(discovered_.size() + 1);
    items.push_back(DiscoveredItem{placeholderLabel_, ""});
    for (const auto& receiver : discovered_) {
        items.push_back(DiscoveredItem{receiver.name, receiver.address});
    }
    return items;
}

void DiscoveryCoordinator::handleAddressObserved(const std::string& address) {
    if (pendingResolution_.count(address) > 0) {
        spdlog::debug("Discovery response from {} while its name is being resolved", address);
        return;
    }

    auto it = std::find_if(discovered_.begin(), discovered_.end(),
                           [&address](const DiscoveredReceiver& r) { return r.address == address; });
    if (it != discovered_.end() && it->nameResolved) {
        return;
    }

    spdlog::debug("Discovery response from {}", address);
    pendingResolution_.insert(address);
    transport_.resolveDisplayName(address, [this, address, generation = generation_](std::optional<std::string> name) {
        handleNameResolved(address, std::move(name), generation);
    });
}

void DiscoveryCoordinator::handleNameResolved(const std::string& address,
                                              std::optional<std::string> name,
                                              std::uint64_t generation) {
    if (generation != generation_) {
        spdlog::debug("Dropping name for {} resolved before discovery restarted", address);
        return;
    }
    pendingResolution_.erase(address);

    const bool resolved = name.has_value() && !name->empty();
    auto it = std::find_if(discovered_.begin(), discovered_.end(),
                           [&address](const DiscoveredReceiver& r) { return r.address == address; });
    if (it != discovered_.end()) {
        if (!resolved) {
            return;
        }
        it->name = std::move(*name);
        it->nameResolved = true;
    } else {
        if (!resolved) {
            spdlog::debug("No name reported by {}, listing it by address", address);
        }
        discovered_.push_back(DiscoveredReceiver{resolved ? std::move(*name) : address, address, resolved});
    }

    if (listChanged_) {
        listChanged_();
    }
}

}  // namespace avrdeck::core
