#include "avrdeck/sim/SimulatedReceiver.h"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace avrdeck::sim {

namespace {

constexpr double kMaxVolume = 98.0;

double clampVolume(double volume) {
    return std::clamp(volume, 0.0, kMaxVolume);
}

}  // namespace

SimulatedReceiver::SimulatedReceiver(boost::asio::io_context& ioContext, std::string host, std::string name)
    : ioContext_(ioContext),
      host_(std::move(host)),
      name_(std::move(name)),
      alive_(std::make_shared<bool>(true)) {
    if (name_.empty()) {
        name_ = host_;
    }
}

SimulatedReceiver::~SimulatedReceiver() = default;

void SimulatedReceiver::setEventHandler(EventHandler handler) {
    handler_ = std::move(handler);
}

void SimulatedReceiver::emit(receiver::ReceiverEvent event) {
    boost::asio::post(ioContext_, [this, alive = std::weak_ptr<bool>(alive_), event = std::move(event)] {
        if (alive.expired()) {
            return;
        }
        if (handler_) {
            handler_(event);
        }
    });
}

void SimulatedReceiver::setStatus(std::string status) {
    status_ = std::move(status);
    emit(receiver::StatusEvent{});
}

void SimulatedReceiver::markConnected() {
    status_ = "Connected to " + name_ + ".";
    emit(receiver::ConnectedEvent{});
}

void SimulatedReceiver::markClosed() {
    status_ = "Connection to " + name_ + " closed.";
    emit(receiver::ClosedEvent{});
}

void SimulatedReceiver::setPower(bool on) {
    commandLog_.push_back(on ? "power:on" : "power:off");
    if (state_.power == on) {
        return;
    }
    state_.power = on;
    emit(receiver::PowerChangedEvent{on});
}

void SimulatedReceiver::togglePower() {
    setPower(!state_.power);
}

void SimulatedReceiver::setVolume(double volume) {
    commandLog_.push_back("volume:" + std::to_string(volume));
    const double clamped = clampVolume(volume);
    if (clamped == state_.volume) {
        return;
    }
    state_.volume = clamped;
    emit(receiver::VolumeChangedEvent{clamped});
}

void SimulatedReceiver::changeVolume(double delta) {
    setVolume(state_.volume + delta);
}

void SimulatedReceiver::toggleMute() {
    commandLog_.push_back("mute:toggle");
    state_.muted = !state_.muted;
    emit(receiver::MuteChangedEvent{state_.muted});
}

void SimulatedReceiver::selectSource(const std::string& source) {
    commandLog_.push_back("source:" + source);
    state_.source = source;
}

void SimulatedReceiver::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    status_ = "Connection to " + name_ + " closed.";
    spdlog::debug("Simulated receiver {} closed", host_);
    emit(receiver::ClosedEvent{});
}

SimulatedConnectionFactory::SimulatedConnectionFactory(boost::asio::io_context& ioContext)
    : ioContext_(ioContext) {}

void SimulatedConnectionFactory::create(const std::string& host, const std::string& nameHint, CreateHandler handler) {
    ++createCounts_[host];
    if (hold_) {
        held_.push_back(HeldCompletion{host, nameHint, std::move(handler)});
        return;
    }
    boost::asio::post(ioContext_, [this, host, nameHint, handler = std::move(handler)]() mutable {
        complete(host, nameHint, std::move(handler));
    });
}

void SimulatedConnectionFactory::complete(const std::string& host, const std::string& nameHint, CreateHandler handler) {
    if (failing_.count(host) > 0) {
        handler(nullptr, "receiver at " + host + " refused the connection");
        return;
    }

    std::string name = nameHint;
    if (auto it = names_.find(host); it != names_.end()) {
        name = it->second;
    }
    auto connection = std::make_unique<SimulatedReceiver>(ioContext_, host, name);
    receivers_[host] = connection.get();
    aliveTokens_[host] = connection->lifetime();
    handler(std::move(connection), {});
}

void SimulatedConnectionFactory::setFailing(const std::string& host, bool failing) {
    if (failing) {
        failing_.insert(host);
    } else {
        failing_.erase(host);
    }
}

void SimulatedConnectionFactory::setReceiverName(const std::string& host, std::string name) {
    names_[host] = std::move(name);
}

void SimulatedConnectionFactory::holdCompletions(bool hold) {
    hold_ = hold;
}

void SimulatedConnectionFactory::releaseCompletions() {
    auto held = std::move(held_);
    held_.clear();
    for (auto& completion : held) {
        boost::asio::post(ioContext_, [this, completion = std::move(completion)]() mutable {
            complete(completion.host, completion.nameHint, std::move(completion.handler));
        });
    }
}

std::size_t SimulatedConnectionFactory::createCount(const std::string& host) const {
    auto it = createCounts_.find(host);
    return it == createCounts_.end() ? 0 : it->second;
}

SimulatedReceiver* SimulatedConnectionFactory::receiver(const std::string& host) const {
    auto it = receivers_.find(host);
    if (it == receivers_.end()) {
        return nullptr;
    }
    auto alive = aliveTokens_.find(host);
    if (alive == aliveTokens_.end() || alive->second.expired()) {
        return nullptr;
    }
    return it->second;
}

}  // namespace avrdeck::sim
