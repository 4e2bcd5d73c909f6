#include "avrdeck/core/LifecycleController.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace avrdeck::core {

namespace {

using json = nlohmann::json;

constexpr const char* kUserChoseReceiver = "userChoseReceiver";
constexpr const char* kGetDiscoveredReceivers = "getDiscoveredReceivers";

}  // namespace

json LifecycleController::Snapshot::toJson() const {
    json root;

    json bindingsJson = json::array();
    for (const auto& binding : bindings) {
        bindingsJson.push_back({{"control", binding.controlId}, {"host", binding.host}});
    }
    root["bindings"] = std::move(bindingsJson);

    json connectionsJson = json::array();
    for (const auto& connection : connections) {
        connectionsJson.push_back({
            {"host", connection.host},
            {"name", connection.displayName},
            {"status", connection.statusText},
            {"references", connection.references},
            {"teardown_scheduled", connection.teardownScheduled},
        });
    }
    root["connections"] = std::move(connectionsJson);

    json discoveredJson = json::array();
    for (const auto& receiver : discovered) {
        discoveredJson.push_back({
            {"name", receiver.name},
            {"address", receiver.address},
            {"name_resolved", receiver.nameResolved},
        });
    }
    root["discovered"] = std::move(discoveredJson);
    root["discovery_state"] = std::string(toString(discoveryState));
    return root;
}

LifecycleController::LifecycleController(boost::asio::io_context& ioContext,
                                         surface::ControlSurface& surface,
                                         ConnectionRegistry& registry,
                                         AssociationTable& associations,
                                         DiscoveryCoordinator& discovery,
                                         common::PluginConfig config)
    : surface_(surface),
      registry_(registry),
      associations_(associations),
      discovery_(discovery),
      config_(std::move(config)),
      sequencer_(ioContext) {
    registry_.setIdleTimeout(config_.idleConnectionTimeout);
    registry_.setEventSink([this](const std::string& host, const receiver::ReceiverEvent& event) {
        handleReceiverEvent(host, event);
    });
    discovery_.setListChangedHandler([this] {
        if (auto focused = surface_.focusedControl()) {
            sendDiscoveredReceivers(*focused);
        }
    });
}

LifecycleController::~LifecycleController() {
    registry_.setEventSink({});
    discovery_.setListChangedHandler({});
}

void LifecycleController::onWillAppear(const ControlId& controlId, const surface::ControlSettings& settings) {
    spdlog::debug("onWillAppear for action id: {}", controlId);
    if (settings.host.empty()) {
        return;
    }
    bindControl(controlId, settings, BindOrigin::Appearance);
}

void LifecycleController::onWillDisappear(const ControlId& controlId) {
    spdlog::debug("onWillDisappear for action id: {}", controlId);
    sequencer_.enqueue(controlId, [this, controlId](ControlSequencer::Done done) {
        dissociate(controlId);
        done();
    });
}

void LifecycleController::onPropertyInspectorDidAppear(const ControlId& controlId) {
    discovery_.startSearching();

    auto host = associations_.hostOf(controlId);
    if (!host) {
        return;
    }
    if (auto* connection = registry_.find(*host)) {
        setStatusMessage(controlId, connection->statusText());
    }
}

void LifecycleController::onPropertyInspectorDidDisappear(const ControlId& controlId) {
    discovery_.stopSearching();
    setStatusMessage(controlId, "");
}

void LifecycleController::onSendToPlugin(const ControlId& controlId, const json& payload) {
    if (!payload.is_object()) {
        spdlog::warn("Ignoring non-object message from inspector of {}", controlId);
        return;
    }

    const auto eventIt = payload.find("event");
    const std::string event = eventIt != payload.end() && eventIt->is_string() ? eventIt->get<std::string>() : "";

    if (event == kUserChoseReceiver) {
        std::optional<surface::ControlSettings> settings;
        if (auto it = payload.find("settings"); it != payload.end() && it->is_object()) {
            try {
                settings = surface::ControlSettings::fromJson(*it);
            } catch (const std::exception& ex) {
                spdlog::warn("Invalid settings in {} from {}: {}", event, controlId, ex.what());
                return;
            }
        }
        bindControl(controlId, std::move(settings), BindOrigin::UserChoice);
    } else if (event == kGetDiscoveredReceivers) {
        sendDiscoveredReceivers(controlId);
    } else {
        spdlog::warn("Received unknown event: {}", event);
    }
}

bool LifecycleController::sendCommand(const ControlId& controlId, const receiver::ReceiverCommand& command) {
    auto* connection = connectionFor(controlId);
    if (!connection) {
        spdlog::warn("Command for {} dropped: no receiver bound", controlId);
        return false;
    }
    receiver::applyCommand(*connection, command);
    return true;
}

receiver::ReceiverConnection* LifecycleController::connectionFor(const ControlId& controlId) const {
    auto host = associations_.hostOf(controlId);
    if (!host) {
        return nullptr;
    }
    return registry_.find(*host);
}

void LifecycleController::setReceiverEventHandler(ReceiverEventHandler handler) {
    receiverEventHandler_ = std::move(handler);
}

void LifecycleController::setStatusMessage(const ControlId& controlId, const std::string& text) {
    surface_.getSettings(controlId, [this, controlId, text](surface::ControlSettings settings) {
        settings.statusMessage = text;
        surface_.setSettings(controlId, settings);
    });
}

LifecycleController::Snapshot LifecycleController::snapshot() const {
    Snapshot snapshot;
    snapshot.bindings = associations_.snapshot();
    snapshot.connections = registry_.snapshot();
    snapshot.discovered = discovery_.discovered();
    snapshot.discoveryState = discovery_.state();
    return snapshot;
}

void LifecycleController::bindControl(const ControlId& controlId,
                                      std::optional<surface::ControlSettings> settings,
                                      BindOrigin origin) {
    sequencer_.enqueue(controlId, [this, controlId, settings = std::move(settings), origin](ControlSequencer::Done done) {
        if (settings) {
            applyBinding(controlId, *settings, origin, std::move(done));
            return;
        }
        surface_.getSettings(controlId, [this, controlId, origin, done = std::move(done)](surface::ControlSettings stored) {
            applyBinding(controlId, stored, origin, done);
        });
    });
}

void LifecycleController::applyBinding(const ControlId& controlId,
                                       const surface::ControlSettings& settings,
                                       BindOrigin origin,
                                       ControlSequencer::Done done) {
    if (settings.host.empty()) {
        if (origin == BindOrigin::UserChoice) {
            setStatusMessage(controlId, kNoReceiverSelected);
        }
        done();
        return;
    }

    const std::string host = settings.host;
    if (associations_.hostOf(controlId) == host) {
        if (auto* connection = registry_.find(host)) {
            spdlog::debug("{} already bound to {}", controlId, host);
            if (origin == BindOrigin::UserChoice) {
                setStatusMessage(controlId, connection->statusText());
            }
            done();
            return;
        }
    }

    registry_.getOrCreate(host, settings.name, [this, controlId, host, done](receiver::ReceiverConnection* connection) {
        if (!connection) {
            dissociate(controlId);
            setStatusMessage(controlId, "Unable to connect to " + host + ".");
            done();
            return;
        }
        associate(controlId, host);
        setStatusMessage(controlId, connection->statusText());
        done();
    });
}

void LifecycleController::associate(const ControlId& controlId, const std::string& host) {
    auto previous = associations_.bind(controlId, host);
    if (previous && *previous == host) {
        return;
    }
    registry_.acquire(host);
    if (previous) {
        registry_.release(*previous);
        spdlog::debug("{} rebound from {} to {}", controlId, *previous, host);
    } else {
        spdlog::debug("{} bound to {}", controlId, host);
    }
}

void LifecycleController::dissociate(const ControlId& controlId) {
    if (auto previous = associations_.unbind(controlId)) {
        registry_.release(*previous);
        spdlog::debug("{} unbound from {}", controlId, *previous);
    }
}

void LifecycleController::sendDiscoveredReceivers(const ControlId& controlId) {
    const auto items = discovery_.getDiscoveredList();
    if (items.empty()) {
        return;
    }

    json list = json::array();
    for (const auto& item : items) {
        list.push_back({{"label", item.label}, {"value", item.value}});
    }
    surface_.sendToInspector(controlId, json{{"event", kGetDiscoveredReceivers}, {"items", std::move(list)}});
}

void LifecycleController::handleReceiverEvent(const std::string& host, const receiver::ReceiverEvent& event) {
    auto* connection = registry_.find(host);
    if (!connection) {
        return;
    }

    if (receiverEventHandler_) {
        receiverEventHandler_(host, event, connection->state());
    }

    if (!receiver::isStatusBearing(event)) {
        spdlog::debug("Receiver {} {}", host, receiver::eventName(event));
        return;
    }

    const auto text = connection->statusText();
    switch (config_.statusScope) {
    case common::StatusScope::BoundControls:
        for (const auto& controlId : associations_.controlsBoundTo(host)) {
            setStatusMessage(controlId, text);
        }
        break;
    case common::StatusScope::FocusedInspector:
        if (auto focused = surface_.focusedControl()) {
            setStatusMessage(*focused, text);
        }
        break;
    }
}

}  // namespace avrdeck::core
