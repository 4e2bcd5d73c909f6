#pragma once

#include "avrdeck/common/PluginConfig.h"
#include "avrdeck/core/AssociationTable.h"
#include "avrdeck/core/ConnectionRegistry.h"
#include "avrdeck/core/ControlSequencer.h"
#include "avrdeck/core/DiscoveryCoordinator.h"
#include "avrdeck/receiver/ReceiverCommand.h"
#include "avrdeck/receiver/ReceiverConnection.h"
#include "avrdeck/surface/ControlSurface.h"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace avrdeck::core {

/**
 * @brief Glues control-surface lifecycle events to receiver connections and discovery.
 *
 * The stores are owned by the caller and injected so several independent
 * controllers can coexist (tests). Every entry point must run on the thread
 * driving @p ioContext; binds and unbinds for one control are applied in the
 * order they were requested.
 */
class LifecycleController {
public:
    using ControlId = surface::ControlId;
    using ReceiverEventHandler = std::function<void(const std::string& host,
                                                    const receiver::ReceiverEvent& event,
                                                    const receiver::ReceiverState& state)>;

    static constexpr const char* kNoReceiverSelected = "No receiver selected.";

    struct Snapshot {
        std::vector<AssociationTable::Association> bindings;
        std::vector<ConnectionRegistry::ConnectionInfo> connections;
        std::vector<DiscoveredReceiver> discovered;
        CoordinatorState discoveryState{CoordinatorState::Idle};

        nlohmann::json toJson() const;
    };

    LifecycleController(boost::asio::io_context& ioContext,
                        surface::ControlSurface& surface,
                        ConnectionRegistry& registry,
                        AssociationTable& associations,
                        DiscoveryCoordinator& discovery,
                        common::PluginConfig config = {});
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    void onWillAppear(const ControlId& controlId, const surface::ControlSettings& settings);
    void onWillDisappear(const ControlId& controlId);
    void onPropertyInspectorDidAppear(const ControlId& controlId);
    void onPropertyInspectorDidDisappear(const ControlId& controlId);

    /// Messages from the inspector: {"event": "userChoseReceiver" | "getDiscoveredReceivers", ...}.
    void onSendToPlugin(const ControlId& controlId, const nlohmann::json& payload);

    /// Route a command to the control's receiver. False if the control is not bound.
    bool sendCommand(const ControlId& controlId, const receiver::ReceiverCommand& command);

    receiver::ReceiverConnection* connectionFor(const ControlId& controlId) const;

    /// Observe every receiver event (power/volume/mute included) for display refresh.
    void setReceiverEventHandler(ReceiverEventHandler handler);

    void setStatusMessage(const ControlId& controlId, const std::string& text);

    Snapshot snapshot() const;
    const common::PluginConfig& config() const noexcept { return config_; }

private:
    enum class BindOrigin {
        Appearance,
        UserChoice,
    };

    void bindControl(const ControlId& controlId,
                     std::optional<surface::ControlSettings> settings,
                     BindOrigin origin);
    void applyBinding(const ControlId& controlId,
                      const surface::ControlSettings& settings,
                      BindOrigin origin,
                      ControlSequencer::Done done);
    void associate(const ControlId& controlId, const std::string& host);
    void dissociate(const ControlId& controlId);

    void sendDiscoveredReceivers(const ControlId& controlId);
    void handleReceiverEvent(const std::string& host, const receiver::ReceiverEvent& event);

    surface::ControlSurface& surface_;
    ConnectionRegistry& registry_;
    AssociationTable& associations_;
    DiscoveryCoordinator& discovery_;
    common::PluginConfig config_;
    ControlSequencer sequencer_;
    ReceiverEventHandler receiverEventHandler_;
};

}  // namespace avrdeck::core
