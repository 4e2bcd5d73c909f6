#pragma once

#include "avrdeck/common/PluginConfig.h"
#include "avrdeck/core/AssociationTable.h"
#include "avrdeck/core/ConnectionRegistry.h"
#include "avrdeck/core/DiscoveryCoordinator.h"
#include "avrdeck/core/LifecycleController.h"
#include "avrdeck/sim/InMemorySurface.h"
#include "avrdeck/sim/SimulatedDiscovery.h"
#include "avrdeck/sim/SimulatedReceiver.h"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace avrdeck::sim {

/**
 * @brief Replays a JSON scenario of surface, discovery and receiver events.
 *
 * Scenario layout:
 * @code
 * {
 *   "receivers": { "192.168.1.50": { "name": "Den", "fail": false } },
 *   "names":     { "192.168.1.77": "Living Room" },
 *   "steps": [
 *     { "op": "willAppear", "control": "A", "settings": { "host": "192.168.1.50" } },
 *     { "op": "inspectorDidAppear", "control": "A" },
 *     { "op": "announce", "address": "192.168.1.77" },
 *     { "op": "sendToPlugin", "control": "A", "payload": { "event": "getDiscoveredReceivers" } }
 *   ]
 * }
 * @endcode
 * The io_context is drained after every step.
 */
class ScenarioRunner {
public:
    explicit ScenarioRunner(common::PluginConfig config = {});

    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    void load(const nlohmann::json& scenario);
    static nlohmann::json readScenarioFile(const std::filesystem::path& path);

    /// Run every loaded step and return the final report.
    nlohmann::json run();
    void runStep(const nlohmann::json& step);

    nlohmann::json report() const;

    core::LifecycleController& controller() noexcept { return controller_; }
    InMemorySurface& surface() noexcept { return surface_; }
    SimulatedConnectionFactory& factory() noexcept { return factory_; }
    SimulatedDiscoveryTransport& transport() noexcept { return transport_; }

private:
    void drain();
    SimulatedReceiver& requireReceiver(const std::string& host);

    boost::asio::io_context ioContext_;
    SimulatedConnectionFactory factory_;
    SimulatedDiscoveryTransport transport_;
    InMemorySurface surface_;
    core::ConnectionRegistry registry_;
    core::AssociationTable associations_;
    core::DiscoveryCoordinator discovery_;
    core::LifecycleController controller_;
    std::vector<nlohmann::json> steps_;
    std::size_t stepsRun_{0};
};

}  // namespace avrdeck::sim
