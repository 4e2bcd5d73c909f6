#include "avrdeck/sim/ScenarioRunner.h"

#include "avrdeck/receiver/ReceiverCommand.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace avrdeck::sim {

namespace {

using json = nlohmann::json;

std::string requireString(const json& step, const char* key) {
    auto it = step.find(key);
    if (it == step.end() || !it->is_string()) {
        throw std::runtime_error("Scenario step '" + step.value("op", std::string{"?"}) +
                                 "' requires string field '" + key + "'");
    }
    return it->get<std::string>();
}

}  // namespace

ScenarioRunner::ScenarioRunner(common::PluginConfig config)
    : factory_(ioContext_),
      transport_(ioContext_),
      surface_(ioContext_),
      registry_(ioContext_, factory_),
      associations_(),
      discovery_(ioContext_, transport_, config.placeholderLabel),
      controller_(ioContext_, surface_, registry_, associations_, discovery_, std::move(config)) {
    controller_.setReceiverEventHandler(
        [](const std::string& host, const receiver::ReceiverEvent& event, const receiver::ReceiverState& state) {
            spdlog::debug("{} {}: power={} volume={} muted={}", host, receiver::eventName(event),
                          state.power, state.volume, state.muted);
        });
}

json ScenarioRunner::readScenarioFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open scenario: " + path.string());
    }
    json root;
    try {
        input >> root;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Failed to parse scenario " + path.string() + ": " + ex.what());
    }
    return root;
}

void ScenarioRunner::load(const json& scenario) {
    if (!scenario.is_object()) {
        throw std::runtime_error("Scenario must contain an object at the root");
    }

    if (auto it = scenario.find("receivers"); it != scenario.end()) {
        if (!it->is_object()) {
            throw std::runtime_error("Scenario 'receivers' must be an object keyed by host");
        }
        for (const auto& [host, entry] : it->items()) {
            if (entry.contains("name")) {
                factory_.setReceiverName(host, entry.at("name").get<std::string>());
            }
            factory_.setFailing(host, entry.value("fail", false));
        }
    }

    if (auto it = scenario.find("names"); it != scenario.end()) {
        if (!it->is_object()) {
            throw std::runtime_error("Scenario 'names' must be an object keyed by address");
        }
        for (const auto& [address, name] : it->items()) {
            if (name.is_null()) {
                transport_.setDisplayName(address, std::nullopt);
            } else {
                transport_.setDisplayName(address, name.get<std::string>());
            }
        }
    }

    auto stepsIt = scenario.find("steps");
    if (stepsIt == scenario.end() || !stepsIt->is_array()) {
        throw std::runtime_error("Scenario must contain a 'steps' array");
    }
    steps_.assign(stepsIt->begin(), stepsIt->end());
}

json ScenarioRunner::run() {
    for (const auto& step : steps_) {
        runStep(step);
    }
    return report();
}

void ScenarioRunner::runStep(const json& step) {
    if (!step.is_object()) {
        throw std::runtime_error("Scenario steps must be objects");
    }
    const auto op = requireString(step, "op");
    spdlog::debug("Scenario step {}: {}", stepsRun_, op);

    if (op == "willAppear") {
        const auto settings = surface::ControlSettings::fromJson(step.value("settings", json::object()));
        const auto control = requireString(step, "control");
        surface_.setSettings(control, settings);
        controller_.onWillAppear(control, settings);
    } else if (op == "willDisappear") {
        controller_.onWillDisappear(requireString(step, "control"));
    } else if (op == "inspectorDidAppear") {
        const auto control = requireString(step, "control");
        surface_.setFocusedControl(control);
        controller_.onPropertyInspectorDidAppear(control);
    } else if (op == "inspectorDidDisappear") {
        controller_.onPropertyInspectorDidDisappear(requireString(step, "control"));
        surface_.setFocusedControl(std::nullopt);
    } else if (op == "sendToPlugin") {
        const auto control = requireString(step, "control");
        const auto payload = step.value("payload", json::object());
        if (auto settings = payload.find("settings"); settings != payload.end() && settings->is_object()) {
            surface_.setSettings(control, surface::ControlSettings::fromJson(*settings));
        }
        controller_.onSendToPlugin(control, payload);
    } else if (op == "announce") {
        if (!transport_.announce(requireString(step, "address"))) {
            spdlog::warn("announce ignored: no discovery session");
        }
    } else if (op == "destroyDiscovery") {
        transport_.destroyActiveSession();
    } else if (op == "receiverStatus") {
        requireReceiver(requireString(step, "host")).setStatus(requireString(step, "status"));
    } else if (op == "receiverConnected") {
        requireReceiver(requireString(step, "host")).markConnected();
    } else if (op == "receiverClosed") {
        requireReceiver(requireString(step, "host")).markClosed();
    } else if (op == "receiverPower") {
        requireReceiver(requireString(step, "host")).setPower(step.value("on", true));
    } else if (op == "command") {
        const auto control = requireString(step, "control");
        controller_.sendCommand(control, receiver::commandFromJson(step.value("command", json::object())));
    } else if (op == "wait") {
        const auto ms = step.value("ms", 0);
        ioContext_.restart();
        ioContext_.run_for(std::chrono::milliseconds(ms));
    } else {
        throw std::runtime_error("Unknown scenario op '" + op + "'");
    }

    drain();
    ++stepsRun_;
}

json ScenarioRunner::report() const {
    json root = surface_.toJson();
    root["state"] = controller_.snapshot().toJson();
    root["steps_run"] = stepsRun_;
    return root;
}

void ScenarioRunner::drain() {
    ioContext_.restart();
    ioContext_.poll();
}

SimulatedReceiver& ScenarioRunner::requireReceiver(const std::string& host) {
    auto* receiver = factory_.receiver(host);
    if (!receiver) {
        throw std::runtime_error("No live simulated receiver for " + host);
    }
    return *receiver;
}

}  // namespace avrdeck::sim
