#include "avrdeck/sim/InMemorySurface.h"

#include <boost/asio/post.hpp>

#include <utility>

namespace avrdeck::sim {

using json = nlohmann::json;

InMemorySurface::InMemorySurface(boost::asio::io_context& ioContext)
    : ioContext_(ioContext) {}

void InMemorySurface::getSettings(const surface::ControlId& controlId, SettingsHandler handler) {
    boost::asio::post(ioContext_, [this, controlId, handler = std::move(handler)] {
        handler(settings(controlId));
    });
}

void InMemorySurface::setSettings(const surface::ControlId& controlId, const surface::ControlSettings& settings) {
    settings_[controlId] = settings;
    ++writes_[controlId];
}

void InMemorySurface::sendToInspector(const surface::ControlId& controlId, const json& payload) {
    messages_.push_back(InspectorMessage{controlId, payload});
}

void InMemorySurface::setFocusedControl(std::optional<surface::ControlId> controlId) {
    focused_ = std::move(controlId);
}

surface::ControlSettings InMemorySurface::settings(const surface::ControlId& controlId) const {
    auto it = settings_.find(controlId);
    if (it == settings_.end()) {
        return {};
    }
    return it->second;
}

std::string InMemorySurface::statusMessage(const surface::ControlId& controlId) const {
    return settings(controlId).statusMessage;
}

std::size_t InMemorySurface::settingsWrites(const surface::ControlId& controlId) const {
    auto it = writes_.find(controlId);
    return it == writes_.end() ? 0 : it->second;
}

json InMemorySurface::toJson() const {
    json controls = json::object();
    for (const auto& [controlId, stored] : settings_) {
        controls[controlId] = stored.toJson();
    }

    json messages = json::array();
    for (const auto& message : messages_) {
        messages.push_back({{"control", message.controlId}, {"payload", message.payload}});
    }

    return json{{"controls", std::move(controls)}, {"inspector_messages", std::move(messages)}};
}

}  // namespace avrdeck::sim
