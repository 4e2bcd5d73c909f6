#pragma once

#include "avrdeck/surface/ControlSurface.h"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace avrdeck::sim {

/// Control surface whose settings store lives in memory; reads complete asynchronously.
class InMemorySurface : public surface::ControlSurface {
public:
    struct InspectorMessage {
        surface::ControlId controlId;
        nlohmann::json payload;
    };

    explicit InMemorySurface(boost::asio::io_context& ioContext);

    void getSettings(const surface::ControlId& controlId, SettingsHandler handler) override;
    void setSettings(const surface::ControlId& controlId, const surface::ControlSettings& settings) override;
    std::optional<surface::ControlId> focusedControl() const override { return focused_; }
    void sendToInspector(const surface::ControlId& controlId, const nlohmann::json& payload) override;

    void setFocusedControl(std::optional<surface::ControlId> controlId);

    /// Stored settings; default-constructed when the control has none.
    surface::ControlSettings settings(const surface::ControlId& controlId) const;
    std::string statusMessage(const surface::ControlId& controlId) const;

    const std::vector<InspectorMessage>& inspectorMessages() const noexcept { return messages_; }
    void clearInspectorMessages() { messages_.clear(); }
    std::size_t settingsWrites(const surface::ControlId& controlId) const;

    nlohmann::json toJson() const;

private:
    boost::asio::io_context& ioContext_;
    std::map<surface::ControlId, surface::ControlSettings> settings_;
    std::map<surface::ControlId, std::size_t> writes_;
    std::optional<surface::ControlId> focused_;
    std::vector<InspectorMessage> messages_;
};

}  // namespace avrdeck::sim
