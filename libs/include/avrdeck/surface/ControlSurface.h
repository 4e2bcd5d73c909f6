#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace avrdeck::surface {

using ControlId = std::string;

/**
 * @brief Persisted per-control settings as stored by the control surface.
 *
 * Only the keys this plugin owns are typed. Everything else the surface stores
 * for the control is carried in @ref extra so a read-modify-write never drops it.
 */
struct ControlSettings {
    std::string host;
    std::string name;
    std::string statusMessage;
    nlohmann::json extra = nlohmann::json::object();

    static ControlSettings fromJson(const nlohmann::json& value);
    nlohmann::json toJson() const;
};

/**
 * @brief Port to the control-surface framework (settings store + inspector channel).
 *
 * getSettings() completes asynchronously on the scheduler thread.
 */
class ControlSurface {
public:
    using SettingsHandler = std::function<void(ControlSettings)>;

    virtual ~ControlSurface() = default;

    virtual void getSettings(const ControlId& controlId, SettingsHandler handler) = 0;
    virtual void setSettings(const ControlId& controlId, const ControlSettings& settings) = 0;

    /// Control whose inspector is currently open, if any.
    virtual std::optional<ControlId> focusedControl() const = 0;

    virtual void sendToInspector(const ControlId& controlId, const nlohmann::json& payload) = 0;
};

}  // namespace avrdeck::surface
