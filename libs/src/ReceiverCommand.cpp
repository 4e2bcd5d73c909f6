#include "avrdeck/receiver/ReceiverCommand.h"

#include <stdexcept>
#include <string>
#include <type_traits>

namespace avrdeck::receiver {

namespace {

using json = nlohmann::json;

template <typename T>
T requireField(const json& value, const char* key, const std::string& type) {
    auto it = value.find(key);
    if (it == value.end()) {
        throw std::runtime_error("Command '" + type + "' requires field '" + key + "'");
    }

    bool matches = false;
    const char* expected = "";
    if constexpr (std::is_same_v<T, bool>) {
        matches = it->is_boolean();
        expected = "a boolean";
    } else if constexpr (std::is_same_v<T, double>) {
        matches = it->is_number();
        expected = "a number";
    } else {
        static_assert(std::is_same_v<T, std::string>, "unsupported command field type");
        matches = it->is_string();
        expected = "a string";
    }
    if (!matches) {
        throw std::runtime_error("Command '" + type + "' field '" + key + "' must be " + expected);
    }
    return it->get<T>();
}

}  // namespace

void applyCommand(ReceiverConnection& connection, const ReceiverCommand& command) {
    std::visit([&connection](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, SetPowerCommand>) {
            connection.setPower(cmd.on);
        } else if constexpr (std::is_same_v<T, TogglePowerCommand>) {
            connection.togglePower();
        } else if constexpr (std::is_same_v<T, SetVolumeCommand>) {
            connection.setVolume(cmd.volume);
        } else if constexpr (std::is_same_v<T, ChangeVolumeCommand>) {
            connection.changeVolume(cmd.delta);
        } else if constexpr (std::is_same_v<T, ToggleMuteCommand>) {
            connection.toggleMute();
        } else {
            connection.selectSource(cmd.source);
        }
    }, command);
}

ReceiverCommand commandFromJson(const json& value) {
    if (!value.is_object()) {
        throw std::runtime_error("Receiver command must be a JSON object");
    }
    const auto type = value.value("type", std::string{});
    if (type == "setPower") {
        return SetPowerCommand{requireField<bool>(value, "on", type)};
    }
    if (type == "togglePower") {
        return TogglePowerCommand{};
    }
    if (type == "setVolume") {
        return SetVolumeCommand{requireField<double>(value, "volume", type)};
    }
    if (type == "changeVolume") {
        return ChangeVolumeCommand{requireField<double>(value, "delta", type)};
    }
    if (type == "toggleMute") {
        return ToggleMuteCommand{};
    }
    if (type == "selectSource") {
        return SelectSourceCommand{requireField<std::string>(value, "source", type)};
    }
    throw std::runtime_error("Unknown receiver command type '" + type + "'");
}

}  // namespace avrdeck::receiver
