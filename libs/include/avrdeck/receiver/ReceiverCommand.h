#pragma once

#include "avrdeck/receiver/ReceiverConnection.h"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace avrdeck::receiver {

struct SetPowerCommand {
    bool on{true};
};

struct TogglePowerCommand {};

struct SetVolumeCommand {
    double volume{0.0};
};

struct ChangeVolumeCommand {
    double delta{0.0};
};

struct ToggleMuteCommand {};

struct SelectSourceCommand {
    std::string source;
};

using ReceiverCommand = std::variant<SetPowerCommand,
                                     TogglePowerCommand,
                                     SetVolumeCommand,
                                     ChangeVolumeCommand,
                                     ToggleMuteCommand,
                                     SelectSourceCommand>;

void applyCommand(ReceiverConnection& connection, const ReceiverCommand& command);

/**
 * @brief Parse {"type": "togglePower"}, {"type": "changeVolume", "delta": -0.5}, ...
 * @throws std::runtime_error on unknown types or missing arguments.
 */
ReceiverCommand commandFromJson(const nlohmann::json& value);

}  // namespace avrdeck::receiver
