#include "avrdeck/receiver/ReceiverConnection.h"

#include <type_traits>

namespace avrdeck::receiver {

std::string_view eventName(const ReceiverEvent& event) {
    return std::visit([](const auto& value) -> std::string_view {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, StatusEvent>) {
            return "status";
        } else if constexpr (std::is_same_v<T, ConnectedEvent>) {
            return "connected";
        } else if constexpr (std::is_same_v<T, ClosedEvent>) {
            return "closed";
        } else if constexpr (std::is_same_v<T, PowerChangedEvent>) {
            return "powerChanged";
        } else if constexpr (std::is_same_v<T, VolumeChangedEvent>) {
            return "volumeChanged";
        } else {
            return "muteChanged";
        }
    }, event);
}

bool isStatusBearing(const ReceiverEvent& event) {
    return std::holds_alternative<StatusEvent>(event) ||
           std::holds_alternative<ConnectedEvent>(event) ||
           std::holds_alternative<ClosedEvent>(event);
}

}  // namespace avrdeck::receiver
