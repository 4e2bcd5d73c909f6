#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace avrdeck::receiver {

struct ReceiverState {
    bool power{false};
    double volume{0.0};
    bool muted{false};
    std::string source;
};

struct StatusEvent {};
struct ConnectedEvent {};
struct ClosedEvent {};

struct PowerChangedEvent {
    bool power{false};
};

struct VolumeChangedEvent {
    double volume{0.0};
};

struct MuteChangedEvent {
    bool muted{false};
};

using ReceiverEvent = std::variant<StatusEvent,
                                   ConnectedEvent,
                                   ClosedEvent,
                                   PowerChangedEvent,
                                   VolumeChangedEvent,
                                   MuteChangedEvent>;

/// Wire name of the event ("status", "connected", "closed", "powerChanged", ...).
std::string_view eventName(const ReceiverEvent& event);

/// True for events after which the connection's status text should be re-read.
bool isStatusBearing(const ReceiverEvent& event);

/**
 * @brief One live session with a physical receiver.
 *
 * Implementations deliver every event through the single handler installed with
 * setEventHandler(), always on the scheduler that owns the core components.
 */
class ReceiverConnection {
public:
    using EventHandler = std::function<void(const ReceiverEvent&)>;

    virtual ~ReceiverConnection() = default;

    virtual const std::string& host() const = 0;
    virtual std::string displayName() const = 0;
    virtual std::string statusText() const = 0;
    virtual ReceiverState state() const = 0;

    virtual void setEventHandler(EventHandler handler) = 0;

    virtual void setPower(bool on) = 0;
    virtual void togglePower() = 0;
    virtual void setVolume(double volume) = 0;
    virtual void changeVolume(double delta) = 0;
    virtual void toggleMute() = 0;
    virtual void selectSource(const std::string& source) = 0;

    virtual void close() = 0;
};

class ConnectionFactory {
public:
    /// @p connection is null when construction failed; @p error then describes why.
    using CreateHandler = std::function<void(std::unique_ptr<ReceiverConnection> connection,
                                             const std::string& error)>;

    virtual ~ConnectionFactory() = default;

    virtual void create(const std::string& host,
                        const std::string& nameHint,
                        CreateHandler handler) = 0;
};

}  // namespace avrdeck::receiver
