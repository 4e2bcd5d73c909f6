#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace avrdeck::discovery {

/**
 * @brief Lifecycle of a discovery session.
 *
 * Created -> Searching, Searching -> Stopped, Stopped -> Searching and
 * any state -> Destroyed. Destroyed is terminal: the session must be replaced.
 */
enum class SessionState {
    Created,
    Searching,
    Stopped,
    Destroyed,
};

std::string_view toString(SessionState state);
bool isTransitionAllowed(SessionState from, SessionState to);

class DiscoverySession {
public:
    using AddressHandler = std::function<void(const std::string& address)>;

    virtual ~DiscoverySession() = default;

    virtual void setAddressHandler(AddressHandler handler) = 0;
    virtual void startSearching() = 0;
    virtual void stopSearching() = 0;
    virtual SessionState state() const = 0;
};

class DiscoveryTransport {
public:
    using NameHandler = std::function<void(std::optional<std::string> name)>;

    virtual ~DiscoveryTransport() = default;

    virtual std::unique_ptr<DiscoverySession> createSession() = 0;

    /// Completes with std::nullopt when the device does not report a usable name.
    virtual void resolveDisplayName(const std::string& address, NameHandler handler) = 0;
};

}  // namespace avrdeck::discovery
