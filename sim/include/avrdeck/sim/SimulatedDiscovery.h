#pragma once

#include "avrdeck/discovery/DiscoverySession.h"

#include <boost/asio/io_context.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace avrdeck::sim {

class SimulatedDiscoverySession : public discovery::DiscoverySession {
public:
    explicit SimulatedDiscoverySession(boost::asio::io_context& ioContext);
    ~SimulatedDiscoverySession() override;

    void setAddressHandler(AddressHandler handler) override;
    void startSearching() override;
    void stopSearching() override;
    discovery::SessionState state() const override { return state_; }

    /// Deliver a device announcement on the next turn of the io_context.
    void announce(const std::string& address);
    void destroy();

    std::size_t startCount() const noexcept { return startCount_; }
    std::weak_ptr<bool> lifetime() const { return alive_; }

private:
    bool transition(discovery::SessionState next);

    boost::asio::io_context& ioContext_;
    discovery::SessionState state_{discovery::SessionState::Created};
    AddressHandler handler_;
    std::size_t startCount_{0};
    std::shared_ptr<bool> alive_;
};

/**
 * @brief DiscoveryTransport backed by a table of address -> display name.
 *
 * Addresses missing from the table resolve to std::nullopt. With
 * holdResolutions(true) name lookups are parked until releaseResolutions().
 */
class SimulatedDiscoveryTransport : public discovery::DiscoveryTransport {
public:
    explicit SimulatedDiscoveryTransport(boost::asio::io_context& ioContext);

    std::unique_ptr<discovery::DiscoverySession> createSession() override;
    void resolveDisplayName(const std::string& address, NameHandler handler) override;

    void setDisplayName(const std::string& address, std::optional<std::string> name);
    void holdResolutions(bool hold);
    void releaseResolutions();

    /// Announce on the live session; returns false when there is none.
    bool announce(const std::string& address);
    bool destroyActiveSession();

    SimulatedDiscoverySession* activeSession() const;
    std::size_t sessionsCreated() const noexcept { return sessionsCreated_; }
    std::size_t resolveCount(const std::string& address) const;

private:
    void complete(const std::string& address, NameHandler handler);

    struct HeldResolution {
        std::string address;
        NameHandler handler;
    };

    boost::asio::io_context& ioContext_;
    std::map<std::string, std::optional<std::string>> names_;
    std::map<std::string, std::size_t> resolveCounts_;
    SimulatedDiscoverySession* active_{nullptr};
    std::weak_ptr<bool> activeAlive_;
    std::size_t sessionsCreated_{0};
    bool hold_{false};
    std::vector<HeldResolution> held_;
};

}  // namespace avrdeck::sim
