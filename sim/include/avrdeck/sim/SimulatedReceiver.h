#pragma once

#include "avrdeck/receiver/ReceiverConnection.h"

#include <boost/asio/io_context.hpp>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace avrdeck::sim {

/**
 * @brief In-process receiver that behaves like a networked one from the core's view.
 *
 * Commands update the state and emit the matching change event on the next turn
 * of the io_context. Status transitions are driven by the test or scenario.
 */
class SimulatedReceiver : public receiver::ReceiverConnection {
public:
    static constexpr const char* kConnectingStatus = "Connecting...";

    SimulatedReceiver(boost::asio::io_context& ioContext, std::string host, std::string name);
    ~SimulatedReceiver() override;

    const std::string& host() const override { return host_; }
    std::string displayName() const override { return name_; }
    std::string statusText() const override { return status_; }
    receiver::ReceiverState state() const override { return state_; }

    void setEventHandler(EventHandler handler) override;

    void setPower(bool on) override;
    void togglePower() override;
    void setVolume(double volume) override;
    void changeVolume(double delta) override;
    void toggleMute() override;
    void selectSource(const std::string& source) override;

    void close() override;

    // Driven by tests and scenarios.
    void setStatus(std::string status);
    void markConnected();
    void markClosed();
    void emit(receiver::ReceiverEvent event);

    bool closed() const noexcept { return closed_; }
    const std::vector<std::string>& commandLog() const noexcept { return commandLog_; }
    std::weak_ptr<bool> lifetime() const { return alive_; }

private:
    boost::asio::io_context& ioContext_;
    std::string host_;
    std::string name_;
    std::string status_{kConnectingStatus};
    receiver::ReceiverState state_{};
    EventHandler handler_;
    bool closed_{false};
    std::vector<std::string> commandLog_;
    std::shared_ptr<bool> alive_;
};

/**
 * @brief ConnectionFactory that hands out SimulatedReceivers.
 *
 * Creation completes on a later turn of the io_context. With holdCompletions(true)
 * completions are parked until releaseCompletions(), which lets tests interleave
 * other events with an in-flight connection attempt.
 */
class SimulatedConnectionFactory : public receiver::ConnectionFactory {
public:
    explicit SimulatedConnectionFactory(boost::asio::io_context& ioContext);

    void create(const std::string& host, const std::string& nameHint, CreateHandler handler) override;

    void setFailing(const std::string& host, bool failing);
    void setReceiverName(const std::string& host, std::string name);
    void holdCompletions(bool hold);
    void releaseCompletions();

    std::size_t createCount(const std::string& host) const;
    std::size_t heldCompletions() const noexcept { return held_.size(); }

    /// Most recent receiver created for @p host, if it is still alive.
    SimulatedReceiver* receiver(const std::string& host) const;

private:
    void complete(const std::string& host, const std::string& nameHint, CreateHandler handler);

    struct HeldCompletion {
        std::string host;
        std::string nameHint;
        CreateHandler handler;
    };

    boost::asio::io_context& ioContext_;
    std::set<std::string> failing_;
    std::map<std::string, std::string> names_;
    std::map<std::string, std::size_t> createCounts_;
    std::map<std::string, std::weak_ptr<bool>> aliveTokens_;
    std::map<std::string, SimulatedReceiver*> receivers_;
    bool hold_{false};
    std::vector<HeldCompletion> held_;
};

}  // namespace avrdeck::sim
