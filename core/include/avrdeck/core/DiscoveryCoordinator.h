#pragma once

#include "avrdeck/discovery/DiscoverySession.h"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace avrdeck::core {

struct DiscoveredReceiver {
    std::string name;
    std::string address;
    // False while the entry shows the raw address because no name was reported.
    bool nameResolved{false};
};

/// One entry of the list shown by the inspector's receiver picker.
struct DiscoveredItem {
    std::string label;
    std::string value;

    bool operator==(const DiscoveredItem& other) const {
        return label == other.label && value == other.value;
    }
};

enum class CoordinatorState {
    Idle,
    Searching,
    SessionDestroyed,
};

std::string_view toString(CoordinatorState state);

/**
 * @brief Owns the process-wide discovery session and the discovered receiver set.
 *
 * Starting a search clears the set. Each address is resolved to a display name at
 * most once at a time; an entry that fell back to its address is re-resolved the
 * next time the address is observed. A destroyed session is replaced on the next
 * startSearching().
 */
class DiscoveryCoordinator {
public:
    using ListChangedHandler = std::function<void()>;

    DiscoveryCoordinator(boost::asio::io_context& ioContext,
                         discovery::DiscoveryTransport& transport,
                         std::string placeholderLabel = "Select a receiver");
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    void setListChangedHandler(ListChangedHandler handler);

    void startSearching();
    void stopSearching();

    CoordinatorState state() const;

    /// Sentinel entry followed by the receivers in discovery order; empty if none.
    std::vector<DiscoveredItem> getDiscoveredList() const;

    const std::vector<DiscoveredReceiver>& discovered() const noexcept { return discovered_; }
    std::size_t pendingResolutions() const noexcept { return pendingResolution_.size(); }
    std::uint64_t sessionsCreated() const noexcept { return sessionsCreated_; }

private:
    void ensureLiveSession();
    void handleAddressObserved(const std::string& address);
    void handleNameResolved(const std::string& address,
                            std::optional<std::string> name,
                            std::uint64_t generation);

    boost::asio::io_context& ioContext_;
    discovery::DiscoveryTransport& transport_;
    std::string placeholderLabel_;
    ListChangedHandler listChanged_;

    std::unique_ptr<discovery::DiscoverySession> session_;
    std::uint64_t sessionsCreated_{0};
    bool startPending_{false};
    std::uint64_t generation_{0};

    std::vector<DiscoveredReceiver> discovered_;
    std::unordered_set<std::string> pendingResolution_;
};

}  // namespace avrdeck::core
