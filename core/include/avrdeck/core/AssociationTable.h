#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace avrdeck::core {

/**
 * @brief Maps each control instance to the receiver host it is bound to.
 *
 * A control is bound to at most one host; any number of controls may share a host.
 * The table stores host keys only, connection lifetime belongs to ConnectionRegistry.
 */
class AssociationTable {
public:
    struct Association {
        std::string controlId;
        std::string host;
    };

    AssociationTable() = default;

    /**
     * @brief Replace any prior association for @p controlId.
     * @return The previously bound host, if there was one.
     */
    std::optional<std::string> bind(const std::string& controlId, const std::string& host);

    /// Remove the association for @p controlId. Returns the host it was bound to.
    std::optional<std::string> unbind(const std::string& controlId);

    std::optional<std::string> lookupByControl(const std::string& controlId) const;
    std::optional<std::string> hostOf(const std::string& controlId) const { return lookupByControl(controlId); }

    /// Controls bound to @p host, sorted by control id.
    std::vector<std::string> controlsBoundTo(const std::string& host) const;
    std::size_t countForHost(const std::string& host) const;

    std::vector<Association> snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> hostByControl_;
};

}  // namespace avrdeck::core
