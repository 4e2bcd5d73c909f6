#include "avrdeck/core/AssociationTable.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace avrdeck::core {

std::optional<std::string> AssociationTable::bind(const std::string& controlId, const std::string& host) {
    if (controlId.empty()) {
        throw std::invalid_argument("Control id must not be empty");
    }
    if (host.empty()) {
        throw std::invalid_argument("Host must not be empty");
    }

    std::lock_guard lock(mutex_);
    auto [it, inserted] = hostByControl_.try_emplace(controlId, host);
    if (inserted) {
        return std::nullopt;
    }
    std::string previous = std::exchange(it->second, host);
    return previous;
}

std::optional<std::string> AssociationTable::unbind(const std::string& controlId) {
    std::lock_guard lock(mutex_);
    auto it = hostByControl_.find(controlId);
    if (it == hostByControl_.end()) {
        return std::nullopt;
    }
    std::string host = std::move(it->second);
    hostByControl_.erase(it);
    return host;
}

std::optional<std::string> AssociationTable::lookupByControl(const std::string& controlId) const {
    std::lock_guard lock(mutex_);
    auto it = hostByControl_.find(controlId);
    if (it == hostByControl_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> AssociationTable::controlsBoundTo(const std::string& host) const {
    std::vector<std::string> controls;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [controlId, boundHost] : hostByControl_) {
            if (boundHost == host) {
                controls.push_back(controlId);
            }
        }
    }
    std::sort(controls.begin(), controls.end());
    return controls;
}

std::size_t AssociationTable::countForHost(const std::string& host) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(hostByControl_.begin(), hostByControl_.end(),
                                                  [&host](const auto& entry) { return entry.second == host; }));
}

std::vector<AssociationTable::Association> AssociationTable::snapshot() const {
    std::vector<Association> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(hostByControl_.size());
        for (const auto& [controlId, host] : hostByControl_) {
            out.push_back(Association{controlId, host});
        }
    }
    std::sort(out.begin(), out.end(), [](const Association& a, const Association& b) {
        return a.controlId < b.controlId;
    });
    return out;
}

std::size_t AssociationTable::size() const {
    std::lock_guard lock(mutex_);
    return hostByControl_.size();
}

}  // namespace avrdeck::core
