#include "agenthub/network/ConnectionRegistry.hpp"

#include "log/TaggedLogger.hpp"

#include <mutex>

namespace AH::Network {

auto ConnectionRegistry::registerAgent(ConnectionId const& connectionId, std::string const& agentName)
    -> std::optional<ConnectionId> {
    std::unique_lock lock(mutex_);

    // The connection may have been bound to a different name before.
    if (auto it = byConnection_.find(connectionId); it != byConnection_.end() && it->second.agentName != agentName) {
        if (auto previous = byAgent_.find(it->second.agentName);
            previous != byAgent_.end() && previous->second == connectionId) {
            byAgent_.erase(previous);
        }
    }

    std::optional<ConnectionId> displaced;
    if (auto it = byAgent_.find(agentName); it != byAgent_.end() && it->second != connectionId) {
        displaced = it->second;
        byConnection_.erase(it->second);
    }

    byConnection_.insert_or_assign(connectionId, AgentRecord{connectionId, agentName, true});
    byAgent_.insert_or_assign(agentName, connectionId);

    if (displaced) {
        ah_log("Agent " + agentName + " moved from " + *displaced + " to " + connectionId, "ConnectionRegistry");
    }
    return displaced;
}

auto ConnectionRegistry::tryGet(ConnectionId const& connectionId) const -> std::optional<std::string> {
    std::shared_lock lock(mutex_);
    if (auto it = byConnection_.find(connectionId); it != byConnection_.end()) {
        return it->second.agentName;
    }
    return std::nullopt;
}

auto ConnectionRegistry::connectionFor(std::string_view agentName) const -> std::optional<ConnectionId> {
    std::shared_lock lock(mutex_);
    if (auto it = byAgent_.find(std::string(agentName)); it != byAgent_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto ConnectionRegistry::tryRemove(ConnectionId const& connectionId) -> std::optional<std::string> {
    std::unique_lock lock(mutex_);
    auto             it = byConnection_.find(connectionId);
    if (it == byConnection_.end()) {
        return std::nullopt;
    }
    auto agentName = std::move(it->second.agentName);
    byConnection_.erase(it);
    if (auto reverse = byAgent_.find(agentName); reverse != byAgent_.end() && reverse->second == connectionId) {
        byAgent_.erase(reverse);
    }
    return agentName;
}

auto ConnectionRegistry::isRegistered(std::string_view agentName) const -> bool {
    std::shared_lock lock(mutex_);
    return byAgent_.contains(std::string(agentName));
}

auto ConnectionRegistry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return byConnection_.size();
}

auto ConnectionRegistry::snapshot() const -> std::vector<AgentRecord> {
    std::shared_lock         lock(mutex_);
    std::vector<AgentRecord> records;
    records.reserve(byConnection_.size());
    for (auto const& [_, record] : byConnection_) {
        records.push_back(record);
    }
    return records;
}

} // namespace AH::Network
