/**
 * @file peer_registry.cpp
 * @brief Implementation of the agent registry
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/peer_registry.hpp"
#include "agentlink/utilities.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace agentlink {

// ============================================================================
// AgentInfo
// ============================================================================

json AgentInfo::to_json() const {
    json j = metadata.is_object() ? metadata : json::object();
    j["agent_id"] = agent_id;
    j["capabilities"] = capabilities;
    return j;
}

std::optional<AgentInfo> AgentInfo::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto id = j.find("agent_id");
    if (id == j.end() || !id->is_string() || id->get<std::string>().empty()) {
        return std::nullopt;
    }

    AgentInfo info;
    info.agent_id = id->get<std::string>();

    auto caps = j.find("capabilities");
    if (caps != j.end() && caps->is_array()) {
        for (const auto& cap : *caps) {
            if (cap.is_string()) {
                info.capabilities.push_back(cap.get<std::string>());
            }
        }
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "agent_id" && it.key() != "capabilities") {
            info.metadata[it.key()] = it.value();
        }
    }

    return info;
}

std::string agent_status_to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::ONLINE: return "online";
        case AgentStatus::OFFLINE: return "offline";
        case AgentStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

// ============================================================================
// Constructor
// ============================================================================

PeerRegistry::PeerRegistry(std::chrono::seconds liveness_window, Clock clock)
    : liveness_window_(liveness_window)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

// ============================================================================
// Updates
// ============================================================================

PeerRegistration PeerRegistry::register_peer(const AgentInfo& info, const json& announcement) {
    auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(info.agent_id);
    if (it == peers_.end()) {
        PeerRegistration entry;
        entry.agent_id = info.agent_id;
        entry.registered_at = now;
        it = peers_.emplace(info.agent_id, std::move(entry)).first;
        utilities::log_info("PeerRegistry: agent registered " + info.agent_id);
    } else {
        utilities::log_debug("PeerRegistry: registration refreshed " + info.agent_id);
    }

    it->second.capabilities = info.capabilities;
    it->second.info = announcement;
    it->second.last_seen = now;
    return it->second;
}

bool PeerRegistry::record_heartbeat(const std::string& agent_id) {
    auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(agent_id);
    if (it == peers_.end()) {
        utilities::log_warn("PeerRegistry: heartbeat from unknown agent " + agent_id);
        return false;
    }

    it->second.last_seen = now;
    return true;
}

bool PeerRegistry::unregister(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (peers_.erase(agent_id) == 0) {
        utilities::log_warn("PeerRegistry: unregistration for unknown agent " + agent_id);
        return false;
    }

    utilities::log_info("PeerRegistry: agent unregistered " + agent_id);
    return true;
}

size_t PeerRegistry::cleanup_stale(std::chrono::seconds max_age) {
    auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = peers_.begin(); it != peers_.end();) {
        if (now - it->second.last_seen >= max_age) {
            utilities::log_info("PeerRegistry: removing stale agent " + it->first);
            it = peers_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void PeerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
}

// ============================================================================
// Queries
// ============================================================================

bool PeerRegistry::is_online_locked(const PeerRegistration& entry,
                                    std::chrono::system_clock::time_point now) const {
    return now - entry.last_seen < liveness_window_;
}

AgentStatus PeerRegistry::status_of(const std::string& agent_id) const {
    auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(agent_id);
    if (it == peers_.end()) {
        return AgentStatus::UNKNOWN;
    }
    return is_online_locked(it->second, now) ? AgentStatus::ONLINE : AgentStatus::OFFLINE;
}

std::optional<PeerRegistration> PeerRegistry::get(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(agent_id);
    if (it != peers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<PeerRegistration> PeerRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PeerRegistration> result;
    result.reserve(peers_.size());
    for (const auto& [agent_id, entry] : peers_) {
        result.push_back(entry);
    }
    return result;
}

std::vector<PeerRegistration> PeerRegistry::online() const {
    auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PeerRegistration> result;
    for (const auto& [agent_id, entry] : peers_) {
        if (is_online_locked(entry, now)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<PeerRegistration> PeerRegistry::with_capability(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PeerRegistration> result;
    for (const auto& [agent_id, entry] : peers_) {
        if (std::find(entry.capabilities.begin(), entry.capabilities.end(), capability) !=
            entry.capabilities.end()) {
            result.push_back(entry);
        }
    }
    return result;
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

size_t PeerRegistry::online_count() const {
    auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(peers_.begin(), peers_.end(), [&](const auto& entry) {
        return is_online_locked(entry.second, now);
    }));
}

} // namespace agentlink
