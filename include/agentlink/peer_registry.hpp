/**
 * @file peer_registry.hpp
 * @brief Registry of known agents with heartbeat-based liveness
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides the agent table behind the coordination service:
 * - Registration refreshes an existing entry
 * - Heartbeats and unregistration for unknown agents are warnings
 * - Online/offline is derived from last_seen at query time
 * - Thread-safe operations
 */

#pragma once

#include "agentlink/config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {

/**
 * @brief What an agent announces about itself when registering
 */
struct AgentInfo {
    std::string agent_id;                                ///< Agent identifier
    std::vector<std::string> capabilities;               ///< Advertised capabilities
    nlohmann::json metadata = nlohmann::json::object();  ///< Extra fields merged into the announcement

    /// {agent_id, capabilities, ...metadata}
    nlohmann::json to_json() const;

    /**
     * @brief Read an announcement
     * @return nullopt if agent_id is missing or not a string
     */
    static std::optional<AgentInfo> from_json(const nlohmann::json& j);
};

/**
 * @brief Derived liveness of a registered agent
 */
enum class AgentStatus {
    UNKNOWN,   ///< Never registered, or unregistered
    ONLINE,    ///< Heartbeat within the liveness window
    OFFLINE    ///< Registered but silent for the liveness window or longer
};

std::string agent_status_to_string(AgentStatus status);

/**
 * @brief A registry entry
 */
struct PeerRegistration {
    std::string agent_id;
    std::vector<std::string> capabilities;
    nlohmann::json info = nlohmann::json::object();      ///< Full announcement as received
    std::chrono::system_clock::time_point registered_at;
    std::chrono::system_clock::time_point last_seen;
};

/**
 * @brief PeerRegistry - agent table keyed by agent ID
 */
class PeerRegistry {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param liveness_window Agents silent this long are offline
     * @param clock Time source (system clock by default)
     */
    explicit PeerRegistry(std::chrono::seconds liveness_window = config::LIVENESS_WINDOW,
                          Clock clock = nullptr);

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // ========================================================================
    // Updates
    // ========================================================================

    /**
     * @brief Create or refresh an entry
     *
     * A refresh keeps registered_at and replaces capabilities and info.
     *
     * @return The stored registration
     */
    PeerRegistration register_peer(const AgentInfo& info, const nlohmann::json& announcement);

    /**
     * @brief Update last_seen of a known agent
     * @return false (with a warning) if the agent is not registered
     */
    bool record_heartbeat(const std::string& agent_id);

    /**
     * @brief Remove an agent
     * @return false (with a warning) if the agent is not registered
     */
    bool unregister(const std::string& agent_id);

    /**
     * @brief Drop entries not seen for max_age
     * @return Number of entries removed
     */
    size_t cleanup_stale(std::chrono::seconds max_age);

    void clear();

    // ========================================================================
    // Queries
    // ========================================================================

    AgentStatus status_of(const std::string& agent_id) const;

    std::optional<PeerRegistration> get(const std::string& agent_id) const;

    std::vector<PeerRegistration> all() const;

    /// Entries whose last heartbeat is within the liveness window
    std::vector<PeerRegistration> online() const;

    std::vector<PeerRegistration> with_capability(const std::string& capability) const;

    size_t size() const;

    size_t online_count() const;

    std::chrono::seconds liveness_window() const { return liveness_window_; }

private:
    bool is_online_locked(const PeerRegistration& entry,
                          std::chrono::system_clock::time_point now) const;

    std::chrono::seconds liveness_window_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, PeerRegistration> peers_;
};

} // namespace agentlink
