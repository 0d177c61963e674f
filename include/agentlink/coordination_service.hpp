/**
 * @file coordination_service.hpp
 * @brief Broker-backed agent discovery, messaging, task routing and events
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Ties together:
 * - MessageBroker for transport (NATS JetStream or in-memory)
 * - PeerRegistry for agent liveness
 * - EventDispatcher for local event fan-out
 *
 * Every subscription owns background threads that pull from a durable
 * consumer and settle each message after the callback returns.
 *
 * While connected, a monitor thread watches the broker link. When the
 * link drops it reconnects with the retry policy, provisions streams and
 * consumers again and re-subscribes every core subscription.
 */

#pragma once

#include "agentlink/config.hpp"
#include "agentlink/message_broker.hpp"
#include "agentlink/peer_registry.hpp"
#include "agentlink/system_event.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace agentlink {

/**
 * @brief Callback for stream payloads (messages, tasks)
 *
 * Throwing DeliveryError, or any other std::exception, requests
 * redelivery. MalformedMessageError and CryptoError are not retried.
 */
using PayloadCallback = std::function<void(const nlohmann::json& payload)>;

/**
 * @brief Callback for agents.updates broadcasts
 */
using AgentUpdateCallback = std::function<void(const nlohmann::json& update)>;

/**
 * @brief Snapshot returned by health_check()
 */
struct HealthStatus {
    bool connected = false;
    size_t agent_count = 0;
    size_t online_agents = 0;
    size_t subscriptions = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief CoordinationService - agent coordination over a message broker
 */
class CoordinationService {
public:
    using Clock = PeerRegistry::Clock;

    /**
     * @param broker Transport; shared so tests can inspect it
     * @param settings Runtime settings
     * @param service_id Source recorded on published events; empty picks
     *        coordination-service-<host>-<random>
     * @param clock Time source for liveness and payload timestamps
     */
    CoordinationService(std::shared_ptr<MessageBroker> broker,
                        CoordinationConfig settings = CoordinationConfig(),
                        std::string service_id = "",
                        Clock clock = nullptr);

    /**
     * @brief Destructor - stops all subscriptions and closes the broker
     */
    ~CoordinationService();

    CoordinationService(const CoordinationService&) = delete;
    CoordinationService& operator=(const CoordinationService&) = delete;

    // ========================================================================
    // Connection Management
    // ========================================================================

    /**
     * @brief Connect, provision streams and consumers, subscribe to discovery
     *
     * On a started service whose broker link has dropped, reconnects and
     * restores every subscription. A no-op while the link is up.
     *
     * @throws ConnectionError if the broker is unreachable
     * @throws BrokerError if provisioning is rejected
     */
    void connect();

    /**
     * @brief connect() with bounded retry
     *
     * Waits reconnect_delay * backoff_multiplier^(n-1) after failed attempt n.
     *
     * @throws ConnectionError once max_reconnect_attempts attempts have failed
     */
    void connect_with_retry();

    /**
     * @brief Stop and join all subscriptions, then close the broker
     *
     * Safe to call more than once. Must not be called from a subscription
     * callback.
     */
    void disconnect();

    /// Started and the broker link is up
    bool is_connected() const;

    const std::string& service_id() const { return service_id_; }

    // ========================================================================
    // Discovery
    // ========================================================================

    /**
     * @brief Announce an agent on agents.register
     * @throws ValidationError for an unusable agent ID
     */
    void register_agent(const AgentInfo& info);

    /**
     * @brief Publish {agent_id, timestamp} on agents.heartbeat
     */
    void send_heartbeat(const std::string& agent_id);

    /**
     * @brief Publish {agent_id} on agents.unregister
     */
    void unregister_agent(const std::string& agent_id);

    /**
     * @brief Receive agents.updates broadcasts
     * @return Subscription ID for unsubscribe()
     */
    uint64_t subscribe_to_agent_updates(AgentUpdateCallback callback);

    std::optional<nlohmann::json> get_agent_info(const std::string& agent_id) const;

    std::vector<PeerRegistration> get_online_agents() const;

    AgentStatus agent_status(const std::string& agent_id) const;

    const PeerRegistry& registry() const { return registry_; }

    // ========================================================================
    // Messaging and Tasks
    // ========================================================================

    /**
     * @brief Durable publish of {sender_id, receiver_id, message, timestamp}
     *        on messages.<sender>.<receiver>
     */
    PublishAck send_message(const std::string& sender_id,
                            const std::string& receiver_id,
                            const nlohmann::json& message);

    /**
     * @brief Publish {task, timestamp, target_agents}
     *
     * One copy per target on tasks.<agent>, or a single copy on
     * tasks.available for the competing work-queue consumers.
     *
     * @return Number of copies published
     */
    size_t route_task(const nlohmann::json& task,
                      const std::vector<std::string>& target_agents = {});

    /**
     * @brief Pull messages addressed to agent_id
     * @return Subscription ID for unsubscribe()
     */
    uint64_t subscribe_to_messages(const std::string& agent_id, PayloadCallback callback);

    /**
     * @brief Pull tasks for agent_id and compete for tasks.available
     * @return Subscription ID covering both consumers
     */
    uint64_t subscribe_to_tasks(const std::string& agent_id, PayloadCallback callback);

    /**
     * @brief Stop one subscription and join its threads
     * @return false if the ID is unknown
     */
    bool unsubscribe(uint64_t subscription_id);

    // ========================================================================
    // Events
    // ========================================================================

    /**
     * @brief Dispatch locally and publish on events.<type>
     *
     * The event ID is remembered so the copy coming back from the broker
     * is not dispatched a second time.
     *
     * @return The event as published
     */
    SystemEvent publish_event(EventType type,
                              const nlohmann::json& data = nlohmann::json::object(),
                              const std::optional<std::string>& correlation_id = std::nullopt);

    /**
     * @brief Dispatch events published by other services into the local dispatcher
     * @return Subscription ID for unsubscribe()
     */
    uint64_t subscribe_to_events();

    void register_event_handler(EventType type, EventHandler handler);

    void register_global_event_handler(EventHandler handler);

    EventDispatcher& events() { return events_; }

    // ========================================================================
    // Status
    // ========================================================================

    HealthStatus health_check() const;

    const CoordinationConfig& settings() const { return settings_; }

private:
    struct Subscription {
        std::string description;
        std::atomic<bool> stop{false};
        std::vector<std::thread> threads;

        // Core subscriptions, re-subscribed after a reconnect
        std::string subject;
        MessageCallback on_message;
        std::optional<uint64_t> broker_sid;

        // Pull consumers, provisioned again after a reconnect
        std::vector<std::pair<std::string, ConsumerSpec>> consumers;
    };

    void require_connected() const;
    double now_seconds() const;

    void provision();
    void restore_link_locked();
    void start_monitor();
    void stop_monitor();
    void monitor_link();
    void recover_link();
    bool monitor_wait(std::chrono::milliseconds delay);

    void remember_published(const std::string& event_id);
    bool was_published(const std::string& event_id) const;

    void handle_registration(const BrokerMessage& message);
    void handle_heartbeat(const BrokerMessage& message);
    void handle_unregistration(const BrokerMessage& message);
    void handle_remote_event(const BrokerMessage& message);
    void broadcast_agent_update(const std::string& agent_id,
                                const std::string& event_type,
                                const nlohmann::json& agent_info);

    uint64_t add_core_subscription(const std::string& subject, MessageCallback callback,
                                   const std::string& description);
    uint64_t add_pull_subscription(std::unique_ptr<Subscription> subscription);
    void run_pull_loop(Subscription* subscription,
                       std::string stream,
                       std::string durable,
                       int max_deliver,
                       PayloadCallback callback);
    void settle(const BrokerMessage& message, int max_deliver, const PayloadCallback& callback);
    void stop_subscription(std::unique_ptr<Subscription> subscription);

    std::shared_ptr<MessageBroker> broker_;
    CoordinationConfig settings_;
    std::string service_id_;
    Clock clock_;

    PeerRegistry registry_;
    EventDispatcher events_;

    std::atomic<bool> connected_{false};
    std::mutex connection_mutex_;

    std::thread monitor_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_ = false;
    std::atomic<bool> recovery_abandoned_{false};

    mutable std::mutex published_mutex_;
    std::deque<std::string> published_order_;
    std::set<std::string> published_ids_;

    mutable std::mutex subscriptions_mutex_;
    std::map<uint64_t, std::unique_ptr<Subscription>> subscriptions_;
    uint64_t next_subscription_id_ = 1;
};

} // namespace agentlink
