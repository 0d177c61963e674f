/**
 * @file system_event.hpp
 * @brief System events and their synchronous dispatcher
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Events signal state changes (agent joined, task completed, error) to
 * handlers registered per event type plus a wildcard list.
 */

#pragma once

#include "agentlink/config.hpp"
#include "agentlink/message_types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {

/**
 * @brief Kinds of system event
 */
enum class EventType {
    AGENT_REGISTERED,
    AGENT_UNREGISTERED,
    AGENT_STATUS_UPDATED,
    TASK_CREATED,
    TASK_ASSIGNED,
    TASK_COMPLETED,
    TASK_FAILED,
    MESSAGE_RECEIVED,
    SYSTEM_READY,
    SYSTEM_SHUTDOWN,
    ERROR_OCCURRED,
    RESOURCE_LOW,
    UNRECOGNIZED
};

std::string event_type_to_string(EventType type);

/// Unknown strings map to EventType::UNRECOGNIZED
EventType string_to_event_type(const std::string& str);

/**
 * @brief Event raised when an inbound message of the given type arrives
 */
EventType event_type_for_message(MessageType type);

/**
 * @brief A state change signalled by some component
 */
struct SystemEvent {
    std::string event_id;                          ///< <source>-event-<n>-<epoch ms>
    EventType type = EventType::UNRECOGNIZED;      ///< Event kind
    double timestamp = 0.0;                        ///< Epoch seconds
    std::string source;                            ///< Emitting agent or service
    nlohmann::json data = nlohmann::json::object(); ///< Payload
    std::optional<std::string> correlation_id;     ///< Links related events
    std::string priority = "normal";               ///< Free-form priority label

    nlohmann::json to_json() const;

    /// @throws MalformedMessageError on missing fields or unknown type
    static SystemEvent from_json(const nlohmann::json& j);
};

using EventHandler = std::function<void(const SystemEvent& event)>;

/**
 * @brief EventDispatcher - typed and wildcard handler lists with history
 *
 * dispatch() runs synchronously on the caller's thread: type handlers in
 * registration order, then wildcard handlers. A throwing handler is logged
 * and skipped.
 */
class EventDispatcher {
public:
    /**
     * @param source_id Source recorded on events created by make_event()
     * @param history_limit Oldest events are dropped beyond this count
     */
    explicit EventDispatcher(std::string source_id,
                             size_t history_limit = config::EVENT_HISTORY_LIMIT);

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Build an event stamped with a fresh ID, this source and now
     */
    SystemEvent make_event(EventType type,
                           const nlohmann::json& data = nlohmann::json::object(),
                           const std::optional<std::string>& correlation_id = std::nullopt);

    void register_handler(EventType type, EventHandler handler);

    /**
     * @brief Register a handler that receives every event
     */
    void register_global_handler(EventHandler handler);

    /**
     * @brief Record an event in history and run its handlers
     * @return Number of handlers that completed without throwing
     */
    size_t dispatch(const SystemEvent& event);

    /**
     * @brief Recent events, newest last
     * @param type Only events of this type when set
     * @param limit Maximum number returned (0 = all)
     */
    std::vector<SystemEvent> history(std::optional<EventType> type = std::nullopt,
                                     size_t limit = 0) const;

    size_t handler_count() const;

    void clear_history();

    const std::string& source_id() const { return source_id_; }

private:
    std::string source_id_;
    size_t history_limit_;
    std::atomic<uint64_t> counter_{0};

    mutable std::mutex mutex_;
    std::map<EventType, std::vector<EventHandler>> handlers_;
    std::vector<EventHandler> global_handlers_;
    std::deque<SystemEvent> history_;
};

} // namespace agentlink
