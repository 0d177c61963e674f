/**
 * @file system_event.cpp
 * @brief Implementation of system events and dispatch
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/system_event.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/utilities.hpp"

using json = nlohmann::json;

namespace agentlink {

// ============================================================================
// Event Type Conversion
// ============================================================================

std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::AGENT_REGISTERED: return "agent_registered";
        case EventType::AGENT_UNREGISTERED: return "agent_unregistered";
        case EventType::AGENT_STATUS_UPDATED: return "agent_status_updated";
        case EventType::TASK_CREATED: return "task_created";
        case EventType::TASK_ASSIGNED: return "task_assigned";
        case EventType::TASK_COMPLETED: return "task_completed";
        case EventType::TASK_FAILED: return "task_failed";
        case EventType::MESSAGE_RECEIVED: return "message_received";
        case EventType::SYSTEM_READY: return "system_ready";
        case EventType::SYSTEM_SHUTDOWN: return "system_shutdown";
        case EventType::ERROR_OCCURRED: return "error_occurred";
        case EventType::RESOURCE_LOW: return "resource_low";
        case EventType::UNRECOGNIZED: return "unrecognized";
    }
    return "unrecognized";
}

EventType string_to_event_type(const std::string& str) {
    static const std::map<std::string, EventType> lookup = {
        {"agent_registered", EventType::AGENT_REGISTERED},
        {"agent_unregistered", EventType::AGENT_UNREGISTERED},
        {"agent_status_updated", EventType::AGENT_STATUS_UPDATED},
        {"task_created", EventType::TASK_CREATED},
        {"task_assigned", EventType::TASK_ASSIGNED},
        {"task_completed", EventType::TASK_COMPLETED},
        {"task_failed", EventType::TASK_FAILED},
        {"message_received", EventType::MESSAGE_RECEIVED},
        {"system_ready", EventType::SYSTEM_READY},
        {"system_shutdown", EventType::SYSTEM_SHUTDOWN},
        {"error_occurred", EventType::ERROR_OCCURRED},
        {"resource_low", EventType::RESOURCE_LOW}
    };

    auto it = lookup.find(str);
    return it == lookup.end() ? EventType::UNRECOGNIZED : it->second;
}

EventType event_type_for_message(MessageType type) {
    switch (type) {
        case MessageType::TASK: return EventType::TASK_CREATED;
        case MessageType::RESPONSE: return EventType::TASK_COMPLETED;
        case MessageType::STATUS: return EventType::AGENT_STATUS_UPDATED;
        case MessageType::ERROR: return EventType::ERROR_OCCURRED;
        default: return EventType::MESSAGE_RECEIVED;
    }
}

// ============================================================================
// SystemEvent Serialization
// ============================================================================

json SystemEvent::to_json() const {
    return {
        {"event_id", event_id},
        {"event_type", event_type_to_string(type)},
        {"timestamp", timestamp},
        {"source", source},
        {"data", data},
        {"correlation_id", correlation_id ? json(*correlation_id) : json(nullptr)},
        {"priority", priority}
    };
}

SystemEvent SystemEvent::from_json(const json& j) {
    if (!j.is_object()) {
        throw MalformedMessageError("event is not a JSON object");
    }

    try {
        SystemEvent event;
        event.event_id = j.at("event_id").get<std::string>();
        std::string type_name = j.at("event_type").get<std::string>();
        event.type = string_to_event_type(type_name);
        if (event.type == EventType::UNRECOGNIZED) {
            throw MalformedMessageError("unrecognized event type '" + type_name + "'", "event_type");
        }
        event.timestamp = j.at("timestamp").get<double>();
        event.source = j.at("source").get<std::string>();
        event.data = j.value("data", json::object());
        event.priority = j.value("priority", std::string("normal"));

        auto correlation = j.find("correlation_id");
        if (correlation != j.end() && correlation->is_string()) {
            event.correlation_id = correlation->get<std::string>();
        }
        return event;

    } catch (const json::exception& e) {
        throw MalformedMessageError("invalid event: " + std::string(e.what()));
    }
}

// ============================================================================
// EventDispatcher
// ============================================================================

EventDispatcher::EventDispatcher(std::string source_id, size_t history_limit)
    : source_id_(std::move(source_id))
    , history_limit_(history_limit)
{
}

SystemEvent EventDispatcher::make_event(EventType type,
                                        const json& data,
                                        const std::optional<std::string>& correlation_id) {
    SystemEvent event;
    event.event_id = source_id_ + "-event-" + std::to_string(++counter_) + "-" +
                     std::to_string(utilities::current_time_ms());
    event.type = type;
    event.timestamp = utilities::current_time_seconds();
    event.source = source_id_;
    event.data = data;
    event.correlation_id = correlation_id;
    return event;
}

void EventDispatcher::register_handler(EventType type, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[type].push_back(std::move(handler));
    utilities::log_debug("EventDispatcher: handler registered for " + event_type_to_string(type));
}

void EventDispatcher::register_global_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_handlers_.push_back(std::move(handler));
}

size_t EventDispatcher::dispatch(const SystemEvent& event) {
    std::vector<EventHandler> typed;
    std::vector<EventHandler> global;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(event);
        while (history_.size() > history_limit_) {
            history_.pop_front();
        }

        auto it = handlers_.find(event.type);
        if (it != handlers_.end()) {
            typed = it->second;
        }
        global = global_handlers_;
    }

    utilities::log_debug("EventDispatcher: " + event_type_to_string(event.type) + " from " + event.source);

    size_t completed = 0;
    for (const auto& handler : typed) {
        try {
            handler(event);
            ++completed;
        } catch (const std::exception& e) {
            utilities::log_error("EventDispatcher: handler failed for " + event.event_id +
                                 ": " + std::string(e.what()));
        }
    }
    for (const auto& handler : global) {
        try {
            handler(event);
            ++completed;
        } catch (const std::exception& e) {
            utilities::log_error("EventDispatcher: global handler failed for " + event.event_id +
                                 ": " + std::string(e.what()));
        }
    }
    return completed;
}

std::vector<SystemEvent> EventDispatcher::history(std::optional<EventType> type, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SystemEvent> result;
    for (const auto& event : history_) {
        if (!type || event.type == *type) {
            result.push_back(event);
        }
    }

    if (limit > 0 && result.size() > limit) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return result;
}

size_t EventDispatcher::handler_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = global_handlers_.size();
    for (const auto& [type, list] : handlers_) {
        count += list.size();
    }
    return count;
}

void EventDispatcher::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

} // namespace agentlink
