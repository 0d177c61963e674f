/**
 * @file subjects.hpp
 * @brief Broker subject layout, stream catalog and consumer names
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Subject names are shared with other deployments and must not change.
 */

#pragma once

#include "agentlink/message_broker.hpp"

#include <string>
#include <vector>

namespace agentlink {
namespace subjects {

// ============================================================================
// Fixed subjects
// ============================================================================

constexpr const char* AGENTS_REGISTER = "agents.register";
constexpr const char* AGENTS_HEARTBEAT = "agents.heartbeat";
constexpr const char* AGENTS_UNREGISTER = "agents.unregister";
constexpr const char* AGENTS_UPDATES = "agents.updates";
constexpr const char* TASKS_AVAILABLE = "tasks.available";
constexpr const char* EVENTS_ALL = "events.>";

// ============================================================================
// Streams and consumers
// ============================================================================

constexpr const char* DISCOVERY_STREAM = "AGENT_DISCOVERY";
constexpr const char* MESSAGES_STREAM = "AGENT_MESSAGES";
constexpr const char* TASKS_STREAM = "TASK_ROUTING";
constexpr const char* EVENTS_STREAM = "SYSTEM_EVENTS";

constexpr const char* DISCOVERY_CONSUMER = "agent-discovery-consumer";
constexpr const char* TASK_QUEUE_CONSUMER = "task-routing-consumer";

// ============================================================================
// Builders
// ============================================================================

/// messages.<sender>.<receiver>
std::string message(const std::string& sender_id, const std::string& receiver_id);

/// messages.*.<receiver>
std::string messages_for(const std::string& receiver_id);

/// tasks.<agent>
std::string task(const std::string& agent_id);

/// events.<event type>
std::string event(const std::string& event_type);

/// agent-<id>-messages
std::string message_consumer(const std::string& agent_id);

/// agent-<id>-tasks
std::string task_consumer(const std::string& agent_id);

/**
 * @brief NATS-style subject match
 *
 * '*' matches exactly one token, '>' matches one or more trailing tokens.
 */
bool subject_matches(const std::string& pattern, const std::string& subject);

/**
 * @brief The four durable streams provisioned at connect
 */
std::vector<StreamSpec> stream_catalog();

/**
 * @brief Consumer on AGENT_DISCOVERY
 */
ConsumerSpec discovery_consumer();

/**
 * @brief Shared work-queue consumer on tasks.available
 */
ConsumerSpec task_queue_consumer();

/**
 * @brief Per-agent consumer on messages.*.<id>
 */
ConsumerSpec agent_message_consumer(const std::string& agent_id, int max_deliver);

/**
 * @brief Per-agent consumer on tasks.<id>
 */
ConsumerSpec agent_task_consumer(const std::string& agent_id, int max_deliver);

} // namespace subjects
} // namespace agentlink
