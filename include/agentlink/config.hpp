/**
 * @file config.hpp
 * @brief Configuration constants and environment-driven settings for AgentLink
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

namespace agentlink {
namespace config {

// ============================================================================
// Limits
// ============================================================================

/// Maximum identifier length (agent ID, durable consumer name token)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum serialized message size accepted from the wire (1MB)
constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;

/// Bounded event history kept by the dispatcher
constexpr size_t EVENT_HISTORY_LIMIT = 1000;

// ============================================================================
// Liveness and retry
// ============================================================================

/// Agent is online while its last heartbeat is younger than this
constexpr auto LIVENESS_WINDOW = std::chrono::seconds(60);

/// Fixed delay between connection attempts
constexpr auto RECONNECT_DELAY = std::chrono::seconds(5);

/// Connection attempts before startup is aborted
constexpr int MAX_RECONNECT_ATTEMPTS = 5;

/// Broker request/reply timeout
constexpr auto REQUEST_TIMEOUT = std::chrono::seconds(5);

// ============================================================================
// Consumers
// ============================================================================

/// Messages pulled per fetch
constexpr size_t FETCH_BATCH = 5;

/// Poll timeout per fetch; bounds cancellation latency of a subscription loop
constexpr auto FETCH_TIMEOUT = std::chrono::milliseconds(1000);

/// Redelivery ceiling for per-agent message consumers
constexpr int MESSAGE_MAX_DELIVER = 5;

/// Redelivery ceiling for the discovery consumer
constexpr int DISCOVERY_MAX_DELIVER = 5;

/// Redelivery ceiling for the task work queue
constexpr int TASK_MAX_DELIVER = 3;

/// Unacknowledged messages are redelivered after this
constexpr auto ACK_WAIT = std::chrono::seconds(30);

// ============================================================================
// Stream limits
// ============================================================================

constexpr int64_t DISCOVERY_MAX_BYTES = 100LL * 1024 * 1024;
constexpr auto DISCOVERY_MAX_AGE = std::chrono::hours(24);

constexpr int64_t MESSAGES_MAX_BYTES = 1024LL * 1024 * 1024;
constexpr auto MESSAGES_MAX_AGE = std::chrono::hours(24 * 7);

constexpr int64_t TASKS_MAX_BYTES = 500LL * 1024 * 1024;
constexpr auto TASKS_MAX_AGE = std::chrono::hours(24 * 3);

constexpr int64_t EVENTS_MAX_BYTES = 200LL * 1024 * 1024;
constexpr auto EVENTS_MAX_AGE = std::chrono::hours(24);

// ============================================================================
// Directories and validation
// ============================================================================

/**
 * @brief Get AgentLink data directory from AGENTLINK_DATA_DIR or use default
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Directory holding identity key files
 */
std::filesystem::path get_identity_directory();

/**
 * @brief Validate an identifier that becomes a broker subject token
 *
 * Accepts alphanumeric, underscore and hyphen only. Dots and wildcards
 * would change the meaning of the subject the identifier is embedded in.
 *
 * @param identifier Identifier to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

} // namespace config

/**
 * @brief Runtime settings for CoordinationService
 *
 * Defaults come from the constants above; from_environment() overrides
 * them with AGENTLINK_* variables.
 */
struct CoordinationConfig {
    std::string nats_url = "nats://localhost:4222";                        ///< Broker URL
    std::string client_name = "agentlink";                                 ///< Connection name shown by the broker
    std::chrono::seconds liveness_window = config::LIVENESS_WINDOW;        ///< Online threshold
    std::chrono::milliseconds reconnect_delay = config::RECONNECT_DELAY;   ///< Delay before next connect attempt
    double backoff_multiplier = 1.0;                                       ///< 1.0 keeps the delay fixed
    int max_reconnect_attempts = config::MAX_RECONNECT_ATTEMPTS;           ///< Attempt ceiling
    size_t fetch_batch = config::FETCH_BATCH;                              ///< Pull batch size
    std::chrono::milliseconds fetch_timeout = config::FETCH_TIMEOUT;       ///< Pull poll timeout
    int max_deliver = config::MESSAGE_MAX_DELIVER;                         ///< Per-agent redelivery ceiling
    std::string log_level = "info";                                        ///< Log level name
    std::string log_file;                                                  ///< Optional rotating log file

    /**
     * @brief Build settings from AGENTLINK_* environment variables
     *
     * Unparseable numeric values keep their default and log a warning.
     */
    static CoordinationConfig from_environment();

    /**
     * @brief Check settings for consistency
     * @return Human-readable problems, empty when valid
     */
    std::vector<std::string> validate() const;
};

} // namespace agentlink
