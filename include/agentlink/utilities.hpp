/**
 * @file utilities.hpp
 * @brief Common utility functions for AgentLink
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Logging goes through one spdlog logger named "agentlink". The first
 * log call initializes console logging at INFO when initialize_logging()
 * was never called.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace agentlink {
namespace utilities {

/**
 * @brief Log levels for AgentLink logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return Parsed level, INFO when unknown
 */
LogLevel parse_log_level(const std::string& name);

void log(LogLevel level, const std::string& message);
void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Seconds since the Unix epoch with sub-second precision
 */
double to_epoch_seconds(std::chrono::system_clock::time_point tp);

/**
 * @brief Current wall clock time as epoch seconds
 */
double current_time_seconds();

/**
 * @brief Current wall clock time as epoch milliseconds
 */
uint64_t current_time_ms();

/**
 * @brief Current UTC time as ISO 8601, e.g. "2025-11-10T15:30:45Z"
 */
std::string format_current_time();

// ============================================================================
// Files
// ============================================================================

/// Whole file contents, nullopt (logged) when unreadable
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Create a new, empty file opened for writing
 *
 * Any existing file at the path is removed first, so the mode below is
 * in force before the first byte is written.
 *
 * @param owner_only Mode 0600 instead of 0644 (before umask)
 * @return Open descriptor owned by the caller, -1 on failure (logged)
 */
int create_file(const std::string& file_path, bool owner_only);

/**
 * @brief Replace a file's contents, creating parent directories
 *
 * The content is staged in <file_path>.tmp and renamed over the target.
 *
 * @param owner_only Restrict permissions to owner read/write (0600)
 * @return false on any I/O failure, which is logged
 */
bool write_file(const std::string& file_path, const std::string& content, bool owner_only = false);

/**
 * @brief SHA-256 digest of a byte string as lowercase hex
 */
std::string sha256_hex(const std::vector<uint8_t>& data);

// ============================================================================
// Strings
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim_string(const std::string& str);
std::string to_lowercase(std::string str);
bool starts_with(const std::string& str, const std::string& prefix);

// ============================================================================
// Environment
// ============================================================================

/// Value of an environment variable; unset and empty both yield default_value
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Hostname of current machine, "unknown" if unavailable
 */
std::string get_hostname();

/// Lowercase alphanumeric string, not for key material
std::string generate_random_string(size_t length);

} // namespace utilities
} // namespace agentlink
