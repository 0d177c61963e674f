/**
 * @file config.cpp
 * @brief Implementation of configuration lookup and validation
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentlink/config.hpp"
#include "agentlink/utilities.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace agentlink {
namespace config {

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    std::string env_data_dir = utilities::get_env("AGENTLINK_DATA_DIR");

    std::filesystem::path data_dir = env_data_dir.empty()
        ? std::filesystem::path("/var/lib/agentlink")
        : std::filesystem::path(env_data_dir);

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

std::filesystem::path get_identity_directory() {
    std::filesystem::path identity_dir = get_data_directory() / "identity";

    if (!std::filesystem::exists(identity_dir)) {
        std::filesystem::create_directories(identity_dir);
    }

    return identity_dir;
}

// ============================================================================
// Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }

    return true;
}

} // namespace config

// ============================================================================
// CoordinationConfig
// ============================================================================

namespace {

std::optional<long long> env_integer(const std::string& name) {
    std::string raw = utilities::trim_string(utilities::get_env(name));
    if (raw.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        utilities::log_warn("Config: ignoring non-numeric " + name + "=" + raw);
        return std::nullopt;
    }
}

std::optional<double> env_double(const std::string& name) {
    std::string raw = utilities::trim_string(utilities::get_env(name));
    if (raw.empty()) {
        return std::nullopt;
    }

    try {
        return std::stod(raw);
    } catch (const std::exception&) {
        utilities::log_warn("Config: ignoring non-numeric " + name + "=" + raw);
        return std::nullopt;
    }
}

} // namespace

CoordinationConfig CoordinationConfig::from_environment() {
    CoordinationConfig cfg;

    cfg.nats_url = utilities::get_env("AGENTLINK_NATS_URL", cfg.nats_url);
    cfg.client_name = utilities::get_env("AGENTLINK_CLIENT_NAME",
                                         "agentlink-" + utilities::get_hostname());
    cfg.log_level = utilities::get_env("AGENTLINK_LOG_LEVEL", cfg.log_level);
    cfg.log_file = utilities::get_env("AGENTLINK_LOG_FILE", cfg.log_file);

    if (auto v = env_integer("AGENTLINK_LIVENESS_WINDOW")) {
        cfg.liveness_window = std::chrono::seconds(*v);
    }
    if (auto v = env_integer("AGENTLINK_RECONNECT_DELAY")) {
        cfg.reconnect_delay = std::chrono::seconds(*v);
    }
    if (auto v = env_double("AGENTLINK_BACKOFF_MULTIPLIER")) {
        cfg.backoff_multiplier = *v;
    }
    if (auto v = env_integer("AGENTLINK_MAX_RECONNECT_ATTEMPTS")) {
        cfg.max_reconnect_attempts = static_cast<int>(*v);
    }
    if (auto v = env_integer("AGENTLINK_FETCH_BATCH")) {
        cfg.fetch_batch = *v > 0 ? static_cast<size_t>(*v) : 0;
    }
    if (auto v = env_integer("AGENTLINK_FETCH_TIMEOUT_MS")) {
        cfg.fetch_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = env_integer("AGENTLINK_MAX_DELIVER")) {
        cfg.max_deliver = static_cast<int>(*v);
    }

    return cfg;
}

std::vector<std::string> CoordinationConfig::validate() const {
    std::vector<std::string> problems;

    if (!utilities::starts_with(nats_url, "nats://")) {
        problems.push_back("nats_url must start with nats://");
    }
    if (liveness_window.count() <= 0) {
        problems.push_back("liveness_window must be positive");
    }
    if (reconnect_delay.count() < 0) {
        problems.push_back("reconnect_delay must not be negative");
    }
    if (backoff_multiplier < 1.0) {
        problems.push_back("backoff_multiplier must be at least 1.0");
    }
    if (max_reconnect_attempts < 1) {
        problems.push_back("max_reconnect_attempts must be at least 1");
    }
    if (fetch_batch == 0) {
        problems.push_back("fetch_batch must be at least 1");
    }
    if (fetch_timeout.count() <= 0) {
        problems.push_back("fetch_timeout must be positive");
    }
    if (max_deliver < 1) {
        problems.push_back("max_deliver must be at least 1");
    }

    return problems;
}

} // namespace agentlink
