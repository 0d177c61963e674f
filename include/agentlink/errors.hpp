/**
 * @file errors.hpp
 * @brief Exception hierarchy for AgentLink
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Failure kinds surfaced at module boundaries:
 * - ConnectionError: broker unreachable, retry ceiling exceeded
 * - ValidationError / MalformedMessageError: bad input or wire data
 * - CryptoError / DecryptionError: key or authentication failures
 * - DeliveryError: handler failure that should trigger redelivery
 * - StorageError: identity persistence failures
 */

#pragma once

#include <stdexcept>
#include <string>

namespace agentlink {

/**
 * @brief Base exception for all AgentLink errors
 */
class AgentLinkError : public std::runtime_error {
public:
    explicit AgentLinkError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Broker connection failure (retryable up to a ceiling)
 */
class ConnectionError : public AgentLinkError {
public:
    explicit ConnectionError(const std::string& message)
        : AgentLinkError("Connection error: " + message) {}
};

/**
 * @brief Error reply from the broker's management API
 */
class BrokerError : public AgentLinkError {
public:
    BrokerError(const std::string& message, int error_code = 0)
        : AgentLinkError("Broker error: " + message),
          error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

/**
 * @brief Invalid input (identifiers, configuration, messages)
 */
class ValidationError : public AgentLinkError {
public:
    explicit ValidationError(const std::string& message)
        : AgentLinkError("Validation error: " + message) {}

protected:
    struct raw_tag {};
    ValidationError(raw_tag, const std::string& message)
        : AgentLinkError(message) {}
};

/**
 * @brief Wire message that cannot be decoded
 */
class MalformedMessageError : public ValidationError {
public:
    explicit MalformedMessageError(const std::string& message,
                                   std::string field = "")
        : ValidationError(raw_tag{}, "Malformed message: " + message),
          field_(std::move(field)) {}

    /// Offending field name, empty when the document itself is unreadable
    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Cryptographic failure; never retryable for the affected message
 */
class CryptoError : public AgentLinkError {
public:
    explicit CryptoError(const std::string& message)
        : AgentLinkError("Crypto error: " + message) {}

protected:
    struct raw_tag {};
    CryptoError(raw_tag, const std::string& message)
        : AgentLinkError(message) {}
};

/**
 * @brief Authenticated decryption failed (bad tag or envelope length)
 */
class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError(raw_tag{}, "Decryption failed: " + message) {}
};

/**
 * @brief Message handler failure; the broker should redeliver
 */
class DeliveryError : public AgentLinkError {
public:
    explicit DeliveryError(const std::string& message)
        : AgentLinkError("Delivery error: " + message) {}
};

/**
 * @brief Identity persistence failure
 */
class StorageError : public AgentLinkError {
public:
    explicit StorageError(const std::string& message)
        : AgentLinkError("Storage error: " + message) {}
};

} // namespace agentlink
