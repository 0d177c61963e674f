/**
 * @file message_types.hpp
 * @brief Agent message envelope and its JSON wire form
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Wire fields (all required unless noted):
 *   message_id, sender_id, receiver_id, type, content, priority,
 *   timestamp, metadata{}, signature (nullable), encrypted (bool)
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {

/// receiver_id addressing every agent
constexpr const char* BROADCAST_RECEIVER = "broadcast";

/**
 * @brief Message kinds carried between agents
 */
enum class MessageType {
    TEXT,          ///< Free-form text
    TASK,          ///< Work request
    RESPONSE,      ///< Reply to a task
    STATUS,        ///< Status update
    ERROR,         ///< Error report
    DISCOVERY,     ///< Discovery traffic
    HEARTBEAT,     ///< Liveness signal
    UNRECOGNIZED   ///< Value outside the protocol; never valid on the wire
};

/**
 * @brief Delivery priority
 */
enum class MessagePriority {
    LOW,
    NORMAL,
    HIGH,
    CRITICAL,
    UNRECOGNIZED
};

/**
 * @brief Message exchanged between agents
 */
struct AgentMessage {
    std::string message_id;                              ///< Sender-assigned unique ID
    std::string sender_id;                               ///< Sender agent ID
    std::string receiver_id;                             ///< Receiver agent ID or BROADCAST_RECEIVER
    MessageType type = MessageType::TEXT;                ///< Message kind
    std::string content;                                 ///< Body (base64 envelope when encrypted)
    MessagePriority priority = MessagePriority::NORMAL;  ///< Priority
    double timestamp = 0.0;                              ///< Epoch seconds
    nlohmann::json metadata = nlohmann::json::object();  ///< Free-form metadata object
    std::optional<std::string> signature;                ///< Base64 Ed25519 signature
    bool encrypted = false;                              ///< content holds an encrypted envelope

    /**
     * @brief Wire document for this message
     */
    nlohmann::json to_json() const;

    /**
     * @brief Compact serialized wire document
     */
    std::string to_json_string() const;

    /**
     * @brief Decode a wire document
     * @throws MalformedMessageError on missing/mistyped fields or unknown enum values
     */
    static AgentMessage from_json(const nlohmann::json& j);

    /**
     * @brief Parse and decode a serialized wire document
     * @throws MalformedMessageError on parse failure or invalid content
     */
    static AgentMessage from_json_string(const std::string& json_str);

    /**
     * @brief Canonical bytes covered by the signature
     *
     * Compact JSON of every field except "signature", keys sorted.
     */
    std::vector<uint8_t> signing_payload() const;
};

/**
 * @brief Helper functions for message enums and identifiers
 */
class MessageHelpers {
public:
    static std::string message_type_to_string(MessageType type);

    /// Unknown strings map to MessageType::UNRECOGNIZED
    static MessageType string_to_message_type(const std::string& str);

    static std::string priority_to_string(MessagePriority priority);

    /// Unknown strings map to MessagePriority::UNRECOGNIZED
    static MessagePriority string_to_priority(const std::string& str);

    /**
     * @brief Build a message ID: <agent_id>-<counter>-<epoch ms>
     */
    static std::string generate_message_id(const std::string& agent_id, uint64_t counter, uint64_t epoch_ms);
};

} // namespace agentlink
