/**
 * @file message_types.cpp
 * @brief Implementation of the agent message wire form
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentlink/message_types.hpp"
#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"

using json = nlohmann::json;

namespace agentlink {

// ============================================================================
// Enum String Conversion
// ============================================================================

std::string MessageHelpers::message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::TEXT: return "text";
        case MessageType::TASK: return "task";
        case MessageType::RESPONSE: return "response";
        case MessageType::STATUS: return "status";
        case MessageType::ERROR: return "error";
        case MessageType::DISCOVERY: return "discovery";
        case MessageType::HEARTBEAT: return "heartbeat";
        case MessageType::UNRECOGNIZED: return "unrecognized";
    }
    return "unrecognized";
}

MessageType MessageHelpers::string_to_message_type(const std::string& str) {
    if (str == "text") return MessageType::TEXT;
    if (str == "task") return MessageType::TASK;
    if (str == "response") return MessageType::RESPONSE;
    if (str == "status") return MessageType::STATUS;
    if (str == "error") return MessageType::ERROR;
    if (str == "discovery") return MessageType::DISCOVERY;
    if (str == "heartbeat") return MessageType::HEARTBEAT;
    return MessageType::UNRECOGNIZED;
}

std::string MessageHelpers::priority_to_string(MessagePriority priority) {
    switch (priority) {
        case MessagePriority::LOW: return "low";
        case MessagePriority::NORMAL: return "normal";
        case MessagePriority::HIGH: return "high";
        case MessagePriority::CRITICAL: return "critical";
        case MessagePriority::UNRECOGNIZED: return "unrecognized";
    }
    return "unrecognized";
}

MessagePriority MessageHelpers::string_to_priority(const std::string& str) {
    if (str == "low") return MessagePriority::LOW;
    if (str == "normal") return MessagePriority::NORMAL;
    if (str == "high") return MessagePriority::HIGH;
    if (str == "critical") return MessagePriority::CRITICAL;
    return MessagePriority::UNRECOGNIZED;
}

std::string MessageHelpers::generate_message_id(const std::string& agent_id, uint64_t counter, uint64_t epoch_ms) {
    return agent_id + "-" + std::to_string(counter) + "-" + std::to_string(epoch_ms);
}

// ============================================================================
// AgentMessage Serialization
// ============================================================================

json AgentMessage::to_json() const {
    json j;
    j["message_id"] = message_id;
    j["sender_id"] = sender_id;
    j["receiver_id"] = receiver_id;
    j["type"] = MessageHelpers::message_type_to_string(type);
    j["content"] = content;
    j["priority"] = MessageHelpers::priority_to_string(priority);
    j["timestamp"] = timestamp;
    j["metadata"] = metadata.is_object() ? metadata : json::object();
    j["signature"] = signature ? json(*signature) : json(nullptr);
    j["encrypted"] = encrypted;
    return j;
}

std::string AgentMessage::to_json_string() const {
    return to_json().dump();
}

namespace {

const json& require_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) {
        throw MalformedMessageError(std::string("missing field '") + name + "'", name);
    }
    return *it;
}

std::string require_string(const json& j, const char* name) {
    const json& value = require_field(j, name);
    if (!value.is_string()) {
        throw MalformedMessageError(std::string("field '") + name + "' must be a string", name);
    }
    return value.get<std::string>();
}

} // namespace

AgentMessage AgentMessage::from_json(const json& j) {
    if (!j.is_object()) {
        throw MalformedMessageError("document is not a JSON object");
    }

    AgentMessage message;
    message.message_id = require_string(j, "message_id");
    message.sender_id = require_string(j, "sender_id");
    message.receiver_id = require_string(j, "receiver_id");
    message.content = require_string(j, "content");

    std::string type_str = require_string(j, "type");
    message.type = MessageHelpers::string_to_message_type(type_str);
    if (message.type == MessageType::UNRECOGNIZED) {
        throw MalformedMessageError("unrecognized message type '" + type_str + "'", "type");
    }

    std::string priority_str = require_string(j, "priority");
    message.priority = MessageHelpers::string_to_priority(priority_str);
    if (message.priority == MessagePriority::UNRECOGNIZED) {
        throw MalformedMessageError("unrecognized priority '" + priority_str + "'", "priority");
    }

    const json& timestamp = require_field(j, "timestamp");
    if (!timestamp.is_number()) {
        throw MalformedMessageError("field 'timestamp' must be a number", "timestamp");
    }
    message.timestamp = timestamp.get<double>();

    const json& metadata = require_field(j, "metadata");
    if (!metadata.is_object()) {
        throw MalformedMessageError("field 'metadata' must be an object", "metadata");
    }
    message.metadata = metadata;

    // signature may be absent or null
    auto sig = j.find("signature");
    if (sig != j.end() && !sig->is_null()) {
        if (!sig->is_string()) {
            throw MalformedMessageError("field 'signature' must be a string or null", "signature");
        }
        message.signature = sig->get<std::string>();
    }

    const json& encrypted = require_field(j, "encrypted");
    if (!encrypted.is_boolean()) {
        throw MalformedMessageError("field 'encrypted' must be a boolean", "encrypted");
    }
    message.encrypted = encrypted.get<bool>();

    return message;
}

AgentMessage AgentMessage::from_json_string(const std::string& json_str) {
    if (json_str.size() > config::MAX_MESSAGE_SIZE) {
        throw MalformedMessageError("message exceeds " + std::to_string(config::MAX_MESSAGE_SIZE) + " bytes");
    }

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw MalformedMessageError(std::string("invalid JSON: ") + e.what());
    }
    return from_json(j);
}

std::vector<uint8_t> AgentMessage::signing_payload() const {
    json j = to_json();
    j.erase("signature");
    // nlohmann::json objects iterate in key order, so dump() is canonical
    std::string canonical = j.dump();
    return std::vector<uint8_t>(canonical.begin(), canonical.end());
}

} // namespace agentlink
