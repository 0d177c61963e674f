/**
 * @file message_handler.cpp
 * @brief Implementation of message tables and processor dispatch
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentlink/message_handler.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/utilities.hpp"

using json = nlohmann::json;

namespace agentlink {

MessageHandler::MessageHandler(std::string agent_id, Clock clock)
    : agent_id_(std::move(agent_id))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

// ============================================================================
// Registration
// ============================================================================

void MessageHandler::register_processor(MessageType type, MessageProcessor processor) {
    std::lock_guard<std::mutex> lock(mutex_);
    processors_[type].push_back(std::move(processor));
    utilities::log_debug("MessageHandler: processor registered for " +
                         MessageHelpers::message_type_to_string(type));
}

void MessageHandler::set_fallback_processor(MessageProcessor processor) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallback_ = std::move(processor);
}

void MessageHandler::set_outbound_sink(OutboundSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    outbound_ = std::move(sink);
}

// ============================================================================
// Outbound
// ============================================================================

AgentMessage MessageHandler::create(const std::string& receiver_id,
                                    const std::string& content,
                                    MessageType type,
                                    MessagePriority priority,
                                    const json& metadata) {
    AgentMessage message;
    message.message_id = MessageHelpers::generate_message_id(
        agent_id_, ++counter_, utilities::current_time_ms());
    message.sender_id = agent_id_;
    message.receiver_id = receiver_id;
    message.type = type;
    message.content = content;
    message.priority = priority;
    message.timestamp = utilities::current_time_seconds();
    message.metadata = metadata.is_object() ? metadata : json::object();

    std::lock_guard<std::mutex> lock(mutex_);
    sent_[message.message_id] = Recorded{message, clock_()};
    return message;
}

AgentMessage MessageHandler::make_heartbeat() {
    return create(BROADCAST_RECEIVER, "heartbeat", MessageType::HEARTBEAT, MessagePriority::LOW,
                  {{"timestamp", utilities::current_time_seconds()}, {"status", "online"}});
}

AgentMessage MessageHandler::make_status_update(const std::string& status, const json& metadata) {
    return create(BROADCAST_RECEIVER, status, MessageType::STATUS, MessagePriority::NORMAL, metadata);
}

AgentMessage MessageHandler::make_error(const std::string& receiver_id,
                                        const std::string& error,
                                        const std::string& original_message_id) {
    json metadata = {
        {"original_message_id", original_message_id.empty() ? json(nullptr) : json(original_message_id)},
        {"timestamp", utilities::current_time_seconds()}
    };
    return create(receiver_id, error, MessageType::ERROR, MessagePriority::HIGH, metadata);
}

// ============================================================================
// Inbound
// ============================================================================

std::vector<std::string> MessageHandler::validate(const AgentMessage& message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validate_locked(message);
}

std::vector<std::string> MessageHandler::validate_locked(const AgentMessage& message) const {
    std::vector<std::string> errors;

    if (message.message_id.empty()) errors.push_back("missing message_id");
    if (message.sender_id.empty()) errors.push_back("missing sender_id");
    if (message.receiver_id.empty()) errors.push_back("missing receiver_id");
    if (message.content.empty()) errors.push_back("missing content");

    if (!message.receiver_id.empty() &&
        message.receiver_id != agent_id_ && message.receiver_id != BROADCAST_RECEIVER) {
        errors.push_back("receiver '" + message.receiver_id + "' is not this agent");
    }

    if (!message.message_id.empty() && received_.count(message.message_id) > 0) {
        errors.push_back("duplicate message_id '" + message.message_id + "'");
    }

    if (message.type == MessageType::UNRECOGNIZED) {
        errors.push_back("unrecognized message type");
    }
    if (message.priority == MessagePriority::UNRECOGNIZED) {
        errors.push_back("unrecognized priority");
    }

    return errors;
}

ProcessResult MessageHandler::process(const AgentMessage& message) {
    std::vector<MessageProcessor> processors;
    bool accepted = false;
    bool reply_unknown = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (received_.count(message.message_id) > 0) {
            utilities::log_warn("MessageHandler: duplicate message dropped: " + message.message_id);
            return ProcessResult::DUPLICATE;
        }

        auto errors = validate_locked(message);
        if (!errors.empty()) {
            std::string joined;
            for (const auto& error : errors) {
                joined += (joined.empty() ? "" : "; ") + error;
            }
            utilities::log_warn("MessageHandler: rejected message " + message.message_id + ": " + joined);

            reply_unknown = message.type == MessageType::UNRECOGNIZED && !message.sender_id.empty();
        } else {
            accepted = true;
            received_[message.message_id] = Recorded{message, clock_()};

            auto it = processors_.find(message.type);
            if (it != processors_.end()) {
                processors = it->second;
            }
        }
    }

    if (!accepted) {
        if (reply_unknown) {
            reply_unknown_type(message.sender_id, "unrecognized", message.message_id);
        }
        return ProcessResult::REJECTED;
    }

    if (processors.empty()) {
        utilities::log_warn("MessageHandler: no processor for message type " +
                            MessageHelpers::message_type_to_string(message.type));
        run_fallback(message);
        return ProcessResult::ACCEPTED;
    }

    for (const auto& processor : processors) {
        try {
            processor(message);
        } catch (const std::exception& e) {
            utilities::log_error("MessageHandler: processor failed for " + message.message_id +
                                 ": " + std::string(e.what()));
        }
    }

    return ProcessResult::ACCEPTED;
}

ProcessResult MessageHandler::receive(const std::string& wire) {
    AgentMessage message;
    try {
        message = deserialize(wire);
    } catch (const MalformedMessageError& e) {
        utilities::log_warn("MessageHandler: " + std::string(e.what()));

        if (e.field() == "type") {
            // Readable enough to answer: tell the sender its type is unknown
            try {
                json doc = json::parse(wire);
                std::string sender = doc.value("sender_id", "");
                std::string type_name = doc.value("type", "");
                std::string original_id = doc.value("message_id", "");
                if (!sender.empty()) {
                    reply_unknown_type(sender, type_name, original_id);
                }
            } catch (const json::exception& parse_error) {
                utilities::log_debug("MessageHandler: cannot read sender of malformed message: " +
                                     std::string(parse_error.what()));
            }
        }
        return ProcessResult::REJECTED;
    }

    return process(message);
}

std::string MessageHandler::serialize(const AgentMessage& message) const {
    return message.to_json_string();
}

AgentMessage MessageHandler::deserialize(const std::string& wire) const {
    return AgentMessage::from_json_string(wire);
}

void MessageHandler::run_fallback(const AgentMessage& message) {
    MessageProcessor fallback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback = fallback_;
    }

    if (fallback) {
        try {
            fallback(message);
        } catch (const std::exception& e) {
            utilities::log_error("MessageHandler: fallback processor failed for " + message.message_id +
                                 ": " + std::string(e.what()));
        }
        return;
    }

    // Never answer an error with an error
    if (message.type == MessageType::ERROR) {
        return;
    }
    reply_unknown_type(message.sender_id, MessageHelpers::message_type_to_string(message.type),
                       message.message_id);
}

void MessageHandler::reply_unknown_type(const std::string& sender_id,
                                        const std::string& type_name,
                                        const std::string& original_message_id) {
    AgentMessage reply = make_error(sender_id, "Unknown message type: " + type_name, original_message_id);
    utilities::log_debug("MessageHandler: error reply created: " + reply.message_id);

    OutboundSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = outbound_;
    }
    if (!sink) {
        return;
    }

    try {
        sink(reply);
    } catch (const std::exception& e) {
        utilities::log_error("MessageHandler: failed to send error reply " + reply.message_id +
                             ": " + std::string(e.what()));
    }
}

// ============================================================================
// Envelope security
// ============================================================================

void MessageHandler::sign_message(AgentMessage& message, const IdentityStore& identity) {
    message.signature.reset();
    auto signature = identity.sign(message.signing_payload());
    message.signature = AgentCrypto::bytes_to_base64(signature);
}

bool MessageHandler::verify_message(const AgentMessage& message, const PublicKey& peer_signing_public) noexcept {
    if (!message.signature) {
        return false;
    }

    try {
        auto signature = AgentCrypto::base64_to_bytes(*message.signature);
        if (!signature) {
            return false;
        }
        return IdentityStore::verify(message.signing_payload(), *signature, peer_signing_public);
    } catch (const std::exception& e) {
        utilities::log_warn("MessageHandler: signature check failed: " + std::string(e.what()));
        return false;
    }
}

void MessageHandler::seal(AgentMessage& message, const EncryptionChannel& channel,
                          const PublicKey& peer_exchange_public) {
    if (message.encrypted) {
        return;
    }
    message.content = channel.encrypt_text_for_peer(message.content, peer_exchange_public);
    message.encrypted = true;
}

void MessageHandler::open(AgentMessage& message, const EncryptionChannel& channel,
                          const PublicKey& peer_exchange_public) {
    if (!message.encrypted) {
        return;
    }
    message.content = channel.decrypt_text_from_peer(message.content, peer_exchange_public);
    message.encrypted = false;
}

// ============================================================================
// Queries and cleanup
// ============================================================================

std::optional<AgentMessage> MessageHandler::get_message_by_id(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto sent = sent_.find(message_id);
    if (sent != sent_.end()) {
        return sent->second.message;
    }
    auto received = received_.find(message_id);
    if (received != received_.end()) {
        return received->second.message;
    }
    return std::nullopt;
}

std::vector<AgentMessage> MessageHandler::get_sent_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentMessage> result;
    result.reserve(sent_.size());
    for (const auto& [id, entry] : sent_) {
        result.push_back(entry.message);
    }
    return result;
}

std::vector<AgentMessage> MessageHandler::get_received_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentMessage> result;
    result.reserve(received_.size());
    for (const auto& [id, entry] : received_) {
        result.push_back(entry.message);
    }
    return result;
}

std::vector<AgentMessage> MessageHandler::get_messages_by_type(MessageType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentMessage> result;
    for (const auto* table : {&sent_, &received_}) {
        for (const auto& [id, entry] : *table) {
            if (entry.message.type == type) {
                result.push_back(entry.message);
            }
        }
    }
    return result;
}

size_t MessageHandler::clear_older_than(std::chrono::seconds max_age) {
    auto cutoff = clock_() - max_age;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* table : {&sent_, &received_}) {
        for (auto it = table->begin(); it != table->end();) {
            if (it->second.recorded_at < cutoff) {
                it = table->erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        utilities::log_debug("MessageHandler: cleared " + std::to_string(removed) + " old messages");
    }
    return removed;
}

void MessageHandler::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.clear();
    received_.clear();
}

} // namespace agentlink
