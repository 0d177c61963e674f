/**
 * @file message_handler.hpp
 * @brief Creation, validation, deduplication and dispatch of agent messages
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "agentlink/encryption_channel.hpp"
#include "agentlink/identity_store.hpp"
#include "agentlink/message_types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {

/**
 * @brief Outcome of processing one inbound message
 */
enum class ProcessResult {
    ACCEPTED,   ///< Recorded and dispatched
    DUPLICATE,  ///< Already in the received table; dropped
    REJECTED    ///< Failed validation or decoding; dropped
};

/// Processor invoked for each accepted message of a registered type
using MessageProcessor = std::function<void(const AgentMessage& message)>;

/// Destination for replies the handler synthesizes (e.g. error replies)
using OutboundSink = std::function<void(const AgentMessage& message)>;

/**
 * @brief MessageHandler - per-agent message tables and processor dispatch
 *
 * Keeps a sent table and a received table keyed by message_id. The
 * received table doubles as the duplicate filter. Entries age by the local
 * time they were recorded, never by the sender's timestamp. All tables are
 * guarded by one mutex; processors run outside the lock.
 */
class MessageHandler {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param agent_id Identifier of the owning agent
     * @param clock Time source for table aging (system clock by default)
     */
    explicit MessageHandler(std::string agent_id, Clock clock = nullptr);

    MessageHandler(const MessageHandler&) = delete;
    MessageHandler& operator=(const MessageHandler&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Append a processor for a message type (processors run in registration order)
     */
    void register_processor(MessageType type, MessageProcessor processor);

    /**
     * @brief Replace the processor used when no processor matches a type
     *
     * The default fallback replies to the sender with an ERROR message.
     */
    void set_fallback_processor(MessageProcessor processor);

    /**
     * @brief Where synthesized replies are delivered (none by default)
     */
    void set_outbound_sink(OutboundSink sink);

    // ========================================================================
    // Outbound
    // ========================================================================

    /**
     * @brief Create a message from this agent and record it as sent
     */
    AgentMessage create(const std::string& receiver_id,
                        const std::string& content,
                        MessageType type = MessageType::TEXT,
                        MessagePriority priority = MessagePriority::NORMAL,
                        const nlohmann::json& metadata = nlohmann::json::object());

    /// Broadcast heartbeat: content "heartbeat", LOW priority, metadata {timestamp, status}
    AgentMessage make_heartbeat();

    /// Broadcast STATUS message
    AgentMessage make_status_update(const std::string& status,
                                    const nlohmann::json& metadata = nlohmann::json::object());

    /// HIGH priority ERROR message referencing the message that caused it
    AgentMessage make_error(const std::string& receiver_id,
                            const std::string& error,
                            const std::string& original_message_id = "");

    // ========================================================================
    // Inbound
    // ========================================================================

    /**
     * @brief Check a message against this agent's acceptance rules
     * @return Problems found; empty when the message is acceptable
     */
    std::vector<std::string> validate(const AgentMessage& message) const;

    /**
     * @brief Validate, record, and dispatch a message
     *
     * Processor exceptions are logged per processor and do not stop the
     * remaining processors or undo the received-table update.
     */
    ProcessResult process(const AgentMessage& message);

    /**
     * @brief Decode a serialized message and process it
     *
     * An unrecognized type still produces an error reply to the sender.
     */
    ProcessResult receive(const std::string& wire);

    std::string serialize(const AgentMessage& message) const;

    /// @throws MalformedMessageError
    AgentMessage deserialize(const std::string& wire) const;

    // ========================================================================
    // Envelope security
    // ========================================================================

    /**
     * @brief Sign the canonical form of a message with the local identity
     */
    static void sign_message(AgentMessage& message, const IdentityStore& identity);

    /**
     * @brief Verify a message signature; false when missing or invalid
     */
    static bool verify_message(const AgentMessage& message, const PublicKey& peer_signing_public) noexcept;

    /**
     * @brief Encrypt content for a peer and set the encrypted flag
     */
    static void seal(AgentMessage& message, const EncryptionChannel& channel,
                     const PublicKey& peer_exchange_public);

    /**
     * @brief Decrypt content from a peer and clear the encrypted flag
     * @throws DecryptionError on authentication failure
     */
    static void open(AgentMessage& message, const EncryptionChannel& channel,
                     const PublicKey& peer_exchange_public);

    // ========================================================================
    // Queries and cleanup
    // ========================================================================

    std::optional<AgentMessage> get_message_by_id(const std::string& message_id) const;

    std::vector<AgentMessage> get_sent_messages() const;

    std::vector<AgentMessage> get_received_messages() const;

    /// Sent and received messages of one type
    std::vector<AgentMessage> get_messages_by_type(MessageType type) const;

    /**
     * @brief Evict entries recorded locally more than max_age ago
     * @return Number of entries removed from both tables
     */
    size_t clear_older_than(std::chrono::seconds max_age);

    void clear_all();

    const std::string& agent_id() const { return agent_id_; }

private:
    std::vector<std::string> validate_locked(const AgentMessage& message) const;
    void run_fallback(const AgentMessage& message);
    void reply_unknown_type(const std::string& sender_id,
                            const std::string& type_name,
                            const std::string& original_message_id);

    /// Table entry: the message and when this handler recorded it
    struct Recorded {
        AgentMessage message;
        std::chrono::system_clock::time_point recorded_at;
    };

    std::string agent_id_;
    Clock clock_;
    std::atomic<uint64_t> counter_{0};

    mutable std::mutex mutex_;
    std::map<std::string, Recorded> sent_;
    std::map<std::string, Recorded> received_;
    std::map<MessageType, std::vector<MessageProcessor>> processors_;
    MessageProcessor fallback_;
    OutboundSink outbound_;
};

} // namespace agentlink
