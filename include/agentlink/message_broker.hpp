/**
 * @file message_broker.hpp
 * @brief Abstract broker interface used by the coordination service
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Two implementations exist: NatsBroker talks to a NATS server with
 * JetStream enabled, InMemoryBroker keeps everything in-process.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace agentlink {

/**
 * @brief Durable stream definition
 */
struct StreamSpec {
    std::string name;                    ///< Stream name (AGENT_DISCOVERY, ...)
    std::vector<std::string> subjects;   ///< Captured subject patterns
    std::string retention = "limits";    ///< Retention policy
    int64_t max_bytes = -1;              ///< Size bound (-1 = unbounded)
    std::chrono::seconds max_age{0};     ///< Age bound (0 = unbounded)
    std::string storage = "file";        ///< Storage backend
};

/**
 * @brief Durable pull consumer definition
 */
struct ConsumerSpec {
    std::string durable_name;            ///< Durable name
    std::string filter_subject;          ///< Subject filter within the stream
    std::string ack_policy = "explicit"; ///< Only explicit ack is used
    int max_deliver = 5;                 ///< Delivery attempts before the message is dropped
    std::chrono::seconds ack_wait{30};   ///< Redelivery timeout for unacked messages
};

/**
 * @brief A message delivered by the broker
 *
 * reply is the ack handle for stream messages and the reply subject for
 * core messages (empty when none).
 */
struct BrokerMessage {
    std::string subject;
    std::string data;
    std::string reply;
    uint64_t stream_sequence = 0;
    uint64_t delivery_count = 1;   ///< 1 on first delivery
};

/**
 * @brief Stream acknowledgement of a durable publish
 */
struct PublishAck {
    std::string stream;
    uint64_t sequence = 0;
};

using MessageCallback = std::function<void(const BrokerMessage& message)>;

/**
 * @brief MessageBroker - pub/sub plus durable streams with pull consumers
 *
 * All operations may be called from any thread. Core subscription
 * callbacks run on a broker-owned thread (or the publisher's thread for
 * the in-memory broker) and must not block for long.
 */
class MessageBroker {
public:
    virtual ~MessageBroker() = default;

    /**
     * @brief Open the connection
     * @throws ConnectionError if the broker is unreachable
     */
    virtual void connect() = 0;

    /**
     * @brief Drain and close; safe to call more than once
     */
    virtual void close() = 0;

    virtual bool is_connected() const = 0;

    /**
     * @brief Create the stream or update it to match spec
     * @throws BrokerError on API rejection
     */
    virtual void ensure_stream(const StreamSpec& spec) = 0;

    /**
     * @brief Create the durable consumer if it does not exist
     * @throws BrokerError on API rejection
     */
    virtual void ensure_consumer(const std::string& stream, const ConsumerSpec& spec) = 0;

    /**
     * @brief Durable publish; returns once a stream has stored the message
     * @throws BrokerError if no stream captures the subject
     */
    virtual PublishAck publish(const std::string& subject, const std::string& data) = 0;

    /**
     * @brief Fire-and-forget publish to core subscribers
     *
     * Streams capturing the subject still store the message.
     */
    virtual void publish_core(const std::string& subject, const std::string& data) = 0;

    /**
     * @brief Core subscription; subject may contain * and > wildcards
     * @return Subscription ID for unsubscribe()
     */
    virtual uint64_t subscribe(const std::string& subject, MessageCallback callback) = 0;

    virtual void unsubscribe(uint64_t subscription_id) = 0;

    /**
     * @brief Pull up to batch messages from a durable consumer
     *
     * Returns early with what is available; an empty result means the
     * timeout elapsed with nothing pending.
     */
    virtual std::vector<BrokerMessage> fetch(const std::string& stream,
                                             const std::string& durable,
                                             size_t batch,
                                             std::chrono::milliseconds timeout) = 0;

    /// Positive acknowledgement; the message is not delivered again
    virtual void ack(const BrokerMessage& message) = 0;

    /// Negative acknowledgement; the message is redelivered
    virtual void nak(const BrokerMessage& message) = 0;

    /// Terminate; the message is never redelivered
    virtual void term(const BrokerMessage& message) = 0;
};

} // namespace agentlink
