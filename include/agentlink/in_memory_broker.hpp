/**
 * @file in_memory_broker.hpp
 * @brief In-process broker with durable streams and pull consumers
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Mirrors the JetStream semantics the coordination service relies on:
 * - Streams capture subjects and enforce age and byte limits
 * - Durable pull consumers with subject filter and explicit ack
 * - Redelivery after nak or ack-wait expiry, dropped after max_deliver
 * - Competing fetchers on one durable each receive distinct messages
 * - Core subscriptions with wildcards, dispatched on the publisher's thread
 */

#pragma once

#include "agentlink/message_broker.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentlink {

/**
 * @brief InMemoryBroker - MessageBroker without a server
 *
 * Used by tests and single-process deployments.
 */
class InMemoryBroker : public MessageBroker {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param clock Time source for ack-wait and age limits (system clock by default)
     */
    explicit InMemoryBroker(Clock clock = nullptr);
    ~InMemoryBroker() override;

    InMemoryBroker(const InMemoryBroker&) = delete;
    InMemoryBroker& operator=(const InMemoryBroker&) = delete;

    // MessageBroker
    void connect() override;
    void close() override;
    bool is_connected() const override;
    void ensure_stream(const StreamSpec& spec) override;
    void ensure_consumer(const std::string& stream, const ConsumerSpec& spec) override;
    PublishAck publish(const std::string& subject, const std::string& data) override;
    void publish_core(const std::string& subject, const std::string& data) override;
    uint64_t subscribe(const std::string& subject, MessageCallback callback) override;
    void unsubscribe(uint64_t subscription_id) override;
    std::vector<BrokerMessage> fetch(const std::string& stream,
                                     const std::string& durable,
                                     size_t batch,
                                     std::chrono::milliseconds timeout) override;
    void ack(const BrokerMessage& message) override;
    void nak(const BrokerMessage& message) override;
    void term(const BrokerMessage& message) override;

    // ========================================================================
    // Inspection
    // ========================================================================

    /// Messages currently retained by a stream, nullopt if it does not exist
    std::optional<size_t> stream_size(const std::string& stream) const;

    /// Copy of a stream definition
    std::optional<StreamSpec> stream_spec(const std::string& stream) const;

    bool has_consumer(const std::string& stream, const std::string& durable) const;

    /// Delivered but not yet acknowledged messages on a consumer
    size_t in_flight_count(const std::string& stream, const std::string& durable) const;

    size_t subscription_count() const;

private:
    struct StoredMessage {
        uint64_t sequence;
        std::string subject;
        std::string data;
        std::chrono::system_clock::time_point stored_at;
    };

    struct Consumer {
        ConsumerSpec spec;
        uint64_t cursor = 1;                                               ///< Next unseen stream sequence
        std::map<uint64_t, uint64_t> deliveries;                           ///< Sequence -> deliveries so far
        std::map<uint64_t, std::chrono::system_clock::time_point> in_flight; ///< Sequence -> ack deadline
        std::set<uint64_t> redeliver;                                      ///< Awaiting redelivery
    };

    struct Stream {
        StreamSpec spec;
        std::deque<StoredMessage> messages;
        int64_t bytes = 0;
        uint64_t last_sequence = 0;
        std::map<std::string, Consumer> consumers;
    };

    struct AckHandle {
        std::string stream;
        std::string durable;
        uint64_t sequence;
    };

    void require_connected_locked() const;
    Stream* capturing_stream_locked(const std::string& subject);
    uint64_t store_locked(Stream& stream, const std::string& subject, const std::string& data);
    void enforce_limits_locked(Stream& stream);
    const StoredMessage* find_message_locked(const Stream& stream, uint64_t sequence) const;
    void expire_in_flight_locked(Stream& stream, Consumer& consumer);
    bool exhausted_locked(const Stream& stream, Consumer& consumer, uint64_t sequence);
    std::vector<BrokerMessage> collect_locked(Stream& stream, Consumer& consumer, size_t batch);
    void dispatch_core(const std::string& subject, const std::string& data);
    Consumer* consumer_for_locked(const AckHandle& handle);

    static std::string ack_reply(const std::string& stream, const std::string& durable, uint64_t sequence);
    static std::optional<AckHandle> parse_ack_reply(const std::string& reply);

    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    bool connected_ = false;
    std::map<std::string, Stream> streams_;
    std::map<uint64_t, std::pair<std::string, MessageCallback>> subscriptions_;
    uint64_t next_subscription_id_ = 1;
};

} // namespace agentlink
