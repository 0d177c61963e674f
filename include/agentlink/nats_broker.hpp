/**
 * @file nats_broker.hpp
 * @brief MessageBroker backed by a NATS server with JetStream
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Speaks the NATS client protocol over a single TCP connection:
 * - Blocking writes from caller threads, serialized by a mutex
 * - One reader thread parsing server operations
 * - One dispatcher thread running core subscription callbacks, so a
 *   callback may itself make requests without stalling the reader
 * - Request/reply through a per-connection inbox subscription
 * - JetStream management and pull consumers through the $JS.API subjects
 */

#pragma once

#include "agentlink/message_broker.hpp"
#include "agentlink/nats_protocol.hpp"
#include "agentlink/config.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agentlink {

/**
 * @brief NatsBroker - JetStream client
 */
class NatsBroker : public MessageBroker {
public:
    /**
     * @param url nats://[user:pass@]host[:port]
     * @param client_name Connection name reported to the server
     * @param request_timeout Timeout for API requests and durable publishes
     */
    NatsBroker(std::string url,
               std::string client_name,
               std::chrono::milliseconds request_timeout = config::REQUEST_TIMEOUT);

    ~NatsBroker() override;

    NatsBroker(const NatsBroker&) = delete;
    NatsBroker& operator=(const NatsBroker&) = delete;

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

    /// INFO received during the handshake
    nats::ServerInfo server_info() const;

private:
    /// Replies collected for one outstanding request
    struct PendingRequest {
        size_t expected = 1;
        std::vector<BrokerMessage> replies;
        int status = 0;
        bool done = false;
    };

    std::string read_line();
    std::string read_payload(size_t size);
    /// Core message waiting for the dispatcher
    struct Delivery {
        uint64_t sid;
        BrokerMessage message;
    };

    void send(const std::string& data);
    void handshake();
    void read_loop();
    void dispatch_loop();
    bool on_dispatcher_thread() const;
    void start_dispatcher();
    void stop_dispatcher();
    void handle_message(const nats::ControlLine& control, const std::string& payload);
    void fail_pending_locked();

    /**
     * @brief Publish with a fresh inbox reply and collect up to max_replies
     *
     * With own_subscription the reply inbox gets a SUB of its own and
     * replies are matched by sid, for pulls whose messages arrive under
     * their stream subject.
     *
     * @return Replies received before the deadline or a terminal status
     */
    std::vector<BrokerMessage> request_many(const std::string& subject,
                                            const std::string& payload,
                                            size_t max_replies,
                                            std::chrono::milliseconds timeout,
                                            int* status = nullptr,
                                            bool own_subscription = false);

    /**
     * @brief JetStream API call
     * @throws ConnectionError on timeout, BrokerError on an error reply
     */
    nlohmann::json api_request(const std::string& subject, const std::string& payload);

    void send_ack(const BrokerMessage& message, const char* verb);

    std::string url_;
    std::string client_name_;
    std::chrono::milliseconds request_timeout_;

    asio::io_context io_context_;
    std::unique_ptr<asio::ip::tcp::socket> socket_;
    asio::streambuf buffer_;
    std::thread reader_;
    std::mutex write_mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};

    mutable std::mutex mutex_;
    std::condition_variable replies_cv_;
    nats::ServerInfo server_info_;
    uint64_t pongs_ = 0;
    std::map<uint64_t, std::pair<std::string, MessageCallback>> subscriptions_;
    uint64_t next_sid_ = 1;
    std::string inbox_prefix_;
    uint64_t inbox_sid_ = 0;
    uint64_t next_request_ = 1;
    std::map<std::string, std::shared_ptr<PendingRequest>> requests_;
    std::map<uint64_t, std::shared_ptr<PendingRequest>> pulls_;

    std::thread dispatcher_;
    std::atomic<std::thread::id> dispatcher_id_{};
    std::condition_variable dispatch_cv_;
    std::deque<Delivery> deliveries_;
    bool dispatching_ = false;
    uint64_t active_sid_ = 0;   ///< Subscription whose callback is running, 0 when idle
};

} // namespace agentlink
