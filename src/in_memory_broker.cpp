/**
 * @file in_memory_broker.cpp
 * @brief Implementation of the in-process broker
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/in_memory_broker.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/subjects.hpp"
#include "agentlink/utilities.hpp"

#include <algorithm>

namespace agentlink {

namespace {

constexpr const char* ACK_PREFIX = "$MEM.ACK.";

/// Upper bound on one condition wait so ack-wait expiry is noticed
constexpr auto POLL_SLICE = std::chrono::milliseconds(50);

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

InMemoryBroker::InMemoryBroker(Clock clock)
    : clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

InMemoryBroker::~InMemoryBroker() {
    close();
}

void InMemoryBroker::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    utilities::log_debug("InMemoryBroker: connected");
}

void InMemoryBroker::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return;
        }
        connected_ = false;
        subscriptions_.clear();
    }
    available_.notify_all();
    utilities::log_debug("InMemoryBroker: closed");
}

bool InMemoryBroker::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

void InMemoryBroker::require_connected_locked() const {
    if (!connected_) {
        throw ConnectionError("in-memory broker is not connected");
    }
}

// ============================================================================
// Provisioning
// ============================================================================

void InMemoryBroker::ensure_stream(const StreamSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_connected_locked();

    if (spec.name.empty() || spec.subjects.empty()) {
        throw BrokerError("stream needs a name and at least one subject", 10052);
    }

    auto it = streams_.find(spec.name);
    if (it != streams_.end()) {
        it->second.spec = spec;
        enforce_limits_locked(it->second);
        utilities::log_debug("InMemoryBroker: stream updated " + spec.name);
        return;
    }

    Stream stream;
    stream.spec = spec;
    streams_.emplace(spec.name, std::move(stream));
    utilities::log_debug("InMemoryBroker: stream created " + spec.name);
}

void InMemoryBroker::ensure_consumer(const std::string& stream_name, const ConsumerSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_connected_locked();

    auto it = streams_.find(stream_name);
    if (it == streams_.end()) {
        throw BrokerError("stream not found: " + stream_name, 10059);
    }

    auto& consumers = it->second.consumers;
    if (consumers.count(spec.durable_name) > 0) {
        return;
    }

    Consumer consumer;
    consumer.spec = spec;
    consumers.emplace(spec.durable_name, std::move(consumer));
    utilities::log_debug("InMemoryBroker: consumer created " + stream_name + "/" + spec.durable_name);
}

// ============================================================================
// Publishing
// ============================================================================

InMemoryBroker::Stream* InMemoryBroker::capturing_stream_locked(const std::string& subject) {
    for (auto& [name, stream] : streams_) {
        for (const auto& pattern : stream.spec.subjects) {
            if (subjects::subject_matches(pattern, subject)) {
                return &stream;
            }
        }
    }
    return nullptr;
}

uint64_t InMemoryBroker::store_locked(Stream& stream, const std::string& subject, const std::string& data) {
    StoredMessage stored{++stream.last_sequence, subject, data, clock_()};
    stream.bytes += static_cast<int64_t>(data.size());
    stream.messages.push_back(std::move(stored));
    enforce_limits_locked(stream);
    return stream.last_sequence;
}

void InMemoryBroker::enforce_limits_locked(Stream& stream) {
    auto now = clock_();

    auto evict_front = [&stream]() {
        stream.bytes -= static_cast<int64_t>(stream.messages.front().data.size());
        stream.messages.pop_front();
    };

    if (stream.spec.max_age.count() > 0) {
        while (!stream.messages.empty() &&
               now - stream.messages.front().stored_at > stream.spec.max_age) {
            evict_front();
        }
    }

    if (stream.spec.max_bytes >= 0) {
        while (!stream.messages.empty() && stream.bytes > stream.spec.max_bytes) {
            evict_front();
        }
    }
}

PublishAck InMemoryBroker::publish(const std::string& subject, const std::string& data) {
    PublishAck ack;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_connected_locked();

        Stream* stream = capturing_stream_locked(subject);
        if (stream == nullptr) {
            throw BrokerError("no stream captures subject " + subject, 503);
        }

        ack.stream = stream->spec.name;
        ack.sequence = store_locked(*stream, subject, data);
    }

    available_.notify_all();
    dispatch_core(subject, data);
    return ack;
}

void InMemoryBroker::publish_core(const std::string& subject, const std::string& data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_connected_locked();

        Stream* stream = capturing_stream_locked(subject);
        if (stream != nullptr) {
            store_locked(*stream, subject, data);
        }
    }

    available_.notify_all();
    dispatch_core(subject, data);
}

void InMemoryBroker::dispatch_core(const std::string& subject, const std::string& data) {
    std::vector<MessageCallback> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : subscriptions_) {
            if (subjects::subject_matches(entry.first, subject)) {
                targets.push_back(entry.second);
            }
        }
    }

    BrokerMessage message;
    message.subject = subject;
    message.data = data;

    for (const auto& callback : targets) {
        try {
            callback(message);
        } catch (const std::exception& e) {
            utilities::log_error("InMemoryBroker: subscriber on " + subject + " failed: " + std::string(e.what()));
        }
    }
}

// ============================================================================
// Core Subscriptions
// ============================================================================

uint64_t InMemoryBroker::subscribe(const std::string& subject, MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_connected_locked();

    uint64_t id = next_subscription_id_++;
    subscriptions_.emplace(id, std::make_pair(subject, std::move(callback)));
    return id;
}

void InMemoryBroker::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(subscription_id);
}

// ============================================================================
// Pull Consumers
// ============================================================================

const InMemoryBroker::StoredMessage* InMemoryBroker::find_message_locked(const Stream& stream,
                                                                         uint64_t sequence) const {
    auto it = std::lower_bound(
        stream.messages.begin(), stream.messages.end(), sequence,
        [](const StoredMessage& m, uint64_t seq) { return m.sequence < seq; });

    if (it == stream.messages.end() || it->sequence != sequence) {
        return nullptr;
    }
    return &*it;
}

bool InMemoryBroker::exhausted_locked(const Stream& stream, Consumer& consumer, uint64_t sequence) {
    auto it = consumer.deliveries.find(sequence);
    if (it == consumer.deliveries.end() ||
        it->second < static_cast<uint64_t>(consumer.spec.max_deliver)) {
        return false;
    }

    utilities::log_error("InMemoryBroker: " + stream.spec.name + "/" + consumer.spec.durable_name +
                         " dropped sequence " + std::to_string(sequence) +
                         " after " + std::to_string(it->second) + " deliveries");
    consumer.deliveries.erase(it);
    consumer.redeliver.erase(sequence);
    consumer.in_flight.erase(sequence);
    return true;
}

void InMemoryBroker::expire_in_flight_locked(Stream& stream, Consumer& consumer) {
    auto now = clock_();

    for (auto it = consumer.in_flight.begin(); it != consumer.in_flight.end();) {
        if (it->second > now) {
            ++it;
            continue;
        }
        uint64_t sequence = it->first;
        it = consumer.in_flight.erase(it);
        if (!exhausted_locked(stream, consumer, sequence)) {
            consumer.redeliver.insert(sequence);
        }
    }
}

std::vector<BrokerMessage> InMemoryBroker::collect_locked(Stream& stream, Consumer& consumer, size_t batch) {
    std::vector<BrokerMessage> result;
    auto now = clock_();

    auto deliver = [&](const StoredMessage& stored) {
        uint64_t count = ++consumer.deliveries[stored.sequence];
        consumer.in_flight[stored.sequence] = now + consumer.spec.ack_wait;

        BrokerMessage message;
        message.subject = stored.subject;
        message.data = stored.data;
        message.reply = ack_reply(stream.spec.name, consumer.spec.durable_name, stored.sequence);
        message.stream_sequence = stored.sequence;
        message.delivery_count = count;
        result.push_back(std::move(message));
    };

    expire_in_flight_locked(stream, consumer);

    // Redeliveries first, oldest sequence first
    for (auto it = consumer.redeliver.begin(); it != consumer.redeliver.end() && result.size() < batch;) {
        const StoredMessage* stored = find_message_locked(stream, *it);
        if (stored == nullptr) {
            // Evicted by stream limits
            consumer.deliveries.erase(*it);
        } else {
            deliver(*stored);
        }
        it = consumer.redeliver.erase(it);
    }

    while (result.size() < batch && consumer.cursor <= stream.last_sequence) {
        uint64_t sequence = consumer.cursor++;
        const StoredMessage* stored = find_message_locked(stream, sequence);
        if (stored == nullptr) {
            continue;
        }
        if (!consumer.spec.filter_subject.empty() &&
            !subjects::subject_matches(consumer.spec.filter_subject, stored->subject)) {
            continue;
        }
        deliver(*stored);
    }

    return result;
}

std::vector<BrokerMessage> InMemoryBroker::fetch(const std::string& stream_name,
                                                 const std::string& durable,
                                                 size_t batch,
                                                 std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    require_connected_locked();

    while (true) {
        auto stream_it = streams_.find(stream_name);
        if (stream_it == streams_.end()) {
            throw BrokerError("stream not found: " + stream_name, 10059);
        }
        auto consumer_it = stream_it->second.consumers.find(durable);
        if (consumer_it == stream_it->second.consumers.end()) {
            throw BrokerError("consumer not found: " + durable, 10014);
        }

        auto messages = collect_locked(stream_it->second, consumer_it->second, batch);
        if (!messages.empty()) {
            return messages;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline || !connected_) {
            return {};
        }
        available_.wait_until(lock, std::min(deadline, now + POLL_SLICE));
    }
}

// ============================================================================
// Acknowledgement
// ============================================================================

std::string InMemoryBroker::ack_reply(const std::string& stream, const std::string& durable, uint64_t sequence) {
    return std::string(ACK_PREFIX) + stream + "." + durable + "." + std::to_string(sequence);
}

std::optional<InMemoryBroker::AckHandle> InMemoryBroker::parse_ack_reply(const std::string& reply) {
    if (!utilities::starts_with(reply, ACK_PREFIX)) {
        return std::nullopt;
    }

    auto tokens = utilities::split_string(reply.substr(std::string(ACK_PREFIX).size()), '.');
    if (tokens.size() != 3) {
        return std::nullopt;
    }

    try {
        return AckHandle{tokens[0], tokens[1], std::stoull(tokens[2])};
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

InMemoryBroker::Consumer* InMemoryBroker::consumer_for_locked(const AckHandle& handle) {
    auto stream_it = streams_.find(handle.stream);
    if (stream_it == streams_.end()) {
        return nullptr;
    }
    auto consumer_it = stream_it->second.consumers.find(handle.durable);
    if (consumer_it == stream_it->second.consumers.end()) {
        return nullptr;
    }
    return &consumer_it->second;
}

void InMemoryBroker::ack(const BrokerMessage& message) {
    auto handle = parse_ack_reply(message.reply);
    if (!handle) {
        utilities::log_warn("InMemoryBroker: ack without a stream reply on " + message.subject);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Consumer* consumer = consumer_for_locked(*handle);
    if (consumer == nullptr) {
        return;
    }
    consumer->in_flight.erase(handle->sequence);
    consumer->deliveries.erase(handle->sequence);
    consumer->redeliver.erase(handle->sequence);
}

void InMemoryBroker::nak(const BrokerMessage& message) {
    auto handle = parse_ack_reply(message.reply);
    if (!handle) {
        utilities::log_warn("InMemoryBroker: nak without a stream reply on " + message.subject);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Consumer* consumer = consumer_for_locked(*handle);
        if (consumer == nullptr || consumer->in_flight.erase(handle->sequence) == 0) {
            return;
        }
        if (!exhausted_locked(streams_.at(handle->stream), *consumer, handle->sequence)) {
            consumer->redeliver.insert(handle->sequence);
        }
    }
    available_.notify_all();
}

void InMemoryBroker::term(const BrokerMessage& message) {
    // Terminated messages are forgotten exactly like acknowledged ones
    ack(message);
}

// ============================================================================
// Inspection
// ============================================================================

std::optional<size_t> InMemoryBroker::stream_size(const std::string& stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        return std::nullopt;
    }
    return it->second.messages.size();
}

std::optional<StreamSpec> InMemoryBroker::stream_spec(const std::string& stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        return std::nullopt;
    }
    return it->second.spec;
}

bool InMemoryBroker::has_consumer(const std::string& stream, const std::string& durable) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    return it != streams_.end() && it->second.consumers.count(durable) > 0;
}

size_t InMemoryBroker::in_flight_count(const std::string& stream, const std::string& durable) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        return 0;
    }
    auto consumer = it->second.consumers.find(durable);
    return consumer == it->second.consumers.end() ? 0 : consumer->second.in_flight.size();
}

size_t InMemoryBroker::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace agentlink
