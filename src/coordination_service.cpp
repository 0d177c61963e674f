/**
 * @file coordination_service.cpp
 * @brief Implementation of the coordination service
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/coordination_service.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/subjects.hpp"
#include "agentlink/utilities.hpp"

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace agentlink {

namespace {

/// Pause after a failed fetch before polling again
constexpr auto FETCH_ERROR_BACKOFF = std::chrono::milliseconds(500);

/// Upper bound on how often the monitor checks the broker link
constexpr auto MONITOR_INTERVAL = std::chrono::milliseconds(1000);

/// Own event IDs kept for echo suppression
constexpr size_t PUBLISHED_EVENT_MEMORY = 1024;

std::string default_service_id() {
    return "coordination-service-" + utilities::get_hostname() + "-" + utilities::generate_random_string(6);
}

void require_identifier(const std::string& id, const char* what) {
    if (!config::validate_identifier(id)) {
        throw ValidationError(std::string("invalid ") + what + " '" + id + "'");
    }
}

std::optional<json> parse_payload(const BrokerMessage& message) {
    json payload = json::parse(message.data, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        utilities::log_warn("CoordinationService: unreadable payload on " + message.subject);
        return std::nullopt;
    }
    return payload;
}

} // namespace

json HealthStatus::to_json() const {
    return {
        {"connected", connected},
        {"agent_count", agent_count},
        {"online_agents", online_agents},
        {"subscriptions", subscriptions}
    };
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

CoordinationService::CoordinationService(std::shared_ptr<MessageBroker> broker,
                                         CoordinationConfig settings,
                                         std::string service_id,
                                         Clock clock)
    : broker_(std::move(broker))
    , settings_(std::move(settings))
    , service_id_(service_id.empty() ? default_service_id() : std::move(service_id))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    , registry_(settings_.liveness_window, clock_)
    , events_(service_id_)
{
    if (!broker_) {
        throw ValidationError("coordination service needs a broker");
    }

    auto problems = settings_.validate();
    if (!problems.empty()) {
        std::string joined;
        for (const auto& problem : problems) {
            joined += (joined.empty() ? "" : "; ") + problem;
        }
        throw ValidationError(joined);
    }

    utilities::log_info("CoordinationService: " + service_id_ + " initialized for " + settings_.nats_url);
}

CoordinationService::~CoordinationService() {
    try {
        disconnect();
    } catch (const std::exception& e) {
        utilities::log_error("CoordinationService: error during shutdown: " + std::string(e.what()));
    }
    stop_monitor();
}

// ============================================================================
// Connection Management
// ============================================================================

void CoordinationService::connect() {
    std::unique_lock<std::mutex> lock(connection_mutex_);
    if (connected_) {
        if (!broker_->is_connected()) {
            restore_link_locked();
            lock.unlock();
            events_.dispatch(events_.make_event(EventType::SYSTEM_READY,
                                                {{"service", service_id_}, {"reconnected", true}}));
        }
        return;
    }

    utilities::log_info("CoordinationService: connecting to " + settings_.nats_url);
    broker_->connect();

    try {
        provision();
        connected_ = true;

        add_core_subscription(subjects::AGENTS_REGISTER,
                              [this](const BrokerMessage& m) { handle_registration(m); },
                              "discovery:register");
        add_core_subscription(subjects::AGENTS_HEARTBEAT,
                              [this](const BrokerMessage& m) { handle_heartbeat(m); },
                              "discovery:heartbeat");
        add_core_subscription(subjects::AGENTS_UNREGISTER,
                              [this](const BrokerMessage& m) { handle_unregistration(m); },
                              "discovery:unregister");

    } catch (const AgentLinkError& e) {
        utilities::log_error("CoordinationService: setup failed: " + std::string(e.what()));
        connected_ = false;
        {
            std::lock_guard<std::mutex> lock(subscriptions_mutex_);
            subscriptions_.clear();
        }
        broker_->close();
        throw;
    }

    recovery_abandoned_ = false;
    start_monitor();
    lock.unlock();

    events_.dispatch(events_.make_event(EventType::SYSTEM_READY, {{"service", service_id_}}));
    utilities::log_info("CoordinationService: connected");
}

void CoordinationService::provision() {
    for (const auto& stream : subjects::stream_catalog()) {
        broker_->ensure_stream(stream);
    }
    broker_->ensure_consumer(subjects::DISCOVERY_STREAM, subjects::discovery_consumer());
    broker_->ensure_consumer(subjects::TASKS_STREAM, subjects::task_queue_consumer());
    utilities::log_info("CoordinationService: streams and consumers provisioned");
}

void CoordinationService::restore_link_locked() {
    utilities::log_info("CoordinationService: restoring connection to " + settings_.nats_url);
    broker_->connect();

    try {
        provision();

        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (auto& [id, subscription] : subscriptions_) {
            for (const auto& [stream, consumer] : subscription->consumers) {
                broker_->ensure_consumer(stream, consumer);
            }
            if (subscription->on_message) {
                subscription->broker_sid = broker_->subscribe(subscription->subject, subscription->on_message);
            }
        }
    } catch (const AgentLinkError& e) {
        utilities::log_error("CoordinationService: restore failed: " + std::string(e.what()));
        broker_->close();
        throw;
    }

    recovery_abandoned_ = false;
    utilities::log_info("CoordinationService: connection restored");
}

void CoordinationService::connect_with_retry() {
    auto delay = settings_.reconnect_delay;

    for (int attempt = 1; attempt <= settings_.max_reconnect_attempts; ++attempt) {
        try {
            connect();
            return;
        } catch (const ConnectionError& e) {
            utilities::log_warn("CoordinationService: connection attempt " + std::to_string(attempt) + "/" +
                                std::to_string(settings_.max_reconnect_attempts) + " failed: " + e.what());
        }

        if (attempt < settings_.max_reconnect_attempts) {
            utilities::log_info("CoordinationService: retrying in " + std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
            delay = std::chrono::milliseconds(
                static_cast<int64_t>(std::llround(delay.count() * settings_.backoff_multiplier)));
        }
    }

    utilities::log_critical("CoordinationService: giving up after " +
                            std::to_string(settings_.max_reconnect_attempts) + " connection attempts");
    throw ConnectionError("unable to reach " + settings_.nats_url + " after " +
                          std::to_string(settings_.max_reconnect_attempts) + " attempts");
}

void CoordinationService::disconnect() {
    stop_monitor();

    std::unique_lock<std::mutex> connection_lock(connection_mutex_);
    if (!connected_.exchange(false)) {
        return;
    }

    utilities::log_info("CoordinationService: disconnecting");

    std::map<uint64_t, std::unique_ptr<Subscription>> subscriptions;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions.swap(subscriptions_);
    }

    // Signal every loop first so they wind down in parallel
    for (auto& [id, subscription] : subscriptions) {
        subscription->stop = true;
    }
    for (auto& [id, subscription] : subscriptions) {
        stop_subscription(std::move(subscription));
    }

    broker_->close();
    connection_lock.unlock();

    events_.dispatch(events_.make_event(EventType::SYSTEM_SHUTDOWN, {{"service", service_id_}}));
    utilities::log_info("CoordinationService: disconnected");
}

bool CoordinationService::is_connected() const {
    return connected_ && broker_->is_connected();
}

// ============================================================================
// Link Monitor
// ============================================================================

void CoordinationService::start_monitor() {
    if (monitor_.joinable()) {
        if (monitor_.get_id() == std::this_thread::get_id()) {
            return;
        }
        // Stopped from one of its own event handlers and not yet joined
        monitor_.join();
    }
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = false;
    }
    monitor_ = std::thread(&CoordinationService::monitor_link, this);
}

void CoordinationService::stop_monitor() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();

    // An event handler on the monitor thread cannot join it; the destructor does
    if (monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id()) {
        monitor_.join();
    }
}

bool CoordinationService::monitor_wait(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(monitor_mutex_);
    return monitor_cv_.wait_for(lock, delay, [this] { return monitor_stop_; });
}

void CoordinationService::monitor_link() {
    auto interval = std::min(settings_.reconnect_delay, MONITOR_INTERVAL);

    while (!monitor_wait(interval)) {
        if (!connected_ || recovery_abandoned_ || broker_->is_connected()) {
            continue;
        }
        recover_link();
    }
}

void CoordinationService::recover_link() {
    utilities::log_warn("CoordinationService: lost connection to " + settings_.nats_url + ", reconnecting");

    auto delay = settings_.reconnect_delay;
    for (int attempt = 1; attempt <= settings_.max_reconnect_attempts; ++attempt) {
        try {
            std::lock_guard<std::mutex> lock(connection_mutex_);
            if (!connected_ || broker_->is_connected()) {
                return;  // disconnected, or connect() got there first
            }
            restore_link_locked();
        } catch (const AgentLinkError& e) {
            utilities::log_warn("CoordinationService: reconnect attempt " + std::to_string(attempt) + "/" +
                                std::to_string(settings_.max_reconnect_attempts) + " failed: " + e.what());
            if (attempt < settings_.max_reconnect_attempts) {
                if (monitor_wait(delay)) {
                    return;
                }
                delay = std::chrono::milliseconds(
                    static_cast<int64_t>(std::llround(delay.count() * settings_.backoff_multiplier)));
            }
            continue;
        }

        events_.dispatch(events_.make_event(EventType::SYSTEM_READY,
                                            {{"service", service_id_}, {"reconnected", true}}));
        return;
    }

    recovery_abandoned_ = true;
    utilities::log_critical("CoordinationService: giving up on " + settings_.nats_url + " after " +
                            std::to_string(settings_.max_reconnect_attempts) +
                            " reconnect attempts; call connect() to retry");
    events_.dispatch(events_.make_event(EventType::ERROR_OCCURRED,
                                        {{"service", service_id_},
                                         {"error", "connection lost"},
                                         {"attempts", settings_.max_reconnect_attempts}}));
}

void CoordinationService::require_connected() const {
    if (!connected_) {
        throw ConnectionError("coordination service is not connected");
    }
}

double CoordinationService::now_seconds() const {
    return utilities::to_epoch_seconds(clock_());
}

// ============================================================================
// Discovery
// ============================================================================

void CoordinationService::register_agent(const AgentInfo& info) {
    require_identifier(info.agent_id, "agent ID");
    require_connected();

    broker_->publish_core(subjects::AGENTS_REGISTER, info.to_json().dump());
    utilities::log_info("CoordinationService: registration published for " + info.agent_id);
}

void CoordinationService::send_heartbeat(const std::string& agent_id) {
    require_identifier(agent_id, "agent ID");
    require_connected();

    json heartbeat = {{"agent_id", agent_id}, {"timestamp", now_seconds()}};
    broker_->publish_core(subjects::AGENTS_HEARTBEAT, heartbeat.dump());
}

void CoordinationService::unregister_agent(const std::string& agent_id) {
    require_identifier(agent_id, "agent ID");
    require_connected();

    broker_->publish_core(subjects::AGENTS_UNREGISTER, json{{"agent_id", agent_id}}.dump());
    utilities::log_info("CoordinationService: unregistration published for " + agent_id);
}

void CoordinationService::handle_registration(const BrokerMessage& message) {
    auto payload = parse_payload(message);
    if (!payload) {
        return;
    }

    auto info = AgentInfo::from_json(*payload);
    if (!info) {
        utilities::log_warn("CoordinationService: registration without agent_id");
        return;
    }

    registry_.register_peer(*info, *payload);
    broadcast_agent_update(info->agent_id, "registered", *payload);
    events_.dispatch(events_.make_event(EventType::AGENT_REGISTERED, {{"agent_id", info->agent_id}}));
}

void CoordinationService::handle_heartbeat(const BrokerMessage& message) {
    auto payload = parse_payload(message);
    if (!payload) {
        return;
    }

    std::string agent_id = payload->value("agent_id", std::string());
    if (registry_.record_heartbeat(agent_id)) {
        utilities::log_debug("CoordinationService: heartbeat from " + agent_id);
    }
}

void CoordinationService::handle_unregistration(const BrokerMessage& message) {
    auto payload = parse_payload(message);
    if (!payload) {
        return;
    }

    std::string agent_id = payload->value("agent_id", std::string());
    if (!registry_.unregister(agent_id)) {
        return;
    }

    // The entry is gone, so there is no info left to attach
    broadcast_agent_update(agent_id, "unregistered", nullptr);
    events_.dispatch(events_.make_event(EventType::AGENT_UNREGISTERED, {{"agent_id", agent_id}}));
}

void CoordinationService::broadcast_agent_update(const std::string& agent_id,
                                                 const std::string& event_type,
                                                 const json& agent_info) {
    json update = {
        {"agent_id", agent_id},
        {"event_type", event_type},
        {"timestamp", now_seconds()},
        {"agent_info", agent_info}
    };

    try {
        broker_->publish_core(subjects::AGENTS_UPDATES, update.dump());
        utilities::log_debug("CoordinationService: update broadcast " + agent_id + " - " + event_type);
    } catch (const AgentLinkError& e) {
        utilities::log_error("CoordinationService: failed to broadcast update for " + agent_id +
                             ": " + e.what());
    }
}

uint64_t CoordinationService::subscribe_to_agent_updates(AgentUpdateCallback callback) {
    return add_core_subscription(
        subjects::AGENTS_UPDATES,
        [callback = std::move(callback)](const BrokerMessage& message) {
            auto payload = parse_payload(message);
            if (payload) {
                callback(*payload);
            }
        },
        "agent-updates");
}

std::optional<json> CoordinationService::get_agent_info(const std::string& agent_id) const {
    auto entry = registry_.get(agent_id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->info;
}

std::vector<PeerRegistration> CoordinationService::get_online_agents() const {
    return registry_.online();
}

AgentStatus CoordinationService::agent_status(const std::string& agent_id) const {
    return registry_.status_of(agent_id);
}

// ============================================================================
// Messaging and Tasks
// ============================================================================

PublishAck CoordinationService::send_message(const std::string& sender_id,
                                             const std::string& receiver_id,
                                             const json& message) {
    require_identifier(sender_id, "sender ID");
    require_identifier(receiver_id, "receiver ID");
    require_connected();

    json payload = {
        {"sender_id", sender_id},
        {"receiver_id", receiver_id},
        {"message", message},
        {"timestamp", now_seconds()}
    };

    PublishAck ack = broker_->publish(subjects::message(sender_id, receiver_id), payload.dump());
    utilities::log_debug("CoordinationService: message " + sender_id + " -> " + receiver_id +
                         " stored at " + ack.stream + "#" + std::to_string(ack.sequence));
    return ack;
}

size_t CoordinationService::route_task(const json& task, const std::vector<std::string>& target_agents) {
    for (const auto& agent_id : target_agents) {
        require_identifier(agent_id, "target agent ID");
    }
    require_connected();

    json payload = {
        {"task", task},
        {"timestamp", now_seconds()},
        {"target_agents", target_agents.empty() ? json(nullptr) : json(target_agents)}
    };
    std::string data = payload.dump();

    std::string task_id = "<unnamed>";
    if (task.is_object() && task.contains("task_id") && task["task_id"].is_string()) {
        task_id = task["task_id"].get<std::string>();
    }

    if (target_agents.empty()) {
        broker_->publish(subjects::TASKS_AVAILABLE, data);
        utilities::log_debug("CoordinationService: task " + task_id + " queued for any agent");
        return 1;
    }

    for (const auto& agent_id : target_agents) {
        broker_->publish(subjects::task(agent_id), data);
    }
    utilities::log_debug("CoordinationService: task " + task_id + " routed to " +
                         std::to_string(target_agents.size()) + " agents");
    return target_agents.size();
}

uint64_t CoordinationService::subscribe_to_messages(const std::string& agent_id, PayloadCallback callback) {
    require_identifier(agent_id, "agent ID");
    require_connected();

    auto consumer = subjects::agent_message_consumer(agent_id, settings_.max_deliver);
    broker_->ensure_consumer(subjects::MESSAGES_STREAM, consumer);

    auto subscription = std::make_unique<Subscription>();
    subscription->description = "messages:" + agent_id;
    subscription->consumers.emplace_back(subjects::MESSAGES_STREAM, consumer);
    Subscription* raw = subscription.get();
    raw->threads.emplace_back(&CoordinationService::run_pull_loop, this, raw,
                              std::string(subjects::MESSAGES_STREAM), consumer.durable_name,
                              consumer.max_deliver, std::move(callback));

    utilities::log_info("CoordinationService: subscribed to messages for " + agent_id);
    return add_pull_subscription(std::move(subscription));
}

uint64_t CoordinationService::subscribe_to_tasks(const std::string& agent_id, PayloadCallback callback) {
    require_identifier(agent_id, "agent ID");
    require_connected();

    auto direct = subjects::agent_task_consumer(agent_id, config::TASK_MAX_DELIVER);
    auto shared = subjects::task_queue_consumer();
    broker_->ensure_consumer(subjects::TASKS_STREAM, direct);
    broker_->ensure_consumer(subjects::TASKS_STREAM, shared);

    auto subscription = std::make_unique<Subscription>();
    subscription->description = "tasks:" + agent_id;
    subscription->consumers.emplace_back(subjects::TASKS_STREAM, direct);
    subscription->consumers.emplace_back(subjects::TASKS_STREAM, shared);
    Subscription* raw = subscription.get();
    raw->threads.emplace_back(&CoordinationService::run_pull_loop, this, raw,
                              std::string(subjects::TASKS_STREAM), direct.durable_name,
                              direct.max_deliver, callback);
    raw->threads.emplace_back(&CoordinationService::run_pull_loop, this, raw,
                              std::string(subjects::TASKS_STREAM), shared.durable_name,
                              shared.max_deliver, callback);

    utilities::log_info("CoordinationService: subscribed to tasks for " + agent_id);
    return add_pull_subscription(std::move(subscription));
}

bool CoordinationService::unsubscribe(uint64_t subscription_id) {
    std::unique_ptr<Subscription> subscription;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        auto it = subscriptions_.find(subscription_id);
        if (it == subscriptions_.end()) {
            return false;
        }
        subscription = std::move(it->second);
        subscriptions_.erase(it);
    }

    stop_subscription(std::move(subscription));
    return true;
}

// ============================================================================
// Subscription Plumbing
// ============================================================================

uint64_t CoordinationService::add_core_subscription(const std::string& subject,
                                                    MessageCallback callback,
                                                    const std::string& description) {
    require_connected();

    auto subscription = std::make_unique<Subscription>();
    subscription->description = description;
    subscription->subject = subject;
    subscription->on_message = std::move(callback);
    subscription->broker_sid = broker_->subscribe(subject, subscription->on_message);

    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    uint64_t id = next_subscription_id_++;
    subscriptions_.emplace(id, std::move(subscription));
    return id;
}

uint64_t CoordinationService::add_pull_subscription(std::unique_ptr<Subscription> subscription) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        if (connected_) {
            uint64_t id = next_subscription_id_++;
            subscriptions_.emplace(id, std::move(subscription));
            return id;
        }
    }

    // disconnect() ran while the loops were starting
    stop_subscription(std::move(subscription));
    throw ConnectionError("coordination service disconnected during subscribe");
}

void CoordinationService::stop_subscription(std::unique_ptr<Subscription> subscription) {
    subscription->stop = true;

    if (subscription->broker_sid) {
        try {
            broker_->unsubscribe(*subscription->broker_sid);
        } catch (const AgentLinkError& e) {
            utilities::log_warn("CoordinationService: unsubscribe " + subscription->description +
                                " failed: " + e.what());
        }
    }

    for (auto& thread : subscription->threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    utilities::log_debug("CoordinationService: stopped " + subscription->description);
}

void CoordinationService::run_pull_loop(Subscription* subscription,
                                        std::string stream,
                                        std::string durable,
                                        int max_deliver,
                                        PayloadCallback callback) {
    utilities::log_debug("CoordinationService: pull loop started on " + stream + "/" + durable);

    while (!subscription->stop) {
        std::vector<BrokerMessage> batch;
        try {
            batch = broker_->fetch(stream, durable, settings_.fetch_batch, settings_.fetch_timeout);
        } catch (const AgentLinkError& e) {
            if (subscription->stop) {
                break;
            }
            if (broker_->is_connected()) {
                utilities::log_error("CoordinationService: fetch from " + durable + " failed: " + e.what());
            } else {
                utilities::log_debug("CoordinationService: " + durable + " waiting for the connection");
            }
            std::this_thread::sleep_for(FETCH_ERROR_BACKOFF);
            continue;
        }

        for (const auto& message : batch) {
            if (subscription->stop) {
                // Not started: hand it back for prompt redelivery
                try {
                    broker_->nak(message);
                } catch (const AgentLinkError& e) {
                    utilities::log_warn("CoordinationService: nak on shutdown failed: " + std::string(e.what()));
                }
                continue;
            }
            settle(message, max_deliver, callback);
        }
    }

    utilities::log_debug("CoordinationService: pull loop finished on " + stream + "/" + durable);
}

void CoordinationService::settle(const BrokerMessage& message, int max_deliver, const PayloadCallback& callback) {
    enum class Outcome { ACK, NAK, TERM };
    Outcome outcome = Outcome::ACK;

    std::string sequence = std::to_string(message.stream_sequence);

    try {
        json payload = json::parse(message.data, nullptr, false);
        if (payload.is_discarded()) {
            throw MalformedMessageError("payload on " + message.subject + " is not JSON");
        }
        callback(payload);

    } catch (const MalformedMessageError& e) {
        utilities::log_error("CoordinationService: dropping #" + sequence + " on " + message.subject + ": " + e.what());
        outcome = Outcome::TERM;
    } catch (const CryptoError& e) {
        utilities::log_error("CoordinationService: dropping #" + sequence + " on " + message.subject + ": " + e.what());
        outcome = Outcome::TERM;
    } catch (const std::exception& e) {
        if (message.delivery_count >= static_cast<uint64_t>(max_deliver)) {
            utilities::log_error("CoordinationService: dead letter #" + sequence + " on " + message.subject +
                                 " after " + std::to_string(message.delivery_count) + " deliveries: " + e.what());
            outcome = Outcome::TERM;
        } else {
            utilities::log_warn("CoordinationService: delivery " + std::to_string(message.delivery_count) +
                                " of #" + sequence + " failed, requesting redelivery: " + e.what());
            outcome = Outcome::NAK;
        }
    }

    try {
        switch (outcome) {
            case Outcome::ACK: broker_->ack(message); break;
            case Outcome::NAK: broker_->nak(message); break;
            case Outcome::TERM: broker_->term(message); break;
        }
    } catch (const AgentLinkError& e) {
        // Unsettled messages come back after ack_wait
        utilities::log_error("CoordinationService: failed to settle #" + sequence + ": " + e.what());
    }
}

// ============================================================================
// Events
// ============================================================================

SystemEvent CoordinationService::publish_event(EventType type,
                                               const json& data,
                                               const std::optional<std::string>& correlation_id) {
    SystemEvent event = events_.make_event(type, data, correlation_id);
    event.timestamp = now_seconds();

    events_.dispatch(event);

    if (connected_) {
        // Before publishing: a broker may deliver the echo before publish_core returns
        remember_published(event.event_id);
        try {
            broker_->publish_core(subjects::event(event_type_to_string(type)), event.to_json().dump());
        } catch (const AgentLinkError& e) {
            utilities::log_error("CoordinationService: failed to publish event " + event.event_id + ": " + e.what());
        }
    } else {
        utilities::log_debug("CoordinationService: not connected, event " + event.event_id + " dispatched locally only");
    }

    return event;
}

uint64_t CoordinationService::subscribe_to_events() {
    return add_core_subscription(subjects::EVENTS_ALL,
                                 [this](const BrokerMessage& m) { handle_remote_event(m); },
                                 "events");
}

void CoordinationService::handle_remote_event(const BrokerMessage& message) {
    auto payload = parse_payload(message);
    if (!payload) {
        return;
    }

    try {
        SystemEvent event = SystemEvent::from_json(*payload);
        if (was_published(event.event_id)) {
            return;  // already dispatched by publish_event
        }
        events_.dispatch(event);
    } catch (const MalformedMessageError& e) {
        utilities::log_warn("CoordinationService: ignoring event on " + message.subject + ": " + e.what());
    }
}

void CoordinationService::remember_published(const std::string& event_id) {
    std::lock_guard<std::mutex> lock(published_mutex_);
    if (!published_ids_.insert(event_id).second) {
        return;
    }
    published_order_.push_back(event_id);
    if (published_order_.size() > PUBLISHED_EVENT_MEMORY) {
        published_ids_.erase(published_order_.front());
        published_order_.pop_front();
    }
}

bool CoordinationService::was_published(const std::string& event_id) const {
    std::lock_guard<std::mutex> lock(published_mutex_);
    return published_ids_.count(event_id) > 0;
}

void CoordinationService::register_event_handler(EventType type, EventHandler handler) {
    events_.register_handler(type, std::move(handler));
}

void CoordinationService::register_global_event_handler(EventHandler handler) {
    events_.register_global_handler(std::move(handler));
}

// ============================================================================
// Status
// ============================================================================

HealthStatus CoordinationService::health_check() const {
    HealthStatus status;
    status.connected = is_connected();
    status.agent_count = registry_.size();
    status.online_agents = registry_.online_count();

    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    status.subscriptions = subscriptions_.size();
    return status;
}

} // namespace agentlink
