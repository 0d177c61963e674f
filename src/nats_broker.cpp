/**
 * @file nats_broker.cpp
 * @brief Implementation of the NATS JetStream client
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/nats_broker.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/utilities.hpp"

#include <algorithm>
#include <system_error>

using json = nlohmann::json;

namespace agentlink {

namespace {

/// Consumer exists with a different configuration
constexpr int CONSUMER_NAME_IN_USE = 10013;
constexpr int CONSUMER_ALREADY_EXISTS = 10148;

/// How long close() waits for the server to confirm outstanding writes
constexpr auto DRAIN_TIMEOUT = std::chrono::seconds(1);

int64_t to_nanoseconds(std::chrono::milliseconds ms) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(ms).count();
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

NatsBroker::NatsBroker(std::string url, std::string client_name, std::chrono::milliseconds request_timeout)
    : url_(std::move(url))
    , client_name_(std::move(client_name))
    , request_timeout_(request_timeout)
{
}

NatsBroker::~NatsBroker() {
    close();
    if (dispatcher_.joinable() && dispatcher_.get_id() != std::this_thread::get_id()) {
        dispatcher_.join();
    }
}

bool NatsBroker::on_dispatcher_thread() const {
    return dispatcher_id_.load() == std::this_thread::get_id();
}

// ============================================================================
// Connection Management
// ============================================================================

void NatsBroker::connect() {
    if (connected_) {
        return;
    }
    if (on_dispatcher_thread()) {
        throw ConnectionError("cannot reconnect from inside a subscription callback");
    }
    if (reader_.joinable()) {
        // Reader of a previous, lost connection
        reader_.join();
    }
    stop_dispatcher();

    {
        // Subscriptions and requests belonged to the previous connection
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.clear();
        requests_.clear();
        pulls_.clear();
    }

    auto address = nats::parse_url(url_);
    if (!address) {
        throw ConnectionError("invalid NATS URL: " + url_);
    }

    utilities::log_info("NatsBroker: connecting to " + address->host + ":" + std::to_string(address->port));

    socket_ = std::make_unique<asio::ip::tcp::socket>(io_context_);
    buffer_.consume(buffer_.size());

    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(address->host, std::to_string(address->port), ec);
    if (ec) {
        throw ConnectionError("cannot resolve " + address->host + ": " + ec.message());
    }

    asio::connect(*socket_, endpoints, ec);
    if (ec) {
        throw ConnectionError("cannot reach " + url_ + ": " + ec.message());
    }

    try {
        handshake();
        send(nats::connect_command(client_name_, *address) + "PING" + nats::CRLF);

        // Wait for PONG; the server reports CONNECT problems with -ERR first
        while (true) {
            auto control = nats::parse_control_line(read_line());
            if (!control) {
                continue;
            }
            if (control->op == nats::Operation::PONG) {
                break;
            }
            if (control->op == nats::Operation::ERR) {
                throw ConnectionError("server rejected connection: " + control->argument);
            }
        }
    } catch (const std::system_error& e) {
        asio::error_code ignored;
        socket_->close(ignored);
        throw ConnectionError("handshake with " + url_ + " failed: " + std::string(e.what()));
    } catch (const ConnectionError&) {
        asio::error_code ignored;
        socket_->close(ignored);
        throw;
    }

    closing_ = false;
    connected_ = true;
    start_dispatcher();
    reader_ = std::thread(&NatsBroker::read_loop, this);

    // Request/reply inbox
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbox_prefix_ = "_INBOX." + utilities::generate_random_string(22);
        inbox_sid_ = next_sid_++;
    }
    send(nats::sub_command(inbox_prefix_ + ".*", inbox_sid_));

    utilities::log_info("NatsBroker: connected to server " + server_info().server_id +
                        " (version " + server_info().version + ")");
}

void NatsBroker::handshake() {
    auto control = nats::parse_control_line(read_line());
    if (!control || control->op != nats::Operation::INFO) {
        throw ConnectionError("expected INFO from server");
    }

    auto info = nats::parse_info(control->argument);
    if (!info) {
        throw ConnectionError("unreadable INFO from server");
    }
    if (!info->jetstream) {
        utilities::log_warn("NatsBroker: server does not advertise JetStream");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    server_info_ = *info;
}

void NatsBroker::close() {
    if (closing_.exchange(true) || !socket_) {
        return;
    }

    // Drain: stop interest, then wait for the server to confirm it has seen everything
    if (connected_) {
        try {
            std::vector<uint64_t> sids;
            uint64_t pongs_before = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto& [sid, entry] : subscriptions_) {
                    sids.push_back(sid);
                }
                subscriptions_.clear();
                pongs_before = pongs_;
            }
            for (uint64_t sid : sids) {
                send(nats::unsub_command(sid));
            }
            send(std::string("PING") + nats::CRLF);

            std::unique_lock<std::mutex> lock(mutex_);
            replies_cv_.wait_for(lock, DRAIN_TIMEOUT, [&] { return pongs_ > pongs_before || !connected_; });
        } catch (const ConnectionError& e) {
            utilities::log_warn("NatsBroker: drain incomplete: " + std::string(e.what()));
        }
    }

    connected_ = false;

    asio::error_code ec;
    socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (reader_.joinable()) {
        reader_.join();
    }
    socket_->close(ec);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.clear();
        fail_pending_locked();
    }
    replies_cv_.notify_all();
    stop_dispatcher();

    utilities::log_info("NatsBroker: connection closed");
}

bool NatsBroker::is_connected() const {
    return connected_;
}

nats::ServerInfo NatsBroker::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

// ============================================================================
// Socket I/O
// ============================================================================

std::string NatsBroker::read_line() {
    size_t n = asio::read_until(*socket_, buffer_, nats::CRLF);
    auto begin = asio::buffers_begin(buffer_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(n - 2));
    buffer_.consume(n);
    return line;
}

std::string NatsBroker::read_payload(size_t size) {
    size_t needed = size + 2;
    if (buffer_.size() < needed) {
        asio::read(*socket_, buffer_, asio::transfer_exactly(needed - buffer_.size()));
    }
    auto begin = asio::buffers_begin(buffer_.data());
    std::string payload(begin, begin + static_cast<std::ptrdiff_t>(size));
    buffer_.consume(needed);
    return payload;
}

void NatsBroker::send(const std::string& data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!socket_ || !socket_->is_open()) {
        throw ConnectionError("not connected to " + url_);
    }

    asio::error_code ec;
    asio::write(*socket_, asio::buffer(data), ec);
    if (ec) {
        throw ConnectionError("write to " + url_ + " failed: " + ec.message());
    }
}

void NatsBroker::read_loop() {
    try {
        while (connected_) {
            auto control = nats::parse_control_line(read_line());
            if (!control) {
                utilities::log_warn("NatsBroker: unparseable protocol line");
                continue;
            }

            switch (control->op) {
                case nats::Operation::PING:
                    send(std::string("PONG") + nats::CRLF);
                    break;

                case nats::Operation::PONG: {
                    std::lock_guard<std::mutex> lock(mutex_);
                    ++pongs_;
                    replies_cv_.notify_all();
                    break;
                }

                case nats::Operation::MSG:
                case nats::Operation::HMSG:
                    handle_message(*control, read_payload(control->total_bytes));
                    break;

                case nats::Operation::ERR:
                    utilities::log_error("NatsBroker: server error: " + control->argument);
                    break;

                case nats::Operation::INFO: {
                    auto info = nats::parse_info(control->argument);
                    if (info) {
                        std::lock_guard<std::mutex> lock(mutex_);
                        server_info_ = *info;
                    }
                    break;
                }

                case nats::Operation::OK:
                    break;

                case nats::Operation::UNKNOWN:
                    utilities::log_debug("NatsBroker: ignoring " + control->argument);
                    break;
            }
        }
    } catch (const std::exception& e) {
        if (!closing_) {
            utilities::log_error("NatsBroker: connection lost: " + std::string(e.what()));
        }
    }

    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_pending_locked();
    }
    replies_cv_.notify_all();
}

void NatsBroker::handle_message(const nats::ControlLine& control, const std::string& payload) {
    BrokerMessage message;
    message.subject = control.subject;
    message.reply = control.reply;

    int status = 0;
    if (control.op == nats::Operation::HMSG) {
        auto headers = nats::parse_headers(payload.substr(0, control.header_bytes));
        if (headers) {
            status = headers->status;
        }
        message.data = payload.substr(control.header_bytes);
    } else {
        message.data = payload;
    }

    if (auto metadata = nats::parse_ack_subject(message.reply)) {
        message.delivery_count = metadata->delivered;
        message.stream_sequence = metadata->stream_sequence;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Pulled messages keep their stream subject, so pulls are matched by sid
    auto pull = pulls_.find(control.sid);
    if (control.sid == inbox_sid_ || pull != pulls_.end()) {
        std::shared_ptr<PendingRequest> request;
        if (pull != pulls_.end()) {
            request = pull->second;
        } else {
            std::string token = message.subject.substr(std::min(message.subject.size(), inbox_prefix_.size() + 1));
            auto it = requests_.find(token);
            if (it != requests_.end()) {
                request = it->second;
            }
        }
        if (!request) {
            return;  // late reply
        }

        auto& pending = *request;
        if (status >= 400) {
            pending.status = status;
            pending.done = true;
        } else if (status == 100) {
            return;  // idle heartbeat
        } else {
            pending.replies.push_back(std::move(message));
            pending.done = pending.replies.size() >= pending.expected;
        }
        replies_cv_.notify_all();
        return;
    }

    if (subscriptions_.count(control.sid) == 0) {
        return;
    }
    deliveries_.push_back(Delivery{control.sid, std::move(message)});
    dispatch_cv_.notify_all();
}

// ============================================================================
// Core Delivery
// ============================================================================

void NatsBroker::start_dispatcher() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deliveries_.clear();
        dispatching_ = true;
    }
    dispatcher_ = std::thread(&NatsBroker::dispatch_loop, this);
}

void NatsBroker::stop_dispatcher() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatching_ = false;
        deliveries_.clear();
    }
    dispatch_cv_.notify_all();

    // From inside a callback the loop exits once the callback returns;
    // the destructor joins it then
    if (dispatcher_.joinable() && !on_dispatcher_thread()) {
        dispatcher_.join();
    }
}

void NatsBroker::dispatch_loop() {
    dispatcher_id_ = std::this_thread::get_id();
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        dispatch_cv_.wait(lock, [&] { return !dispatching_ || !deliveries_.empty(); });
        if (!dispatching_) {
            break;
        }

        Delivery delivery = std::move(deliveries_.front());
        deliveries_.pop_front();

        auto it = subscriptions_.find(delivery.sid);
        if (it == subscriptions_.end()) {
            continue;  // unsubscribed while queued
        }
        MessageCallback callback = it->second.second;
        active_sid_ = delivery.sid;
        lock.unlock();

        try {
            callback(delivery.message);
        } catch (const std::exception& e) {
            utilities::log_error("NatsBroker: subscriber on " + delivery.message.subject +
                                 " failed: " + std::string(e.what()));
        }

        lock.lock();
        active_sid_ = 0;
        dispatch_cv_.notify_all();
    }
    dispatcher_id_ = std::thread::id();
}

void NatsBroker::fail_pending_locked() {
    for (auto& [token, pending] : requests_) {
        pending->done = true;
    }
    for (auto& [sid, pending] : pulls_) {
        pending->done = true;
    }
}

// ============================================================================
// Request / Reply
// ============================================================================

std::vector<BrokerMessage> NatsBroker::request_many(const std::string& subject,
                                                    const std::string& payload,
                                                    size_t max_replies,
                                                    std::chrono::milliseconds timeout,
                                                    int* status,
                                                    bool own_subscription) {
    if (!connected_) {
        throw ConnectionError("not connected to " + url_);
    }

    auto pending = std::make_shared<PendingRequest>();
    pending->expected = max_replies;

    std::string token;
    std::string reply_subject;
    uint64_t sid = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = std::to_string(next_request_++);
        if (own_subscription) {
            sid = next_sid_++;
            reply_subject = inbox_prefix_ + ".pull." + token;
            pulls_[sid] = pending;
        } else {
            reply_subject = inbox_prefix_ + "." + token;
            requests_[token] = pending;
        }
    }

    auto forget = [&] {
        if (sid != 0) {
            pulls_.erase(sid);
        } else {
            requests_.erase(token);
        }
    };

    try {
        std::string command = nats::pub_command(subject, reply_subject, payload);
        if (sid != 0) {
            command = nats::sub_command(reply_subject, sid) + command;
        }
        send(command);
    } catch (const ConnectionError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        forget();
        throw;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        replies_cv_.wait_for(lock, timeout, [&] { return pending->done; });
        forget();
    }

    if (sid != 0 && connected_) {
        try {
            send(nats::unsub_command(sid));
        } catch (const ConnectionError& e) {
            utilities::log_debug("NatsBroker: pull inbox cleanup failed: " + std::string(e.what()));
        }
    }

    if (status != nullptr) {
        *status = pending->status;
    }
    return std::move(pending->replies);
}

json NatsBroker::api_request(const std::string& subject, const std::string& payload) {
    int status = 0;
    auto replies = request_many(subject, payload, 1, request_timeout_, &status);

    if (status == 503) {
        throw BrokerError("no responders for " + subject + " (is JetStream enabled?)", 503);
    }
    if (replies.empty()) {
        throw ConnectionError("request timed out: " + subject);
    }

    json reply = json::parse(replies.front().data, nullptr, false);
    if (reply.is_discarded()) {
        throw BrokerError("unreadable API reply on " + subject);
    }

    if (auto error = nats::api_error(reply)) {
        throw BrokerError(error->description, error->err_code);
    }
    return reply;
}

// ============================================================================
// Provisioning
// ============================================================================

void NatsBroker::ensure_stream(const StreamSpec& spec) {
    json body = nats::stream_config_json(spec.name, spec.subjects, spec.retention,
                                         spec.max_bytes, spec.max_age.count(), spec.storage);
    try {
        api_request("$JS.API.STREAM.CREATE." + spec.name, body.dump());
        utilities::log_info("NatsBroker: stream created " + spec.name);
    } catch (const BrokerError& e) {
        if (e.error_code() != nats::STREAM_NAME_IN_USE) {
            throw;
        }
        api_request("$JS.API.STREAM.UPDATE." + spec.name, body.dump());
        utilities::log_info("NatsBroker: stream updated " + spec.name);
    }
}

void NatsBroker::ensure_consumer(const std::string& stream, const ConsumerSpec& spec) {
    json consumer_config = {
        {"durable_name", spec.durable_name},
        {"deliver_policy", "all"},
        {"ack_policy", spec.ack_policy},
        {"ack_wait", to_nanoseconds(std::chrono::duration_cast<std::chrono::milliseconds>(spec.ack_wait))},
        {"max_deliver", spec.max_deliver},
        {"replay_policy", "instant"}
    };
    if (!spec.filter_subject.empty()) {
        consumer_config["filter_subject"] = spec.filter_subject;
    }

    json body = {{"stream_name", stream}, {"config", consumer_config}};

    try {
        api_request("$JS.API.CONSUMER.DURABLE.CREATE." + stream + "." + spec.durable_name, body.dump());
        utilities::log_info("NatsBroker: consumer ready " + stream + "/" + spec.durable_name);
    } catch (const BrokerError& e) {
        if (e.error_code() != CONSUMER_NAME_IN_USE && e.error_code() != CONSUMER_ALREADY_EXISTS) {
            throw;
        }
        utilities::log_warn("NatsBroker: consumer " + spec.durable_name +
                            " exists with different settings, keeping it");
    }
}

// ============================================================================
// Publishing
// ============================================================================

PublishAck NatsBroker::publish(const std::string& subject, const std::string& data) {
    // A stream capturing the subject answers with {"stream":..., "seq":...}
    json reply = api_request(subject, data);

    PublishAck ack;
    ack.stream = reply.value("stream", std::string());
    ack.sequence = reply.value("seq", static_cast<uint64_t>(0));
    if (ack.stream.empty()) {
        throw BrokerError("publish to " + subject + " was not acknowledged by a stream");
    }
    return ack;
}

void NatsBroker::publish_core(const std::string& subject, const std::string& data) {
    send(nats::pub_command(subject, "", data));
}

// ============================================================================
// Core Subscriptions
// ============================================================================

uint64_t NatsBroker::subscribe(const std::string& subject, MessageCallback callback) {
    uint64_t sid = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sid = next_sid_++;
        subscriptions_[sid] = std::make_pair(subject, std::move(callback));
    }

    try {
        send(nats::sub_command(subject, sid));
    } catch (const ConnectionError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.erase(sid);
        throw;
    }

    utilities::log_debug("NatsBroker: subscribed to " + subject + " (sid " + std::to_string(sid) + ")");
    return sid;
}

void NatsBroker::unsubscribe(uint64_t subscription_id) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (subscriptions_.erase(subscription_id) == 0) {
            return;
        }

        // Once this returns the callback is not running and will not run again
        if (!on_dispatcher_thread()) {
            dispatch_cv_.wait(lock, [&] { return active_sid_ != subscription_id; });
        }
    }

    if (connected_) {
        send(nats::unsub_command(subscription_id));
    }
}

// ============================================================================
// Pull Consumers
// ============================================================================

std::vector<BrokerMessage> NatsBroker::fetch(const std::string& stream,
                                             const std::string& durable,
                                             size_t batch,
                                             std::chrono::milliseconds timeout) {
    // The server ends the pull with a 408 once expires passes
    json body = {
        {"batch", batch},
        {"expires", to_nanoseconds(timeout)}
    };

    int status = 0;
    auto messages = request_many("$JS.API.CONSUMER.MSG.NEXT." + stream + "." + durable,
                                 body.dump(), batch, timeout + std::chrono::milliseconds(200), &status, true);

    if (status != 0 && !nats::is_pull_terminal_status(status)) {
        throw BrokerError("pull from " + stream + "/" + durable + " failed with status " +
                          std::to_string(status), status);
    }
    return messages;
}

// ============================================================================
// Acknowledgement
// ============================================================================

void NatsBroker::send_ack(const BrokerMessage& message, const char* verb) {
    if (message.reply.empty()) {
        utilities::log_warn("NatsBroker: " + std::string(verb) + " without reply subject on " + message.subject);
        return;
    }
    send(nats::pub_command(message.reply, "", verb));
}

void NatsBroker::ack(const BrokerMessage& message) {
    send_ack(message, "+ACK");
}

void NatsBroker::nak(const BrokerMessage& message) {
    send_ack(message, "-NAK");
}

void NatsBroker::term(const BrokerMessage& message) {
    send_ack(message, "+TERM");
}

} // namespace agentlink
