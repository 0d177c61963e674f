/**
 * @file subjects.cpp
 * @brief Implementation of the subject layout
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/subjects.hpp"
#include "agentlink/config.hpp"
#include "agentlink/utilities.hpp"

#include <chrono>

namespace agentlink {
namespace subjects {

std::string message(const std::string& sender_id, const std::string& receiver_id) {
    return "messages." + sender_id + "." + receiver_id;
}

std::string messages_for(const std::string& receiver_id) {
    return "messages.*." + receiver_id;
}

std::string task(const std::string& agent_id) {
    return "tasks." + agent_id;
}

std::string event(const std::string& event_type) {
    return "events." + event_type;
}

std::string message_consumer(const std::string& agent_id) {
    return "agent-" + agent_id + "-messages";
}

std::string task_consumer(const std::string& agent_id) {
    return "agent-" + agent_id + "-tasks";
}

bool subject_matches(const std::string& pattern, const std::string& subject) {
    auto pattern_tokens = utilities::split_string(pattern, '.');
    auto subject_tokens = utilities::split_string(subject, '.');

    for (size_t i = 0; i < pattern_tokens.size(); ++i) {
        const std::string& token = pattern_tokens[i];

        if (token == ">") {
            // '>' must be last and needs at least one token to consume
            return i == pattern_tokens.size() - 1 && subject_tokens.size() > i;
        }
        if (i >= subject_tokens.size()) {
            return false;
        }
        if (token != "*" && token != subject_tokens[i]) {
            return false;
        }
    }

    return pattern_tokens.size() == subject_tokens.size();
}

std::vector<StreamSpec> stream_catalog() {
    using std::chrono::duration_cast;
    using std::chrono::seconds;

    std::vector<StreamSpec> streams(4);

    streams[0].name = DISCOVERY_STREAM;
    streams[0].subjects = {"agents.>"};
    streams[0].max_bytes = config::DISCOVERY_MAX_BYTES;
    streams[0].max_age = duration_cast<seconds>(config::DISCOVERY_MAX_AGE);

    streams[1].name = MESSAGES_STREAM;
    streams[1].subjects = {"messages.>"};
    streams[1].max_bytes = config::MESSAGES_MAX_BYTES;
    streams[1].max_age = duration_cast<seconds>(config::MESSAGES_MAX_AGE);

    streams[2].name = TASKS_STREAM;
    streams[2].subjects = {"tasks.>"};
    streams[2].max_bytes = config::TASKS_MAX_BYTES;
    streams[2].max_age = duration_cast<seconds>(config::TASKS_MAX_AGE);

    streams[3].name = EVENTS_STREAM;
    streams[3].subjects = {"events.>"};
    streams[3].max_bytes = config::EVENTS_MAX_BYTES;
    streams[3].max_age = duration_cast<seconds>(config::EVENTS_MAX_AGE);

    return streams;
}

ConsumerSpec discovery_consumer() {
    ConsumerSpec spec;
    spec.durable_name = DISCOVERY_CONSUMER;
    spec.filter_subject = "agents.>";
    spec.max_deliver = config::DISCOVERY_MAX_DELIVER;
    spec.ack_wait = config::ACK_WAIT;
    return spec;
}

ConsumerSpec task_queue_consumer() {
    ConsumerSpec spec;
    spec.durable_name = TASK_QUEUE_CONSUMER;
    spec.filter_subject = TASKS_AVAILABLE;
    spec.max_deliver = config::TASK_MAX_DELIVER;
    spec.ack_wait = config::ACK_WAIT;
    return spec;
}

ConsumerSpec agent_message_consumer(const std::string& agent_id, int max_deliver) {
    ConsumerSpec spec;
    spec.durable_name = message_consumer(agent_id);
    spec.filter_subject = messages_for(agent_id);
    spec.max_deliver = max_deliver;
    spec.ack_wait = config::ACK_WAIT;
    return spec;
}

ConsumerSpec agent_task_consumer(const std::string& agent_id, int max_deliver) {
    ConsumerSpec spec;
    spec.durable_name = task_consumer(agent_id);
    spec.filter_subject = task(agent_id);
    spec.max_deliver = max_deliver;
    spec.ack_wait = config::ACK_WAIT;
    return spec;
}

} // namespace subjects
} // namespace agentlink
