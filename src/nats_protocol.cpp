/**
 * @file nats_protocol.cpp
 * @brief Implementation of NATS protocol encoding and parsing
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/nats_protocol.hpp"
#include "agentlink/utilities.hpp"

#include <sstream>

using json = nlohmann::json;

namespace agentlink {
namespace nats {

namespace {

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<uint64_t> parse_unsigned(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

// ============================================================================
// URLs and handshake
// ============================================================================

std::optional<ServerAddress> parse_url(const std::string& url) {
    const std::string scheme = "nats://";
    if (!utilities::starts_with(url, scheme)) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    ServerAddress address;

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string credentials = rest.substr(0, at);
        rest = rest.substr(at + 1);
        auto colon = credentials.find(':');
        address.user = credentials.substr(0, colon);
        if (colon != std::string::npos) {
            address.password = credentials.substr(colon + 1);
        }
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        auto port = parse_unsigned(rest.substr(colon + 1));
        if (!port || *port == 0 || *port > 65535) {
            return std::nullopt;
        }
        address.port = static_cast<uint16_t>(*port);
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        return std::nullopt;
    }
    address.host = rest;
    return address;
}

std::optional<ServerInfo> parse_info(const std::string& json_argument) {
    json j = json::parse(json_argument, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    ServerInfo info;
    info.server_id = j.value("server_id", std::string());
    info.version = j.value("version", std::string());
    info.headers = j.value("headers", false);
    info.jetstream = j.value("jetstream", false);
    info.max_payload = j.value("max_payload", static_cast<size_t>(1024 * 1024));
    return info;
}

std::string connect_command(const std::string& client_name, const ServerAddress& address) {
    json options = {
        {"verbose", false},
        {"pedantic", false},
        {"headers", true},
        {"no_responders", true},
        {"lang", "cpp"},
        {"version", CLIENT_VERSION},
        {"name", client_name},
        {"protocol", 1}
    };
    if (!address.user.empty()) {
        options["user"] = address.user;
        options["pass"] = address.password;
    }
    return "CONNECT " + options.dump() + CRLF;
}

// ============================================================================
// Commands
// ============================================================================

std::string pub_command(const std::string& subject, const std::string& reply, const std::string& payload) {
    std::string command = "PUB " + subject + " ";
    if (!reply.empty()) {
        command += reply + " ";
    }
    command += std::to_string(payload.size()) + CRLF + payload + CRLF;
    return command;
}

std::string sub_command(const std::string& subject, uint64_t sid) {
    return "SUB " + subject + " " + std::to_string(sid) + CRLF;
}

std::string unsub_command(uint64_t sid) {
    return "UNSUB " + std::to_string(sid) + CRLF;
}

// ============================================================================
// Server operations
// ============================================================================

std::optional<ControlLine> parse_control_line(const std::string& line) {
    ControlLine control;

    auto space = line.find(' ');
    std::string verb = utilities::to_lowercase(line.substr(0, space));
    std::string argument = space == std::string::npos ? "" : utilities::trim_string(line.substr(space + 1));

    if (verb == "ping") { control.op = Operation::PING; return control; }
    if (verb == "pong") { control.op = Operation::PONG; return control; }
    if (verb == "+ok") { control.op = Operation::OK; return control; }
    if (verb == "-err") {
        control.op = Operation::ERR;
        // -ERR 'Authorization Violation'
        if (argument.size() >= 2 && argument.front() == '\'' && argument.back() == '\'') {
            argument = argument.substr(1, argument.size() - 2);
        }
        control.argument = argument;
        return control;
    }
    if (verb == "info") {
        control.op = Operation::INFO;
        control.argument = argument;
        return control;
    }

    if (verb == "msg") {
        // MSG <subject> <sid> [reply] <#bytes>
        auto tokens = tokenize(argument);
        if (tokens.size() != 3 && tokens.size() != 4) {
            return std::nullopt;
        }
        auto sid = parse_unsigned(tokens[1]);
        auto total = parse_unsigned(tokens.back());
        if (!sid || !total) {
            return std::nullopt;
        }
        control.op = Operation::MSG;
        control.subject = tokens[0];
        control.sid = *sid;
        control.reply = tokens.size() == 4 ? tokens[2] : "";
        control.total_bytes = static_cast<size_t>(*total);
        return control;
    }

    if (verb == "hmsg") {
        // HMSG <subject> <sid> [reply] <#header bytes> <#total bytes>
        auto tokens = tokenize(argument);
        if (tokens.size() != 4 && tokens.size() != 5) {
            return std::nullopt;
        }
        auto sid = parse_unsigned(tokens[1]);
        auto headers = parse_unsigned(tokens[tokens.size() - 2]);
        auto total = parse_unsigned(tokens.back());
        if (!sid || !headers || !total || *headers > *total) {
            return std::nullopt;
        }
        control.op = Operation::HMSG;
        control.subject = tokens[0];
        control.sid = *sid;
        control.reply = tokens.size() == 5 ? tokens[2] : "";
        control.header_bytes = static_cast<size_t>(*headers);
        control.total_bytes = static_cast<size_t>(*total);
        return control;
    }

    control.op = Operation::UNKNOWN;
    control.argument = line;
    return control;
}

std::optional<HeaderBlock> parse_headers(const std::string& block) {
    auto lines = utilities::split_string(block, '\n');
    if (lines.empty()) {
        return std::nullopt;
    }

    auto strip_cr = [](std::string& s) {
        if (!s.empty() && s.back() == '\r') {
            s.pop_back();
        }
    };

    std::string status_line = lines[0];
    strip_cr(status_line);
    if (!utilities::starts_with(status_line, "NATS/1.0")) {
        return std::nullopt;
    }

    HeaderBlock headers;
    std::string status_rest = utilities::trim_string(status_line.substr(8));
    if (!status_rest.empty()) {
        auto space = status_rest.find(' ');
        auto code = parse_unsigned(status_rest.substr(0, space));
        if (!code) {
            return std::nullopt;
        }
        headers.status = static_cast<int>(*code);
        if (space != std::string::npos) {
            headers.description = utilities::trim_string(status_rest.substr(space + 1));
        }
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        std::string line = lines[i];
        strip_cr(line);
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        headers.fields[utilities::trim_string(line.substr(0, colon))] =
            utilities::trim_string(line.substr(colon + 1));
    }

    return headers;
}

bool is_pull_terminal_status(int status) {
    return status == 404 || status == 408 || status == 409;
}

// ============================================================================
// JetStream
// ============================================================================

std::optional<AckMetadata> parse_ack_subject(const std::string& reply) {
    auto tokens = utilities::split_string(reply, '.');
    if (tokens.size() < 9 || tokens[0] != "$JS" || tokens[1] != "ACK") {
        return std::nullopt;
    }

    // v1: $JS.ACK.<stream>.<consumer>.<delivered>.<sseq>.<cseq>.<ts>.<pending>
    // v2: $JS.ACK.<domain>.<account hash>.<stream>.<consumer>.<delivered>.<sseq>.<cseq>.<ts>.<pending>.<token>
    size_t offset = 0;
    AckMetadata metadata;
    if (tokens.size() == 9) {
        offset = 2;
    } else if (tokens.size() >= 11) {
        metadata.domain = tokens[2] == "_" ? "" : tokens[2];
        offset = 4;
    } else {
        return std::nullopt;
    }

    metadata.stream = tokens[offset];
    metadata.consumer = tokens[offset + 1];

    auto delivered = parse_unsigned(tokens[offset + 2]);
    auto stream_seq = parse_unsigned(tokens[offset + 3]);
    auto consumer_seq = parse_unsigned(tokens[offset + 4]);
    auto timestamp = parse_unsigned(tokens[offset + 5]);
    auto pending = parse_unsigned(tokens[offset + 6]);
    if (!delivered || !stream_seq || !consumer_seq || !timestamp || !pending) {
        return std::nullopt;
    }

    metadata.delivered = *delivered;
    metadata.stream_sequence = *stream_seq;
    metadata.consumer_sequence = *consumer_seq;
    metadata.timestamp_ns = static_cast<int64_t>(*timestamp);
    metadata.pending = *pending;
    return metadata;
}

json stream_config_json(const std::string& name,
                        const std::vector<std::string>& subjects,
                        const std::string& retention,
                        int64_t max_bytes,
                        int64_t max_age_seconds,
                        const std::string& storage) {
    return {
        {"name", name},
        {"subjects", subjects},
        {"retention", retention},
        {"max_bytes", max_bytes},
        {"max_age", max_age_seconds * 1000000000LL},
        {"storage", storage},
        {"discard", "old"},
        {"num_replicas", 1}
    };
}

std::optional<ApiError> api_error(const json& reply) {
    auto it = reply.find("error");
    if (it == reply.end() || !it->is_object()) {
        return std::nullopt;
    }

    ApiError error;
    error.code = it->value("code", 0);
    error.err_code = it->value("err_code", 0);
    error.description = it->value("description", std::string("unknown error"));
    return error;
}

} // namespace nats
} // namespace agentlink
