/**
 * @file nats_protocol.hpp
 * @brief NATS client protocol encoding and parsing
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Pure functions over the text protocol: no sockets, no state.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {
namespace nats {

constexpr const char* CRLF = "\r\n";
constexpr uint16_t DEFAULT_PORT = 4222;
constexpr const char* CLIENT_VERSION = "1.0.0";

/// JetStream API error code returned when a stream already exists with other settings
constexpr int STREAM_NAME_IN_USE = 10058;

// ============================================================================
// URLs and handshake
// ============================================================================

struct ServerAddress {
    std::string host;
    uint16_t port = DEFAULT_PORT;
    std::string user;
    std::string password;
};

/**
 * @brief Parse nats://[user:pass@]host[:port]
 * @return nullopt for other schemes or a bad port
 */
std::optional<ServerAddress> parse_url(const std::string& url);

/**
 * @brief Fields of the server INFO block the client uses
 */
struct ServerInfo {
    std::string server_id;
    std::string version;
    bool headers = false;
    bool jetstream = false;
    size_t max_payload = 1024 * 1024;
};

/**
 * @brief Parse the JSON argument of an INFO line
 */
std::optional<ServerInfo> parse_info(const std::string& json_argument);

/**
 * @brief CONNECT command (with trailing CRLF)
 */
std::string connect_command(const std::string& client_name, const ServerAddress& address);

// ============================================================================
// Commands
// ============================================================================

std::string pub_command(const std::string& subject, const std::string& reply, const std::string& payload);
std::string sub_command(const std::string& subject, uint64_t sid);
std::string unsub_command(uint64_t sid);

// ============================================================================
// Server operations
// ============================================================================

enum class Operation {
    MSG,
    HMSG,
    PING,
    PONG,
    OK,
    ERR,
    INFO,
    UNKNOWN
};

/**
 * @brief A parsed server control line (the part before any payload)
 *
 * For MSG and HMSG, header_bytes and total_bytes say how many payload bytes
 * (plus CRLF) follow. For ERR and INFO, argument holds the rest of the line.
 */
struct ControlLine {
    Operation op = Operation::UNKNOWN;
    std::string subject;
    uint64_t sid = 0;
    std::string reply;
    size_t header_bytes = 0;
    size_t total_bytes = 0;
    std::string argument;
};

/**
 * @brief Parse one control line without its CRLF
 * @return nullopt if a MSG/HMSG line has the wrong token count or bad sizes
 */
std::optional<ControlLine> parse_control_line(const std::string& line);

/**
 * @brief Header block of an HMSG
 *
 * The first line is "NATS/1.0" optionally followed by a status code and
 * description; JetStream uses 404, 408 and 409 to end a pull request.
 */
struct HeaderBlock {
    int status = 0;
    std::string description;
    std::map<std::string, std::string> fields;
};

std::optional<HeaderBlock> parse_headers(const std::string& block);

/**
 * @brief True for status codes that terminate a pull request
 */
bool is_pull_terminal_status(int status);

// ============================================================================
// JetStream
// ============================================================================

/**
 * @brief Metadata encoded in a JetStream ack reply subject
 */
struct AckMetadata {
    std::string domain;
    std::string stream;
    std::string consumer;
    uint64_t delivered = 0;
    uint64_t stream_sequence = 0;
    uint64_t consumer_sequence = 0;
    int64_t timestamp_ns = 0;
    uint64_t pending = 0;
};

/**
 * @brief Parse $JS.ACK.<stream>.<consumer>.<delivered>.<sseq>.<cseq>.<ts>.<pending>
 *        or the 12-token form with domain and account hash
 */
std::optional<AckMetadata> parse_ack_subject(const std::string& reply);

/**
 * @brief JetStream API request body for a stream
 */
nlohmann::json stream_config_json(const std::string& name,
                                  const std::vector<std::string>& subjects,
                                  const std::string& retention,
                                  int64_t max_bytes,
                                  int64_t max_age_seconds,
                                  const std::string& storage);

/**
 * @brief Error carried by a JetStream API reply
 */
struct ApiError {
    int code = 0;
    int err_code = 0;
    std::string description;
};

/**
 * @brief Extract the "error" object from an API reply
 * @return nullopt when the reply reports success
 */
std::optional<ApiError> api_error(const nlohmann::json& reply);

} // namespace nats
} // namespace agentlink
