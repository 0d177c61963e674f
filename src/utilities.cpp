/**
 * @file utilities.cpp
 * @brief Logging, clock, file and environment helpers for AgentLink
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace agentlink {
namespace utilities {

namespace {

constexpr const char* LOGGER_NAME = "agentlink";
constexpr size_t LOG_FILE_BYTES = 10 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

std::once_flag g_default_logging;

spdlog::level::level_enum spdlog_level(LogLevel level) {
    static constexpr std::array<spdlog::level::level_enum, 5> levels = {
        spdlog::level::debug, spdlog::level::info, spdlog::level::warn,
        spdlog::level::err, spdlog::level::critical
    };
    return levels[static_cast<size_t>(level)];
}

std::shared_ptr<spdlog::logger> active_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    std::call_once(g_default_logging, [] { initialize_logging(); });
    return spdlog::get(LOGGER_NAME);
}

} // namespace

// ============================================================================
// Logging
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, LOG_FILE_BYTES, LOG_FILE_COUNT));
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "agentlink: cannot open log file %s: %s\n", log_file.c_str(), ex.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(spdlog_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    spdlog::drop(LOGGER_NAME);
    spdlog::set_default_logger(logger);
}

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = to_lowercase(trim_string(name));
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void log(LogLevel level, const std::string& message) {
    if (auto logger = active_logger()) {
        logger->log(spdlog_level(level), message);
    }
}

void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void log_info(const std::string& message) { log(LogLevel::INFO, message); }
void log_warn(const std::string& message) { log(LogLevel::WARN, message); }
void log_error(const std::string& message) { log(LogLevel::ERROR, message); }
void log_critical(const std::string& message) { log(LogLevel::CRITICAL, message); }

// ============================================================================
// Time
// ============================================================================

double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    using seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<seconds>(tp.time_since_epoch()).count();
}

double current_time_seconds() {
    return to_epoch_seconds(std::chrono::system_clock::now());
}

uint64_t current_time_ms() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

std::string format_current_time() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    char buffer[sizeof("2025-01-01T00:00:00Z")];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

// ============================================================================
// Files
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        log_error("Utilities: cannot open " + file_path);
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        log_error("Utilities: read failed for " + file_path);
        return std::nullopt;
    }
    return content;
}

int create_file(const std::string& file_path, bool owner_only) {
    // O_CREAT leaves the mode of an existing file alone, so start from nothing
    if (::unlink(file_path.c_str()) != 0 && errno != ENOENT) {
        log_error("Utilities: cannot replace " + file_path + ": " + std::strerror(errno));
        return -1;
    }

    mode_t mode = owner_only ? S_IRUSR | S_IWUSR : S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    int fd = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
    if (fd < 0) {
        log_error("Utilities: cannot create " + file_path + ": " + std::strerror(errno));
        return -1;
    }
    if (owner_only && ::fchmod(fd, mode) != 0) {
        log_error("Utilities: cannot restrict permissions on " + file_path + ": " + std::strerror(errno));
        ::close(fd);
        ::unlink(file_path.c_str());
        return -1;
    }
    return fd;
}

bool write_file(const std::string& file_path, const std::string& content, bool owner_only) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path target(file_path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            log_error("Utilities: cannot create " + target.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    // Staged beside the target and renamed, so readers never see a partial key file
    std::string staging = file_path + ".tmp";
    int fd = create_file(staging, owner_only);
    if (fd < 0) {
        return false;
    }

    const char* cursor = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            log_error("Utilities: write failed for " + staging + ": " + std::strerror(errno));
            ::close(fd);
            ::unlink(staging.c_str());
            return false;
        }
        cursor += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::close(fd) != 0) {
        log_error("Utilities: close failed for " + staging + ": " + std::strerror(errno));
        ::unlink(staging.c_str());
        return false;
    }

    fs::rename(staging, target, ec);
    if (ec) {
        log_error("Utilities: cannot move " + staging + " into place: " + ec.message());
        fs::remove(staging, ec);
        return false;
    }
    return true;
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        log_error("Utilities: SHA-256 digest failed");
        return "";
    }

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

// ============================================================================
// Strings
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t pos = str.find(delimiter); pos != std::string::npos; pos = str.find(delimiter, start)) {
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    if (start < str.size()) {
        parts.push_back(str.substr(start));
    }
    return parts;
}

std::string trim_string(const std::string& str) {
    static constexpr const char* whitespace = " \t\r\n\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(whitespace) - first + 1);
}

std::string to_lowercase(std::string str) {
    for (char& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), str.begin());
}

// ============================================================================
// Environment
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return (value != nullptr && *value != '\0') ? std::string(value) : default_value;
}

std::string get_hostname() {
    char name[256] = {};
    if (gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
        return "unknown";
    }
    return name;
}

std::string generate_random_string(size_t length) {
    static constexpr char alphabet[] =
        "abcdefghijklmnopqrstuvwxyz0123456789";

    thread_local std::mt19937_64 engine(std::random_device{}());
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string out(length, '\0');
    for (char& c : out) {
        c = alphabet[pick(engine)];
    }
    return out;
}

} // namespace utilities
} // namespace agentlink
