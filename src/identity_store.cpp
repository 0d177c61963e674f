/**
 * @file identity_store.cpp
 * @brief Implementation of persistent agent identity
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Secure identity management with PEM key storage
 */

#include "agentlink/identity_store.hpp"
#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/utilities.hpp"

#include <system_error>

namespace agentlink {

namespace {

std::vector<uint8_t> to_vector(const PublicKey& key) {
    return std::vector<uint8_t>(key.begin(), key.end());
}

std::string encode_raw(KeyKind kind, KeyFormat format, const PublicKey& key, bool is_private) {
    switch (format) {
        case KeyFormat::RAW:
            return std::string(key.begin(), key.end());
        case KeyFormat::HEX:
            return AgentCrypto::bytes_to_hex(to_vector(key));
        case KeyFormat::PEM:
            return is_private ? key_encoding::private_key_to_pem(kind, key)
                              : key_encoding::public_key_to_pem(kind, key);
    }
    throw ValidationError("unsupported key format");
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

IdentityStore::IdentityStore(const std::string& agent_id, std::filesystem::path storage_dir)
    : agent_id_(agent_id)
    , storage_dir_(std::move(storage_dir))
{
    if (!config::validate_identifier(agent_id_)) {
        throw ValidationError("invalid agent id '" + agent_id_ + "'");
    }
}

IdentityStore::~IdentityStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_keys_locked();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool IdentityStore::has_identity() const {
    std::error_code ec;
    return std::filesystem::exists(signing_key_path(), ec)
        && std::filesystem::exists(exchange_key_path(), ec);
}

bool IdentityStore::is_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signing_.has_value() && exchange_.has_value();
}

std::pair<SignatureKeyPair, ExchangeKeyPair> IdentityStore::generate() {
    SignatureKeyPair signing = AgentCrypto::generate_signature_keypair();
    ExchangeKeyPair exchange = AgentCrypto::generate_exchange_keypair();

    std::lock_guard<std::mutex> lock(mutex_);
    persist_locked(signing, exchange);
    clear_keys_locked();
    signing_ = signing;
    exchange_ = exchange;

    utilities::log_info("IdentityStore: generated identity for " + agent_id_);
    return {signing, exchange};
}

void IdentityStore::load() {
    auto signing_pem = utilities::read_file(signing_key_path().string());
    auto exchange_pem = utilities::read_file(exchange_key_path().string());
    if (!signing_pem || !exchange_pem) {
        throw StorageError("no readable identity for " + agent_id_ + " in " + storage_dir_.string());
    }

    auto seed = key_encoding::private_key_from_pem(KeyKind::SIGNING, *signing_pem);
    auto scalar = key_encoding::private_key_from_pem(KeyKind::EXCHANGE, *exchange_pem);
    AgentCrypto::secure_zero(signing_pem->data(), signing_pem->size());
    AgentCrypto::secure_zero(exchange_pem->data(), exchange_pem->size());

    if (!seed || !scalar) {
        throw CryptoError("identity files for " + agent_id_ + " do not hold the expected keys");
    }

    SignatureKeyPair signing = AgentCrypto::signature_keypair_from_seed(*seed);
    auto exchange = AgentCrypto::exchange_keypair_from_secret(*scalar);
    AgentCrypto::secure_zero(seed->data(), seed->size());
    AgentCrypto::secure_zero(scalar->data(), scalar->size());
    if (!exchange) {
        throw CryptoError("exchange key for " + agent_id_ + " is invalid");
    }

    // Manifest mismatch means files were swapped or edited by hand
    if (auto manifest = read_manifest()) {
        std::string recorded = manifest->value("signing_public_key", "");
        if (!recorded.empty() && recorded != AgentCrypto::bytes_to_hex(to_vector(signing.public_key))) {
            utilities::log_warn("IdentityStore: manifest public key does not match key file for " + agent_id_);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    clear_keys_locked();
    signing_ = signing;
    exchange_ = *exchange;
    utilities::log_info("IdentityStore: loaded identity for " + agent_id_);
}

void IdentityStore::load_or_generate() {
    if (has_identity()) {
        load();
    } else {
        utilities::log_info("IdentityStore: no identity on disk for " + agent_id_ + ", generating");
        generate();
    }
}

std::pair<SignatureKeyPair, ExchangeKeyPair> IdentityStore::regenerate() {
    utilities::log_warn("IdentityStore: regenerating identity for " + agent_id_ +
                        "; previously derived shared secrets are invalidated");
    remove();
    return generate();
}

bool IdentityStore::remove() {
    bool removed = false;

    for (const auto& path : {signing_key_path(), exchange_key_path(), manifest_path()}) {
        std::error_code ec;
        bool existed = std::filesystem::remove(path, ec);
        if (ec) {
            throw StorageError("cannot remove " + path.string() + ": " + ec.message());
        }
        removed = removed || existed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    clear_keys_locked();

    if (removed) {
        utilities::log_info("IdentityStore: removed identity for " + agent_id_);
    }
    return removed;
}

void IdentityStore::import_keys(const std::string& signing_private_pem,
                                const std::string& exchange_private_pem) {
    auto seed = key_encoding::private_key_from_pem(KeyKind::SIGNING, signing_private_pem);
    if (!seed) {
        throw CryptoError("signing key PEM is not a valid Ed25519 private key");
    }
    auto scalar = key_encoding::private_key_from_pem(KeyKind::EXCHANGE, exchange_private_pem);
    if (!scalar) {
        AgentCrypto::secure_zero(seed->data(), seed->size());
        throw CryptoError("exchange key PEM is not a valid X25519 private key");
    }

    SignatureKeyPair signing = AgentCrypto::signature_keypair_from_seed(*seed);
    auto exchange = AgentCrypto::exchange_keypair_from_secret(*scalar);
    AgentCrypto::secure_zero(seed->data(), seed->size());
    AgentCrypto::secure_zero(scalar->data(), scalar->size());
    if (!exchange) {
        throw CryptoError("exchange key is invalid");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    persist_locked(signing, *exchange);
    clear_keys_locked();
    signing_ = signing;
    exchange_ = *exchange;
    utilities::log_warn("IdentityStore: imported external keys for " + agent_id_);
}

std::optional<nlohmann::json> IdentityStore::read_manifest() const {
    std::error_code ec;
    if (!std::filesystem::exists(manifest_path(), ec)) {
        return std::nullopt;
    }

    auto content = utilities::read_file(manifest_path().string());
    if (!content) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(*content);
    } catch (const nlohmann::json::exception& e) {
        utilities::log_warn("IdentityStore: unreadable manifest: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// Identity Information
// ============================================================================

PublicKey IdentityStore::signing_public_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    require_loaded_locked();
    return signing_->public_key;
}

PublicKey IdentityStore::exchange_public_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    require_loaded_locked();
    return exchange_->public_key;
}

std::string IdentityStore::export_public(KeyKind kind, KeyFormat format) const {
    PublicKey key = kind == KeyKind::SIGNING ? signing_public_key() : exchange_public_key();
    return encode_raw(kind, format, key, false);
}

std::string IdentityStore::export_private(KeyKind kind, KeyFormat format) const {
    key_encoding::PrivateKeyBytes raw;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_loaded_locked();
        raw = kind == KeyKind::SIGNING
            ? AgentCrypto::signature_seed(signing_->secret_key)
            : exchange_->secret_key;
    }

    utilities::log_warn("IdentityStore: AUDIT private " + key_encoding::key_type_name(kind) +
                        " key exported for " + agent_id_);

    std::string exported = encode_raw(kind, format, raw, true);
    AgentCrypto::secure_zero(raw.data(), raw.size());
    return exported;
}

// ============================================================================
// Cryptographic Operations
// ============================================================================

std::vector<uint8_t> IdentityStore::sign(const std::vector<uint8_t>& message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    require_loaded_locked();
    return AgentCrypto::sign_message(message, signing_->secret_key);
}

bool IdentityStore::verify(const std::vector<uint8_t>& message,
                           const std::vector<uint8_t>& signature) const noexcept {
    PublicKey own_key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!signing_) {
            return false;
        }
        own_key = signing_->public_key;
    }
    return verify(message, signature, own_key);
}

bool IdentityStore::verify(const std::vector<uint8_t>& message,
                           const std::vector<uint8_t>& signature,
                           const PublicKey& peer_signing_public_key) noexcept {
    return AgentCrypto::verify_signature(message, signature, peer_signing_public_key);
}

std::optional<SharedSecret> IdentityStore::key_exchange(const PublicKey& peer_exchange_public_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    require_loaded_locked();
    return AgentCrypto::derive_shared_secret(exchange_->secret_key, peer_exchange_public_key);
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::filesystem::path IdentityStore::signing_key_path() const {
    return storage_dir_ / (agent_id_ + "_signing.pem");
}

std::filesystem::path IdentityStore::exchange_key_path() const {
    return storage_dir_ / (agent_id_ + "_exchange.pem");
}

std::filesystem::path IdentityStore::manifest_path() const {
    return storage_dir_ / (agent_id_ + "_identity.json");
}

void IdentityStore::persist_locked(const SignatureKeyPair& signing, const ExchangeKeyPair& exchange) {
    try {
        std::filesystem::create_directories(storage_dir_);
    } catch (const std::filesystem::filesystem_error& e) {
        throw StorageError("cannot create " + storage_dir_.string() + ": " + e.what());
    }

    auto seed = AgentCrypto::signature_seed(signing.secret_key);
    std::string signing_pem = key_encoding::private_key_to_pem(KeyKind::SIGNING, seed);
    std::string exchange_pem = key_encoding::private_key_to_pem(KeyKind::EXCHANGE, exchange.secret_key);
    AgentCrypto::secure_zero(seed.data(), seed.size());

    bool written = utilities::write_file(signing_key_path().string(), signing_pem, true)
                && utilities::write_file(exchange_key_path().string(), exchange_pem, true);
    AgentCrypto::secure_zero(signing_pem.data(), signing_pem.size());
    AgentCrypto::secure_zero(exchange_pem.data(), exchange_pem.size());
    if (!written) {
        throw StorageError("cannot write key files to " + storage_dir_.string());
    }

    std::vector<uint8_t> signing_public = to_vector(signing.public_key);
    nlohmann::json manifest = {
        {"agent_id", agent_id_},
        {"version", MANIFEST_VERSION},
        {"signing_key_type", key_encoding::key_type_name(KeyKind::SIGNING)},
        {"exchange_key_type", key_encoding::key_type_name(KeyKind::EXCHANGE)},
        {"created_at", utilities::format_current_time()},
        {"signing_public_key", AgentCrypto::bytes_to_hex(signing_public)},
        {"exchange_public_key", AgentCrypto::bytes_to_hex(to_vector(exchange.public_key))},
        {"signing_key_fingerprint", utilities::sha256_hex(signing_public)},
        {"signing_key_file", signing_key_path().filename().string()},
        {"exchange_key_file", exchange_key_path().filename().string()}
    };

    if (!utilities::write_file(manifest_path().string(), manifest.dump(2))) {
        throw StorageError("cannot write identity manifest to " + storage_dir_.string());
    }
}

void IdentityStore::clear_keys_locked() {
    if (signing_) {
        AgentCrypto::secure_zero(signing_->secret_key.data(), signing_->secret_key.size());
        signing_.reset();
    }
    if (exchange_) {
        AgentCrypto::secure_zero(exchange_->secret_key.data(), exchange_->secret_key.size());
        exchange_.reset();
    }
}

void IdentityStore::require_loaded_locked() const {
    if (!signing_ || !exchange_) {
        throw StorageError("identity for " + agent_id_ + " is not loaded");
    }
}

} // namespace agentlink
