/**
 * @file identity_store.hpp
 * @brief Persistent per-agent cryptographic identity
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Manages agent identity including:
 * - Ed25519 signing keys (authentication)
 * - Independent X25519 exchange keys (confidentiality)
 * - PEM key files with owner-only permissions plus a JSON manifest
 * - Raw, hex and PEM export
 */

#pragma once

#include "agentlink/agent_crypto.hpp"
#include "agentlink/key_encoding.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentlink {

/**
 * @brief IdentityStore - Cryptographic identity for one agent
 *
 * Files in storage_dir:
 * - <agent_id>_signing.pem   PKCS#8 Ed25519 private key (0600)
 * - <agent_id>_exchange.pem  PKCS#8 X25519 private key (0600)
 * - <agent_id>_identity.json manifest (key types, version, public keys)
 *
 * Private material never leaves the process except through the audited
 * export_private(). Thread-safe.
 */
class IdentityStore {
public:
    /// Manifest format version
    static constexpr const char* MANIFEST_VERSION = "1.0.0";

    /**
     * @brief Bind a store to an agent and directory; no keys are touched
     * @param agent_id Agent identifier (validated, becomes part of file names)
     * @param storage_dir Directory holding the key files
     * @throws ValidationError if agent_id is not a valid identifier
     */
    IdentityStore(const std::string& agent_id, std::filesystem::path storage_dir);

    /**
     * @brief Destructor - zeroes in-memory private keys
     */
    ~IdentityStore();

    IdentityStore(const IdentityStore&) = delete;
    IdentityStore& operator=(const IdentityStore&) = delete;
    IdentityStore(IdentityStore&&) = delete;
    IdentityStore& operator=(IdentityStore&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Check whether both key files exist on disk
     */
    bool has_identity() const;

    /**
     * @brief Check whether keys are held in memory
     */
    bool is_loaded() const;

    /**
     * @brief Create and persist fresh signing and exchange key pairs
     *
     * Overwrites any existing files for this agent.
     *
     * @return The new key pairs
     * @throws StorageError if the directory or files cannot be written
     */
    std::pair<SignatureKeyPair, ExchangeKeyPair> generate();

    /**
     * @brief Load keys from disk
     * @throws StorageError if key files are missing or unreadable
     * @throws CryptoError if a file does not hold a key of the expected type
     */
    void load();

    /**
     * @brief Load keys if present, otherwise generate them
     */
    void load_or_generate();

    /**
     * @brief Delete and regenerate both key pairs
     *
     * Every shared secret derived from the previous exchange key stops
     * matching, and signatures from the old key no longer verify.
     */
    std::pair<SignatureKeyPair, ExchangeKeyPair> regenerate();

    /**
     * @brief Delete key files and manifest, and forget in-memory keys
     * @return true if any file was removed
     * @throws StorageError if a file exists but cannot be removed
     */
    bool remove();

    /**
     * @brief Replace the identity with keys supplied as PKCS#8 PEM and persist them
     * @throws CryptoError if either PEM block is invalid
     * @throws StorageError if the keys cannot be written
     */
    void import_keys(const std::string& signing_private_pem,
                     const std::string& exchange_private_pem);

    /**
     * @brief Read the identity manifest
     * @return Manifest document, or std::nullopt if absent or unreadable
     */
    std::optional<nlohmann::json> read_manifest() const;

    // ========================================================================
    // Identity Information
    // ========================================================================

    const std::string& agent_id() const { return agent_id_; }

    const std::filesystem::path& storage_dir() const { return storage_dir_; }

    /// @throws StorageError if no identity is loaded
    PublicKey signing_public_key() const;

    /// @throws StorageError if no identity is loaded
    PublicKey exchange_public_key() const;

    /**
     * @brief Export a public key
     * @param kind Signing or exchange key
     * @param format RAW (32 bytes in a string), HEX or PEM
     */
    std::string export_public(KeyKind kind, KeyFormat format) const;

    /**
     * @brief Export a private key (audited: always logged)
     *
     * RAW yields the 32-byte Ed25519 seed or X25519 scalar.
     */
    std::string export_private(KeyKind kind, KeyFormat format) const;

    // ========================================================================
    // Cryptographic Operations
    // ========================================================================

    /**
     * @brief Sign a message with this agent's Ed25519 key
     * @return Detached 64-byte signature
     * @throws StorageError if no identity is loaded
     */
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

    /**
     * @brief Verify a signature against this agent's public key
     * @return false on any failure, never throws
     */
    bool verify(const std::vector<uint8_t>& message,
                const std::vector<uint8_t>& signature) const noexcept;

    /**
     * @brief Verify a signature against a peer's public key
     * @return false on any failure, never throws
     */
    static bool verify(const std::vector<uint8_t>& message,
                       const std::vector<uint8_t>& signature,
                       const PublicKey& peer_signing_public_key) noexcept;

    /**
     * @brief Derive the shared secret with a peer's exchange public key
     * @return SharedSecret, or std::nullopt if the peer key is rejected
     * @throws StorageError if no identity is loaded
     */
    std::optional<SharedSecret> key_exchange(const PublicKey& peer_exchange_public_key) const;

private:
    std::filesystem::path signing_key_path() const;
    std::filesystem::path exchange_key_path() const;
    std::filesystem::path manifest_path() const;

    void persist_locked(const SignatureKeyPair& signing, const ExchangeKeyPair& exchange);
    void clear_keys_locked();
    void require_loaded_locked() const;

    std::string agent_id_;
    std::filesystem::path storage_dir_;

    mutable std::mutex mutex_;
    std::optional<SignatureKeyPair> signing_;
    std::optional<ExchangeKeyPair> exchange_;
};

} // namespace agentlink
