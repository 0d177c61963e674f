/**
 * @file encryption_channel.hpp
 * @brief Authenticated encryption between two agents
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Wire form of an encrypted payload:
 *
 *   nonce (12 bytes) || tag (16 bytes) || ciphertext (variable)
 */

#pragma once

#include "agentlink/agent_crypto.hpp"
#include "agentlink/identity_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace agentlink {

/// Smallest valid envelope: nonce and tag around an empty ciphertext
constexpr size_t ENVELOPE_OVERHEAD = NONCE_SIZE + TAG_SIZE;

/**
 * @brief EncryptionChannel - per-peer key agreement and AEAD
 *
 * Holds a reference to the local identity and nothing else long-lived.
 * Shared secrets are recomputed on every *_for_peer / *_from_peer call so
 * a peer key rotation takes effect immediately.
 */
class EncryptionChannel {
public:
    /**
     * @param identity Loaded local identity
     */
    explicit EncryptionChannel(std::shared_ptr<const IdentityStore> identity);

    /**
     * @brief Derive the symmetric key for a peer
     *
     * X25519 followed by SHA-256. Symmetric: both sides derive the same key.
     *
     * @throws CryptoError if the peer key is a low-order point
     */
    static SharedSecret derive_shared_secret(
        const std::array<uint8_t, KEY_SIZE>& own_exchange_private,
        const PublicKey& peer_exchange_public
    );

    /**
     * @brief Encrypt under a fresh random nonce
     * @return nonce || tag || ciphertext
     * @throws CryptoError if the cipher reports failure
     */
    static std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext, const SharedSecret& key);

    /**
     * @brief Decrypt an envelope produced by encrypt()
     * @throws DecryptionError on short envelope or tag mismatch
     */
    static std::vector<uint8_t> decrypt(const std::vector<uint8_t>& envelope, const SharedSecret& key);

    /**
     * @brief Derive with the local identity, then encrypt
     */
    std::vector<uint8_t> encrypt_for_peer(const std::vector<uint8_t>& plaintext,
                                          const PublicKey& peer_exchange_public) const;

    /**
     * @brief Derive with the local identity, then decrypt
     * @throws DecryptionError on authentication failure
     */
    std::vector<uint8_t> decrypt_from_peer(const std::vector<uint8_t>& envelope,
                                           const PublicKey& peer_exchange_public) const;

    /**
     * @brief Text convenience: encrypt a string, return base64 of the envelope
     */
    std::string encrypt_text_for_peer(const std::string& plaintext,
                                      const PublicKey& peer_exchange_public) const;

    /**
     * @brief Text convenience: decode base64, decrypt, return the string
     * @throws DecryptionError if the input is not base64 or fails authentication
     */
    std::string decrypt_text_from_peer(const std::string& envelope_base64,
                                       const PublicKey& peer_exchange_public) const;

    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

    bool verify(const std::vector<uint8_t>& message,
                const std::vector<uint8_t>& signature,
                const PublicKey& peer_signing_public) const noexcept;

    const IdentityStore& identity() const { return *identity_; }

private:
    SharedSecret shared_secret_with(const PublicKey& peer_exchange_public) const;

    std::shared_ptr<const IdentityStore> identity_;
};

} // namespace agentlink
