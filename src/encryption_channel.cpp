/**
 * @file encryption_channel.cpp
 * @brief Implementation of per-peer authenticated encryption
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/encryption_channel.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/utilities.hpp"

#include <algorithm>

namespace agentlink {

EncryptionChannel::EncryptionChannel(std::shared_ptr<const IdentityStore> identity)
    : identity_(std::move(identity))
{
    if (!identity_) {
        throw ValidationError("EncryptionChannel requires an identity");
    }
}

// ============================================================================
// Key Agreement
// ============================================================================

SharedSecret EncryptionChannel::derive_shared_secret(
    const std::array<uint8_t, KEY_SIZE>& own_exchange_private,
    const PublicKey& peer_exchange_public
) {
    auto shared = AgentCrypto::derive_shared_secret(own_exchange_private, peer_exchange_public);
    if (!shared) {
        throw CryptoError("key exchange rejected peer public key");
    }
    return *shared;
}

SharedSecret EncryptionChannel::shared_secret_with(const PublicKey& peer_exchange_public) const {
    auto shared = identity_->key_exchange(peer_exchange_public);
    if (!shared) {
        throw CryptoError("key exchange rejected peer public key");
    }
    return *shared;
}

// ============================================================================
// Encryption
// ============================================================================

std::vector<uint8_t> EncryptionChannel::encrypt(const std::vector<uint8_t>& plaintext,
                                                const SharedSecret& key) {
    Nonce nonce = AgentCrypto::generate_nonce();

    auto tagged = AgentCrypto::encrypt(plaintext, key, nonce);
    if (!tagged) {
        throw CryptoError("encryption failed");
    }

    std::vector<uint8_t> envelope;
    envelope.reserve(NONCE_SIZE + tagged->size());
    envelope.insert(envelope.end(), nonce.begin(), nonce.end());
    envelope.insert(envelope.end(), tagged->begin(), tagged->end());
    return envelope;
}

std::vector<uint8_t> EncryptionChannel::decrypt(const std::vector<uint8_t>& envelope,
                                                const SharedSecret& key) {
    if (envelope.size() < ENVELOPE_OVERHEAD) {
        throw DecryptionError("envelope of " + std::to_string(envelope.size()) +
                              " bytes is shorter than nonce and tag");
    }

    Nonce nonce;
    std::copy(envelope.begin(), envelope.begin() + NONCE_SIZE, nonce.begin());
    std::vector<uint8_t> tagged(envelope.begin() + NONCE_SIZE, envelope.end());

    auto plaintext = AgentCrypto::decrypt(tagged, key, nonce);
    if (!plaintext) {
        throw DecryptionError("authentication tag mismatch");
    }
    return *plaintext;
}

std::vector<uint8_t> EncryptionChannel::encrypt_for_peer(const std::vector<uint8_t>& plaintext,
                                                         const PublicKey& peer_exchange_public) const {
    SharedSecret key = shared_secret_with(peer_exchange_public);
    auto envelope = encrypt(plaintext, key);
    AgentCrypto::secure_zero(key.key.data(), key.key.size());
    return envelope;
}

std::vector<uint8_t> EncryptionChannel::decrypt_from_peer(const std::vector<uint8_t>& envelope,
                                                          const PublicKey& peer_exchange_public) const {
    SharedSecret key = shared_secret_with(peer_exchange_public);
    try {
        auto plaintext = decrypt(envelope, key);
        AgentCrypto::secure_zero(key.key.data(), key.key.size());
        return plaintext;
    } catch (const DecryptionError& e) {
        AgentCrypto::secure_zero(key.key.data(), key.key.size());
        utilities::log_warn("EncryptionChannel: " + identity_->agent_id() + ": " + e.what());
        throw;
    }
}

std::string EncryptionChannel::encrypt_text_for_peer(const std::string& plaintext,
                                                     const PublicKey& peer_exchange_public) const {
    std::vector<uint8_t> bytes(plaintext.begin(), plaintext.end());
    return AgentCrypto::bytes_to_base64(encrypt_for_peer(bytes, peer_exchange_public));
}

std::string EncryptionChannel::decrypt_text_from_peer(const std::string& envelope_base64,
                                                      const PublicKey& peer_exchange_public) const {
    auto envelope = AgentCrypto::base64_to_bytes(envelope_base64);
    if (!envelope) {
        throw DecryptionError("envelope is not valid base64");
    }
    auto plaintext = decrypt_from_peer(*envelope, peer_exchange_public);
    return std::string(plaintext.begin(), plaintext.end());
}

// ============================================================================
// Signatures
// ============================================================================

std::vector<uint8_t> EncryptionChannel::sign(const std::vector<uint8_t>& message) const {
    return identity_->sign(message);
}

bool EncryptionChannel::verify(const std::vector<uint8_t>& message,
                               const std::vector<uint8_t>& signature,
                               const PublicKey& peer_signing_public) const noexcept {
    return IdentityStore::verify(message, signature, peer_signing_public);
}

} // namespace agentlink
