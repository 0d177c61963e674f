/**
 * @file agent_crypto.hpp
 * @brief Cryptographic primitives for AgentLink agents
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides Ed25519 signatures, X25519 key agreement with SHA-256 key
 * derivation, and ChaCha20-Poly1305 (IETF) authenticated encryption.
 */

#pragma once

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <sodium.h>

namespace agentlink {

/// Size of every public key, exchange private key and derived secret
constexpr size_t KEY_SIZE = 32;

/// AEAD nonce size (random per message)
constexpr size_t NONCE_SIZE = crypto_aead_chacha20poly1305_ietf_NPUBBYTES;

/// AEAD authentication tag size
constexpr size_t TAG_SIZE = crypto_aead_chacha20poly1305_ietf_ABYTES;

/// Ed25519 signature size
constexpr size_t SIGNATURE_SIZE = crypto_sign_BYTES;

using PublicKey = std::array<uint8_t, KEY_SIZE>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;

/**
 * @brief Ed25519 signing key pair
 *
 * secret_key uses libsodium's 64-byte layout (seed followed by public key).
 */
struct SignatureKeyPair {
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/**
 * @brief X25519 key exchange key pair
 */
struct ExchangeKeyPair {
    std::array<uint8_t, crypto_scalarmult_BYTES> public_key;
    std::array<uint8_t, crypto_scalarmult_SCALARBYTES> secret_key;
};

/**
 * @brief Symmetric key derived from a key exchange
 */
struct SharedSecret {
    std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_KEYBYTES> key;

    bool operator==(const SharedSecret& other) const {
        return sodium_memcmp(key.data(), other.key.data(), key.size()) == 0;
    }
    bool operator!=(const SharedSecret& other) const { return !(*this == other); }
};

/**
 * @brief AgentCrypto - Cryptographic operations for agents
 *
 * Stateless wrappers over libsodium. Failures are reported through
 * std::optional / bool; callers decide whether they are fatal.
 */
class AgentCrypto {
public:
    /**
     * @brief Initialize libsodium (safe to call repeatedly)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Key Generation
    // ========================================================================

    static SignatureKeyPair generate_signature_keypair();

    static ExchangeKeyPair generate_exchange_keypair();

    /**
     * @brief Rebuild an Ed25519 key pair from its 32-byte seed
     */
    static SignatureKeyPair signature_keypair_from_seed(const std::array<uint8_t, KEY_SIZE>& seed);

    /**
     * @brief Rebuild an X25519 key pair from its 32-byte private scalar
     * @return Key pair, or std::nullopt if the scalar is rejected
     */
    static std::optional<ExchangeKeyPair> exchange_keypair_from_secret(
        const std::array<uint8_t, KEY_SIZE>& secret
    );

    /**
     * @brief Extract the 32-byte seed from a libsodium Ed25519 secret key
     */
    static std::array<uint8_t, KEY_SIZE> signature_seed(
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Detached signature (64 bytes)
     */
    static std::vector<uint8_t> sign_message(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 signature
     * @param message Original message
     * @param signature Signature to verify (64 bytes)
     * @param public_key Public key of signer
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
    );

    // ========================================================================
    // Key Agreement (X25519 + SHA-256)
    // ========================================================================

    /**
     * @brief Derive a symmetric key from our private and their public key
     *
     * key = SHA-256(X25519(our_secret_key, their_public_key))
     *
     * @return SharedSecret, or std::nullopt for low-order peer keys
     */
    static std::optional<SharedSecret> derive_shared_secret(
        const std::array<uint8_t, crypto_scalarmult_SCALARBYTES>& our_secret_key,
        const std::array<uint8_t, crypto_scalarmult_BYTES>& their_public_key
    );

    // ========================================================================
    // Encryption (ChaCha20-Poly1305 AEAD, detached tag)
    // ========================================================================

    /**
     * @brief Encrypt with ChaCha20-Poly1305
     * @param plaintext Message to encrypt
     * @param shared_secret Symmetric key
     * @param nonce Unique nonce (12 bytes) - must never be reused with same key
     * @return tag(16) followed by ciphertext
     */
    static std::optional<std::vector<uint8_t>> encrypt(
        const std::vector<uint8_t>& plaintext,
        const SharedSecret& shared_secret,
        const Nonce& nonce
    );

    /**
     * @brief Decrypt tag(16) followed by ciphertext
     * @return Plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> decrypt(
        const std::vector<uint8_t>& tagged_ciphertext,
        const SharedSecret& shared_secret,
        const Nonce& nonce
    );

    // ========================================================================
    // Utility Functions
    // ========================================================================

    static Nonce generate_nonce();

    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Constant-time comparison of byte arrays
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    /**
     * @brief Convert bytes to lowercase hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert bytes to base64 string (standard alphabet, padded)
     */
    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Convert base64 string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Securely zero memory
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace agentlink
