/**
 * @file agent_crypto.cpp
 * @brief Implementation of cryptographic primitives for AgentLink agents
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519: digital signatures
 * - X25519 + SHA-256: key agreement
 * - ChaCha20-Poly1305 (IETF): AEAD cipher
 */

#include "agentlink/agent_crypto.hpp"
#include <cstring>

namespace agentlink {

// ============================================================================
// Initialization
// ============================================================================

bool AgentCrypto::initialize() {
    // sodium_init() returns 1 when already initialized
    return sodium_init() >= 0;
}

// ============================================================================
// Key Generation
// ============================================================================

SignatureKeyPair AgentCrypto::generate_signature_keypair() {
    SignatureKeyPair keypair;
    crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

ExchangeKeyPair AgentCrypto::generate_exchange_keypair() {
    ExchangeKeyPair keypair;
    crypto_box_keypair(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

SignatureKeyPair AgentCrypto::signature_keypair_from_seed(const std::array<uint8_t, KEY_SIZE>& seed) {
    SignatureKeyPair keypair;
    crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data());
    return keypair;
}

std::optional<ExchangeKeyPair> AgentCrypto::exchange_keypair_from_secret(
    const std::array<uint8_t, KEY_SIZE>& secret
) {
    ExchangeKeyPair keypair;
    keypair.secret_key = secret;

    if (crypto_scalarmult_base(keypair.public_key.data(), keypair.secret_key.data()) != 0) {
        secure_zero(keypair.secret_key.data(), keypair.secret_key.size());
        return std::nullopt;
    }

    return keypair;
}

std::array<uint8_t, KEY_SIZE> AgentCrypto::signature_seed(
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::array<uint8_t, KEY_SIZE> seed;
    crypto_sign_ed25519_sk_to_seed(seed.data(), secret_key.data());
    return seed;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

std::vector<uint8_t> AgentCrypto::sign_message(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    unsigned long long signature_len = 0;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);
    return signature;
}

bool AgentCrypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
) {
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    return crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    ) == 0;
}

// ============================================================================
// Key Agreement (X25519 + SHA-256)
// ============================================================================

std::optional<SharedSecret> AgentCrypto::derive_shared_secret(
    const std::array<uint8_t, crypto_scalarmult_SCALARBYTES>& our_secret_key,
    const std::array<uint8_t, crypto_scalarmult_BYTES>& their_public_key
) {
    std::array<uint8_t, crypto_scalarmult_BYTES> raw;

    // Fails for low-order points (all-zero output)
    if (crypto_scalarmult(raw.data(), our_secret_key.data(), their_public_key.data()) != 0) {
        return std::nullopt;
    }

    static_assert(crypto_hash_sha256_BYTES == crypto_aead_chacha20poly1305_ietf_KEYBYTES,
                  "derived key must fill the AEAD key");

    SharedSecret shared;
    crypto_hash_sha256(shared.key.data(), raw.data(), raw.size());
    secure_zero(raw.data(), raw.size());

    return shared;
}

// ============================================================================
// Encryption (ChaCha20-Poly1305 AEAD)
// ============================================================================

std::optional<std::vector<uint8_t>> AgentCrypto::encrypt(
    const std::vector<uint8_t>& plaintext,
    const SharedSecret& shared_secret,
    const Nonce& nonce
) {
    std::vector<uint8_t> output(TAG_SIZE + plaintext.size());

    unsigned long long tag_len = 0;
    int result = crypto_aead_chacha20poly1305_ietf_encrypt_detached(
        output.data() + TAG_SIZE,  // ciphertext after the tag
        output.data(),             // tag
        &tag_len,
        plaintext.data(),
        plaintext.size(),
        nullptr,  // No additional data
        0,
        nullptr,  // No secret nonce
        nonce.data(),
        shared_secret.key.data()
    );

    if (result != 0 || tag_len != TAG_SIZE) {
        return std::nullopt;
    }

    return output;
}

std::optional<std::vector<uint8_t>> AgentCrypto::decrypt(
    const std::vector<uint8_t>& tagged_ciphertext,
    const SharedSecret& shared_secret,
    const Nonce& nonce
) {
    if (tagged_ciphertext.size() < TAG_SIZE) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(tagged_ciphertext.size() - TAG_SIZE);

    // Fails if the tag does not authenticate the ciphertext
    int result = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
        plaintext.data(),
        nullptr,  // No secret nonce
        tagged_ciphertext.data() + TAG_SIZE,
        plaintext.size(),
        tagged_ciphertext.data(),
        nullptr,  // No additional data
        0,
        nonce.data(),
        shared_secret.key.data()
    );

    if (result != 0) {
        secure_zero(plaintext.data(), plaintext.size());
        return std::nullopt;
    }

    return plaintext;
}

// ============================================================================
// Utility Functions
// ============================================================================

Nonce AgentCrypto::generate_nonce() {
    Nonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

std::vector<uint8_t> AgentCrypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

bool AgentCrypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string AgentCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::vector<char> hex(bytes.size() * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    return std::string(hex.data());
}

std::string AgentCrypto::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);
    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> AgentCrypto::hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.length() / 2);
    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_hex2bin(
        bytes.data(),
        bytes.size(),
        hex.c_str(),
        hex.length(),
        nullptr,
        &decoded_len,
        &end_ptr
    );

    // Reject trailing garbage
    if (result != 0 || end_ptr != hex.c_str() + hex.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::optional<std::vector<uint8_t>> AgentCrypto::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0 || end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

void AgentCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace agentlink
