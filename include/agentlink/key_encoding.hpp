/**
 * @file key_encoding.hpp
 * @brief Key export/import formats (raw, hex, PEM)
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * PEM blocks are standard SubjectPublicKeyInfo / PKCS#8 documents for
 * Ed25519 and X25519 keys, readable by OpenSSL and other tooling.
 */

#pragma once

#include "agentlink/agent_crypto.hpp"

#include <array>
#include <optional>
#include <string>

namespace agentlink {

/**
 * @brief Which of the two identity key pairs a key belongs to
 */
enum class KeyKind {
    SIGNING,   ///< Ed25519
    EXCHANGE   ///< X25519
};

/**
 * @brief Export representation
 */
enum class KeyFormat {
    RAW,   ///< Raw key bytes
    HEX,   ///< Lowercase hexadecimal
    PEM    ///< PEM text block
};

namespace key_encoding {

/// Raw 32-byte private key material (Ed25519 seed or X25519 scalar)
using PrivateKeyBytes = std::array<uint8_t, KEY_SIZE>;

/**
 * @brief Algorithm name recorded in manifests ("Ed25519" / "X25519")
 */
std::string key_type_name(KeyKind kind);

/**
 * @brief Encode a public key as a "PUBLIC KEY" PEM block
 * @throws CryptoError if OpenSSL rejects the key
 */
std::string public_key_to_pem(KeyKind kind, const PublicKey& public_key);

/**
 * @brief Encode a private key as a PKCS#8 "PRIVATE KEY" PEM block
 * @throws CryptoError if OpenSSL rejects the key
 */
std::string private_key_to_pem(KeyKind kind, const PrivateKeyBytes& private_key);

/**
 * @brief Decode a "PUBLIC KEY" PEM block of the given algorithm
 * @return Raw key, or std::nullopt if the block is invalid or of another type
 */
std::optional<PublicKey> public_key_from_pem(KeyKind kind, const std::string& pem);

/**
 * @brief Decode a PKCS#8 "PRIVATE KEY" PEM block of the given algorithm
 * @return Raw key, or std::nullopt if the block is invalid or of another type
 */
std::optional<PrivateKeyBytes> private_key_from_pem(KeyKind kind, const std::string& pem);

} // namespace key_encoding
} // namespace agentlink
