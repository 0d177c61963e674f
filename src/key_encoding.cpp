/**
 * @file key_encoding.cpp
 * @brief PEM encoding of Ed25519/X25519 keys through OpenSSL
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "agentlink/key_encoding.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/utilities.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <memory>

namespace agentlink {
namespace key_encoding {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

int openssl_key_id(KeyKind kind) {
    return kind == KeyKind::SIGNING ? EVP_PKEY_ED25519 : EVP_PKEY_X25519;
}

std::string last_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

std::string drain_bio(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    if (length <= 0 || data == nullptr) {
        return "";
    }
    return std::string(data, static_cast<size_t>(length));
}

BioPtr read_bio(const std::string& pem) {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}

} // namespace

std::string key_type_name(KeyKind kind) {
    return kind == KeyKind::SIGNING ? "Ed25519" : "X25519";
}

// ============================================================================
// Export
// ============================================================================

std::string public_key_to_pem(KeyKind kind, const PublicKey& public_key) {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(openssl_key_id(kind), nullptr,
                                             public_key.data(), public_key.size()));
    if (!pkey) {
        throw CryptoError("cannot load " + key_type_name(kind) + " public key: " + last_openssl_error());
    }

    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey.get()) != 1) {
        throw CryptoError("cannot write public key PEM: " + last_openssl_error());
    }

    return drain_bio(bio.get());
}

std::string private_key_to_pem(KeyKind kind, const PrivateKeyBytes& private_key) {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(openssl_key_id(kind), nullptr,
                                              private_key.data(), private_key.size()));
    if (!pkey) {
        throw CryptoError("cannot load " + key_type_name(kind) + " private key: " + last_openssl_error());
    }

    // PEM_write_bio_PrivateKey emits PKCS#8 for raw-key algorithms
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey.get(),
                                         nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw CryptoError("cannot write private key PEM: " + last_openssl_error());
    }

    return drain_bio(bio.get());
}

// ============================================================================
// Import
// ============================================================================

std::optional<PublicKey> public_key_from_pem(KeyKind kind, const std::string& pem) {
    BioPtr bio = read_bio(pem);
    if (!bio) {
        return std::nullopt;
    }

    PkeyPtr pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        utilities::log_debug("KeyEncoding: unreadable public key PEM: " + last_openssl_error());
        return std::nullopt;
    }

    if (EVP_PKEY_id(pkey.get()) != openssl_key_id(kind)) {
        utilities::log_warn("KeyEncoding: PEM does not hold an " + key_type_name(kind) + " public key");
        return std::nullopt;
    }

    PublicKey key;
    size_t key_len = key.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), key.data(), &key_len) != 1 || key_len != key.size()) {
        return std::nullopt;
    }

    return key;
}

std::optional<PrivateKeyBytes> private_key_from_pem(KeyKind kind, const std::string& pem) {
    BioPtr bio = read_bio(pem);
    if (!bio) {
        return std::nullopt;
    }

    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        utilities::log_debug("KeyEncoding: unreadable private key PEM: " + last_openssl_error());
        return std::nullopt;
    }

    if (EVP_PKEY_id(pkey.get()) != openssl_key_id(kind)) {
        utilities::log_warn("KeyEncoding: PEM does not hold an " + key_type_name(kind) + " private key");
        return std::nullopt;
    }

    PrivateKeyBytes key;
    size_t key_len = key.size();
    if (EVP_PKEY_get_raw_private_key(pkey.get(), key.data(), &key_len) != 1 || key_len != key.size()) {
        return std::nullopt;
    }

    return key;
}

} // namespace key_encoding
} // namespace agentlink
