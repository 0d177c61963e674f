/**
 * @file test_encryption_channel.cpp
 * @brief Unit tests for EncryptionChannel
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include <gtest/gtest.h>
#include "agentlink/encryption_channel.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/utilities.hpp"
#include <filesystem>
#include <memory>

using namespace agentlink;
namespace fs = std::filesystem;

class EncryptionChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(AgentCrypto::initialize());

        test_dir_ = fs::temp_directory_path() /
                    ("agentlink_channel_test_" + utilities::generate_random_string(8));
        fs::create_directories(test_dir_);

        alice_store_ = std::make_shared<IdentityStore>("alice", test_dir_);
        alice_store_->generate();
        bob_store_ = std::make_shared<IdentityStore>("bob", test_dir_);
        bob_store_->generate();

        alice_ = std::make_unique<EncryptionChannel>(alice_store_);
        bob_ = std::make_unique<EncryptionChannel>(bob_store_);
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    static SharedSecret random_key() {
        SharedSecret key;
        auto random = AgentCrypto::generate_random_bytes(key.key.size());
        std::copy(random.begin(), random.end(), key.key.begin());
        return key;
    }

    fs::path test_dir_;
    std::shared_ptr<IdentityStore> alice_store_;
    std::shared_ptr<IdentityStore> bob_store_;
    std::unique_ptr<EncryptionChannel> alice_;
    std::unique_ptr<EncryptionChannel> bob_;
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST_F(EncryptionChannelTest, RejectsNullIdentity) {
    EXPECT_THROW(EncryptionChannel(nullptr), ValidationError);
}

// ============================================================================
// Key Agreement Tests
// ============================================================================

TEST_F(EncryptionChannelTest, DerivedSecretIsSymmetric) {
    auto a = AgentCrypto::generate_exchange_keypair();
    auto b = AgentCrypto::generate_exchange_keypair();

    SharedSecret ab = EncryptionChannel::derive_shared_secret(a.secret_key, b.public_key);
    SharedSecret ba = EncryptionChannel::derive_shared_secret(b.secret_key, a.public_key);

    EXPECT_EQ(ab.key, ba.key);
}

TEST_F(EncryptionChannelTest, DifferentPeersGiveDifferentSecrets) {
    auto a = AgentCrypto::generate_exchange_keypair();
    auto b = AgentCrypto::generate_exchange_keypair();
    auto c = AgentCrypto::generate_exchange_keypair();

    SharedSecret ab = EncryptionChannel::derive_shared_secret(a.secret_key, b.public_key);
    SharedSecret ac = EncryptionChannel::derive_shared_secret(a.secret_key, c.public_key);

    EXPECT_NE(ab.key, ac.key);
}

TEST_F(EncryptionChannelTest, LowOrderPeerKeyIsRejected) {
    auto a = AgentCrypto::generate_exchange_keypair();
    PublicKey zero{};

    EXPECT_THROW(EncryptionChannel::derive_shared_secret(a.secret_key, zero), CryptoError);
    EXPECT_THROW(alice_->encrypt_for_peer(bytes("hi"), zero), CryptoError);
}

// ============================================================================
// Envelope Tests
// ============================================================================

TEST_F(EncryptionChannelTest, EnvelopeLayout) {
    SharedSecret key = random_key();
    auto plaintext = bytes("payload of some length");

    auto envelope = EncryptionChannel::encrypt(plaintext, key);

    EXPECT_EQ(envelope.size(), plaintext.size() + ENVELOPE_OVERHEAD);
    EXPECT_EQ(EncryptionChannel::decrypt(envelope, key), plaintext);
}

TEST_F(EncryptionChannelTest, EmptyPlaintextRoundTrips) {
    SharedSecret key = random_key();

    auto envelope = EncryptionChannel::encrypt({}, key);

    EXPECT_EQ(envelope.size(), ENVELOPE_OVERHEAD);
    EXPECT_TRUE(EncryptionChannel::decrypt(envelope, key).empty());
}

TEST_F(EncryptionChannelTest, SamePlaintextEncryptsDifferently) {
    SharedSecret key = random_key();
    auto plaintext = bytes("repeat");

    EXPECT_NE(EncryptionChannel::encrypt(plaintext, key),
              EncryptionChannel::encrypt(plaintext, key));
}

TEST_F(EncryptionChannelTest, ShortEnvelopeFailsDecryption) {
    SharedSecret key = random_key();
    std::vector<uint8_t> short_envelope(ENVELOPE_OVERHEAD - 1, 0);

    EXPECT_THROW(EncryptionChannel::decrypt(short_envelope, key), DecryptionError);
}

TEST_F(EncryptionChannelTest, TamperedEnvelopeFailsDecryption) {
    SharedSecret key = random_key();
    auto envelope = EncryptionChannel::encrypt(bytes("do not touch"), key);

    // Flip one bit in each region: nonce, tag, ciphertext
    for (size_t index : {size_t(0), NONCE_SIZE + 1, envelope.size() - 1}) {
        auto tampered = envelope;
        tampered[index] ^= 0x01;
        EXPECT_THROW(EncryptionChannel::decrypt(tampered, key), DecryptionError) << "index " << index;
    }
}

TEST_F(EncryptionChannelTest, WrongKeyFailsDecryption) {
    auto envelope = EncryptionChannel::encrypt(bytes("secret"), random_key());

    EXPECT_THROW(EncryptionChannel::decrypt(envelope, random_key()), DecryptionError);
}

TEST_F(EncryptionChannelTest, DecryptionErrorIsCryptoError) {
    auto envelope = EncryptionChannel::encrypt(bytes("secret"), random_key());

    EXPECT_THROW(EncryptionChannel::decrypt(envelope, random_key()), CryptoError);
}

// ============================================================================
// Peer Channel Tests
// ============================================================================

TEST_F(EncryptionChannelTest, PeersExchangeBinaryMessages) {
    auto plaintext = bytes("alice to bob");

    auto envelope = alice_->encrypt_for_peer(plaintext, bob_store_->exchange_public_key());
    auto decrypted = bob_->decrypt_from_peer(envelope, alice_store_->exchange_public_key());

    EXPECT_EQ(decrypted, plaintext);
}

TEST_F(EncryptionChannelTest, PeersExchangeTextMessages) {
    std::string text = "Hello Bob! Unicode: caf\xc3\xa9";

    std::string encoded = alice_->encrypt_text_for_peer(text, bob_store_->exchange_public_key());
    EXPECT_TRUE(AgentCrypto::base64_to_bytes(encoded).has_value());

    EXPECT_EQ(bob_->decrypt_text_from_peer(encoded, alice_store_->exchange_public_key()), text);
}

TEST_F(EncryptionChannelTest, ThirdPartyCannotDecrypt) {
    auto eve_store = std::make_shared<IdentityStore>("eve", test_dir_);
    eve_store->generate();
    EncryptionChannel eve(eve_store);

    auto envelope = alice_->encrypt_for_peer(bytes("private"), bob_store_->exchange_public_key());

    EXPECT_THROW(eve.decrypt_from_peer(envelope, alice_store_->exchange_public_key()), DecryptionError);
}

TEST_F(EncryptionChannelTest, InvalidBase64TextFailsDecryption) {
    EXPECT_THROW(bob_->decrypt_text_from_peer("!!not base64!!", alice_store_->exchange_public_key()),
                 DecryptionError);
}

TEST_F(EncryptionChannelTest, PeerKeyRotationTakesEffectImmediately) {
    PublicKey old_bob = bob_store_->exchange_public_key();
    auto envelope = alice_->encrypt_for_peer(bytes("before rotation"), old_bob);

    bob_store_->regenerate();

    EXPECT_THROW(bob_->decrypt_from_peer(envelope, alice_store_->exchange_public_key()), DecryptionError);

    auto fresh = alice_->encrypt_for_peer(bytes("after rotation"), bob_store_->exchange_public_key());
    EXPECT_EQ(bob_->decrypt_from_peer(fresh, alice_store_->exchange_public_key()), bytes("after rotation"));
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST_F(EncryptionChannelTest, SignaturesVerifyAcrossPeers) {
    auto message = bytes("signed by alice");
    auto signature = alice_->sign(message);

    EXPECT_TRUE(bob_->verify(message, signature, alice_store_->signing_public_key()));
    EXPECT_FALSE(bob_->verify(message, signature, bob_store_->signing_public_key()));
    EXPECT_FALSE(bob_->verify(bytes("altered"), signature, alice_store_->signing_public_key()));
}
