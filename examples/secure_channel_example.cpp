/**
 * @file secure_channel_example.cpp
 * @brief Two agents exchanging signed, encrypted messages
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Creating or loading persistent identities
 * - Sealing and signing a message for a peer
 * - Verifying and opening it on the other side
 */

#include "agentlink/encryption_channel.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/identity_store.hpp"
#include "agentlink/message_handler.hpp"
#include "agentlink/utilities.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

using namespace agentlink;

int main(int argc, char** argv) {
    std::filesystem::path key_dir = argc >= 2
        ? std::filesystem::path(argv[1])
        : std::filesystem::temp_directory_path() / "agentlink_secure_channel_example";

    try {
        utilities::initialize_logging("", utilities::parse_log_level(utilities::get_env("AGENTLINK_LOG_LEVEL", "info")));

        if (!AgentCrypto::initialize()) {
            std::cerr << "Error: libsodium failed to initialize\n";
            return 1;
        }

        std::cout << "\n=== AgentLink Secure Channel Example ===\n\n";
        std::cout << "Key directory: " << key_dir << "\n\n";

        auto alice = std::make_shared<IdentityStore>("alice", key_dir);
        auto bob = std::make_shared<IdentityStore>("bob", key_dir);
        alice->load_or_generate();
        bob->load_or_generate();

        std::cout << "alice signing key:  " << alice->export_public(KeyKind::SIGNING, KeyFormat::HEX) << "\n";
        std::cout << "bob exchange key:   " << bob->export_public(KeyKind::EXCHANGE, KeyFormat::HEX) << "\n\n";

        EncryptionChannel alice_channel(alice);
        EncryptionChannel bob_channel(bob);

        // Alice seals, then signs, so the signature covers the ciphertext
        MessageHandler alice_messages("alice");
        AgentMessage outbound = alice_messages.create("bob", "Quarterly numbers are ready for review",
                                                      MessageType::TASK, MessagePriority::HIGH);
        MessageHandler::seal(outbound, alice_channel, bob->exchange_public_key());
        MessageHandler::sign_message(outbound, *alice);

        std::string wire = outbound.to_json_string();
        std::cout << "On the wire (" << wire.size() << " bytes):\n  " << wire << "\n\n";

        // Bob receives, verifies and opens
        MessageHandler bob_messages("bob");
        bob_messages.register_processor(MessageType::TASK, [&](const AgentMessage& received) {
            if (!MessageHandler::verify_message(received, alice->signing_public_key())) {
                std::cout << "Signature check FAILED for " << received.message_id << "\n";
                return;
            }

            AgentMessage opened = received;
            MessageHandler::open(opened, bob_channel, alice->exchange_public_key());
            std::cout << "bob received task from " << opened.sender_id << ": " << opened.content << "\n";
        });

        ProcessResult result = bob_messages.receive(wire);
        std::cout << "Processing result: " << (result == ProcessResult::ACCEPTED ? "accepted" : "rejected") << "\n";

        // A replay of the same message is filtered
        result = bob_messages.receive(wire);
        std::cout << "Replay result:     " << (result == ProcessResult::DUPLICATE ? "duplicate" : "unexpected") << "\n";

        return 0;

    } catch (const AgentLinkError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
