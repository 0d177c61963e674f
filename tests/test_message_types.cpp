/**
 * @file test_message_types.cpp
 * @brief Unit tests for the agent message wire form
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Tests message serialization including:
 * - Enum string conversion
 * - JSON encoding and decoding
 * - Rejection of malformed documents
 * - Canonical signing payload
 */

#include <gtest/gtest.h>
#include "agentlink/message_types.hpp"
#include "agentlink/config.hpp"
#include "agentlink/errors.hpp"
#include <string>

using namespace agentlink;
using json = nlohmann::json;

class MessageTypesTest : public ::testing::Test {
protected:
    static AgentMessage sample_message() {
        AgentMessage message;
        message.message_id = "alice-1-1700000000000";
        message.sender_id = "alice";
        message.receiver_id = "bob";
        message.type = MessageType::TASK;
        message.content = "summarize report";
        message.priority = MessagePriority::HIGH;
        message.timestamp = 1700000000.5;
        message.metadata = {{"trace", "abc"}, {"attempt", 2}};
        return message;
    }

    static json sample_document() {
        return sample_message().to_json();
    }
};

// ============================================================================
// Enum Conversion Tests
// ============================================================================

TEST_F(MessageTypesTest, MessageTypeStrings) {
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::TEXT), "text");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::TASK), "task");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::RESPONSE), "response");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::STATUS), "status");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::ERROR), "error");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::DISCOVERY), "discovery");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::HEARTBEAT), "heartbeat");

    EXPECT_EQ(MessageHelpers::string_to_message_type("response"), MessageType::RESPONSE);
    EXPECT_EQ(MessageHelpers::string_to_message_type("TEXT"), MessageType::UNRECOGNIZED);
    EXPECT_EQ(MessageHelpers::string_to_message_type(""), MessageType::UNRECOGNIZED);
}

TEST_F(MessageTypesTest, PriorityStrings) {
    EXPECT_EQ(MessageHelpers::priority_to_string(MessagePriority::LOW), "low");
    EXPECT_EQ(MessageHelpers::priority_to_string(MessagePriority::CRITICAL), "critical");

    EXPECT_EQ(MessageHelpers::string_to_priority("normal"), MessagePriority::NORMAL);
    EXPECT_EQ(MessageHelpers::string_to_priority("urgent"), MessagePriority::UNRECOGNIZED);
}

TEST_F(MessageTypesTest, MessageIdFormat) {
    EXPECT_EQ(MessageHelpers::generate_message_id("agent-7", 3, 1700000000123ULL),
              "agent-7-3-1700000000123");
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST_F(MessageTypesTest, EncodesEveryField) {
    json j = sample_document();

    EXPECT_EQ(j["message_id"], "alice-1-1700000000000");
    EXPECT_EQ(j["sender_id"], "alice");
    EXPECT_EQ(j["receiver_id"], "bob");
    EXPECT_EQ(j["type"], "task");
    EXPECT_EQ(j["content"], "summarize report");
    EXPECT_EQ(j["priority"], "high");
    EXPECT_DOUBLE_EQ(j["timestamp"].get<double>(), 1700000000.5);
    EXPECT_EQ(j["metadata"]["trace"], "abc");
    EXPECT_TRUE(j["signature"].is_null());
    EXPECT_EQ(j["encrypted"], false);
}

TEST_F(MessageTypesTest, NonObjectMetadataEncodesAsEmptyObject) {
    AgentMessage message = sample_message();
    message.metadata = nullptr;

    json j = message.to_json();
    EXPECT_TRUE(j["metadata"].is_object());
    EXPECT_TRUE(j["metadata"].empty());
}

TEST_F(MessageTypesTest, DecodePreservesContent) {
    AgentMessage original = sample_message();
    original.signature = "c2lnbmF0dXJl";
    original.encrypted = true;

    AgentMessage decoded = AgentMessage::from_json_string(original.to_json_string());

    EXPECT_EQ(decoded.message_id, original.message_id);
    EXPECT_EQ(decoded.type, MessageType::TASK);
    EXPECT_EQ(decoded.priority, MessagePriority::HIGH);
    EXPECT_EQ(decoded.metadata, original.metadata);
    ASSERT_TRUE(decoded.signature.has_value());
    EXPECT_EQ(*decoded.signature, "c2lnbmF0dXJl");
    EXPECT_TRUE(decoded.encrypted);
}

TEST_F(MessageTypesTest, IntegerTimestampIsAccepted) {
    json j = sample_document();
    j["timestamp"] = 1700000000;

    EXPECT_DOUBLE_EQ(AgentMessage::from_json(j).timestamp, 1700000000.0);
}

TEST_F(MessageTypesTest, AbsentSignatureIsAccepted) {
    json j = sample_document();
    j.erase("signature");

    EXPECT_FALSE(AgentMessage::from_json(j).signature.has_value());
}

// ============================================================================
// Malformed Document Tests
// ============================================================================

TEST_F(MessageTypesTest, InvalidJsonIsMalformed) {
    EXPECT_THROW(AgentMessage::from_json_string("{not json"), MalformedMessageError);
    EXPECT_THROW(AgentMessage::from_json_string("[1, 2, 3]"), MalformedMessageError);
}

TEST_F(MessageTypesTest, MissingFieldNamesTheField) {
    for (const char* field : {"message_id", "sender_id", "receiver_id", "type", "content",
                              "priority", "timestamp", "metadata", "encrypted"}) {
        json j = sample_document();
        j.erase(field);

        try {
            AgentMessage::from_json(j);
            FAIL() << "accepted document without " << field;
        } catch (const MalformedMessageError& e) {
            EXPECT_EQ(e.field(), field);
        }
    }
}

TEST_F(MessageTypesTest, MistypedFieldsAreMalformed) {
    json j = sample_document();
    j["content"] = 42;
    EXPECT_THROW(AgentMessage::from_json(j), MalformedMessageError);

    j = sample_document();
    j["timestamp"] = "yesterday";
    EXPECT_THROW(AgentMessage::from_json(j), MalformedMessageError);

    j = sample_document();
    j["metadata"] = json::array();
    EXPECT_THROW(AgentMessage::from_json(j), MalformedMessageError);

    j = sample_document();
    j["encrypted"] = "true";
    EXPECT_THROW(AgentMessage::from_json(j), MalformedMessageError);

    j = sample_document();
    j["signature"] = 7;
    EXPECT_THROW(AgentMessage::from_json(j), MalformedMessageError);
}

TEST_F(MessageTypesTest, UnknownEnumValuesAreMalformed) {
    json j = sample_document();
    j["type"] = "gossip";
    EXPECT_THROW(AgentMessage::from_json(j), MalformedMessageError);

    j = sample_document();
    j["priority"] = "whenever";
    EXPECT_THROW(AgentMessage::from_json(j), MalformedMessageError);
}

TEST_F(MessageTypesTest, OversizedInputIsMalformed) {
    std::string huge(config::MAX_MESSAGE_SIZE + 1, ' ');

    EXPECT_THROW(AgentMessage::from_json_string(huge), MalformedMessageError);
}

TEST_F(MessageTypesTest, MalformedIsValidationError) {
    EXPECT_THROW(AgentMessage::from_json_string("nope"), ValidationError);
}

// ============================================================================
// Signing Payload Tests
// ============================================================================

TEST_F(MessageTypesTest, SigningPayloadExcludesSignature) {
    AgentMessage message = sample_message();
    auto unsigned_payload = message.signing_payload();

    message.signature = "anything";
    EXPECT_EQ(message.signing_payload(), unsigned_payload);

    std::string text(unsigned_payload.begin(), unsigned_payload.end());
    EXPECT_EQ(text.find("signature"), std::string::npos);
}

TEST_F(MessageTypesTest, SigningPayloadCoversContent) {
    AgentMessage message = sample_message();
    auto before = message.signing_payload();

    message.content = "summarize another report";
    EXPECT_NE(message.signing_payload(), before);
}

TEST_F(MessageTypesTest, SigningPayloadIsStableAcrossDecode) {
    AgentMessage message = sample_message();

    AgentMessage decoded = AgentMessage::from_json_string(message.to_json_string());
    EXPECT_EQ(decoded.signing_payload(), message.signing_payload());
}
