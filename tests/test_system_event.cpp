/**
 * @file test_system_event.cpp
 * @brief Unit tests for SystemEvent and EventDispatcher
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include <gtest/gtest.h>
#include "agentlink/system_event.hpp"
#include "agentlink/errors.hpp"
#include <stdexcept>

using namespace agentlink;
using json = nlohmann::json;

class SystemEventTest : public ::testing::Test {
protected:
    EventDispatcher dispatcher_{"agent-1"};
};

// ============================================================================
// Event Type Tests
// ============================================================================

TEST_F(SystemEventTest, EventTypeStringsAreSnakeCase) {
    EXPECT_EQ(event_type_to_string(EventType::AGENT_REGISTERED), "agent_registered");
    EXPECT_EQ(event_type_to_string(EventType::RESOURCE_LOW), "resource_low");
    EXPECT_EQ(string_to_event_type("task_failed"), EventType::TASK_FAILED);
    EXPECT_EQ(string_to_event_type("TASK_FAILED"), EventType::UNRECOGNIZED);
}

TEST_F(SystemEventTest, EveryEventTypeSurvivesStringConversion) {
    for (int i = 0; i < static_cast<int>(EventType::UNRECOGNIZED); ++i) {
        auto type = static_cast<EventType>(i);
        EXPECT_EQ(string_to_event_type(event_type_to_string(type)), type) << i;
    }
}

TEST_F(SystemEventTest, MessageTypesMapToEvents) {
    EXPECT_EQ(event_type_for_message(MessageType::TASK), EventType::TASK_CREATED);
    EXPECT_EQ(event_type_for_message(MessageType::RESPONSE), EventType::TASK_COMPLETED);
    EXPECT_EQ(event_type_for_message(MessageType::STATUS), EventType::AGENT_STATUS_UPDATED);
    EXPECT_EQ(event_type_for_message(MessageType::ERROR), EventType::ERROR_OCCURRED);
    EXPECT_EQ(event_type_for_message(MessageType::TEXT), EventType::MESSAGE_RECEIVED);
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST_F(SystemEventTest, MakeEventStampsSourceAndId) {
    SystemEvent event = dispatcher_.make_event(EventType::TASK_CREATED, {{"task_id", "t1"}}, "corr-9");

    EXPECT_EQ(event.source, "agent-1");
    EXPECT_EQ(event.event_id.rfind("agent-1-event-1-", 0), 0u);
    EXPECT_GT(event.timestamp, 0.0);
    EXPECT_EQ(event.data["task_id"], "t1");
    EXPECT_EQ(event.correlation_id, std::optional<std::string>("corr-9"));
    EXPECT_EQ(event.priority, "normal");

    EXPECT_NE(dispatcher_.make_event(EventType::TASK_CREATED).event_id, event.event_id);
}

TEST_F(SystemEventTest, JsonCarriesEveryField) {
    SystemEvent event = dispatcher_.make_event(EventType::RESOURCE_LOW, {{"disk", 0.95}});
    event.priority = "high";

    json j = event.to_json();
    EXPECT_EQ(j["event_type"], "resource_low");
    EXPECT_EQ(j["source"], "agent-1");
    EXPECT_TRUE(j["correlation_id"].is_null());
    EXPECT_EQ(j["priority"], "high");

    SystemEvent decoded = SystemEvent::from_json(j);
    EXPECT_EQ(decoded.event_id, event.event_id);
    EXPECT_EQ(decoded.type, EventType::RESOURCE_LOW);
    EXPECT_EQ(decoded.data, event.data);
    EXPECT_FALSE(decoded.correlation_id.has_value());
}

TEST_F(SystemEventTest, DecodeRejectsBadDocuments) {
    json j = dispatcher_.make_event(EventType::SYSTEM_READY).to_json();

    json unknown = j;
    unknown["event_type"] = "meteor_strike";
    EXPECT_THROW(SystemEvent::from_json(unknown), MalformedMessageError);

    json missing = j;
    missing.erase("source");
    EXPECT_THROW(SystemEvent::from_json(missing), MalformedMessageError);

    json mistyped = j;
    mistyped["timestamp"] = "now";
    EXPECT_THROW(SystemEvent::from_json(mistyped), MalformedMessageError);

    EXPECT_THROW(SystemEvent::from_json(json::array()), MalformedMessageError);
}

TEST_F(SystemEventTest, OptionalFieldsDefaultOnDecode) {
    json j = {
        {"event_id", "e1"},
        {"event_type", "system_ready"},
        {"timestamp", 1.0},
        {"source", "svc"}
    };

    SystemEvent event = SystemEvent::from_json(j);
    EXPECT_TRUE(event.data.is_object());
    EXPECT_EQ(event.priority, "normal");
}

// ============================================================================
// Dispatch Tests
// ============================================================================

TEST_F(SystemEventTest, TypedHandlersRunBeforeGlobalHandlers) {
    std::vector<std::string> order;
    dispatcher_.register_global_handler([&](const SystemEvent&) { order.push_back("global"); });
    dispatcher_.register_handler(EventType::TASK_COMPLETED, [&](const SystemEvent&) { order.push_back("typed-1"); });
    dispatcher_.register_handler(EventType::TASK_COMPLETED, [&](const SystemEvent&) { order.push_back("typed-2"); });

    size_t completed = dispatcher_.dispatch(dispatcher_.make_event(EventType::TASK_COMPLETED));

    EXPECT_EQ(completed, 3u);
    EXPECT_EQ(order, (std::vector<std::string>{"typed-1", "typed-2", "global"}));
    EXPECT_EQ(dispatcher_.handler_count(), 3u);
}

TEST_F(SystemEventTest, HandlersOnlySeeTheirType) {
    int task_events = 0;
    dispatcher_.register_handler(EventType::TASK_FAILED, [&](const SystemEvent&) { ++task_events; });

    EXPECT_EQ(dispatcher_.dispatch(dispatcher_.make_event(EventType::SYSTEM_READY)), 0u);
    EXPECT_EQ(task_events, 0);
}

TEST_F(SystemEventTest, ThrowingHandlerIsSkipped) {
    int after = 0;
    dispatcher_.register_handler(EventType::ERROR_OCCURRED, [](const SystemEvent&) {
        throw std::runtime_error("handler failure");
    });
    dispatcher_.register_global_handler([&](const SystemEvent&) { ++after; });

    EXPECT_EQ(dispatcher_.dispatch(dispatcher_.make_event(EventType::ERROR_OCCURRED)), 1u);
    EXPECT_EQ(after, 1);
}

// ============================================================================
// History Tests
// ============================================================================

TEST_F(SystemEventTest, HistoryIsNewestLastAndFiltered) {
    dispatcher_.dispatch(dispatcher_.make_event(EventType::TASK_CREATED, {{"n", 1}}));
    dispatcher_.dispatch(dispatcher_.make_event(EventType::SYSTEM_READY));
    dispatcher_.dispatch(dispatcher_.make_event(EventType::TASK_CREATED, {{"n", 2}}));

    auto all = dispatcher_.history();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.back().data["n"], 2);

    auto tasks = dispatcher_.history(EventType::TASK_CREATED);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].data["n"], 1);

    auto latest = dispatcher_.history(std::nullopt, 1);
    ASSERT_EQ(latest.size(), 1u);
    EXPECT_EQ(latest[0].data["n"], 2);
}

TEST_F(SystemEventTest, HistoryIsBounded) {
    EventDispatcher small("svc", 3);
    for (int i = 0; i < 5; ++i) {
        small.dispatch(small.make_event(EventType::MESSAGE_RECEIVED, {{"n", i}}));
    }

    auto history = small.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.front().data["n"], 2);

    small.clear_history();
    EXPECT_TRUE(small.history().empty());
}
