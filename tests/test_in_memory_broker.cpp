/**
 * @file test_in_memory_broker.cpp
 * @brief Unit tests for InMemoryBroker
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Tests broker semantics including:
 * - Stream capture, limits and provisioning errors
 * - Pull consumers with filters, ack, nak and term
 * - Redelivery after ack-wait expiry and drop after max_deliver
 * - Competing fetchers on one durable consumer
 * - Core subscriptions with wildcards
 */

#include <gtest/gtest.h>
#include "agentlink/in_memory_broker.hpp"
#include "agentlink/errors.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace agentlink;
using namespace std::chrono_literals;

class InMemoryBrokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_unique<InMemoryBroker>([this] {
            return std::chrono::system_clock::time_point(std::chrono::seconds(offset_s_.load()));
        });
        broker_->connect();

        StreamSpec work;
        work.name = "WORK";
        work.subjects = {"work.>"};
        broker_->ensure_stream(work);
    }

    ConsumerSpec consumer(const std::string& name, const std::string& filter = "work.>",
                          int max_deliver = 3) {
        ConsumerSpec spec;
        spec.durable_name = name;
        spec.filter_subject = filter;
        spec.max_deliver = max_deliver;
        spec.ack_wait = 30s;
        broker_->ensure_consumer("WORK", spec);
        return spec;
    }

    std::vector<BrokerMessage> fetch(const std::string& durable, size_t batch = 10) {
        return broker_->fetch("WORK", durable, batch, 0ms);
    }

    void advance(int seconds) {
        offset_s_ += seconds;
    }

    std::atomic<int64_t> offset_s_{1700000000};
    std::unique_ptr<InMemoryBroker> broker_;
};

// ============================================================================
// Connection Tests
// ============================================================================

TEST_F(InMemoryBrokerTest, OperationsRequireConnection) {
    InMemoryBroker idle;

    EXPECT_FALSE(idle.is_connected());
    EXPECT_THROW(idle.publish("work.a", "x"), ConnectionError);
    EXPECT_THROW(idle.subscribe("work.a", [](const BrokerMessage&) {}), ConnectionError);

    idle.connect();
    EXPECT_TRUE(idle.is_connected());
    idle.close();
    idle.close();
    EXPECT_FALSE(idle.is_connected());
}

// ============================================================================
// Stream Tests
// ============================================================================

TEST_F(InMemoryBrokerTest, PublishReturnsStreamSequence) {
    PublishAck first = broker_->publish("work.a", "1");
    PublishAck second = broker_->publish("work.b", "2");

    EXPECT_EQ(first.stream, "WORK");
    EXPECT_EQ(first.sequence, 1u);
    EXPECT_EQ(second.sequence, 2u);
    EXPECT_EQ(broker_->stream_size("WORK"), std::optional<size_t>(2));
}

TEST_F(InMemoryBrokerTest, PublishWithoutCapturingStreamFails) {
    try {
        broker_->publish("elsewhere.a", "x");
        FAIL() << "publish succeeded without a stream";
    } catch (const BrokerError& e) {
        EXPECT_EQ(e.error_code(), 503);
    }

    // Core publish does not need a stream
    EXPECT_NO_THROW(broker_->publish_core("elsewhere.a", "x"));
}

TEST_F(InMemoryBrokerTest, CorePublishIsStoredWhenCaptured) {
    broker_->publish_core("work.a", "x");
    EXPECT_EQ(broker_->stream_size("WORK"), std::optional<size_t>(1));
}

TEST_F(InMemoryBrokerTest, EnsureStreamUpdatesExisting) {
    StreamSpec wider;
    wider.name = "WORK";
    wider.subjects = {"work.>", "jobs.>"};
    broker_->ensure_stream(wider);

    EXPECT_EQ(broker_->stream_spec("WORK")->subjects.size(), 2u);
    EXPECT_NO_THROW(broker_->publish("jobs.x", "y"));
}

TEST_F(InMemoryBrokerTest, StreamByteLimitEvictsOldest) {
    StreamSpec bounded;
    bounded.name = "SMALL";
    bounded.subjects = {"small.>"};
    bounded.max_bytes = 10;
    broker_->ensure_stream(bounded);

    broker_->publish("small.a", "12345");
    broker_->publish("small.b", "12345");
    broker_->publish("small.c", "12345");

    EXPECT_EQ(broker_->stream_size("SMALL"), std::optional<size_t>(2));
}

TEST_F(InMemoryBrokerTest, StreamAgeLimitEvictsExpired) {
    StreamSpec bounded;
    bounded.name = "SHORT";
    bounded.subjects = {"short.>"};
    bounded.max_age = 60s;
    broker_->ensure_stream(bounded);

    broker_->publish("short.a", "old");
    advance(120);
    broker_->publish("short.b", "new");

    EXPECT_EQ(broker_->stream_size("SHORT"), std::optional<size_t>(1));
}

TEST_F(InMemoryBrokerTest, ProvisioningErrorsCarryCodes) {
    ConsumerSpec spec;
    spec.durable_name = "c";
    try {
        broker_->ensure_consumer("MISSING", spec);
        FAIL() << "consumer created on missing stream";
    } catch (const BrokerError& e) {
        EXPECT_EQ(e.error_code(), 10059);
    }

    try {
        broker_->fetch("WORK", "nobody", 1, 0ms);
        FAIL() << "fetch from missing consumer";
    } catch (const BrokerError& e) {
        EXPECT_EQ(e.error_code(), 10014);
    }
}

// ============================================================================
// Pull Consumer Tests
// ============================================================================

TEST_F(InMemoryBrokerTest, ConsumerSeesOnlyFilteredSubjects) {
    consumer("alpha-only", "work.alpha");
    broker_->publish("work.alpha", "a1");
    broker_->publish("work.beta", "b1");
    broker_->publish("work.alpha", "a2");

    auto messages = fetch("alpha-only");
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].data, "a1");
    EXPECT_EQ(messages[1].data, "a2");
    EXPECT_EQ(messages[0].delivery_count, 1u);
}

TEST_F(InMemoryBrokerTest, ConsumerCreatedLaterReadsHistory) {
    broker_->publish("work.a", "before");
    consumer("late");

    auto messages = fetch("late");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].data, "before");
}

TEST_F(InMemoryBrokerTest, FetchHonoursBatchSize) {
    consumer("c");
    for (int i = 0; i < 5; ++i) {
        broker_->publish("work.a", std::to_string(i));
    }

    EXPECT_EQ(fetch("c", 2).size(), 2u);
    EXPECT_EQ(fetch("c", 10).size(), 3u);
    EXPECT_TRUE(fetch("c").empty());
}

TEST_F(InMemoryBrokerTest, FetchWaitsForPublish) {
    consumer("c");

    std::thread publisher([this] {
        std::this_thread::sleep_for(50ms);
        broker_->publish("work.a", "late arrival");
    });

    auto messages = broker_->fetch("WORK", "c", 1, 2000ms);
    publisher.join();

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].data, "late arrival");
}

TEST_F(InMemoryBrokerTest, AckedMessageIsNotRedelivered) {
    consumer("c");
    broker_->publish("work.a", "x");

    auto messages = fetch("c");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(broker_->in_flight_count("WORK", "c"), 1u);

    broker_->ack(messages[0]);
    EXPECT_EQ(broker_->in_flight_count("WORK", "c"), 0u);

    advance(3600);
    EXPECT_TRUE(fetch("c").empty());
}

TEST_F(InMemoryBrokerTest, NakRedeliversWithIncreasedCount) {
    consumer("c");
    broker_->publish("work.a", "retry me");

    auto first = fetch("c");
    ASSERT_EQ(first.size(), 1u);
    broker_->nak(first[0]);

    auto second = fetch("c");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].data, "retry me");
    EXPECT_EQ(second[0].delivery_count, 2u);
    EXPECT_EQ(second[0].stream_sequence, first[0].stream_sequence);
}

TEST_F(InMemoryBrokerTest, MessageDroppedAfterMaxDeliver) {
    consumer("c", "work.>", 3);
    broker_->publish("work.a", "poison");

    for (uint64_t attempt = 1; attempt <= 3; ++attempt) {
        auto messages = fetch("c");
        ASSERT_EQ(messages.size(), 1u) << "attempt " << attempt;
        EXPECT_EQ(messages[0].delivery_count, attempt);
        broker_->nak(messages[0]);
    }

    EXPECT_TRUE(fetch("c").empty());
}

TEST_F(InMemoryBrokerTest, TermStopsRedelivery) {
    consumer("c");
    broker_->publish("work.a", "malformed");

    auto messages = fetch("c");
    ASSERT_EQ(messages.size(), 1u);
    broker_->term(messages[0]);

    advance(3600);
    EXPECT_TRUE(fetch("c").empty());
}

TEST_F(InMemoryBrokerTest, UnackedMessageRedeliveredAfterAckWait) {
    consumer("c");
    broker_->publish("work.a", "slow");

    ASSERT_EQ(fetch("c").size(), 1u);

    advance(10);
    EXPECT_TRUE(fetch("c").empty());

    advance(25);
    auto redelivered = fetch("c");
    ASSERT_EQ(redelivered.size(), 1u);
    EXPECT_EQ(redelivered[0].delivery_count, 2u);
}

TEST_F(InMemoryBrokerTest, SeparateDurablesEachSeeEveryMessage) {
    consumer("one");
    consumer("two");
    broker_->publish("work.a", "x");

    EXPECT_EQ(fetch("one").size(), 1u);
    EXPECT_EQ(fetch("two").size(), 1u);
}

TEST_F(InMemoryBrokerTest, CompetingFetchersReceiveDistinctMessages) {
    consumer("shared", "work.>", 3);
    constexpr int total = 200;
    for (int i = 0; i < total; ++i) {
        broker_->publish("work.task", std::to_string(i));
    }

    std::mutex seen_mutex;
    std::multiset<std::string> seen;

    auto worker = [&] {
        while (true) {
            auto messages = broker_->fetch("WORK", "shared", 7, 20ms);
            if (messages.empty()) {
                return;
            }
            for (const auto& message : messages) {
                broker_->ack(message);
                std::lock_guard<std::mutex> lock(seen_mutex);
                seen.insert(message.data);
            }
        }
    };

    std::thread a(worker);
    std::thread b(worker);
    std::thread c(worker);
    a.join();
    b.join();
    c.join();

    EXPECT_EQ(seen.size(), static_cast<size_t>(total));
    std::set<std::string> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(total));
}

TEST_F(InMemoryBrokerTest, AckWithoutHandleIsIgnored) {
    BrokerMessage core;
    core.subject = "work.a";

    EXPECT_NO_THROW(broker_->ack(core));
    EXPECT_NO_THROW(broker_->nak(core));
}

// ============================================================================
// Core Subscription Tests
// ============================================================================

TEST_F(InMemoryBrokerTest, WildcardSubscriptionsReceiveMatchingSubjects) {
    std::vector<std::string> star;
    std::vector<std::string> tail;
    broker_->subscribe("events.*", [&](const BrokerMessage& m) { star.push_back(m.subject); });
    broker_->subscribe("events.>", [&](const BrokerMessage& m) { tail.push_back(m.subject); });

    broker_->publish_core("events.ready", "{}");
    broker_->publish_core("events.task.done", "{}");
    broker_->publish_core("agents.register", "{}");

    EXPECT_EQ(star, (std::vector<std::string>{"events.ready"}));
    EXPECT_EQ(tail, (std::vector<std::string>{"events.ready", "events.task.done"}));
}

TEST_F(InMemoryBrokerTest, DurablePublishAlsoReachesCoreSubscribers) {
    std::string received;
    broker_->subscribe("work.a", [&](const BrokerMessage& m) { received = m.data; });

    broker_->publish("work.a", "both");
    EXPECT_EQ(received, "both");
}

TEST_F(InMemoryBrokerTest, UnsubscribeStopsDelivery) {
    int calls = 0;
    uint64_t id = broker_->subscribe("work.a", [&](const BrokerMessage&) { ++calls; });
    EXPECT_EQ(broker_->subscription_count(), 1u);

    broker_->unsubscribe(id);
    broker_->publish_core("work.a", "x");

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(broker_->subscription_count(), 0u);
}

TEST_F(InMemoryBrokerTest, ThrowingSubscriberDoesNotAffectOthers) {
    int calls = 0;
    broker_->subscribe("work.a", [](const BrokerMessage&) { throw std::runtime_error("subscriber failure"); });
    broker_->subscribe("work.a", [&](const BrokerMessage&) { ++calls; });

    EXPECT_NO_THROW(broker_->publish_core("work.a", "x"));
    EXPECT_EQ(calls, 1);
}
