/**
 * @file test_peer_registry.cpp
 * @brief Unit tests for PeerRegistry
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Tests agent registry functionality including:
 * - Registration, refresh and unregistration
 * - Lazy online/offline evaluation against a manual clock
 * - Capability queries and stale cleanup
 */

#include <gtest/gtest.h>
#include "agentlink/peer_registry.hpp"
#include <algorithm>
#include <memory>

using namespace agentlink;
using json = nlohmann::json;

class PeerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        epoch_ = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
        now_ = epoch_;
        registry_ = std::make_unique<PeerRegistry>(std::chrono::seconds(60), [this] { return now_; });
    }

    void advance_to(int seconds) {
        now_ = epoch_ + std::chrono::seconds(seconds);
    }

    static AgentInfo info(const std::string& id, std::vector<std::string> capabilities = {}) {
        AgentInfo agent;
        agent.agent_id = id;
        agent.capabilities = std::move(capabilities);
        return agent;
    }

    void add(const std::string& id, std::vector<std::string> capabilities = {}) {
        AgentInfo agent = info(id, std::move(capabilities));
        registry_->register_peer(agent, agent.to_json());
    }

    std::chrono::system_clock::time_point epoch_;
    std::chrono::system_clock::time_point now_;
    std::unique_ptr<PeerRegistry> registry_;
};

// ============================================================================
// AgentInfo Tests
// ============================================================================

TEST_F(PeerRegistryTest, AgentInfoMergesMetadata) {
    AgentInfo agent = info("worker-1", {"summarize"});
    agent.metadata = {{"region", "eu"}, {"version", 2}};

    json j = agent.to_json();
    EXPECT_EQ(j["agent_id"], "worker-1");
    EXPECT_EQ(j["capabilities"], json::array({"summarize"}));
    EXPECT_EQ(j["region"], "eu");

    auto decoded = AgentInfo::from_json(j);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->capabilities, agent.capabilities);
    EXPECT_EQ(decoded->metadata, agent.metadata);
}

TEST_F(PeerRegistryTest, AgentInfoRequiresAgentId) {
    EXPECT_FALSE(AgentInfo::from_json(json{{"capabilities", json::array()}}).has_value());
    EXPECT_FALSE(AgentInfo::from_json(json{{"agent_id", 7}}).has_value());
    EXPECT_FALSE(AgentInfo::from_json(json{{"agent_id", ""}}).has_value());
    EXPECT_FALSE(AgentInfo::from_json(json("worker")).has_value());
}

TEST_F(PeerRegistryTest, AgentInfoWithoutCapabilities) {
    auto decoded = AgentInfo::from_json(json{{"agent_id", "bare"}});

    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->capabilities.empty());
}

// ============================================================================
// Liveness Tests
// ============================================================================

TEST_F(PeerRegistryTest, UnknownAgentStatus) {
    EXPECT_EQ(registry_->status_of("nobody"), AgentStatus::UNKNOWN);
    EXPECT_EQ(agent_status_to_string(AgentStatus::UNKNOWN), "unknown");
}

TEST_F(PeerRegistryTest, StatusFollowsHeartbeatsLazily) {
    add("worker-1");

    advance_to(10);
    EXPECT_TRUE(registry_->record_heartbeat("worker-1"));
    advance_to(20);
    EXPECT_TRUE(registry_->record_heartbeat("worker-1"));

    advance_to(50);
    EXPECT_EQ(registry_->status_of("worker-1"), AgentStatus::ONLINE);

    advance_to(100);
    EXPECT_EQ(registry_->status_of("worker-1"), AgentStatus::OFFLINE);
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_EQ(registry_->online_count(), 0u);
}

TEST_F(PeerRegistryTest, WindowBoundaryIsOffline) {
    add("worker-1");

    advance_to(59);
    EXPECT_EQ(registry_->status_of("worker-1"), AgentStatus::ONLINE);
    advance_to(60);
    EXPECT_EQ(registry_->status_of("worker-1"), AgentStatus::OFFLINE);
}

TEST_F(PeerRegistryTest, HeartbeatRevivesOfflineAgent) {
    add("worker-1");

    advance_to(120);
    EXPECT_EQ(registry_->status_of("worker-1"), AgentStatus::OFFLINE);

    registry_->record_heartbeat("worker-1");
    EXPECT_EQ(registry_->status_of("worker-1"), AgentStatus::ONLINE);
}

TEST_F(PeerRegistryTest, HeartbeatFromUnknownAgentIsIgnored) {
    EXPECT_FALSE(registry_->record_heartbeat("ghost"));
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(registry_->status_of("ghost"), AgentStatus::UNKNOWN);
}

// ============================================================================
// Registration Tests
// ============================================================================

TEST_F(PeerRegistryTest, ReRegistrationKeepsRegisteredAt) {
    add("worker-1", {"a"});

    advance_to(30);
    add("worker-1", {"b", "c"});

    auto entry = registry_->get("worker-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->registered_at, epoch_);
    EXPECT_EQ(entry->last_seen, now_);
    EXPECT_EQ(entry->capabilities, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(PeerRegistryTest, UnregisterReturnsToUnknown) {
    add("worker-1");

    EXPECT_TRUE(registry_->unregister("worker-1"));
    EXPECT_EQ(registry_->status_of("worker-1"), AgentStatus::UNKNOWN);
    EXPECT_FALSE(registry_->get("worker-1").has_value());

    EXPECT_FALSE(registry_->unregister("worker-1"));
}

TEST_F(PeerRegistryTest, AnnouncementIsStoredVerbatim) {
    AgentInfo agent = info("worker-1", {"a"});
    json announcement = agent.to_json();
    announcement["timestamp"] = 1700000000.0;

    registry_->register_peer(agent, announcement);

    EXPECT_EQ(registry_->get("worker-1")->info, announcement);
}

// ============================================================================
// Query Tests
// ============================================================================

TEST_F(PeerRegistryTest, OnlineListsOnlyLiveAgents) {
    add("early");
    advance_to(45);
    add("late");

    advance_to(70);
    auto online = registry_->online();
    ASSERT_EQ(online.size(), 1u);
    EXPECT_EQ(online[0].agent_id, "late");
    EXPECT_EQ(registry_->all().size(), 2u);
}

TEST_F(PeerRegistryTest, CapabilityQuery) {
    add("a", {"summarize", "translate"});
    add("b", {"translate"});
    add("c", {});

    auto translators = registry_->with_capability("translate");
    std::vector<std::string> ids;
    for (const auto& entry : translators) {
        ids.push_back(entry.agent_id);
    }
    std::sort(ids.begin(), ids.end());

    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(registry_->with_capability("paint").empty());
}

TEST_F(PeerRegistryTest, CleanupStaleRemovesSilentAgents) {
    add("old");
    advance_to(200);
    add("fresh");

    advance_to(400);
    EXPECT_EQ(registry_->cleanup_stale(std::chrono::seconds(300)), 1u);
    EXPECT_FALSE(registry_->get("old").has_value());
    EXPECT_TRUE(registry_->get("fresh").has_value());

    registry_->clear();
    EXPECT_EQ(registry_->size(), 0u);
}
