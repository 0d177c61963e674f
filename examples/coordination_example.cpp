/**
 * @file coordination_example.cpp
 * @brief Coordination service walkthrough: discovery, messaging, tasks, events
 *
 * AgentLink - Secure Agent Coordination Layer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Runs against a NATS server when AGENTLINK_NATS_URL is set, otherwise
 * against the in-process broker.
 */

#include "agentlink/coordination_service.hpp"
#include "agentlink/errors.hpp"
#include "agentlink/in_memory_broker.hpp"
#include "agentlink/nats_broker.hpp"
#include "agentlink/utilities.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace agentlink;
using namespace std::chrono_literals;
using json = nlohmann::json;

int main() {
    CoordinationConfig settings = CoordinationConfig::from_environment();
    utilities::initialize_logging(settings.log_file, utilities::parse_log_level(settings.log_level));

    std::shared_ptr<MessageBroker> broker;
    if (utilities::get_env("AGENTLINK_NATS_URL").empty()) {
        std::cout << "Using in-process broker (set AGENTLINK_NATS_URL for NATS)\n";
        broker = std::make_shared<InMemoryBroker>();
    } else {
        std::cout << "Using NATS at " << settings.nats_url << "\n";
        broker = std::make_shared<NatsBroker>(settings.nats_url, settings.client_name);
    }

    // Outlive the service, whose pull threads update them
    std::atomic<int> received{0};
    std::atomic<int> tasks_done{0};

    try {
        std::cout << "\n=== AgentLink Coordination Example ===\n\n";

        CoordinationService service(broker, settings);
        service.connect_with_retry();

        service.subscribe_to_agent_updates([](const json& update) {
            std::cout << "[update] " << update.value("agent_id", "?") << " "
                      << update.value("event_type", "?") << "\n";
        });

        service.register_global_event_handler([](const SystemEvent& event) {
            std::cout << "[event]  " << event_type_to_string(event.type) << " from " << event.source << "\n";
        });

        // Discovery
        AgentInfo summarizer;
        summarizer.agent_id = "summarizer";
        summarizer.capabilities = {"summarize", "translate"};
        summarizer.metadata = {{"model", "small"}};
        service.register_agent(summarizer);

        AgentInfo reviewer;
        reviewer.agent_id = "reviewer";
        reviewer.capabilities = {"review"};
        service.register_agent(reviewer);

        service.send_heartbeat("summarizer");
        std::this_thread::sleep_for(200ms);

        std::cout << "\nOnline agents:\n";
        for (const auto& entry : service.get_online_agents()) {
            std::cout << "  - " << entry.agent_id << " (" << entry.capabilities.size() << " capabilities)\n";
        }

        // Messaging
        service.subscribe_to_messages("reviewer", [&](const json& payload) {
            std::cout << "reviewer got message from " << payload.value("sender_id", "?") << ": "
                      << payload.at("message").dump() << "\n";
            ++received;
        });

        PublishAck ack = service.send_message("summarizer", "reviewer",
                                              {{"text", "Draft summary attached"}, {"pages", 3}});
        std::cout << "\nMessage stored in " << ack.stream << " at sequence " << ack.sequence << "\n";

        // Tasks
        service.subscribe_to_tasks("summarizer", [&](const json& payload) {
            std::cout << "summarizer picked up task " << payload.at("task").value("task_id", "?") << "\n";
            ++tasks_done;
        });

        service.route_task({{"task_id", "task-001"}, {"kind", "summarize"}}, {"summarizer"});
        service.route_task({{"task_id", "task-002"}, {"kind", "summarize"}});

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while ((received < 1 || tasks_done < 2) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(50ms);
        }

        service.publish_event(EventType::TASK_COMPLETED, {{"task_id", "task-001"}}, "task-001");

        std::cout << "\nHealth: " << service.health_check().to_json().dump() << "\n";

        service.unregister_agent("reviewer");
        std::this_thread::sleep_for(100ms);

        service.disconnect();
        std::cout << "\nService stopped.\n";
        return 0;

    } catch (const AgentLinkError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
