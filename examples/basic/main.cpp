#include "agentbridge/adapters/capability_adapter.h"
#include "agentbridge/adapters/role_goal_adapter.h"
#include "agentbridge/adapters/tool_call_adapter.h"
#include "agentbridge/core/bridge_service.h"
#include <iostream>

using namespace agentbridge;
using namespace agentbridge::core;

int main() {
    // Create a bridge with in-memory storage
    BridgeConfig config;
    config.logLevel = utils::LogLevel::INFO;
    applyLogConfig(config);
    BridgeService bridge(config);
    bridge.registerAdapter(std::make_shared<adapters::ToolCallAdapter>());
    bridge.registerAdapter(std::make_shared<adapters::RoleGoalAdapter>());
    bridge.registerAdapter(std::make_shared<adapters::CapabilityAdapter>());

    // Import a role/goal agent
    nlohmann::json crewAgent = {
        {"role", "Travel Planner"},
        {"goal", "Plan cheap weekend trips"},
        {"backstory", "Knows every budget airline"},
        {"tools", {"flight_search", "hotel_search"}},
        {"llm", "openai/gpt-4"},
        {"verbose", true}
    };
    auto imported = bridge.importAgent("rolegoal", crewAgent);
    if (!imported.success) {
        for (const auto& error : imported.errors) {
            std::cerr << errorCodeName(error.code) << ": " << error.message << "\n";
        }
        return 1;
    }
    std::cout << "Imported " << imported.agentId << " v" << *imported.version
              << " (fidelity " << imported.fidelity << ")\n";

    // Export it as a function-calling description
    auto exported = bridge.exportAgent(imported.agentId, "toolcall");
    std::cout << "As toolcall (fidelity " << exported.totalFidelity << "):\n"
              << exported.targetData.dump(2) << "\n";

    // And as a capability description, straight from the native form
    TranslationRequest request;
    request.sourceFormat = "rolegoal";
    request.targetFormat = "capability";
    request.sourceData = crewAgent;
    auto response = bridge.translate(request);
    std::cout << "As capability (fidelity " << response.totalFidelity << "):\n"
              << response.targetData.dump(2) << "\n";
    for (const auto& warning : response.warnings) {
        std::cout << "warning: " << warning << "\n";
    }

    // Find agents able to search for flights
    DiscoveryCriteria criteria;
    criteria.capability = "flight_search";
    std::cout << "Agents with flight_search:\n";
    for (const auto& agent : bridge.discoverAgents(criteria)) {
        std::cout << "- " << agent.agentId << "\n";
    }

    return 0;
}
