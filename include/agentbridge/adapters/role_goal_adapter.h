#pragma once

#include "agentbridge/core/adapter_base.h"

namespace agentbridge {
namespace adapters {

/**
 * @brief Adapter for role/goal crew member schemas
 *
 * Native shape:
 * {role, name, goal, backstory, tools: [string], llm: "provider/model",
 *  max_iter, memory}
 * role is required. Execution flags such as verbose or allow_delegation
 * have no canonical equivalent and go to the extension namespace.
 */
class RoleGoalAdapter : public core::AdapterBase {
public:
    static constexpr const char* PROTOCOL_ID = "rolegoal";

    std::string protocolId() const override { return PROTOCOL_ID; }
    std::string description() const override;

    core::CanonicalResult toCanonical(const nlohmann::json& native,
                                      const core::TransformOptions& options) const override;
    core::NativeResult fromCanonical(const core::CanonicalGraph& graph,
                                     const core::TransformOptions& options) const override;
    core::ValidationResult validate(const nlohmann::json& native) const override;
    std::vector<core::AdapterCapability> getCapabilities() const override;
};

} // namespace adapters
} // namespace agentbridge
