#pragma once

#include "agentbridge/core/adapter_base.h"

namespace agentbridge {
namespace adapters {

/**
 * @brief Adapter for capability / thing-description style schemas
 *
 * Native shape:
 * {id, title, description, capabilities: [string],
 *  actions: {name: {description, input}},
 *  protocols: {name: bool},
 *  llmConfig: {provider, model, temperature, systemPrompt}}
 * id is required and becomes the agent id unless one is supplied.
 */
class CapabilityAdapter : public core::AdapterBase {
public:
    static constexpr const char* PROTOCOL_ID = "capability";

    std::string protocolId() const override { return PROTOCOL_ID; }
    std::string description() const override;

    core::CanonicalResult toCanonical(const nlohmann::json& native,
                                      const core::TransformOptions& options) const override;
    core::NativeResult fromCanonical(const core::CanonicalGraph& graph,
                                     const core::TransformOptions& options) const override;
    core::ValidationResult validate(const nlohmann::json& native) const override;
    std::vector<core::AdapterCapability> getCapabilities() const override;

private:
    void mapActions(ForwardMapping& mapping, const nlohmann::json& actions) const;
    void mapProtocols(ForwardMapping& mapping, const nlohmann::json& protocols) const;
    void mapLlmConfig(ForwardMapping& mapping, const nlohmann::json& config) const;
};

} // namespace adapters
} // namespace agentbridge
