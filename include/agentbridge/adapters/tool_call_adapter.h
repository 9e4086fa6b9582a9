#pragma once

#include "agentbridge/core/adapter_base.h"

namespace agentbridge {
namespace adapters {

/**
 * @brief Adapter for function-calling agent schemas
 *
 * Native shape:
 * {name, description, version, instructions, tags,
 *  tools: [string | {name, description, parameters}],
 *  model: {provider, name, temperature}}
 * Only name is required. Unknown keys are kept in the extension namespace.
 */
class ToolCallAdapter : public core::AdapterBase {
public:
    static constexpr const char* PROTOCOL_ID = "toolcall";

    std::string protocolId() const override { return PROTOCOL_ID; }
    std::string description() const override;

    core::CanonicalResult toCanonical(const nlohmann::json& native,
                                      const core::TransformOptions& options) const override;
    core::NativeResult fromCanonical(const core::CanonicalGraph& graph,
                                     const core::TransformOptions& options) const override;
    core::ValidationResult validate(const nlohmann::json& native) const override;
    std::vector<core::AdapterCapability> getCapabilities() const override;

private:
    void mapTool(ForwardMapping& mapping, const std::string& path, const nlohmann::json& tool) const;
    void mapModel(ForwardMapping& mapping, const nlohmann::json& model) const;
};

} // namespace adapters
} // namespace agentbridge
