#include "agentbridge/adapters/capability_adapter.h"
#include "agentbridge/core/errors.h"
#include "agentbridge/utils/logging.hpp"

namespace agentbridge {
namespace adapters {

using core::CanonicalGraph;
using core::Term;
namespace vocab = core::vocab;

namespace {
    const char* const UNKNOWN_FIELD = "no canonical equivalent";
    const char* const UNEXPECTED_TYPE = "unexpected value type";
}

std::string CapabilityAdapter::description() const {
    return "Capability description schema (capabilities, actions, protocols, llmConfig)";
}

core::CanonicalResult CapabilityAdapter::toCanonical(const nlohmann::json& native,
                                                     const core::TransformOptions& options) const {
    auto started = std::chrono::steady_clock::now();
    if (!native.is_object()) {
        throw core::TransformError("capability: native description must be a JSON object");
    }
    auto id = native.find("id");
    if (id == native.end() || !id->is_string() || id->get<std::string>().empty()) {
        throw core::TransformError("capability: required field 'id' is missing");
    }

    const std::string nativeId = id->get<std::string>();
    std::string agentId = options.agentId ? *options.agentId : core::slugify(nativeId);
    if (agentId.empty()) {
        throw core::TransformError("capability: cannot derive an agent id from '" + nativeId + "'");
    }

    ForwardMapping mapping(PROTOCOL_ID, agentId);
    for (auto it = native.begin(); it != native.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (key == "id") {
            // The id is the agent node itself; keep the exact spelling when it differs.
            if (nativeId != agentId) {
                mapping.preserve(key, value, "identifier differs from the agent id");
            }
        } else if (key == "title" && value.is_string()) {
            mapping.mapLiteral(key, vocab::NAME, Term::literal(value.get<std::string>()));
        } else if (key == "description" && value.is_string()) {
            mapping.mapLiteral(key, vocab::DESCRIPTION, Term::literal(value.get<std::string>()));
        } else if (key == "capabilities" && value.is_array()) {
            for (size_t i = 0; i < value.size(); ++i) {
                const std::string path = "capabilities[" + std::to_string(i) + "]";
                if (value[i].is_string()) {
                    mapping.mapLiteral(path, vocab::CAPABILITY, Term::literal(value[i].get<std::string>()));
                } else {
                    mapping.preserve(path, value[i], UNEXPECTED_TYPE);
                }
            }
        } else if (key == "actions" && value.is_object()) {
            mapActions(mapping, value);
        } else if (key == "protocols" && value.is_object()) {
            mapProtocols(mapping, value);
        } else if (key == "llmConfig" && value.is_object()) {
            mapLlmConfig(mapping, value);
        } else {
            mapping.preserve(key, value, UNKNOWN_FIELD);
        }
    }

    auto result = mapping.finish(started);
    XLOG_DEBUG("[capability] toCanonical " << agentId << " fidelity=" << result.report.fidelityScore);
    return result;
}

void CapabilityAdapter::mapActions(ForwardMapping& mapping, const nlohmann::json& actions) const {
    for (auto it = actions.begin(); it != actions.end(); ++it) {
        const std::string path = "actions." + it.key();
        auto node = mapping.addTool(path, it.key());
        if (!node) {
            continue;
        }
        if (!it.value().is_object()) {
            mapping.preserveOn(*node, "value", path, it.value(), UNEXPECTED_TYPE);
            continue;
        }
        for (auto field = it.value().begin(); field != it.value().end(); ++field) {
            const std::string fieldPath = path + "." + field.key();
            if (field.key() == "description" && field.value().is_string()) {
                mapping.mapLiteralOn(*node, fieldPath, vocab::TOOL_DESCRIPTION,
                                     Term::literal(field.value().get<std::string>()));
            } else if (field.key() == "input" && field.value().is_object()) {
                mapping.mapLiteralOn(*node, fieldPath, vocab::TOOL_INPUT_SCHEMA, Term::jsonLiteral(field.value()));
            } else {
                mapping.preserveOn(*node, field.key(), fieldPath, field.value(), UNKNOWN_FIELD);
            }
        }
    }
}

void CapabilityAdapter::mapProtocols(ForwardMapping& mapping, const nlohmann::json& protocols) const {
    for (auto it = protocols.begin(); it != protocols.end(); ++it) {
        const std::string path = "protocols." + it.key();
        if (it.value().is_boolean() && it.value().get<bool>()) {
            mapping.mapLiteral(path, vocab::PROTOCOL, Term::literal(it.key()));
        } else {
            mapping.preserve(path, it.value(), "only supported protocols have a canonical form");
        }
    }
}

void CapabilityAdapter::mapLlmConfig(ForwardMapping& mapping, const nlohmann::json& config) const {
    for (auto it = config.begin(); it != config.end(); ++it) {
        const std::string path = "llmConfig." + it.key();
        const nlohmann::json& value = it.value();
        if (it.key() == "provider" && value.is_string()) {
            mapping.mapLiteral(path, vocab::LLM_PROVIDER, Term::literal(value.get<std::string>()));
        } else if (it.key() == "model" && value.is_string()) {
            mapping.mapLiteral(path, vocab::LLM_MODEL, Term::literal(value.get<std::string>()));
        } else if (it.key() == "temperature" && value.is_number()) {
            mapping.mapLiteral(path, vocab::TEMPERATURE, Term::literal(value.get<double>()));
        } else if (it.key() == "systemPrompt" && value.is_string()) {
            mapping.mapLiteral(path, vocab::INSTRUCTION, Term::literal(value.get<std::string>()));
        } else {
            mapping.preserve(path, value, UNKNOWN_FIELD);
        }
    }
}

core::NativeResult CapabilityAdapter::fromCanonical(const CanonicalGraph& graph,
                                                    const core::TransformOptions& /*options*/) const {
    auto started = std::chrono::steady_clock::now();
    ReverseMapping mapping(graph, PROTOCOL_ID);
    const std::string agent = mapping.agentNode();
    nlohmann::json native = nlohmann::json::object();

    native["id"] = mapping.agentId();
    if (auto title = mapping.takeString(agent, vocab::NAME)) {
        native["title"] = *title;
        mapping.markMapped("title");
    }
    if (auto description = mapping.takeString(agent, vocab::DESCRIPTION)) {
        native["description"] = *description;
        mapping.markMapped("description");
    }

    auto capabilities = mapping.takeAll(agent, vocab::CAPABILITY);
    if (!capabilities.empty()) {
        native["capabilities"] = nlohmann::json::array();
        for (const auto& capability : capabilities) {
            native["capabilities"].push_back(capability.value);
        }
        mapping.markMapped("capabilities");
    }

    auto tools = mapping.takeTools();
    if (!tools.empty()) {
        nlohmann::json actions = nlohmann::json::object();
        for (const auto& tool : tools) {
            nlohmann::json action = nlohmann::json::object();
            if (tool.description) {
                action["description"] = *tool.description;
            }
            if (tool.inputSchema) {
                action["input"] = *tool.inputSchema;
            }
            for (const auto& [key, value] : tool.extensions) {
                if (key == "value") {
                    action = value;
                    break;
                }
                action[key] = value;
            }
            actions[tool.name] = std::move(action);
        }
        native["actions"] = std::move(actions);
    }

    auto protocols = mapping.takeAll(agent, vocab::PROTOCOL);
    for (const auto& protocol : protocols) {
        native["protocols"][protocol.value] = true;
    }
    if (!protocols.empty()) {
        mapping.markMapped("protocols");
    }

    nlohmann::json llmConfig = nlohmann::json::object();
    if (auto provider = mapping.takeString(agent, vocab::LLM_PROVIDER)) {
        llmConfig["provider"] = *provider;
    }
    if (auto model = mapping.takeString(agent, vocab::LLM_MODEL)) {
        llmConfig["model"] = *model;
    }
    if (auto temperature = mapping.take(agent, vocab::TEMPERATURE)) {
        llmConfig["temperature"] = temperature->toJson();
    }
    if (auto prompt = mapping.takeString(agent, vocab::INSTRUCTION)) {
        llmConfig["systemPrompt"] = *prompt;
    }
    if (!llmConfig.empty()) {
        native["llmConfig"] = std::move(llmConfig);
        mapping.markMapped("llmConfig");
    }

    for (const auto& [path, value] : mapping.takeExtensions(agent)) {
        assignPath(native, path, value);
    }

    return mapping.finish(std::move(native), started);
}

core::ValidationResult CapabilityAdapter::validate(const nlohmann::json& native) const {
    core::ValidationResult result;
    if (!native.is_object()) {
        result.valid = false;
        result.errors.push_back({"", "native description must be a JSON object"});
        return result;
    }
    if (!native.contains("id") || !native["id"].is_string() || native["id"].get<std::string>().empty()) {
        result.errors.push_back({"id", "required string field"});
    } else if (core::slugify(native["id"].get<std::string>()) != native["id"].get<std::string>()) {
        result.warnings.push_back({"id", "not a canonical agent id, original spelling kept as an extension"});
    }
    if (native.contains("capabilities") && !native["capabilities"].is_array()) {
        result.errors.push_back({"capabilities", "must be an array"});
    }
    if (native.contains("actions") && !native["actions"].is_object()) {
        result.errors.push_back({"actions", "must be an object keyed by action name"});
    }
    if (native.contains("protocols") && !native["protocols"].is_object()) {
        result.errors.push_back({"protocols", "must be an object of booleans"});
    }
    if (native.contains("llmConfig") && !native["llmConfig"].is_object()) {
        result.errors.push_back({"llmConfig", "must be an object"});
    }
    result.valid = result.errors.empty();
    return result;
}

std::vector<core::AdapterCapability> CapabilityAdapter::getCapabilities() const {
    return {
        {"capabilities", "Declared capability names", true},
        {"tools", "Actions with input schemas", true},
        {"protocols", "Supported interaction protocols", true},
        {"llm-config", "Provider, model, temperature and system prompt", true}
    };
}

} // namespace adapters
} // namespace agentbridge
