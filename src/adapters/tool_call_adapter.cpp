#include "agentbridge/adapters/tool_call_adapter.h"
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

    std::string indexed(const std::string& field, size_t index) {
        return field + "[" + std::to_string(index) + "]";
    }
}

std::string ToolCallAdapter::description() const {
    return "Function-calling agent schema (name, instructions, tools, model)";
}

core::CanonicalResult ToolCallAdapter::toCanonical(const nlohmann::json& native,
                                                   const core::TransformOptions& options) const {
    auto started = std::chrono::steady_clock::now();
    if (!native.is_object()) {
        throw core::TransformError("toolcall: native description must be a JSON object");
    }
    auto name = native.find("name");
    if (name == native.end() || !name->is_string() || name->get<std::string>().empty()) {
        throw core::TransformError("toolcall: required field 'name' is missing");
    }

    std::string agentId = options.agentId ? *options.agentId : core::slugify(name->get<std::string>());
    if (agentId.empty()) {
        throw core::TransformError("toolcall: cannot derive an agent id from name '" +
                                   name->get<std::string>() + "'");
    }

    ForwardMapping mapping(PROTOCOL_ID, agentId);
    for (auto it = native.begin(); it != native.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (key == "name") {
            mapping.mapLiteral(key, vocab::NAME, Term::literal(value.get<std::string>()));
        } else if ((key == "description" || key == "version") && value.is_string()) {
            mapping.mapLiteral(key, key == "description" ? vocab::DESCRIPTION : vocab::VERSION,
                               Term::literal(value.get<std::string>()));
        } else if (key == "instructions" && value.is_string()) {
            mapping.mapLiteral(key, vocab::INSTRUCTION, Term::literal(value.get<std::string>()));
        } else if ((key == "instructions" || key == "tags") && value.is_array()) {
            const char* predicate = key == "instructions" ? vocab::INSTRUCTION : vocab::TAG;
            for (size_t i = 0; i < value.size(); ++i) {
                if (value[i].is_string()) {
                    mapping.mapLiteral(indexed(key, i), predicate, Term::literal(value[i].get<std::string>()));
                } else {
                    mapping.lossy(indexed(key, i), UNEXPECTED_TYPE);
                }
            }
        } else if (key == "tools" && value.is_array()) {
            for (size_t i = 0; i < value.size(); ++i) {
                mapTool(mapping, indexed(key, i), value[i]);
            }
        } else if (key == "model" && (value.is_object() || value.is_string())) {
            mapModel(mapping, value);
        } else {
            mapping.preserve(key, value, value.is_null() ? UNEXPECTED_TYPE : UNKNOWN_FIELD);
        }
    }

    auto result = mapping.finish(started);
    XLOG_DEBUG("[toolcall] toCanonical " << agentId << " fidelity=" << result.report.fidelityScore);
    return result;
}

void ToolCallAdapter::mapTool(ForwardMapping& mapping, const std::string& path, const nlohmann::json& tool) const {
    if (tool.is_string()) {
        mapping.addTool(path, tool.get<std::string>());
        return;
    }
    if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
        mapping.lossy(path, "tool has no name");
        return;
    }
    auto node = mapping.addTool(path + ".name", tool["name"].get<std::string>());
    if (!node) {
        return;
    }
    for (auto it = tool.begin(); it != tool.end(); ++it) {
        const std::string field = path + "." + it.key();
        if (it.key() == "name") {
            continue;
        } else if (it.key() == "description" && it.value().is_string()) {
            mapping.mapLiteralOn(*node, field, vocab::TOOL_DESCRIPTION,
                                 Term::literal(it.value().get<std::string>()));
        } else if (it.key() == "parameters" && it.value().is_object()) {
            mapping.mapLiteralOn(*node, field, vocab::TOOL_INPUT_SCHEMA, Term::jsonLiteral(it.value()));
        } else {
            mapping.preserveOn(*node, it.key(), field, it.value(), UNKNOWN_FIELD);
        }
    }
}

void ToolCallAdapter::mapModel(ForwardMapping& mapping, const nlohmann::json& model) const {
    if (model.is_string()) {
        mapping.mapLiteral("model", vocab::LLM_MODEL, Term::literal(model.get<std::string>()));
        return;
    }
    for (auto it = model.begin(); it != model.end(); ++it) {
        const std::string field = "model." + it.key();
        if (it.key() == "provider" && it.value().is_string()) {
            mapping.mapLiteral(field, vocab::LLM_PROVIDER, Term::literal(it.value().get<std::string>()));
        } else if (it.key() == "name" && it.value().is_string()) {
            mapping.mapLiteral(field, vocab::LLM_MODEL, Term::literal(it.value().get<std::string>()));
        } else if (it.key() == "temperature" && it.value().is_number()) {
            mapping.mapLiteral(field, vocab::TEMPERATURE, Term::literal(it.value().get<double>()));
        } else {
            mapping.preserve(field, it.value(), UNKNOWN_FIELD);
        }
    }
}

core::NativeResult ToolCallAdapter::fromCanonical(const CanonicalGraph& graph,
                                                  const core::TransformOptions& /*options*/) const {
    auto started = std::chrono::steady_clock::now();
    ReverseMapping mapping(graph, PROTOCOL_ID);
    const std::string agent = mapping.agentNode();
    nlohmann::json native = nlohmann::json::object();

    if (auto name = mapping.takeString(agent, vocab::NAME)) {
        native["name"] = *name;
        mapping.markMapped("name");
    } else {
        native["name"] = mapping.agentId();
        mapping.warn("agent has no name, using its id '" + mapping.agentId() + "'");
    }
    if (auto description = mapping.takeString(agent, vocab::DESCRIPTION)) {
        native["description"] = *description;
        mapping.markMapped("description");
    }
    if (auto version = mapping.takeString(agent, vocab::VERSION)) {
        native["version"] = *version;
        mapping.markMapped("version");
    }

    auto instructions = mapping.takeAll(agent, vocab::INSTRUCTION);
    if (instructions.size() == 1) {
        native["instructions"] = instructions.front().value;
    } else if (instructions.size() > 1) {
        native["instructions"] = nlohmann::json::array();
        for (const auto& instruction : instructions) {
            native["instructions"].push_back(instruction.value);
        }
    }
    if (!instructions.empty()) {
        mapping.markMapped("instructions");
    }

    auto tags = mapping.takeAll(agent, vocab::TAG);
    if (!tags.empty()) {
        native["tags"] = nlohmann::json::array();
        for (const auto& tag : tags) {
            native["tags"].push_back(tag.value);
        }
        mapping.markMapped("tags");
    }

    auto tools = mapping.takeTools();
    if (!tools.empty()) {
        native["tools"] = nlohmann::json::array();
        for (const auto& tool : tools) {
            if (tool.nameOnly()) {
                native["tools"].push_back(tool.name);
                continue;
            }
            nlohmann::json entry = {{"name", tool.name}};
            if (tool.description) {
                entry["description"] = *tool.description;
            }
            if (tool.inputSchema) {
                entry["parameters"] = *tool.inputSchema;
            }
            for (const auto& [key, value] : tool.extensions) {
                entry[key] = value;
            }
            native["tools"].push_back(std::move(entry));
        }
    }

    nlohmann::json model = nlohmann::json::object();
    if (auto provider = mapping.takeString(agent, vocab::LLM_PROVIDER)) {
        model["provider"] = *provider;
    }
    if (auto modelName = mapping.takeString(agent, vocab::LLM_MODEL)) {
        model["name"] = *modelName;
    }
    if (auto temperature = mapping.take(agent, vocab::TEMPERATURE)) {
        model["temperature"] = temperature->toJson();
    }
    if (!model.empty()) {
        native["model"] = std::move(model);
        mapping.markMapped("model");
    }

    for (const auto& [path, value] : mapping.takeExtensions(agent)) {
        assignPath(native, path, value);
    }

    return mapping.finish(std::move(native), started);
}

core::ValidationResult ToolCallAdapter::validate(const nlohmann::json& native) const {
    core::ValidationResult result;
    if (!native.is_object()) {
        result.valid = false;
        result.errors.push_back({"", "native description must be a JSON object"});
        return result;
    }
    if (!native.contains("name") || !native["name"].is_string() || native["name"].get<std::string>().empty()) {
        result.errors.push_back({"name", "required string field"});
    }
    if (native.contains("tools")) {
        const auto& tools = native["tools"];
        if (!tools.is_array()) {
            result.errors.push_back({"tools", "must be an array"});
        } else {
            for (size_t i = 0; i < tools.size(); ++i) {
                bool named = tools[i].is_string() ||
                             (tools[i].is_object() && tools[i].contains("name") && tools[i]["name"].is_string());
                if (!named) {
                    result.errors.push_back({indexed("tools", i), "tool must be a name or an object with a name"});
                }
            }
        }
    }
    if (native.contains("model") && !native["model"].is_object() && !native["model"].is_string()) {
        result.errors.push_back({"model", "must be an object or a model name"});
    }
    static const std::set<std::string> known = {
        "name", "description", "version", "instructions", "tags", "tools", "model"};
    for (auto it = native.begin(); it != native.end(); ++it) {
        if (!known.count(it.key())) {
            result.warnings.push_back({it.key(), "kept in the extension namespace"});
        }
    }
    result.valid = result.errors.empty();
    return result;
}

std::vector<core::AdapterCapability> ToolCallAdapter::getCapabilities() const {
    return {
        {"tools", "Tool definitions with JSON parameter schemas", true},
        {"instructions", "System instructions", true},
        {"llm-config", "Model provider, name and temperature", true},
        {"tags", "Free-form tags", true}
    };
}

} // namespace adapters
} // namespace agentbridge
