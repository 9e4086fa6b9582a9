#include "agentbridge/adapters/role_goal_adapter.h"
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

    bool isNonEmptyString(const nlohmann::json& object, const char* key) {
        auto it = object.find(key);
        return it != object.end() && it->is_string() && !it->get<std::string>().empty();
    }
}

std::string RoleGoalAdapter::description() const {
    return "Role/goal crew member schema (role, goal, backstory, tools, llm)";
}

core::CanonicalResult RoleGoalAdapter::toCanonical(const nlohmann::json& native,
                                                   const core::TransformOptions& options) const {
    auto started = std::chrono::steady_clock::now();
    if (!native.is_object()) {
        throw core::TransformError("rolegoal: native description must be a JSON object");
    }
    if (!isNonEmptyString(native, "role")) {
        throw core::TransformError("rolegoal: required field 'role' is missing");
    }

    std::string agentId;
    if (options.agentId) {
        agentId = *options.agentId;
    } else {
        agentId = core::slugify(isNonEmptyString(native, "name") ? native["name"].get<std::string>()
                                                                 : native["role"].get<std::string>());
    }
    if (agentId.empty()) {
        throw core::TransformError("rolegoal: cannot derive an agent id");
    }

    ForwardMapping mapping(PROTOCOL_ID, agentId);
    for (auto it = native.begin(); it != native.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (value.is_string() && (key == "role" || key == "name" || key == "goal" || key == "backstory")) {
            const char* predicate = key == "role" ? vocab::ROLE
                                  : key == "name" ? vocab::NAME
                                  : key == "goal" ? vocab::GOAL
                                  : vocab::BACKSTORY;
            mapping.mapLiteral(key, predicate, Term::literal(value.get<std::string>()));
        } else if (key == "tools" && value.is_array()) {
            for (size_t i = 0; i < value.size(); ++i) {
                const std::string path = "tools[" + std::to_string(i) + "]";
                if (value[i].is_string()) {
                    mapping.addTool(path, value[i].get<std::string>());
                } else if (value[i].is_object() && isNonEmptyString(value[i], "name")) {
                    auto node = mapping.addTool(path + ".name", value[i]["name"].get<std::string>());
                    if (node && isNonEmptyString(value[i], "description")) {
                        mapping.mapLiteralOn(*node, path + ".description", vocab::TOOL_DESCRIPTION,
                                             Term::literal(value[i]["description"].get<std::string>()));
                    }
                    for (auto field = value[i].begin(); node && field != value[i].end(); ++field) {
                        if (field.key() != "name" && field.key() != "description") {
                            mapping.preserveOn(*node, field.key(), path + "." + field.key(),
                                               field.value(), UNKNOWN_FIELD);
                        }
                    }
                } else {
                    mapping.lossy(path, "tool has no name");
                }
            }
        } else if (key == "llm" && value.is_string()) {
            // "provider/model"; a bare value is a model name.
            const std::string llm = value.get<std::string>();
            auto slash = llm.find('/');
            if (slash == std::string::npos) {
                mapping.mapLiteral(key, vocab::LLM_MODEL, Term::literal(llm));
            } else {
                mapping.mapLiteral("llm.provider", vocab::LLM_PROVIDER, Term::literal(llm.substr(0, slash)));
                mapping.mapLiteral("llm.model", vocab::LLM_MODEL, Term::literal(llm.substr(slash + 1)));
            }
        } else if (key == "max_iter" && value.is_number_integer()) {
            mapping.mapLiteral(key, vocab::MAX_ITERATIONS, Term::literal(value.get<int64_t>()));
        } else if (key == "memory" && value.is_boolean()) {
            mapping.mapLiteral(key, vocab::MEMORY_ENABLED, Term::literal(value.get<bool>()));
        } else {
            bool known = key == "role" || key == "name" || key == "goal" || key == "backstory" ||
                         key == "tools" || key == "llm" || key == "max_iter" || key == "memory";
            mapping.preserve(key, value, known ? UNEXPECTED_TYPE : UNKNOWN_FIELD);
        }
    }

    auto result = mapping.finish(started);
    XLOG_DEBUG("[rolegoal] toCanonical " << agentId << " fidelity=" << result.report.fidelityScore);
    return result;
}

core::NativeResult RoleGoalAdapter::fromCanonical(const CanonicalGraph& graph,
                                                  const core::TransformOptions& /*options*/) const {
    auto started = std::chrono::steady_clock::now();
    ReverseMapping mapping(graph, PROTOCOL_ID);
    const std::string agent = mapping.agentNode();
    nlohmann::json native = nlohmann::json::object();

    auto name = mapping.takeString(agent, vocab::NAME);
    if (name) {
        native["name"] = *name;
        mapping.markMapped("name");
    }
    if (auto role = mapping.takeString(agent, vocab::ROLE)) {
        native["role"] = *role;
        mapping.markMapped("role");
    } else {
        native["role"] = name ? *name : mapping.agentId();
        mapping.warn("agent has no role, using '" + native["role"].get<std::string>() + "'");
    }
    if (auto goal = mapping.takeString(agent, vocab::GOAL)) {
        native["goal"] = *goal;
        mapping.markMapped("goal");
    }
    if (auto backstory = mapping.takeString(agent, vocab::BACKSTORY)) {
        native["backstory"] = *backstory;
        mapping.markMapped("backstory");
    }

    auto tools = mapping.takeTools(false);
    if (!tools.empty()) {
        native["tools"] = nlohmann::json::array();
        for (const auto& tool : tools) {
            if (!tool.description && tool.extensions.empty()) {
                native["tools"].push_back(tool.name);
                continue;
            }
            nlohmann::json entry = {{"name", tool.name}};
            if (tool.description) {
                entry["description"] = *tool.description;
            }
            for (const auto& [key, value] : tool.extensions) {
                entry[key] = value;
            }
            native["tools"].push_back(std::move(entry));
        }
    }

    if (auto model = mapping.takeString(agent, vocab::LLM_MODEL)) {
        auto provider = mapping.takeString(agent, vocab::LLM_PROVIDER);
        native["llm"] = provider ? *provider + "/" + *model : *model;
        mapping.markMapped("llm");
    }
    if (auto maxIter = mapping.take(agent, vocab::MAX_ITERATIONS)) {
        native["max_iter"] = maxIter->toJson();
        mapping.markMapped("max_iter");
    }
    if (auto memory = mapping.take(agent, vocab::MEMORY_ENABLED)) {
        native["memory"] = memory->toJson();
        mapping.markMapped("memory");
    }

    for (const auto& [path, value] : mapping.takeExtensions(agent)) {
        assignPath(native, path, value);
    }

    return mapping.finish(std::move(native), started);
}

core::ValidationResult RoleGoalAdapter::validate(const nlohmann::json& native) const {
    core::ValidationResult result;
    if (!native.is_object()) {
        result.valid = false;
        result.errors.push_back({"", "native description must be a JSON object"});
        return result;
    }
    if (!isNonEmptyString(native, "role")) {
        result.errors.push_back({"role", "required string field"});
    }
    if (!native.contains("goal")) {
        result.warnings.push_back({"goal", "crew members usually declare a goal"});
    }
    if (native.contains("tools") && !native["tools"].is_array()) {
        result.errors.push_back({"tools", "must be an array of tool names"});
    }
    if (native.contains("llm") && !native["llm"].is_string()) {
        result.errors.push_back({"llm", "must be a \"provider/model\" string"});
    }
    if (native.contains("max_iter") && !native["max_iter"].is_number_integer()) {
        result.errors.push_back({"max_iter", "must be an integer"});
    }
    if (native.contains("memory") && !native["memory"].is_boolean()) {
        result.errors.push_back({"memory", "must be a boolean"});
    }
    result.valid = result.errors.empty();
    return result;
}

std::vector<core::AdapterCapability> RoleGoalAdapter::getCapabilities() const {
    return {
        {"role-goal", "Role, goal and backstory of a crew member", true},
        {"tools", "Tool names", true},
        {"memory", "Memory toggle", true},
        {"llm-config", "Provider/model string", true}
    };
}

} // namespace adapters
} // namespace agentbridge
