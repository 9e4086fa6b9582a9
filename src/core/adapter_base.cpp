#include "agentbridge/core/adapter_base.h"
#include "agentbridge/core/errors.h"
#include <sstream>

namespace agentbridge {
namespace core {

namespace {
    // Children of the agent are at most two hops away (agent -> tool -> schema).
    constexpr size_t TRACE_DEPTH = 4;

    std::chrono::microseconds elapsedSince(std::chrono::steady_clock::time_point started) {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
    }
}

double AdapterBase::computeFidelity(size_t mapped, size_t preserved, size_t lossy, size_t dropped) {
    const size_t total = mapped + preserved + lossy + dropped;
    if (total == 0) {
        return 1.0;
    }
    double score = static_cast<double>(mapped) +
                   EXTENSION_WEIGHT * static_cast<double>(preserved) +
                   LOSSY_WEIGHT * static_cast<double>(lossy);
    return score / static_cast<double>(total);
}

void AdapterBase::assignPath(nlohmann::json& target, const std::string& dottedPath, const nlohmann::json& value) {
    nlohmann::json* node = &target;
    std::stringstream ss(dottedPath);
    std::string segment;
    std::vector<std::string> segments;
    while (std::getline(ss, segment, '.')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    if (segments.empty()) {
        return;
    }
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        nlohmann::json& child = (*node)[segments[i]];
        if (!child.is_object()) {
            child = nlohmann::json::object();
        }
        node = &child;
    }
    (*node)[segments.back()] = value;
}

// --- ForwardMapping ---

AdapterBase::ForwardMapping::ForwardMapping(std::string protocolId, std::string agentId)
    : protocolId_(std::move(protocolId)),
      agentId_(std::move(agentId)),
      agentNode_(agentIdentifier(agentId_)) {
    graph_.addObject(agentNode_, vocab::TYPE, vocab::AGENT);
}

void AdapterBase::ForwardMapping::mapLiteral(const std::string& path, const std::string& predicate, Term literal) {
    mapLiteralOn(agentNode_, path, predicate, std::move(literal));
}

void AdapterBase::ForwardMapping::mapLiteralOn(const std::string& subject, const std::string& path,
                                               const std::string& predicate, Term literal) {
    graph_.addLiteral(subject, predicate, std::move(literal));
    report_.mappedFields.push_back(path);
}

std::string AdapterBase::ForwardMapping::addChild(const std::string& kind, const std::string& local,
                                                  const std::string& typeId, const std::string& linkPredicate) {
    std::string child = childIdentifier(agentId_, kind, slugify(local));
    graph_.addObject(agentNode_, linkPredicate, child);
    graph_.addObject(child, vocab::TYPE, typeId);
    return child;
}

std::optional<std::string> AdapterBase::ForwardMapping::addTool(const std::string& path, const std::string& name) {
    std::string local = slugify(name);
    if (local.empty()) {
        lossy(path, "tool has no usable name");
        return std::nullopt;
    }
    if (!tools_.insert(local).second) {
        lossy(path, "duplicate tool name '" + name + "'");
        return std::nullopt;
    }
    std::string child = addChild("tool", local, vocab::TOOL, vocab::HAS_TOOL);
    mapLiteralOn(child, path, vocab::TOOL_NAME, Term::literal(name));
    return child;
}

void AdapterBase::ForwardMapping::preserve(const std::string& path, const nlohmann::json& value,
                                           const std::string& reason) {
    preserveOn(agentNode_, path, path, value, reason);
}

void AdapterBase::ForwardMapping::preserveOn(const std::string& subject, const std::string& extensionKey,
                                             const std::string& path, const nlohmann::json& value,
                                             const std::string& reason) {
    graph_.addLiteral(subject, extensionPredicate(protocolId_, extensionKey), Term::jsonLiteral(value));
    report_.unmappedFields.push_back({path, reason});
}

void AdapterBase::ForwardMapping::lossy(const std::string& path, const std::string& reason) {
    report_.lossyMappings.push_back({path, reason});
}

void AdapterBase::ForwardMapping::warn(const std::string& message) {
    report_.warnings.push_back(message);
}

CanonicalResult AdapterBase::ForwardMapping::finish(std::chrono::steady_clock::time_point started) {
    report_.success = true;
    report_.fidelityScore = computeFidelity(report_.mappedFields.size(),
                                            report_.unmappedFields.size(),
                                            report_.lossyMappings.size());
    report_.duration = elapsedSince(started);
    return CanonicalResult{std::move(graph_), agentId_, std::move(report_)};
}

// --- ReverseMapping ---

AdapterBase::ReverseMapping::ReverseMapping(const CanonicalGraph& graph, std::string protocolId)
    : graph_(graph),
      protocolId_(std::move(protocolId)),
      agentNode_(graph.agentNode()) {
    consumed_.insert(objectTriple(agentNode_, vocab::TYPE, vocab::AGENT));
}

std::string AdapterBase::ReverseMapping::agentId() const {
    auto id = agentIdFromIdentifier(agentNode_);
    return id ? *id : agentNode_;
}

std::optional<Term> AdapterBase::ReverseMapping::take(const std::string& subject, const std::string& predicate) {
    auto objects = graph_.objectsOf(subject, predicate);
    if (objects.empty()) {
        return std::nullopt;
    }
    // Further values stay unconsumed and are reported by finish().
    consumed_.insert(Triple{subject, predicate, objects.front()});
    return objects.front();
}

std::vector<Term> AdapterBase::ReverseMapping::takeAll(const std::string& subject, const std::string& predicate) {
    auto objects = graph_.objectsOf(subject, predicate);
    for (const auto& object : objects) {
        consumed_.insert(Triple{subject, predicate, object});
    }
    return objects;
}

std::map<std::string, nlohmann::json> AdapterBase::ReverseMapping::takeExtensions(const std::string& subject) {
    auto entries = graph_.extensionEntries(subject, protocolId_);
    for (const auto& triple : graph_.triplesAbout(subject)) {
        auto parsed = parseExtensionPredicate(triple.predicate);
        if (parsed && parsed->first == protocolId_) {
            consumed_.insert(triple);
        }
    }
    return entries;
}

std::optional<std::string> AdapterBase::ReverseMapping::takeString(const std::string& subject,
                                                                  const std::string& predicate) {
    auto objects = graph_.objectsOf(subject, predicate);
    for (const auto& object : objects) {
        if (object.isLiteral() && object.datatype == LiteralType::STRING) {
            consumed_.insert(Triple{subject, predicate, object});
            return object.value;
        }
    }
    return std::nullopt;
}

std::vector<AdapterBase::ToolView> AdapterBase::ReverseMapping::takeTools(bool withInputSchema) {
    std::vector<ToolView> tools;
    for (const auto& link : takeAll(agentNode_, vocab::HAS_TOOL)) {
        if (!link.isIdentifier()) {
            continue;
        }
        ToolView tool;
        tool.node = link.value;
        auto name = takeString(tool.node, vocab::TOOL_NAME);
        if (name) {
            tool.name = *name;
        } else {
            // Fall back to the local part of the node identifier.
            auto slash = tool.node.find_last_of('/');
            tool.name = slash == std::string::npos ? tool.node : tool.node.substr(slash + 1);
            report_.warnings.push_back("tool " + tool.node + " has no name, using '" + tool.name + "'");
        }
        tool.description = takeString(tool.node, vocab::TOOL_DESCRIPTION);
        if (withInputSchema) {
            auto schema = take(tool.node, vocab::TOOL_INPUT_SCHEMA);
            if (schema && schema->isLiteral()) {
                tool.inputSchema = schema->toJson();
            }
        }
        tool.extensions = takeExtensions(tool.node);
        report_.mappedFields.push_back("tools." + tool.name);
        tools.push_back(std::move(tool));
    }
    return tools;
}

void AdapterBase::ReverseMapping::markMapped(const std::string& field) {
    report_.mappedFields.push_back(field);
}

void AdapterBase::ReverseMapping::lossy(const std::string& path, const std::string& reason) {
    report_.lossyMappings.push_back({path, reason});
}

void AdapterBase::ReverseMapping::warn(const std::string& message) {
    report_.warnings.push_back(message);
}

NativeResult AdapterBase::ReverseMapping::finish(nlohmann::json native,
                                                 std::chrono::steady_clock::time_point started) {
    // A node's type statement is carried whenever anything else about it is.
    std::set<std::string> touched;
    for (const auto& triple : consumed_) {
        touched.insert(triple.subject);
    }
    for (const auto& triple : graph_) {
        if (triple.predicate == vocab::TYPE && touched.count(triple.subject)) {
            consumed_.insert(triple);
        }
    }

    // Report what was left behind, in reachable order first.
    std::set<Triple> reported;
    auto reportLoss = [this, &reported](const Triple& triple) {
        if (consumed_.count(triple) || !reported.insert(triple).second) {
            return;
        }
        auto extension = parseExtensionPredicate(triple.predicate);
        if (extension) {
            report_.lossyMappings.push_back({triple.predicate,
                "extension entry owned by protocol '" + extension->first + "'"});
        } else {
            report_.lossyMappings.push_back({triple.predicate,
                "no " + protocolId_ + " equivalent for " + triple.predicate});
        }
    };
    for (const auto& triple : graph_.traceRelationships(agentNode_, TRACE_DEPTH)) {
        reportLoss(triple);
    }
    for (const auto& triple : graph_) {
        reportLoss(triple);
    }

    size_t carried = 0;
    for (const auto& triple : graph_) {
        if (consumed_.count(triple)) {
            ++carried;
        }
    }

    report_.success = true;
    report_.fidelityScore = graph_.empty()
        ? 1.0
        : static_cast<double>(carried) / static_cast<double>(graph_.size());
    report_.duration = elapsedSince(started);
    return NativeResult{std::move(native), std::move(report_)};
}

} // namespace core
} // namespace agentbridge
