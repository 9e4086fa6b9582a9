#include "agentbridge/core/canonical_graph.h"
#include "agentbridge/core/errors.h"
#include <algorithm>
#include <cctype>
#include <deque>
#include <sstream>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace agentbridge {
namespace core {

namespace {
    const char* AGENT_PREFIX = "agent:";

    const std::unordered_map<std::string, SemanticCategory>& categoryTable() {
        static const std::unordered_map<std::string, SemanticCategory> table = {
            {vocab::TYPE, SemanticCategory::IDENTITY},
            {vocab::NAME, SemanticCategory::IDENTITY},
            {vocab::DESCRIPTION, SemanticCategory::IDENTITY},
            {vocab::VERSION, SemanticCategory::IDENTITY},
            {vocab::ROLE, SemanticCategory::IDENTITY},
            {vocab::GOAL, SemanticCategory::IDENTITY},
            {vocab::BACKSTORY, SemanticCategory::IDENTITY},
            {vocab::AUTHOR, SemanticCategory::IDENTITY},
            {vocab::TAG, SemanticCategory::IDENTITY},
            {vocab::HAS_TOOL, SemanticCategory::CAPABILITIES},
            {vocab::TOOL_NAME, SemanticCategory::CAPABILITIES},
            {vocab::TOOL_DESCRIPTION, SemanticCategory::CAPABILITIES},
            {vocab::TOOL_INPUT_SCHEMA, SemanticCategory::CAPABILITIES},
            {vocab::CAPABILITY, SemanticCategory::CAPABILITIES},
            {vocab::INSTRUCTION, SemanticCategory::INSTRUCTIONS},
            {vocab::CONSTRAINT, SemanticCategory::INSTRUCTIONS},
            {vocab::MEMORY_TYPE, SemanticCategory::STATE},
            {vocab::MEMORY_ENABLED, SemanticCategory::STATE},
            {vocab::LLM_PROVIDER, SemanticCategory::EXECUTION},
            {vocab::LLM_MODEL, SemanticCategory::EXECUTION},
            {vocab::TEMPERATURE, SemanticCategory::EXECUTION},
            {vocab::MAX_ITERATIONS, SemanticCategory::EXECUTION},
            {vocab::PROTOCOL, SemanticCategory::EXECUTION}
        };
        return table;
    }

    bool startsWith(const std::string& text, const std::string& prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    std::string escapeLiteral(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default: out += c;
            }
        }
        return out;
    }
}

const char* categoryName(SemanticCategory category) {
    switch (category) {
        case SemanticCategory::IDENTITY: return "Identity";
        case SemanticCategory::CAPABILITIES: return "Capabilities";
        case SemanticCategory::INSTRUCTIONS: return "Instructions";
        case SemanticCategory::STATE: return "State";
        case SemanticCategory::EXECUTION: return "Execution";
    }
    return "Unknown";
}

std::optional<SemanticCategory> categoryOf(const std::string& predicate) {
    const auto& table = categoryTable();
    auto it = table.find(predicate);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* literalTypeName(LiteralType type) {
    switch (type) {
        case LiteralType::NONE: return "none";
        case LiteralType::STRING: return "string";
        case LiteralType::INTEGER: return "integer";
        case LiteralType::DOUBLE: return "double";
        case LiteralType::BOOLEAN: return "boolean";
        case LiteralType::JSON: return "json";
    }
    return "none";
}

LiteralType parseLiteralType(const std::string& name) {
    if (name == "string") return LiteralType::STRING;
    if (name == "integer") return LiteralType::INTEGER;
    if (name == "double") return LiteralType::DOUBLE;
    if (name == "boolean") return LiteralType::BOOLEAN;
    if (name == "json") return LiteralType::JSON;
    if (name == "none") return LiteralType::NONE;
    throw TransformError("Unknown literal datatype: " + name);
}

// --- Term ---

Term Term::identifier(std::string id) {
    return Term{TermKind::IDENTIFIER, std::move(id), LiteralType::NONE};
}

Term Term::literal(std::string text) {
    return Term{TermKind::LITERAL, std::move(text), LiteralType::STRING};
}

Term Term::literal(const char* text) {
    return literal(std::string(text));
}

Term Term::literal(int64_t number) {
    return Term{TermKind::LITERAL, std::to_string(number), LiteralType::INTEGER};
}

Term Term::literal(double number) {
    // nlohmann emits the shortest round-trip representation
    return Term{TermKind::LITERAL, nlohmann::json(number).dump(), LiteralType::DOUBLE};
}

Term Term::literal(bool flag) {
    return Term{TermKind::LITERAL, flag ? "true" : "false", LiteralType::BOOLEAN};
}

Term Term::jsonLiteral(const nlohmann::json& value) {
    return Term{TermKind::LITERAL, value.dump(), LiteralType::JSON};
}

nlohmann::json Term::toJson() const {
    try {
        switch (datatype) {
            case LiteralType::NONE:
            case LiteralType::STRING:
                return value;
            case LiteralType::INTEGER:
                return std::stoll(value);
            case LiteralType::DOUBLE:
                return nlohmann::json::parse(value).get<double>();
            case LiteralType::BOOLEAN:
                return value == "true";
            case LiteralType::JSON:
                return nlohmann::json::parse(value);
        }
    } catch (const std::exception& e) {
        throw TransformError("Malformed " + std::string(literalTypeName(datatype)) +
                             " literal '" + value + "': " + e.what());
    }
    return value;
}

bool Term::operator==(const Term& other) const {
    return kind == other.kind && datatype == other.datatype && value == other.value;
}

bool Term::operator<(const Term& other) const {
    return std::tie(kind, datatype, value) < std::tie(other.kind, other.datatype, other.value);
}

// --- Triple ---

bool Triple::operator==(const Triple& other) const {
    return subject == other.subject && predicate == other.predicate && object == other.object;
}

bool Triple::operator<(const Triple& other) const {
    return std::tie(subject, predicate, object) < std::tie(other.subject, other.predicate, other.object);
}

Triple literalTriple(const std::string& subject, const std::string& predicate, Term literal) {
    if (!literal.isLiteral()) {
        throw TransformError("Literal triple for " + predicate + " given an identifier object");
    }
    return Triple{subject, predicate, std::move(literal)};
}

Triple objectTriple(const std::string& subject, const std::string& predicate, const std::string& objectId) {
    return Triple{subject, predicate, Term::identifier(objectId)};
}

// --- Identifiers ---

std::string agentIdentifier(const std::string& agentId) {
    return AGENT_PREFIX + agentId;
}

std::string childIdentifier(const std::string& agentId, const std::string& kind, const std::string& local) {
    return agentIdentifier(agentId) + "/" + kind + "/" + local;
}

std::optional<std::string> agentIdFromIdentifier(const std::string& identifier) {
    if (!startsWith(identifier, AGENT_PREFIX)) {
        return std::nullopt;
    }
    std::string rest = identifier.substr(std::char_traits<char>::length(AGENT_PREFIX));
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) {
        return std::nullopt;
    }
    return rest;
}

std::string slugify(const std::string& text) {
    std::string slug;
    bool pendingDash = false;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            if (pendingDash && !slug.empty()) {
                slug += '-';
            }
            pendingDash = false;
            slug += static_cast<char>(std::tolower(c));
        } else {
            pendingDash = true;
        }
    }
    return slug;
}

std::string extensionPredicate(const std::string& protocolId, const std::string& fieldPath) {
    return std::string(vocab::EXTENSION_PREFIX) + protocolId + ":" + fieldPath;
}

bool isExtensionPredicate(const std::string& predicate) {
    return startsWith(predicate, vocab::EXTENSION_PREFIX);
}

std::optional<std::pair<std::string, std::string>> parseExtensionPredicate(const std::string& predicate) {
    if (!isExtensionPredicate(predicate)) {
        return std::nullopt;
    }
    std::string rest = predicate.substr(std::char_traits<char>::length(vocab::EXTENSION_PREFIX));
    auto colon = rest.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == rest.size()) {
        return std::nullopt;
    }
    return std::make_pair(rest.substr(0, colon), rest.substr(colon + 1));
}

// --- CanonicalGraph ---

bool CanonicalGraph::insert(Triple triple) {
    return triples_.insert(std::move(triple)).second;
}

bool CanonicalGraph::addLiteral(const std::string& subject, const std::string& predicate, Term literal) {
    return insert(literalTriple(subject, predicate, std::move(literal)));
}

bool CanonicalGraph::addObject(const std::string& subject, const std::string& predicate, const std::string& objectId) {
    return insert(objectTriple(subject, predicate, objectId));
}

bool CanonicalGraph::erase(const Triple& triple) {
    return triples_.erase(triple) > 0;
}

bool CanonicalGraph::contains(const Triple& triple) const {
    return triples_.count(triple) > 0;
}

std::vector<std::string> CanonicalGraph::agentNodes() const {
    std::vector<std::string> nodes;
    const Term agentType = Term::identifier(vocab::AGENT);
    for (const auto& triple : triples_) {
        if (triple.predicate == vocab::TYPE && triple.object == agentType) {
            nodes.push_back(triple.subject);
        }
    }
    return nodes;
}

std::string CanonicalGraph::agentNode() const {
    auto nodes = agentNodes();
    if (nodes.size() != 1) {
        throw TransformError("Canonical graph must contain exactly one Agent node, found " +
                             std::to_string(nodes.size()));
    }
    return nodes.front();
}

std::vector<Term> CanonicalGraph::objectsOf(const std::string& subject, const std::string& predicate) const {
    std::vector<Term> objects;
    // Triples sort by subject then predicate, so the matches are contiguous.
    auto it = triples_.lower_bound(Triple{subject, predicate, Term{TermKind::IDENTIFIER, "", LiteralType::NONE}});
    for (; it != triples_.end() && it->subject == subject && it->predicate == predicate; ++it) {
        objects.push_back(it->object);
    }
    return objects;
}

std::optional<Term> CanonicalGraph::firstObject(const std::string& subject, const std::string& predicate) const {
    auto objects = objectsOf(subject, predicate);
    if (objects.empty()) {
        return std::nullopt;
    }
    return objects.front();
}

std::vector<Triple> CanonicalGraph::triplesAbout(const std::string& subject) const {
    std::vector<Triple> result;
    auto it = triples_.lower_bound(Triple{subject, "", Term{TermKind::IDENTIFIER, "", LiteralType::NONE}});
    for (; it != triples_.end() && it->subject == subject; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::set<std::string> CanonicalGraph::predicates() const {
    std::set<std::string> result;
    for (const auto& triple : triples_) {
        result.insert(triple.predicate);
    }
    return result;
}

std::map<std::string, nlohmann::json> CanonicalGraph::extensionEntries(
    const std::string& subject,
    const std::string& protocolId) const {
    std::map<std::string, nlohmann::json> entries;
    for (const auto& triple : triplesAbout(subject)) {
        auto parsed = parseExtensionPredicate(triple.predicate);
        if (!parsed || parsed->first != protocolId || !triple.object.isLiteral()) {
            continue;
        }
        entries[parsed->second] = triple.object.toJson();
    }
    return entries;
}

std::vector<Triple> CanonicalGraph::traceRelationships(const std::string& subject, size_t maxDepth) const {
    std::vector<Triple> result;
    std::unordered_set<std::string> visited;
    std::deque<std::pair<std::string, size_t>> frontier;

    frontier.emplace_back(subject, 0);
    visited.insert(subject);

    while (!frontier.empty()) {
        auto [current, depth] = frontier.front();
        frontier.pop_front();

        for (const auto& triple : triplesAbout(current)) {
            result.push_back(triple);
            if (!triple.object.isIdentifier() || depth >= maxDepth) {
                continue;
            }
            if (visited.insert(triple.object.value).second) {
                frontier.emplace_back(triple.object.value, depth + 1);
            }
        }
    }
    return result;
}

nlohmann::json CanonicalGraph::toJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& triple : triples_) {
        list.push_back({
            {"s", triple.subject},
            {"p", triple.predicate},
            {"o", {
                {"kind", triple.object.isIdentifier() ? "id" : "literal"},
                {"value", triple.object.value},
                {"datatype", literalTypeName(triple.object.datatype)}
            }}
        });
    }
    return nlohmann::json{{"triples", std::move(list)}};
}

CanonicalGraph CanonicalGraph::fromJson(const nlohmann::json& json) {
    CanonicalGraph graph;
    try {
        for (const auto& entry : json.at("triples")) {
            const auto& object = entry.at("o");
            Term term;
            term.kind = object.at("kind").get<std::string>() == "id" ? TermKind::IDENTIFIER : TermKind::LITERAL;
            term.value = object.at("value").get<std::string>();
            term.datatype = parseLiteralType(object.value("datatype", std::string("none")));
            graph.insert(Triple{entry.at("s").get<std::string>(), entry.at("p").get<std::string>(), std::move(term)});
        }
    } catch (const nlohmann::json::exception& e) {
        throw TransformError(std::string("Malformed canonical graph JSON: ") + e.what());
    }
    return graph;
}

std::string CanonicalGraph::toNTriples() const {
    std::ostringstream out;
    for (const auto& triple : triples_) {
        out << "<" << triple.subject << "> <" << triple.predicate << "> ";
        if (triple.object.isIdentifier()) {
            out << "<" << triple.object.value << ">";
        } else {
            out << "\"" << escapeLiteral(triple.object.value) << "\"^^" << literalTypeName(triple.object.datatype);
        }
        out << " .\n";
    }
    return out.str();
}

} // namespace core
} // namespace agentbridge
