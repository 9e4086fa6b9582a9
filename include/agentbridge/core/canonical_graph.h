#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

/**
 * @brief Core vocabulary of the canonical model
 *
 * Only protocol-neutral terms live here. Anything protocol specific goes
 * into the extension namespace (see extensionPredicate()).
 */
namespace vocab {
    // Types
    inline constexpr const char* TYPE = "ab:type";
    inline constexpr const char* AGENT = "ab:Agent";
    inline constexpr const char* TOOL = "ab:Tool";

    // Identity
    inline constexpr const char* NAME = "ab:name";
    inline constexpr const char* DESCRIPTION = "ab:description";
    inline constexpr const char* VERSION = "ab:version";
    inline constexpr const char* ROLE = "ab:role";
    inline constexpr const char* GOAL = "ab:goal";
    inline constexpr const char* BACKSTORY = "ab:backstory";
    inline constexpr const char* AUTHOR = "ab:author";
    inline constexpr const char* TAG = "ab:tag";

    // Capabilities
    inline constexpr const char* HAS_TOOL = "ab:hasTool";
    inline constexpr const char* TOOL_NAME = "ab:toolName";
    inline constexpr const char* TOOL_DESCRIPTION = "ab:toolDescription";
    inline constexpr const char* TOOL_INPUT_SCHEMA = "ab:toolInputSchema";
    inline constexpr const char* CAPABILITY = "ab:capability";

    // Instructions
    inline constexpr const char* INSTRUCTION = "ab:instruction";
    inline constexpr const char* CONSTRAINT = "ab:constraint";

    // State
    inline constexpr const char* MEMORY_TYPE = "ab:memoryType";
    inline constexpr const char* MEMORY_ENABLED = "ab:memoryEnabled";

    // Execution
    inline constexpr const char* LLM_PROVIDER = "ab:llmProvider";
    inline constexpr const char* LLM_MODEL = "ab:llmModel";
    inline constexpr const char* TEMPERATURE = "ab:temperature";
    inline constexpr const char* MAX_ITERATIONS = "ab:maxIterations";
    inline constexpr const char* PROTOCOL = "ab:protocol";

    inline constexpr const char* EXTENSION_PREFIX = "ext:";
} // namespace vocab

/**
 * @brief Closed set of semantic categories every adapter maps into
 */
enum class SemanticCategory {
    IDENTITY,
    CAPABILITIES,
    INSTRUCTIONS,
    STATE,
    EXECUTION
};

const char* categoryName(SemanticCategory category);

/**
 * @brief Category of a core predicate
 * @return std::nullopt for extension predicates and unknown terms
 */
std::optional<SemanticCategory> categoryOf(const std::string& predicate);

enum class TermKind {
    IDENTIFIER,
    LITERAL
};

enum class LiteralType {
    NONE,      ///< Identifiers carry no datatype
    STRING,
    INTEGER,
    DOUBLE,
    BOOLEAN,
    JSON       ///< Compact JSON dump of a structured value
};

const char* literalTypeName(LiteralType type);
LiteralType parseLiteralType(const std::string& name);

/**
 * @brief Object position of a triple: an identifier or a typed literal
 */
struct Term {
    TermKind kind{TermKind::IDENTIFIER};
    std::string value;
    LiteralType datatype{LiteralType::NONE};

    static Term identifier(std::string id);
    static Term literal(std::string text);
    static Term literal(const char* text);
    static Term literal(int64_t number);
    static Term literal(int number) { return literal(static_cast<int64_t>(number)); }
    static Term literal(double number);
    static Term literal(bool flag);
    static Term jsonLiteral(const nlohmann::json& value);

    bool isIdentifier() const { return kind == TermKind::IDENTIFIER; }
    bool isLiteral() const { return kind == TermKind::LITERAL; }

    /**
     * @brief Convert the literal back into a JSON value of its datatype
     * @throws TransformError if the lexical form does not parse
     */
    nlohmann::json toJson() const;

    bool operator==(const Term& other) const;
    bool operator!=(const Term& other) const { return !(*this == other); }
    bool operator<(const Term& other) const;
};

/**
 * @brief Atomic statement of the canonical graph
 *
 * Equality is exact match on subject, predicate and object.
 */
struct Triple {
    std::string subject;
    std::string predicate;
    Term object;

    bool operator==(const Triple& other) const;
    bool operator!=(const Triple& other) const { return !(*this == other); }
    bool operator<(const Triple& other) const;
};

Triple literalTriple(const std::string& subject, const std::string& predicate, Term literal);
Triple objectTriple(const std::string& subject, const std::string& predicate, const std::string& objectId);

// Identifier construction, always scoped to one agent.
std::string agentIdentifier(const std::string& agentId);
std::string childIdentifier(const std::string& agentId, const std::string& kind, const std::string& local);
std::optional<std::string> agentIdFromIdentifier(const std::string& identifier);

/**
 * @brief Lower-case slug of a display name: [a-z0-9-], runs collapsed
 */
std::string slugify(const std::string& text);

// Extension namespace: "ext:<protocolId>:<fieldPath>"
std::string extensionPredicate(const std::string& protocolId, const std::string& fieldPath);
bool isExtensionPredicate(const std::string& predicate);
std::optional<std::pair<std::string, std::string>> parseExtensionPredicate(const std::string& predicate);

/**
 * @brief Unordered set of triples describing one agent at one point in time
 *
 * Iteration order is the ordering of Triple, so serialization is
 * deterministic for equal graphs.
 */
class CanonicalGraph {
public:
    using const_iterator = std::set<Triple>::const_iterator;

    CanonicalGraph() = default;

    bool insert(Triple triple);
    bool addLiteral(const std::string& subject, const std::string& predicate, Term literal);
    bool addObject(const std::string& subject, const std::string& predicate, const std::string& objectId);
    bool erase(const Triple& triple);
    bool contains(const Triple& triple) const;

    size_t size() const { return triples_.size(); }
    bool empty() const { return triples_.empty(); }
    const_iterator begin() const { return triples_.begin(); }
    const_iterator end() const { return triples_.end(); }
    const std::set<Triple>& triples() const { return triples_; }

    /**
     * @brief Subjects typed ab:Agent
     */
    std::vector<std::string> agentNodes() const;

    /**
     * @brief The single Agent-typed node
     * @throws TransformError unless exactly one node is typed ab:Agent
     */
    std::string agentNode() const;

    bool hasSingleAgent() const { return agentNodes().size() == 1; }

    std::vector<Term> objectsOf(const std::string& subject, const std::string& predicate) const;
    std::optional<Term> firstObject(const std::string& subject, const std::string& predicate) const;
    std::vector<Triple> triplesAbout(const std::string& subject) const;
    std::set<std::string> predicates() const;

    /**
     * @brief Extension entries a protocol stored on a subject, keyed by field path
     */
    std::map<std::string, nlohmann::json> extensionEntries(
        const std::string& subject,
        const std::string& protocolId) const;

    /**
     * @brief Collect the triples reachable from a subject
     *
     * Follows identifier-valued objects breadth first. A visited set and the
     * depth bound guarantee termination on cyclic graphs; depth 0 returns
     * only the subject's own triples.
     */
    std::vector<Triple> traceRelationships(const std::string& subject, size_t maxDepth) const;

    nlohmann::json toJson() const;

    /**
     * @throws TransformError on malformed input
     */
    static CanonicalGraph fromJson(const nlohmann::json& json);

    /**
     * @brief Line-oriented text form, one "<s> <p> <o> ." statement per line
     */
    std::string toNTriples() const;

    bool operator==(const CanonicalGraph& other) const { return triples_ == other.triples_; }
    bool operator!=(const CanonicalGraph& other) const { return !(*this == other); }

private:
    std::set<Triple> triples_;
};

} // namespace core
} // namespace agentbridge
