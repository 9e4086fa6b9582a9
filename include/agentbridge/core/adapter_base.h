#pragma once

#include "agentbridge/core/agent_adapter.h"
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentbridge {
namespace core {

/**
 * @brief Shared bookkeeping for hand-written adapters
 *
 * Concrete adapters describe their mapping through ForwardMapping and
 * ReverseMapping; both keep the field accounting that feeds the fidelity
 * self-report, so every adapter scores itself the same way.
 */
class AdapterBase : public Adapter {
public:
    static constexpr double EXTENSION_WEIGHT = 0.9;
    static constexpr double LOSSY_WEIGHT = 0.5;

    /**
     * @brief (mapped + 0.9 * preserved + 0.5 * lossy) / total, 1.0 when total is 0
     */
    static double computeFidelity(size_t mapped, size_t preserved, size_t lossy, size_t dropped = 0);

protected:
    /**
     * @brief Builds the canonical graph for one native description
     */
    class ForwardMapping {
    public:
        ForwardMapping(std::string protocolId, std::string agentId);

        const std::string& agentId() const { return agentId_; }
        const std::string& agentNode() const { return agentNode_; }

        /**
         * @brief Map a native field to a literal on the agent node
         */
        void mapLiteral(const std::string& path, const std::string& predicate, Term literal);

        /**
         * @brief Map a native field to a literal on another node
         */
        void mapLiteralOn(const std::string& subject, const std::string& path,
                          const std::string& predicate, Term literal);

        /**
         * @brief Create a typed child node linked from the agent node
         * @return Identifier of the child
         */
        std::string addChild(const std::string& kind, const std::string& local,
                             const std::string& typeId, const std::string& linkPredicate);

        /**
         * @brief Add an ab:Tool child carrying its name
         * @return std::nullopt (and a lossy entry) for an empty or duplicate name
         */
        std::optional<std::string> addTool(const std::string& path, const std::string& name);

        /**
         * @brief Preserve a field with no canonical equivalent in the extension namespace
         */
        void preserve(const std::string& path, const nlohmann::json& value, const std::string& reason);
        void preserveOn(const std::string& subject, const std::string& extensionKey,
                        const std::string& path, const nlohmann::json& value, const std::string& reason);

        void lossy(const std::string& path, const std::string& reason);
        void warn(const std::string& message);

        CanonicalResult finish(std::chrono::steady_clock::time_point started);

    private:
        std::string protocolId_;
        std::string agentId_;
        std::string agentNode_;
        CanonicalGraph graph_;
        TransformReport report_;
        std::set<std::string> tools_;
    };

    /**
     * @brief Tool node as read back from a graph
     */
    struct ToolView {
        std::string node;
        std::string name;
        std::optional<std::string> description;
        std::optional<nlohmann::json> inputSchema;
        std::map<std::string, nlohmann::json> extensions;

        /**
         * @brief Whether the tool is fully described by its name
         */
        bool nameOnly() const { return !description && !inputSchema && extensions.empty(); }
    };

    /**
     * @brief Tracks which triples of a graph a reverse transform consumed
     */
    class ReverseMapping {
    public:
        /**
         * @throws TransformError if the graph has no single Agent node
         */
        ReverseMapping(const CanonicalGraph& graph, std::string protocolId);

        const CanonicalGraph& graph() const { return graph_; }
        const std::string& agentNode() const { return agentNode_; }
        std::string agentId() const;

        std::optional<Term> take(const std::string& subject, const std::string& predicate);
        std::vector<Term> takeAll(const std::string& subject, const std::string& predicate);

        /**
         * @brief Consume and return this protocol's extension entries on a subject
         */
        std::map<std::string, nlohmann::json> takeExtensions(const std::string& subject);

        /**
         * @brief Consume every ab:hasTool link of the agent and the tool nodes behind it
         *
         * Protocols without tool schemas pass false so the schemas are
         * reported as lost.
         */
        std::vector<ToolView> takeTools(bool withInputSchema = true);

        /**
         * @brief take() a string literal, nullopt if absent or not a string
         */
        std::optional<std::string> takeString(const std::string& subject, const std::string& predicate);

        void markMapped(const std::string& field);
        void lossy(const std::string& path, const std::string& reason);
        void warn(const std::string& message);

        /**
         * @brief Score consumed / total triples and report the rest as lossy
         */
        NativeResult finish(nlohmann::json native, std::chrono::steady_clock::time_point started);

    private:
        const CanonicalGraph& graph_;
        std::string protocolId_;
        std::string agentNode_;
        std::set<Triple> consumed_;
        TransformReport report_;
    };

    /**
     * @brief Assign value at a dotted path ("llmConfig.maxTokens"), creating objects
     */
    static void assignPath(nlohmann::json& target, const std::string& dottedPath, const nlohmann::json& value);

    static std::string stringValue(const Term& term) { return term.value; }
};

} // namespace core
} // namespace agentbridge
