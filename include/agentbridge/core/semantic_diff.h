#pragma once

#include "agentbridge/core/canonical_graph.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

struct PredicateBreakdown {
    std::string predicate;
    size_t leftCount{0};
    size_t rightCount{0};
    size_t commonCount{0};
    double similarity{1.0};   ///< common / union for this predicate
};

struct GraphDiff {
    std::vector<Triple> leftOnly;
    std::vector<Triple> rightOnly;
    std::vector<Triple> common;
    double similarity{1.0};   ///< |common| / |union|, 1.0 for two empty graphs
    std::vector<PredicateBreakdown> perPredicate;   ///< Ordered by predicate

    nlohmann::json toJson() const;
};

struct InformationLoss {
    double tripleRetention{1.0};
    double tripleLoss{0.0};
    double predicateRetention{1.0};
    std::vector<std::string> lostPredicates;
    std::vector<std::string> addedPredicates;
    std::vector<Triple> lostTriples;
    double overallFidelity{1.0};

    nlohmann::json toJson() const;
};

/**
 * @brief Weights of the overall fidelity blend
 */
struct FidelityWeights {
    double triple{0.7};
    double predicate{0.3};
};

/**
 * @brief Compares canonical graphs by exact triple match
 */
class SemanticDiffEngine {
public:
    explicit SemanticDiffEngine(const FidelityWeights& weights = FidelityWeights{});

    /**
     * @brief Symmetric comparison: diff(a, b).similarity == diff(b, a).similarity
     */
    GraphDiff diff(const CanonicalGraph& left, const CanonicalGraph& right) const;

    /**
     * @brief What a reconstruction kept of an original graph
     *
     * predicateRetention looks only at which predicates survive, so a
     * changed value costs triple retention but not predicate retention.
     * Triples added by the reconstruction are reported, not penalized.
     */
    InformationLoss calculateInformationLoss(const CanonicalGraph& original,
                                             const CanonicalGraph& reconstructed) const;

    /**
     * @brief Human-readable report, predicate breakdowns worst first
     */
    std::string formatReport(const GraphDiff& diff) const;

    /**
     * @brief Breakdowns sorted ascending by similarity, ties by predicate
     */
    static std::vector<PredicateBreakdown> worstFirst(const GraphDiff& diff);

private:
    FidelityWeights weights_;
};

} // namespace core
} // namespace agentbridge
