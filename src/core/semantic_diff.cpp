#include "agentbridge/core/semantic_diff.h"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>

namespace agentbridge {
namespace core {

namespace {
    nlohmann::json triplesToJson(const std::vector<Triple>& triples) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& triple : triples) {
            array.push_back({{"s", triple.subject}, {"p", triple.predicate}, {"o", triple.object.value}});
        }
        return array;
    }

    double ratio(size_t part, size_t whole) {
        return whole == 0 ? 1.0 : static_cast<double>(part) / static_cast<double>(whole);
    }
}

nlohmann::json GraphDiff::toJson() const {
    nlohmann::json breakdown = nlohmann::json::array();
    for (const auto& entry : perPredicate) {
        breakdown.push_back({
            {"predicate", entry.predicate},
            {"left", entry.leftCount},
            {"right", entry.rightCount},
            {"common", entry.commonCount},
            {"similarity", entry.similarity}
        });
    }
    return {
        {"similarity", similarity},
        {"leftOnly", triplesToJson(leftOnly)},
        {"rightOnly", triplesToJson(rightOnly)},
        {"commonCount", common.size()},
        {"perPredicate", std::move(breakdown)}
    };
}

nlohmann::json InformationLoss::toJson() const {
    return {
        {"tripleRetention", tripleRetention},
        {"tripleLoss", tripleLoss},
        {"predicateRetention", predicateRetention},
        {"lostPredicates", lostPredicates},
        {"addedPredicates", addedPredicates},
        {"lostTriples", triplesToJson(lostTriples)},
        {"overallFidelity", overallFidelity}
    };
}

SemanticDiffEngine::SemanticDiffEngine(const FidelityWeights& weights) : weights_(weights) {
    if (weights_.triple < 0.0 || weights_.predicate < 0.0 || weights_.triple + weights_.predicate <= 0.0) {
        throw std::invalid_argument("Fidelity weights must be non-negative and not both zero");
    }
}

GraphDiff SemanticDiffEngine::diff(const CanonicalGraph& left, const CanonicalGraph& right) const {
    GraphDiff result;
    const auto& a = left.triples();
    const auto& b = right.triples();

    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result.common));
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result.leftOnly));
    std::set_difference(b.begin(), b.end(), a.begin(), a.end(), std::back_inserter(result.rightOnly));

    const size_t unionSize = result.common.size() + result.leftOnly.size() + result.rightOnly.size();
    result.similarity = ratio(result.common.size(), unionSize);

    std::map<std::string, PredicateBreakdown> byPredicate;
    auto entryFor = [&byPredicate](const std::string& predicate) -> PredicateBreakdown& {
        auto& entry = byPredicate[predicate];
        entry.predicate = predicate;
        return entry;
    };
    for (const auto& triple : result.common) {
        auto& entry = entryFor(triple.predicate);
        entry.leftCount++;
        entry.rightCount++;
        entry.commonCount++;
    }
    for (const auto& triple : result.leftOnly) {
        entryFor(triple.predicate).leftCount++;
    }
    for (const auto& triple : result.rightOnly) {
        entryFor(triple.predicate).rightCount++;
    }
    for (auto& [predicate, entry] : byPredicate) {
        size_t predicateUnion = entry.leftCount + entry.rightCount - entry.commonCount;
        entry.similarity = ratio(entry.commonCount, predicateUnion);
        result.perPredicate.push_back(entry);
    }
    return result;
}

InformationLoss SemanticDiffEngine::calculateInformationLoss(const CanonicalGraph& original,
                                                             const CanonicalGraph& reconstructed) const {
    InformationLoss loss;
    if (original.empty()) {
        auto added = reconstructed.predicates();
        loss.addedPredicates.assign(added.begin(), added.end());
        return loss;
    }

    const auto& a = original.triples();
    const auto& b = reconstructed.triples();
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(loss.lostTriples));
    const size_t retained = a.size() - loss.lostTriples.size();
    loss.tripleRetention = ratio(retained, a.size());
    loss.tripleLoss = 1.0 - loss.tripleRetention;

    const auto originalPredicates = original.predicates();
    const auto reconstructedPredicates = reconstructed.predicates();
    std::set_difference(originalPredicates.begin(), originalPredicates.end(),
                        reconstructedPredicates.begin(), reconstructedPredicates.end(),
                        std::back_inserter(loss.lostPredicates));
    std::set_difference(reconstructedPredicates.begin(), reconstructedPredicates.end(),
                        originalPredicates.begin(), originalPredicates.end(),
                        std::back_inserter(loss.addedPredicates));
    loss.predicateRetention = ratio(originalPredicates.size() - loss.lostPredicates.size(),
                                    originalPredicates.size());

    loss.overallFidelity = (weights_.triple * loss.tripleRetention +
                            weights_.predicate * loss.predicateRetention) /
                           (weights_.triple + weights_.predicate);
    return loss;
}

std::vector<PredicateBreakdown> SemanticDiffEngine::worstFirst(const GraphDiff& diff) {
    std::vector<PredicateBreakdown> sorted = diff.perPredicate;
    std::sort(sorted.begin(), sorted.end(), [](const PredicateBreakdown& a, const PredicateBreakdown& b) {
        if (a.similarity != b.similarity) {
            return a.similarity < b.similarity;
        }
        return a.predicate < b.predicate;
    });
    return sorted;
}

std::string SemanticDiffEngine::formatReport(const GraphDiff& diff) const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    out << "Similarity: " << diff.similarity
        << " (common " << diff.common.size()
        << ", left only " << diff.leftOnly.size()
        << ", right only " << diff.rightOnly.size() << ")\n";
    for (const auto& entry : worstFirst(diff)) {
        out << "  " << std::left << std::setw(28) << entry.predicate << std::right
            << " similarity " << entry.similarity
            << "  left " << entry.leftCount
            << "  right " << entry.rightCount
            << "  common " << entry.commonCount << "\n";
    }
    return out.str();
}

} // namespace core
} // namespace agentbridge
