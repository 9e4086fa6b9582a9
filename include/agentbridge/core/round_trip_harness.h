#pragma once

#include "agentbridge/core/agent_adapter.h"
#include "agentbridge/core/semantic_diff.h"
#include "agentbridge/utils/result.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

struct HarnessConfig {
    double default_min_fidelity{0.95};
    double baseline_tolerance{0.01};   ///< Allowed drop of mean fidelity against the baseline
};

enum class TestKind {
    ROUND_TRIP,
    CROSS_FRAMEWORK
};

struct RoundTripResult {
    std::string name;
    TestKind kind{TestKind::ROUND_TRIP};
    std::string sourceProtocol;
    std::string targetProtocol;   ///< Equals sourceProtocol for round trips
    bool passed{false};
    bool exactMatch{false};
    double fidelity{0.0};
    double forwardFidelity{0.0};
    double reverseFidelity{0.0};
    double threshold{0.0};
    InformationLoss loss;
    std::vector<std::string> errors;
    std::chrono::milliseconds duration{0};

    nlohmann::json toJson() const;
};

/**
 * @brief One case of a suite; a null targetAdapter makes it a round trip
 */
struct HarnessTestCase {
    std::string name;
    std::shared_ptr<Adapter> adapter;
    nlohmann::json sample;
    std::optional<double> minFidelity;
    std::shared_ptr<Adapter> targetAdapter;
};

struct SuiteResult {
    std::string name;
    std::vector<RoundTripResult> results;
    size_t passed{0};
    size_t failed{0};
    double meanFidelity{0.0};
    std::chrono::milliseconds duration{0};

    bool allPassed() const { return failed == 0; }
    nlohmann::json toJson() const;
};

/**
 * @brief Stored fidelity figures of a previous suite run
 */
struct Baseline {
    double meanFidelity{0.0};
    std::map<std::string, double> cases;

    nlohmann::json toJson() const;
    static Baseline fromJson(const nlohmann::json& json);
};

struct RegressionReport {
    bool passed{true};
    std::vector<std::string> failures;
};

/**
 * @brief Checks adapters and adapter pairs against fidelity thresholds
 *
 * Both graphs of a comparison are always produced by the same adapter's
 * toCanonical(), so differences come from the translation and not from
 * two adapters modelling the same field differently.
 */
class RoundTripHarness {
public:
    explicit RoundTripHarness(const HarnessConfig& config = HarnessConfig{});

    /**
     * @brief native -> canonical -> native' -> canonical, compared by information loss
     *
     * Passes if the fidelity meets the threshold or both graphs are equal.
     */
    RoundTripResult runTest(const Adapter& adapter,
                            const nlohmann::json& sample,
                            std::optional<double> minFidelity = std::nullopt,
                            const std::string& name = "") const;

    /**
     * @brief source -> canonical -> target -> canonical -> source
     *
     * Forward and reverse fidelity are measured independently; their
     * product must meet the threshold.
     */
    RoundTripResult runCrossFrameworkTest(const Adapter& sourceAdapter,
                                          const nlohmann::json& sourceData,
                                          const Adapter& targetAdapter,
                                          std::optional<double> minFidelity = std::nullopt,
                                          const std::string& name = "") const;

    SuiteResult runSuite(const std::string& name, const std::vector<HarnessTestCase>& cases) const;

    /**
     * @brief Fails on any case below its threshold or a drop against the baseline
     */
    RegressionReport checkRegression(const SuiteResult& suite, const std::optional<Baseline>& baseline) const;

    static Baseline makeBaseline(const SuiteResult& suite);
    static Result<Baseline> loadBaseline(const std::string& path);
    static Result<void> saveBaseline(const Baseline& baseline, const std::string& path);

    /**
     * @brief JUnit-style XML, one testcase per result, failure only below threshold
     */
    static std::string toJUnitXml(const SuiteResult& suite);
    static Result<void> writeJUnitReport(const SuiteResult& suite, const std::string& path);

    const HarnessConfig& config() const { return config_; }

private:
    double thresholdFor(std::optional<double> minFidelity) const;

    HarnessConfig config_;
    SemanticDiffEngine diff_;
};

} // namespace core
} // namespace agentbridge
