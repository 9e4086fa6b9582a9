#include "agentbridge/core/round_trip_harness.h"
#include "agentbridge/core/errors.h"
#include "agentbridge/utils/logging.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace agentbridge {
namespace core {

namespace {
    std::string escapeXml(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                case '\'': out += "&apos;"; break;
                default: out += c;
            }
        }
        return out;
    }

    std::string seconds(std::chrono::milliseconds duration) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(3) << static_cast<double>(duration.count()) / 1000.0;
        return out.str();
    }

    std::chrono::milliseconds elapsedMs(std::chrono::steady_clock::time_point started) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }

    const char* kindName(TestKind kind) {
        return kind == TestKind::ROUND_TRIP ? "round_trip" : "cross_framework";
    }
}

nlohmann::json RoundTripResult::toJson() const {
    return {
        {"name", name},
        {"kind", kindName(kind)},
        {"sourceProtocol", sourceProtocol},
        {"targetProtocol", targetProtocol},
        {"passed", passed},
        {"exactMatch", exactMatch},
        {"fidelity", fidelity},
        {"forwardFidelity", forwardFidelity},
        {"reverseFidelity", reverseFidelity},
        {"threshold", threshold},
        {"loss", loss.toJson()},
        {"errors", errors},
        {"durationMs", duration.count()}
    };
}

nlohmann::json SuiteResult::toJson() const {
    nlohmann::json cases = nlohmann::json::array();
    for (const auto& result : results) {
        cases.push_back(result.toJson());
    }
    return {
        {"name", name},
        {"passed", passed},
        {"failed", failed},
        {"meanFidelity", meanFidelity},
        {"durationMs", duration.count()},
        {"results", std::move(cases)}
    };
}

nlohmann::json Baseline::toJson() const {
    return {{"meanFidelity", meanFidelity}, {"cases", cases}};
}

Baseline Baseline::fromJson(const nlohmann::json& json) {
    Baseline baseline;
    baseline.meanFidelity = json.at("meanFidelity").get<double>();
    baseline.cases = json.value("cases", std::map<std::string, double>{});
    return baseline;
}

RoundTripHarness::RoundTripHarness(const HarnessConfig& config) : config_(config) {}

double RoundTripHarness::thresholdFor(std::optional<double> minFidelity) const {
    return minFidelity ? *minFidelity : config_.default_min_fidelity;
}

RoundTripResult RoundTripHarness::runTest(const Adapter& adapter,
                                          const nlohmann::json& sample,
                                          std::optional<double> minFidelity,
                                          const std::string& name) const {
    auto started = std::chrono::steady_clock::now();
    RoundTripResult result;
    result.name = name.empty() ? adapter.protocolId() + ".round_trip" : name;
    result.kind = TestKind::ROUND_TRIP;
    result.sourceProtocol = adapter.protocolId();
    result.targetProtocol = adapter.protocolId();
    result.threshold = thresholdFor(minFidelity);

    try {
        auto original = adapter.toCanonical(sample, TransformOptions{});
        auto rendered = adapter.fromCanonical(original.graph, TransformOptions{});

        TransformOptions sameId;
        sameId.agentId = original.agentId;
        auto reconstructed = adapter.toCanonical(rendered.native, sameId);

        result.forwardFidelity = original.report.fidelityScore;
        result.reverseFidelity = rendered.report.fidelityScore;
        result.loss = diff_.calculateInformationLoss(original.graph, reconstructed.graph);
        result.exactMatch = original.graph == reconstructed.graph;
        result.fidelity = result.loss.overallFidelity;
        result.passed = result.exactMatch || result.fidelity >= result.threshold;
    } catch (const BridgeError& e) {
        result.errors.push_back(e.what());
        result.passed = false;
    }

    result.duration = elapsedMs(started);
    XLOG_INFO("[harness] " << result.name << (result.passed ? " PASS" : " FAIL")
              << " fidelity=" << result.fidelity << " threshold=" << result.threshold);
    return result;
}

RoundTripResult RoundTripHarness::runCrossFrameworkTest(const Adapter& sourceAdapter,
                                                        const nlohmann::json& sourceData,
                                                        const Adapter& targetAdapter,
                                                        std::optional<double> minFidelity,
                                                        const std::string& name) const {
    auto started = std::chrono::steady_clock::now();
    RoundTripResult result;
    result.name = name.empty() ? sourceAdapter.protocolId() + "->" + targetAdapter.protocolId() : name;
    result.kind = TestKind::CROSS_FRAMEWORK;
    result.sourceProtocol = sourceAdapter.protocolId();
    result.targetProtocol = targetAdapter.protocolId();
    result.threshold = thresholdFor(minFidelity);

    try {
        // Stage 1-2: source -> canonical -> target native
        auto g1 = sourceAdapter.toCanonical(sourceData, TransformOptions{});
        auto targetNative = targetAdapter.fromCanonical(g1.graph, TransformOptions{});

        TransformOptions sameId;
        sameId.agentId = g1.agentId;

        // Forward: what the target protocol kept of the source graph
        auto g2 = targetAdapter.toCanonical(targetNative.native, sameId);
        InformationLoss forward = diff_.calculateInformationLoss(g1.graph, g2.graph);

        // Stage 3-4: target -> canonical -> source native, and back once more
        auto sourceNative = sourceAdapter.fromCanonical(g2.graph, TransformOptions{});
        auto g3 = sourceAdapter.toCanonical(sourceNative.native, sameId);
        InformationLoss reverse = diff_.calculateInformationLoss(g2.graph, g3.graph);

        result.forwardFidelity = forward.overallFidelity;
        result.reverseFidelity = reverse.overallFidelity;
        result.fidelity = result.forwardFidelity * result.reverseFidelity;
        result.loss = diff_.calculateInformationLoss(g1.graph, g3.graph);
        result.exactMatch = g1.graph == g3.graph;
        result.passed = result.fidelity >= result.threshold;
    } catch (const BridgeError& e) {
        result.errors.push_back(e.what());
        result.passed = false;
    }

    result.duration = elapsedMs(started);
    XLOG_INFO("[harness] " << result.name << (result.passed ? " PASS" : " FAIL")
              << " forward=" << result.forwardFidelity << " reverse=" << result.reverseFidelity
              << " threshold=" << result.threshold);
    return result;
}

SuiteResult RoundTripHarness::runSuite(const std::string& name, const std::vector<HarnessTestCase>& cases) const {
    auto started = std::chrono::steady_clock::now();
    SuiteResult suite;
    suite.name = name;

    double total = 0.0;
    for (const auto& testCase : cases) {
        if (!testCase.adapter) {
            throw std::invalid_argument("Test case " + testCase.name + " has no adapter");
        }
        RoundTripResult result = testCase.targetAdapter
            ? runCrossFrameworkTest(*testCase.adapter, testCase.sample, *testCase.targetAdapter,
                                    testCase.minFidelity, testCase.name)
            : runTest(*testCase.adapter, testCase.sample, testCase.minFidelity, testCase.name);
        total += result.fidelity;
        if (result.passed) {
            suite.passed++;
        } else {
            suite.failed++;
        }
        suite.results.push_back(std::move(result));
    }

    suite.meanFidelity = cases.empty() ? 1.0 : total / static_cast<double>(cases.size());
    suite.duration = elapsedMs(started);
    XLOG_INFO("[harness] suite " << name << ": " << suite.passed << " passed, " << suite.failed
              << " failed, mean fidelity " << suite.meanFidelity);
    return suite;
}

RegressionReport RoundTripHarness::checkRegression(const SuiteResult& suite,
                                                   const std::optional<Baseline>& baseline) const {
    RegressionReport report;
    for (const auto& result : suite.results) {
        if (!result.passed) {
            std::ostringstream message;
            message << result.name << ": fidelity " << result.fidelity
                    << " below threshold " << result.threshold;
            report.failures.push_back(message.str());
        }
    }

    if (baseline) {
        if (suite.meanFidelity < baseline->meanFidelity - config_.baseline_tolerance) {
            std::ostringstream message;
            message << "mean fidelity " << suite.meanFidelity << " regressed from baseline "
                    << baseline->meanFidelity;
            report.failures.push_back(message.str());
        }
        for (const auto& result : suite.results) {
            auto previous = baseline->cases.find(result.name);
            if (previous != baseline->cases.end() &&
                result.fidelity < previous->second - config_.baseline_tolerance) {
                std::ostringstream message;
                message << result.name << ": fidelity " << result.fidelity
                        << " regressed from baseline " << previous->second;
                report.failures.push_back(message.str());
            }
        }
    }

    report.passed = report.failures.empty();
    for (const auto& failure : report.failures) {
        XLOG_ERROR("[harness] regression: " << failure);
    }
    return report;
}

Baseline RoundTripHarness::makeBaseline(const SuiteResult& suite) {
    Baseline baseline;
    baseline.meanFidelity = suite.meanFidelity;
    for (const auto& result : suite.results) {
        baseline.cases[result.name] = result.fidelity;
    }
    return baseline;
}

Result<Baseline> RoundTripHarness::loadBaseline(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<Baseline>::failure("Cannot open baseline " + path);
    }
    try {
        nlohmann::json json;
        file >> json;
        return Baseline::fromJson(json);
    } catch (const nlohmann::json::exception& e) {
        return Result<Baseline>::failure("Malformed baseline " + path + ": " + e.what());
    }
}

Result<void> RoundTripHarness::saveBaseline(const Baseline& baseline, const std::string& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Result<void>::failure("Cannot write baseline " + path);
    }
    file << baseline.toJson().dump(2) << '\n';
    if (!file) {
        return Result<void>::failure("Write to " + path + " failed");
    }
    return Result<void>();
}

std::string RoundTripHarness::toJUnitXml(const SuiteResult& suite) {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<testsuite name=\"" << escapeXml(suite.name) << "\" tests=\"" << suite.results.size()
        << "\" failures=\"" << suite.failed << "\" time=\"" << seconds(suite.duration) << "\">\n";
    for (const auto& result : suite.results) {
        xml << "  <testcase name=\"" << escapeXml(result.name) << "\" classname=\"agentbridge."
            << kindName(result.kind) << "\" time=\"" << seconds(result.duration) << "\"";
        if (result.passed) {
            xml << "/>\n";
            continue;
        }
        std::ostringstream message;
        message << "fidelity " << result.fidelity << " below threshold " << result.threshold;
        xml << ">\n    <failure message=\"" << escapeXml(message.str()) << "\">";
        for (const auto& error : result.errors) {
            xml << escapeXml(error) << "\n";
        }
        for (const auto& predicate : result.loss.lostPredicates) {
            xml << "lost " << escapeXml(predicate) << "\n";
        }
        xml << "</failure>\n  </testcase>\n";
    }
    xml << "</testsuite>\n";
    return xml.str();
}

Result<void> RoundTripHarness::writeJUnitReport(const SuiteResult& suite, const std::string& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Result<void>::failure("Cannot write report " + path);
    }
    file << toJUnitXml(suite);
    if (!file) {
        return Result<void>::failure("Write to " + path + " failed");
    }
    return Result<void>();
}

} // namespace core
} // namespace agentbridge
