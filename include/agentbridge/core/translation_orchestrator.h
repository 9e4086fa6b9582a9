#pragma once

#include "agentbridge/core/adapter_registry.h"
#include "agentbridge/core/agent_adapter.h"
#include "agentbridge/core/canonical_store.h"
#include "agentbridge/core/errors.h"
#include "agentbridge/core/translation_cache.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

struct TranslateOptions {
    bool useCache{false};
    bool persist{false};
    bool validate{false};   ///< Run the source adapter's validate() first
    bool strict{false};     ///< With validate, treat validation warnings as errors
    std::optional<double> maxFidelityLoss;          ///< Reject forward fidelity below 1 - loss
    std::optional<std::chrono::milliseconds> timeout;   ///< Per adapter stage
};

struct TranslationRequest {
    std::optional<std::string> agentId;
    std::string sourceFormat;
    std::string targetFormat;
    nlohmann::json sourceData;
    TranslateOptions options;

    NativePayload payload() const { return NativePayload{sourceFormat, sourceData}; }
};

struct ResponseIssue {
    ErrorCode code;
    std::string message;
};

struct TranslationResponse {
    bool success{false};
    std::string agentId;
    std::string sourceFormat;
    std::string targetFormat;
    nlohmann::json targetData;
    std::optional<TransformReport> forwardReport;
    std::optional<TransformReport> reverseReport;
    double totalFidelity{0.0};
    std::optional<uint64_t> version;   ///< Snapshot written or read, if any
    bool fromCache{false};
    std::vector<ResponseIssue> errors;
    std::vector<std::string> warnings;
    std::chrono::milliseconds duration{0};

    bool hasError(ErrorCode code) const;

    nlohmann::json toJson() const;

    /**
     * @throws TransformError on malformed input
     */
    static TranslationResponse fromJson(const nlohmann::json& json);
};

struct ChainResponse {
    bool success{false};
    std::string agentId;
    nlohmann::json targetData;
    double cumulativeFidelity{0.0};   ///< Product of the hops' totalFidelity
    std::optional<uint64_t> version;
    std::vector<TranslationResponse> hops;
    std::vector<ResponseIssue> errors;
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

struct OrchestratorConfig {
    bool enable_cache{true};
    double min_fidelity_warning{0.8};   ///< Warn when totalFidelity falls below
    std::optional<std::chrono::milliseconds> default_timeout;
};

struct CompatibilityEntry {
    size_t count{0};
    double meanFidelity{0.0};
};

/**
 * @brief Executes single-hop and multi-hop translations
 *
 * The orchestrator only ever carries native payloads as opaque JSON tagged
 * with their protocol id. Registry, store and cache are injected, so several
 * isolated orchestrators can share or separate them.
 *
 * translate() reports data-quality problems inside the response. It throws
 * std::invalid_argument for malformed requests, AdapterNotFoundError when a
 * protocol is unavailable, and StoreError when persistence keeps failing.
 *
 * A stage abandoned after a timeout keeps running on its own thread; the
 * destructor waits for all such stages.
 */
class TranslationOrchestrator {
public:
    /**
     * @param cache May be null to disable caching
     */
    TranslationOrchestrator(std::shared_ptr<AdapterRegistry> registry,
                            std::shared_ptr<CanonicalStore> store,
                            std::shared_ptr<TranslationCache> cache = nullptr,
                            const OrchestratorConfig& config = OrchestratorConfig{});
    ~TranslationOrchestrator();

    TranslationOrchestrator(const TranslationOrchestrator&) = delete;
    TranslationOrchestrator& operator=(const TranslationOrchestrator&) = delete;

    TranslationResponse translate(const TranslationRequest& request);

    /**
     * @brief Render a stored snapshot through the target adapter only
     */
    TranslationResponse translateFromStore(const std::string& agentId,
                                           const std::string& targetFormat,
                                           std::optional<uint64_t> version = std::nullopt,
                                           const TranslateOptions& options = TranslateOptions{});

    /**
     * @brief Pairwise translate() along formats[0] -> ... -> formats[N]
     *
     * Persistence applies to the final hop only. The first failing hop ends
     * the chain; issues of all executed hops are kept.
     * @throws std::invalid_argument for fewer than two formats
     */
    ChainResponse translateChain(const nlohmann::json& sourceData,
                                 const std::vector<std::string>& formats,
                                 const TranslateOptions& options = TranslateOptions{},
                                 const std::optional<std::string>& agentId = std::nullopt);

    /**
     * @throws AdapterNotFoundError, TransformError
     */
    CanonicalResult toCanonical(const NativePayload& payload,
                                const TransformOptions& options = TransformOptions{}) const;
    NativeResult fromCanonical(const CanonicalGraph& graph,
                               const std::string& targetFormat,
                               const TransformOptions& options = TransformOptions{}) const;

    /**
     * @brief Commit a snapshot and drop cached translations of the agent
     *
     * A StoreError is retried once with a fresh version lookup.
     * @throws StoreError if the retry fails as well
     */
    SnapshotRef commitSnapshot(const std::string& agentId,
                               const CanonicalGraph& graph,
                               const SnapshotMetadata& metadata);

    std::optional<CompatibilityEntry> getCompatibility(const std::string& sourceFormat,
                                                       const std::string& targetFormat) const;
    std::map<std::pair<std::string, std::string>, CompatibilityEntry> getCompatibilityMatrix() const;

    const OrchestratorConfig& config() const { return config_; }

private:
    std::shared_ptr<Adapter> requireAdapter(const std::string& protocolId) const;
    std::optional<std::chrono::milliseconds> stageTimeout(const TranslateOptions& options) const;
    void recordActivity(const TranslationResponse& response, std::chrono::steady_clock::time_point started);
    void updateCompatibility(const std::string& sourceFormat, const std::string& targetFormat, double fidelity);

    // Runs fn, giving up after timeout; the abandoned worker is kept for the destructor.
    template <typename Fn>
    auto runStage(Fn fn, std::optional<std::chrono::milliseconds> timeout, const std::string& stage)
        -> decltype(fn());

    std::shared_ptr<AdapterRegistry> registry_;
    std::shared_ptr<CanonicalStore> store_;
    std::shared_ptr<TranslationCache> cache_;
    OrchestratorConfig config_;

    mutable std::mutex compatibilityMutex_;
    std::map<std::pair<std::string, std::string>, CompatibilityEntry> compatibility_;

    std::mutex abandonedMutex_;
    std::vector<std::thread> abandoned_;
};

} // namespace core
} // namespace agentbridge
