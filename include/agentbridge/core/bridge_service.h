#pragma once

#include "agentbridge/core/adapter_registry.h"
#include "agentbridge/core/bridge_config.h"
#include "agentbridge/core/canonical_store.h"
#include "agentbridge/core/translation_cache.h"
#include "agentbridge/core/translation_orchestrator.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

enum class ExportFormat {
    NATIVE,     ///< Rendered by the target protocol's adapter
    NTRIPLES    ///< Canonical graph as N-Triples text
};

struct ImportResult {
    bool success{false};
    std::string agentId;
    std::optional<uint64_t> version;
    double fidelity{0.0};
    std::optional<TransformReport> report;
    std::vector<ResponseIssue> errors;
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

struct AgentDetails {
    AgentSummary summary;
    std::vector<HistoryEntry> history;
    CanonicalGraph graph;   ///< Latest version

    nlohmann::json toJson() const;
};

/**
 * @brief Store-facing API of the bridge for tooling
 *
 * Owns one registry, store, cache and orchestrator built from a
 * BridgeConfig. Concrete adapters are wired in by the host through
 * registerAdapter(). The logging level is process-wide and is applied by
 * the host with applyLogConfig(), not by the service.
 */
class BridgeService {
public:
    explicit BridgeService(const BridgeConfig& config = BridgeConfig{});

    /**
     * @brief Use an existing store instead of one built from config.store
     */
    BridgeService(const BridgeConfig& config, std::shared_ptr<CanonicalStore> store);

    BridgeService(const BridgeService&) = delete;
    BridgeService& operator=(const BridgeService&) = delete;

    void registerAdapter(std::shared_ptr<Adapter> adapter, const AdapterRegistration& registration = {});

    std::vector<AgentSummary> listAgents(size_t limit = 0, size_t offset = 0) const;
    std::optional<AgentDetails> getAgent(const std::string& agentId) const;

    /**
     * @brief Translate a native description to canonical form and store it
     * @throws AdapterNotFoundError, StoreError
     */
    ImportResult importAgent(const std::string& sourceFormat,
                             const nlohmann::json& data,
                             const std::optional<std::string>& agentId = std::nullopt);

    /**
     * @brief Render a stored agent; NTRIPLES ignores targetFormat
     */
    TranslationResponse exportAgent(const std::string& agentId,
                                    const std::string& targetFormat,
                                    std::optional<uint64_t> version = std::nullopt,
                                    ExportFormat format = ExportFormat::NATIVE);

    std::vector<AgentSummary> discoverAgents(const DiscoveryCriteria& criteria) const;

    /**
     * @brief Remove a stored agent together with its cached translations
     * @return false if the agent is unknown
     */
    bool deleteAgent(const std::string& agentId);

    /**
     * @brief Apply the store's retention policy
     * @return Number of snapshot bodies pruned
     */
    size_t compact();

    TranslationResponse translate(const TranslationRequest& request);

    /**
     * @brief Combined store, cache, registry and compatibility figures
     */
    nlohmann::json getStats() const;

    const BridgeConfig& config() const { return config_; }
    std::shared_ptr<AdapterRegistry> registry() const { return registry_; }
    std::shared_ptr<CanonicalStore> store() const { return store_; }
    std::shared_ptr<TranslationCache> cache() const { return cache_; }
    std::shared_ptr<TranslationOrchestrator> orchestrator() const { return orchestrator_; }

private:
    BridgeConfig config_;
    std::shared_ptr<AdapterRegistry> registry_;
    std::shared_ptr<CanonicalStore> store_;
    std::shared_ptr<TranslationCache> cache_;
    std::shared_ptr<TranslationOrchestrator> orchestrator_;
};

} // namespace core
} // namespace agentbridge
