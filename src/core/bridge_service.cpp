#include "agentbridge/core/bridge_service.h"
#include "agentbridge/utils/logging.hpp"
#include <chrono>

namespace agentbridge {
namespace core {

namespace {
    int64_t toMillis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
}

nlohmann::json ImportResult::toJson() const {
    nlohmann::json errorsJson = nlohmann::json::array();
    for (const auto& issue : errors) {
        errorsJson.push_back({{"code", errorCodeName(issue.code)}, {"message", issue.message}});
    }
    return {
        {"success", success},
        {"agentId", agentId},
        {"version", version ? nlohmann::json(*version) : nlohmann::json()},
        {"fidelity", fidelity},
        {"report", report ? report->toJson() : nlohmann::json()},
        {"errors", std::move(errorsJson)},
        {"warnings", warnings}
    };
}

nlohmann::json AgentDetails::toJson() const {
    nlohmann::json historyJson = nlohmann::json::array();
    for (const auto& entry : history) {
        historyJson.push_back({
            {"version", entry.version},
            {"timestamp", toMillis(entry.timestamp)},
            {"sourceFormat", entry.sourceFormat},
            {"fidelity", entry.fidelity},
            {"compacted", entry.compacted}
        });
    }
    return {
        {"summary", summary.toJson()},
        {"history", std::move(historyJson)},
        {"graph", graph.toJson()}
    };
}

BridgeService::BridgeService(const BridgeConfig& config)
    : BridgeService(config, std::make_shared<CanonicalStore>(config.store)) {}

BridgeService::BridgeService(const BridgeConfig& config, std::shared_ptr<CanonicalStore> store)
    : config_(config),
      registry_(std::make_shared<AdapterRegistry>()),
      store_(std::move(store)),
      cache_(std::make_shared<TranslationCache>(config.cache)),
      orchestrator_(std::make_shared<TranslationOrchestrator>(registry_, store_, cache_, config.orchestrator)) {}

void BridgeService::registerAdapter(std::shared_ptr<Adapter> adapter, const AdapterRegistration& registration) {
    registry_->registerAdapter(std::move(adapter), registration);
}

std::vector<AgentSummary> BridgeService::listAgents(size_t limit, size_t offset) const {
    return store_->listAgents(limit, offset);
}

std::optional<AgentDetails> BridgeService::getAgent(const std::string& agentId) const {
    auto snapshot = store_->getAgentSnapshot(agentId);
    if (!snapshot) {
        return std::nullopt;
    }
    AgentDetails details;
    if (auto summary = store_->getAgentSummary(agentId)) {
        details.summary = std::move(*summary);
    }
    details.history = store_->getAgentHistory(agentId);
    details.graph = std::move(snapshot->graph);
    return details;
}

ImportResult BridgeService::importAgent(const std::string& sourceFormat,
                                        const nlohmann::json& data,
                                        const std::optional<std::string>& agentId) {
    auto started = std::chrono::steady_clock::now();
    ImportResult result;

    TranslationActivity activity;
    activity.sourceFormat = sourceFormat;
    activity.targetFormat = "canonical";
    activity.agentId = agentId.value_or("");

    auto finish = [&]() {
        activity.success = result.success;
        activity.fidelityScore = result.success ? result.fidelity : 0.0;
        activity.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        store_->recordTranslation(activity);
        return result;
    };

    TransformOptions options;
    options.agentId = agentId;
    CanonicalResult canonical;
    try {
        canonical = orchestrator_->toCanonical(NativePayload{sourceFormat, data}, options);
    } catch (const TransformError& e) {
        result.errors.push_back({ErrorCode::TRANSFORM, e.what()});
        XLOG_WARN("[service] import from " << sourceFormat << " failed: " << e.what());
        return finish();
    } catch (const AdapterNotFoundError& e) {
        result.errors.push_back({ErrorCode::ADAPTER_NOT_FOUND, e.what()});
        finish();
        throw;
    }

    result.agentId = canonical.agentId;
    activity.agentId = canonical.agentId;
    result.fidelity = canonical.report.fidelityScore;
    result.warnings = canonical.report.warnings;
    for (const auto& lossy : canonical.report.lossyMappings) {
        activity.lostFields.push_back(lossy.path);
    }
    result.report = canonical.report;
    if (!canonical.report.success) {
        for (const auto& error : canonical.report.errors) {
            result.errors.push_back({ErrorCode::TRANSFORM, error});
        }
        result.errors.push_back({ErrorCode::TRANSFORM, sourceFormat + " transform reported failure"});
        XLOG_WARN("[service] import of " << canonical.agentId << " from " << sourceFormat
                  << " rejected: transform reported failure");
        return finish();
    }

    SnapshotMetadata metadata;
    metadata.sourceFormat = sourceFormat;
    metadata.fidelity = result.fidelity;
    try {
        result.version = orchestrator_->commitSnapshot(canonical.agentId, canonical.graph, metadata).version;
    } catch (const StoreError& e) {
        result.errors.push_back({ErrorCode::STORE, e.what()});
        finish();
        throw;
    }
    registry_->recordUsage(sourceFormat, result.fidelity);

    result.success = true;
    return finish();
}

TranslationResponse BridgeService::exportAgent(const std::string& agentId,
                                               const std::string& targetFormat,
                                               std::optional<uint64_t> version,
                                               ExportFormat format) {
    if (format == ExportFormat::NATIVE) {
        return orchestrator_->translateFromStore(agentId, targetFormat, version);
    }

    TranslationResponse response;
    response.agentId = agentId;
    response.sourceFormat = "canonical";
    response.targetFormat = "ntriples";
    auto snapshot = store_->getAgentSnapshot(agentId, version);
    if (!snapshot) {
        response.errors.push_back({ErrorCode::STORE, "No stored snapshot for " + agentId});
        return response;
    }
    response.success = true;
    response.version = snapshot->version;
    response.targetData = snapshot->graph.toNTriples();
    response.totalFidelity = 1.0;
    return response;
}

std::vector<AgentSummary> BridgeService::discoverAgents(const DiscoveryCriteria& criteria) const {
    return store_->discoverAgents(criteria);
}

bool BridgeService::deleteAgent(const std::string& agentId) {
    bool deleted = store_->deleteAgent(agentId);
    cache_->invalidate(agentId);
    return deleted;
}

size_t BridgeService::compact() {
    size_t pruned = store_->compact();
    if (pruned > 0) {
        // Cached responses may name pruned versions
        cache_->clear();
    }
    return pruned;
}

TranslationResponse BridgeService::translate(const TranslationRequest& request) {
    return orchestrator_->translate(request);
}

nlohmann::json BridgeService::getStats() const {
    nlohmann::json compatibility = nlohmann::json::array();
    for (const auto& [pair, entry] : orchestrator_->getCompatibilityMatrix()) {
        compatibility.push_back({
            {"source", pair.first},
            {"target", pair.second},
            {"count", entry.count},
            {"meanFidelity", entry.meanFidelity}
        });
    }
    nlohmann::json adapters = nlohmann::json::array();
    for (const auto& protocol : registry_->listProtocols()) {
        nlohmann::json adapter = {{"protocol", protocol}, {"enabled", registry_->isEnabled(protocol)}};
        if (auto usage = registry_->getUsage(protocol)) {
            adapter["usageCount"] = usage->count;
            adapter["meanFidelity"] = usage->meanFidelity;
        }
        adapters.push_back(std::move(adapter));
    }
    return {
        {"store", store_->getStats().toJson()},
        {"cache", cache_->getStats().toJson()},
        {"registry", {
            {"registered", registry_->size()},
            {"enabled", registry_->enabledCount()},
            {"adapters", std::move(adapters)}
        }},
        {"compatibility", std::move(compatibility)}
    };
}

} // namespace core
} // namespace agentbridge
