#include "agentbridge/core/translation_orchestrator.h"
#include "agentbridge/utils/logging.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

namespace agentbridge {
namespace core {

namespace {
    nlohmann::json issuesToJson(const std::vector<ResponseIssue>& issues) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& issue : issues) {
            array.push_back({{"code", errorCodeName(issue.code)}, {"message", issue.message}});
        }
        return array;
    }

    std::chrono::milliseconds elapsedMs(std::chrono::steady_clock::time_point started) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }
}

// --- Responses ---

bool TranslationResponse::hasError(ErrorCode code) const {
    return std::any_of(errors.begin(), errors.end(),
                       [code](const ResponseIssue& issue) { return issue.code == code; });
}

nlohmann::json TranslationResponse::toJson() const {
    nlohmann::json json = {
        {"success", success},
        {"agentId", agentId},
        {"sourceFormat", sourceFormat},
        {"targetFormat", targetFormat},
        {"targetData", targetData},
        {"forwardReport", forwardReport ? forwardReport->toJson() : nlohmann::json()},
        {"reverseReport", reverseReport ? reverseReport->toJson() : nlohmann::json()},
        {"totalFidelity", totalFidelity},
        {"version", version ? nlohmann::json(*version) : nlohmann::json()},
        {"fromCache", fromCache},
        {"errors", issuesToJson(errors)},
        {"warnings", warnings},
        {"durationMs", duration.count()}
    };
    return json;
}

TranslationResponse TranslationResponse::fromJson(const nlohmann::json& json) {
    TranslationResponse response;
    try {
        response.success = json.at("success").get<bool>();
        response.agentId = json.value("agentId", "");
        response.sourceFormat = json.at("sourceFormat").get<std::string>();
        response.targetFormat = json.at("targetFormat").get<std::string>();
        response.targetData = json.value("targetData", nlohmann::json());
        if (json.contains("forwardReport") && !json["forwardReport"].is_null()) {
            response.forwardReport = TransformReport::fromJson(json["forwardReport"]);
        }
        if (json.contains("reverseReport") && !json["reverseReport"].is_null()) {
            response.reverseReport = TransformReport::fromJson(json["reverseReport"]);
        }
        response.totalFidelity = json.value("totalFidelity", 0.0);
        if (json.contains("version") && !json["version"].is_null()) {
            response.version = json["version"].get<uint64_t>();
        }
        response.fromCache = json.value("fromCache", false);
        for (const auto& issue : json.value("errors", nlohmann::json::array())) {
            response.errors.push_back({parseErrorCode(issue.at("code").get<std::string>()),
                                       issue.at("message").get<std::string>()});
        }
        response.warnings = json.value("warnings", std::vector<std::string>{});
        response.duration = std::chrono::milliseconds(json.value("durationMs", int64_t{0}));
    } catch (const nlohmann::json::exception& e) {
        throw TransformError(std::string("Malformed translation response: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw TransformError(std::string("Malformed translation response: ") + e.what());
    }
    return response;
}

nlohmann::json ChainResponse::toJson() const {
    nlohmann::json hopsJson = nlohmann::json::array();
    for (const auto& hop : hops) {
        hopsJson.push_back(hop.toJson());
    }
    return {
        {"success", success},
        {"agentId", agentId},
        {"targetData", targetData},
        {"cumulativeFidelity", cumulativeFidelity},
        {"version", version ? nlohmann::json(*version) : nlohmann::json()},
        {"hops", std::move(hopsJson)},
        {"errors", issuesToJson(errors)},
        {"warnings", warnings}
    };
}

// --- TranslationOrchestrator ---

template <typename Fn>
auto TranslationOrchestrator::runStage(Fn fn, std::optional<std::chrono::milliseconds> timeout,
                                       const std::string& stage) -> decltype(fn()) {
    using R = decltype(fn());
    if (!timeout) {
        return fn();
    }
    // The worker owns everything it touches through the captured shared pointers.
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto future = task->get_future();
    std::thread worker([task] { (*task)(); });
    if (future.wait_for(*timeout) == std::future_status::timeout) {
        {
            std::lock_guard<std::mutex> lock(abandonedMutex_);
            abandoned_.push_back(std::move(worker));
        }
        throw TimeoutError(stage + " exceeded " + std::to_string(timeout->count()) + " ms");
    }
    worker.join();
    return future.get();
}

TranslationOrchestrator::TranslationOrchestrator(std::shared_ptr<AdapterRegistry> registry,
                                                 std::shared_ptr<CanonicalStore> store,
                                                 std::shared_ptr<TranslationCache> cache,
                                                 const OrchestratorConfig& config)
    : registry_(std::move(registry)),
      store_(std::move(store)),
      cache_(std::move(cache)),
      config_(config) {
    if (!registry_ || !store_) {
        throw std::invalid_argument("Orchestrator requires a registry and a store");
    }
}

TranslationOrchestrator::~TranslationOrchestrator() {
    std::lock_guard<std::mutex> lock(abandonedMutex_);
    if (!abandoned_.empty()) {
        XLOG_DEBUG("[orchestrator] waiting for " << abandoned_.size() << " abandoned stage(s)");
    }
    for (auto& worker : abandoned_) {
        worker.join();
    }
}

std::shared_ptr<Adapter> TranslationOrchestrator::requireAdapter(const std::string& protocolId) const {
    auto adapter = registry_->getAdapter(protocolId);
    if (!adapter) {
        throw AdapterNotFoundError(protocolId);
    }
    return adapter;
}

std::optional<std::chrono::milliseconds> TranslationOrchestrator::stageTimeout(const TranslateOptions& options) const {
    return options.timeout ? options.timeout : config_.default_timeout;
}

TranslationResponse TranslationOrchestrator::translate(const TranslationRequest& request) {
    if (request.sourceFormat.empty() || request.targetFormat.empty()) {
        throw std::invalid_argument("Translation request needs a source and a target format");
    }
    if (request.options.maxFidelityLoss &&
        (*request.options.maxFidelityLoss < 0.0 || *request.options.maxFidelityLoss > 1.0)) {
        throw std::invalid_argument("maxFidelityLoss must lie in [0, 1]");
    }

    const auto started = std::chrono::steady_clock::now();
    const TranslateOptions& options = request.options;
    TranslationResponse response;
    response.agentId = request.agentId.value_or("");
    response.sourceFormat = request.sourceFormat;
    response.targetFormat = request.targetFormat;

    auto fail = [&](ErrorCode code, const std::string& message) {
        response.success = false;
        response.errors.push_back({code, message});
        response.duration = elapsedMs(started);
        XLOG_WARN("[orchestrator] " << request.sourceFormat << "->" << request.targetFormat
                  << " failed: " << errorCodeName(code) << ": " << message);
        recordActivity(response, started);
        return response;
    };

    // Resolve adapters
    auto source = registry_->getAdapter(request.sourceFormat);
    auto target = registry_->getAdapter(request.targetFormat);
    if (!source || !target) {
        const std::string& missing = source ? request.targetFormat : request.sourceFormat;
        fail(ErrorCode::ADAPTER_NOT_FOUND, "No enabled adapter registered for protocol: " + missing);
        throw AdapterNotFoundError(missing);
    }

    // A cache hit is returned verbatim, no adapter runs
    const bool useCache = options.useCache && config_.enable_cache && cache_ && request.agentId;
    const CacheKey key{request.agentId.value_or(""), request.sourceFormat, request.targetFormat};
    if (useCache) {
        try {
            if (auto cached = cache_->get(key)) {
                TranslationResponse hit = TranslationResponse::fromJson(*cached);
                hit.fromCache = true;
                recordActivity(hit, started);
                return hit;
            }
        } catch (const TransformError& e) {
            // An unreadable entry is treated as a miss.
            cache_->remove(key);
            response.warnings.push_back(std::string("Ignoring unreadable cache entry: ") + e.what());
        }
    }

    // Optional validation
    if (options.validate) {
        auto validation = source->validate(request.sourceData);
        bool rejected = !validation.valid || (options.strict && !validation.warnings.empty());
        for (const auto& warning : validation.warnings) {
            response.warnings.push_back(warning.path + ": " + warning.message);
        }
        if (rejected) {
            for (const auto& error : validation.errors) {
                response.errors.push_back({ErrorCode::TRANSFORM, error.path + ": " + error.message});
            }
            return fail(ErrorCode::TRANSFORM, "Source data failed " + request.sourceFormat + " validation");
        }
    }

    const auto timeout = stageTimeout(options);
    TransformOptions transformOptions;
    transformOptions.agentId = request.agentId;
    transformOptions.strict = options.strict;

    // Forward transform
    CanonicalResult forward;
    try {
        auto native = std::make_shared<const nlohmann::json>(request.sourceData);
        forward = runStage([source, native, transformOptions] {
            return source->toCanonical(*native, transformOptions);
        }, timeout, request.sourceFormat + ".toCanonical");
    } catch (const TransformError& e) {
        return fail(ErrorCode::TRANSFORM, e.what());
    } catch (const TimeoutError& e) {
        return fail(ErrorCode::TIMEOUT, e.what());
    } catch (const nlohmann::json::exception& e) {
        return fail(ErrorCode::TRANSFORM, e.what());
    }

    response.agentId = forward.agentId;
    response.forwardReport = forward.report;
    response.warnings.insert(response.warnings.end(),
                             forward.report.warnings.begin(), forward.report.warnings.end());
    if (!forward.report.success) {
        for (const auto& error : forward.report.errors) {
            response.errors.push_back({ErrorCode::TRANSFORM, error});
        }
        return fail(ErrorCode::TRANSFORM, request.sourceFormat + " transform reported failure");
    }

    // Fidelity gate, before anything is persisted
    const double forwardFidelity = forward.report.fidelityScore;
    if (options.maxFidelityLoss) {
        const double minimum = 1.0 - *options.maxFidelityLoss;
        if (forwardFidelity < minimum) {
            FidelityThresholdError error(forwardFidelity, minimum);
            return fail(error.code(), error.what());
        }
    }

    // Target transform
    NativeResult reverse;
    try {
        auto graph = std::make_shared<const CanonicalGraph>(forward.graph);
        reverse = runStage([target, graph, transformOptions] {
            return target->fromCanonical(*graph, transformOptions);
        }, timeout, request.targetFormat + ".fromCanonical");
    } catch (const TransformError& e) {
        return fail(ErrorCode::TRANSFORM, e.what());
    } catch (const TimeoutError& e) {
        return fail(ErrorCode::TIMEOUT, e.what());
    } catch (const nlohmann::json::exception& e) {
        return fail(ErrorCode::TRANSFORM, e.what());
    }

    response.reverseReport = reverse.report;
    response.warnings.insert(response.warnings.end(),
                             reverse.report.warnings.begin(), reverse.report.warnings.end());
    if (!reverse.report.success) {
        for (const auto& error : reverse.report.errors) {
            response.errors.push_back({ErrorCode::TRANSFORM, error});
        }
        return fail(ErrorCode::TRANSFORM, request.targetFormat + " transform reported failure");
    }
    if (options.validate) {
        auto validation = target->validate(reverse.native);
        for (const auto& error : validation.errors) {
            response.warnings.push_back(request.targetFormat + " output " + error.path + ": " + error.message);
        }
        for (const auto& warning : validation.warnings) {
            response.warnings.push_back(request.targetFormat + " output " + warning.path + ": " + warning.message);
        }
    }

    // Two lossy stages compose multiplicatively
    response.targetData = std::move(reverse.native);
    response.totalFidelity = forwardFidelity * reverse.report.fidelityScore;
    registry_->recordUsage(request.sourceFormat, forwardFidelity);
    registry_->recordUsage(request.targetFormat, reverse.report.fidelityScore);
    if (response.totalFidelity < config_.min_fidelity_warning) {
        response.warnings.push_back("Total fidelity " + std::to_string(response.totalFidelity) +
                                    " is below " + std::to_string(config_.min_fidelity_warning));
    }

    // Persist as the last mutating step
    if (options.persist) {
        SnapshotMetadata metadata;
        metadata.sourceFormat = request.sourceFormat;
        metadata.fidelity = forwardFidelity;
        try {
            response.version = commitSnapshot(forward.agentId, forward.graph, metadata).version;
        } catch (const StoreError& e) {
            fail(ErrorCode::STORE, e.what());
            throw;
        }
    }

    response.success = true;
    response.duration = elapsedMs(started);

    // Audit, success or not
    recordActivity(response, started);

    // Cache
    if (useCache) {
        try {
            cache_->put(key, response.toJson());
        } catch (const CacheError& e) {
            response.warnings.push_back(std::string("Response not cached: ") + e.what());
        }
    }
    updateCompatibility(request.sourceFormat, request.targetFormat, response.totalFidelity);
    return response;
}

TranslationResponse TranslationOrchestrator::translateFromStore(const std::string& agentId,
                                                                const std::string& targetFormat,
                                                                std::optional<uint64_t> version,
                                                                const TranslateOptions& options) {
    if (agentId.empty() || targetFormat.empty()) {
        throw std::invalid_argument("translateFromStore needs an agent id and a target format");
    }

    const auto started = std::chrono::steady_clock::now();
    TranslationResponse response;
    response.agentId = agentId;
    response.targetFormat = targetFormat;

    auto fail = [&](ErrorCode code, const std::string& message) {
        response.success = false;
        response.errors.push_back({code, message});
        response.duration = elapsedMs(started);
        recordActivity(response, started);
        return response;
    };

    auto target = registry_->getAdapter(targetFormat);
    if (!target) {
        fail(ErrorCode::ADAPTER_NOT_FOUND, "No enabled adapter registered for protocol: " + targetFormat);
        throw AdapterNotFoundError(targetFormat);
    }

    auto snapshot = store_->getAgentSnapshot(agentId, version);
    if (!snapshot) {
        response.sourceFormat = "canonical";
        return fail(ErrorCode::STORE, "No stored snapshot for " + agentId +
                    (version ? " v" + std::to_string(*version) : std::string()));
    }
    response.sourceFormat = snapshot->metadata.sourceFormat;
    response.version = snapshot->version;

    NativeResult reverse;
    try {
        auto graph = std::make_shared<const CanonicalGraph>(std::move(snapshot->graph));
        TransformOptions transformOptions;
        transformOptions.agentId = agentId;
        reverse = runStage([target, graph, transformOptions] {
            return target->fromCanonical(*graph, transformOptions);
        }, stageTimeout(options), targetFormat + ".fromCanonical");
    } catch (const TransformError& e) {
        return fail(ErrorCode::TRANSFORM, e.what());
    } catch (const TimeoutError& e) {
        return fail(ErrorCode::TIMEOUT, e.what());
    } catch (const nlohmann::json::exception& e) {
        return fail(ErrorCode::TRANSFORM, e.what());
    }

    response.reverseReport = reverse.report;
    response.warnings = reverse.report.warnings;
    if (!reverse.report.success) {
        for (const auto& error : reverse.report.errors) {
            response.errors.push_back({ErrorCode::TRANSFORM, error});
        }
        return fail(ErrorCode::TRANSFORM, targetFormat + " transform reported failure");
    }
    response.targetData = std::move(reverse.native);
    response.totalFidelity = reverse.report.fidelityScore;
    response.success = true;
    registry_->recordUsage(targetFormat, reverse.report.fidelityScore);
    response.duration = elapsedMs(started);
    recordActivity(response, started);
    return response;
}

ChainResponse TranslationOrchestrator::translateChain(const nlohmann::json& sourceData,
                                                      const std::vector<std::string>& formats,
                                                      const TranslateOptions& options,
                                                      const std::optional<std::string>& agentId) {
    if (formats.size() < 2) {
        throw std::invalid_argument("A translation chain needs at least two formats");
    }

    ChainResponse chain;
    chain.cumulativeFidelity = 1.0;
    nlohmann::json current = sourceData;
    std::optional<std::string> hopAgentId = agentId;

    for (size_t i = 0; i + 1 < formats.size(); ++i) {
        TranslationRequest hop;
        hop.agentId = hopAgentId;
        hop.sourceFormat = formats[i];
        hop.targetFormat = formats[i + 1];
        hop.sourceData = std::move(current);
        hop.options = options;
        hop.options.persist = options.persist && i + 2 == formats.size();

        TranslationResponse result = translate(hop);
        chain.warnings.insert(chain.warnings.end(), result.warnings.begin(), result.warnings.end());
        chain.errors.insert(chain.errors.end(), result.errors.begin(), result.errors.end());
        chain.agentId = result.agentId;
        // Later hops keep the id the first hop settled on.
        if (!hopAgentId && !result.agentId.empty()) {
            hopAgentId = result.agentId;
        }

        if (!result.success) {
            XLOG_WARN("[orchestrator] chain aborted at hop " << i + 1 << " (" << hop.sourceFormat
                      << "->" << hop.targetFormat << ")");
            chain.hops.push_back(std::move(result));
            chain.success = false;
            return chain;
        }

        chain.cumulativeFidelity *= result.totalFidelity;
        current = result.targetData;
        if (result.version) {
            chain.version = result.version;
        }
        chain.hops.push_back(std::move(result));
    }

    chain.success = true;
    chain.targetData = std::move(current);
    return chain;
}

SnapshotRef TranslationOrchestrator::commitSnapshot(const std::string& agentId,
                                                    const CanonicalGraph& graph,
                                                    const SnapshotMetadata& metadata) {
    SnapshotRef ref;
    try {
        ref = store_->createAgentSnapshot(agentId, graph, metadata);
    } catch (const StoreError& e) {
        XLOG_WARN("[orchestrator] snapshot of " << agentId << " failed, retrying: " << e.what());
        ref = store_->createAgentSnapshot(agentId, graph, metadata);
    }
    if (cache_) {
        cache_->invalidate(agentId);
    }
    return ref;
}

CanonicalResult TranslationOrchestrator::toCanonical(const NativePayload& payload,
                                                     const TransformOptions& options) const {
    return requireAdapter(payload.protocol)->toCanonical(payload.data, options);
}

NativeResult TranslationOrchestrator::fromCanonical(const CanonicalGraph& graph,
                                                    const std::string& targetFormat,
                                                    const TransformOptions& options) const {
    return requireAdapter(targetFormat)->fromCanonical(graph, options);
}

std::optional<CompatibilityEntry> TranslationOrchestrator::getCompatibility(const std::string& sourceFormat,
                                                                           const std::string& targetFormat) const {
    std::lock_guard<std::mutex> lock(compatibilityMutex_);
    auto it = compatibility_.find({sourceFormat, targetFormat});
    if (it == compatibility_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::pair<std::string, std::string>, CompatibilityEntry>
TranslationOrchestrator::getCompatibilityMatrix() const {
    std::lock_guard<std::mutex> lock(compatibilityMutex_);
    return compatibility_;
}

void TranslationOrchestrator::recordActivity(const TranslationResponse& response,
                                             std::chrono::steady_clock::time_point started) {
    TranslationActivity activity;
    activity.agentId = response.agentId;
    activity.sourceFormat = response.sourceFormat;
    activity.targetFormat = response.targetFormat;
    activity.fidelityScore = response.success ? response.totalFidelity : 0.0;
    activity.success = response.success;
    activity.duration = elapsedMs(started);
    for (const auto* report : {&response.forwardReport, &response.reverseReport}) {
        if (*report) {
            for (const auto& lossy : (*report)->lossyMappings) {
                activity.lostFields.push_back(lossy.path);
            }
        }
    }
    store_->recordTranslation(std::move(activity));
}

void TranslationOrchestrator::updateCompatibility(const std::string& sourceFormat,
                                                  const std::string& targetFormat, double fidelity) {
    std::lock_guard<std::mutex> lock(compatibilityMutex_);
    CompatibilityEntry& entry = compatibility_[{sourceFormat, targetFormat}];
    entry.count++;
    entry.meanFidelity += (fidelity - entry.meanFidelity) / static_cast<double>(entry.count);
}

} // namespace core
} // namespace agentbridge
