#include "agentbridge/core/bridge_config.h"
#include <fstream>
#include <stdexcept>

namespace agentbridge {
namespace core {

namespace {
    template <typename T>
    void merge(const nlohmann::json& section, const char* key, T& target) {
        if (section.contains(key)) {
            target = section.at(key).get<T>();
        }
    }

    template <typename Duration>
    void mergeDuration(const nlohmann::json& section, const char* key, Duration& target) {
        if (section.contains(key)) {
            target = Duration(section.at(key).get<typename Duration::rep>());
        }
    }

    const nlohmann::json& sectionOf(const nlohmann::json& json, const char* name) {
        static const nlohmann::json empty = nlohmann::json::object();
        auto it = json.find(name);
        if (it == json.end()) {
            return empty;
        }
        if (!it->is_object()) {
            throw std::invalid_argument(std::string("section '") + name + "' must be an object");
        }
        return *it;
    }
}

Result<BridgeConfig> loadBridgeConfig(const nlohmann::json& json, const BridgeConfig& defaults) {
    if (!json.is_object()) {
        return Result<BridgeConfig>::failure("configuration must be a JSON object");
    }

    BridgeConfig config = defaults;
    try {
        const auto& cache = sectionOf(json, "cache");
        merge(cache, "max_entries", config.cache.max_entries);
        mergeDuration(cache, "ttl_seconds", config.cache.ttl);
        merge(cache, "shard_count", config.cache.shard_count);
        mergeDuration(cache, "sweep_interval_ms", config.cache.sweep_interval);
        merge(cache, "background_sweep", config.cache.background_sweep);
        merge(cache, "track_stats", config.cache.track_stats);

        const auto& store = sectionOf(json, "store");
        merge(store, "storage_path", config.store.storage_path);
        merge(store, "enable_compression", config.store.enable_compression);
        const auto& retention = sectionOf(store, "retention");
        merge(retention, "keep_versions", config.store.retention.keep_versions);
        mergeDuration(retention, "max_age_hours", config.store.retention.max_age);

        const auto& orchestrator = sectionOf(json, "orchestrator");
        merge(orchestrator, "enable_cache", config.orchestrator.enable_cache);
        merge(orchestrator, "min_fidelity_warning", config.orchestrator.min_fidelity_warning);
        if (orchestrator.contains("default_timeout_ms")) {
            const auto& timeout = orchestrator.at("default_timeout_ms");
            if (timeout.is_null()) {
                config.orchestrator.default_timeout.reset();
            } else {
                config.orchestrator.default_timeout = std::chrono::milliseconds(timeout.get<int64_t>());
            }
        }

        const auto& harness = sectionOf(json, "harness");
        merge(harness, "default_min_fidelity", config.harness.default_min_fidelity);
        merge(harness, "baseline_tolerance", config.harness.baseline_tolerance);

        const auto& batch = sectionOf(json, "batch");
        merge(batch, "max_concurrency", config.batch.max_concurrency);
        merge(batch, "continue_on_error", config.batch.continue_on_error);

        const auto& logging = sectionOf(json, "logging");
        if (logging.contains("level")) {
            config.logLevel = utils::parseLogLevel(logging.at("level").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<BridgeConfig>::failure(std::string("invalid configuration: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Result<BridgeConfig>::failure(std::string("invalid configuration: ") + e.what());
    }

    if (config.cache.max_entries == 0 || config.cache.shard_count == 0) {
        return Result<BridgeConfig>::failure("cache.max_entries and cache.shard_count must be positive");
    }
    if (config.harness.default_min_fidelity < 0.0 || config.harness.default_min_fidelity > 1.0) {
        return Result<BridgeConfig>::failure("harness.default_min_fidelity must lie in [0, 1]");
    }
    return config;
}

Result<BridgeConfig> loadBridgeConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<BridgeConfig>::failure("cannot open configuration file " + path);
    }
    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        return Result<BridgeConfig>::failure("cannot parse " + path + ": " + e.what());
    }
    return loadBridgeConfig(json);
}

nlohmann::json bridgeConfigToJson(const BridgeConfig& config) {
    return {
        {"cache", {
            {"max_entries", config.cache.max_entries},
            {"ttl_seconds", config.cache.ttl.count()},
            {"shard_count", config.cache.shard_count},
            {"sweep_interval_ms", config.cache.sweep_interval.count()},
            {"background_sweep", config.cache.background_sweep},
            {"track_stats", config.cache.track_stats}
        }},
        {"store", {
            {"storage_path", config.store.storage_path},
            {"enable_compression", config.store.enable_compression},
            {"retention", {
                {"keep_versions", config.store.retention.keep_versions},
                {"max_age_hours", config.store.retention.max_age.count()}
            }}
        }},
        {"orchestrator", {
            {"enable_cache", config.orchestrator.enable_cache},
            {"min_fidelity_warning", config.orchestrator.min_fidelity_warning},
            {"default_timeout_ms", config.orchestrator.default_timeout
                ? nlohmann::json(config.orchestrator.default_timeout->count()) : nlohmann::json()}
        }},
        {"harness", {
            {"default_min_fidelity", config.harness.default_min_fidelity},
            {"baseline_tolerance", config.harness.baseline_tolerance}
        }},
        {"batch", {
            {"max_concurrency", config.batch.max_concurrency},
            {"continue_on_error", config.batch.continue_on_error}
        }},
        {"logging", {{"level", utils::logLevelName(config.logLevel)}}}
    };
}

void applyLogConfig(const BridgeConfig& config) {
    utils::setLogLevel(config.logLevel);
}

} // namespace core
} // namespace agentbridge
