#pragma once

#include "agentbridge/core/batch_migrator.h"
#include "agentbridge/core/canonical_store.h"
#include "agentbridge/core/round_trip_harness.h"
#include "agentbridge/core/translation_cache.h"
#include "agentbridge/core/translation_orchestrator.h"
#include "agentbridge/utils/logging.hpp"
#include "agentbridge/utils/result.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

/**
 * @brief Configuration of every bridge component, with working defaults
 */
struct BridgeConfig {
    CacheConfig cache;
    StoreConfig store;
    OrchestratorConfig orchestrator;
    HarnessConfig harness;
    BatchConfig batch;
    utils::LogLevel logLevel{utils::LogLevel::WARN};
};

/**
 * @brief Merge the keys present in a JSON document onto the defaults
 *
 * Recognized sections: cache, store, orchestrator, harness, batch, logging.
 * Unknown keys are ignored; a key of the wrong type fails the whole load.
 */
Result<BridgeConfig> loadBridgeConfig(const nlohmann::json& json, const BridgeConfig& defaults = BridgeConfig{});

Result<BridgeConfig> loadBridgeConfigFile(const std::string& path);

nlohmann::json bridgeConfigToJson(const BridgeConfig& config);

/**
 * @brief Set the process-wide log threshold from config.logLevel
 *
 * Called once by the host; services never change the threshold themselves.
 */
void applyLogConfig(const BridgeConfig& config);

} // namespace core
} // namespace agentbridge
