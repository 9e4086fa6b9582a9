#pragma once

#include "agentbridge/core/translation_orchestrator.h"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentbridge {
namespace core {

struct BatchConfig {
    size_t max_concurrency{4};       ///< Worker threads per job
    bool continue_on_error{true};    ///< Otherwise the first failure cancels the rest
};

/**
 * @brief Cooperative cancellation flag shared with a running job
 *
 * Checked between items; an item already running always completes.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

enum class BatchItemStatus {
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char* batchItemStatusName(BatchItemStatus status);

struct BatchItemResult {
    size_t index{0};
    BatchItemStatus status{BatchItemStatus::CANCELLED};
    std::optional<TranslationResponse> response;
    std::string error;    ///< Set when the translation threw
};

struct BatchResult {
    std::vector<BatchItemResult> items;   ///< In submission order
    size_t total{0};
    size_t succeeded{0};
    size_t failed{0};
    size_t cancelled{0};

    nlohmann::json toJson() const;
};

/**
 * @brief Runs many translations with bounded concurrency
 */
class BatchMigrator {
public:
    explicit BatchMigrator(std::shared_ptr<TranslationOrchestrator> orchestrator,
                           const BatchConfig& config = BatchConfig{});

    BatchResult run(const std::vector<TranslationRequest>& requests,
                    std::shared_ptr<CancellationToken> token = nullptr) const;

    /**
     * @brief Re-export stored agents to another format
     */
    BatchResult migrateStored(const std::vector<std::string>& agentIds,
                              const std::string& targetFormat,
                              std::shared_ptr<CancellationToken> token = nullptr) const;

private:
    BatchResult runItems(size_t count,
                         const std::function<TranslationResponse(size_t)>& translateItem,
                         const std::shared_ptr<CancellationToken>& token) const;

    std::shared_ptr<TranslationOrchestrator> orchestrator_;
    BatchConfig config_;
};

} // namespace core
} // namespace agentbridge
