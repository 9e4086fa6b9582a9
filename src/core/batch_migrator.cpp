#include "agentbridge/core/batch_migrator.h"
#include "agentbridge/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace agentbridge {
namespace core {

const char* batchItemStatusName(BatchItemStatus status) {
    switch (status) {
        case BatchItemStatus::SUCCEEDED: return "succeeded";
        case BatchItemStatus::FAILED: return "failed";
        case BatchItemStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

nlohmann::json BatchResult::toJson() const {
    nlohmann::json itemsJson = nlohmann::json::array();
    for (const auto& item : items) {
        nlohmann::json entry = {
            {"index", item.index},
            {"status", batchItemStatusName(item.status)}
        };
        if (item.response) {
            entry["response"] = item.response->toJson();
        }
        if (!item.error.empty()) {
            entry["error"] = item.error;
        }
        itemsJson.push_back(std::move(entry));
    }
    return {
        {"total", total},
        {"succeeded", succeeded},
        {"failed", failed},
        {"cancelled", cancelled},
        {"items", std::move(itemsJson)}
    };
}

BatchMigrator::BatchMigrator(std::shared_ptr<TranslationOrchestrator> orchestrator, const BatchConfig& config)
    : orchestrator_(std::move(orchestrator)), config_(config) {
    if (!orchestrator_) {
        throw std::invalid_argument("BatchMigrator requires an orchestrator");
    }
    if (config_.max_concurrency == 0) {
        config_.max_concurrency = 1;
    }
}

BatchResult BatchMigrator::run(const std::vector<TranslationRequest>& requests,
                               std::shared_ptr<CancellationToken> token) const {
    return runItems(requests.size(), [this, &requests](size_t index) {
        return orchestrator_->translate(requests[index]);
    }, token);
}

BatchResult BatchMigrator::migrateStored(const std::vector<std::string>& agentIds,
                                         const std::string& targetFormat,
                                         std::shared_ptr<CancellationToken> token) const {
    return runItems(agentIds.size(), [this, &agentIds, &targetFormat](size_t index) {
        return orchestrator_->translateFromStore(agentIds[index], targetFormat);
    }, token);
}

BatchResult BatchMigrator::runItems(size_t count,
                                    const std::function<TranslationResponse(size_t)>& translateItem,
                                    const std::shared_ptr<CancellationToken>& token) const {
    BatchResult result;
    result.total = count;
    result.items.resize(count);
    for (size_t i = 0; i < count; ++i) {
        result.items[i].index = i;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> halted{false};

    // Each worker writes only the slots it claimed.
    auto worker = [&]() {
        while (true) {
            if ((token && token->isCancelled()) || halted.load()) {
                return;
            }
            size_t index = next.fetch_add(1);
            if (index >= count) {
                return;
            }
            BatchItemResult& item = result.items[index];
            try {
                item.response = translateItem(index);
                item.status = item.response->success ? BatchItemStatus::SUCCEEDED : BatchItemStatus::FAILED;
            } catch (const std::exception& e) {
                item.status = BatchItemStatus::FAILED;
                item.error = e.what();
            }
            if (item.status == BatchItemStatus::FAILED && !config_.continue_on_error) {
                halted.store(true);
            }
        }
    };

    const size_t workers = std::min(config_.max_concurrency, std::max<size_t>(count, 1));
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& item : result.items) {
        switch (item.status) {
            case BatchItemStatus::SUCCEEDED: result.succeeded++; break;
            case BatchItemStatus::FAILED: result.failed++; break;
            case BatchItemStatus::CANCELLED: result.cancelled++; break;
        }
    }
    XLOG_INFO("[batch] " << result.succeeded << "/" << result.total << " succeeded, "
              << result.failed << " failed, " << result.cancelled << " cancelled");
    return result;
}

} // namespace core
} // namespace agentbridge
