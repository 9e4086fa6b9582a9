#include <gtest/gtest.h>
#include "agentbridge/core/batch_migrator.h"
#include "../../common/fake_adapter.h"
#include <cstdint>
#include <thread>

using namespace agentbridge;
using namespace agentbridge::core;

class BatchMigratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<AdapterRegistry>();
        source = std::make_shared<samples::FakeAdapter>("source");
        target = std::make_shared<samples::FakeAdapter>("target");
        registry->registerAdapter(source);
        registry->registerAdapter(target);
        store = std::make_shared<CanonicalStore>();
        orchestrator = std::make_shared<TranslationOrchestrator>(registry, store);
    }

    std::vector<TranslationRequest> requests(size_t count, size_t brokenIndex = SIZE_MAX) {
        std::vector<TranslationRequest> list;
        for (size_t i = 0; i < count; ++i) {
            TranslationRequest request;
            request.sourceFormat = "source";
            request.targetFormat = "target";
            request.sourceData = i == brokenIndex
                ? nlohmann::json{{"name", "no id"}}
                : nlohmann::json{{"id", "agent" + std::to_string(i)}};
            list.push_back(std::move(request));
        }
        return list;
    }

    std::shared_ptr<AdapterRegistry> registry;
    std::shared_ptr<samples::FakeAdapter> source;
    std::shared_ptr<samples::FakeAdapter> target;
    std::shared_ptr<CanonicalStore> store;
    std::shared_ptr<TranslationOrchestrator> orchestrator;
};

TEST_F(BatchMigratorTest, ResultsKeepSubmissionOrder) {
    BatchMigrator migrator(orchestrator, BatchConfig{4, true});
    auto result = migrator.run(requests(20));

    EXPECT_EQ(result.total, 20u);
    EXPECT_EQ(result.succeeded, 20u);
    ASSERT_EQ(result.items.size(), 20u);
    for (size_t i = 0; i < result.items.size(); ++i) {
        EXPECT_EQ(result.items[i].index, i);
        ASSERT_TRUE(result.items[i].response.has_value());
        EXPECT_EQ(result.items[i].response->agentId, "agent" + std::to_string(i));
    }
    EXPECT_EQ(source->forwardCalls(), 20);
}

TEST_F(BatchMigratorTest, ContinuesPastFailures) {
    BatchMigrator migrator(orchestrator, BatchConfig{2, true});
    auto result = migrator.run(requests(6, 3));
    EXPECT_EQ(result.succeeded, 5u);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.items[3].status, BatchItemStatus::FAILED);
}

TEST_F(BatchMigratorTest, StopsAtFirstFailure) {
    BatchMigrator migrator(orchestrator, BatchConfig{1, false});
    auto result = migrator.run(requests(6, 2));
    EXPECT_EQ(result.succeeded, 2u);
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.cancelled, 3u);
    EXPECT_EQ(result.items[5].status, BatchItemStatus::CANCELLED);
    EXPECT_FALSE(result.items[5].response.has_value());
}

TEST_F(BatchMigratorTest, ThrownErrorsMarkItemFailed) {
    auto list = requests(3);
    list[1].targetFormat = "missing";
    BatchMigrator migrator(orchestrator);
    auto result = migrator.run(list);
    EXPECT_EQ(result.items[1].status, BatchItemStatus::FAILED);
    EXPECT_NE(result.items[1].error.find("missing"), std::string::npos);
    EXPECT_EQ(result.succeeded, 2u);
}

TEST_F(BatchMigratorTest, CancelledTokenSkipsRemainingItems) {
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    BatchMigrator migrator(orchestrator);
    auto result = migrator.run(requests(5), token);
    EXPECT_EQ(result.cancelled, 5u);
    EXPECT_EQ(source->forwardCalls(), 0);
}

TEST_F(BatchMigratorTest, CancelDuringRun) {
    source->setDelay(std::chrono::milliseconds(20));
    auto token = std::make_shared<CancellationToken>();
    BatchMigrator migrator(orchestrator, BatchConfig{1, true});

    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token->cancel();
    });
    auto result = migrator.run(requests(50), token);
    canceller.join();

    EXPECT_GT(result.cancelled, 0u);
    EXPECT_EQ(result.succeeded + result.failed + result.cancelled, 50u);
    // Items that started still completed
    for (const auto& item : result.items) {
        if (item.status != BatchItemStatus::CANCELLED) {
            EXPECT_TRUE(item.response.has_value());
        }
    }
}

TEST_F(BatchMigratorTest, MigrateStoredAgents) {
    for (auto& request : requests(3)) {
        request.options.persist = true;
        orchestrator->translate(request);
    }
    BatchMigrator migrator(orchestrator);
    auto result = migrator.migrateStored({"agent0", "agent1", "ghost", "agent2"}, "target");
    EXPECT_EQ(result.succeeded, 3u);
    EXPECT_EQ(result.failed, 1u);
    ASSERT_TRUE(result.items[2].response.has_value());
    EXPECT_TRUE(result.items[2].response->hasError(ErrorCode::STORE));
    EXPECT_EQ(result.items[3].response->targetData["id"], "agent2");
}

TEST_F(BatchMigratorTest, JsonSummary) {
    BatchMigrator migrator(orchestrator);
    auto json = migrator.run(requests(2, 1)).toJson();
    EXPECT_EQ(json["total"], 2);
    EXPECT_EQ(json["items"][0]["status"], "succeeded");
    EXPECT_EQ(json["items"][1]["status"], "failed");
    EXPECT_STREQ(batchItemStatusName(BatchItemStatus::CANCELLED), "cancelled");
}

TEST(BatchMigratorConfigTest, RequiresOrchestrator) {
    EXPECT_THROW(BatchMigrator migrator(nullptr), std::invalid_argument);
}
