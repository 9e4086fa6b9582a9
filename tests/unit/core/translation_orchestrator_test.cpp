#include <gtest/gtest.h>
#include "agentbridge/core/translation_orchestrator.h"
#include "../../common/fake_adapter.h"
#include "../../common/flaky_store.h"
#include "../../common/sample_agents.h"
#include <algorithm>

using namespace agentbridge;
using namespace agentbridge::core;

class TranslationOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = samples::makeRegistry();
        alpha = std::make_shared<samples::FakeAdapter>("alpha", 0.9, 1.0);
        beta = std::make_shared<samples::FakeAdapter>("beta", 1.0, 0.8);
        registry->registerAdapter(alpha);
        registry->registerAdapter(beta);

        store = std::make_shared<CanonicalStore>();
        cache = std::make_shared<TranslationCache>();
        orchestrator = std::make_unique<TranslationOrchestrator>(registry, store, cache);
    }

    TranslationRequest request(const std::string& from, const std::string& to, nlohmann::json data) {
        TranslationRequest req;
        req.sourceFormat = from;
        req.targetFormat = to;
        req.sourceData = std::move(data);
        return req;
    }

    std::shared_ptr<AdapterRegistry> registry;
    std::shared_ptr<samples::FakeAdapter> alpha;
    std::shared_ptr<samples::FakeAdapter> beta;
    std::shared_ptr<CanonicalStore> store;
    std::shared_ptr<TranslationCache> cache;
    std::unique_ptr<TranslationOrchestrator> orchestrator;
};

TEST_F(TranslationOrchestratorTest, FidelityComposesMultiplicatively) {
    auto response = orchestrator->translate(request("alpha", "beta", {{"id", "a1"}, {"name", "One"}}));
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.agentId, "a1");
    EXPECT_NEAR(response.totalFidelity, 0.72, 1e-12);
    EXPECT_EQ(response.targetData["format"], "beta");
    EXPECT_EQ(response.targetData["name"], "One");
    ASSERT_TRUE(response.forwardReport.has_value());
    ASSERT_TRUE(response.reverseReport.has_value());
    EXPECT_FALSE(response.fromCache);
    EXPECT_FALSE(response.version.has_value());

    // Below the default 0.8 warning level
    EXPECT_FALSE(response.warnings.empty());
    EXPECT_EQ(registry->getUsage("alpha")->count, 1u);
}

TEST_F(TranslationOrchestratorTest, ReferenceAdaptersTranslate) {
    auto response = orchestrator->translate(request("toolcall", "rolegoal", samples::toolCallAgent()));
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.agentId, "research-assistant");
    EXPECT_EQ(response.targetData["name"], "Research Assistant");
    EXPECT_GT(response.totalFidelity, 0.0);
    EXPECT_LE(response.totalFidelity, 1.0);
}

TEST_F(TranslationOrchestratorTest, MalformedRequestsThrow) {
    EXPECT_THROW(orchestrator->translate(request("", "beta", {})), std::invalid_argument);

    auto req = request("alpha", "beta", {{"id", "a1"}});
    req.options.maxFidelityLoss = 1.5;
    EXPECT_THROW(orchestrator->translate(req), std::invalid_argument);
}

TEST_F(TranslationOrchestratorTest, MissingAdapterThrowsAndIsAudited) {
    EXPECT_THROW(orchestrator->translate(request("alpha", "gamma", {{"id", "a1"}})), AdapterNotFoundError);

    registry->setEnabled("beta", false);
    try {
        orchestrator->translate(request("alpha", "beta", {{"id", "a1"}}));
        FAIL() << "disabled adapter used";
    } catch (const AdapterNotFoundError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ADAPTER_NOT_FOUND);
    }

    auto log = store->getActivityLog();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_FALSE(log[0].success);
    EXPECT_EQ(log[0].targetFormat, "gamma");
}

TEST_F(TranslationOrchestratorTest, TransformErrorIsReported) {
    auto response = orchestrator->translate(request("alpha", "beta", {{"name", "no id"}}));
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.hasError(ErrorCode::TRANSFORM));
    EXPECT_EQ(store->getActivityLog().size(), 1u);
}

TEST_F(TranslationOrchestratorTest, ValidationRejectsInvalidSource) {
    auto req = request("alpha", "beta", nlohmann::json::object());
    req.options.validate = true;
    auto response = orchestrator->translate(req);
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.hasError(ErrorCode::TRANSFORM));
    EXPECT_EQ(alpha->forwardCalls(), 0);
}

TEST_F(TranslationOrchestratorTest, StrictValidationRejectsWarnings) {
    auto req = request("alpha", "beta", {{"id", "a1"}});
    req.options.validate = true;
    EXPECT_TRUE(orchestrator->translate(req).success);

    req.options.strict = true;
    auto strict = orchestrator->translate(req);
    EXPECT_FALSE(strict.success);
    EXPECT_FALSE(strict.warnings.empty());
}

TEST_F(TranslationOrchestratorTest, FidelityGateBlocksPersistence) {
    auto req = request("alpha", "beta", {{"id", "a1"}});
    req.options.persist = true;
    req.options.maxFidelityLoss = 0.05;

    auto response = orchestrator->translate(req);
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.hasError(ErrorCode::FIDELITY_THRESHOLD));
    EXPECT_FALSE(store->getAgentSnapshot("a1").has_value());
    EXPECT_EQ(beta->reverseCalls(), 0);

    req.options.maxFidelityLoss = 0.2;
    auto accepted = orchestrator->translate(req);
    EXPECT_TRUE(accepted.success);
    EXPECT_EQ(accepted.version, 1u);
}

TEST_F(TranslationOrchestratorTest, PersistStoresForwardGraph) {
    auto req = request("alpha", "beta", {{"id", "a1"}, {"name", "One"}});
    req.options.persist = true;
    auto first = orchestrator->translate(req);
    auto second = orchestrator->translate(req);
    EXPECT_EQ(first.version, 1u);
    EXPECT_EQ(second.version, 2u);

    auto snapshot = store->getAgentSnapshot("a1");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->metadata.sourceFormat, "alpha");
    EXPECT_DOUBLE_EQ(snapshot->metadata.fidelity, 0.9);
}

TEST_F(TranslationOrchestratorTest, TimeoutLeavesNoSnapshot) {
    beta->setDelay(std::chrono::milliseconds(300));
    auto req = request("alpha", "beta", {{"id", "slow"}});
    req.options.persist = true;
    req.options.timeout = std::chrono::milliseconds(20);

    auto response = orchestrator->translate(req);
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.hasError(ErrorCode::TIMEOUT));
    EXPECT_FALSE(store->getAgentSnapshot("slow").has_value());
}

TEST_F(TranslationOrchestratorTest, ReverseFailureIsReported) {
    beta->setFailReverse(true);
    auto response = orchestrator->translate(request("alpha", "beta", {{"id", "a1"}}));
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.hasError(ErrorCode::TRANSFORM));
}

TEST_F(TranslationOrchestratorTest, CacheHitSkipsAdapters) {
    auto req = request("alpha", "beta", {{"id", "a1"}, {"name", "One"}});
    req.agentId = "a1";
    req.options.useCache = true;

    auto first = orchestrator->translate(req);
    ASSERT_TRUE(first.success);
    EXPECT_FALSE(first.fromCache);

    auto second = orchestrator->translate(req);
    EXPECT_TRUE(second.fromCache);
    EXPECT_EQ(second.targetData, first.targetData);
    EXPECT_DOUBLE_EQ(second.totalFidelity, first.totalFidelity);
    EXPECT_EQ(alpha->forwardCalls(), 1);
    EXPECT_EQ(store->getActivityLog().size(), 2u);
}

TEST_F(TranslationOrchestratorTest, CacheNeedsAgentId) {
    auto req = request("alpha", "beta", {{"id", "a1"}});
    req.options.useCache = true;
    orchestrator->translate(req);
    orchestrator->translate(req);
    EXPECT_EQ(alpha->forwardCalls(), 2);
}

TEST_F(TranslationOrchestratorTest, PersistInvalidatesCachedTranslations) {
    auto cached = request("alpha", "beta", {{"id", "a1"}});
    cached.agentId = "a1";
    cached.options.useCache = true;
    orchestrator->translate(cached);
    ASSERT_TRUE(cache->get({"a1", "alpha", "beta"}).has_value());

    auto persisted = request("alpha", "toolcall", {{"id", "a1"}});
    persisted.agentId = "a1";
    persisted.options.persist = true;
    orchestrator->translate(persisted);
    EXPECT_FALSE(cache->get({"a1", "alpha", "beta"}).has_value());
}

TEST_F(TranslationOrchestratorTest, CacheDisabledByConfig) {
    OrchestratorConfig config;
    config.enable_cache = false;
    TranslationOrchestrator uncached(registry, store, cache, config);

    auto req = request("alpha", "beta", {{"id", "a1"}});
    req.agentId = "a1";
    req.options.useCache = true;
    uncached.translate(req);
    uncached.translate(req);
    EXPECT_EQ(alpha->forwardCalls(), 2);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(TranslationOrchestratorTest, TranslateFromStore) {
    auto req = request("alpha", "beta", {{"id", "a1"}, {"name", "Stored"}});
    req.options.persist = true;
    orchestrator->translate(req);

    auto response = orchestrator->translateFromStore("a1", "toolcall");
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.version, 1u);
    EXPECT_EQ(response.sourceFormat, "alpha");
    EXPECT_EQ(response.targetData["name"], "Stored");
    ASSERT_TRUE(response.reverseReport.has_value());
    EXPECT_DOUBLE_EQ(response.totalFidelity, response.reverseReport->fidelityScore);

    auto missing = orchestrator->translateFromStore("nobody", "toolcall");
    EXPECT_FALSE(missing.success);
    EXPECT_TRUE(missing.hasError(ErrorCode::STORE));
    EXPECT_EQ(missing.sourceFormat, "canonical");

    EXPECT_FALSE(orchestrator->translateFromStore("a1", "toolcall", 7).success);
    EXPECT_THROW(orchestrator->translateFromStore("a1", "gamma"), AdapterNotFoundError);
}

TEST_F(TranslationOrchestratorTest, TranslateFromStoreReportsTargetErrors) {
    auto req = request("alpha", "beta", {{"id", "a1"}, {"name", "Stored"}});
    req.options.persist = true;
    ASSERT_TRUE(orchestrator->translate(req).success);

    beta->setFailReverse(true);
    auto response = orchestrator->translateFromStore("a1", "beta");
    EXPECT_FALSE(response.success);
    ASSERT_EQ(response.errors.size(), 2u);
    EXPECT_EQ(response.errors[0].code, ErrorCode::TRANSFORM);
    EXPECT_EQ(response.errors[0].message, "scripted failure");
    EXPECT_TRUE(response.targetData.is_null());

    auto log = store->getActivityLog("a1");
    ASSERT_EQ(log.size(), 2u);
    EXPECT_FALSE(log.back().success);
}

TEST_F(TranslationOrchestratorTest, ForwardReportFailureStopsTranslation) {
    alpha->setFailForward(true);
    auto req = request("alpha", "beta", {{"id", "a1"}});
    req.options.persist = true;
    auto response = orchestrator->translate(req);
    EXPECT_FALSE(response.success);
    EXPECT_TRUE(response.hasError(ErrorCode::TRANSFORM));
    EXPECT_EQ(beta->reverseCalls(), 0);
    EXPECT_FALSE(store->getAgentSnapshot("a1").has_value());
}

TEST_F(TranslationOrchestratorTest, ValidationChecksTargetOutput) {
    beta->setOmitName(true);
    auto req = request("alpha", "beta", {{"id", "a1"}, {"name", "One"}});
    req.options.validate = true;
    auto response = orchestrator->translate(req);
    ASSERT_TRUE(response.success);
    EXPECT_NE(std::find(response.warnings.begin(), response.warnings.end(), "beta output name: recommended"),
              response.warnings.end());

    req.options.validate = false;
    auto unchecked = orchestrator->translate(req);
    EXPECT_EQ(std::find(unchecked.warnings.begin(), unchecked.warnings.end(), "beta output name: recommended"),
              unchecked.warnings.end());
}

TEST_F(TranslationOrchestratorTest, PersistRetriesStoreErrorOnce) {
    auto flaky = std::make_shared<samples::FlakyStore>(1);
    TranslationOrchestrator retrying(registry, flaky, cache);
    auto req = request("alpha", "beta", {{"id", "r1"}});
    req.options.persist = true;

    auto response = retrying.translate(req);
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.version, 1u);
    EXPECT_EQ(flaky->attempts(), 2);
}

TEST_F(TranslationOrchestratorTest, PersistSurfacesRepeatedStoreError) {
    auto flaky = std::make_shared<samples::FlakyStore>(2);
    TranslationOrchestrator retrying(registry, flaky, cache);
    auto req = request("alpha", "beta", {{"id", "r1"}});
    req.options.persist = true;

    EXPECT_THROW(retrying.translate(req), StoreError);
    EXPECT_EQ(flaky->attempts(), 2);
    auto log = flaky->getActivityLog("r1");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_FALSE(log[0].success);
}

TEST_F(TranslationOrchestratorTest, DestructorWaitsForAbandonedStages) {
    alpha->setDelay(std::chrono::milliseconds(200));
    auto req = request("alpha", "beta", {{"id", "slow"}});
    req.options.timeout = std::chrono::milliseconds(10);

    auto response = orchestrator->translate(req);
    EXPECT_TRUE(response.hasError(ErrorCode::TIMEOUT));
    EXPECT_EQ(alpha->forwardCompleted(), 0);

    orchestrator.reset();
    EXPECT_EQ(alpha->forwardCompleted(), 1);
}

TEST_F(TranslationOrchestratorTest, ChainMultipliesHopFidelity) {
    TranslateOptions options;
    options.persist = true;
    auto chain = orchestrator->translateChain({{"id", "c1"}, {"name", "Chained"}},
                                              {"alpha", "beta", "alpha"}, options);
    ASSERT_TRUE(chain.success);
    ASSERT_EQ(chain.hops.size(), 2u);
    EXPECT_NEAR(chain.cumulativeFidelity, chain.hops[0].totalFidelity * chain.hops[1].totalFidelity, 1e-12);
    EXPECT_EQ(chain.agentId, "c1");
    EXPECT_EQ(chain.targetData["format"], "alpha");

    // Only the last hop persists
    EXPECT_FALSE(chain.hops[0].version.has_value());
    EXPECT_EQ(chain.version, 1u);
    EXPECT_EQ(store->latestVersion("c1"), 1u);
}

TEST_F(TranslationOrchestratorTest, ChainAbortsAtFailedHop) {
    beta->setFailReverse(true);
    auto chain = orchestrator->translateChain({{"id", "c1"}}, {"alpha", "beta", "alpha", "beta"});
    EXPECT_FALSE(chain.success);
    EXPECT_EQ(chain.hops.size(), 1u);
    EXPECT_FALSE(chain.errors.empty());

    EXPECT_THROW(orchestrator->translateChain({{"id", "c1"}}, {"alpha"}), std::invalid_argument);
}

TEST_F(TranslationOrchestratorTest, CompatibilityMatrixTracksMeanFidelity) {
    orchestrator->translate(request("alpha", "beta", {{"id", "a1"}}));
    orchestrator->translate(request("alpha", "beta", {{"id", "a2"}}));
    orchestrator->translate(request("beta", "alpha", {{"id", "a3"}}));

    auto entry = orchestrator->getCompatibility("alpha", "beta");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->count, 2u);
    EXPECT_NEAR(entry->meanFidelity, 0.72, 1e-12);
    EXPECT_FALSE(orchestrator->getCompatibility("beta", "gamma").has_value());
    EXPECT_EQ(orchestrator->getCompatibilityMatrix().size(), 2u);
}

TEST_F(TranslationOrchestratorTest, DirectCanonicalAccess) {
    auto canonical = orchestrator->toCanonical({"alpha", {{"id", "d1"}}});
    EXPECT_EQ(canonical.agentId, "d1");
    auto native = orchestrator->fromCanonical(canonical.graph, "beta");
    EXPECT_EQ(native.native["id"], "d1");
    EXPECT_THROW(orchestrator->toCanonical({"gamma", nlohmann::json::object()}), AdapterNotFoundError);
}

TEST_F(TranslationOrchestratorTest, ResponseJsonRoundTrip) {
    auto response = orchestrator->translate(request("alpha", "beta", {{"id", "a1"}}));
    auto restored = TranslationResponse::fromJson(response.toJson());
    EXPECT_EQ(restored.agentId, response.agentId);
    EXPECT_EQ(restored.targetData, response.targetData);
    EXPECT_THROW(TranslationResponse::fromJson(nlohmann::json::object()), TransformError);
}
