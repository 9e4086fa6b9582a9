#include <gtest/gtest.h>
#include "agentbridge/core/bridge_service.h"
#include "../../common/fake_adapter.h"
#include "../../common/flaky_store.h"
#include "../../common/sample_agents.h"

using namespace agentbridge;
using namespace agentbridge::core;

class BridgeServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_unique<BridgeService>();
        service->registerAdapter(std::make_shared<adapters::ToolCallAdapter>());
        service->registerAdapter(std::make_shared<adapters::RoleGoalAdapter>());
        service->registerAdapter(std::make_shared<adapters::CapabilityAdapter>());
    }

    std::unique_ptr<BridgeService> service;
};

TEST_F(BridgeServiceTest, ImportStoresSnapshot) {
    auto result = service->importAgent("toolcall", samples::toolCallAgent());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.agentId, "research-assistant");
    EXPECT_EQ(result.version, 1u);
    EXPECT_GT(result.fidelity, 0.0);
    ASSERT_TRUE(result.report.has_value());

    auto again = service->importAgent("toolcall", samples::toolCallAgent());
    EXPECT_EQ(again.version, 2u);

    auto log = service->store()->getActivityLog("research-assistant");
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].targetFormat, "canonical");
    EXPECT_TRUE(log[0].success);
}

TEST_F(BridgeServiceTest, ImportWithExplicitId) {
    auto result = service->importAgent("rolegoal", samples::roleGoalAgent(), std::string("researcher-7"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.agentId, "researcher-7");
    EXPECT_TRUE(service->store()->getAgentSnapshot("researcher-7").has_value());
}

TEST_F(BridgeServiceTest, ImportFailures) {
    auto invalid = service->importAgent("toolcall", {{"description", "no name"}});
    EXPECT_FALSE(invalid.success);
    ASSERT_EQ(invalid.errors.size(), 1u);
    EXPECT_EQ(invalid.errors[0].code, ErrorCode::TRANSFORM);
    EXPECT_EQ(service->store()->getStats().totalSnapshots, 0u);
    EXPECT_EQ(service->store()->getActivityLog().size(), 1u);

    EXPECT_THROW(service->importAgent("unknown", nlohmann::json::object()), AdapterNotFoundError);
    EXPECT_EQ(service->store()->getActivityLog().size(), 2u);
}

TEST_F(BridgeServiceTest, ListAndGetAgent) {
    service->importAgent("toolcall", samples::toolCallAgent());
    service->importAgent("capability", samples::capabilityAgent());

    auto agents = service->listAgents();
    ASSERT_EQ(agents.size(), 2u);
    EXPECT_EQ(agents[0].agentId, "research-assistant");
    EXPECT_EQ(agents[1].agentId, "weather-agent");
    EXPECT_EQ(service->listAgents(1, 1).size(), 1u);

    auto details = service->getAgent("weather-agent");
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->summary.name, "Weather Agent");
    EXPECT_EQ(details->history.size(), 1u);
    EXPECT_FALSE(details->graph.empty());
    EXPECT_EQ(details->toJson()["summary"]["agentId"], "weather-agent");

    EXPECT_FALSE(service->getAgent("nobody").has_value());
}

TEST_F(BridgeServiceTest, ExportNativeAndNTriples) {
    service->importAgent("capability", samples::capabilityAgent());

    auto native = service->exportAgent("weather-agent", "toolcall");
    ASSERT_TRUE(native.success);
    EXPECT_EQ(native.targetData["name"], "Weather Agent");
    EXPECT_EQ(native.version, 1u);

    auto triples = service->exportAgent("weather-agent", "ignored", std::nullopt, ExportFormat::NTRIPLES);
    ASSERT_TRUE(triples.success);
    EXPECT_EQ(triples.targetFormat, "ntriples");
    EXPECT_DOUBLE_EQ(triples.totalFidelity, 1.0);
    ASSERT_TRUE(triples.targetData.is_string());
    EXPECT_NE(triples.targetData.get<std::string>().find("ab:Agent"), std::string::npos);

    auto missing = service->exportAgent("nobody", "toolcall", std::nullopt, ExportFormat::NTRIPLES);
    EXPECT_FALSE(missing.success);
    EXPECT_TRUE(missing.hasError(ErrorCode::STORE));
}

TEST_F(BridgeServiceTest, DiscoverImportedAgents) {
    service->importAgent("toolcall", samples::toolCallAgent());
    service->importAgent("capability", samples::capabilityAgent());

    DiscoveryCriteria criteria;
    criteria.capability = "forecast";
    auto found = service->discoverAgents(criteria);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].agentId, "weather-agent");

    criteria = DiscoveryCriteria{};
    criteria.capability = "web_search";
    found = service->discoverAgents(criteria);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].agentId, "research-assistant");
}

TEST_F(BridgeServiceTest, ImportInvalidatesCachedTranslations) {
    TranslationRequest request;
    request.agentId = "research-assistant";
    request.sourceFormat = "toolcall";
    request.targetFormat = "rolegoal";
    request.sourceData = samples::toolCallAgent();
    request.options.useCache = true;

    EXPECT_FALSE(service->translate(request).fromCache);
    EXPECT_TRUE(service->translate(request).fromCache);

    service->importAgent("toolcall", samples::toolCallAgent());
    EXPECT_FALSE(service->translate(request).fromCache);
}

TEST_F(BridgeServiceTest, StatsCombineComponents) {
    service->importAgent("toolcall", samples::toolCallAgent());
    TranslationRequest request;
    request.sourceFormat = "toolcall";
    request.targetFormat = "capability";
    request.sourceData = samples::toolCallAgent();
    service->translate(request);

    auto stats = service->getStats();
    EXPECT_EQ(stats["store"]["totalAgents"], 1);
    EXPECT_EQ(stats["registry"]["registered"], 3);
    EXPECT_EQ(stats["registry"]["enabled"], 3);
    EXPECT_EQ(stats["registry"]["adapters"].size(), 3u);
    ASSERT_EQ(stats["compatibility"].size(), 1u);
    EXPECT_EQ(stats["compatibility"][0]["source"], "toolcall");
    EXPECT_TRUE(stats["cache"].is_object());
}

TEST_F(BridgeServiceTest, ImportRejectsFailedTransformReport) {
    auto broken = std::make_shared<samples::FakeAdapter>("broken");
    broken->setFailForward(true);
    service->registerAdapter(broken);

    auto result = service->importAgent("broken", {{"id", "x"}});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.agentId, "x");
    EXPECT_FALSE(result.version.has_value());
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].code, ErrorCode::TRANSFORM);
    EXPECT_EQ(result.errors[0].message, "scripted failure");
    EXPECT_FALSE(service->store()->getAgentSnapshot("x").has_value());

    auto log = service->store()->getActivityLog("x");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_FALSE(log[0].success);
}

TEST_F(BridgeServiceTest, DeleteAgentDropsCachedTranslations) {
    service->registerAdapter(std::make_shared<samples::FakeAdapter>("x"));
    service->registerAdapter(std::make_shared<samples::FakeAdapter>("y"));

    TranslationRequest request;
    request.agentId = "a";
    request.sourceFormat = "x";
    request.targetFormat = "y";
    request.sourceData = {{"id", "a"}, {"name", "Alpha"}};
    request.options.useCache = true;
    request.options.persist = true;
    ASSERT_EQ(service->translate(request).version, 1u);

    EXPECT_TRUE(service->deleteAgent("a"));
    EXPECT_FALSE(service->store()->getAgentSnapshot("a").has_value());
    EXPECT_FALSE(service->deleteAgent("a"));

    request.options.persist = false;
    auto after = service->translate(request);
    ASSERT_TRUE(after.success);
    EXPECT_FALSE(after.fromCache);
    EXPECT_FALSE(after.version.has_value());
}

TEST_F(BridgeServiceTest, ExportReportsTargetAdapterErrors) {
    auto target = std::make_shared<samples::FakeAdapter>("y");
    service->registerAdapter(std::make_shared<samples::FakeAdapter>("x"));
    service->registerAdapter(target);
    ASSERT_TRUE(service->importAgent("x", {{"id", "a"}}).success);

    target->setFailReverse(true);
    auto exported = service->exportAgent("a", "y");
    EXPECT_FALSE(exported.success);
    EXPECT_TRUE(exported.hasError(ErrorCode::TRANSFORM));
    ASSERT_EQ(exported.errors.size(), 2u);
    EXPECT_EQ(exported.errors[0].message, "scripted failure");
    ASSERT_TRUE(exported.reverseReport.has_value());
    EXPECT_EQ(exported.toJson()["errors"].size(), 2u);
}

TEST(BridgeServiceStoreTest, ImportRetriesStoreErrorOnce) {
    auto store = std::make_shared<samples::FlakyStore>(1);
    BridgeService service(BridgeConfig{}, store);
    service.registerAdapter(std::make_shared<samples::FakeAdapter>("x"));

    auto result = service.importAgent("x", {{"id", "a"}});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.version, 1u);
    EXPECT_EQ(store->attempts(), 2);
    EXPECT_EQ(service.store().get(), store.get());
}

TEST(BridgeServiceStoreTest, ImportSurfacesRepeatedStoreError) {
    auto store = std::make_shared<samples::FlakyStore>(2);
    BridgeService service(BridgeConfig{}, store);
    service.registerAdapter(std::make_shared<samples::FakeAdapter>("x"));

    EXPECT_THROW(service.importAgent("x", {{"id", "a"}}), StoreError);
    EXPECT_EQ(store->attempts(), 2);
    EXPECT_FALSE(store->getAgentSnapshot("a").has_value());

    auto log = store->getActivityLog("a");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_FALSE(log[0].success);
}

TEST(BridgeServiceStoreTest, CompactClearsCache) {
    BridgeConfig config;
    config.store.retention.keep_versions = 1;
    config.store.retention.max_age = std::chrono::hours(0);
    BridgeService service(config);
    service.registerAdapter(std::make_shared<samples::FakeAdapter>("x"));
    service.registerAdapter(std::make_shared<samples::FakeAdapter>("y"));
    for (int i = 0; i < 3; ++i) {
        service.importAgent("x", {{"id", "a"}});
    }

    TranslationRequest request;
    request.agentId = "a";
    request.sourceFormat = "x";
    request.targetFormat = "y";
    request.sourceData = {{"id", "a"}};
    request.options.useCache = true;
    service.translate(request);
    ASSERT_EQ(service.cache()->size(), 1u);

    EXPECT_EQ(service.compact(), 2u);
    EXPECT_EQ(service.cache()->size(), 0u);
    EXPECT_EQ(service.compact(), 0u);
}

TEST(BridgeServiceConfigTest, AppliesConfiguration) {
    BridgeConfig config;
    config.cache.max_entries = 12;
    config.logLevel = utils::LogLevel::ERROR;
    BridgeService service(config);
    EXPECT_EQ(service.config().cache.max_entries, 12u);
    EXPECT_NE(service.cache(), nullptr);
    EXPECT_NE(service.orchestrator(), nullptr);
}

TEST(BridgeServiceConfigTest, LogLevelIsAppliedByHostOnly) {
    const auto previous = utils::logLevel();
    utils::setLogLevel(utils::LogLevel::WARN);

    BridgeConfig quiet;
    quiet.logLevel = utils::LogLevel::OFF;
    BridgeConfig verbose;
    verbose.logLevel = utils::LogLevel::DEBUG;
    BridgeService first(quiet);
    BridgeService second(verbose);
    EXPECT_EQ(utils::logLevel(), utils::LogLevel::WARN);

    applyLogConfig(quiet);
    EXPECT_EQ(utils::logLevel(), utils::LogLevel::OFF);
    utils::setLogLevel(previous);
}
