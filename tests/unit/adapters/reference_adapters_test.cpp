#include <gtest/gtest.h>
#include "agentbridge/adapters/capability_adapter.h"
#include "agentbridge/adapters/role_goal_adapter.h"
#include "agentbridge/adapters/tool_call_adapter.h"
#include "agentbridge/core/errors.h"
#include "agentbridge/core/round_trip_harness.h"
#include "../../common/sample_agents.h"
#include <algorithm>

using namespace agentbridge;
using namespace agentbridge::core;
using agentbridge::adapters::CapabilityAdapter;
using agentbridge::adapters::RoleGoalAdapter;
using agentbridge::adapters::ToolCallAdapter;

namespace {
    bool hasPath(const std::vector<UnmappedField>& fields, const std::string& path) {
        return std::any_of(fields.begin(), fields.end(),
                           [&path](const UnmappedField& field) { return field.path == path; });
    }

    bool hasPath(const std::vector<LossyMapping>& mappings, const std::string& path) {
        return std::any_of(mappings.begin(), mappings.end(),
                           [&path](const LossyMapping& mapping) { return mapping.path == path; });
    }
}

// --- ToolCallAdapter ---

class ToolCallAdapterTest : public ::testing::Test {
protected:
    ToolCallAdapter adapter;
    RoundTripHarness harness;
};

TEST_F(ToolCallAdapterTest, MapsCoreFields) {
    auto result = adapter.toCanonical(samples::toolCallAgent(), TransformOptions{});
    const std::string agent = agentIdentifier("research-assistant");

    EXPECT_EQ(result.agentId, "research-assistant");
    EXPECT_TRUE(result.report.success);
    EXPECT_DOUBLE_EQ(result.report.fidelityScore, 1.0);
    EXPECT_TRUE(result.report.unmappedFields.empty());
    EXPECT_EQ(result.graph.agentNode(), agent);
    EXPECT_EQ(result.graph.firstObject(agent, vocab::NAME)->value, "Research Assistant");
    EXPECT_EQ(result.graph.objectsOf(agent, vocab::TAG).size(), 2u);
    EXPECT_EQ(result.graph.objectsOf(agent, vocab::HAS_TOOL).size(), 2u);
    EXPECT_EQ(result.graph.firstObject(agent, vocab::LLM_MODEL)->value, "gpt-4");

    const std::string search = childIdentifier("research-assistant", "tool", "web-search");
    auto schema = result.graph.firstObject(search, vocab::TOOL_INPUT_SCHEMA);
    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(schema->toJson()["type"], "object");
}

TEST_F(ToolCallAdapterTest, AgentIdOverride) {
    TransformOptions options;
    options.agentId = "custom";
    auto result = adapter.toCanonical(samples::toolCallAgent(), options);
    EXPECT_EQ(result.agentId, "custom");
    EXPECT_EQ(result.graph.agentNode(), "agent:custom");
}

TEST_F(ToolCallAdapterTest, MissingNameIsTransformError) {
    EXPECT_THROW(adapter.toCanonical(nlohmann::json{{"description", "anonymous"}}, TransformOptions{}),
                 TransformError);
    EXPECT_THROW(adapter.toCanonical(nlohmann::json::array(), TransformOptions{}), TransformError);
}

TEST_F(ToolCallAdapterTest, UnknownFieldsArePreservedNotDropped) {
    auto native = samples::toolCallAgent();
    native["metadata"] = {{"owner", "team-a"}};
    native["model"]["top_p"] = 0.9;
    native["tools"][1]["strict"] = true;

    auto result = adapter.toCanonical(native, TransformOptions{});
    EXPECT_TRUE(hasPath(result.report.unmappedFields, "metadata"));
    EXPECT_TRUE(hasPath(result.report.unmappedFields, "model.top_p"));
    EXPECT_TRUE(hasPath(result.report.unmappedFields, "tools[1].strict"));
    EXPECT_LT(result.report.fidelityScore, 1.0);
    EXPECT_GT(result.report.fidelityScore, 0.9);

    auto rendered = adapter.fromCanonical(result.graph, TransformOptions{});
    EXPECT_EQ(rendered.native["metadata"]["owner"], "team-a");
    EXPECT_DOUBLE_EQ(rendered.native["model"]["top_p"].get<double>(), 0.9);
    EXPECT_EQ(rendered.native["tools"][1]["strict"], true);
    EXPECT_DOUBLE_EQ(rendered.report.fidelityScore, 1.0);
}

TEST_F(ToolCallAdapterTest, DuplicateToolIsLossy) {
    nlohmann::json native = {{"name", "dup"}, {"tools", {"search", "Search"}}};
    auto result = adapter.toCanonical(native, TransformOptions{});
    EXPECT_EQ(result.graph.objectsOf("agent:dup", vocab::HAS_TOOL).size(), 1u);
    EXPECT_TRUE(hasPath(result.report.lossyMappings, "tools[1]"));
}

TEST_F(ToolCallAdapterTest, ForeignExtensionsAreReportedLossy) {
    RoleGoalAdapter rolegoal;
    auto native = samples::roleGoalAgent();
    native["verbose"] = true;
    auto canonical = rolegoal.toCanonical(native, TransformOptions{});

    auto rendered = adapter.fromCanonical(canonical.graph, TransformOptions{});
    EXPECT_FALSE(rendered.native.contains("verbose"));
    EXPECT_TRUE(hasPath(rendered.report.lossyMappings, "ext:rolegoal:verbose"));
    EXPECT_TRUE(hasPath(rendered.report.lossyMappings, vocab::ROLE));
    EXPECT_LT(rendered.report.fidelityScore, 1.0);
}

TEST_F(ToolCallAdapterTest, FromCanonicalRequiresAgentNode) {
    CanonicalGraph graph;
    graph.addLiteral("agent:x", vocab::NAME, Term::literal("x"));
    EXPECT_THROW(adapter.fromCanonical(graph, TransformOptions{}), TransformError);
}

TEST_F(ToolCallAdapterTest, Validate) {
    EXPECT_TRUE(adapter.validate(samples::toolCallAgent()).valid);

    auto invalid = adapter.validate(nlohmann::json{{"tools", "search"}});
    EXPECT_FALSE(invalid.valid);
    EXPECT_EQ(invalid.errors.size(), 2u);

    auto warned = adapter.validate(nlohmann::json{{"name", "a"}, {"extra", 1}});
    EXPECT_TRUE(warned.valid);
    ASSERT_EQ(warned.warnings.size(), 1u);
    EXPECT_EQ(warned.warnings[0].path, "extra");
}

TEST_F(ToolCallAdapterTest, RoundTripMeetsThreshold) {
    auto result = harness.runTest(adapter, samples::toolCallAgent());
    EXPECT_TRUE(result.passed);
    EXPECT_TRUE(result.exactMatch);
    EXPECT_GE(result.fidelity, 0.95);
}

TEST_F(ToolCallAdapterTest, Capabilities) {
    EXPECT_TRUE(adapter.supportsFeature("tools"));
    EXPECT_TRUE(adapter.supportsFeature("llm-config"));
    EXPECT_FALSE(adapter.supportsFeature("role-goal"));
}

// --- RoleGoalAdapter ---

class RoleGoalAdapterTest : public ::testing::Test {
protected:
    RoleGoalAdapter adapter;
    RoundTripHarness harness;
};

TEST_F(RoleGoalAdapterTest, MapsCoreFields) {
    auto result = adapter.toCanonical(samples::roleGoalAgent(), TransformOptions{});
    const std::string agent = agentIdentifier("research-assistant");

    EXPECT_EQ(result.agentId, "research-assistant");
    EXPECT_DOUBLE_EQ(result.report.fidelityScore, 1.0);
    EXPECT_EQ(result.graph.firstObject(agent, vocab::ROLE)->value, "Senior Researcher");
    EXPECT_EQ(result.graph.firstObject(agent, vocab::LLM_PROVIDER)->value, "openai");
    EXPECT_EQ(result.graph.firstObject(agent, vocab::LLM_MODEL)->value, "gpt-4");
    EXPECT_EQ(result.graph.firstObject(agent, vocab::MAX_ITERATIONS)->toJson(), 15);
    EXPECT_EQ(result.graph.firstObject(agent, vocab::MEMORY_ENABLED)->toJson(), true);
}

TEST_F(RoleGoalAdapterTest, AgentIdFallsBackToRole) {
    auto result = adapter.toCanonical(nlohmann::json{{"role", "Data Analyst"}}, TransformOptions{});
    EXPECT_EQ(result.agentId, "data-analyst");
}

TEST_F(RoleGoalAdapterTest, MissingRoleIsTransformError) {
    EXPECT_THROW(adapter.toCanonical(nlohmann::json{{"name", "nobody"}}, TransformOptions{}), TransformError);
}

TEST_F(RoleGoalAdapterTest, BareLlmIsModelName) {
    auto result = adapter.toCanonical(nlohmann::json{{"role", "r"}, {"llm", "gpt-4"}}, TransformOptions{});
    EXPECT_EQ(result.graph.firstObject("agent:r", vocab::LLM_MODEL)->value, "gpt-4");
    EXPECT_FALSE(result.graph.firstObject("agent:r", vocab::LLM_PROVIDER).has_value());

    auto rendered = adapter.fromCanonical(result.graph, TransformOptions{});
    EXPECT_EQ(rendered.native["llm"], "gpt-4");
}

TEST_F(RoleGoalAdapterTest, ToolSchemasAreLost) {
    ToolCallAdapter toolcall;
    auto canonical = toolcall.toCanonical(samples::toolCallAgent(), TransformOptions{});
    auto rendered = adapter.fromCanonical(canonical.graph, TransformOptions{});

    EXPECT_TRUE(hasPath(rendered.report.lossyMappings, vocab::TOOL_INPUT_SCHEMA));
    EXPECT_EQ(rendered.native["role"], "Research Assistant");
    EXPECT_FALSE(rendered.report.warnings.empty());
}

TEST_F(RoleGoalAdapterTest, ValidateWarnsWithoutGoal) {
    auto result = adapter.validate(nlohmann::json{{"role", "r"}});
    EXPECT_TRUE(result.valid);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].path, "goal");

    EXPECT_FALSE(adapter.validate(nlohmann::json{{"role", "r"}, {"max_iter", "ten"}}).valid);
}

TEST_F(RoleGoalAdapterTest, RoundTripMeetsThreshold) {
    auto native = samples::roleGoalAgent();
    native["allow_delegation"] = false;
    auto result = harness.runTest(adapter, native);
    EXPECT_TRUE(result.passed);
    EXPECT_TRUE(result.exactMatch);
}

// --- CapabilityAdapter ---

class CapabilityAdapterTest : public ::testing::Test {
protected:
    CapabilityAdapter adapter;
    RoundTripHarness harness;
};

TEST_F(CapabilityAdapterTest, MapsCoreFields) {
    auto result = adapter.toCanonical(samples::capabilityAgent(), TransformOptions{});
    const std::string agent = agentIdentifier("weather-agent");

    EXPECT_EQ(result.agentId, "weather-agent");
    EXPECT_DOUBLE_EQ(result.report.fidelityScore, 1.0);
    EXPECT_EQ(result.graph.firstObject(agent, vocab::NAME)->value, "Weather Agent");
    EXPECT_EQ(result.graph.objectsOf(agent, vocab::CAPABILITY).size(), 2u);
    EXPECT_EQ(result.graph.objectsOf(agent, vocab::PROTOCOL).size(), 2u);

    const std::string forecast = childIdentifier("weather-agent", "tool", "get-forecast");
    EXPECT_EQ(result.graph.firstObject(forecast, vocab::TOOL_NAME)->value, "get_forecast");
}

TEST_F(CapabilityAdapterTest, NonCanonicalIdIsPreserved) {
    nlohmann::json native = {{"id", "Weather.Agent"}};
    auto result = adapter.toCanonical(native, TransformOptions{});
    EXPECT_EQ(result.agentId, "weather-agent");
    EXPECT_TRUE(hasPath(result.report.unmappedFields, "id"));

    auto rendered = adapter.fromCanonical(result.graph, TransformOptions{});
    EXPECT_EQ(rendered.native["id"], "Weather.Agent");
}

TEST_F(CapabilityAdapterTest, DisabledProtocolsArePreserved) {
    auto native = samples::capabilityAgent();
    native["protocols"]["grpc"] = false;
    auto result = adapter.toCanonical(native, TransformOptions{});
    EXPECT_EQ(result.graph.objectsOf("agent:weather-agent", vocab::PROTOCOL).size(), 2u);
    EXPECT_TRUE(hasPath(result.report.unmappedFields, "protocols.grpc"));

    auto rendered = adapter.fromCanonical(result.graph, TransformOptions{});
    EXPECT_EQ(rendered.native["protocols"]["grpc"], false);
    EXPECT_EQ(rendered.native["protocols"]["http"], true);
}

TEST_F(CapabilityAdapterTest, MissingIdIsTransformError) {
    EXPECT_THROW(adapter.toCanonical(nlohmann::json{{"title", "x"}}, TransformOptions{}), TransformError);
}

TEST_F(CapabilityAdapterTest, RoundTripMeetsThreshold) {
    auto result = harness.runTest(adapter, samples::capabilityAgent());
    EXPECT_TRUE(result.passed);
    EXPECT_TRUE(result.exactMatch);
}

TEST_F(CapabilityAdapterTest, CrossFrameworkFromToolCall) {
    ToolCallAdapter toolcall;
    auto result = harness.runCrossFrameworkTest(toolcall, samples::toolCallAgent(), adapter, 0.0);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.kind, TestKind::CROSS_FRAMEWORK);
    EXPECT_DOUBLE_EQ(result.fidelity, result.forwardFidelity * result.reverseFidelity);
    EXPECT_LT(result.forwardFidelity, 1.0);
}
