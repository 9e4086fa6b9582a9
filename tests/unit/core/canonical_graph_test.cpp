#include <gtest/gtest.h>
#include "agentbridge/core/canonical_graph.h"
#include "agentbridge/core/errors.h"
#include <algorithm>

using namespace agentbridge::core;

class CanonicalGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        agent = agentIdentifier("alpha");
        tool = childIdentifier("alpha", "tool", "search");
        graph.addObject(agent, vocab::TYPE, vocab::AGENT);
        graph.addLiteral(agent, vocab::NAME, Term::literal("Alpha"));
        graph.addObject(agent, vocab::HAS_TOOL, tool);
        graph.addObject(tool, vocab::TYPE, vocab::TOOL);
        graph.addLiteral(tool, vocab::TOOL_NAME, Term::literal("search"));
    }

    std::string agent;
    std::string tool;
    CanonicalGraph graph;
};

TEST_F(CanonicalGraphTest, InsertIsSetSemantics) {
    EXPECT_EQ(graph.size(), 5u);
    EXPECT_FALSE(graph.addLiteral(agent, vocab::NAME, Term::literal("Alpha")));
    EXPECT_EQ(graph.size(), 5u);

    // Same lexical value with another datatype is a different triple
    EXPECT_TRUE(graph.addLiteral(agent, vocab::VERSION, Term::literal(int64_t{2})));
    EXPECT_TRUE(graph.addLiteral(agent, vocab::VERSION, Term::literal("2")));
    EXPECT_EQ(graph.size(), 7u);
}

TEST_F(CanonicalGraphTest, AgentNode) {
    EXPECT_EQ(graph.agentNode(), agent);
    EXPECT_TRUE(graph.hasSingleAgent());

    graph.addObject(agentIdentifier("beta"), vocab::TYPE, vocab::AGENT);
    EXPECT_FALSE(graph.hasSingleAgent());
    EXPECT_THROW(graph.agentNode(), TransformError);

    CanonicalGraph empty;
    EXPECT_THROW(empty.agentNode(), TransformError);
}

TEST_F(CanonicalGraphTest, ObjectsOfReturnsOnlyMatchingPredicate) {
    graph.addLiteral(agent, vocab::TAG, Term::literal("a"));
    graph.addLiteral(agent, vocab::TAG, Term::literal("b"));

    auto tags = graph.objectsOf(agent, vocab::TAG);
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0].value, "a");
    EXPECT_EQ(tags[1].value, "b");

    EXPECT_TRUE(graph.objectsOf(agent, vocab::GOAL).empty());
    EXPECT_FALSE(graph.firstObject(agent, vocab::GOAL).has_value());
    EXPECT_EQ(graph.firstObject(tool, vocab::TOOL_NAME)->value, "search");
}

TEST_F(CanonicalGraphTest, TypedLiteralsConvertBack) {
    EXPECT_EQ(Term::literal(int64_t{42}).toJson(), 42);
    EXPECT_EQ(Term::literal(true).toJson(), true);
    EXPECT_DOUBLE_EQ(Term::literal(0.25).toJson().get<double>(), 0.25);
    nlohmann::json schema = {{"type", "object"}};
    EXPECT_EQ(Term::jsonLiteral(schema).toJson(), schema);

    Term broken{TermKind::LITERAL, "not a number", LiteralType::INTEGER};
    EXPECT_THROW(broken.toJson(), TransformError);
}

TEST_F(CanonicalGraphTest, TraceRelationshipsFollowsIdentifiers) {
    auto depth0 = graph.traceRelationships(agent, 0);
    EXPECT_EQ(depth0.size(), 3u);

    auto depth1 = graph.traceRelationships(agent, 1);
    EXPECT_EQ(depth1.size(), 5u);
}

TEST_F(CanonicalGraphTest, TraceRelationshipsTerminatesOnCycles) {
    graph.addObject(tool, "ab:usedBy", agent);
    auto traced = graph.traceRelationships(agent, 100);
    EXPECT_EQ(traced.size(), graph.size());
}

TEST_F(CanonicalGraphTest, ExtensionEntriesAreScopedByProtocol) {
    graph.addLiteral(agent, extensionPredicate("toolcall", "metadata.owner"), Term::jsonLiteral("team-a"));
    graph.addLiteral(agent, extensionPredicate("rolegoal", "verbose"), Term::jsonLiteral(true));

    auto toolcall = graph.extensionEntries(agent, "toolcall");
    ASSERT_EQ(toolcall.size(), 1u);
    EXPECT_EQ(toolcall["metadata.owner"], "team-a");

    auto rolegoal = graph.extensionEntries(agent, "rolegoal");
    ASSERT_EQ(rolegoal.size(), 1u);
    EXPECT_EQ(rolegoal["verbose"], true);

    EXPECT_TRUE(graph.extensionEntries(agent, "capability").empty());
}

TEST(CanonicalIdentifiersTest, ExtensionPredicateParsing) {
    auto parsed = parseExtensionPredicate("ext:toolcall:model.top_p");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->first, "toolcall");
    EXPECT_EQ(parsed->second, "model.top_p");

    EXPECT_FALSE(parseExtensionPredicate("ab:name").has_value());
    EXPECT_FALSE(parseExtensionPredicate("ext:toolcall").has_value());
    EXPECT_FALSE(parseExtensionPredicate("ext::field").has_value());
}

TEST(CanonicalIdentifiersTest, AgentIdFromIdentifier) {
    EXPECT_EQ(agentIdFromIdentifier("agent:alpha"), "alpha");
    EXPECT_EQ(agentIdFromIdentifier(childIdentifier("alpha", "tool", "x")), "alpha");
    EXPECT_FALSE(agentIdFromIdentifier("tool:x").has_value());
    EXPECT_FALSE(agentIdFromIdentifier("agent:").has_value());
}

TEST(CanonicalIdentifiersTest, Slugify) {
    EXPECT_EQ(slugify("Research Assistant"), "research-assistant");
    EXPECT_EQ(slugify("  web__search!! "), "web-search");
    EXPECT_EQ(slugify("GPT-4"), "gpt-4");
    EXPECT_EQ(slugify("???"), "");
}

TEST(CanonicalCategoryTest, CorePredicatesHaveCategories) {
    EXPECT_EQ(categoryOf(vocab::NAME), SemanticCategory::IDENTITY);
    EXPECT_EQ(categoryOf(vocab::HAS_TOOL), SemanticCategory::CAPABILITIES);
    EXPECT_EQ(categoryOf(vocab::INSTRUCTION), SemanticCategory::INSTRUCTIONS);
    EXPECT_EQ(categoryOf(vocab::MEMORY_ENABLED), SemanticCategory::STATE);
    EXPECT_EQ(categoryOf(vocab::LLM_MODEL), SemanticCategory::EXECUTION);
    EXPECT_FALSE(categoryOf("ext:toolcall:anything").has_value());
}

TEST_F(CanonicalGraphTest, JsonSerializationRoundTrip) {
    graph.addLiteral(agent, vocab::TEMPERATURE, Term::literal(0.7));
    graph.addLiteral(agent, vocab::MEMORY_ENABLED, Term::literal(false));

    auto restored = CanonicalGraph::fromJson(graph.toJson());
    EXPECT_EQ(restored, graph);
    EXPECT_EQ(restored.toJson().dump(), graph.toJson().dump());

    EXPECT_THROW(CanonicalGraph::fromJson(nlohmann::json{{"nothing", 1}}), TransformError);
}

TEST_F(CanonicalGraphTest, NTriplesOutput) {
    graph.addLiteral(agent, vocab::DESCRIPTION, Term::literal("says \"hi\""));
    std::string text = graph.toNTriples();

    EXPECT_NE(text.find("<agent:alpha> <ab:name> \"Alpha\"^^string ."), std::string::npos);
    EXPECT_NE(text.find("<agent:alpha> <ab:hasTool> <agent:alpha/tool/search> ."), std::string::npos);
    EXPECT_NE(text.find("\\\"hi\\\""), std::string::npos);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), static_cast<long>(graph.size()));
}
