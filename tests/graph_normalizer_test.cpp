#include "gtest/gtest.h"
#include <relgraph/graph/model/graph_normalizer.h>
#include <relgraph/graph/model/node_palette.h>

#include <string>

using namespace relgraph::graph;

namespace {

NodeSpec MakeSpec(const std::string& id, const std::string& name, const std::string& type = "person") {
    NodeSpec spec;
    spec.id = id;
    spec.name = name;
    spec.type = type;
    return spec;
}

SourceDescriptor MakeSource() {
    SourceDescriptor source;
    source.title = "Letters from an American Farmer";
    source.author = "Crevecoeur";
    source.metadata = {{"title", source.title}, {"author", source.author}};
    return source;
}

const Viewport kViewport{ImVec2(800.0f, 600.0f)};

} // namespace

TEST(GraphNormalizerTest, FlatInputLinksEveryConnectionToSynthesizedSource) {
    FlatConnections flat;
    flat.connections.push_back(MakeSpec("a", "Alpha"));
    flat.connections.back().relationship = "direct";
    flat.connections.back().distance = 1.0;
    flat.connections.push_back(MakeSpec("b", "Beta", "place"));
    flat.connections.push_back(MakeSpec("c", "Gamma", "event"));

    Graph graph = NormalizeConnections(flat, MakeSource(), kViewport);

    ASSERT_EQ(graph.nodes.size(), 4u);
    ASSERT_EQ(graph.links.size(), 3u);
    const GraphNode* source = graph.GetSourceNode();
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->index, 0);
    EXPECT_EQ(source->label, "Letters from an American Farmer");
    EXPECT_EQ(source->radius, kSourceNodeRadius);
    EXPECT_EQ(source->metadata.value("author", std::string()), "Crevecoeur");

    for (size_t i = 0; i < graph.links.size(); ++i) {
        const GraphLink& link = graph.links[i];
        EXPECT_EQ(link.source_id, "source");
        EXPECT_EQ(link.source, 0);
        EXPECT_EQ(link.target, static_cast<NodeIndex>(i + 1));
        const GraphNode& target = graph.nodes[link.target];
        EXPECT_EQ(link.relationship, target.relationship_to_source.value());
        EXPECT_FLOAT_EQ(link.rest_length, RestLengthFor(link.distance_hint, link.relationship));
    }
    EXPECT_EQ(graph.links[0].relationship, Relationship::DIRECT);
    EXPECT_FLOAT_EQ(graph.links[0].distance_hint, 1.0f);
    EXPECT_EQ(graph.links[1].relationship, Relationship::INDIRECT);
}

TEST(GraphNormalizerTest, MissingFieldsGetDefaults) {
    FlatConnections flat;
    NodeSpec bare;
    bare.id = "x";
    flat.connections.push_back(bare);

    Graph graph = NormalizeConnections(flat, MakeSource(), kViewport);
    ASSERT_EQ(graph.nodes.size(), 2u);
    const GraphNode& node = graph.nodes[1];
    EXPECT_EQ(node.kind, "concept");
    EXPECT_EQ(node.label, "Connection 1");
    EXPECT_EQ(node.glyph, GlyphForKind("concept"));
    EXPECT_EQ(node.color, ColorForKind("concept"));
    EXPECT_FLOAT_EQ(node.distance_hint, 3.0f);
    EXPECT_FLOAT_EQ(node.radius, 22.0f - 3.0f * 2.5f);
    ASSERT_TRUE(node.relationship_to_source.has_value());
    EXPECT_EQ(*node.relationship_to_source, Relationship::INDIRECT);
    EXPECT_FALSE(node.seed_position.has_value());
}

TEST(GraphNormalizerTest, OutOfRangeHintAndMalformedColorFallBack) {
    FlatConnections flat;
    flat.connections.push_back(MakeSpec("far", "Far"));
    flat.connections.back().distance = 9.0;
    flat.connections.back().color = "blue";
    flat.connections.push_back(MakeSpec("red", "Red"));
    flat.connections.back().color = "#FF0000";
    flat.connections.back().size = 30.0f;

    Graph graph = NormalizeConnections(flat, MakeSource(), kViewport);
    ASSERT_EQ(graph.nodes.size(), 3u);
    EXPECT_FLOAT_EQ(graph.nodes[1].distance_hint, kDefaultDistanceHint);
    EXPECT_EQ(graph.nodes[1].color, ColorForKind("person"));
    EXPECT_EQ(graph.nodes[2].color, IM_COL32(0xFF, 0x00, 0x00, 0xFF));
    EXPECT_FLOAT_EQ(graph.nodes[2].radius, 30.0f);
}

TEST(GraphNormalizerTest, DuplicateIdsKeepFirstOccurrence) {
    FlatConnections flat;
    flat.connections.push_back(MakeSpec("a", "First"));
    flat.connections.push_back(MakeSpec("a", "Second"));
    flat.connections.push_back(MakeSpec("source", "Impostor"));
    flat.connections.push_back(MakeSpec("b", "Beta"));

    Graph graph = NormalizeConnections(flat, MakeSource(), kViewport);
    ASSERT_EQ(graph.nodes.size(), 3u);
    EXPECT_EQ(graph.nodes[1].label, "First");
    EXPECT_EQ(graph.nodes[2].id, "b");
    EXPECT_EQ(graph.links.size(), 2u);

    int source_count = 0;
    for (const auto& node : graph.nodes) {
        if (node.IsSource()) ++source_count;
    }
    EXPECT_EQ(source_count, 1);
}

TEST(GraphNormalizerTest, PrebuiltDropsDanglingAndSelfLinks) {
    PrebuiltGraph prebuilt;
    prebuilt.connections.push_back(MakeSpec("a", "Alpha"));
    prebuilt.connections.push_back(MakeSpec("b", "Beta"));
    prebuilt.links.push_back({"source", "a", std::string("direct"), 2.0, "person"});
    prebuilt.links.push_back({"a", "b", std::nullopt, std::nullopt, ""});
    prebuilt.links.push_back({"a", "missing", std::nullopt, std::nullopt, ""});
    prebuilt.links.push_back({"b", "b", std::nullopt, std::nullopt, ""});

    Graph graph = NormalizeConnections(prebuilt, MakeSource(), kViewport);
    ASSERT_EQ(graph.nodes.size(), 3u);
    ASSERT_EQ(graph.links.size(), 2u);
    for (const auto& link : graph.links) {
        EXPECT_NE(link.source, link.target);
        EXPECT_LT(static_cast<size_t>(link.source), graph.nodes.size());
        EXPECT_LT(static_cast<size_t>(link.target), graph.nodes.size());
    }
    EXPECT_EQ(graph.links[0].relationship, Relationship::DIRECT);
    EXPECT_FLOAT_EQ(graph.links[0].distance_hint, 2.0f);
}

TEST(GraphNormalizerTest, PrebuiltLinksWithoutDistanceDefaultToHintOne) {
    PrebuiltGraph prebuilt;
    prebuilt.connections.push_back(MakeSpec("a", "Alpha"));
    prebuilt.links.push_back({"source", "a", std::string("indirect"), std::nullopt, "person"});

    Graph graph = NormalizeConnections(prebuilt, MakeSource(), kViewport);
    ASSERT_EQ(graph.links.size(), 1u);
    EXPECT_FLOAT_EQ(graph.links[0].distance_hint, kDefaultLinkDistanceHint);
    EXPECT_FLOAT_EQ(graph.links[0].rest_length, RestLengthFor(1.0f, Relationship::INDIRECT));
}

TEST(GraphNormalizerTest, PayloadSourceNodeIsRenamed) {
    PrebuiltGraph prebuilt;
    NodeSpec root = MakeSpec("root", "The Document", "source");
    root.emoji = "X";
    prebuilt.source_node = root;
    prebuilt.connections.push_back(MakeSpec("a", "Alpha"));
    prebuilt.connections.push_back(MakeSpec("root", "Duplicate of root"));
    prebuilt.links.push_back({"root", "a", std::string("direct"), 1.0, "person"});

    Graph graph = NormalizeConnections(prebuilt, MakeSource(), kViewport);
    ASSERT_EQ(graph.nodes.size(), 2u);
    EXPECT_EQ(graph.nodes[0].id, "source");
    EXPECT_EQ(graph.nodes[0].label, "The Document");
    EXPECT_EQ(graph.nodes[0].glyph, "X");
    EXPECT_FALSE(graph.FindNode("root").has_value());
    ASSERT_EQ(graph.links.size(), 1u);
    EXPECT_EQ(graph.links[0].source_id, "source");
    EXPECT_EQ(graph.links[0].source, 0);
}

TEST(GraphNormalizerTest, ZeroConnectionsGiveEmptyGraph) {
    EXPECT_TRUE(NormalizeConnections(FlatConnections{}, MakeSource(), kViewport).Empty());

    PrebuiltGraph only_source;
    only_source.source_node = MakeSpec("source", "Doc", "source");
    EXPECT_TRUE(NormalizeConnections(only_source, MakeSource(), kViewport).Empty());
}

TEST(GraphNormalizerTest, SourceIsSeededAtViewportCenter) {
    FlatConnections flat;
    flat.connections.push_back(MakeSpec("a", "Alpha"));
    Viewport viewport{ImVec2(1000.0f, 500.0f)};

    Graph graph = NormalizeConnections(flat, MakeSource(), viewport);
    ASSERT_TRUE(graph.nodes[0].seed_position.has_value());
    EXPECT_FLOAT_EQ(graph.nodes[0].seed_position->x, 500.0f);
    EXPECT_FLOAT_EQ(graph.nodes[0].seed_position->y, 250.0f);
}

TEST(GraphNormalizerTest, NormalizingExportedGraphIsIdempotent) {
    FlatConnections flat;
    flat.connections.push_back(MakeSpec("a", "Alpha"));
    flat.connections.back().relationship = "direct";
    flat.connections.back().distance = 2.0;
    flat.connections.back().extra = {{"description", "A figure"}, {"year", "1782"}};
    flat.connections.push_back(MakeSpec("b", "", "work"));
    flat.connections.back().color = "#112233";
    flat.connections.push_back(MakeSpec("c", "Gamma", "unknown-kind"));
    flat.connections.back().distance = 7.0;

    const SourceDescriptor source = MakeSource();
    Graph first = NormalizeConnections(flat, source, kViewport);
    Graph second = NormalizeConnections(ToPrebuilt(first), source, kViewport);
    EXPECT_TRUE(first == second);

    Graph third = NormalizeConnections(ToPrebuilt(second), source, kViewport);
    EXPECT_TRUE(second == third);
}

TEST(GraphNormalizerTest, DirectLinkRestsShorterThanIndirectAtSameHint) {
    FlatConnections flat;
    flat.connections.push_back(MakeSpec("near", "Near"));
    flat.connections.back().relationship = "direct";
    flat.connections.back().distance = 3.0;
    flat.connections.push_back(MakeSpec("far", "Far"));
    flat.connections.back().relationship = "indirect";
    flat.connections.back().distance = 3.0;

    Graph graph = NormalizeConnections(flat, MakeSource(), kViewport);
    ASSERT_EQ(graph.links.size(), 2u);
    EXPECT_LT(graph.links[0].rest_length, graph.links[1].rest_length);
}

TEST(GraphNormalizerTest, CountsAndDegrees) {
    PrebuiltGraph prebuilt;
    prebuilt.connections.push_back(MakeSpec("a", "Alpha"));
    prebuilt.connections.push_back(MakeSpec("b", "Beta"));
    prebuilt.links.push_back({"source", "a", std::nullopt, std::nullopt, ""});
    prebuilt.links.push_back({"source", "b", std::nullopt, std::nullopt, ""});
    prebuilt.links.push_back({"a", "b", std::nullopt, std::nullopt, ""});

    ConnectionsInput input = prebuilt;
    EXPECT_EQ(ConnectionCount(input), 2u);
    EXPECT_EQ(LinkCount(input), 3u);
    EXPECT_EQ(LinkCount(ConnectionsInput(FlatConnections{prebuilt.connections})), 0u);

    Graph graph = NormalizeConnections(input, MakeSource(), kViewport);
    std::vector<int> degrees = graph.Degrees();
    ASSERT_EQ(degrees.size(), 3u);
    EXPECT_EQ(degrees[0], 2);
    EXPECT_EQ(degrees[1], 2);
    EXPECT_EQ(degrees[2], 2);
}

TEST(GraphNormalizerTest, SourceDisplayNameFallsBack) {
    SourceDescriptor source;
    EXPECT_EQ(source.DisplayName(), "Primary Source");
    source.author = "Anonymous";
    EXPECT_EQ(source.DisplayName(), "Anonymous");
    source.title = "Diary";
    EXPECT_EQ(source.DisplayName(), "Diary");
}
