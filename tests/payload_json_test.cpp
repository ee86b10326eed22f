#include "gtest/gtest.h"
#include <relgraph/graph/model/payload_json.h>

#include <stdexcept>
#include <string>
#include <variant>

using namespace relgraph::graph;
using nlohmann::json;

TEST(PayloadJsonTest, TopLevelArrayIsFlat) {
    ConnectionsInput input = ParseConnectionsPayload(std::string(R"([{"id":"a","name":"Alpha"},{"id":"b","name":"Beta"}])"));
    ASSERT_TRUE(std::holds_alternative<FlatConnections>(input));
    const auto& flat = std::get<FlatConnections>(input);
    ASSERT_EQ(flat.connections.size(), 2u);
    EXPECT_EQ(flat.connections[0].id, "a");
    EXPECT_EQ(flat.connections[1].name, "Beta");
}

TEST(PayloadJsonTest, ObjectWithoutLinksIsFlat) {
    json doc = {{"connections", json::array({{{"id", "a"}, {"name", "Alpha"}, {"relationship", "direct"}, {"distance", 2}}})}};
    ConnectionsInput input = ParseConnectionsPayload(doc);
    ASSERT_TRUE(std::holds_alternative<FlatConnections>(input));
    const NodeSpec& spec = std::get<FlatConnections>(input).connections.at(0);
    EXPECT_EQ(spec.relationship.value(), "direct");
    EXPECT_DOUBLE_EQ(spec.distance.value(), 2.0);
}

TEST(PayloadJsonTest, ObjectWithLinksIsPrebuilt) {
    json doc = json::parse(R"({
        "sourceNode": {"id": "root", "name": "Doc", "type": "source"},
        "connections": [{"id": "a", "name": "Alpha"}],
        "links": [{"source": "root", "target": "a", "relationship": "direct", "distance": 2, "type": "person"}]
    })");
    ConnectionsInput input = ParseConnectionsPayload(doc);
    ASSERT_TRUE(std::holds_alternative<PrebuiltGraph>(input));
    const auto& prebuilt = std::get<PrebuiltGraph>(input);
    ASSERT_TRUE(prebuilt.source_node.has_value());
    EXPECT_EQ(prebuilt.source_node->id, "root");
    ASSERT_EQ(prebuilt.links.size(), 1u);
    EXPECT_EQ(prebuilt.links[0].source, "root");
    EXPECT_EQ(prebuilt.links[0].target, "a");
    EXPECT_DOUBLE_EQ(prebuilt.links[0].distance.value(), 2.0);
    EXPECT_EQ(prebuilt.links[0].type, "person");
}

TEST(PayloadJsonTest, SourceNodeWithoutIdBecomesSource) {
    json doc = json::parse(R"({"sourceNode": {"name": "Doc"}, "connections": [], "links": []})");
    ConnectionsInput input = ParseConnectionsPayload(doc);
    const auto& prebuilt = std::get<PrebuiltGraph>(input);
    ASSERT_TRUE(prebuilt.source_node.has_value());
    EXPECT_EQ(prebuilt.source_node->id, "source");
}

TEST(PayloadJsonTest, MalformedDocumentsThrow) {
    EXPECT_THROW(ParseConnectionsPayload(std::string("42")), std::runtime_error);
    EXPECT_THROW(ParseConnectionsPayload(std::string(R"({"connections": 5})")), std::runtime_error);
    EXPECT_THROW(ParseConnectionsPayload(std::string("not json at all")), std::runtime_error);
    EXPECT_THROW(ParseConnectionsPayload(json("text")), std::runtime_error);
}

TEST(PayloadJsonTest, MalformedEntriesAreSkipped) {
    json doc = json::parse(R"([1, {"id": "a"}, {"id": [1]}, {"id": "b", "name": 5}, {"name": "Nameless id"}])");
    ConnectionsInput input = ParseConnectionsPayload(doc);
    const auto& flat = std::get<FlatConnections>(input);
    ASSERT_EQ(flat.connections.size(), 2u);
    EXPECT_EQ(flat.connections[0].id, "a");
    EXPECT_EQ(flat.connections[1].id, "connection-5");
    EXPECT_EQ(flat.connections[1].name, "Nameless id");
}

TEST(PayloadJsonTest, WrongTypedFieldsAreIgnored) {
    json entry = {{"id", 12}, {"distance", "far"}, {"size", "big"}, {"type", 3}, {"x", 1.0}};
    auto spec = ParseNodeSpec(entry, 1);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->id, "12");
    EXPECT_FALSE(spec->distance.has_value());
    EXPECT_FALSE(spec->size.has_value());
    EXPECT_EQ(spec->type, "");
    // Only one coordinate: no seed position.
    EXPECT_FALSE(spec->position.has_value());
}

TEST(PayloadJsonTest, UninterpretedKeysLandInExtra) {
    json entry = {{"id", "a"}, {"name", "Alpha"}, {"description", "Someone"}, {"year", 1782},
                  {"wikipediaTitle", "Alpha_(person)"}, {"x", 10.0}, {"y", 20.0}};
    auto spec = ParseNodeSpec(entry, 1);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->extra.size(), 3u);
    EXPECT_EQ(spec->extra["description"].get<std::string>(), "Someone");
    EXPECT_EQ(spec->extra["year"].get<int>(), 1782);
    ASSERT_TRUE(spec->position.has_value());
    EXPECT_FLOAT_EQ(spec->position->x, 10.0f);
    EXPECT_FLOAT_EQ(spec->position->y, 20.0f);
}

TEST(PayloadJsonTest, LinkEndpointsMayBeObjectsOrNumbers) {
    auto link = ParseLinkSpec(json::parse(R"({"source": {"id": "a", "x": 3}, "target": 7})"));
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->source, "a");
    EXPECT_EQ(link->target, "7");

    EXPECT_FALSE(ParseLinkSpec(json::parse(R"({"source": "a"})")).has_value());
    EXPECT_FALSE(ParseLinkSpec(json::parse(R"({"source": {"name": "x"}, "target": "b"})")).has_value());
    EXPECT_FALSE(ParseLinkSpec(json("a->b")).has_value());
}

TEST(PayloadJsonTest, SourceDescriptorReadsMetadata) {
    json doc = json::parse(R"({
        "metadata": {"title": "Diary", "author": "Anne", "documentEmoji": "D", "date": "1944"},
        "content": "Dear Kitty"
    })");
    SourceDescriptor source = ParseSourceDescriptor(doc);
    EXPECT_EQ(source.title, "Diary");
    EXPECT_EQ(source.author, "Anne");
    EXPECT_EQ(source.glyph, "D");
    EXPECT_EQ(source.content, "Dear Kitty");
    EXPECT_EQ(source.metadata["date"].get<std::string>(), "1944");
    EXPECT_EQ(source.DisplayName(), "Diary");

    SourceDescriptor untitled = ParseSourceDescriptor(json::parse(R"({"metadata": {"author": "Anne"}})"));
    EXPECT_EQ(untitled.DisplayName(), "Anne");
    EXPECT_EQ(ParseSourceDescriptor(json::array()).DisplayName(), "Primary Source");
}

TEST(PayloadJsonTest, GraphSurvivesJsonExport) {
    SourceDescriptor source;
    source.title = "Diary";
    source.metadata = {{"title", "Diary"}};
    Viewport viewport;

    json doc = json::parse(R"([
        {"id": "a", "name": "Alpha", "type": "person", "relationship": "direct", "distance": 1, "description": "Writer"},
        {"id": "b", "name": "Beta", "type": "place", "relationship": "indirect", "distance": 4},
        {"id": "c", "type": "fact", "color": "#0F0"}
    ])");
    Graph original = NormalizeConnections(ParseConnectionsPayload(doc), source, viewport);
    json exported = ToJson(original);
    ASSERT_TRUE(exported.contains("links"));
    EXPECT_EQ(exported["connections"].size(), 3u);
    EXPECT_EQ(exported["sourceNode"]["id"].get<std::string>(), "source");

    Graph reparsed = NormalizeConnections(ParseConnectionsPayload(exported.dump()), source, viewport);
    EXPECT_TRUE(original == reparsed);
}
