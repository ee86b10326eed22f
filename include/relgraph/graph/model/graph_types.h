#ifndef RELGRAPH_GRAPH_TYPES_H
#define RELGRAPH_GRAPH_TYPES_H

#include <imgui.h>
#include <nlohmann/json.hpp>
#include <relgraph/core/id_types.h>

#include <optional>
#include <string>
#include <vector>

namespace relgraph {
namespace graph {

enum class Relationship {
    DIRECT,
    INDIRECT
};

const char* ToString(Relationship relationship);
std::optional<Relationship> ParseRelationship(const std::string& text);

struct GraphNode {
    std::string id;
    std::string label;
    std::string glyph;
    std::string kind;
    ImU32 color = 0;
    float radius = 0.0f;
    float distance_hint = 0.0f;
    std::optional<Relationship> relationship_to_source;
    std::optional<ImVec2> seed_position;
    nlohmann::json metadata = nlohmann::json::object();
    NodeIndex index = kInvalidNodeIndex;

    bool IsSource() const { return id == kSourceNodeId; }
    // Free-text description carried in metadata, empty when absent.
    std::string Description() const;
};

struct GraphLink {
    std::string source_id;
    std::string target_id;
    NodeIndex source = kInvalidNodeIndex;
    NodeIndex target = kInvalidNodeIndex;
    Relationship relationship = Relationship::INDIRECT;
    float distance_hint = 1.0f;
    float rest_length = 0.0f;
    std::string kind;
};

// Normalized, immutable graph. Links reference nodes by index into `nodes`.
struct Graph {
    std::vector<GraphNode> nodes;
    std::vector<GraphLink> links;

    bool Empty() const { return nodes.empty(); }
    std::optional<NodeIndex> FindNode(const std::string& id) const;
    const GraphNode* GetSourceNode() const;
    std::vector<int> Degrees() const;
};

bool operator==(const GraphNode& a, const GraphNode& b);
bool operator==(const GraphLink& a, const GraphLink& b);
bool operator==(const Graph& a, const Graph& b);

struct Viewport {
    ImVec2 size = ImVec2(800.0f, 600.0f);

    ImVec2 Center() const { return ImVec2(size.x * 0.5f, size.y * 0.5f); }
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_TYPES_H
