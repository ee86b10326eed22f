#include <relgraph/graph/model/graph_types.h>

namespace relgraph {
namespace graph {

const char* ToString(Relationship relationship) {
    switch (relationship) {
        case Relationship::DIRECT: return "direct";
        case Relationship::INDIRECT: return "indirect";
    }
    return "indirect";
}

std::optional<Relationship> ParseRelationship(const std::string& text) {
    if (text == "direct") return Relationship::DIRECT;
    if (text == "indirect") return Relationship::INDIRECT;
    return std::nullopt;
}

std::string GraphNode::Description() const {
    if (metadata.is_object()) {
        auto it = metadata.find("description");
        if (it != metadata.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

std::optional<NodeIndex> Graph::FindNode(const std::string& id) const {
    for (const auto& node : nodes) {
        if (node.id == id) return node.index;
    }
    return std::nullopt;
}

const GraphNode* Graph::GetSourceNode() const {
    auto index = FindNode(kSourceNodeId);
    if (!index) return nullptr;
    return &nodes[*index];
}

std::vector<int> Graph::Degrees() const {
    std::vector<int> degrees(nodes.size(), 0);
    for (const auto& link : links) {
        ++degrees[link.source];
        ++degrees[link.target];
    }
    return degrees;
}

namespace {
bool SameSeed(const std::optional<ImVec2>& a, const std::optional<ImVec2>& b) {
    if (a.has_value() != b.has_value()) return false;
    if (!a) return true;
    return a->x == b->x && a->y == b->y;
}
}

bool operator==(const GraphNode& a, const GraphNode& b) {
    return a.id == b.id && a.label == b.label && a.glyph == b.glyph && a.kind == b.kind &&
           a.color == b.color && a.radius == b.radius && a.distance_hint == b.distance_hint &&
           a.relationship_to_source == b.relationship_to_source &&
           SameSeed(a.seed_position, b.seed_position) && a.metadata == b.metadata &&
           a.index == b.index;
}

bool operator==(const GraphLink& a, const GraphLink& b) {
    return a.source_id == b.source_id && a.target_id == b.target_id &&
           a.source == b.source && a.target == b.target &&
           a.relationship == b.relationship && a.distance_hint == b.distance_hint &&
           a.rest_length == b.rest_length && a.kind == b.kind;
}

bool operator==(const Graph& a, const Graph& b) {
    return a.nodes == b.nodes && a.links == b.links;
}

} // namespace graph
} // namespace relgraph
