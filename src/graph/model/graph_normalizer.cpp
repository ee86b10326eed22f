#include <relgraph/graph/model/graph_normalizer.h>
#include <relgraph/graph/model/node_palette.h>

#include <cmath>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

namespace relgraph {
namespace graph {

std::string SourceDescriptor::DisplayName() const {
    if (!title.empty()) return title;
    if (!author.empty()) return author;
    return "Primary Source";
}

namespace {

float ValidatedHint(const std::optional<double>& distance, float fallback) {
    if (!distance) return fallback;
    if (!IsValidDistanceHint(*distance)) {
        std::cerr << "Warning: distance hint " << *distance << " outside 1..5, using " << fallback << std::endl;
        return fallback;
    }
    return static_cast<float>(*distance);
}

Relationship RelationshipOf(const std::optional<std::string>& text, const std::string& owner) {
    if (!text) return Relationship::INDIRECT;
    if (auto parsed = ParseRelationship(*text)) return *parsed;
    std::cerr << "Warning: unknown relationship '" << *text << "' on " << owner
              << ", treating as indirect" << std::endl;
    return Relationship::INDIRECT;
}

ImU32 ColorOf(const NodeSpec& spec, const std::string& kind) {
    if (spec.color) {
        if (auto parsed = ParseHexColor(*spec.color)) return *parsed;
        std::cerr << "Warning: malformed color '" << *spec.color << "' on node " << spec.id << std::endl;
    }
    return ColorForKind(kind);
}

bool HasUsableSize(const NodeSpec& spec) {
    return spec.size && std::isfinite(*spec.size) && *spec.size > 0.0f;
}

GraphNode BuildConnectionNode(const NodeSpec& spec, size_t ordinal) {
    GraphNode node;
    node.id = spec.id;
    node.kind = spec.type.empty() ? kDefaultNodeKind : spec.type;
    node.label = spec.name.empty() ? "Connection " + std::to_string(ordinal) : spec.name;
    node.glyph = spec.emoji.empty() ? GlyphForKind(node.kind) : spec.emoji;
    node.color = ColorOf(spec, node.kind);
    node.distance_hint = ValidatedHint(spec.distance, kDefaultDistanceHint);
    node.radius = HasUsableSize(spec) ? *spec.size : RadiusForDistance(node.distance_hint);
    node.relationship_to_source = RelationshipOf(spec.relationship, "node " + spec.id);
    node.seed_position = spec.position;
    node.metadata = spec.extra.is_object() ? spec.extra : nlohmann::json::object();
    return node;
}

GraphNode BuildSourceNode(const std::optional<NodeSpec>& spec,
                          const SourceDescriptor& source,
                          const Viewport& viewport) {
    GraphNode node;
    node.id = kSourceNodeId;
    node.seed_position = viewport.Center();
    if (spec) {
        node.kind = spec->type.empty() ? kSourceNodeKind : spec->type;
        node.label = spec->name.empty() ? source.DisplayName() : spec->name;
        node.glyph = spec->emoji.empty() ? GlyphForKind(node.kind) : spec->emoji;
        node.color = ColorOf(*spec, node.kind);
        node.radius = HasUsableSize(*spec) ? *spec->size : kSourceNodeRadius;
        node.metadata = spec->extra.is_object() ? spec->extra : nlohmann::json::object();
    } else {
        node.kind = kSourceNodeKind;
        node.label = source.DisplayName();
        node.glyph = source.glyph.empty() ? kDefaultSourceGlyph : source.glyph;
        node.color = ColorForKind(kSourceNodeKind);
        node.radius = kSourceNodeRadius;
        node.metadata = source.metadata.is_object() ? source.metadata : nlohmann::json::object();
    }
    return node;
}

class GraphBuilder {
public:
    bool AddNode(GraphNode node) {
        if (node.id.empty()) {
            std::cerr << "Warning: dropping node without id ('" << node.label << "')" << std::endl;
            return false;
        }
        if (index_by_id_.count(node.id)) {
            std::cerr << "Warning: duplicate node id '" << node.id << "', keeping first occurrence" << std::endl;
            return false;
        }
        node.index = static_cast<NodeIndex>(graph_.nodes.size());
        index_by_id_.emplace(node.id, node.index);
        graph_.nodes.push_back(std::move(node));
        return true;
    }

    void AddLink(const std::string& source_id, const std::string& target_id,
                 Relationship relationship, float hint, const std::string& kind) {
        auto source_it = index_by_id_.find(source_id);
        auto target_it = index_by_id_.find(target_id);
        if (source_it == index_by_id_.end() || target_it == index_by_id_.end()) {
            std::cerr << "Warning: dropping dangling link " << source_id << " -> " << target_id << std::endl;
            return;
        }
        if (source_it->second == target_it->second) {
            std::cerr << "Warning: dropping self link on " << source_id << std::endl;
            return;
        }
        GraphLink link;
        link.source_id = source_id;
        link.target_id = target_id;
        link.source = source_it->second;
        link.target = target_it->second;
        link.relationship = relationship;
        link.distance_hint = hint;
        link.rest_length = RestLengthFor(hint, relationship);
        link.kind = kind.empty() ? kDefaultNodeKind : kind;
        graph_.links.push_back(std::move(link));
    }

    Graph Take() { return std::move(graph_); }

private:
    Graph graph_;
    std::unordered_map<std::string, NodeIndex> index_by_id_;
};

Graph NormalizeFlat(const FlatConnections& flat, const SourceDescriptor& source, const Viewport& viewport) {
    GraphBuilder builder;
    builder.AddNode(BuildSourceNode(std::nullopt, source, viewport));

    size_t ordinal = 0;
    for (const auto& spec : flat.connections) {
        ++ordinal;
        if (spec.id == kSourceNodeId) {
            std::cerr << "Warning: connection uses reserved id 'source', dropping it" << std::endl;
            continue;
        }
        GraphNode node = BuildConnectionNode(spec, ordinal);
        std::string id = node.id;
        Relationship relationship = node.relationship_to_source.value_or(Relationship::INDIRECT);
        float hint = node.distance_hint;
        std::string kind = node.kind;
        if (builder.AddNode(std::move(node))) {
            builder.AddLink(kSourceNodeId, id, relationship, hint, kind);
        }
    }
    return builder.Take();
}

Graph NormalizePrebuilt(const PrebuiltGraph& prebuilt, const SourceDescriptor& source, const Viewport& viewport) {
    GraphBuilder builder;

    // Links may still name the payload's own source id.
    std::string renamed_source_id;
    if (prebuilt.source_node && !prebuilt.source_node->id.empty() &&
        prebuilt.source_node->id != kSourceNodeId) {
        renamed_source_id = prebuilt.source_node->id;
        std::cerr << "Warning: renaming source node '" << renamed_source_id << "' to 'source'" << std::endl;
    }
    builder.AddNode(BuildSourceNode(prebuilt.source_node, source, viewport));

    size_t ordinal = 0;
    for (const auto& spec : prebuilt.connections) {
        ++ordinal;
        if (spec.id == kSourceNodeId) {
            std::cerr << "Warning: connection uses reserved id 'source', dropping it" << std::endl;
            continue;
        }
        if (!renamed_source_id.empty() && spec.id == renamed_source_id) {
            std::cerr << "Warning: connection duplicates source id '" << spec.id << "', dropping it" << std::endl;
            continue;
        }
        builder.AddNode(BuildConnectionNode(spec, ordinal));
    }

    auto resolve = [&](const std::string& id) -> const std::string& {
        if (!renamed_source_id.empty() && id == renamed_source_id) {
            static const std::string source_id = kSourceNodeId;
            return source_id;
        }
        return id;
    };

    for (const auto& spec : prebuilt.links) {
        std::string owner = "link " + spec.source + " -> " + spec.target;
        builder.AddLink(resolve(spec.source), resolve(spec.target),
                        RelationshipOf(spec.relationship, owner),
                        ValidatedHint(spec.distance, kDefaultLinkDistanceHint),
                        spec.type);
    }
    return builder.Take();
}

NodeSpec ExportNode(const GraphNode& node) {
    NodeSpec spec;
    spec.id = node.id;
    spec.name = node.label;
    spec.type = node.kind;
    spec.emoji = node.glyph;
    spec.color = ToHexColor(node.color);
    spec.size = node.radius;
    if (node.relationship_to_source) {
        spec.relationship = ToString(*node.relationship_to_source);
    }
    if (!node.IsSource()) {
        spec.distance = node.distance_hint;
    }
    spec.position = node.seed_position;
    spec.extra = node.metadata;
    return spec;
}

} // namespace

Graph NormalizeConnections(const ConnectionsInput& input,
                           const SourceDescriptor& source,
                           const Viewport& viewport) {
    if (ConnectionCount(input) == 0) {
        return Graph{};
    }
    if (const auto* flat = std::get_if<FlatConnections>(&input)) {
        return NormalizeFlat(*flat, source, viewport);
    }
    return NormalizePrebuilt(std::get<PrebuiltGraph>(input), source, viewport);
}

PrebuiltGraph ToPrebuilt(const Graph& graph) {
    PrebuiltGraph prebuilt;
    for (const auto& node : graph.nodes) {
        if (node.IsSource()) {
            prebuilt.source_node = ExportNode(node);
        } else {
            prebuilt.connections.push_back(ExportNode(node));
        }
    }
    for (const auto& link : graph.links) {
        LinkSpec spec;
        spec.source = link.source_id;
        spec.target = link.target_id;
        spec.relationship = ToString(link.relationship);
        spec.distance = link.distance_hint;
        spec.type = link.kind;
        prebuilt.links.push_back(std::move(spec));
    }
    return prebuilt;
}

size_t ConnectionCount(const ConnectionsInput& input) {
    return std::visit([](const auto& shape) { return shape.connections.size(); }, input);
}

size_t LinkCount(const ConnectionsInput& input) {
    if (const auto* prebuilt = std::get_if<PrebuiltGraph>(&input)) {
        return prebuilt->links.size();
    }
    return 0;
}

} // namespace graph
} // namespace relgraph
