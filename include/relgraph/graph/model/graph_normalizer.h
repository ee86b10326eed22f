#ifndef RELGRAPH_GRAPH_NORMALIZER_H
#define RELGRAPH_GRAPH_NORMALIZER_H

#include <imgui.h>
#include <nlohmann/json.hpp>
#include <relgraph/graph/model/graph_types.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relgraph {
namespace graph {

// One node entry as it arrives from a payload, before defaults are applied.
struct NodeSpec {
    std::string id;
    std::string name;
    std::string type;
    std::string emoji;
    std::optional<std::string> color;
    std::optional<float> size;
    std::optional<std::string> relationship;
    std::optional<double> distance;
    std::optional<ImVec2> position;
    nlohmann::json extra = nlohmann::json::object();
};

struct LinkSpec {
    std::string source;
    std::string target;
    std::optional<std::string> relationship;
    std::optional<double> distance;
    std::string type;
};

// Bare list of related entities; every one is linked to the source.
struct FlatConnections {
    std::vector<NodeSpec> connections;
};

// Fully specified graph with its own links.
struct PrebuiltGraph {
    std::optional<NodeSpec> source_node;
    std::vector<NodeSpec> connections;
    std::vector<LinkSpec> links;
};

using ConnectionsInput = std::variant<FlatConnections, PrebuiltGraph>;

struct SourceDescriptor {
    std::string title;
    std::string author;
    std::string glyph;
    nlohmann::json metadata = nlohmann::json::object();
    std::string content;

    // Title, else author, else "Primary Source".
    std::string DisplayName() const;
};

/*
 * Turns either input shape into a Graph.
 *  - the result always contains exactly one node with id "source" unless
 *    there are no connections at all, in which case the Graph is empty
 *  - ids are unique (first occurrence wins), links never dangle and never
 *    connect a node to itself
 *  - recoverable problems are reported on std::cerr and dropped
 */
Graph NormalizeConnections(const ConnectionsInput& input,
                           const SourceDescriptor& source,
                           const Viewport& viewport);

// Exports a Graph back to the prebuilt shape. Normalizing the result with the
// same source and viewport yields an equal Graph.
PrebuiltGraph ToPrebuilt(const Graph& graph);

size_t ConnectionCount(const ConnectionsInput& input);
size_t LinkCount(const ConnectionsInput& input);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_NORMALIZER_H
