#ifndef RELGRAPH_PAYLOAD_JSON_H
#define RELGRAPH_PAYLOAD_JSON_H

#include <nlohmann/json.hpp>
#include <relgraph/graph/model/graph_normalizer.h>

#include <string>

namespace relgraph {
namespace graph {

// Reads `{ sourceNode?, connections, links? }` or a bare connections array.
// Throws std::runtime_error when the document itself is unusable; bad
// individual entries are skipped with a warning.
ConnectionsInput ParseConnectionsPayload(const nlohmann::json& doc);
ConnectionsInput ParseConnectionsPayload(const std::string& text);

// Reads the optional "metadata" object of a payload document. Missing
// fields are left empty.
SourceDescriptor ParseSourceDescriptor(const nlohmann::json& doc);

std::optional<NodeSpec> ParseNodeSpec(const nlohmann::json& entry, size_t ordinal);
std::optional<LinkSpec> ParseLinkSpec(const nlohmann::json& entry);

nlohmann::json ToJson(const NodeSpec& spec);
nlohmann::json ToJson(const LinkSpec& spec);
nlohmann::json ToJson(const PrebuiltGraph& prebuilt);
nlohmann::json ToJson(const Graph& graph);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_PAYLOAD_JSON_H
