#include <relgraph/graph/model/payload_json.h>

#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace relgraph {
namespace graph {

namespace {

const char* const kKnownNodeKeys[] = {
    "id", "name", "type", "emoji", "color", "size", "relationship", "distance", "x", "y"
};

bool IsKnownNodeKey(const std::string& key) {
    for (const char* known : kKnownNodeKeys) {
        if (key == known) return true;
    }
    return false;
}

// Ids arrive as strings, but numbers are accepted and stringified.
std::optional<std::string> ReadId(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return std::nullopt;
}

// Link endpoints may already be resolved node objects carrying an "id".
std::optional<std::string> ReadEndpoint(const nlohmann::json& value) {
    if (value.is_object()) {
        auto it = value.find("id");
        if (it == value.end()) return std::nullopt;
        return ReadId(*it);
    }
    return ReadId(value);
}

template <typename T>
std::optional<T> ReadOptional(const nlohmann::json& entry, const char* key, const std::string& owner) {
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return std::nullopt;
    if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) return it->get<std::string>();
    } else {
        if (it->is_number()) return it->get<T>();
    }
    std::cerr << "Warning: ignoring field '" << key << "' with unexpected type on " << owner << std::endl;
    return std::nullopt;
}

std::string ReadString(const nlohmann::json& entry, const char* key, const std::string& owner) {
    return ReadOptional<std::string>(entry, key, owner).value_or("");
}

std::vector<NodeSpec> ParseNodeList(const nlohmann::json& list) {
    std::vector<NodeSpec> specs;
    size_t ordinal = 0;
    for (const auto& entry : list) {
        ++ordinal;
        if (auto spec = ParseNodeSpec(entry, ordinal)) {
            specs.push_back(std::move(*spec));
        }
    }
    return specs;
}

} // namespace

std::optional<NodeSpec> ParseNodeSpec(const nlohmann::json& entry, size_t ordinal) {
    if (!entry.is_object()) {
        std::cerr << "Warning: skipping connection #" << ordinal << ": not an object" << std::endl;
        return std::nullopt;
    }

    NodeSpec spec;
    auto id_it = entry.find("id");
    if (id_it == entry.end() || id_it->is_null()) {
        spec.id = "connection-" + std::to_string(ordinal);
    } else if (auto id = ReadId(*id_it)) {
        spec.id = *id;
    } else {
        std::cerr << "Warning: skipping connection #" << ordinal << ": id is not a string" << std::endl;
        return std::nullopt;
    }

    auto name_it = entry.find("name");
    if (name_it != entry.end() && !name_it->is_null() && !name_it->is_string()) {
        std::cerr << "Warning: skipping connection '" << spec.id << "': name is not a string" << std::endl;
        return std::nullopt;
    }

    const std::string owner = "node " + spec.id;
    spec.name = ReadString(entry, "name", owner);
    spec.type = ReadString(entry, "type", owner);
    spec.emoji = ReadString(entry, "emoji", owner);
    spec.color = ReadOptional<std::string>(entry, "color", owner);
    spec.size = ReadOptional<float>(entry, "size", owner);
    spec.relationship = ReadOptional<std::string>(entry, "relationship", owner);
    spec.distance = ReadOptional<double>(entry, "distance", owner);

    auto x = ReadOptional<float>(entry, "x", owner);
    auto y = ReadOptional<float>(entry, "y", owner);
    if (x && y) {
        spec.position = ImVec2(*x, *y);
    }

    for (auto it = entry.begin(); it != entry.end(); ++it) {
        if (!IsKnownNodeKey(it.key())) {
            spec.extra[it.key()] = it.value();
        }
    }
    return spec;
}

std::optional<LinkSpec> ParseLinkSpec(const nlohmann::json& entry) {
    if (!entry.is_object()) {
        std::cerr << "Warning: skipping link: not an object" << std::endl;
        return std::nullopt;
    }
    auto source_it = entry.find("source");
    auto target_it = entry.find("target");
    if (source_it == entry.end() || target_it == entry.end()) {
        std::cerr << "Warning: skipping link without source or target" << std::endl;
        return std::nullopt;
    }
    auto source = ReadEndpoint(*source_it);
    auto target = ReadEndpoint(*target_it);
    if (!source || !target) {
        std::cerr << "Warning: skipping link with malformed endpoints" << std::endl;
        return std::nullopt;
    }

    LinkSpec spec;
    spec.source = *source;
    spec.target = *target;
    const std::string owner = "link " + spec.source + " -> " + spec.target;
    spec.relationship = ReadOptional<std::string>(entry, "relationship", owner);
    spec.distance = ReadOptional<double>(entry, "distance", owner);
    spec.type = ReadString(entry, "type", owner);
    return spec;
}

ConnectionsInput ParseConnectionsPayload(const nlohmann::json& doc) {
    if (doc.is_array()) {
        return FlatConnections{ParseNodeList(doc)};
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Connections payload must be a JSON object or array");
    }

    std::vector<NodeSpec> connections;
    auto connections_it = doc.find("connections");
    if (connections_it != doc.end() && !connections_it->is_null()) {
        if (!connections_it->is_array()) {
            throw std::runtime_error("Connections payload: 'connections' must be an array");
        }
        connections = ParseNodeList(*connections_it);
    }

    auto links_it = doc.find("links");
    if (links_it == doc.end() || !links_it->is_array()) {
        if (links_it != doc.end() && !links_it->is_null()) {
            std::cerr << "Warning: ignoring 'links' that is not an array" << std::endl;
        }
        return FlatConnections{std::move(connections)};
    }

    PrebuiltGraph prebuilt;
    prebuilt.connections = std::move(connections);
    auto source_it = doc.find("sourceNode");
    if (source_it != doc.end() && !source_it->is_null()) {
        prebuilt.source_node = ParseNodeSpec(*source_it, 0);
        if (prebuilt.source_node && !source_it->contains("id")) {
            prebuilt.source_node->id = kSourceNodeId;
        }
    }
    for (const auto& entry : *links_it) {
        if (auto link = ParseLinkSpec(entry)) {
            prebuilt.links.push_back(std::move(*link));
        }
    }
    return prebuilt;
}

ConnectionsInput ParseConnectionsPayload(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Connections payload is not valid JSON: ") + e.what());
    }
    return ParseConnectionsPayload(doc);
}

SourceDescriptor ParseSourceDescriptor(const nlohmann::json& doc) {
    SourceDescriptor source;
    if (!doc.is_object()) return source;

    auto metadata_it = doc.find("metadata");
    if (metadata_it != doc.end() && metadata_it->is_object()) {
        source.metadata = *metadata_it;
        source.title = ReadString(*metadata_it, "title", "source metadata");
        source.author = ReadString(*metadata_it, "author", "source metadata");
        source.glyph = ReadString(*metadata_it, "documentEmoji", "source metadata");
    }
    source.content = ReadString(doc, "content", "source");
    return source;
}

nlohmann::json ToJson(const NodeSpec& spec) {
    nlohmann::json out = spec.extra.is_object() ? spec.extra : nlohmann::json::object();
    out["id"] = spec.id;
    out["name"] = spec.name;
    out["type"] = spec.type;
    out["emoji"] = spec.emoji;
    if (spec.color) out["color"] = *spec.color;
    if (spec.size) out["size"] = *spec.size;
    if (spec.relationship) out["relationship"] = *spec.relationship;
    if (spec.distance) out["distance"] = *spec.distance;
    if (spec.position) {
        out["x"] = spec.position->x;
        out["y"] = spec.position->y;
    }
    return out;
}

nlohmann::json ToJson(const LinkSpec& spec) {
    nlohmann::json out = {
        {"source", spec.source},
        {"target", spec.target},
        {"type", spec.type}
    };
    if (spec.relationship) out["relationship"] = *spec.relationship;
    if (spec.distance) out["distance"] = *spec.distance;
    return out;
}

nlohmann::json ToJson(const PrebuiltGraph& prebuilt) {
    nlohmann::json out = {
        {"connections", nlohmann::json::array()},
        {"links", nlohmann::json::array()}
    };
    if (prebuilt.source_node) {
        out["sourceNode"] = ToJson(*prebuilt.source_node);
    }
    for (const auto& spec : prebuilt.connections) {
        out["connections"].push_back(ToJson(spec));
    }
    for (const auto& spec : prebuilt.links) {
        out["links"].push_back(ToJson(spec));
    }
    return out;
}

nlohmann::json ToJson(const Graph& graph) {
    return ToJson(ToPrebuilt(graph));
}

} // namespace graph
} // namespace relgraph
