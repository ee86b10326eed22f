#ifndef RELGRAPH_NODE_PALETTE_H
#define RELGRAPH_NODE_PALETTE_H

#include <imgui.h>
#include <relgraph/graph/model/graph_types.h>

#include <optional>
#include <string>
#include <vector>

namespace relgraph {
namespace graph {

struct NodeKindStyle {
    const char* kind;
    const char* glyph;
    ImU32 color;
    const char* description;
};

constexpr float kSourceNodeRadius = 25.0f;
constexpr float kDefaultDistanceHint = 3.0f;
constexpr float kDefaultLinkDistanceHint = 1.0f;
constexpr float kMinDistanceHint = 1.0f;
constexpr float kMaxDistanceHint = 5.0f;
constexpr const char* kDefaultNodeKind = "concept";
constexpr const char* kSourceNodeKind = "source";
constexpr const char* kDefaultSourceGlyph = "\xF0\x9F\x93\x84"; // page facing up

// Kinds shown in the legend, in display order.
const std::vector<NodeKindStyle>& NodeKindStyles();
const NodeKindStyle& StyleForKind(const std::string& kind);

std::string GlyphForKind(const std::string& kind);
ImU32 ColorForKind(const std::string& kind);

// Radius of a non-source node with no explicit size.
float RadiusForDistance(float distance_hint);

// Preferred link length. Indirect links rest further out than direct ones
// with the same hint so direct neighbours settle closer to the source.
float RestLengthFor(float distance_hint, Relationship relationship);

bool IsValidDistanceHint(double distance);

// Accepts "#RRGGBB", "#RGB" and "#RRGGBBAA".
std::optional<ImU32> ParseHexColor(const std::string& text);
std::string ToHexColor(ImU32 color);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_NODE_PALETTE_H
