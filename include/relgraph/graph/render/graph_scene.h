#ifndef RELGRAPH_GRAPH_SCENE_H
#define RELGRAPH_GRAPH_SCENE_H

#include <imgui.h>
#include <relgraph/graph/model/graph_types.h>
#include <relgraph/graph/render/camera_utils.h>
#include <relgraph/graph/render/interaction_controller.h>
#include <relgraph/gui/render/theme_utils.h>

#include <optional>
#include <string>
#include <vector>

namespace relgraph {
namespace graph {

constexpr const char* kLoadingMessage = "Updating connections...";
constexpr const char* kEmptyMessage = "Generate connections to see the graph";
constexpr float kTooltipMaxWidth = 320.0f;
constexpr float kTooltipPadding = 12.0f;
constexpr float kLabelFontSize = 10.0f;

struct LinkSegment {
    ImVec2 from;       // canvas-relative
    ImVec2 to;
    ImU32 color = 0;   // stroke opacity and dimming already folded into alpha
    float thickness = 1.0f;
    bool dashed = false;
    float dash_length = 0.0f;
    float gap_length = 0.0f;
};

struct NodeDisc {
    NodeIndex index = kInvalidNodeIndex;
    ImVec2 center;
    float radius = 0.0f;
    ImU32 color = 0;
    float opacity = 1.0f;
    std::string glyph;
    float glyph_size = 0.0f;
    std::string label;
    ImVec2 label_pos;          // top-center of the label
    float label_size = kLabelFontSize;
    bool selected = false;
    bool hovered = false;
};

struct TooltipLine {
    std::string text;
    ImU32 color = 0;
    bool badge = false;
};

struct TooltipBox {
    TooltipPlacement placement;
    std::vector<TooltipLine> lines;
};

enum class SceneOverlay {
    NONE,
    LOADING,
    EMPTY
};

// Everything one frame paints, in paint order: links, then nodes, then the
// tooltip, then the overlay.
struct SceneFrame {
    ImVec2 canvas_size;
    ImU32 background = 0;
    ImU32 text_color = 0;
    std::vector<LinkSegment> links;
    std::vector<NodeDisc> nodes;
    std::optional<TooltipBox> tooltip;
    SceneOverlay overlay = SceneOverlay::NONE;
    std::string overlay_text;
};

std::vector<TooltipLine> BuildTooltipLines(const GraphNode& node, ThemeType theme);
ImVec2 MeasureTooltip(const std::vector<TooltipLine>& lines);

SceneFrame BuildScene(const Graph& graph,
                      const std::vector<ImVec2>& positions,
                      const GraphViewState& view_state,
                      const InteractionController& interaction,
                      bool loading,
                      ThemeType theme);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_SCENE_H
