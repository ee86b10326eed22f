#ifndef RELGRAPH_INTERACTION_CONTROLLER_H
#define RELGRAPH_INTERACTION_CONTROLLER_H

#include <imgui.h>
#include <relgraph/graph/model/graph_types.h>
#include <relgraph/graph/render/camera_utils.h>

#include <functional>
#include <optional>
#include <vector>

namespace relgraph {
namespace graph {

constexpr float kTooltipOffsetX = 30.0f;
constexpr float kTooltipOffsetY = -10.0f;

constexpr float kLinkOpacityIdle = 0.7f;
constexpr float kLinkOpacityTouching = 1.0f;
constexpr float kLinkOpacityDimmed = 0.2f;
constexpr float kNodeOpacityDimmed = 0.5f;

struct TooltipPlacement {
    ImVec2 position;   // top-left, canvas-relative
    ImVec2 size;
    bool flipped_x = false;
    bool flipped_y = false;
};

// Hover and selection over the current Graph. Hover is driven by pointer
// motion, selection only by clicks. Neither touches simulation state.
class InteractionController {
public:
    using NodeClickCallback = std::function<void(const GraphNode&)>;

    void SetOnNodeClick(NodeClickCallback callback) { on_node_click_ = std::move(callback); }

    // Topmost node whose screen-space circle contains `canvas_point`.
    static std::optional<NodeIndex> HitTest(const ImVec2& canvas_point, const Graph& graph,
                                            const std::vector<ImVec2>& positions,
                                            const GraphViewState& view_state);

    void OnPointerMove(const ImVec2& canvas_point, const Graph& graph,
                       const std::vector<ImVec2>& positions, const GraphViewState& view_state);
    void OnPointerLeave();
    // Selects and reports the node under the pointer; clears the selection on
    // empty canvas. Returns the clicked node.
    std::optional<NodeIndex> OnClick(const ImVec2& canvas_point, const Graph& graph,
                                     const std::vector<ImVec2>& positions,
                                     const GraphViewState& view_state);
    void Reset();

    std::optional<NodeIndex> GetHoveredNode() const { return hovered_; }
    std::optional<NodeIndex> GetSelectedNode() const { return selected_; }
    bool IsHovering() const { return hovered_.has_value(); }

    float LinkOpacity(const GraphLink& link) const;
    float NodeOpacity(NodeIndex index) const;

    // Places a tooltip of `size` next to `anchor` and keeps it inside the
    // canvas, flipping sides before clamping.
    static TooltipPlacement PlaceTooltip(const ImVec2& anchor, float node_screen_radius,
                                         const ImVec2& size, const ImVec2& canvas_size);

    // Tooltip for the hovered node at its position in `positions`.
    std::optional<TooltipPlacement> ComputeTooltip(const ImVec2& size, const Graph& graph,
                                                   const std::vector<ImVec2>& positions,
                                                   const GraphViewState& view_state) const;

private:
    std::optional<NodeIndex> hovered_;
    std::optional<NodeIndex> selected_;
    NodeClickCallback on_node_click_;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_INTERACTION_CONTROLLER_H
