#include <relgraph/graph/render/interaction_controller.h>

#include <algorithm>

namespace relgraph {
namespace graph {

std::optional<NodeIndex> InteractionController::HitTest(const ImVec2& canvas_point, const Graph& graph,
                                                        const std::vector<ImVec2>& positions,
                                                        const GraphViewState& view_state) {
    const size_t count = std::min(graph.nodes.size(), positions.size());
    // Nodes are painted in index order, so the last hit is on top.
    for (size_t i = count; i-- > 0;) {
        ImVec2 center = CameraUtils::WorldToScreen(positions[i], view_state);
        float radius = graph.nodes[i].radius * view_state.zoom_scale;
        float dx = canvas_point.x - center.x;
        float dy = canvas_point.y - center.y;
        if (dx * dx + dy * dy <= radius * radius) {
            return static_cast<NodeIndex>(i);
        }
    }
    return std::nullopt;
}

void InteractionController::OnPointerMove(const ImVec2& canvas_point, const Graph& graph,
                                          const std::vector<ImVec2>& positions,
                                          const GraphViewState& view_state) {
    hovered_ = HitTest(canvas_point, graph, positions, view_state);
}

void InteractionController::OnPointerLeave() {
    hovered_.reset();
}

std::optional<NodeIndex> InteractionController::OnClick(const ImVec2& canvas_point, const Graph& graph,
                                                        const std::vector<ImVec2>& positions,
                                                        const GraphViewState& view_state) {
    auto hit = HitTest(canvas_point, graph, positions, view_state);
    selected_ = hit;
    if (hit && on_node_click_) {
        on_node_click_(graph.nodes[*hit]);
    }
    return hit;
}

void InteractionController::Reset() {
    hovered_.reset();
    selected_.reset();
}

float InteractionController::LinkOpacity(const GraphLink& link) const {
    if (!hovered_) return kLinkOpacityIdle;
    if (link.source == *hovered_ || link.target == *hovered_) return kLinkOpacityTouching;
    return kLinkOpacityDimmed;
}

float InteractionController::NodeOpacity(NodeIndex index) const {
    if (!hovered_ || *hovered_ == index) return 1.0f;
    return kNodeOpacityDimmed;
}

TooltipPlacement InteractionController::PlaceTooltip(const ImVec2& anchor, float node_screen_radius,
                                                     const ImVec2& size, const ImVec2& canvas_size) {
    TooltipPlacement placement;
    placement.size = size;

    const float offset_x = std::max(kTooltipOffsetX, node_screen_radius + 4.0f);
    float x = anchor.x + offset_x;
    float y = anchor.y + kTooltipOffsetY;

    if (x + size.x > canvas_size.x) {
        x = anchor.x - offset_x - size.x;
        placement.flipped_x = true;
    }
    if (y + size.y > canvas_size.y) {
        y = anchor.y - kTooltipOffsetY - size.y;
        placement.flipped_y = true;
    }

    // Clamp last; a tooltip larger than the canvas is pinned to the origin.
    x = std::max(0.0f, std::min(x, canvas_size.x - size.x));
    y = std::max(0.0f, std::min(y, canvas_size.y - size.y));
    placement.position = ImVec2(x, y);
    return placement;
}

std::optional<TooltipPlacement> InteractionController::ComputeTooltip(const ImVec2& size, const Graph& graph,
                                                                      const std::vector<ImVec2>& positions,
                                                                      const GraphViewState& view_state) const {
    if (!hovered_) return std::nullopt;
    const size_t index = static_cast<size_t>(*hovered_);
    if (index >= positions.size() || index >= graph.nodes.size()) return std::nullopt;

    ImVec2 anchor = CameraUtils::WorldToScreen(positions[index], view_state);
    float radius = graph.nodes[index].radius * view_state.zoom_scale;
    return PlaceTooltip(anchor, radius, size, view_state.canvas_size);
}

} // namespace graph
} // namespace relgraph
