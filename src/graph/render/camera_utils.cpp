#include <relgraph/graph/render/camera_utils.h>

#include <algorithm>
#include <cmath>

namespace relgraph {
namespace graph {

ImVec2 CameraUtils::WorldToScreen(const ImVec2& world_pos, const GraphViewState& view_state) {
    return ImVec2((world_pos.x * view_state.zoom_scale) + view_state.pan_offset.x,
                  (world_pos.y * view_state.zoom_scale) + view_state.pan_offset.y);
}

ImVec2 CameraUtils::ScreenToWorld(const ImVec2& screen_pos_absolute, const ImVec2& canvas_screen_pos_absolute, const GraphViewState& view_state) {
    ImVec2 mouse_relative_to_canvas_origin = ImVec2(screen_pos_absolute.x - canvas_screen_pos_absolute.x,
                                                   screen_pos_absolute.y - canvas_screen_pos_absolute.y);

    if (view_state.zoom_scale == 0.0f) return ImVec2(0,0); // Avoid division by zero
    return ImVec2((mouse_relative_to_canvas_origin.x - view_state.pan_offset.x) / view_state.zoom_scale,
                  (mouse_relative_to_canvas_origin.y - view_state.pan_offset.y) / view_state.zoom_scale);
}

float CameraUtils::ClampZoom(float scale) {
    if (!std::isfinite(scale)) return kDefaultZoomScale;
    return std::clamp(scale, kMinZoomScale, kMaxZoomScale);
}

void CameraUtils::ApplyPan(GraphViewState& view_state, const ImVec2& screen_delta) {
    view_state.pan_offset.x += screen_delta.x;
    view_state.pan_offset.y += screen_delta.y;
}

void CameraUtils::ApplyZoom(GraphViewState& view_state, const ImVec2& anchor, float factor) {
    if (!(factor > 0.0f) || !std::isfinite(factor)) return;

    const float old_zoom = view_state.zoom_scale;
    const float new_zoom = ClampZoom(old_zoom * factor);
    if (new_zoom == old_zoom) return;

    // Use the effective factor so a clamped zoom still keeps the anchor still.
    const float effective = new_zoom / old_zoom;
    view_state.pan_offset.x = anchor.x - (anchor.x - view_state.pan_offset.x) * effective;
    view_state.pan_offset.y = anchor.y - (anchor.y - view_state.pan_offset.y) * effective;
    view_state.zoom_scale = new_zoom;
}

void CameraUtils::ApplyWheel(GraphViewState& view_state, const ImVec2& anchor, float wheel) {
    if (wheel == 0.0f) return;
    ApplyZoom(view_state, anchor, 1.0f + wheel * kWheelZoomStep);
}

void CameraUtils::FitToPoint(GraphViewState& view_state, const ImVec2& world_point,
                             const ImVec2& canvas_size, float zoom) {
    view_state.zoom_scale = ClampZoom(zoom);
    view_state.pan_offset = ImVec2(canvas_size.x * 0.5f - world_point.x * view_state.zoom_scale,
                                   canvas_size.y * 0.5f - world_point.y * view_state.zoom_scale);
}

} // namespace graph
} // namespace relgraph
