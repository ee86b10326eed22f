#ifndef RELGRAPH_CAMERA_UTILS_H
#define RELGRAPH_CAMERA_UTILS_H

#include <imgui.h>

namespace relgraph {
namespace graph {

constexpr float kMinZoomScale = 0.5f;
constexpr float kMaxZoomScale = 3.0f;
constexpr float kDefaultZoomScale = 0.8f;
constexpr float kWheelZoomStep = 0.1f;

// Pan/zoom transform of the graph canvas: screen = world * zoom + pan, with
// screen coordinates relative to the canvas origin.
struct GraphViewState {
    ImVec2 pan_offset;
    float zoom_scale;
    ImVec2 canvas_size;
    bool initial_fit_done;

    GraphViewState()
        : pan_offset(0.0f, 0.0f), zoom_scale(1.0f), canvas_size(0.0f, 0.0f), initial_fit_done(false) {}
};

/*
 * Utility helpers for camera transformations in the graph view.
 * All methods are static; an instance of CameraUtils is never created.
 */
class CameraUtils {
public:
    // Converts world coordinates to canvas-relative screen coordinates.
    static ImVec2 WorldToScreen(const ImVec2& world_pos, const GraphViewState& view_state);

    // Converts absolute screen coordinates to world coordinates.
    static ImVec2 ScreenToWorld(const ImVec2& screen_pos_absolute,
                                const ImVec2& canvas_screen_pos_absolute,
                                const GraphViewState& view_state);

    static float ClampZoom(float scale);

    // Drag: the delta is added to the pan unchanged.
    static void ApplyPan(GraphViewState& view_state, const ImVec2& screen_delta);

    // Multiplies the zoom by `factor` (after clamping) keeping the world point
    // under `anchor` (canvas-relative) fixed on screen.
    static void ApplyZoom(GraphViewState& view_state, const ImVec2& anchor, float factor);
    static void ApplyWheel(GraphViewState& view_state, const ImVec2& anchor, float wheel);

    // Centers `world_point` in a canvas of `canvas_size` at `zoom`.
    static void FitToPoint(GraphViewState& view_state, const ImVec2& world_point,
                           const ImVec2& canvas_size, float zoom = kDefaultZoomScale);
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_CAMERA_UTILS_H
