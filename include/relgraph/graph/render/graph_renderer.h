#ifndef RELGRAPH_GRAPH_RENDERER_H
#define RELGRAPH_GRAPH_RENDERER_H

#include <imgui.h>
#include <relgraph/graph/render/graph_scene.h>
#include <relgraph/gui/render/theme_utils.h>

namespace relgraph {
namespace graph {

class GraphManager;

// Emits a SceneFrame into an ImDrawList. Holds no state of its own.
class GraphRenderer {
public:
    static void Draw(ImDrawList* draw_list, const ImVec2& canvas_pos, const SceneFrame& frame,
                     ThemeType theme, float time_seconds);

private:
    static void DrawLinks(ImDrawList* draw_list, const ImVec2& origin, const SceneFrame& frame);
    static void DrawNode(ImDrawList* draw_list, const ImVec2& origin, const NodeDisc& disc, ThemeType theme);
    static void DrawTooltip(ImDrawList* draw_list, const ImVec2& origin, const TooltipBox& tooltip, ThemeType theme);
    static void DrawOverlay(ImDrawList* draw_list, const ImVec2& origin, const SceneFrame& frame,
                            ThemeType theme, float time_seconds);
};

// Feeds ImGui mouse input for the canvas into a GraphManager and paints it.
class GraphEditor {
public:
    explicit GraphEditor(GraphManager* graph_manager);

    void Render(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size);

    void SetCurrentTheme(ThemeType theme) { current_theme_ = theme; }
    ThemeType GetCurrentTheme() const { return current_theme_; }

    // Interaction Handlers
    void HandlePanning();
    void HandleZooming(const ImVec2& canvas_pos);
    void HandlePointer(const ImVec2& canvas_pos);

private:
    GraphManager* m_graph_manager;
    ThemeType current_theme_ = ThemeType::DARK;
    bool was_hovered_ = false;
};

// Draws the graph canvas into the current ImGui window (or its own window).
void RenderGraphView(GraphManager& graph_manager, ThemeType current_theme, bool create_window);

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_GRAPH_RENDERER_H
