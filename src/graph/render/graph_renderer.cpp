#include <relgraph/graph/render/graph_renderer.h>
#include <relgraph/graph/utils/graph_drawing_utils.h>
#include <relgraph/graph/utils/graph_manager.h>

#include <cfloat>

namespace relgraph {
namespace graph {

namespace {
constexpr float kGlowPadding = 4.0f;
constexpr float kGlowOpacity = 0.2f;
constexpr float kGradientInnerAlpha = 0.8f;
constexpr float kGradientOuterAlpha = 0.3f;
constexpr float kRimWidth = 1.5f;
constexpr float kSelectionRingGap = 5.0f;
constexpr float kSpinnerRadius = 18.0f;

ImVec2 Offset(const ImVec2& origin, const ImVec2& p) {
    return ImVec2(origin.x + p.x, origin.y + p.y);
}
}

void GraphRenderer::Draw(ImDrawList* draw_list, const ImVec2& canvas_pos, const SceneFrame& frame,
                         ThemeType theme, float time_seconds) {
    if (!draw_list) return;
    const ImVec2 canvas_max(canvas_pos.x + frame.canvas_size.x, canvas_pos.y + frame.canvas_size.y);

    draw_list->PushClipRect(canvas_pos, canvas_max, true);
    draw_list->AddRectFilled(canvas_pos, canvas_max, frame.background);

    DrawLinks(draw_list, canvas_pos, frame);
    for (const auto& disc : frame.nodes) {
        DrawNode(draw_list, canvas_pos, disc, theme);
    }
    if (frame.tooltip) {
        DrawTooltip(draw_list, canvas_pos, *frame.tooltip, theme);
    }
    DrawOverlay(draw_list, canvas_pos, frame, theme, time_seconds);

    draw_list->PopClipRect();
}

void GraphRenderer::DrawLinks(ImDrawList* draw_list, const ImVec2& origin, const SceneFrame& frame) {
    for (const auto& link : frame.links) {
        const ImVec2 from = Offset(origin, link.from);
        const ImVec2 to = Offset(origin, link.to);
        if (link.dashed) {
            GraphDraw::AddDashedLine(draw_list, from, to, link.color, link.thickness,
                                     link.dash_length, link.gap_length);
        } else {
            draw_list->AddLine(from, to, link.color, link.thickness);
        }
    }
}

void GraphRenderer::DrawNode(ImDrawList* draw_list, const ImVec2& origin, const NodeDisc& disc, ThemeType theme) {
    const ImVec2 center = Offset(origin, disc.center);
    const float opacity = disc.opacity;

    draw_list->AddCircleFilled(center, disc.radius + kGlowPadding, GraphDraw::WithAlpha(disc.color, kGlowOpacity * opacity));
    GraphDraw::AddRadialGradientCircle(draw_list, center, disc.radius, disc.color,
                                       kGradientInnerAlpha * opacity, kGradientOuterAlpha * opacity);
    draw_list->AddCircle(center, disc.radius, GraphDraw::WithAlpha(disc.color, opacity), 0, kRimWidth);

    if (disc.selected) {
        draw_list->AddCircle(center, disc.radius + kSelectionRingGap,
                             ThemeUtils::GetThemeNodeSelectedBorderColor(theme), 0, 2.0f);
    }

    ImFont* font = ImGui::GetFont();
    if (!font) return;

    if (!disc.glyph.empty() && disc.glyph_size > 1.0f) {
        ImVec2 glyph_extent = font->CalcTextSizeA(disc.glyph_size, FLT_MAX, 0.0f, disc.glyph.c_str());
        draw_list->AddText(font, disc.glyph_size,
                           ImVec2(center.x - glyph_extent.x * 0.5f, center.y - glyph_extent.y * 0.5f),
                           GraphDraw::WithAlpha(ThemeUtils::GetThemeTextColor(theme), opacity),
                           disc.glyph.c_str());
    }

    if (!disc.label.empty() && disc.label_size > 1.0f) {
        ImVec2 label_extent = font->CalcTextSizeA(disc.label_size, FLT_MAX, 0.0f, disc.label.c_str());
        ImVec2 pos(origin.x + disc.label_pos.x - label_extent.x * 0.5f, origin.y + disc.label_pos.y);
        draw_list->AddText(font, disc.label_size, ImVec2(pos.x + 1.0f, pos.y + 1.0f),
                           GraphDraw::WithAlpha(ThemeUtils::GetThemeLabelShadowColor(theme), opacity),
                           disc.label.c_str());
        draw_list->AddText(font, disc.label_size, pos,
                           GraphDraw::WithAlpha(ThemeUtils::GetThemeTextColor(theme), opacity),
                           disc.label.c_str());
    }
}

void GraphRenderer::DrawTooltip(ImDrawList* draw_list, const ImVec2& origin, const TooltipBox& tooltip, ThemeType theme) {
    const ImVec2 min = Offset(origin, tooltip.placement.position);
    const ImVec2 max(min.x + tooltip.placement.size.x, min.y + tooltip.placement.size.y);
    draw_list->AddRectFilled(min, max, ThemeUtils::GetThemeTooltipBackgroundColor(theme), 8.0f);
    draw_list->AddRect(min, max, ThemeUtils::GetThemeTooltipBorderColor(theme), 8.0f);

    draw_list->PushClipRect(min, max, true);
    const float line_height = GraphDraw::SafeTextLineHeight() + 4.0f;
    ImVec2 cursor(min.x + kTooltipPadding, min.y + kTooltipPadding);
    for (const auto& line : tooltip.lines) {
        if (line.badge) {
            ImVec2 extent = GraphDraw::SafeCalcTextSize(line.text);
            draw_list->AddRect(ImVec2(cursor.x - 3.0f, cursor.y - 1.0f),
                               ImVec2(cursor.x + extent.x + 3.0f, cursor.y + extent.y + 1.0f),
                               GraphDraw::WithAlpha(line.color, 0.5f), 3.0f);
        }
        draw_list->AddText(cursor, line.color, line.text.c_str());
        cursor.y += line_height;
    }
    draw_list->PopClipRect();
}

void GraphRenderer::DrawOverlay(ImDrawList* draw_list, const ImVec2& origin, const SceneFrame& frame,
                                ThemeType theme, float time_seconds) {
    if (frame.overlay == SceneOverlay::NONE) return;

    const ImVec2 center(origin.x + frame.canvas_size.x * 0.5f, origin.y + frame.canvas_size.y * 0.5f);
    if (frame.overlay == SceneOverlay::LOADING) {
        draw_list->AddRectFilled(origin, ImVec2(origin.x + frame.canvas_size.x, origin.y + frame.canvas_size.y),
                                 ThemeUtils::GetThemeOverlayColor(theme));
        GraphDraw::AddSpinner(draw_list, ImVec2(center.x, center.y - kSpinnerRadius - 6.0f), kSpinnerRadius,
                              ThemeUtils::GetThemeAccentColor(theme), 2.0f, time_seconds);
        GraphDraw::AddTextCentered(draw_list, ImVec2(center.x, center.y + 12.0f), frame.text_color, frame.overlay_text);
    } else {
        GraphDraw::AddTextCentered(draw_list, center, ThemeUtils::GetThemeMutedTextColor(theme), frame.overlay_text);
    }
}

GraphEditor::GraphEditor(GraphManager* graph_manager) : m_graph_manager(graph_manager) {}

void GraphEditor::HandlePanning() {
    if (!ImGui::IsItemActive()) return;
    if (ImGui::IsMouseDragging(ImGuiMouseButton_Left) || ImGui::IsMouseDragging(ImGuiMouseButton_Middle)) {
        m_graph_manager->OnPointerDrag(ImGui::GetIO().MouseDelta);
    }
}

void GraphEditor::HandleZooming(const ImVec2& canvas_pos) {
    if (!ImGui::IsItemHovered()) return;
    float wheel = ImGui::GetIO().MouseWheel;
    if (wheel == 0.0f) return;

    ImVec2 mouse_pos_screen_absolute = ImGui::GetMousePos();
    ImVec2 mouse_pos_in_canvas_content = ImVec2(mouse_pos_screen_absolute.x - canvas_pos.x,
                                                mouse_pos_screen_absolute.y - canvas_pos.y);
    m_graph_manager->OnWheel(mouse_pos_in_canvas_content, wheel);
}

void GraphEditor::HandlePointer(const ImVec2& canvas_pos) {
    ImVec2 mouse = ImGui::GetMousePos();
    ImVec2 local(mouse.x - canvas_pos.x, mouse.y - canvas_pos.y);

    bool hovered = ImGui::IsItemHovered();
    if (hovered) {
        m_graph_manager->OnPointerMove(local);
    } else if (was_hovered_) {
        m_graph_manager->OnPointerLeave();
    }
    was_hovered_ = hovered;

    if (ImGui::IsItemActivated()) {
        m_graph_manager->OnPointerDown(local);
    }
    if (ImGui::IsItemDeactivated()) {
        m_graph_manager->OnPointerUp(local);
    }
}

void GraphEditor::Render(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size) {
    m_graph_manager->OnCanvasResize(canvas_size, GraphManager::Clock::now());

    ImGui::SetCursorScreenPos(canvas_pos);
    ImGui::InvisibleButton("graph_canvas", canvas_size,
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonMiddle);
    HandlePointer(canvas_pos);
    HandlePanning();
    HandleZooming(canvas_pos);

    SceneFrame frame = m_graph_manager->BuildScene(current_theme_);
    frame.canvas_size = canvas_size;
    GraphRenderer::Draw(draw_list, canvas_pos, frame, current_theme_, static_cast<float>(ImGui::GetTime()));

    if (m_graph_manager->GetInteraction().IsHovering()) {
        ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
    }
}

void RenderGraphView(GraphManager& graph_manager, ThemeType current_theme, bool create_window) {
    static GraphEditor graph_editor(&graph_manager);
    graph_editor.SetCurrentTheme(current_theme);

    if (create_window) {
        if (!ImGui::Begin("Graph View")) {
            ImGui::End();
            return;
        }
    }

    ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
    ImVec2 canvas_size = ImGui::GetContentRegionAvail();
    if (canvas_size.x < 50.0f) canvas_size.x = 50.0f;
    if (canvas_size.y < 50.0f) canvas_size.y = 50.0f;

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    graph_editor.Render(draw_list, canvas_pos, canvas_size);
    draw_list->AddRect(canvas_pos, ImVec2(canvas_pos.x + canvas_size.x, canvas_pos.y + canvas_size.y), IM_COL32(100, 100, 100, 255));

    if (create_window) {
        ImGui::End();
    }
}

} // namespace graph
} // namespace relgraph
