#include <relgraph/gui/views/main_gui_views.h>
#include <relgraph/graph/model/node_palette.h>
#include <relgraph/graph/render/graph_renderer.h>
#include <relgraph/graph/utils/graph_drawing_utils.h>
#include <relgraph/graph/utils/graph_manager.h>
#include <relgraph/gui/views/gui_interface.h>

#include <imgui.h>

#include <cstring>
#include <string>

namespace relgraph {

namespace {

const ImVec4 kErrorColor = ImVec4(1.0f, 0.4f, 0.4f, 1.0f);

std::string metadata_text(const nlohmann::json& metadata, const char* key) {
    if (!metadata.is_object()) return std::string();
    auto it = metadata.find(key);
    if (it == metadata.end()) return std::string();
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number() || it->is_boolean()) return it->dump();
    return std::string();
}

void draw_detail_row(const char* label, const std::string& value) {
    if (value.empty() || value == "N/A") return;
    ImGui::TextDisabled("%s", label);
    ImGui::SameLine(110.0f);
    ImGui::TextWrapped("%s", value.c_str());
}

void draw_settings(GuiInterface& gui, ViewerState& state) {
    if (!ImGui::CollapsingHeader("Settings")) return;
    ImGui::Indent();

    ImGui::Text("Theme:"); ImGui::SameLine();
    if (ImGui::RadioButton("Dark", state.config.theme == ThemeType::DARK)) {
        state.config.theme = ThemeType::DARK;
        gui.setTheme(state.config.theme);
        state.settings_dirty = true;
    }
    ImGui::SameLine();
    if (ImGui::RadioButton("White", state.config.theme == ThemeType::WHITE)) {
        state.config.theme = ThemeType::WHITE;
        gui.setTheme(state.config.theme);
        state.settings_dirty = true;
    }

    if (ImGui::InputText("Endpoint", state.endpoint_buf, sizeof(state.endpoint_buf),
                         ImGuiInputTextFlags_EnterReturnsTrue)) {
        state.config.endpoint_url = state.endpoint_buf;
        state.settings_dirty = true;
    }
    ImGui::Text("Model: %s", state.config.model_id.c_str());
    ImGui::Unindent();
}

void draw_controls(graph::GraphManager& gm, GuiInterface& gui, ViewerState& state) {
    const bool busy = gm.IsLoading();
    ImGui::BeginDisabled(busy);
    if (ImGui::Button("Generate connections")) {
        state.generate_requested = true;
    }
    ImGui::SameLine();
    const graph::GraphNode* selected = gm.GetSelectedNode();
    ImGui::BeginDisabled(selected == nullptr || selected->IsSource());
    if (ImGui::Button("Expand connections")) {
        state.expand_requested = true;
    }
    ImGui::EndDisabled();
    ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::BeginDisabled(gm.GetGraph().Empty());
    if (ImGui::Button("Re-run layout")) {
        state.relayout_requested = true;
    }
    ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::Text("Nodes: %zu  Links: %zu  [%s]", gm.GetGraph().nodes.size(), gm.GetGraph().links.size(),
                graph::ToString(gm.GetRunner().GetState()));

    if (!gui.getStatusLine().empty()) {
        if (gui.isStatusError()) {
            ImGui::TextColored(kErrorColor, "%s", gui.getStatusLine().c_str());
        } else {
            ImGui::TextDisabled("%s", gui.getStatusLine().c_str());
        }
    }
}

void draw_legend_swatch(const graph::NodeKindStyle& style) {
    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    const float line_height = ImGui::GetTextLineHeight();
    ImVec2 pos = ImGui::GetCursorScreenPos();
    draw_list->AddCircleFilled(ImVec2(pos.x + line_height * 0.5f, pos.y + line_height * 0.5f),
                               line_height * 0.45f, style.color);
    ImGui::Dummy(ImVec2(line_height, line_height));
    ImGui::SameLine();
    ImGui::Text("%s %s", style.glyph, style.kind);
    ImGui::SameLine(180.0f);
    ImGui::TextDisabled("%s", style.description);
}

void draw_legend(ThemeType theme) {
    if (!ImGui::CollapsingHeader("Legend")) return;
    ImGui::Indent();

    ImGui::Text("Node types");
    for (const auto& style : graph::NodeKindStyles()) {
        if (std::strcmp(style.kind, graph::kSourceNodeKind) == 0) continue;
        draw_legend_swatch(style);
    }

    ImGui::Spacing();
    ImGui::Text("Relationships");
    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    const float line_height = ImGui::GetTextLineHeight();
    const float swatch_width = 40.0f;

    ImVec2 pos = ImGui::GetCursorScreenPos();
    draw_list->AddLine(ImVec2(pos.x, pos.y + line_height * 0.5f),
                       ImVec2(pos.x + swatch_width, pos.y + line_height * 0.5f),
                       ThemeUtils::GetThemeDirectLinkColor(theme), 1.5f);
    ImGui::Dummy(ImVec2(swatch_width, line_height));
    ImGui::SameLine();
    ImGui::Text("Directly mentioned");

    pos = ImGui::GetCursorScreenPos();
    graph::GraphDraw::AddDashedLine(draw_list, ImVec2(pos.x, pos.y + line_height * 0.5f),
                                    ImVec2(pos.x + swatch_width, pos.y + line_height * 0.5f),
                                    ThemeUtils::GetThemeIndirectLinkColor(theme), 1.0f, 4.0f, 4.0f);
    ImGui::Dummy(ImVec2(swatch_width, line_height));
    ImGui::SameLine();
    ImGui::Text("Indirectly related");

    ImGui::Spacing();
    ImGui::TextDisabled("Hover a node for a summary, click it for details.");
    ImGui::TextDisabled("Drag the canvas to pan, scroll to zoom.");
    ImGui::Unindent();
}

void draw_node_details(graph::GraphManager& gm, ViewerState& state) {
    if (!state.details_node_id) return;
    const graph::GraphNode* node = gm.GetNodeById(*state.details_node_id);
    if (!node) {
        state.details_node_id.reset();
        return;
    }

    const ImVec2 display_size = ImGui::GetIO().DisplaySize;
    ImGui::SetNextWindowPos(ImVec2(display_size.x - 20.0f, 60.0f), ImGuiCond_Appearing, ImVec2(1.0f, 0.0f));
    ImGui::SetNextWindowSize(ImVec2(340.0f, 0.0f), ImGuiCond_Appearing);

    bool open = true;
    if (ImGui::Begin("Node Details", &open, ImGuiWindowFlags_NoCollapse)) {
        ImGui::Text("%s %s", node->glyph.c_str(), node->label.c_str());
        ImGui::Separator();
        draw_detail_row("Type", node->kind);
        if (node->relationship_to_source) {
            draw_detail_row("Relationship", *node->relationship_to_source == graph::Relationship::DIRECT
                                                ? "Directly mentioned" : "Indirectly related");
        }
        draw_detail_row("Year", metadata_text(node->metadata, "year"));
        draw_detail_row("Location", metadata_text(node->metadata, "location"));
        draw_detail_row("Field", metadata_text(node->metadata, "field"));
        draw_detail_row("Wikipedia", metadata_text(node->metadata, "wikipediaTitle"));

        std::string description = node->Description();
        if (!description.empty()) {
            ImGui::Spacing();
            ImGui::TextWrapped("%s", description.c_str());
        }

        if (!node->IsSource()) {
            ImGui::Spacing();
            ImGui::BeginDisabled(gm.IsLoading());
            if (ImGui::Button("Expand connections")) {
                state.expand_requested = true;
            }
            ImGui::EndDisabled();
        }
    }
    ImGui::End();

    if (!open) {
        state.details_node_id.reset();
    }
}

} // namespace

void drawAllViews(graph::GraphManager& gm, GuiInterface& gui, ViewerState& state) {
    const ImVec2 display_size = ImGui::GetIO().DisplaySize;

    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f)); ImGui::SetNextWindowSize(display_size);
    ImGui::Begin("Main", nullptr, ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

    if (!state.source.title.empty() || !state.source.author.empty()) {
        ImGui::Text("%s %s", state.source.glyph.empty() ? graph::kDefaultSourceGlyph : state.source.glyph.c_str(),
                    state.source.DisplayName().c_str());
    }
    draw_settings(gui, state);
    draw_controls(gm, gui, state);
    draw_legend(state.config.theme);

    ImGui::BeginChild("GraphCanvas", ImVec2(0, 0), true, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
    graph::RenderGraphView(gm, state.config.theme, false);
    ImGui::EndChild();

    ImGui::End();

    draw_node_details(gm, state);
}

} // namespace relgraph
