#include <relgraph/graph/render/graph_scene.h>
#include <relgraph/graph/utils/graph_drawing_utils.h>

#include <algorithm>
#include <cctype>

namespace relgraph {
namespace graph {

namespace {
constexpr float kDirectStrokeOpacity = 0.8f;
constexpr float kIndirectStrokeOpacity = 0.5f;
constexpr float kDirectLinkWidth = 1.5f;
constexpr float kIndirectLinkWidth = 1.0f;
constexpr float kDashLength = 4.0f;
constexpr float kLabelGap = 6.0f;
constexpr float kGlyphScale = 0.75f;
constexpr float kTooltipLineSpacing = 4.0f;
constexpr size_t kTooltipDescriptionLines = 2;
constexpr const char* kMiddleDot = " \xC2\xB7 ";

std::string UpperAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string YearOf(const GraphNode& node) {
    if (!node.metadata.is_object()) return {};
    auto it = node.metadata.find("year");
    if (it == node.metadata.end()) return {};
    std::string year;
    if (it->is_string()) {
        year = it->get<std::string>();
    } else if (it->is_number_integer()) {
        year = std::to_string(it->get<long long>());
    }
    if (year == "N/A") return {};
    return year;
}
}

std::vector<TooltipLine> BuildTooltipLines(const GraphNode& node, ThemeType theme) {
    const ImU32 text = ThemeUtils::GetThemeTextColor(theme);
    const ImU32 muted = ThemeUtils::GetThemeMutedTextColor(theme);

    std::vector<TooltipLine> lines;
    lines.push_back({node.glyph.empty() ? node.label : node.glyph + " " + node.label, text, false});

    std::string kind_line = UpperAscii(node.kind);
    std::string year = YearOf(node);
    if (!year.empty()) {
        kind_line += kMiddleDot + year;
    }
    lines.push_back({kind_line, muted, false});

    if (node.relationship_to_source) {
        if (*node.relationship_to_source == Relationship::DIRECT) {
            lines.push_back({"Directly mentioned", ThemeUtils::GetThemeDirectBadgeColor(theme), true});
        } else {
            lines.push_back({"Indirectly related", muted, true});
        }
    }

    const std::string description = node.Description();
    if (!description.empty()) {
        for (auto& line : GraphDraw::WrapText(description, kTooltipMaxWidth - 2.0f * kTooltipPadding,
                                              kTooltipDescriptionLines)) {
            lines.push_back({std::move(line), muted, false});
        }
    }

    lines.push_back({"Click to view details", muted, false});
    return lines;
}

ImVec2 MeasureTooltip(const std::vector<TooltipLine>& lines) {
    float width = 0.0f;
    for (const auto& line : lines) {
        width = std::max(width, GraphDraw::SafeCalcTextSize(line.text).x);
    }
    const float line_height = GraphDraw::SafeTextLineHeight() + kTooltipLineSpacing;
    width = std::min(width + 2.0f * kTooltipPadding, kTooltipMaxWidth);
    const float height = static_cast<float>(lines.size()) * line_height + 2.0f * kTooltipPadding;
    return ImVec2(width, height);
}

SceneFrame BuildScene(const Graph& graph,
                      const std::vector<ImVec2>& positions,
                      const GraphViewState& view_state,
                      const InteractionController& interaction,
                      bool loading,
                      ThemeType theme) {
    SceneFrame frame;
    frame.canvas_size = view_state.canvas_size;
    frame.background = ThemeUtils::GetThemeBackgroundColor(theme);
    frame.text_color = ThemeUtils::GetThemeTextColor(theme);

    const float zoom = view_state.zoom_scale;
    const size_t drawable = std::min(graph.nodes.size(), positions.size());

    // Links first so nodes layer above them.
    frame.links.reserve(graph.links.size());
    for (const auto& link : graph.links) {
        if (static_cast<size_t>(link.source) >= drawable || static_cast<size_t>(link.target) >= drawable) {
            continue;
        }
        LinkSegment segment;
        segment.from = CameraUtils::WorldToScreen(positions[link.source], view_state);
        segment.to = CameraUtils::WorldToScreen(positions[link.target], view_state);
        const float dimming = interaction.LinkOpacity(link);
        if (link.relationship == Relationship::DIRECT) {
            segment.color = GraphDraw::WithAlpha(ThemeUtils::GetThemeDirectLinkColor(theme),
                                                 kDirectStrokeOpacity * dimming);
            segment.thickness = kDirectLinkWidth * zoom;
        } else {
            segment.color = GraphDraw::WithAlpha(ThemeUtils::GetThemeIndirectLinkColor(theme),
                                                 kIndirectStrokeOpacity * dimming);
            segment.thickness = kIndirectLinkWidth * zoom;
            segment.dashed = true;
            segment.dash_length = kDashLength * zoom;
            segment.gap_length = kDashLength * zoom;
        }
        frame.links.push_back(segment);
    }

    const auto hovered = interaction.GetHoveredNode();
    const auto selected = interaction.GetSelectedNode();
    frame.nodes.reserve(drawable);
    for (size_t i = 0; i < drawable; ++i) {
        const GraphNode& node = graph.nodes[i];
        const NodeIndex index = static_cast<NodeIndex>(i);
        NodeDisc disc;
        disc.index = index;
        disc.center = CameraUtils::WorldToScreen(positions[i], view_state);
        disc.radius = node.radius * zoom;
        disc.color = node.color;
        disc.opacity = interaction.NodeOpacity(index);
        disc.glyph = node.glyph;
        disc.glyph_size = node.radius * kGlyphScale * zoom;
        disc.label = GraphDraw::TruncateLabel(node.label);
        disc.label_pos = ImVec2(disc.center.x, disc.center.y + (node.radius + kLabelGap) * zoom);
        disc.label_size = kLabelFontSize * zoom;
        disc.selected = selected && *selected == index;
        disc.hovered = hovered && *hovered == index;
        frame.nodes.push_back(std::move(disc));
    }

    if (hovered && static_cast<size_t>(*hovered) < drawable) {
        TooltipBox box;
        box.lines = BuildTooltipLines(graph.nodes[*hovered], theme);
        ImVec2 size = MeasureTooltip(box.lines);
        size.x = std::min(size.x, view_state.canvas_size.x);
        size.y = std::min(size.y, view_state.canvas_size.y);
        if (auto placement = interaction.ComputeTooltip(size, graph, positions, view_state)) {
            box.placement = *placement;
            frame.tooltip = std::move(box);
        }
    }

    if (loading) {
        frame.overlay = SceneOverlay::LOADING;
        frame.overlay_text = kLoadingMessage;
    } else if (graph.Empty()) {
        frame.overlay = SceneOverlay::EMPTY;
        frame.overlay_text = kEmptyMessage;
    }
    return frame;
}

} // namespace graph
} // namespace relgraph
