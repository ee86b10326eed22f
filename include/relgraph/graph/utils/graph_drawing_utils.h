#ifndef RELGRAPH_GRAPH_DRAWING_UTILS_H
#define RELGRAPH_GRAPH_DRAWING_UTILS_H

#include <imgui.h>

#include <cfloat>
#include <string>
#include <vector>

namespace relgraph {
namespace GraphDraw {

constexpr size_t kLabelMaxCodePoints = 20;
constexpr size_t kLabelKeptCodePoints = 18;

// Text helpers. These work without an ImGui context, falling back to a fixed
// 8x16 px cell per code point.
size_t Utf8Length(const std::string& text);
std::string Utf8Prefix(const std::string& text, size_t code_points);
std::string TruncateLabel(const std::string& text,
                          size_t max_code_points = kLabelMaxCodePoints,
                          size_t kept_code_points = kLabelKeptCodePoints);
ImVec2 SafeCalcTextSize(const std::string& text, float wrap_width = FLT_MAX);
float SafeTextLineHeight();
// Greedy word wrap into at most `max_lines` lines; the last kept line gets
// an ellipsis when text was cut.
std::vector<std::string> WrapText(const std::string& text, float wrap_width, size_t max_lines);

ImU32 WithAlpha(ImU32 color, float alpha_multiplier);

// Low-level ImDrawList helpers
void AddDashedLine(ImDrawList* draw_list, const ImVec2& from, const ImVec2& to, ImU32 col,
                   float thickness, float dash_length, float gap_length);
// Concentric fills approximating a radial gradient from `inner_alpha` at the
// center to `outer_alpha` at the rim.
void AddRadialGradientCircle(ImDrawList* draw_list, const ImVec2& center, float radius, ImU32 col,
                             float inner_alpha, float outer_alpha, int rings = 8);
void AddTextCentered(ImDrawList* draw_list, const ImVec2& center, ImU32 col, const std::string& text);
void AddSpinner(ImDrawList* draw_list, const ImVec2& center, float radius, ImU32 col,
                float thickness, float time_seconds);

} // namespace GraphDraw
} // namespace relgraph

#endif // RELGRAPH_GRAPH_DRAWING_UTILS_H
