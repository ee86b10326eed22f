#include <relgraph/graph/utils/graph_drawing_utils.h>

#include <algorithm>
#include <cmath>

namespace relgraph {
namespace GraphDraw {

namespace {
constexpr float kFallbackCharW = 8.0f;
constexpr float kFallbackCharH = 16.0f;
constexpr const char* kEllipsis = "...";

bool HasFont() {
    return ImGui::GetCurrentContext() != nullptr && ImGui::GetFont() != nullptr;
}

// Byte length of the UTF-8 sequence starting with `lead`.
size_t SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1; // stray continuation byte; step over it alone
}

float SingleLineWidth(const std::string& text) {
    if (HasFont()) {
        return ImGui::CalcTextSize(text.c_str(), text.c_str() + text.size()).x;
    }
    return static_cast<float>(Utf8Length(text)) * kFallbackCharW;
}

std::vector<std::string> SplitWords(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\t') {
            if (!current.empty()) words.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

// Longest code-point prefix of `text` that fits `width` together with `suffix`.
std::string FitWithSuffix(const std::string& text, float width, const std::string& suffix) {
    const size_t total = Utf8Length(text);
    for (size_t n = total; n > 0; --n) {
        std::string candidate = Utf8Prefix(text, n) + suffix;
        if (SingleLineWidth(candidate) <= width) return candidate;
    }
    return SingleLineWidth(suffix) <= width ? suffix : std::string();
}
}

size_t Utf8Length(const std::string& text) {
    size_t count = 0;
    for (size_t i = 0; i < text.size(); i += SequenceLength(static_cast<unsigned char>(text[i]))) {
        ++count;
    }
    return count;
}

std::string Utf8Prefix(const std::string& text, size_t code_points) {
    size_t i = 0;
    size_t taken = 0;
    while (i < text.size() && taken < code_points) {
        i += SequenceLength(static_cast<unsigned char>(text[i]));
        ++taken;
    }
    return text.substr(0, std::min(i, text.size()));
}

std::string TruncateLabel(const std::string& text, size_t max_code_points, size_t kept_code_points) {
    if (Utf8Length(text) <= max_code_points) return text;
    return Utf8Prefix(text, kept_code_points) + kEllipsis;
}

ImVec2 SafeCalcTextSize(const std::string& text, float wrap_width) {
    if (HasFont()) {
        return ImGui::CalcTextSize(text.c_str(), text.c_str() + text.size(), false, wrap_width);
    }
    const float width = static_cast<float>(Utf8Length(text)) * kFallbackCharW;
    if (wrap_width <= 0.0f || width <= wrap_width) {
        return ImVec2(width, kFallbackCharH);
    }
    const float lines = std::ceil(width / wrap_width);
    return ImVec2(wrap_width, lines * kFallbackCharH);
}

float SafeTextLineHeight() {
    if (HasFont()) return ImGui::GetTextLineHeight();
    return kFallbackCharH;
}

std::vector<std::string> WrapText(const std::string& text, float wrap_width, size_t max_lines) {
    std::vector<std::string> lines;
    if (max_lines == 0 || text.empty()) return lines;

    const std::vector<std::string> words = SplitWords(text);
    std::string current;
    size_t word_index = 0;
    for (; word_index < words.size(); ++word_index) {
        const std::string& word = words[word_index];
        std::string candidate = current.empty() ? word : current + " " + word;
        if (SingleLineWidth(candidate) <= wrap_width || current.empty()) {
            current = std::move(candidate);
            continue;
        }
        lines.push_back(std::move(current));
        current = word;
        if (lines.size() == max_lines) break;
    }
    if (lines.size() < max_lines && !current.empty()) {
        lines.push_back(std::move(current));
        current.clear();
        ++word_index;
    }

    const bool cut = word_index < words.size();
    for (auto& line : lines) {
        if (SingleLineWidth(line) > wrap_width) {
            line = FitWithSuffix(line, wrap_width, kEllipsis);
        }
    }
    if (cut && !lines.empty()) {
        lines.back() = FitWithSuffix(lines.back(), wrap_width, kEllipsis);
    }
    return lines;
}

ImU32 WithAlpha(ImU32 color, float alpha_multiplier) {
    const float clamped = std::clamp(alpha_multiplier, 0.0f, 1.0f);
    const unsigned alpha = (color >> IM_COL32_A_SHIFT) & 0xFF;
    const unsigned scaled = static_cast<unsigned>(std::lround(alpha * clamped));
    return (color & ~IM_COL32_A_MASK) | (scaled << IM_COL32_A_SHIFT);
}

void AddDashedLine(ImDrawList* draw_list, const ImVec2& from, const ImVec2& to, ImU32 col,
                   float thickness, float dash_length, float gap_length) {
    if (!draw_list) return;
    const float dx = to.x - from.x;
    const float dy = to.y - from.y;
    const float length = std::sqrt(dx * dx + dy * dy);
    if (length <= 0.0f) return;
    if (dash_length <= 0.0f || gap_length <= 0.0f) {
        draw_list->AddLine(from, to, col, thickness);
        return;
    }

    const ImVec2 dir(dx / length, dy / length);
    for (float start = 0.0f; start < length; start += dash_length + gap_length) {
        const float end = std::min(start + dash_length, length);
        draw_list->AddLine(ImVec2(from.x + dir.x * start, from.y + dir.y * start),
                           ImVec2(from.x + dir.x * end, from.y + dir.y * end),
                           col, thickness);
    }
}

void AddRadialGradientCircle(ImDrawList* draw_list, const ImVec2& center, float radius, ImU32 col,
                             float inner_alpha, float outer_alpha, int rings) {
    if (!draw_list || radius <= 0.0f) return;
    rings = std::max(1, rings);
    // Painted outermost first; each smaller disc overdraws the previous one.
    for (int ring = 0; ring < rings; ++ring) {
        const float t = static_cast<float>(ring) / static_cast<float>(rings);
        const float r = radius * (1.0f - t);
        const float alpha = outer_alpha + (inner_alpha - outer_alpha) * t;
        draw_list->AddCircleFilled(center, r, WithAlpha(col, alpha));
    }
}

void AddTextCentered(ImDrawList* draw_list, const ImVec2& center, ImU32 col, const std::string& text) {
    if (!draw_list || text.empty()) return;
    ImVec2 size = SafeCalcTextSize(text);
    draw_list->AddText(ImVec2(center.x - size.x * 0.5f, center.y - size.y * 0.5f), col,
                       text.c_str(), text.c_str() + text.size());
}

void AddSpinner(ImDrawList* draw_list, const ImVec2& center, float radius, ImU32 col,
                float thickness, float time_seconds) {
    if (!draw_list) return;
    constexpr float kTwoPi = 6.28318530718f;
    const float start = std::fmod(time_seconds * kTwoPi, kTwoPi);
    draw_list->PathClear();
    draw_list->PathArcTo(center, radius, start, start + kTwoPi * 0.5f, 24);
    draw_list->PathStroke(col, 0, thickness);
}

} // namespace GraphDraw
} // namespace relgraph
