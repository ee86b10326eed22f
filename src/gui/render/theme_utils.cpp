#include <relgraph/gui/render/theme_utils.h>

namespace relgraph {
namespace ThemeUtils {

void applyDarkTheme() {
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 6.0f;
    style.FrameRounding = 4.0f;
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.06f, 0.09f, 0.16f, 0.94f);  // slate-900
    style.Colors[ImGuiCol_Button] = ImVec4(0.26f, 0.22f, 0.79f, 0.70f);    // indigo-700
    style.Colors[ImGuiCol_ButtonHovered] = ImVec4(0.31f, 0.27f, 0.90f, 0.85f);
    style.Colors[ImGuiCol_ButtonActive] = ImVec4(0.39f, 0.40f, 0.95f, 1.00f);
}

void applyWhiteTheme() {
    ImGui::StyleColorsLight();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 6.0f;
    style.FrameRounding = 4.0f;
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.97f, 0.98f, 0.99f, 0.96f);
}

void setTheme(ThemeType theme) {
    switch (theme) {
        case ThemeType::DARK:
            applyDarkTheme();
            break;
        case ThemeType::WHITE:
            applyWhiteTheme();
            break;
    }
}

const char* themeToString(ThemeType theme) {
    return theme == ThemeType::WHITE ? "WHITE" : "DARK";
}

std::optional<ThemeType> themeFromString(const std::string& text) {
    if (text == "DARK" || text == "dark") return ThemeType::DARK;
    if (text == "WHITE" || text == "white") return ThemeType::WHITE;
    return std::nullopt;
}

ImU32 GetThemeBackgroundColor(ThemeType theme) {
    switch (theme) {
        case ThemeType::DARK:
            return IM_COL32(2, 6, 23, 255);      // Near-black night sky
        case ThemeType::WHITE:
            return IM_COL32(250, 250, 255, 255); // Very light background
    }
    return IM_COL32(30, 30, 40, 255);
}

ImU32 GetThemeTextColor(ThemeType theme) {
    switch (theme) {
        case ThemeType::DARK:
            return IM_COL32(255, 255, 255, 255);
        case ThemeType::WHITE:
            return IM_COL32(30, 30, 35, 255);
    }
    return IM_COL32(255, 255, 255, 255);
}

ImU32 GetThemeMutedTextColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(203, 213, 225, 255)  // slate-300
                                    : IM_COL32(71, 85, 105, 255);   // slate-600
}

ImU32 GetThemeLabelShadowColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(0, 0, 0, 128) : IM_COL32(255, 255, 255, 160);
}

ImU32 GetThemeDirectLinkColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(0xE2, 0xE8, 0xF0, 255)
                                    : IM_COL32(0x33, 0x41, 0x55, 255);
}

ImU32 GetThemeIndirectLinkColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(0x64, 0x74, 0x8B, 255)
                                    : IM_COL32(0x94, 0xA3, 0xB8, 255);
}

ImU32 GetThemeNodeSelectedBorderColor(ThemeType theme) {
    switch (theme) {
        case ThemeType::DARK:
            return IM_COL32(255, 255, 0, 255);   // Bright yellow for dark theme
        case ThemeType::WHITE:
            return IM_COL32(255, 165, 0, 255);   // Orange for white theme
    }
    return IM_COL32(255, 255, 0, 255);
}

ImU32 GetThemeTooltipBackgroundColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(15, 23, 42, 230) : IM_COL32(255, 255, 255, 240);
}

ImU32 GetThemeTooltipBorderColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(51, 65, 85, 255) : IM_COL32(203, 213, 225, 255);
}

ImU32 GetThemeDirectBadgeColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(199, 210, 254, 255)  // indigo-200
                                    : IM_COL32(67, 56, 202, 255);   // indigo-700
}

ImU32 GetThemeOverlayColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(0, 0, 0, 102) : IM_COL32(255, 255, 255, 140);
}

ImU32 GetThemeAccentColor(ThemeType /*theme*/) {
    return IM_COL32(0x63, 0x66, 0xF1, 255);
}

} // namespace ThemeUtils
} // namespace relgraph
