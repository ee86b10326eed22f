#pragma once

#include <imgui.h> // For ImU32

#include <optional>
#include <string>

enum class ThemeType {
    DARK,
    WHITE
};

namespace relgraph {
namespace ThemeUtils {

void applyDarkTheme();
void applyWhiteTheme();
void setTheme(ThemeType theme);

const char* themeToString(ThemeType theme);
std::optional<ThemeType> themeFromString(const std::string& text);

// Graph-specific theme colors
ImU32 GetThemeBackgroundColor(ThemeType theme);
ImU32 GetThemeTextColor(ThemeType theme);
ImU32 GetThemeMutedTextColor(ThemeType theme);
ImU32 GetThemeLabelShadowColor(ThemeType theme);
ImU32 GetThemeDirectLinkColor(ThemeType theme);
ImU32 GetThemeIndirectLinkColor(ThemeType theme);
ImU32 GetThemeNodeSelectedBorderColor(ThemeType theme);
ImU32 GetThemeTooltipBackgroundColor(ThemeType theme);
ImU32 GetThemeTooltipBorderColor(ThemeType theme);
ImU32 GetThemeDirectBadgeColor(ThemeType theme);
ImU32 GetThemeOverlayColor(ThemeType theme);
ImU32 GetThemeAccentColor(ThemeType theme);

} // namespace ThemeUtils
} // namespace relgraph
