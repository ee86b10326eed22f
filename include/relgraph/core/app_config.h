#pragma once

#include <relgraph/graph/layout/force_directed_layout.h>
#include <relgraph/gui/render/theme_utils.h>

#include <string>

namespace relgraph {

constexpr const char* DEFAULT_ENDPOINT_URL = "http://localhost:3000";
constexpr const char* DEFAULT_MODEL_ID = "gemini-flash-lite";
constexpr const char* ENDPOINT_ENV_VAR = "RELGRAPH_ENDPOINT";

// Setting keys in the `settings` table.
namespace SettingKeys {
constexpr const char* kTheme = "theme";
constexpr const char* kEndpointUrl = "endpoint_url";
constexpr const char* kModelId = "model_id";
constexpr const char* kChargeStrength = "charge_strength";
constexpr const char* kCollisionRadiusMultiplier = "collision_radius_multiplier";
} // namespace SettingKeys

struct AppConfig {
    ThemeType theme = ThemeType::DARK;
    std::string endpoint_url = DEFAULT_ENDPOINT_URL;
    std::string model_id = DEFAULT_MODEL_ID;
    graph::ForceDirectedLayout::LayoutParams layout_params;
};

} // namespace relgraph
