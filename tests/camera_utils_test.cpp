#include "gtest/gtest.h"
#include <relgraph/graph/render/camera_utils.h>

#include <cmath>
#include <limits>
#include <random>

using namespace relgraph::graph;

TEST(CameraUtilsTest, PanAndZoomInvariants) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(0, 0);
    view_state.zoom_scale = 1.0f;

    ImVec2 world_point(100, 200);

    ImVec2 screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    ImVec2 world_point_rt = CameraUtils::ScreenToWorld(screen_point, ImVec2(0, 0), view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    view_state.zoom_scale = 2.0f;
    screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    world_point_rt = CameraUtils::ScreenToWorld(screen_point, ImVec2(0, 0), view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    view_state.pan_offset = ImVec2(30, -40);
    screen_point = CameraUtils::WorldToScreen(world_point, view_state);
    world_point_rt = CameraUtils::ScreenToWorld(screen_point, ImVec2(0, 0), view_state);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);
}

TEST(CameraUtilsTest, ScreenToWorldAccountsForCanvasOrigin) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(10, 20);
    view_state.zoom_scale = 2.0f;

    ImVec2 world = CameraUtils::ScreenToWorld(ImVec2(160, 170), ImVec2(50, 50), view_state);
    EXPECT_FLOAT_EQ(world.x, 50.0f);
    EXPECT_FLOAT_EQ(world.y, 50.0f);
}

TEST(CameraUtilsTest, PanAddsDeltaUnchanged) {
    GraphViewState view_state;
    view_state.zoom_scale = 2.5f;
    CameraUtils::ApplyPan(view_state, ImVec2(12, -7));
    CameraUtils::ApplyPan(view_state, ImVec2(3, 2));
    EXPECT_FLOAT_EQ(view_state.pan_offset.x, 15.0f);
    EXPECT_FLOAT_EQ(view_state.pan_offset.y, -5.0f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, 2.5f);
}

TEST(CameraUtilsTest, ClampZoom) {
    EXPECT_FLOAT_EQ(CameraUtils::ClampZoom(0.1f), kMinZoomScale);
    EXPECT_FLOAT_EQ(CameraUtils::ClampZoom(10.0f), kMaxZoomScale);
    EXPECT_FLOAT_EQ(CameraUtils::ClampZoom(1.5f), 1.5f);
    EXPECT_FLOAT_EQ(CameraUtils::ClampZoom(std::numeric_limits<float>::quiet_NaN()), kDefaultZoomScale);
}

TEST(CameraUtilsTest, WheelZoomStaysInRange) {
    GraphViewState view_state;
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> wheel(-5.0f, 5.0f);
    std::uniform_real_distribution<float> coord(0.0f, 800.0f);

    for (int i = 0; i < 500; ++i) {
        CameraUtils::ApplyWheel(view_state, ImVec2(coord(rng), coord(rng)), wheel(rng));
        ASSERT_GE(view_state.zoom_scale, kMinZoomScale);
        ASSERT_LE(view_state.zoom_scale, kMaxZoomScale);
        ASSERT_TRUE(std::isfinite(view_state.pan_offset.x));
        ASSERT_TRUE(std::isfinite(view_state.pan_offset.y));
    }
}

TEST(CameraUtilsTest, ZoomKeepsAnchorFixed) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(40, -25);
    view_state.zoom_scale = 1.2f;
    const ImVec2 anchor(310, 220);
    const ImVec2 before = CameraUtils::ScreenToWorld(anchor, ImVec2(0, 0), view_state);

    CameraUtils::ApplyWheel(view_state, anchor, 1.0f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, 1.2f * 1.1f);
    ImVec2 after = CameraUtils::ScreenToWorld(anchor, ImVec2(0, 0), view_state);
    EXPECT_NEAR(before.x, after.x, 1e-3);
    EXPECT_NEAR(before.y, after.y, 1e-3);

    // A factor that hits the clamp still keeps the anchor in place.
    CameraUtils::ApplyZoom(view_state, anchor, 100.0f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, kMaxZoomScale);
    after = CameraUtils::ScreenToWorld(anchor, ImVec2(0, 0), view_state);
    EXPECT_NEAR(before.x, after.x, 1e-3);
    EXPECT_NEAR(before.y, after.y, 1e-3);
}

TEST(CameraUtilsTest, InvalidZoomFactorIsIgnored) {
    GraphViewState view_state;
    view_state.pan_offset = ImVec2(5, 5);
    CameraUtils::ApplyZoom(view_state, ImVec2(100, 100), 0.0f);
    CameraUtils::ApplyZoom(view_state, ImVec2(100, 100), -2.0f);
    CameraUtils::ApplyZoom(view_state, ImVec2(100, 100), std::numeric_limits<float>::quiet_NaN());
    CameraUtils::ApplyWheel(view_state, ImVec2(100, 100), 0.0f);
    EXPECT_FLOAT_EQ(view_state.zoom_scale, 1.0f);
    EXPECT_FLOAT_EQ(view_state.pan_offset.x, 5.0f);
    EXPECT_FLOAT_EQ(view_state.pan_offset.y, 5.0f);
}

TEST(CameraUtilsTest, FitToPointCentersTheSource) {
    GraphViewState view_state;
    const ImVec2 canvas(1000, 700);
    const ImVec2 source(400, 300);
    CameraUtils::FitToPoint(view_state, source, canvas);

    EXPECT_FLOAT_EQ(view_state.zoom_scale, kDefaultZoomScale);
    ImVec2 screen = CameraUtils::WorldToScreen(source, view_state);
    EXPECT_FLOAT_EQ(screen.x, 500.0f);
    EXPECT_FLOAT_EQ(screen.y, 350.0f);
}
