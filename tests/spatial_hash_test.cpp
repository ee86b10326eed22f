#include "gtest/gtest.h"
#include <relgraph/graph/layout/spatial_hash.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace relgraph::graph;

namespace {
bool Contains(const std::vector<int>& values, int value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}
}

TEST(SpatialHashTest, QueryReturnsNearbyPointsOnly) {
    std::vector<ImVec2> positions = {ImVec2(0, 0), ImVec2(10, 0), ImVec2(500, 500)};
    SpatialHash hash(50.0f);
    hash.Insert(positions);

    std::vector<int> near = hash.Query(ImVec2(0, 0), 20.0f);
    EXPECT_TRUE(Contains(near, 0));
    EXPECT_TRUE(Contains(near, 1));
    EXPECT_FALSE(Contains(near, 2));

    std::vector<int> far = hash.Query(ImVec2(510, 490), 5.0f);
    ASSERT_EQ(far.size(), 1u);
    EXPECT_EQ(far[0], 2);
}

TEST(SpatialHashTest, NegativeCoordinatesHashToSeparateCells) {
    std::vector<ImVec2> positions = {ImVec2(-10, -10), ImVec2(10, 10), ImVec2(-400, 300)};
    SpatialHash hash(50.0f);
    hash.Insert(positions);
    EXPECT_EQ(hash.BucketCount(), 3u);

    std::vector<int> result = hash.Query(ImVec2(-5, -5), 10.0f);
    EXPECT_TRUE(Contains(result, 0));
    EXPECT_TRUE(Contains(result, 1));
    EXPECT_FALSE(Contains(result, 2));
}

TEST(SpatialHashTest, NonFinitePointsAreNotIndexed) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    std::vector<ImVec2> positions = {ImVec2(nan, 0), ImVec2(1, 1)};
    SpatialHash hash(25.0f);
    hash.Insert(positions);

    std::vector<int> result = hash.Query(ImVec2(0, 0), 100.0f);
    EXPECT_FALSE(Contains(result, 0));
    EXPECT_TRUE(Contains(result, 1));
}

TEST(SpatialHashTest, FarOutPointsLandInEdgeCells) {
    EXPECT_EQ(detail::CellCoord(1e12f, 40.0f), 1 << 30);
    EXPECT_EQ(detail::CellCoord(-1e12f, 40.0f), -(1 << 30));
    EXPECT_EQ(detail::CellCoord(-1.0f, 40.0f), -1);
    EXPECT_EQ(detail::CellCoord(79.0f, 40.0f), 1);

    std::vector<ImVec2> positions = {ImVec2(1e12f, 0), ImVec2(-1e12f, 5), ImVec2(1e12f, 1e12f), ImVec2(3, 3)};
    SpatialHash hash(40.0f);
    hash.Insert(positions);

    std::vector<int> near_origin = hash.Query(ImVec2(0, 0), 50.0f);
    ASSERT_EQ(near_origin.size(), 1u);
    EXPECT_EQ(near_origin[0], 3);

    std::vector<int> far_right = hash.Query(ImVec2(1e12f, 0), 10.0f);
    EXPECT_TRUE(Contains(far_right, 0));
    EXPECT_FALSE(Contains(far_right, 2));
    EXPECT_FALSE(Contains(far_right, 3));

    const float inf = std::numeric_limits<float>::infinity();
    EXPECT_TRUE(hash.Query(ImVec2(inf, 0), 10.0f).empty());
}

TEST(SpatialHashTest, ReinsertReplacesPreviousContents) {
    SpatialHash hash(10.0f);
    hash.Insert({ImVec2(0, 0), ImVec2(100, 100)});
    hash.Insert({ImVec2(100, 100)});

    std::vector<int> result = hash.Query(ImVec2(0, 0), 5.0f);
    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(hash.Query(ImVec2(), 1.0f).empty());
}

TEST(SpatialHashTest, CellSizeHasFloor) {
    SpatialHash hash(0.0f);
    EXPECT_FLOAT_EQ(hash.GetCellSize(), 1.0f);
    hash.SetCellSize(32.0f);
    EXPECT_FLOAT_EQ(hash.GetCellSize(), 32.0f);
}

TEST(SpatialHashTest, VectorHelpers) {
    EXPECT_FLOAT_EQ(detail::Distance(ImVec2(0, 0), ImVec2(3, 4)), 5.0f);
    EXPECT_FLOAT_EQ(detail::DistanceSquared(ImVec2(1, 1), ImVec2(4, 5)), 25.0f);

    ImVec2 unit = detail::Normalize(ImVec2(0, -8));
    EXPECT_FLOAT_EQ(unit.x, 0.0f);
    EXPECT_FLOAT_EQ(unit.y, -1.0f);
    ImVec2 zero = detail::Normalize(ImVec2(0, 0));
    EXPECT_FLOAT_EQ(zero.x, 0.0f);
    EXPECT_FLOAT_EQ(zero.y, 0.0f);

    EXPECT_TRUE(detail::IsFinite(ImVec2(1, 2)));
    EXPECT_FALSE(detail::IsFinite(ImVec2(std::numeric_limits<float>::infinity(), 0)));
    EXPECT_NE(detail::PackCell(1, -1), detail::PackCell(-1, 1));
}
