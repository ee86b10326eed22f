#ifndef RELGRAPH_SPATIAL_HASH_H
#define RELGRAPH_SPATIAL_HASH_H

#include <imgui.h>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace relgraph {
namespace graph {

namespace detail {
// Pack 2D grid cell coordinates into a 64-bit bucket key.
constexpr uint64_t PackCell(int32_t x, int32_t y) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
           static_cast<uint32_t>(y);
}

// Grid cell of one coordinate, clamped to +-2^30 so far-out seeds stay
// within int32 range.
int32_t CellCoord(float value, float cell_size);

float Distance(const ImVec2& a, const ImVec2& b);
float DistanceSquared(const ImVec2& a, const ImVec2& b);
ImVec2 Normalize(const ImVec2& vec);
bool IsFinite(const ImVec2& vec);
} // namespace detail

// Uniform grid over a position buffer, used as the collision broadphase.
class SpatialHash {
public:
    explicit SpatialHash(float cell_size);

    void SetCellSize(float cell_size);
    float GetCellSize() const { return cell_size_; }

    void Insert(const std::vector<ImVec2>& positions);
    // Indices of every point in cells overlapping the query square. Callers
    // apply their own exact distance test.
    std::vector<int> Query(const ImVec2& position, float radius) const;
    size_t BucketCount() const { return buckets_.size(); }

private:
    float cell_size_;
    std::unordered_map<uint64_t, std::vector<int>> buckets_;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_SPATIAL_HASH_H
