#include <relgraph/graph/layout/spatial_hash.h>

#include <algorithm>
#include <cmath>

namespace relgraph {
namespace graph {

namespace detail {
    int32_t CellCoord(float value, float cell_size) {
        constexpr double kCellLimit = 1 << 30;
        double cell = std::floor(static_cast<double>(value) / cell_size);
        return static_cast<int32_t>(std::clamp(cell, -kCellLimit, kCellLimit));
    }

    float Distance(const ImVec2& a, const ImVec2& b) {
        return std::sqrt(DistanceSquared(a, b));
    }

    float DistanceSquared(const ImVec2& a, const ImVec2& b) {
        float dx = b.x - a.x;
        float dy = b.y - a.y;
        return dx * dx + dy * dy;
    }

    ImVec2 Normalize(const ImVec2& vec) {
        float length = std::sqrt(vec.x * vec.x + vec.y * vec.y);
        if (length > 0.001f) {
            return ImVec2(vec.x / length, vec.y / length);
        }
        return ImVec2(0.0f, 0.0f);
    }

    bool IsFinite(const ImVec2& vec) {
        return std::isfinite(vec.x) && std::isfinite(vec.y);
    }
}

SpatialHash::SpatialHash(float cell_size) : cell_size_(std::max(1.0f, cell_size)) {}

void SpatialHash::SetCellSize(float cell_size) {
    cell_size_ = std::max(1.0f, cell_size);
}

void SpatialHash::Insert(const std::vector<ImVec2>& positions) {
    buckets_.clear();
    buckets_.reserve(positions.size() * 2);

    for (size_t idx = 0; idx < positions.size(); ++idx) {
        const ImVec2& p = positions[idx];
        if (!detail::IsFinite(p)) continue;

        uint64_t key = detail::PackCell(detail::CellCoord(p.x, cell_size_), detail::CellCoord(p.y, cell_size_));
        buckets_[key].push_back(static_cast<int>(idx));
    }
}

std::vector<int> SpatialHash::Query(const ImVec2& position, float radius) const {
    std::vector<int> result;
    if (buckets_.empty() || !detail::IsFinite(position) || !std::isfinite(radius)) return result;

    const int32_t center_cx = detail::CellCoord(position.x, cell_size_);
    const int32_t center_cy = detail::CellCoord(position.y, cell_size_);

    const int search_radius = static_cast<int>(std::ceil(std::max(0.0f, radius) / cell_size_));

    for (int dx = -search_radius; dx <= search_radius; ++dx) {
        for (int dy = -search_radius; dy <= search_radius; ++dy) {
            uint64_t key = detail::PackCell(center_cx + dx, center_cy + dy);
            auto bucket_it = buckets_.find(key);
            if (bucket_it != buckets_.end()) {
                result.insert(result.end(), bucket_it->second.begin(), bucket_it->second.end());
            }
        }
    }
    return result;
}

} // namespace graph
} // namespace relgraph
