#include <relgraph/graph/layout/quad_tree.h>
#include <relgraph/graph/layout/spatial_hash.h>

#include <algorithm>
#include <cmath>

namespace relgraph {
namespace graph {

namespace {
enum Quadrant { TL = 0, TR, BR, BL };
}

QuadTree::QuadTree(uint8_t max_depth) : max_depth_(max_depth) {}

void QuadTree::Clear() {
    cells_.clear();
    positions_ = nullptr;
}

void QuadTree::Build(const std::vector<ImVec2>& positions) {
    Clear();
    positions_ = &positions;

    bool any = false;
    ImVec2 lo(0.0f, 0.0f);
    ImVec2 hi(0.0f, 0.0f);
    for (const auto& p : positions) {
        if (!detail::IsFinite(p)) continue;
        if (!any) {
            lo = hi = p;
            any = true;
            continue;
        }
        lo.x = std::min(lo.x, p.x);
        lo.y = std::min(lo.y, p.y);
        hi.x = std::max(hi.x, p.x);
        hi.y = std::max(hi.y, p.y);
    }
    if (!any) return;

    // Square root cell, padded so points on the max edge land inside.
    float width = std::max(hi.x - lo.x, hi.y - lo.y) + 1.0f;
    Cell root;
    root.min = lo;
    root.width = width;
    cells_.push_back(std::move(root));

    for (size_t i = 0; i < positions.size(); ++i) {
        if (!detail::IsFinite(positions[i])) continue;
        Insert(0, static_cast<int>(i));
    }
    Summarize(0);
}

void QuadTree::Insert(int cell_index, int point_index) {
    if (!cells_[cell_index].IsLeaf()) {
        InsertIntoChild(cell_index, point_index);
    } else if (!cells_[cell_index].points.empty() && cells_[cell_index].depth < max_depth_) {
        Split(cell_index);
        InsertIntoChild(cell_index, point_index);
    } else {
        cells_[cell_index].points.push_back(point_index);
    }
}

void QuadTree::Split(int cell_index) {
    const float child_width = cells_[cell_index].width * 0.5f;
    const ImVec2 origin = cells_[cell_index].min;
    const uint8_t child_depth = static_cast<uint8_t>(cells_[cell_index].depth + 1);
    const ImVec2 offsets[4] = {
        ImVec2(0.0f, 0.0f), ImVec2(child_width, 0.0f),
        ImVec2(child_width, child_width), ImVec2(0.0f, child_width)
    };

    for (int q = 0; q < 4; ++q) {
        Cell child;
        child.min = ImVec2(origin.x + offsets[q].x, origin.y + offsets[q].y);
        child.width = child_width;
        child.depth = child_depth;
        // push_back may reallocate, so index cells_ afresh each time.
        cells_.push_back(std::move(child));
        cells_[cell_index].children[q] = static_cast<int>(cells_.size() - 1);
    }

    std::vector<int> moved;
    moved.swap(cells_[cell_index].points);
    for (int point : moved) {
        InsertIntoChild(cell_index, point);
    }
}

void QuadTree::InsertIntoChild(int cell_index, int point_index) {
    const Cell& cell = cells_[cell_index];
    const float half = cell.width * 0.5f;
    const ImVec2& p = (*positions_)[point_index];
    const bool left = p.x < cell.min.x + half;
    const bool top = p.y < cell.min.y + half;
    int quadrant = left ? (top ? TL : BL) : (top ? TR : BR);
    Insert(cell.children[quadrant], point_index);
}

void QuadTree::Summarize(int cell_index) {
    Cell& cell = cells_[cell_index];
    cell.sum = ImVec2(0.0f, 0.0f);
    cell.count = 0;
    for (int point : cell.points) {
        const ImVec2& p = (*positions_)[point];
        cell.sum.x += p.x;
        cell.sum.y += p.y;
        ++cell.count;
    }
    if (!cell.IsLeaf()) {
        for (int q = 0; q < 4; ++q) {
            int child_index = cells_[cell_index].children[q];
            Summarize(child_index);
            Cell& parent = cells_[cell_index];
            parent.sum.x += cells_[child_index].sum.x;
            parent.sum.y += cells_[child_index].sum.y;
            parent.count += cells_[child_index].count;
        }
    }
}

size_t QuadTree::PointCount() const {
    return cells_.empty() ? 0 : static_cast<size_t>(cells_[0].count);
}

ImVec2 QuadTree::Accumulate(int index, float theta, float min_distance_sq) const {
    ImVec2 out(0.0f, 0.0f);
    if (cells_.empty() || !positions_) return out;
    const ImVec2& xi = (*positions_)[index];
    if (!detail::IsFinite(xi)) return out;
    AccumulateCell(0, index, xi, theta * theta, min_distance_sq, out);
    return out;
}

void QuadTree::AccumulateCell(int cell_index, int index, const ImVec2& xi, float theta_sq,
                              float min_distance_sq, ImVec2& out) const {
    const Cell& cell = cells_[cell_index];
    if (cell.count == 0) return;

    const bool contains_xi = xi.x >= cell.min.x && xi.x < cell.min.x + cell.width &&
                             xi.y >= cell.min.y && xi.y < cell.min.y + cell.width;

    if (!cell.IsLeaf() && !contains_xi) {
        const float n = static_cast<float>(cell.count);
        const ImVec2 centroid(cell.sum.x / n, cell.sum.y / n);
        const ImVec2 delta(centroid.x - xi.x, centroid.y - xi.y);
        float l = delta.x * delta.x + delta.y * delta.y;
        if (l > 0.0f && (cell.width * cell.width) / l < theta_sq) {
            l = std::max(l, min_distance_sq);
            out.x += delta.x * n / l;
            out.y += delta.y * n / l;
            return;
        }
    }

    if (!cell.IsLeaf()) {
        for (int child : cell.children) {
            AccumulateCell(child, index, xi, theta_sq, min_distance_sq, out);
        }
        return;
    }

    for (int j : cell.points) {
        if (j == index) continue;
        const ImVec2& xj = (*positions_)[j];
        const ImVec2 delta(xj.x - xi.x, xj.y - xi.y);
        float l = delta.x * delta.x + delta.y * delta.y;
        if (l == 0.0f) continue;
        l = std::max(l, min_distance_sq);
        out.x += delta.x / l;
        out.y += delta.y / l;
    }
}

} // namespace graph
} // namespace relgraph
