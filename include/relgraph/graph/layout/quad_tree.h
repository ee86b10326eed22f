#ifndef RELGRAPH_QUAD_TREE_H
#define RELGRAPH_QUAD_TREE_H

#include <imgui.h>

#include <cstdint>
#include <vector>

namespace relgraph {
namespace graph {

// Barnes-Hut quadtree over a position buffer. Cells live in a flat pool and
// refer to their children by index; leaves keep the indices of their points.
class QuadTree {
public:
    explicit QuadTree(uint8_t max_depth = 16);

    void Build(const std::vector<ImVec2>& positions);
    void Clear();

    // Sum over other points j of (p_j - p_i) / max(|p_j - p_i|^2, min_distance_sq),
    // with far cells collapsed to their centroid when width^2 / d^2 < theta^2.
    ImVec2 Accumulate(int index, float theta, float min_distance_sq) const;

    size_t CellCount() const { return cells_.size(); }
    size_t PointCount() const;
    bool Empty() const { return cells_.empty(); }

private:
    struct Cell {
        ImVec2 min;
        float width = 0.0f;
        uint8_t depth = 0;
        int children[4] = {-1, -1, -1, -1};
        std::vector<int> points;
        ImVec2 sum;
        int count = 0;

        bool IsLeaf() const { return children[0] < 0; }
    };

    void Insert(int cell_index, int point_index);
    void InsertIntoChild(int cell_index, int point_index);
    void Split(int cell_index);
    void Summarize(int cell_index);
    void AccumulateCell(int cell_index, int index, const ImVec2& xi, float theta_sq,
                        float min_distance_sq, ImVec2& out) const;

    uint8_t max_depth_;
    std::vector<Cell> cells_;
    const std::vector<ImVec2>* positions_ = nullptr;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_QUAD_TREE_H
