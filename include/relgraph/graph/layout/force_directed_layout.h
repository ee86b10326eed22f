#ifndef RELGRAPH_FORCE_DIRECTED_LAYOUT_H
#define RELGRAPH_FORCE_DIRECTED_LAYOUT_H

#include <imgui.h>
#include <relgraph/graph/layout/quad_tree.h>
#include <relgraph/graph/layout/spatial_hash.h>
#include <relgraph/graph/model/graph_types.h>

#include <random>
#include <vector>

namespace relgraph {
namespace graph {

// Lightweight physics data for each node
struct NodePhysics {
    ImVec2 velocity;
    ImVec2 last_valid;
    bool is_frozen;
    NodePhysics() : velocity(0.0f, 0.0f), last_valid(0.0f, 0.0f), is_frozen(false) {}
};

enum class SimulationState {
    kIdle,
    kRunning,
    kSettled,
    kStopped
};

const char* ToString(SimulationState state);

// Semi-implicit Euler particle simulation cooled by a decaying alpha. Owns the
// position buffer for one Graph; everyone else reads it between ticks.
class ForceDirectedLayout {
public:
    struct LayoutParams {
        float charge_strength;            // repulsion magnitude, attenuated by distance^2
        float charge_distance_min;
        float theta;                      // Barnes-Hut opening angle
        int barnes_hut_threshold;         // below this node count repulsion is exact
        float center_strength;
        float collision_radius_multiplier;
        float collision_strength;
        float velocity_decay;
        float alpha_min;
        float alpha_decay;
        float alpha_target;
        float max_displacement;
        int settle_relaxation_passes;     // overlap projection budget per 8 nodes, at least one budget

        LayoutParams();
    };

private:
    struct LinkBinding {
        NodeIndex source;
        NodeIndex target;
        float rest_length;
        float strength;
        float bias;
    };

    LayoutParams params_;
    SimulationState state_ = SimulationState::kIdle;
    float alpha_ = 1.0f;
    int current_iteration_ = 0;
    ImVec2 center_;
    std::vector<ImVec2> positions_;
    std::vector<NodePhysics> node_physics_;
    std::vector<float> collision_radii_;
    std::vector<LinkBinding> links_;
    float max_collision_radius_ = 0.0f;
    SpatialHash spatial_hash_;
    QuadTree quad_tree_;
    std::mt19937 rng_{123}; // fixed seed for reproducible layouts
    friend struct ForceDirectedLayoutDetail;

public:
    ForceDirectedLayout(const LayoutParams& params = LayoutParams());

    void Initialize(const Graph& graph, const ImVec2& canvas_center);
    // Advances one tick. Returns false once the simulation is not running.
    bool Step();
    void ComputeLayout(const Graph& graph, const ImVec2& canvas_center);
    void Stop();
    void Reheat(float alpha = 1.0f);
    void SetCenter(const ImVec2& center);

    bool IsRunning() const { return state_ == SimulationState::kRunning; }
    bool IsSettled() const { return state_ == SimulationState::kSettled; }
    SimulationState GetState() const { return state_; }
    float GetAlpha() const { return alpha_; }
    int GetIteration() const { return current_iteration_; }
    const ImVec2& GetCenter() const { return center_; }
    const std::vector<ImVec2>& GetPositions() const { return positions_; }
    bool IsFrozen(NodeIndex index) const;
    const LayoutParams& GetParams() const { return params_; }
    void SetParams(const LayoutParams& params);

    // Test hook: overwrites one position as a diverging integrator would.
    void SetPositionForTesting(NodeIndex index, const ImVec2& position);
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_FORCE_DIRECTED_LAYOUT_H
