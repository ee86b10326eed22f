#include <relgraph/graph/layout/force_directed_layout.h>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace relgraph {
namespace graph {

// Bring math helpers from the SpatialHash detail namespace into scope
using detail::DistanceSquared;
using detail::IsFinite;

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr float kInitialRadius = 10.0f;
const float kInitialAngle = static_cast<float>(kPi * (3.0 - std::sqrt(5.0)));
constexpr float kOverlapSlack = 1e-3f;
}

const char* ToString(SimulationState state) {
    switch (state) {
        case SimulationState::kIdle: return "idle";
        case SimulationState::kRunning: return "running";
        case SimulationState::kSettled: return "settled";
        case SimulationState::kStopped: return "stopped";
    }
    return "unknown";
}

ForceDirectedLayout::LayoutParams::LayoutParams()
    : charge_strength(120.0f),
      charge_distance_min(1.0f),
      theta(0.9f),
      barnes_hut_threshold(64),
      center_strength(0.1f),
      collision_radius_multiplier(1.2f),
      collision_strength(1.0f),
      velocity_decay(0.4f),
      alpha_min(0.001f),
      alpha_decay(1.0f - std::pow(0.001f, 1.0f / 300.0f)),
      alpha_target(0.0f),
      max_displacement(100.0f),
      settle_relaxation_passes(32) {}

struct ForceDirectedLayoutDetail {
    static float Jiggle(ForceDirectedLayout& layout) {
        std::uniform_real_distribution<float> dist(-0.5f, 0.5f);
        return dist(layout.rng_) * 1e-6f;
    }

    static void FreezeNode(ForceDirectedLayout& layout, size_t i) {
        NodePhysics& physics = layout.node_physics_[i];
        if (!physics.is_frozen) {
            std::cerr << "Warning: node " << i << " diverged, freezing it at its last valid position" << std::endl;
        }
        physics.is_frozen = true;
        physics.velocity = ImVec2(0.0f, 0.0f);
        layout.positions_[i] = physics.last_valid;
    }

    static void SanitizePositions(ForceDirectedLayout& layout) {
        for (size_t i = 0; i < layout.positions_.size(); ++i) {
            if (!IsFinite(layout.positions_[i]) || !IsFinite(layout.node_physics_[i].velocity)) {
                FreezeNode(layout, i);
            }
        }
    }

    static void ApplyChargeExact(ForceDirectedLayout& layout, float k) {
        const auto& positions = layout.positions_;
        const float min_sq = layout.params_.charge_distance_min * layout.params_.charge_distance_min;
        for (size_t i = 0; i < positions.size(); ++i) {
            for (size_t j = i + 1; j < positions.size(); ++j) {
                ImVec2 delta(positions[j].x - positions[i].x, positions[j].y - positions[i].y);
                float l = delta.x * delta.x + delta.y * delta.y;
                if (l == 0.0f) {
                    delta = ImVec2(Jiggle(layout), Jiggle(layout));
                    l = delta.x * delta.x + delta.y * delta.y;
                }
                l = std::max(l, min_sq);
                float fx = delta.x * k / l;
                float fy = delta.y * k / l;
                layout.node_physics_[i].velocity.x -= fx;
                layout.node_physics_[i].velocity.y -= fy;
                layout.node_physics_[j].velocity.x += fx;
                layout.node_physics_[j].velocity.y += fy;
            }
        }
    }

    static void ApplyChargeBarnesHut(ForceDirectedLayout& layout, float k) {
        const float min_sq = layout.params_.charge_distance_min * layout.params_.charge_distance_min;
        layout.quad_tree_.Build(layout.positions_);
        for (size_t i = 0; i < layout.positions_.size(); ++i) {
            ImVec2 acc = layout.quad_tree_.Accumulate(static_cast<int>(i), layout.params_.theta, min_sq);
            layout.node_physics_[i].velocity.x -= acc.x * k;
            layout.node_physics_[i].velocity.y -= acc.y * k;
        }
    }

    static void ApplyCharge(ForceDirectedLayout& layout) {
        const float k = layout.params_.charge_strength * layout.alpha_;
        if (static_cast<int>(layout.positions_.size()) > layout.params_.barnes_hut_threshold) {
            ApplyChargeBarnesHut(layout, k);
        } else {
            ApplyChargeExact(layout, k);
        }
    }

    static void ApplyCenter(ForceDirectedLayout& layout) {
        auto& positions = layout.positions_;
        if (positions.empty()) return;

        ImVec2 sum(0.0f, 0.0f);
        for (const auto& p : positions) {
            sum.x += p.x;
            sum.y += p.y;
        }
        const float n = static_cast<float>(positions.size());
        const float strength = layout.params_.center_strength;
        const ImVec2 shift((sum.x / n - layout.center_.x) * strength,
                           (sum.y / n - layout.center_.y) * strength);
        for (size_t i = 0; i < positions.size(); ++i) {
            if (layout.node_physics_[i].is_frozen) continue;
            positions[i].x -= shift.x;
            positions[i].y -= shift.y;
        }
    }

    static void ApplyLinks(ForceDirectedLayout& layout) {
        auto& positions = layout.positions_;
        auto& physics = layout.node_physics_;
        for (const auto& link : layout.links_) {
            NodePhysics& source = physics[link.source];
            NodePhysics& target = physics[link.target];
            float x = positions[link.target].x + target.velocity.x - positions[link.source].x - source.velocity.x;
            float y = positions[link.target].y + target.velocity.y - positions[link.source].y - source.velocity.y;
            if (x == 0.0f) x = Jiggle(layout);
            if (y == 0.0f) y = Jiggle(layout);

            float l = std::sqrt(x * x + y * y);
            l = (l - link.rest_length) / l * layout.alpha_ * link.strength;
            x *= l;
            y *= l;

            target.velocity.x -= x * link.bias;
            target.velocity.y -= y * link.bias;
            source.velocity.x += x * (1.0f - link.bias);
            source.velocity.y += y * (1.0f - link.bias);
        }
    }

    static void ApplyCollision(ForceDirectedLayout& layout) {
        auto& positions = layout.positions_;
        auto& physics = layout.node_physics_;
        const auto& radii = layout.collision_radii_;

        std::vector<ImVec2> predicted(positions.size());
        for (size_t i = 0; i < positions.size(); ++i) {
            predicted[i] = ImVec2(positions[i].x + physics[i].velocity.x,
                                  positions[i].y + physics[i].velocity.y);
        }
        layout.spatial_hash_.Insert(predicted);

        for (size_t i = 0; i < positions.size(); ++i) {
            const float ri = radii[i];
            const float ri2 = ri * ri;
            const ImVec2 xi = predicted[i];
            std::vector<int> neighbors = layout.spatial_hash_.Query(xi, ri + layout.max_collision_radius_);

            for (int j_index : neighbors) {
                if (j_index <= static_cast<int>(i)) continue;
                const size_t j = static_cast<size_t>(j_index);
                const float rj = radii[j];
                const float r = ri + rj;
                float x = xi.x - positions[j].x - physics[j].velocity.x;
                float y = xi.y - positions[j].y - physics[j].velocity.y;
                float l = x * x + y * y;
                if (l >= r * r) continue;

                if (x == 0.0f) {
                    x = Jiggle(layout);
                    l += x * x;
                }
                if (y == 0.0f) {
                    y = Jiggle(layout);
                    l += y * y;
                }
                l = std::sqrt(l);
                l = (r - l) / l * layout.params_.collision_strength;
                x *= l;
                y *= l;

                const float rj2 = rj * rj;
                const float share_i = rj2 / (ri2 + rj2);
                physics[i].velocity.x += x * share_i;
                physics[i].velocity.y += y * share_i;
                physics[j].velocity.x -= x * (1.0f - share_i);
                physics[j].velocity.y -= y * (1.0f - share_i);
            }
        }
    }

    static void Integrate(ForceDirectedLayout& layout) {
        const float decay = 1.0f - layout.params_.velocity_decay;
        const float max_disp = layout.params_.max_displacement;

        for (size_t i = 0; i < layout.positions_.size(); ++i) {
            NodePhysics& physics = layout.node_physics_[i];
            if (physics.is_frozen) {
                physics.velocity = ImVec2(0.0f, 0.0f);
                continue;
            }

            physics.velocity.x *= decay;
            physics.velocity.y *= decay;

            float speed = std::sqrt(physics.velocity.x * physics.velocity.x +
                                    physics.velocity.y * physics.velocity.y);
            if (speed > max_disp) {
                physics.velocity.x *= max_disp / speed;
                physics.velocity.y *= max_disp / speed;
            }

            ImVec2 next(layout.positions_[i].x + physics.velocity.x,
                        layout.positions_[i].y + physics.velocity.y);
            if (!IsFinite(next)) {
                FreezeNode(layout, i);
                continue;
            }
            layout.positions_[i] = next;
            physics.last_valid = next;
        }
    }

    // Position-only projection run once alpha has cooled. Repeats until a
    // full pass finds no overlapping pair of collision circles; the pass
    // budget grows with the node count. Returns false if the budget ran out.
    static bool RelaxOverlaps(ForceDirectedLayout& layout) {
        auto& positions = layout.positions_;
        auto& physics = layout.node_physics_;
        const auto& radii = layout.collision_radii_;
        if (positions.size() < 2) return true;

        const int max_passes = layout.params_.settle_relaxation_passes *
                               std::max(1, static_cast<int>(positions.size()) / 8);
        bool resolved = false;
        for (int pass = 0; pass < max_passes && !resolved; ++pass) {
            bool moved = false;
            layout.spatial_hash_.Insert(positions);

            for (size_t i = 0; i < positions.size(); ++i) {
                std::vector<int> neighbors = layout.spatial_hash_.Query(positions[i], radii[i] + layout.max_collision_radius_);
                for (int j_index : neighbors) {
                    if (j_index <= static_cast<int>(i)) continue;
                    const size_t j = static_cast<size_t>(j_index);
                    if (physics[i].is_frozen && physics[j].is_frozen) continue;

                    const float min_dist = radii[i] + radii[j];
                    const float d2 = DistanceSquared(positions[i], positions[j]);
                    if (d2 >= min_dist * min_dist) continue;

                    float d = std::sqrt(d2);
                    ImVec2 dir;
                    if (d < 1e-6f) {
                        std::uniform_real_distribution<float> angle_dist(0.0f, static_cast<float>(2.0 * kPi));
                        float angle = angle_dist(layout.rng_);
                        dir = ImVec2(std::cos(angle), std::sin(angle));
                        d = 0.0f;
                    } else {
                        dir = ImVec2((positions[j].x - positions[i].x) / d,
                                     (positions[j].y - positions[i].y) / d);
                    }

                    const float overlap = min_dist - d + kOverlapSlack;
                    float share_i;
                    if (physics[i].is_frozen) {
                        share_i = 0.0f;
                    } else if (physics[j].is_frozen) {
                        share_i = 1.0f;
                    } else {
                        const float ri2 = radii[i] * radii[i];
                        const float rj2 = radii[j] * radii[j];
                        share_i = rj2 / (ri2 + rj2);
                    }

                    positions[i].x -= dir.x * overlap * share_i;
                    positions[i].y -= dir.y * overlap * share_i;
                    positions[j].x += dir.x * overlap * (1.0f - share_i);
                    positions[j].y += dir.y * overlap * (1.0f - share_i);
                    moved = true;
                }
            }

            resolved = !moved;
        }

        for (size_t i = 0; i < positions.size(); ++i) {
            physics[i].velocity = ImVec2(0.0f, 0.0f);
            physics[i].last_valid = positions[i];
        }
        return resolved;
    }
};

ForceDirectedLayout::ForceDirectedLayout(const LayoutParams& params)
    : params_(params), center_(0.0f, 0.0f), spatial_hash_(50.0f) {}

void ForceDirectedLayout::Initialize(const Graph& graph, const ImVec2& canvas_center) {
    const size_t n = graph.nodes.size();
    center_ = canvas_center;
    alpha_ = 1.0f;
    current_iteration_ = 0;
    rng_.seed(123);

    positions_.assign(n, ImVec2(0.0f, 0.0f));
    node_physics_.assign(n, NodePhysics());
    collision_radii_.assign(n, 0.0f);
    links_.clear();
    max_collision_radius_ = 0.0f;

    for (size_t i = 0; i < n; ++i) {
        const GraphNode& node = graph.nodes[i];
        if (node.seed_position && IsFinite(*node.seed_position)) {
            positions_[i] = *node.seed_position;
        } else {
            // Phyllotaxis spiral around the canvas center.
            float radius = kInitialRadius * std::sqrt(0.5f + static_cast<float>(i));
            float angle = static_cast<float>(i) * kInitialAngle;
            positions_[i] = ImVec2(canvas_center.x + radius * std::cos(angle),
                                   canvas_center.y + radius * std::sin(angle));
        }
        node_physics_[i].last_valid = positions_[i];
        collision_radii_[i] = node.radius * params_.collision_radius_multiplier;
        max_collision_radius_ = std::max(max_collision_radius_, collision_radii_[i]);
    }
    spatial_hash_.SetCellSize(max_collision_radius_ * 2.0f);

    std::vector<int> degrees = graph.Degrees();
    links_.reserve(graph.links.size());
    for (const auto& link : graph.links) {
        const float ds = static_cast<float>(degrees[link.source]);
        const float dt = static_cast<float>(degrees[link.target]);
        LinkBinding binding;
        binding.source = link.source;
        binding.target = link.target;
        binding.rest_length = link.rest_length;
        binding.strength = 1.0f / std::min(ds, dt);
        binding.bias = ds / (ds + dt);
        links_.push_back(binding);
    }

    state_ = n == 0 ? SimulationState::kSettled : SimulationState::kRunning;
}

bool ForceDirectedLayout::Step() {
    if (state_ != SimulationState::kRunning) return false;

    ++current_iteration_;
    alpha_ += (params_.alpha_target - alpha_) * params_.alpha_decay;

    ForceDirectedLayoutDetail::SanitizePositions(*this);
    const bool interacting = positions_.size() > 1;
    if (interacting) {
        ForceDirectedLayoutDetail::ApplyCharge(*this);
    }
    ForceDirectedLayoutDetail::ApplyCenter(*this);
    if (interacting) {
        ForceDirectedLayoutDetail::ApplyLinks(*this);
        ForceDirectedLayoutDetail::ApplyCollision(*this);
    }
    ForceDirectedLayoutDetail::Integrate(*this);

    if (alpha_ < params_.alpha_min) {
        if (!ForceDirectedLayoutDetail::RelaxOverlaps(*this)) {
            std::cerr << "Warning: settling with overlapping nodes, relaxation pass budget exhausted" << std::endl;
        }
        state_ = SimulationState::kSettled;
        return false;
    }
    return true;
}

void ForceDirectedLayout::ComputeLayout(const Graph& graph, const ImVec2& canvas_center) {
    Initialize(graph, canvas_center);
    while (Step()) {
    }
}

void ForceDirectedLayout::Stop() {
    state_ = SimulationState::kStopped;
}

void ForceDirectedLayout::Reheat(float alpha) {
    if (state_ == SimulationState::kStopped || state_ == SimulationState::kIdle) return;
    if (positions_.empty()) return;
    alpha_ = alpha;
    state_ = SimulationState::kRunning;
}

void ForceDirectedLayout::SetCenter(const ImVec2& center) {
    center_ = center;
}

bool ForceDirectedLayout::IsFrozen(NodeIndex index) const {
    if (index < 0 || static_cast<size_t>(index) >= node_physics_.size()) return false;
    return node_physics_[index].is_frozen;
}

void ForceDirectedLayout::SetParams(const LayoutParams& params) {
    const float old_multiplier = params_.collision_radius_multiplier;
    params_ = params;
    // Collision radii are stored pre-multiplied.
    if (old_multiplier > 0.0f && params_.collision_radius_multiplier != old_multiplier) {
        const float scale = params_.collision_radius_multiplier / old_multiplier;
        for (float& radius : collision_radii_) {
            radius *= scale;
        }
        max_collision_radius_ *= scale;
        spatial_hash_.SetCellSize(max_collision_radius_ * 2.0f);
    }
}

void ForceDirectedLayout::SetPositionForTesting(NodeIndex index, const ImVec2& position) {
    if (index < 0 || static_cast<size_t>(index) >= positions_.size()) return;
    positions_[index] = position;
}

} // namespace graph
} // namespace relgraph
