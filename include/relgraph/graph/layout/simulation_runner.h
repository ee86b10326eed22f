#ifndef RELGRAPH_SIMULATION_RUNNER_H
#define RELGRAPH_SIMULATION_RUNNER_H

#include <relgraph/graph/layout/force_directed_layout.h>
#include <relgraph/graph/model/graph_types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace relgraph {
namespace graph {

struct SimulationHandle {
    std::uint64_t generation = 0;

    bool IsValid() const { return generation != 0; }
    bool operator==(const SimulationHandle& other) const { return generation == other.generation; }
    bool operator!=(const SimulationHandle& other) const { return generation != other.generation; }
};

// Owns at most one live simulation and drives it one tick at a time from
// whatever scheduler calls Tick(): the frame loop in the viewer, a plain
// loop in tests.
class SimulationRunner {
public:
    using TickListener = std::function<void(const SimulationHandle&, const std::vector<ImVec2>&)>;

    explicit SimulationRunner(const ForceDirectedLayout::LayoutParams& params = ForceDirectedLayout::LayoutParams());

    // Synchronously discards the current simulation and starts one over `graph`.
    SimulationHandle Start(const Graph& graph, const Viewport& viewport);
    // Stops the simulation only if `handle` still names the current one.
    void Stop(const SimulationHandle& handle);
    // Advances the current simulation; returns true if positions changed.
    bool Tick();
    // Ticks until the current simulation settles or `max_ticks` is spent.
    int RunToCompletion(int max_ticks = 10000);

    bool IsCurrent(const SimulationHandle& handle) const;
    bool IsRunning() const;
    SimulationState GetState() const;
    SimulationHandle GetCurrentHandle() const { return current_; }
    const ForceDirectedLayout* GetLayout() const { return layout_.get(); }
    const std::vector<ImVec2>& GetPositions() const;

    void SetCenter(const ImVec2& center);
    void Reheat(float alpha = 1.0f);

    int Subscribe(TickListener listener);
    void Unsubscribe(int token);

    const ForceDirectedLayout::LayoutParams& GetParams() const { return params_; }
    void SetParams(const ForceDirectedLayout::LayoutParams& params);

private:
    ForceDirectedLayout::LayoutParams params_;
    std::unique_ptr<ForceDirectedLayout> layout_;
    SimulationHandle current_;
    std::uint64_t next_generation_ = 1;
    std::map<int, TickListener> listeners_;
    int next_listener_token_ = 1;
};

} // namespace graph
} // namespace relgraph

#endif // RELGRAPH_SIMULATION_RUNNER_H
