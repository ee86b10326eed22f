#pragma once

#include <imgui.h>
#include <relgraph/graph/layout/simulation_runner.h>
#include <relgraph/graph/model/graph_normalizer.h>
#include <relgraph/graph/render/camera_utils.h>
#include <relgraph/graph/render/graph_scene.h>
#include <relgraph/graph/render/interaction_controller.h>
#include <relgraph/gui/render/theme_utils.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace relgraph {
namespace graph {

// Inputs the host hands to the graph view.
struct GraphViewProps {
    SourceDescriptor source;
    std::optional<ConnectionsInput> connections;
    bool loading = false;
    std::function<void(const GraphNode&)> on_node_click;
    // Bumped by the host whenever it replaces the payload, so a new payload
    // with the same counts still rebuilds.
    std::uint64_t revision = 0;
};

// The embeddable graph view: owns the Graph, its simulation, the camera and
// the interaction state. Everything runs on the caller's thread.
class GraphManager {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::chrono::milliseconds kResizeDebounce{150};
    static constexpr float kResizeReheatAlpha = 0.3f;

    explicit GraphManager(const ForceDirectedLayout::LayoutParams& params = ForceDirectedLayout::LayoutParams());
    ~GraphManager();

    GraphManager(const GraphManager&) = delete;
    GraphManager& operator=(const GraphManager&) = delete;

    // Returns true when the Graph was rebuilt.
    bool SetProps(const GraphViewProps& props);

    void OnCanvasResize(const ImVec2& size, Clock::time_point now);
    // Applies a settled resize, then advances the simulation one tick.
    // Returns true when node positions changed.
    bool Update(Clock::time_point now);

    // Pointer input, canvas-relative.
    void OnPointerMove(const ImVec2& point);
    void OnPointerLeave();
    void OnPointerDown(const ImVec2& point);
    void OnPointerDrag(const ImVec2& delta);
    void OnPointerUp(const ImVec2& point);
    void OnWheel(const ImVec2& anchor, float wheel);

    SceneFrame BuildScene(ThemeType theme) const;

    void RestartLayout();
    void SetLayoutParams(const ForceDirectedLayout::LayoutParams& params);
    const ForceDirectedLayout::LayoutParams& GetLayoutParams() const { return runner_.GetParams(); }

    const Graph& GetGraph() const { return graph_; }
    const GraphNode* GetNodeById(const std::string& id) const;
    const GraphNode* GetSelectedNode() const;
    const std::vector<ImVec2>& GetPositions() const { return positions_; }
    const GraphViewState& getGraphViewState() const { return view_state_; }
    const InteractionController& GetInteraction() const { return interaction_; }
    const SimulationRunner& GetRunner() const { return runner_; }
    SimulationHandle GetSimulationHandle() const { return handle_; }
    const Viewport& GetViewport() const { return viewport_; }
    bool IsLoading() const { return props_.loading; }
    bool IsLayoutRunning() const { return runner_.IsRunning(); }
    std::uint64_t GetRebuildCount() const { return rebuild_count_; }
    std::uint64_t GetStaleTickCount() const { return stale_ticks_; }

private:
    struct InputSignature {
        bool has_connections = false;
        std::string source_key;
        size_t connection_count = 0;
        size_t link_count = 0;
        std::uint64_t revision = 0;

        bool operator==(const InputSignature& other) const;
        bool operator!=(const InputSignature& other) const { return !(*this == other); }
    };

    static InputSignature SignatureOf(const GraphViewProps& props);
    void Rebuild();
    void ApplyViewport(const ImVec2& size);
    void FitIfNeeded();
    void OnSimulationTick(const SimulationHandle& handle, const std::vector<ImVec2>& positions);

    Graph graph_;
    SimulationRunner runner_;
    SimulationHandle handle_;
    int tick_listener_ = 0;
    std::vector<ImVec2> positions_;
    GraphViewState view_state_;
    InteractionController interaction_;
    GraphViewProps props_;
    InputSignature signature_;
    bool has_signature_ = false;
    Viewport viewport_;
    bool viewport_measured_ = false;
    std::optional<ImVec2> pending_size_;
    Clock::time_point pending_since_;
    bool positions_dirty_ = false;
    std::uint64_t rebuild_count_ = 0;
    std::uint64_t stale_ticks_ = 0;

    // Press/drag tracking for click detection.
    bool pointer_down_ = false;
    bool dragged_ = false;
    std::optional<NodeIndex> press_node_;
};

} // namespace graph
} // namespace relgraph
