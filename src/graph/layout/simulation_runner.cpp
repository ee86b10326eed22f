#include <relgraph/graph/layout/simulation_runner.h>

namespace relgraph {
namespace graph {

namespace {
const std::vector<ImVec2> kNoPositions;
}

SimulationRunner::SimulationRunner(const ForceDirectedLayout::LayoutParams& params)
    : params_(params) {}

SimulationHandle SimulationRunner::Start(const Graph& graph, const Viewport& viewport) {
    if (layout_) {
        layout_->Stop();
        layout_.reset();
    }

    layout_ = std::make_unique<ForceDirectedLayout>(params_);
    layout_->Initialize(graph, viewport.Center());
    current_ = SimulationHandle{next_generation_++};
    return current_;
}

void SimulationRunner::Stop(const SimulationHandle& handle) {
    if (!IsCurrent(handle)) return;
    layout_->Stop();
}

bool SimulationRunner::Tick() {
    if (!layout_ || !layout_->IsRunning()) return false;

    const SimulationHandle ticked = current_;
    layout_->Step();

    // Copy so listeners may (un)subscribe while being notified.
    auto listeners = listeners_;
    for (auto& [token, listener] : listeners) {
        // A listener that restarts the runner supersedes this tick.
        if (current_ != ticked) break;
        listener(ticked, layout_->GetPositions());
    }
    return true;
}

int SimulationRunner::RunToCompletion(int max_ticks) {
    int ticks = 0;
    while (ticks < max_ticks && Tick()) {
        ++ticks;
    }
    return ticks;
}

bool SimulationRunner::IsCurrent(const SimulationHandle& handle) const {
    return layout_ && handle.IsValid() && handle == current_;
}

bool SimulationRunner::IsRunning() const {
    return layout_ && layout_->IsRunning();
}

SimulationState SimulationRunner::GetState() const {
    return layout_ ? layout_->GetState() : SimulationState::kIdle;
}

const std::vector<ImVec2>& SimulationRunner::GetPositions() const {
    return layout_ ? layout_->GetPositions() : kNoPositions;
}

void SimulationRunner::SetCenter(const ImVec2& center) {
    if (layout_) layout_->SetCenter(center);
}

void SimulationRunner::Reheat(float alpha) {
    if (layout_) layout_->Reheat(alpha);
}

int SimulationRunner::Subscribe(TickListener listener) {
    int token = next_listener_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void SimulationRunner::Unsubscribe(int token) {
    listeners_.erase(token);
}

void SimulationRunner::SetParams(const ForceDirectedLayout::LayoutParams& params) {
    params_ = params;
    if (layout_) layout_->SetParams(params);
}

} // namespace graph
} // namespace relgraph
