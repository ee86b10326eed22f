#include <relgraph/graph/utils/graph_manager.h>


namespace relgraph {
namespace graph {

bool GraphManager::InputSignature::operator==(const InputSignature& other) const {
    return has_connections == other.has_connections && source_key == other.source_key &&
           connection_count == other.connection_count && link_count == other.link_count &&
           revision == other.revision;
}

GraphManager::GraphManager(const ForceDirectedLayout::LayoutParams& params)
    : runner_(params) {
    view_state_.canvas_size = viewport_.size;
    tick_listener_ = runner_.Subscribe(
        [this](const SimulationHandle& handle, const std::vector<ImVec2>& positions) {
            OnSimulationTick(handle, positions);
        });
}

GraphManager::~GraphManager() {
    runner_.Unsubscribe(tick_listener_);
}

GraphManager::InputSignature GraphManager::SignatureOf(const GraphViewProps& props) {
    InputSignature signature;
    signature.has_connections = props.connections.has_value();
    signature.source_key = props.source.DisplayName() + "\n" + props.source.metadata.dump();
    if (props.connections) {
        signature.connection_count = ConnectionCount(*props.connections);
        signature.link_count = LinkCount(*props.connections);
    }
    signature.revision = props.revision;
    return signature;
}

bool GraphManager::SetProps(const GraphViewProps& props) {
    InputSignature signature = SignatureOf(props);
    props_ = props;
    interaction_.SetOnNodeClick(props_.on_node_click);

    if (has_signature_ && signature == signature_) {
        return false;
    }
    signature_ = std::move(signature);
    has_signature_ = true;
    Rebuild();
    return true;
}

void GraphManager::Rebuild() {
    // Stop synchronously before the new Graph exists.
    runner_.Stop(handle_);

    if (props_.connections) {
        graph_ = NormalizeConnections(*props_.connections, props_.source, viewport_);
    } else {
        graph_ = Graph{};
    }
    interaction_.Reset();
    pointer_down_ = false;
    press_node_.reset();

    handle_ = runner_.Start(graph_, viewport_);
    positions_ = runner_.GetPositions();
    positions_dirty_ = true;
    ++rebuild_count_;

    if (graph_.Empty()) {
        // The next non-empty graph gets a fresh initial fit.
        view_state_.initial_fit_done = false;
    } else {
        FitIfNeeded();
    }
}

void GraphManager::FitIfNeeded() {
    if (view_state_.initial_fit_done || graph_.Empty() || !viewport_measured_) return;
    const GraphNode* source = graph_.GetSourceNode();
    ImVec2 anchor = viewport_.Center();
    if (source && static_cast<size_t>(source->index) < positions_.size()) {
        anchor = positions_[source->index];
    }
    CameraUtils::FitToPoint(view_state_, anchor, viewport_.size);
    view_state_.initial_fit_done = true;
}

void GraphManager::OnCanvasResize(const ImVec2& size, Clock::time_point now) {
    if (size.x <= 0.0f || size.y <= 0.0f) return;
    if (!viewport_measured_) {
        // First measurement is applied immediately so the initial fit can run.
        ApplyViewport(size);
        return;
    }
    if (size.x == viewport_.size.x && size.y == viewport_.size.y) {
        pending_size_.reset();
        return;
    }
    if (!pending_size_ || pending_size_->x != size.x || pending_size_->y != size.y) {
        pending_size_ = size;
        pending_since_ = now;
    }
}

void GraphManager::ApplyViewport(const ImVec2& size) {
    const bool first = !viewport_measured_;
    viewport_.size = size;
    view_state_.canvas_size = size;
    viewport_measured_ = true;
    pending_size_.reset();

    runner_.SetCenter(viewport_.Center());
    if (first) {
        FitIfNeeded();
    } else if (runner_.GetState() == SimulationState::kSettled) {
        runner_.Reheat(kResizeReheatAlpha);
    }
}

bool GraphManager::Update(Clock::time_point now) {
    if (pending_size_ && now - pending_since_ >= kResizeDebounce) {
        ApplyViewport(*pending_size_);
    }

    runner_.Tick();
    bool changed = positions_dirty_;
    positions_dirty_ = false;
    return changed;
}

void GraphManager::OnSimulationTick(const SimulationHandle& handle, const std::vector<ImVec2>& positions) {
    if (handle != handle_) {
        ++stale_ticks_;
        return;
    }
    positions_ = positions;
    positions_dirty_ = true;
}

void GraphManager::OnPointerMove(const ImVec2& point) {
    interaction_.OnPointerMove(point, graph_, positions_, view_state_);
}

void GraphManager::OnPointerLeave() {
    interaction_.OnPointerLeave();
}

void GraphManager::OnPointerDown(const ImVec2& point) {
    pointer_down_ = true;
    dragged_ = false;
    press_node_ = InteractionController::HitTest(point, graph_, positions_, view_state_);
}

void GraphManager::OnPointerDrag(const ImVec2& delta) {
    if (delta.x == 0.0f && delta.y == 0.0f) return;
    dragged_ = true;
    CameraUtils::ApplyPan(view_state_, delta);
}

void GraphManager::OnPointerUp(const ImVec2& point) {
    if (!pointer_down_) return;
    pointer_down_ = false;
    if (dragged_) return;

    auto released_on = InteractionController::HitTest(point, graph_, positions_, view_state_);
    if (press_node_ && released_on != press_node_) return;
    interaction_.OnClick(point, graph_, positions_, view_state_);
}

void GraphManager::OnWheel(const ImVec2& anchor, float wheel) {
    CameraUtils::ApplyWheel(view_state_, anchor, wheel);
}

SceneFrame GraphManager::BuildScene(ThemeType theme) const {
    return graph::BuildScene(graph_, positions_, view_state_, interaction_, props_.loading, theme);
}

void GraphManager::RestartLayout() {
    if (graph_.Empty()) return;
    runner_.Reheat(1.0f);
}

void GraphManager::SetLayoutParams(const ForceDirectedLayout::LayoutParams& params) {
    runner_.SetParams(params);
}

const GraphNode* GraphManager::GetNodeById(const std::string& id) const {
    auto index = graph_.FindNode(id);
    if (!index) return nullptr;
    return &graph_.nodes[*index];
}

const GraphNode* GraphManager::GetSelectedNode() const {
    auto selected = interaction_.GetSelectedNode();
    if (!selected || static_cast<size_t>(*selected) >= graph_.nodes.size()) return nullptr;
    return &graph_.nodes[*selected];
}

} // namespace graph
} // namespace relgraph
