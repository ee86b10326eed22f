#pragma once

#include <relgraph/core/app_config.h>
#include <relgraph/graph/model/graph_normalizer.h>

#include <cstdint>
#include <optional>
#include <string>

namespace relgraph {

namespace graph {
class GraphManager;
}
class GuiInterface;

// Host-side state shared by the main loop and the views. Views only set the
// *_requested flags; the main loop acts on them.
struct ViewerState {
    AppConfig config;
    graph::SourceDescriptor source;
    std::optional<graph::ConnectionsInput> connections;
    std::uint64_t revision = 0;

    std::optional<std::string> details_node_id;
    char endpoint_buf[512] = {0};

    bool generate_requested = false;
    bool expand_requested = false;
    bool relayout_requested = false;
    bool settings_dirty = false;
};

/*
 * Renders all ImGui views for the application: settings and controls,
 * the legend, the graph canvas and the node details window.
 * Called once per frame from the main loop.
 */
void drawAllViews(graph::GraphManager& gm, GuiInterface& gui, ViewerState& state);

} // namespace relgraph
