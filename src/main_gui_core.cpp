#include <relgraph/core/app_config.h>
#include <relgraph/db/settings_store.h>
#include <relgraph/db/sqlite_connection.h>
#include <relgraph/graph/model/payload_json.h>
#include <relgraph/graph/utils/graph_manager.h>
#include <relgraph/gui/views/gui_interface.h>
#include <relgraph/gui/views/main_gui_views.h>
#include <relgraph/net/connections_client.h>

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace relgraph;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [payload.json]\n\n"
              << "Shows the relationship graph of a primary source.\n"
              << "The payload file holds { metadata?, content?, sourceNode?, connections?, links? }\n"
              << "or a bare array of connections. Files can also be dropped onto the window.\n\n"
              << "Environment:\n"
              << "  " << ENDPOINT_ENV_VAR << "  connections service base URL (default "
              << DEFAULT_ENDPOINT_URL << ")\n";
}

// Loads a payload file into the viewer state. Throws on unreadable or
// malformed documents.
void load_payload_file(const std::string& path, ViewerState& state) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open payload file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json doc = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("Payload file '" + path + "' is not valid JSON");
    }

    if (doc.is_object()) {
        state.source = graph::ParseSourceDescriptor(doc);
    }
    if (doc.is_array() || (doc.is_object() && doc.contains("connections"))) {
        state.connections = graph::ParseConnectionsPayload(doc);
    } else {
        state.connections.reset();
    }
    ++state.revision;
}

void save_settings(db::SettingsStore* settings, const AppConfig& config) {
    if (!settings) return;
    try {
        settings->saveConfig(config);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to save settings: " << e.what() << std::endl;
    }
}

void apply_fetch_results(net::AsyncConnectionsFetcher& fetcher, ViewerState& state, GuiInterface& gui,
                         bool& props_dirty) {
    for (auto& result : fetcher.Drain()) {
        props_dirty = true;
        if (!result.payload) {
            gui.displayError(result.error);
            continue;
        }
        state.connections = std::move(result.payload);
        ++state.revision;
        gui.displayStatus(result.kind == net::FetchKind::EXPAND ? "Connections expanded."
                                                                : "Connections generated.");
    }
}

void handle_requests(graph::GraphManager& gm, net::AsyncConnectionsFetcher& fetcher, ViewerState& state,
                     GuiInterface& gui, bool& props_dirty) {
    if (state.generate_requested) {
        state.generate_requested = false;
        net::ConnectionsClient client(state.config.endpoint_url, state.config.model_id);
        graph::SourceDescriptor source = state.source;
        fetcher.Submit(net::FetchKind::GENERATE, [client, source]() mutable {
            return client.FetchConnections(source);
        });
        gui.displayStatus("Requesting connections from " + state.config.endpoint_url + "...");
        props_dirty = true;
    }

    if (state.expand_requested) {
        state.expand_requested = false;
        std::string node_id;
        if (state.details_node_id) {
            node_id = *state.details_node_id;
        } else if (const graph::GraphNode* selected = gm.GetSelectedNode()) {
            node_id = selected->id;
        }
        if (node_id.empty()) {
            gui.displayError("Select a node to expand.");
        } else {
            net::ConnectionsClient client(state.config.endpoint_url, state.config.model_id);
            graph::SourceDescriptor source = state.source;
            graph::PrebuiltGraph existing = graph::ToPrebuilt(gm.GetGraph());
            fetcher.Submit(net::FetchKind::EXPAND, [client, source, existing, node_id]() mutable {
                graph::PrebuiltGraph merged = existing;
                net::AppendExpansion(merged, client.ExpandNode(existing, node_id, source));
                return graph::ConnectionsInput(std::move(merged));
            });
            gui.displayStatus("Expanding connections of '" + node_id + "'...");
            props_dirty = true;
        }
    }

    if (state.relayout_requested) {
        state.relayout_requested = false;
        gm.RestartLayout();
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string payload_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (!payload_path.empty()) {
            std::cerr << "Error: Only one payload file can be given." << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        payload_path = argv[i];
    }

    std::unique_ptr<db::SQLiteConnection> db_connection;
    std::unique_ptr<db::SettingsStore> settings;
    try {
        db_connection = std::make_unique<db::SQLiteConnection>();
        settings = std::make_unique<db::SettingsStore>(*db_connection);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Settings database unavailable, using defaults: " << e.what() << std::endl;
    }

    ViewerState state;
    if (settings) {
        state.config = settings->loadConfig();
    } else if (const char* env_endpoint = std::getenv(ENDPOINT_ENV_VAR); env_endpoint && env_endpoint[0] != '\0') {
        state.config.endpoint_url = env_endpoint;
    }
    std::strncpy(state.endpoint_buf, state.config.endpoint_url.c_str(), sizeof(state.endpoint_buf) - 1);

    if (!payload_path.empty()) {
        try {
            load_payload_file(payload_path, state);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Error: Failed to initialize libcurl" << std::endl;
        return 1;
    }

    GuiInterface gui_ui;
    try {
        gui_ui.initialize(state.config.theme);
    } catch (const std::exception& e) {
        std::cerr << "GUI Initialization failed: " << e.what() << std::endl;
        curl_global_cleanup();
        return 1;
    }

    {
        graph::GraphManager graph_manager(state.config.layout_params);
        net::AsyncConnectionsFetcher fetcher;
        bool props_dirty = true;
        bool last_loading = false;

        GLFWwindow* window = gui_ui.getWindow();

        // --- Main Render Loop ---
        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            for (const auto& path : gui_ui.takeDroppedPaths()) {
                try {
                    load_payload_file(path, state);
                    state.details_node_id.reset();
                    props_dirty = true;
                    gui_ui.displayStatus("Loaded " + path);
                } catch (const std::exception& e) {
                    gui_ui.displayError(e.what());
                }
            }

            apply_fetch_results(fetcher, state, gui_ui, props_dirty);
            handle_requests(graph_manager, fetcher, state, gui_ui, props_dirty);

            const bool loading = fetcher.IsBusy();
            if (props_dirty || loading != last_loading) {
                graph::GraphViewProps props;
                props.source = state.source;
                props.connections = state.connections;
                props.loading = loading;
                props.revision = state.revision;
                props.on_node_click = [&state](const graph::GraphNode& node) {
                    state.details_node_id = node.id;
                };
                graph_manager.SetProps(props);
                props_dirty = false;
                last_loading = loading;
            }

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            graph_manager.Update(graph::GraphManager::Clock::now());

            drawAllViews(graph_manager, gui_ui, state);

            if (state.settings_dirty) {
                save_settings(settings.get(), state.config);
                state.settings_dirty = false;
            }

            // Rendering
            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            ImVec4 clear_color = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
            glClearColor(clear_color.x, clear_color.y, clear_color.z, clear_color.w);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }
        // fetcher's jthread joins here, before the GUI goes away
    }

    save_settings(settings.get(), state.config);
    gui_ui.shutdown();
    curl_global_cleanup();
    return 0;
}
