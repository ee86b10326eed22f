#pragma once

#include <relgraph/gui/render/theme_utils.h>

#include <mutex>
#include <string>
#include <vector>

// Forward declaration for GLFW window handle
struct GLFWwindow;

namespace relgraph {

/*
 * Owns the GLFW window and the Dear ImGui context for the viewer.
 * initialize() throws std::runtime_error when any part of the stack fails to
 * come up; everything created so far is torn down before throwing.
 */
class GuiInterface {
public:
    GuiInterface();
    ~GuiInterface();

    // Prevent copying/moving
    GuiInterface(const GuiInterface&)            = delete;
    GuiInterface& operator=(const GuiInterface&) = delete;
    GuiInterface(GuiInterface&&)                 = delete;
    GuiInterface& operator=(GuiInterface&&)      = delete;

    void initialize(ThemeType theme);
    void shutdown();

    GLFWwindow* getWindow() const;

    void setTheme(ThemeType theme);
    ThemeType getTheme() const { return current_theme; }

    // One-line status shown under the controls.
    void displayStatus(const std::string& status);
    void displayError(const std::string& error);
    const std::string& getStatusLine() const { return status_line; }
    bool isStatusError() const { return status_is_error; }

    // Called from the GLFW drop callback; drained by the main loop.
    void pushDroppedPath(const std::string& path);
    std::vector<std::string> takeDroppedPaths();

private:
    GLFWwindow* window = nullptr;
    ThemeType current_theme = ThemeType::DARK;
    bool imgui_init_done = false;

    std::string status_line;
    bool status_is_error = false;

    std::mutex input_mutex;
    std::vector<std::string> dropped_paths;
};

} // namespace relgraph
