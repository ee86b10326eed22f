#include <relgraph/core/event_dispatch.h>
#include <relgraph/gui/views/gui_interface.h>

#include <iostream>

namespace relgraph {
namespace EventDispatch {

void custom_glfw_drop_callback(GLFWwindow* window, int path_count, const char* paths[]) {
    GuiInterface* gui_ui = static_cast<GuiInterface*>(glfwGetWindowUserPointer(window));
    if (!gui_ui) return;
    for (int i = 0; i < path_count; ++i) {
        if (paths[i]) {
            gui_ui->pushDroppedPath(paths[i]);
        }
    }
}

void glfw_error_callback(int error, const char* description) {
    std::cerr << "GLFW Error " << error << ": " << description << std::endl;
}

} // namespace EventDispatch
} // namespace relgraph
