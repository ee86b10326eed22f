#pragma once

#include <GLFW/glfw3.h>

namespace relgraph {
namespace EventDispatch {

// Queues dropped file paths on the GuiInterface stored as window user pointer.
void custom_glfw_drop_callback(GLFWwindow* window, int path_count, const char* paths[]);
void glfw_error_callback(int error, const char* description);

} // namespace EventDispatch
} // namespace relgraph
