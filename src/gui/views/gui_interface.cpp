#include <relgraph/gui/views/gui_interface.h>
#include <relgraph/core/event_dispatch.h>

// Include GUI library headers
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <iostream>
#include <stdexcept>

namespace relgraph {

GuiInterface::GuiInterface() = default;

GuiInterface::~GuiInterface() {
    // Ensure shutdown is called, although it should be called explicitly
    if (window) {
        shutdown();
    }
}

void GuiInterface::initialize(ThemeType theme) {
    current_theme = theme;

    glfwSetErrorCallback(EventDispatch::glfw_error_callback);
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // Decide GL+GLSL versions
#if defined(__APPLE__)
    // GL 3.2 + GLSL 150
    const char* glsl_version = "#version 150";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);  // 3.2+ only
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);            // Required on Mac
#else
    // GL 3.3 + GLSL 330
    const char* glsl_version = "#version 330";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#endif

    // Create window with graphics context
    window = glfwCreateWindow(1280, 720, "relgraph", nullptr, nullptr);
    if (window == nullptr) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // Enable vsync

    glfwSetWindowUserPointer(window, this);
    glfwSetDropCallback(window, EventDispatch::custom_glfw_drop_callback);

    // --- Initialize ImGui ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard; // Enable Keyboard Controls

    ThemeUtils::setTheme(current_theme);

    // Setup Platform/Renderer backends
    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
         ImGui::DestroyContext();
         glfwDestroyWindow(window);
         window = nullptr; // Prevent double free in destructor
         glfwTerminate();
         throw std::runtime_error("Failed to initialize ImGui GLFW backend");
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
         ImGui_ImplGlfw_Shutdown();
         ImGui::DestroyContext();
         glfwDestroyWindow(window);
         window = nullptr; // Prevent double free in destructor
         glfwTerminate();
         throw std::runtime_error("Failed to initialize ImGui OpenGL3 backend");
    }

    imgui_init_done = true;
    std::cout << "GUI Initialized Successfully." << std::endl;
}

void GuiInterface::shutdown() {
    if (!window) return; // Prevent double shutdown

    std::cout << "Shutting down GUI..." << std::endl;

    if (imgui_init_done) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        imgui_init_done = false;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    window = nullptr; // Mark as shut down
    std::cout << "GUI Shutdown Complete." << std::endl;
}

GLFWwindow* GuiInterface::getWindow() const {
    return window;
}

void GuiInterface::setTheme(ThemeType theme) {
    current_theme = theme;
    if (imgui_init_done) {
        ThemeUtils::setTheme(theme);
    }
}

void GuiInterface::displayStatus(const std::string& status) {
    status_line = status;
    status_is_error = false;
    std::cout << status << std::endl;
}

void GuiInterface::displayError(const std::string& error) {
    status_line = error;
    status_is_error = true;
    std::cerr << "Error: " << error << std::endl;
}

void GuiInterface::pushDroppedPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(input_mutex);
    dropped_paths.push_back(path);
}

std::vector<std::string> GuiInterface::takeDroppedPaths() {
    std::lock_guard<std::mutex> lock(input_mutex);
    std::vector<std::string> paths;
    paths.swap(dropped_paths);
    return paths;
}

} // namespace relgraph
