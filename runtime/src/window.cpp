#include "window.h"
#include <GLFW/glfw3.h>
#include <stdexcept>
#include <iostream>

namespace automind {

Window::Window(int width, int height, const std::string& title, bool fullscreen)
    : width_(width), height_(height), windowedWidth_(width), windowedHeight_(height) {

    // Initialize GLFW
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // Plain compatibility context: the visualizer only clears rectangles
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    // Create window
    GLFWmonitor* monitor = fullscreen ? glfwGetPrimaryMonitor() : nullptr;
    window_ = glfwCreateWindow(width, height, title.c_str(), monitor, nullptr);

    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }
    isFullscreen_ = monitor != nullptr;

    glfwMakeContextCurrent(window_);
    // Pacing comes from the render loop's clock, not from vsync
    glfwSwapInterval(0);

    // Store this pointer for callbacks
    glfwSetWindowUserPointer(window_, this);

    glfwSetFramebufferSizeCallback(window_, framebufferResizeCallback);
    glfwSetKeyCallback(window_, keyCallback);

    glfwGetFramebufferSize(window_, &width_, &height_);

    std::cout << "[Window] Created " << width << "x" << height << " window\n";
}

Window::~Window() {
    if (window_) {
        glfwDestroyWindow(window_);
    }
    glfwTerminate();
}

bool Window::shouldClose() const {
    return glfwWindowShouldClose(window_);
}

void Window::requestClose() {
    glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void Window::pollEvents() {
    glfwPollEvents();
}

void Window::swapBuffers() {
    glfwSwapBuffers(window_);
}

void Window::setTitle(const std::string& title) {
    if (window_) {
        glfwSetWindowTitle(window_, title.c_str());
    }
}

void Window::toggleFullscreen() {
    if (!isFullscreen_) {
        // Save current windowed position/size
        glfwGetWindowPos(window_, &windowedX_, &windowedY_);
        glfwGetWindowSize(window_, &windowedWidth_, &windowedHeight_);

        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode* mode = monitor ? glfwGetVideoMode(monitor) : nullptr;
        if (!mode) {
            std::cerr << "[Window] No monitor available for fullscreen\n";
            return;
        }
        glfwSetWindowMonitor(window_, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
        isFullscreen_ = true;
    } else {
        glfwSetWindowMonitor(window_, nullptr, windowedX_, windowedY_,
                             windowedWidth_, windowedHeight_, GLFW_DONT_CARE);
        isFullscreen_ = false;
    }
}

void Window::framebufferResizeCallback(GLFWwindow* glfwWindow, int width, int height) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window) {
        window->width_ = width;
        window->height_ = height;
    }
}

void Window::keyCallback(GLFWwindow* glfwWindow, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (!window || key < 0) return;

    if (action == GLFW_PRESS) {
        window->keysPressed_.insert(key);
    }
}

bool Window::wasKeyPressed(int key) const {
    return keysPressed_.count(key) > 0;
}

void Window::clearInputState() {
    keysPressed_.clear();
}

} // namespace automind
