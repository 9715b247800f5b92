#pragma once
#include <string>
#include <unordered_set>

// Forward declare GLFW types
struct GLFWwindow;

namespace automind {

/**
 * @brief GLFW window with an OpenGL context for the visualizer
 *
 * Created and used on the main thread only.
 */
class Window {
public:
    Window(int width, int height, const std::string& title, bool fullscreen = false);
    ~Window();

    // Non-copyable
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Lifecycle
    bool shouldClose() const;
    void requestClose();
    void pollEvents();
    void swapBuffers();

    // Accessors
    int width() const { return width_; }
    int height() const { return height_; }

    void setTitle(const std::string& title);

    /// Toggle between windowed and fullscreen on the primary monitor
    void toggleFullscreen();
    bool isFullscreen() const { return isFullscreen_; }

    // Keyboard input
    bool wasKeyPressed(int key) const;       // Key was just pressed this frame

    void clearInputState();                  // Call at end of frame

private:
    static void framebufferResizeCallback(GLFWwindow* window, int width, int height);
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);

    GLFWwindow* window_ = nullptr;
    int width_ = 0;
    int height_ = 0;

    bool isFullscreen_ = false;

    // Saved windowed position/size for restoring from fullscreen
    int windowedX_ = 100;
    int windowedY_ = 100;
    int windowedWidth_ = 1000;
    int windowedHeight_ = 700;

    // Keys pressed since the last clearInputState()
    std::unordered_set<int> keysPressed_;
};

} // namespace automind
