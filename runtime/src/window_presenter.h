#pragma once
#include <automind/presenter.h>
#include "window.h"
#include <cstdint>
#include <string>

namespace automind {

/**
 * @brief Presenter drawing the VisualState into a GLFW window
 *
 * Spectrum bars across the bottom, bass/mid/treble meters on the right, the
 * background tinted by the fatigue level and a border flash on beats.
 * Escape closes the window, F toggles fullscreen, Space resets the fatigue
 * count and H simulates a fatigue event.
 */
class WindowPresenter : public Presenter {
public:
    WindowPresenter(int width, int height, const std::string& title);

    void pollEvents() override;
    void present(const VisualState& state) override;
    bool closeRequested() const override;

    Window& window() { return window_; }

private:
    void fillRect(int x, int y, int w, int h, float r, float g, float b);
    void updateTitle(const VisualState& state);

    Window window_;
    std::string title_;
    FatigueLevel shownFatigue_ = FatigueLevel::Normal;
    uint64_t lastTitleTick_ = 0;
};

} // namespace automind
