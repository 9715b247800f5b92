#include "window_presenter.h"
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace automind {

WindowPresenter::WindowPresenter(int width, int height, const std::string& title)
    : window_(width, height, title), title_(title) {}

void WindowPresenter::pollEvents() {
    window_.clearInputState();
    window_.pollEvents();

    if (window_.wasKeyPressed(GLFW_KEY_ESCAPE)) {
        window_.requestClose();
    }
    if (window_.wasKeyPressed(GLFW_KEY_F)) {
        window_.toggleFullscreen();
    }
    if (window_.wasKeyPressed(GLFW_KEY_SPACE)) {
        issue(PresenterCommand::ResetFatigue);
    }
    if (window_.wasKeyPressed(GLFW_KEY_H)) {
        issue(PresenterCommand::SimulateFatigueEvent);
    }
}

bool WindowPresenter::closeRequested() const {
    return window_.shouldClose();
}

void WindowPresenter::fillRect(int x, int y, int w, int h, float r, float g, float b) {
    if (w <= 0 || h <= 0) return;
    glScissor(x, y, w, h);
    glClearColor(r, g, b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void WindowPresenter::present(const VisualState& state) {
    const int width = window_.width();
    const int height = window_.height();
    if (width <= 0 || height <= 0) return;  // Minimized

    glViewport(0, 0, width, height);
    glDisable(GL_SCISSOR_TEST);
    glClearColor(state.background.r, state.background.g, state.background.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    glEnable(GL_SCISSOR_TEST);

    const int margin = 20;
    const int meterArea = 120;

    // Beat flash around the edge
    if (state.pulse > 0.05f) {
        int border = static_cast<int>(std::ceil(state.pulse * 8.0f));
        float p = state.pulse;
        fillRect(0, 0, width, border, p, p, p);
        fillRect(0, height - border, width, border, p, p, p);
        fillRect(0, 0, border, height, p, p, p);
        fillRect(width - border, 0, border, height, p, p, p);
    }

    // Spectrum bars, low frequencies on the left
    const int barsWidth = width - meterArea - 2 * margin;
    const int barsHeight = height - 2 * margin;
    const int count = static_cast<int>(state.bars.size());
    if (count > 0 && barsWidth > 0 && barsHeight > 0) {
        const float slot = static_cast<float>(barsWidth) / count;
        const int barW = std::max(1, static_cast<int>(slot) - 2);
        for (int i = 0; i < count; i++) {
            float v = std::clamp(state.bars[i], 0.0f, 1.0f);
            float t = static_cast<float>(i) / count;
            // Color gradient: blue -> purple -> pink
            float r = (80.0f + t * 140.0f) / 255.0f;
            float g = (80.0f - t * 40.0f) / 255.0f;
            float b = (180.0f - t * 40.0f) / 255.0f;
            int x = margin + static_cast<int>(i * slot);
            fillRect(x, margin, barW, static_cast<int>(v * barsHeight), r, g, b);
        }
    }

    // Band meters
    const float bands[3] = {state.bass, state.mid, state.treble};
    const float colors[3][3] = {{0.9f, 0.3f, 0.3f}, {0.3f, 0.9f, 0.4f}, {0.3f, 0.5f, 0.95f}};
    const int meterW = (meterArea - margin) / 3;
    for (int i = 0; i < 3; i++) {
        int x = width - meterArea + i * meterW;
        float v = std::clamp(bands[i], 0.0f, 1.0f);
        fillRect(x, margin, meterW - 4, static_cast<int>(v * barsHeight),
                 colors[i][0], colors[i][1], colors[i][2]);
    }

    glDisable(GL_SCISSOR_TEST);
    window_.swapBuffers();

    updateTitle(state);
}

void WindowPresenter::updateTitle(const VisualState& state) {
    // Roughly twice a second at 60 fps, or immediately on a level change
    if (state.fatigue == shownFatigue_ && state.tick - lastTitleTick_ < 30) return;
    shownFatigue_ = state.fatigue;
    lastTitleTick_ = state.tick;

    std::ostringstream ss;
    ss << title_ << " - " << fatigueLevelName(state.fatigue)
       << " (" << state.fatigueEvents << " events)";
    if (!state.hasData) ss << " - waiting for audio";
    window_.setTitle(ss.str());
}

} // namespace automind
