#pragma once

/**
 * @file presenter.h
 * @brief Output surface the render loop hands each VisualState to
 */

#include <automind/visual_state.h>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <utility>

namespace automind {

/// @brief User requests a presenter forwards to the rest of the pipeline
enum class PresenterCommand {
    ResetFatigue,          ///< Clear the fatigue event count and level
    SimulateFatigueEvent   ///< Count one fatigue event by hand
};

/**
 * @brief Receives one VisualState per render tick
 *
 * All calls happen on the render (main) thread. Input the presenter turns
 * into commands goes to the handler set with setCommandHandler().
 */
class Presenter {
public:
    using CommandHandler = std::function<void(PresenterCommand)>;

    virtual ~Presenter() = default;

    /// @brief Process window/input events before a tick
    virtual void pollEvents() {}

    /// @brief Draw and show one frame
    virtual void present(const VisualState& state) = 0;

    /// @brief True once the user asked to quit (window closed, Escape)
    virtual bool closeRequested() const { return false; }

    void setCommandHandler(CommandHandler handler) { m_commandHandler = std::move(handler); }

protected:
    /// @brief Forward a command; ignored when no handler is set
    void issue(PresenterCommand command) {
        if (m_commandHandler) m_commandHandler(command);
    }

private:
    CommandHandler m_commandHandler;
};

/**
 * @brief Headless presenter that prints a meter line every few ticks
 *
 * @par Example output
 * @code
 * [Render] t=  2.35s  bass 0.41 |########            | mid 0.12 treble 0.03  NORMAL
 * @endcode
 */
class LogPresenter : public Presenter {
public:
    /// @param every Print one line per this many ticks (0 = never)
    explicit LogPresenter(uint32_t every = 30);
    LogPresenter(std::ostream& out, uint32_t every);

    void present(const VisualState& state) override;

    uint64_t presented() const { return m_presented; }

private:
    std::ostream& m_out;
    uint32_t m_every;
    uint64_t m_presented = 0;
};

} // namespace automind
