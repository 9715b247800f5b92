#pragma once

/**
 * @file shutdown_signal.h
 * @brief Process-wide cancellation flag
 */

#include <atomic>

namespace automind {

/**
 * @brief One-way cancellation flag shared by all pipeline stages
 *
 * raise() only touches a lock-free atomic, so it may be called from a POSIX
 * signal handler. Raising more than once leaves the same state as raising
 * once.
 */
class ShutdownSignal {
public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    /**
     * @brief Raise the signal
     * @return true for the call that actually raised it
     */
    bool raise() noexcept { return !m_raised.exchange(true, std::memory_order_acq_rel); }

    bool raised() const noexcept { return m_raised.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_raised{false};

    static_assert(std::atomic<bool>::is_always_lock_free, "ShutdownSignal must be lock-free");
};

} // namespace automind
