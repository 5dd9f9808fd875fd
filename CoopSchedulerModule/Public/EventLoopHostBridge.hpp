#pragma once

#include <HostBridge.hpp>

#include <chrono>
#include <cstddef>

namespace coop_scheduler {

/**
 * Single threaded event loop on std::chrono::steady_clock. Soon callbacks
 * run first in request order, then due timers. When nothing is runnable the
 * loop sleeps until the next timer is due.
 */
class EventLoopHostBridge : public SlicedHostBridge
{
public:
    EventLoopHostBridge();

    TimePoint now() const override;

    HostCallbackHandle requestSoonCallback(HostCallback fn) override;
    HostCallbackHandle requestDelayedCallback(HostCallback fn, Millis delay) override;
    void cancelHostCallback(HostCallbackHandle handle) override;

    /**
     * @brief runUntilIdle Runs until no callback is left or stop() is called
     * @return The number of callbacks invoked
     */
    std::size_t runUntilIdle();

    /**
     * @brief runFor Like runUntilIdle but returns once duration has elapsed
     * @param duration The wall-clock budget of this call
     * @return The number of callbacks invoked
     */
    std::size_t runFor(Millis duration);

    /**
     * @brief stop Makes the running loop return after the current callback
     */
    void stop() noexcept { m_stop_requested = true; }

    /// Simulates an external event waiting behind the scheduler, e.g. user input.
    void setPendingInput(const bool pending) noexcept { m_pending_input = pending; }

    [[nodiscard]] bool empty() const noexcept { return m_callbacks.empty(); }

protected:
    bool hasPendingInput() const override { return m_pending_input; }

private:
    std::size_t run(std::chrono::steady_clock::time_point deadline);

    std::chrono::steady_clock::time_point m_epoch;
    HostCallbackQueue m_callbacks;
    bool m_pending_input = false;
    bool m_stop_requested = false;
};

} // namespace coop_scheduler
