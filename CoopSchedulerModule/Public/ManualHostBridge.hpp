#pragma once

#include <HostBridge.hpp>

#include <cstddef>

namespace coop_scheduler {

/**
 * Deterministic host driven by hand: a virtual clock that only moves when
 * told to, callbacks that only run when pumped, and a pending-input flag.
 * Used to simulate frames and event-loop turns without real time passing.
 */
class ManualHostBridge : public SlicedHostBridge
{
public:
    explicit ManualHostBridge(TimePoint start_time = TimePoint{0});

    TimePoint now() const override { return m_now; }

    HostCallbackHandle requestSoonCallback(HostCallback fn) override;
    HostCallbackHandle requestDelayedCallback(HostCallback fn, Millis delay) override;
    void cancelHostCallback(HostCallbackHandle handle) override;

    /**
     * @brief advanceTime Moves the virtual clock forward, timers are not fired
     * @param delta Must not be negative
     */
    void advanceTime(Millis delta);

    void setPendingInput(const bool pending) noexcept { m_pending_input = pending; }

    /**
     * @brief runSoonCallbacks Runs the soon callbacks queued before this call
     * @return The number of callbacks invoked
     */
    std::size_t runSoonCallbacks();

    /**
     * @brief fireDueTimers Runs every delayed callback due at the current time
     * @return The number of callbacks invoked
     */
    std::size_t fireDueTimers();

    /**
     * @brief runUntilIdle Pumps soon callbacks and timers, jumping the clock to the next timer when nothing is runnable
     * @param max_turns Upper bound on loop turns, protects against work that never finishes
     * @return The number of callbacks invoked
     */
    std::size_t runUntilIdle(std::size_t max_turns = 100000);

    [[nodiscard]] std::size_t pendingSoonCallbacks() const noexcept { return m_callbacks.soonCount(); }
    [[nodiscard]] std::size_t pendingDelayedCallbacks() const noexcept { return m_callbacks.delayedCount(); }
    [[nodiscard]] std::optional<TimePoint> nextTimerDue() const { return m_callbacks.nextDue(); }

protected:
    bool hasPendingInput() const override { return m_pending_input; }

private:
    TimePoint m_now;
    bool m_pending_input = false;
    HostCallbackQueue m_callbacks;
};

} // namespace coop_scheduler
