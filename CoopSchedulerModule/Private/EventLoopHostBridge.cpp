#include <EventLoopHostBridge.hpp>

#include <algorithm>
#include <thread>

namespace coop_scheduler {

EventLoopHostBridge::EventLoopHostBridge()
    : m_epoch(std::chrono::steady_clock::now())
{}

TimePoint EventLoopHostBridge::now() const
{
    return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - m_epoch);
}

HostCallbackHandle EventLoopHostBridge::requestSoonCallback(HostCallback fn)
{
    return m_callbacks.addSoon(std::move(fn));
}

HostCallbackHandle EventLoopHostBridge::requestDelayedCallback(HostCallback fn, const Millis delay)
{
    const TimePoint due = saturatingAdd(now(), std::max(delay, Millis::zero()));
    return m_callbacks.addDelayed(std::move(fn), due);
}

void EventLoopHostBridge::cancelHostCallback(const HostCallbackHandle handle)
{
    m_callbacks.cancel(handle);
}

std::size_t EventLoopHostBridge::runUntilIdle()
{
    return run(std::chrono::steady_clock::time_point::max());
}

std::size_t EventLoopHostBridge::runFor(const Millis duration)
{
    const auto start = std::chrono::steady_clock::now();
    const auto max_duration = std::chrono::steady_clock::time_point::max() - start;
    if (duration >= std::chrono::duration_cast<Millis>(max_duration)) {
        return runUntilIdle();
    }
    return run(start + std::max(duration, Millis::zero()));
}

std::size_t EventLoopHostBridge::run(const std::chrono::steady_clock::time_point deadline)
{
    m_stop_requested = false;
    std::size_t invoked = 0;

    while (not m_stop_requested && not m_callbacks.empty()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }

        // One turn: a single soon callback, then every timer that is due
        if (auto fn = m_callbacks.popSoon()) {
            (*fn)();
            invoked++;
        }

        while (not m_stop_requested) {
            auto due = m_callbacks.popDue(now());
            if (not due) {
                break;
            }
            (*due)();
            invoked++;
        }

        if (not m_stop_requested && m_callbacks.soonCount() == 0) {
            const auto next_due = m_callbacks.nextDue();
            if (not next_due) {
                continue;
            }
            // Sleep relative to now, far away due times would overflow the clock's resolution
            const auto steady_now = std::chrono::steady_clock::now();
            const Millis until_due = std::max(*next_due - now(), Millis::zero());
            if (until_due >= std::chrono::duration_cast<Millis>(deadline - steady_now)) {
                std::this_thread::sleep_until(deadline);
            } else {
                std::this_thread::sleep_until(steady_now + until_due);
            }
        }
    }
    return invoked;
}

} // namespace coop_scheduler
