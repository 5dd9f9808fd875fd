#include <ManualHostBridge.hpp>

#include <algorithm>
#include <stdexcept>

namespace coop_scheduler {

ManualHostBridge::ManualHostBridge(TimePoint start_time)
    : m_now(start_time)
{}

HostCallbackHandle ManualHostBridge::requestSoonCallback(HostCallback fn)
{
    return m_callbacks.addSoon(std::move(fn));
}

HostCallbackHandle ManualHostBridge::requestDelayedCallback(HostCallback fn, const Millis delay)
{
    const TimePoint due = saturatingAdd(m_now, std::max(delay, Millis::zero()));
    return m_callbacks.addDelayed(std::move(fn), due);
}

void ManualHostBridge::cancelHostCallback(const HostCallbackHandle handle)
{
    m_callbacks.cancel(handle);
}

void ManualHostBridge::advanceTime(const Millis delta)
{
    if (delta < Millis::zero()) {
        throw std::invalid_argument("The host clock is monotonic, it cannot move backwards");
    }
    m_now = saturatingAdd(m_now, delta);
}

std::size_t ManualHostBridge::runSoonCallbacks()
{
    // Callbacks requested while pumping wait for the next call
    std::size_t budget = m_callbacks.soonCount();
    std::size_t invoked = 0;

    while (budget-- > 0) {
        auto fn = m_callbacks.popSoon();
        if (not fn) {
            break;
        }
        (*fn)();
        invoked++;
    }
    return invoked;
}

std::size_t ManualHostBridge::fireDueTimers()
{
    std::size_t invoked = 0;
    while (auto fn = m_callbacks.popDue(m_now)) {
        (*fn)();
        invoked++;
    }
    return invoked;
}

std::size_t ManualHostBridge::runUntilIdle(const std::size_t max_turns)
{
    std::size_t invoked = 0;

    for (std::size_t turn = 0; turn < max_turns && not m_callbacks.empty(); ++turn) {
        std::size_t ran = runSoonCallbacks();
        ran += fireDueTimers();

        if (ran == 0) {
            const auto due = m_callbacks.nextDue();
            if (due && *due > m_now) {
                m_now = *due;
            }
        }
        invoked += ran;
    }
    return invoked;
}

} // namespace coop_scheduler
