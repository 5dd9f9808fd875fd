#include <HostBridge.hpp>

namespace coop_scheduler {

void SlicedHostBridge::beginSlice()
{
    m_slice_start = now();
    m_needs_paint = false;
}

bool SlicedHostBridge::shouldYieldNow()
{
    if (m_needs_paint || hasPendingInput()) {
        return true;
    }
    const Millis time_elapsed = now() - m_slice_start;
    return time_elapsed >= m_frame_interval;
}

void SlicedHostBridge::setFrameInterval(const Millis interval)
{
    m_frame_interval = interval > Millis::zero() ? interval : kDefaultFrameInterval;
}

HostCallbackHandle HostCallbackQueue::addSoon(HostCallback fn)
{
    const HostCallbackHandle handle = m_next_handle++;
    m_soon.emplace_back(handle, std::move(fn));
    return handle;
}

HostCallbackHandle HostCallbackQueue::addDelayed(HostCallback fn, const TimePoint due)
{
    const HostCallbackHandle handle = m_next_handle++;
    m_delayed.emplace(TimerKey{due, handle}, std::move(fn));
    m_delayed_index.emplace(handle, due);
    return handle;
}

bool HostCallbackQueue::cancel(const HostCallbackHandle handle)
{
    auto indexed = m_delayed_index.find(handle);
    if (indexed != m_delayed_index.end()) {
        m_delayed.erase(TimerKey{indexed->second, handle});
        m_delayed_index.erase(indexed);
        return true;
    }

    for (auto it = m_soon.begin(); it != m_soon.end(); ++it) {
        if (it->first == handle) {
            m_soon.erase(it);
            return true;
        }
    }
    return false;
}

std::optional<HostCallback> HostCallbackQueue::popSoon()
{
    if (m_soon.empty()) {
        return std::nullopt;
    }
    HostCallback fn = std::move(m_soon.front().second);
    m_soon.pop_front();
    return fn;
}

std::optional<HostCallback> HostCallbackQueue::popDue(const TimePoint now)
{
    if (m_delayed.empty() || m_delayed.begin()->first.first > now) {
        return std::nullopt;
    }
    auto earliest = m_delayed.begin();
    HostCallback fn = std::move(earliest->second);
    m_delayed_index.erase(earliest->first.second);
    m_delayed.erase(earliest);
    return fn;
}

std::optional<TimePoint> HostCallbackQueue::nextDue() const
{
    if (m_delayed.empty()) {
        return std::nullopt;
    }
    return m_delayed.begin()->first.first;
}

void HostCallbackQueue::clear()
{
    m_soon.clear();
    m_delayed.clear();
    m_delayed_index.clear();
}

} // namespace coop_scheduler
