#pragma once

#include <PriorityLevel.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace coop_scheduler {

using HostCallback = std::function<void()>;

/// Identifies a callback requested from the host. Zero never names a live request.
using HostCallbackHandle = uint64_t;

constexpr HostCallbackHandle kInvalidHostCallback = 0;

/**
 * The narrow interface a scheduler needs from the environment embedding it.
 * Implementations must invoke every requested callback eventually, and their
 * clock must be monotonic.
 */
class HostBridge
{
public:
    virtual ~HostBridge() = default;

    /**
     * @brief now Monotonic time in milliseconds since the host epoch
     */
    virtual TimePoint now() const = 0;

    /**
     * @brief requestSoonCallback Invokes the callback at the next opportunity the host yields control
     * @param fn The callback
     * @return A handle accepted by cancelHostCallback
     */
    virtual HostCallbackHandle requestSoonCallback(HostCallback fn) = 0;

    /**
     * @brief requestDelayedCallback Invokes the callback no earlier than delay from now
     * @param fn The callback
     * @param delay The delay, negative values are treated as zero
     * @return A handle accepted by cancelHostCallback
     */
    virtual HostCallbackHandle requestDelayedCallback(HostCallback fn, Millis delay) = 0;

    /**
     * @brief cancelHostCallback Unknown or already invoked handles are ignored
     */
    virtual void cancelHostCallback(HostCallbackHandle handle) = 0;

    /**
     * @brief beginSlice Marks the start of an execution slice
     */
    virtual void beginSlice() = 0;

    /**
     * @brief shouldYieldNow True when the running slice must hand control back to the host
     */
    virtual bool shouldYieldNow() = 0;

    virtual void setFrameInterval(Millis interval) = 0;
    virtual void requestPaint() = 0;
};

/**
 * Bookkeeping for the callbacks a host has been asked to run: a FIFO of soon
 * callbacks and timers ordered by due time, then by request order.
 */
class HostCallbackQueue
{
public:
    HostCallbackHandle addSoon(HostCallback fn);
    HostCallbackHandle addDelayed(HostCallback fn, TimePoint due);

    /**
     * @brief cancel Forgets the callback, returns false when the handle is unknown
     */
    bool cancel(HostCallbackHandle handle);

    /**
     * @brief popSoon Removes the oldest soon callback
     * @return std::nullopt when there is none
     */
    std::optional<HostCallback> popSoon();

    /**
     * @brief popDue Removes the earliest timer if it is due at now
     * @return std::nullopt when no timer is due
     */
    std::optional<HostCallback> popDue(TimePoint now);

    [[nodiscard]] std::optional<TimePoint> nextDue() const;

    [[nodiscard]] std::size_t soonCount() const noexcept { return m_soon.size(); }
    [[nodiscard]] std::size_t delayedCount() const noexcept { return m_delayed.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_soon.empty() && m_delayed.empty(); }

    void clear();

private:
    using TimerKey = std::pair<TimePoint, HostCallbackHandle>;

    HostCallbackHandle m_next_handle = 1;
    std::deque<std::pair<HostCallbackHandle, HostCallback>> m_soon;
    std::map<TimerKey, HostCallback> m_delayed;
    std::unordered_map<HostCallbackHandle, TimePoint> m_delayed_index;
};

/**
 * Slice budgeting shared by the bundled hosts. A slice is over once its
 * quantum elapsed, once a paint was requested during it, or as soon as the
 * host reports pending input.
 */
class SlicedHostBridge : public HostBridge
{
public:
    static constexpr Millis kDefaultFrameInterval{5};

    void beginSlice() override;
    bool shouldYieldNow() override;

    /**
     * @brief setFrameInterval Sets the slice quantum
     * @param interval Must be positive, otherwise the default quantum is restored
     */
    void setFrameInterval(Millis interval) override;
    void requestPaint() override { m_needs_paint = true; }

    [[nodiscard]] Millis frameInterval() const noexcept { return m_frame_interval; }
    [[nodiscard]] TimePoint sliceStart() const noexcept { return m_slice_start; }

protected:
    /**
     * @brief hasPendingInput Hook for hosts that know about pending external events
     */
    virtual bool hasPendingInput() const { return false; }

private:
    Millis m_frame_interval = kDefaultFrameInterval;
    TimePoint m_slice_start{0};
    bool m_needs_paint = false;
};

} // namespace coop_scheduler
