#pragma once

#include <PriorityLevel.hpp>

#include <array>

namespace coop_scheduler {

/// Largest signed 31 bit integer, ~12 days in milliseconds. Idle work never expires in practice.
constexpr Millis kMaxSigned31BitTimeout{1073741823};

struct SchedulerConfig
{
    using TimeoutTable = std::array<Millis, kNumPriorityLevels>;

    /**
     * @brief timeoutFor The maximum age of a task before it is considered expired
     * @param level The priority level, invalid values resolve to NORMAL
     * @return
     */
    [[nodiscard]] Millis timeoutFor(const PriorityLevel level) const noexcept
    {
        return m_timeouts[priorityIndex(level)];
    }

    void setTimeout(const PriorityLevel level, const Millis timeout) noexcept
    {
        m_timeouts[priorityIndex(level)] = timeout;
    }

    /**
     * @brief validate Throws std::runtime_error describing the first inconsistency
     */
    void validate() const;

    // Immediate is negative so it is expired on arrival
    TimeoutTable m_timeouts = {Millis{-1}, Millis{250}, Millis{5000}, Millis{10000}, kMaxSigned31BitTimeout};

    Millis m_frame_interval{5};

    // A requested host callback older than this is reported as a stall
    Millis m_watchdog_threshold{1000};

    // Logs frame rate changes and the latency statistics at destruction
    bool m_verbose = false;
};

} // namespace coop_scheduler
