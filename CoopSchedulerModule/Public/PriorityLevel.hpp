#pragma once

#include <chrono>
#include <cstddef>
#include <limits>

namespace coop_scheduler {

/// Milliseconds on the host's monotonic clock. Absolute times are offsets from the host epoch.
using Millis = std::chrono::milliseconds;
using TimePoint = std::chrono::milliseconds;

/**
 * @brief saturatingAdd Offsets a time point, clamping to the representable range instead of overflowing
 * @param time The time point
 * @param delta The offset, may be negative
 * @return TimePoint::max() or TimePoint::min() when the sum does not fit
 */
constexpr TimePoint saturatingAdd(const TimePoint time, const Millis delta) noexcept
{
    using Rep = Millis::rep;
    const Rep t = time.count();
    const Rep d = delta.count();

    if (d > 0 && t > std::numeric_limits<Rep>::max() - d) {
        return TimePoint::max();
    }
    if (d < 0 && t < std::numeric_limits<Rep>::min() - d) {
        return TimePoint::min();
    }
    return TimePoint{t + d};
}

enum class PriorityLevel { IMMEDIATE = 1, USER_BLOCKING = 2, NORMAL = 3, LOW = 4, IDLE = 5 };

constexpr int kNumPriorityLevels = 5;

/**
 * @brief isValidPriority Checks that the value is one of the five enumerators
 * @param level The candidate level, possibly cast from an arbitrary integer
 * @return 
 */
constexpr bool isValidPriority(const PriorityLevel level) noexcept
{
    const auto raw = static_cast<int>(level);
    return raw >= static_cast<int>(PriorityLevel::IMMEDIATE)
           && raw <= static_cast<int>(PriorityLevel::IDLE);
}

/**
 * @brief normalizePriority Maps invalid levels to NORMAL, priority is only a hint
 */
constexpr PriorityLevel normalizePriority(const PriorityLevel level) noexcept
{
    return isValidPriority(level) ? level : PriorityLevel::NORMAL;
}

/// Zero based slot of a (normalized) level in the timeout table.
constexpr std::size_t priorityIndex(const PriorityLevel level) noexcept
{
    return static_cast<std::size_t>(normalizePriority(level)) - 1;
}

const char *toString(PriorityLevel level) noexcept;

} // namespace coop_scheduler
