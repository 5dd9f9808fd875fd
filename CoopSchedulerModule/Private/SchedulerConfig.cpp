#include <SchedulerConfig.hpp>

#include <sstream>
#include <stdexcept>

namespace coop_scheduler {

void SchedulerConfig::validate() const
{
    // More urgent levels must never expire later than less urgent ones,
    // otherwise the single sort key would invert priorities.
    for (int i = 1; i < kNumPriorityLevels; ++i) {
        if (m_timeouts[i] < m_timeouts[i - 1]) {
            const auto level = static_cast<PriorityLevel>(i + 1);
            const auto previous = static_cast<PriorityLevel>(i);

            std::stringstream err;
            err << "[-] Timeout of " << toString(level) << " (" << m_timeouts[i].count()
                << "ms) is shorter than the timeout of " << toString(previous) << " ("
                << m_timeouts[i - 1].count() << "ms)";
            throw std::runtime_error(err.str());
        }
    }

    if (m_frame_interval <= Millis::zero()) {
        throw std::runtime_error("Frame interval is expected to be positive");
    }

    if (m_watchdog_threshold <= Millis::zero()) {
        throw std::runtime_error("Watchdog threshold is expected to be positive");
    }
}

} // namespace coop_scheduler
