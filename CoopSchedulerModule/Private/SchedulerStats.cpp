#include <SchedulerStats.hpp>

#include <algorithm>
#include <cassert>
#include <ostream>

namespace coop_scheduler {

void SchedulerStats::updateMetrics(const double duration) noexcept
{
    // Reference: https://en.wikipedia.org/wiki/Algorithms_for_calculating_variance#Welford's_online_algorithm
    auto &m = m_metrics;

    m.m_min = std::min(m.m_min, duration);
    m.m_max = std::max(m.m_max, duration);

    m.m_variance *= m.m_num_samples;
    m.m_num_samples++;

    //Update mean and variance on the fly without need to re-iterate
    const auto diff = duration - m.m_mean;
    m.m_mean += diff / m.m_num_samples;

    m.m_variance += diff * (duration - m.m_mean);

    assert(m.m_num_samples > 0);
    m.m_variance /= m.m_num_samples;
}

std::tuple<double, double, double, double> SchedulerStats::getLatencyStatistics() const noexcept
{
    if (m_metrics.m_num_samples == 0) {
        return {0.0, 0.0, 0.0, 0.0};
    }

    std::tuple<double, double, double, double> t = {m_metrics.m_min,
                                                    m_metrics.m_max,
                                                    m_metrics.m_mean,
                                                    m_metrics.m_variance};
    return t;
}

void SchedulerStats::report(std::ostream &out) const
{
    const auto &m = m_metrics;
    const auto &c = m_counters;

    out << "[+] Latency Statistics(ms): \n";
    if (m.m_num_samples > 0) {
        out << "\t Min = " << m.m_min << "\n";
        out << "\t Max = " << m.m_max << "\n";
        out << "\t Mean = " << m.m_mean << "\n";
        out << "\t Variance = " << m.m_variance << "\n";
    } else {
        out << "\t No task has run\n";
    }
    out << "[+] Tasks: invocations = " << c.m_invocations << ", completed = " << c.m_completed
        << ", yielded = " << c.m_yielded << ", cancelled = " << c.m_cancelled
        << ", dropped = " << c.m_dropped << ", failed = " << c.m_failed
        << ", slices = " << c.m_slices << "\n";
}

} // namespace coop_scheduler
