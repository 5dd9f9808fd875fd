#pragma once

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <tuple>

namespace coop_scheduler {

class SchedulerStats
{
public:
    struct Metrics
    {
        double m_mean = 0.0;
        double m_min = std::numeric_limits<double>::max();
        double m_max = 0.0;
        double m_variance = 0.0;
        uint64_t m_num_samples = 0;
    };

    struct Counters
    {
        uint64_t m_invocations = 0;
        uint64_t m_completed = 0;
        uint64_t m_yielded = 0;
        // Effective cancelCallback calls
        uint64_t m_cancelled = 0;
        // Cancelled tasks discarded from the queues
        uint64_t m_dropped = 0;
        uint64_t m_failed = 0;
        uint64_t m_slices = 0;
    };

    SchedulerStats() = default;
    ~SchedulerStats() = default;

    /**
     * @brief updateMetrics Update the statistic metrics member
     * @param duration the queueing latency in ms = first execution - start time
     */
    void updateMetrics(const double duration) noexcept;

    /**
     * @brief getMetricsSoFar Returns the metrics
     * @return 
     */
    [[nodiscard]] const Metrics &getMetricsSoFar() const noexcept { return m_metrics; }

    /**
     * @brief getLatencyStatistics Min, max, mean and variance, all zero before the first sample
     */
    [[nodiscard]] std::tuple<double, double, double, double> getLatencyStatistics() const noexcept;

    [[nodiscard]] const Counters &counters() const noexcept { return m_counters; }

    void recordInvocation() noexcept { m_counters.m_invocations++; }
    void recordCompleted() noexcept { m_counters.m_completed++; }
    void recordYielded() noexcept { m_counters.m_yielded++; }
    void recordCancelled(const uint64_t count = 1) noexcept { m_counters.m_cancelled += count; }
    void recordDropped(const uint64_t count = 1) noexcept { m_counters.m_dropped += count; }
    void recordFailed() noexcept { m_counters.m_failed++; }
    void recordSlice() noexcept { m_counters.m_slices++; }

    /**
     * @brief report Writes the latency metrics and the counters as [+] log lines
     * @param out The destination stream
     */
    void report(std::ostream &out) const;

private:
    Metrics m_metrics;
    Counters m_counters;
};

} // namespace coop_scheduler
