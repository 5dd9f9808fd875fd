#include <gtest/gtest.h>

#include <ManualHostBridge.hpp>
#include <Scheduler.hpp>
#include <SchedulerStats.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>

using coop_scheduler::ManualHostBridge;
using coop_scheduler::Millis;
using coop_scheduler::PriorityLevel;
using coop_scheduler::ScheduleOptions;
using coop_scheduler::Scheduler;
using coop_scheduler::SchedulerStats;
using coop_scheduler::TaskError;
using coop_scheduler::WorkResult;

TEST(SchedulerStatsTest, UninitializedLatency)
{
    ManualHostBridge host;
    Scheduler sch(host);
    std::tuple<double, double, double, double> stats = sch.getLatencyStatistics();
    const bool all_uninitialized = std::get<0>(stats) == 0.0 && std::get<1>(stats) == 0.0
                                   && std::get<2>(stats) == 0.0 && std::get<3>(stats) == 0.0;

    EXPECT_TRUE(all_uninitialized);
}

TEST(SchedulerStatsTest, WelfordMatchesKnownSamples)
{
    SchedulerStats stats;
    for (const double sample : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
        stats.updateMetrics(sample);
    }

    const auto [min, max, mean, variance] = stats.getLatencyStatistics();
    EXPECT_DOUBLE_EQ(min, 2.0);
    EXPECT_DOUBLE_EQ(max, 9.0);
    EXPECT_DOUBLE_EQ(mean, 5.0);
    EXPECT_NEAR(variance, 4.0, 1e-9);
    EXPECT_EQ(stats.getMetricsSoFar().m_num_samples, 8u);
}

TEST(SchedulerStatsTest, SchedulerRecordsQueueingLatency)
{
    ManualHostBridge host;
    Scheduler sch(host);

    sch.scheduleCallback(PriorityLevel::NORMAL, [](bool) { return WorkResult::done(); });
    host.runUntilIdle();

    // Queued at 20ms before the host gets a turn
    sch.scheduleCallback(PriorityLevel::NORMAL, [](bool) { return WorkResult::done(); });
    host.advanceTime(Millis{20});
    host.runUntilIdle();

    const auto [min, max, mean, variance] = sch.getLatencyStatistics();
    EXPECT_DOUBLE_EQ(min, 0.0);
    EXPECT_DOUBLE_EQ(max, 20.0);
    EXPECT_DOUBLE_EQ(mean, 10.0);
    EXPECT_DOUBLE_EQ(variance, 100.0);
}

TEST(SchedulerStatsTest, ContinuationsAreSampledOnce)
{
    ManualHostBridge host;
    Scheduler sch(host);
    int remaining = 3;

    coop_scheduler::Work step = [&](bool) -> WorkResult {
        if (--remaining > 0) {
            return WorkResult::next(step);
        }
        return WorkResult::done();
    };
    sch.scheduleCallback(PriorityLevel::LOW, step);
    host.runUntilIdle();

    EXPECT_EQ(remaining, 0);
    EXPECT_EQ(sch.stats().getMetricsSoFar().m_num_samples, 1u);
    EXPECT_EQ(sch.stats().counters().m_invocations, 3u);
    EXPECT_EQ(sch.stats().counters().m_yielded, 2u);
    EXPECT_EQ(sch.stats().counters().m_completed, 1u);
}

TEST(SchedulerStatsTest, CountersTrackEveryOutcome)
{
    ManualHostBridge host;
    Scheduler sch(host);
    int reported = 0;
    sch.setErrorReporter([&reported](const TaskError &) { reported++; });

    sch.scheduleCallback(PriorityLevel::NORMAL, [](bool) { return WorkResult::done(); });
    auto cancelled = sch.scheduleCallback(PriorityLevel::NORMAL, [](bool) { return WorkResult::done(); });
    sch.scheduleCallback(PriorityLevel::NORMAL, [](bool) -> WorkResult { throw std::runtime_error("boom"); });
    sch.cancelCallback(cancelled);
    sch.cancelCallback(cancelled);
    host.runUntilIdle();

    const auto &counters = sch.stats().counters();
    EXPECT_EQ(counters.m_invocations, 2u);
    EXPECT_EQ(counters.m_completed, 1u);
    EXPECT_EQ(counters.m_cancelled, 1u);
    EXPECT_EQ(counters.m_dropped, 1u);
    EXPECT_EQ(counters.m_failed, 1u);
    EXPECT_EQ(counters.m_yielded, 0u);
    EXPECT_EQ(counters.m_slices, 1u);
    EXPECT_EQ(reported, 1);
}

TEST(SchedulerStatsTest, DroppedCountsDiscardedCancelledTasks)
{
    ManualHostBridge host;
    Scheduler sch(host);
    const auto noop = [](bool) { return WorkResult::done(); };

    auto first_timer = sch.scheduleCallback(PriorityLevel::NORMAL, noop, ScheduleOptions{Millis{10}});
    sch.scheduleCallback(PriorityLevel::NORMAL, noop, ScheduleOptions{Millis{20}});
    sch.cancelCallback(first_timer);

    // Scheduling another timer discards the cancelled head
    sch.scheduleCallback(PriorityLevel::NORMAL, noop, ScheduleOptions{Millis{30}});
    EXPECT_EQ(sch.stats().counters().m_dropped, 1u);
    EXPECT_EQ(sch.queues().timerSize(), 2u);

    auto ready = sch.scheduleCallback(PriorityLevel::NORMAL, noop);
    sch.cancelCallback(ready);
    host.runUntilIdle();

    const auto &counters = sch.stats().counters();
    EXPECT_EQ(counters.m_cancelled, 2u);
    EXPECT_EQ(counters.m_dropped, 2u);
    EXPECT_EQ(counters.m_completed, 2u);
    EXPECT_FALSE(sch.queues().hasTimers());
}

TEST(SchedulerStatsTest, ReportListsMetricsAndCounters)
{
    SchedulerStats stats;
    std::stringstream before;
    stats.report(before);
    EXPECT_NE(before.str().find("No task has run"), std::string::npos);

    stats.updateMetrics(3.0);
    stats.recordInvocation();
    stats.recordCompleted();

    std::stringstream after;
    stats.report(after);
    const std::string text = after.str();
    EXPECT_NE(text.find("[+] Latency Statistics(ms)"), std::string::npos);
    EXPECT_NE(text.find("Mean = 3"), std::string::npos);
    EXPECT_NE(text.find("invocations = 1, completed = 1"), std::string::npos);
    EXPECT_NE(text.find("dropped = 0"), std::string::npos);
}
