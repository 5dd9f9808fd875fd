#pragma once

#include <HostBridge.hpp>
#include <QueueManager.hpp>
#include <SchedulerConfig.hpp>
#include <SchedulerStats.hpp>
#include <Task.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace coop_scheduler {

struct ScheduleOptions
{
    // Negative delays are clamped to zero
    std::optional<Millis> m_delay = std::nullopt;
};

struct TaskError
{
    uint64_t m_task_id = 0;
    PriorityLevel m_priority_level = PriorityLevel::NORMAL;
    std::string m_message;
};

/// Exceptions derived from std::exception thrown by a reporter are logged, others reach the host.
using ErrorReporter = std::function<void(const TaskError &)>;
using StallReporter = std::function<void(Millis outstanding)>;

/**
 * Cooperative scheduler running opaque units of work on the thread that owns
 * it. Work is ordered by expiration time, so priority and age share a single
 * key and an expired task is never postponed past the next slice. The
 * scheduler is not thread safe; it can be reentered from a running task.
 */
class Scheduler
{
public:
    enum class FlushResult { IDLE = 0, WAITING_ON_TIMERS = 1, MORE_WORK_PENDING = 2 };

    /**
     * @brief Scheduler Binds the scheduler to its host
     * @param host The host, must outlive the scheduler
     * @param config Throws std::runtime_error when the config does not validate
     */
    explicit Scheduler(HostBridge &host, SchedulerConfig config = SchedulerConfig{});
    ~Scheduler();

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    /**
     * @brief scheduleCallback Queues a unit of work
     * @param priority_level The priority, invalid values fall back to NORMAL
     * @param work The work, throws std::invalid_argument when empty
     * @param options The optional start delay
     * @return The handle used for cancellation
     */
    TaskHandle scheduleCallback(PriorityLevel priority_level,
                                Work work,
                                ScheduleOptions options = ScheduleOptions{});

    /**
     * @brief scheduleCallback Queues a unit of work at the current priority level
     */
    TaskHandle scheduleCallback(Work work, ScheduleOptions options = ScheduleOptions{});

    /**
     * @brief cancelCallback Prevents any future invocation of the task, idempotent
     * @param task The handle, finished tasks and null handles are ignored
     */
    void cancelCallback(const TaskHandle &task) noexcept;

    /**
     * @brief shouldYield Lets long running work split itself into continuations
     */
    bool shouldYield();

    [[nodiscard]] PriorityLevel getCurrentPriorityLevel() const noexcept { return m_current_priority; }

    /// The task whose work is executing, nullptr outside of a task.
    [[nodiscard]] const TaskHandle &currentTask() const noexcept { return m_current_task; }

    /**
     * @brief runWithPriority Runs fn synchronously with the current priority level set
     * @param priority_level The level, invalid values fall back to NORMAL
     * @param fn The callable
     * @return Whatever fn returns, the previous level is restored on return and on throw
     */
    template <typename Fn>
    decltype(auto) runWithPriority(const PriorityLevel priority_level, Fn &&fn)
    {
        ScopedValue<PriorityLevel> scope(m_current_priority, normalizePriority(priority_level));
        return std::forward<Fn>(fn)();
    }

    /**
     * @brief next Runs fn with urgent levels lowered to NORMAL, other levels are kept
     */
    template <typename Fn>
    decltype(auto) next(Fn &&fn)
    {
        return runWithPriority(nextPriorityLevel(), std::forward<Fn>(fn));
    }

    /**
     * @brief wrapCallback Captures the current priority level
     * @return A callable running fn under the captured level
     */
    template <typename Fn>
    auto wrapCallback(Fn fn)
    {
        const PriorityLevel parent_priority = m_current_priority;
        return [this, parent_priority, fn = std::move(fn)](auto &&...args) mutable -> decltype(auto) {
            return runWithPriority(parent_priority, [&]() -> decltype(auto) {
                return fn(std::forward<decltype(args)>(args)...);
            });
        };
    }

    void pauseExecution() noexcept { m_paused = true; }
    void continueExecution();
    [[nodiscard]] bool isPaused() const noexcept { return m_paused; }

    /**
     * @brief getFirstCallbackNode The head of the ready queue
     * @return nullptr when no task is ready
     */
    [[nodiscard]] TaskHandle getFirstCallbackNode() const;

    /**
     * @brief forceFrameRate Sizes the slice quantum after a frame rate
     * @param fps Between 0 and 125, 0 restores the configured interval, other values are ignored
     */
    void forceFrameRate(int fps);

    void requestPaint() { m_host.requestPaint(); }

    [[nodiscard]] TimePoint now() const { return m_host.now(); }

    /**
     * @brief flushWork Runs ready tasks until the queue drains or the host asks to yield
     * @param now Current host time
     * @return MORE_WORK_PENDING when the caller has to invoke it again later
     */
    FlushResult flushWork(TimePoint now);

    /**
     * @brief checkWatchdog Detects host callbacks that were requested but never delivered
     * @return True when a callback is late by more than the watchdog threshold
     */
    bool checkWatchdog();

    void setErrorReporter(ErrorReporter reporter) { m_error_reporter = std::move(reporter); }
    void setStallReporter(StallReporter reporter) { m_stall_reporter = std::move(reporter); }

    [[nodiscard]] const SchedulerStats &stats() const noexcept { return m_stats; }

    /**
     * @brief getLatencyStatistics returns the queueing latency statistics in ms
     * @return min, max, mean and variance
     */
    [[nodiscard]] std::tuple<double, double, double, double> getLatencyStatistics() const noexcept
    {
        return m_stats.getLatencyStatistics();
    }

    [[nodiscard]] const SchedulerConfig &config() const noexcept { return m_config; }
    [[nodiscard]] const QueueManager &queues() const noexcept { return m_queues; }
    [[nodiscard]] bool isPerformingWork() const noexcept { return m_is_performing_work; }

private:
    // Assigns a value for the lifetime of the scope and restores the previous one
    template <typename T>
    class ScopedValue
    {
    public:
        ScopedValue(T &slot, T value)
            : m_slot(slot)
            , m_previous(std::move(slot))
        {
            m_slot = std::move(value);
        }
        ~ScopedValue() { m_slot = std::move(m_previous); }

        ScopedValue(const ScopedValue &) = delete;
        ScopedValue &operator=(const ScopedValue &) = delete;

    private:
        T &m_slot;
        T m_previous;
    };

    PriorityLevel nextPriorityLevel() const noexcept;

    FlushResult workLoop(TimePoint current_time);
    void runTask(const TaskHandle &task, TimePoint current_time);
    void failTask(const TaskHandle &task, const std::string &message);

    // Entry points invoked by the host
    void performWorkUntilDeadline();
    void handleTimeout();
    void rescheduleRemainingWork();

    void requestHostCallback();
    void cancelHostCallback();
    void requestHostTimeout(Millis delay);
    void cancelHostTimeout();

    HostBridge &m_host;
    SchedulerConfig m_config;
    SchedulerStats m_stats;
    QueueManager m_queues;

    uint64_t m_next_task_id = 1;
    PriorityLevel m_current_priority = PriorityLevel::NORMAL;
    TaskHandle m_current_task;

    bool m_is_performing_work = false;
    bool m_paused = false;

    bool m_host_callback_scheduled = false;
    HostCallbackHandle m_host_callback_handle = kInvalidHostCallback;
    HostCallbackHandle m_host_timeout_handle = kInvalidHostCallback;

    std::optional<TimePoint> m_host_callback_requested_at;
    std::optional<TimePoint> m_host_timeout_due_at;
    bool m_stall_reported = false;

    ErrorReporter m_error_reporter;
    StallReporter m_stall_reporter;
};

} // namespace coop_scheduler
