#include <Scheduler.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

#if defined(__GNUC__) || defined(__clang__)
#define COOP_SCHED_BRANCH_HINT(cond, likely) \
    (__builtin_expect(!!(cond), (likely))) ///< [!!]: ensures boolean of the condition
#else
// On MSVC or other compilers, do nothing
#define COOP_SCHED_BRANCH_HINT(cond, likely) (cond)
#endif

namespace coop_scheduler {

constexpr int kMaxForcedFrameRate = 125;

static void logTaskError(const TaskError &error)
{
    std::cerr << "[-] Task " << error.m_task_id << " (" << toString(error.m_priority_level)
              << ") failed: " << error.m_message << "\n";
}

static void logStall(const Millis outstanding)
{
    std::cerr << "[-] Host has not delivered a requested callback for " << outstanding.count()
              << "ms, the scheduler is stalled\n";
}

static double toMilliseconds(const Millis duration)
{
    return std::chrono::duration<double, std::milli>(duration).count();
}

Scheduler::Scheduler(HostBridge &host, SchedulerConfig config)
    : m_host(host)
    , m_config(std::move(config))
    , m_error_reporter(logTaskError)
    , m_stall_reporter(logStall)
{
    m_config.validate();
    m_host.setFrameInterval(m_config.m_frame_interval);
}

Scheduler::~Scheduler()
{
    cancelHostCallback();
    cancelHostTimeout();
    m_queues.clear();

    if (not m_config.m_verbose) {
        return;
    }

    //Log the latency metrics at destruction
    m_stats.report(std::cout);
}

TaskHandle Scheduler::scheduleCallback(const PriorityLevel priority_level,
                                       Work work,
                                       ScheduleOptions options)
{
    if (not work) {
        throw std::invalid_argument("Scheduled work is expected to be callable");
    }

    checkWatchdog();

    const TimePoint current_time = m_host.now();
    const Millis delay = std::max(options.m_delay.value_or(Millis::zero()), Millis::zero());
    const PriorityLevel level = normalizePriority(priority_level);

    auto task = std::make_shared<Task>();
    task->m_id = m_next_task_id++;
    task->m_work = std::move(work);
    task->m_priority_level = level;
    // Both saturate, a start time at TimePoint::max() is never reached
    task->m_start_time = saturatingAdd(current_time, delay);
    task->m_expiration_time = saturatingAdd(task->m_start_time, m_config.timeoutFor(level));

    if (task->m_start_time > current_time) {
        m_queues.pushTimer(task);

        // Only the earliest timer needs a wake-up, and only while nothing is ready
        m_stats.recordDropped(m_queues.pruneTimers());
        const TaskHandle *earliest = m_queues.peekTimer();
        if (not m_queues.hasReadyTasks() && earliest != nullptr && *earliest == task) {
            requestHostTimeout(task->m_start_time - current_time);
        }
    } else {
        m_queues.pushReady(task);

        // A running work loop picks the task up by itself
        if (not m_host_callback_scheduled && not m_is_performing_work) {
            requestHostCallback();
        }
    }
    return task;
}

TaskHandle Scheduler::scheduleCallback(Work work, ScheduleOptions options)
{
    return scheduleCallback(m_current_priority, std::move(work), options);
}

void Scheduler::cancelCallback(const TaskHandle &task) noexcept
{
    if (task == nullptr) {
        return;
    }

    switch (task->m_state) {
    case Task::State::COMPLETED:
    case Task::State::CANCELLED:
    case Task::State::FAILED:
        return;
    default:
        break;
    }

    // The heap entry stays where it is, the work loop drops it when popped
    task->m_work = nullptr;
    task->m_state = Task::State::CANCELLED;
    m_stats.recordCancelled();
}

bool Scheduler::shouldYield()
{
    return m_host.shouldYieldNow();
}

void Scheduler::continueExecution()
{
    m_paused = false;
    if (not m_host_callback_scheduled && not m_is_performing_work && m_queues.hasReadyTasks()) {
        requestHostCallback();
    }
}

TaskHandle Scheduler::getFirstCallbackNode() const
{
    const TaskHandle *head = m_queues.peekReady();
    return head != nullptr ? *head : nullptr;
}

void Scheduler::forceFrameRate(const int fps)
{
    if (fps < 0 || fps > kMaxForcedFrameRate) {
        std::cerr << "[-] forceFrameRate takes a frame rate between 0 and " << kMaxForcedFrameRate
                  << ", got " << fps << "\n";
        return;
    }

    const Millis interval = fps > 0 ? Millis{1000 / fps} : m_config.m_frame_interval;
    m_host.setFrameInterval(interval);

    if (m_config.m_verbose) {
        std::cout << "[+] Frame interval set to " << interval.count() << "ms\n";
    }
}

Scheduler::FlushResult Scheduler::flushWork(const TimePoint now)
{
    if (m_is_performing_work) {
        throw std::runtime_error("flushWork cannot be called from a running task");
    }

    // This invocation serves any outstanding host request
    cancelHostCallback();
    cancelHostTimeout();

    ScopedValue<bool> performing(m_is_performing_work, true);
    ScopedValue<PriorityLevel> priority(m_current_priority, m_current_priority);
    return workLoop(now);
}

bool Scheduler::checkWatchdog()
{
    const TimePoint current_time = m_host.now();
    Millis outstanding = Millis::zero();

    if (m_host_callback_requested_at) {
        outstanding = current_time - *m_host_callback_requested_at;
    }
    if (m_host_timeout_due_at && current_time > *m_host_timeout_due_at) {
        outstanding = std::max(outstanding, current_time - *m_host_timeout_due_at);
    }

    if (outstanding <= m_config.m_watchdog_threshold) {
        return false;
    }

    if (not m_stall_reported) {
        m_stall_reported = true;
        if (m_stall_reporter) {
            m_stall_reporter(outstanding);
        }
    }
    return true;
}

PriorityLevel Scheduler::nextPriorityLevel() const noexcept
{
    switch (m_current_priority) {
    case PriorityLevel::IMMEDIATE:
    case PriorityLevel::USER_BLOCKING:
    case PriorityLevel::NORMAL:
        return PriorityLevel::NORMAL;
    default:
        return m_current_priority;
    }
}

Scheduler::FlushResult Scheduler::workLoop(TimePoint current_time)
{
    m_stats.recordDropped(m_queues.advanceTimers(current_time).m_dropped);

    while (not m_paused) {
        const TaskHandle *head = m_queues.peekReady();
        if (head == nullptr) {
            break;
        }

        if (COOP_SCHED_BRANCH_HINT(not (*head)->isRunnable(), false)) {
            // Cancelled while queued
            m_queues.popReady();
            m_stats.recordDropped();
            continue;
        }

        // Tasks that have not expired yet wait for the next slice, expired ones are forced through
        if ((*head)->m_expiration_time > current_time && m_host.shouldYieldNow()) {
            return FlushResult::MORE_WORK_PENDING;
        }

        const TaskHandle task = m_queues.popReady();
        runTask(task, current_time);

        // The task may have run for a while, timers may have matured meanwhile
        current_time = m_host.now();
        m_stats.recordDropped(m_queues.advanceTimers(current_time).m_dropped);
    }

    if (m_queues.hasReadyTasks()) {
        // Paused with work left
        return FlushResult::MORE_WORK_PENDING;
    }

    if (const TaskHandle *timer = m_queues.peekTimer()) {
        requestHostTimeout((*timer)->m_start_time - current_time);
        return FlushResult::WAITING_ON_TIMERS;
    }
    return FlushResult::IDLE;
}

void Scheduler::runTask(const TaskHandle &task, const TimePoint current_time)
{
    Work work = std::move(task->m_work);
    task->m_work = nullptr;
    task->m_state = Task::State::RUNNING;

    if (not task->m_has_started) {
        task->m_has_started = true;
        m_stats.updateMetrics(toMilliseconds(current_time - task->m_start_time));
    }
    m_stats.recordInvocation();

    const bool did_timeout = task->m_expiration_time <= current_time;

    ScopedValue<TaskHandle> running(m_current_task, task);
    ScopedValue<PriorityLevel> priority(m_current_priority, task->m_priority_level);

    try {
        WorkResult result = work(did_timeout);

        if (task->m_state == Task::State::CANCELLED) {
            // Cancelled from inside its own work, the continuation must not run
            return;
        }

        if (result.hasContinuation()) {
            // Keeps its original expiration time, pushReady restores the same sortIndex
            task->m_work = result.takeContinuation();
            m_queues.pushReady(task);
            m_stats.recordYielded();
        } else {
            task->m_state = Task::State::COMPLETED;
            m_stats.recordCompleted();
        }
    } catch (const std::exception &e) {
        failTask(task, e.what());
    } catch (...) {
        failTask(task, "unknown exception");
    }
}

void Scheduler::failTask(const TaskHandle &task, const std::string &message)
{
    task->m_work = nullptr;
    task->m_state = Task::State::FAILED;
    m_stats.recordFailed();

    if (not m_error_reporter) {
        return;
    }

    try {
        m_error_reporter(TaskError{task->m_id, task->m_priority_level, message});
    } catch (const std::exception &e) {
        std::cerr << "[-] Error reporter threw while reporting task " << task->m_id << ": "
                  << e.what() << "\n";
    }
}

void Scheduler::performWorkUntilDeadline()
{
    m_host_callback_handle = kInvalidHostCallback;
    m_host_callback_scheduled = false;
    m_host_callback_requested_at.reset();
    m_stall_reported = false;

    m_host.beginSlice();
    m_stats.recordSlice();

    FlushResult result = FlushResult::IDLE;
    try {
        result = flushWork(m_host.now());
    } catch (...) {
        // The remaining work keeps its host request, the host sees the exception
        rescheduleRemainingWork();
        throw;
    }

    if (result == FlushResult::MORE_WORK_PENDING && not m_paused && not m_host_callback_scheduled) {
        requestHostCallback();
    }
}

void Scheduler::rescheduleRemainingWork()
{
    if (m_queues.hasReadyTasks()) {
        if (not m_paused && not m_host_callback_scheduled) {
            requestHostCallback();
        }
        return;
    }

    m_stats.recordDropped(m_queues.pruneTimers());
    if (const TaskHandle *timer = m_queues.peekTimer()) {
        requestHostTimeout((*timer)->m_start_time - m_host.now());
    }
}

void Scheduler::handleTimeout()
{
    m_host_timeout_handle = kInvalidHostCallback;
    m_host_timeout_due_at.reset();
    m_stall_reported = false;

    const TimePoint current_time = m_host.now();
    m_stats.recordDropped(m_queues.advanceTimers(current_time).m_dropped);

    if (m_host_callback_scheduled) {
        return;
    }

    if (m_queues.hasReadyTasks()) {
        requestHostCallback();
    } else if (const TaskHandle *timer = m_queues.peekTimer()) {
        requestHostTimeout((*timer)->m_start_time - current_time);
    }
}

void Scheduler::requestHostCallback()
{
    m_host_callback_scheduled = true;
    m_host_callback_requested_at = m_host.now();
    m_host_callback_handle = m_host.requestSoonCallback([this]() { performWorkUntilDeadline(); });
}

void Scheduler::cancelHostCallback()
{
    if (m_host_callback_handle != kInvalidHostCallback) {
        m_host.cancelHostCallback(m_host_callback_handle);
        m_host_callback_handle = kInvalidHostCallback;
    }
    m_host_callback_scheduled = false;
    m_host_callback_requested_at.reset();
}

void Scheduler::requestHostTimeout(const Millis delay)
{
    // A single timeout is armed at a time, a new one replaces the previous
    cancelHostTimeout();

    const Millis clamped_delay = std::max(delay, Millis::zero());
    const TimePoint due = saturatingAdd(m_host.now(), clamped_delay);
    if (due == TimePoint::max()) {
        // Timers at the end of the clock never mature
        return;
    }

    m_host_timeout_due_at = due;
    m_host_timeout_handle = m_host.requestDelayedCallback([this]() { handleTimeout(); }, clamped_delay);
}

void Scheduler::cancelHostTimeout()
{
    if (m_host_timeout_handle != kInvalidHostCallback) {
        m_host.cancelHostCallback(m_host_timeout_handle);
        m_host_timeout_handle = kInvalidHostCallback;
    }
    m_host_timeout_due_at.reset();
}

} // namespace coop_scheduler
