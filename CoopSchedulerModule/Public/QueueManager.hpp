#pragma once

#include <PriorityHeap.hpp>
#include <Task.hpp>

#include <cstddef>

namespace coop_scheduler {

using TaskHeap = PriorityHeap<TaskHandle, TaskCompare>;

/**
 * Owns the ready queue (tasks eligible now, keyed by expiration time) and the
 * timer queue (tasks waiting for their start time, keyed by start time).
 * Every method finishes its heap mutation before returning, so it is safe to
 * call from inside a running task.
 */
class QueueManager
{
public:
    struct AdvanceResult
    {
        std::size_t m_matured = 0;
        std::size_t m_dropped = 0;
    };

    QueueManager() = default;
    ~QueueManager() = default;

    QueueManager(const QueueManager &) = delete;
    QueueManager &operator=(const QueueManager &) = delete;

    /**
     * @brief pushReady Inserts the task in the ready queue with sortIndex = expirationTime
     * @param task The task
     */
    void pushReady(TaskHandle task);

    /**
     * @brief pushTimer Inserts the task in the timer queue with sortIndex = startTime
     * @param task The task
     */
    void pushTimer(TaskHandle task);

    /**
     * @brief advanceTimers Moves every timer whose start time has passed into the ready queue
     * @param now Current host time
     * @return How many tasks matured and how many cancelled timers were discarded
     */
    AdvanceResult advanceTimers(TimePoint now);

    /**
     * @brief peekReady Head of the ready queue, possibly a cancelled task
     * @return nullptr when empty
     */
    [[nodiscard]] const TaskHandle *peekReady() const noexcept { return m_ready_queue.peek(); }

    /**
     * @brief peekTimer Head of the timer queue, live after pruneTimers() or advanceTimers()
     * @return nullptr when empty
     */
    [[nodiscard]] const TaskHandle *peekTimer() const noexcept { return m_timer_queue.peek(); }

    /**
     * @brief pruneTimers Discards cancelled tasks at the head of the timer queue
     * @return How many were discarded
     */
    std::size_t pruneTimers();

    TaskHandle popReady();

    [[nodiscard]] bool hasReadyTasks() const noexcept { return not m_ready_queue.empty(); }
    [[nodiscard]] bool hasTimers() const noexcept { return not m_timer_queue.empty(); }
    [[nodiscard]] std::size_t readySize() const noexcept { return m_ready_queue.size(); }
    [[nodiscard]] std::size_t timerSize() const noexcept { return m_timer_queue.size(); }

    [[nodiscard]] bool isValid() const { return m_ready_queue.isValid() && m_timer_queue.isValid(); }

    /**
     * @brief clear Drops every queued task, live ones are marked cancelled
     */
    void clear();

private:
    TaskHeap m_ready_queue;
    TaskHeap m_timer_queue;
};

} // namespace coop_scheduler
