#include <QueueManager.hpp>

namespace coop_scheduler {

static void cancelAll(TaskHeap &heap)
{
    while (auto task = heap.pop()) {
        if ((*task)->isRunnable()) {
            (*task)->m_work = nullptr;
            (*task)->m_state = Task::State::CANCELLED;
        }
    }
}

void QueueManager::pushReady(TaskHandle task)
{
    task->m_sort_index = task->m_expiration_time;
    task->m_state = Task::State::READY;
    m_ready_queue.push(std::move(task));
}

void QueueManager::pushTimer(TaskHandle task)
{
    task->m_sort_index = task->m_start_time;
    task->m_state = Task::State::PENDING;
    m_timer_queue.push(std::move(task));
}

QueueManager::AdvanceResult QueueManager::advanceTimers(const TimePoint now)
{
    AdvanceResult result;

    while (const TaskHandle *timer = m_timer_queue.peek()) {
        const TaskHandle &head = *timer;

        if (not head->isRunnable()) {
            // Cancelled while waiting, lazily removed here
            m_timer_queue.pop();
            result.m_dropped++;
        } else if (head->m_start_time <= now) {
            auto matured = m_timer_queue.pop();
            pushReady(std::move(*matured));
            result.m_matured++;
        } else {
            // Remaining timers are still in the future
            break;
        }
    }
    return result;
}

std::size_t QueueManager::pruneTimers()
{
    std::size_t dropped = 0;
    while (const TaskHandle *timer = m_timer_queue.peek()) {
        if ((*timer)->isRunnable()) {
            break;
        }
        m_timer_queue.pop();
        dropped++;
    }
    return dropped;
}

TaskHandle QueueManager::popReady()
{
    auto task = m_ready_queue.pop();
    return task ? std::move(*task) : nullptr;
}

void QueueManager::clear()
{
    cancelAll(m_ready_queue);
    cancelAll(m_timer_queue);
}

} // namespace coop_scheduler
