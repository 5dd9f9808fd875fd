#pragma once

#include <PriorityLevel.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace coop_scheduler {

class WorkResult;

/// A unit of work. The argument tells whether the task had already expired when it was invoked.
using Work = std::function<WorkResult(bool did_timeout)>;

/**
 * Outcome of one invocation of a Work callable: either the task is done, or it
 * hands back the continuation that resumes it on its next invocation.
 */
class WorkResult
{
public:
    enum class Kind { DONE = 0, CONTINUE = 1 };

    static WorkResult done() { return WorkResult(Kind::DONE, nullptr); }

    /**
     * @brief next Signals that the task is unfinished
     * @param continuation The callable that resumes the task, must not be empty
     * @return
     */
    static WorkResult next(Work continuation);

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool hasContinuation() const noexcept { return m_kind == Kind::CONTINUE; }

    /**
     * @brief takeContinuation Moves the continuation out of the result
     */
    Work takeContinuation() { return std::move(m_continuation); }

private:
    WorkResult(Kind kind, Work continuation);

    Kind m_kind = Kind::DONE;
    Work m_continuation;
};

struct Task
{
    enum class State { PENDING = 0, READY = 1, RUNNING = 2, COMPLETED = 3, CANCELLED = 4, FAILED = 5 };

    [[nodiscard]] bool isCancelled() const noexcept { return m_state == State::CANCELLED; }

    // Finished or cancelled tasks never run again
    [[nodiscard]] bool isRunnable() const noexcept { return static_cast<bool>(m_work); }

    uint64_t m_id = 0;
    Work m_work = nullptr;
    PriorityLevel m_priority_level = PriorityLevel::NORMAL;
    TimePoint m_start_time{0};
    TimePoint m_expiration_time{0};
    // startTime while in the timer queue, expirationTime while in the ready queue
    TimePoint m_sort_index{0};
    State m_state = State::PENDING;
    bool m_has_started = false;
};

using TaskHandle = std::shared_ptr<Task>;

/**
 * Heap ordering for tasks: sortIndex ascending, then insertion order.
 */
struct TaskCompare
{
    bool operator()(const TaskHandle &a, const TaskHandle &b) const noexcept
    {
        if (a->m_sort_index != b->m_sort_index) {
            return a->m_sort_index < b->m_sort_index;
        }
        return a->m_id < b->m_id;
    }
};

const char *toString(Task::State state) noexcept;

} // namespace coop_scheduler
