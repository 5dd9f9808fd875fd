#include <Task.hpp>

#include <stdexcept>

namespace coop_scheduler {

WorkResult::WorkResult(Kind kind, Work continuation)
    : m_kind(kind)
    , m_continuation(std::move(continuation))
{}

WorkResult WorkResult::next(Work continuation)
{
    if (not continuation) {
        throw std::invalid_argument("A continuation must be callable, return WorkResult::done() instead");
    }
    return WorkResult(Kind::CONTINUE, std::move(continuation));
}

const char *toString(const Task::State state) noexcept
{
    switch (state) {
    case Task::State::PENDING:
        return "Pending";
    case Task::State::READY:
        return "Ready";
    case Task::State::RUNNING:
        return "Running";
    case Task::State::COMPLETED:
        return "Completed";
    case Task::State::CANCELLED:
        return "Cancelled";
    case Task::State::FAILED:
        return "Failed";
    }
    return "Unknown";
}

} // namespace coop_scheduler
