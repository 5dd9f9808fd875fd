#include <PriorityLevel.hpp>

namespace coop_scheduler {

const char *toString(const PriorityLevel level) noexcept
{
    switch (level) {
    case PriorityLevel::IMMEDIATE:
        return "Immediate";
    case PriorityLevel::USER_BLOCKING:
        return "UserBlocking";
    case PriorityLevel::NORMAL:
        return "Normal";
    case PriorityLevel::LOW:
        return "Low";
    case PriorityLevel::IDLE:
        return "Idle";
    }
    return "Invalid";
}

} // namespace coop_scheduler
