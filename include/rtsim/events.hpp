#pragma once
#include "policy.hpp"
#include "task.hpp"
#include <optional>
#include <vector>

namespace rtsim {

enum class EventKind {
    TaskArrived,
    TaskCompleted,
    DeadlineMissed,
    DeadlockResolved,
    PolicySwitched,
    TaskBlocked,
    TaskPreempted,
};

const char* event_name(EventKind kind);

struct Event {
    EventKind kind{EventKind::TaskArrived};
    Tick time{0};
    std::optional<TaskId> task{};          // subject; victim for DeadlockResolved
    uint32_t job{0};
    std::optional<CoreId> core{};
    std::optional<ResourceId> resource{};
    std::vector<TaskId> cycle{};           // DeadlockResolved only
    std::optional<PolicyKind> from_policy{};
    std::optional<PolicyKind> to_policy{};
};

} // namespace rtsim
