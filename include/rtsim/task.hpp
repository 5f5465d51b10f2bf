#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rtsim {

using Tick = int64_t;
using TaskId = uint64_t;
using ResourceId = uint32_t;
using CoreId = uint32_t;
using JobIndex = std::size_t;

struct ResourceRequest {
    ResourceId resource{};
    Tick acquire_at{0};              // must be held before executing this unit of progress
    std::optional<Tick> release_at{}; // released once this much progress is done; unset = on completion
};

struct Task {
    TaskId id{};
    std::string name;                 // display only
    Tick arrival{0};
    Tick burst{0};
    std::optional<Tick> deadline{};   // absolute
    int priority{0};                  // lower = more urgent
    std::optional<Tick> period{};
    std::vector<ResourceRequest> resources{};
    std::optional<CoreId> affinity{};
};

using TaskSet = std::vector<Task>;

struct ExecutionInterval {
    std::optional<TaskId> task{};     // none = idle
    uint32_t job{0};
    Tick start{0};
    Tick end{0};
    CoreId core{0};

    bool idle() const { return !task.has_value(); }
    Tick duration() const { return end - start; }
};

} // namespace rtsim
