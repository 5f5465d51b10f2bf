#pragma once
#include "resource_graph.hpp"
#include "status.hpp"
#include "task.hpp"
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace rtsim {

enum class JobState { Pending, Ready, Running, Blocked, Completed };

// One release of a task. Periodic tasks expand into several jobs whose
// arrival and deadline are shifted by k * period.
struct Job {
    Task spec;
    uint32_t index{0};
    JobState state{JobState::Pending};
    CoreId core{0};
    Tick remaining{0};
    Tick waiting{0};
    std::optional<Tick> first_run{};
    std::optional<Tick> completion{};
    bool deadline_missed{false};
    uint32_t preemptions{0};
    std::vector<bool> held{};   // parallel to spec.resources

    Tick progress() const { return spec.burst - remaining; }
    Tick release_point(std::size_t request) const {
        const auto& r = spec.resources[request];
        return r.release_at ? *r.release_at : spec.burst;
    }
    std::optional<Tick> laxity(Tick now) const {
        if (!spec.deadline) return std::nullopt;
        return *spec.deadline - now - remaining;
    }
};

// Total order used for every tie: arrival, then task id, then job index.
bool precedes(const Job& a, const Job& b);

Status validate_task_set(const TaskSet& tasks, const ResourceGraph& resources, CoreId cores);

class TaskRegistry {
public:
    Status load(const TaskSet& tasks, const ResourceGraph& resources,
                CoreId cores = 1, Tick periodic_horizon = 0);

    std::size_t size() const { return jobs_.size(); }
    bool empty() const { return jobs_.empty(); }
    Job& job(JobIndex i) { return jobs_[i]; }
    const Job& job(JobIndex i) const { return jobs_[i]; }
    const std::vector<Job>& jobs() const { return jobs_; }

    std::optional<JobIndex> lookup(TaskId id, uint32_t job = 0) const {
        auto it = index_.find({id, job});
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t completed_count() const;
    bool all_completed() const { return completed_count() == jobs_.size(); }

private:
    std::vector<Job> jobs_;
    std::map<std::pair<TaskId, uint32_t>, JobIndex> index_;
};

} // namespace rtsim
