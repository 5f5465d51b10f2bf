#include "rtsim/task_registry.hpp"
#include <algorithm>
#include <set>
#include <string>

namespace rtsim {

const char* error_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok: return "Ok";
    case ErrorCode::InvalidTaskSet: return "InvalidTaskSet";
    case ErrorCode::InvalidConfig: return "InvalidConfig";
    case ErrorCode::SimulationDivergence: return "SimulationDivergence";
    case ErrorCode::DeadlockUnresolved: return "DeadlockUnresolved";
    }
    return "Unknown";
}

bool precedes(const Job& a, const Job& b) {
    if (a.spec.arrival != b.spec.arrival) return a.spec.arrival < b.spec.arrival;
    if (a.spec.id != b.spec.id) return a.spec.id < b.spec.id;
    return a.index < b.index;
}

namespace {

Status invalid(const Task& t, const std::string& why) {
    return Status::failure(ErrorCode::InvalidTaskSet,
                           "task " + std::to_string(t.id) + ": " + why);
}

} // namespace

Status validate_task_set(const TaskSet& tasks, const ResourceGraph& resources, CoreId cores) {
    std::set<TaskId> seen;
    for (const auto& t : tasks) {
        if (!seen.insert(t.id).second) return invalid(t, "duplicate id");
        if (t.burst <= 0) return invalid(t, "burst must be > 0");
        if (t.arrival < 0) return invalid(t, "arrival must be >= 0");
        if (t.period && *t.period <= 0) return invalid(t, "period must be > 0");
        if (t.affinity && *t.affinity >= cores) {
            return invalid(t, "affinity core " + std::to_string(*t.affinity) + " out of range");
        }
        std::set<ResourceId> requested;
        for (const auto& req : t.resources) {
            if (!resources.contains(req.resource)) {
                return invalid(t, "unknown resource " + std::to_string(req.resource));
            }
            if (!requested.insert(req.resource).second) {
                return invalid(t, "resource " + std::to_string(req.resource) + " requested twice");
            }
            if (req.acquire_at < 0 || req.acquire_at >= t.burst) {
                return invalid(t, "acquire point outside [0, burst)");
            }
            if (req.release_at && (*req.release_at <= req.acquire_at || *req.release_at > t.burst)) {
                return invalid(t, "release point outside (acquire, burst]");
            }
        }
    }
    return Status::success();
}

Status TaskRegistry::load(const TaskSet& tasks, const ResourceGraph& resources,
                          CoreId cores, Tick periodic_horizon) {
    jobs_.clear();
    index_.clear();
    auto st = validate_task_set(tasks, resources, cores);
    if (!st.ok()) return st;

    for (const auto& t : tasks) {
        uint32_t k = 0;
        while (true) {
            Job j;
            j.spec = t;
            j.index = k;
            if (t.period) {
                j.spec.arrival = t.arrival + static_cast<Tick>(k) * *t.period;
                if (t.deadline) j.spec.deadline = *t.deadline + static_cast<Tick>(k) * *t.period;
            }
            if (k > 0 && j.spec.arrival >= periodic_horizon) break;
            j.remaining = t.burst;
            j.held.assign(t.resources.size(), false);
            jobs_.push_back(std::move(j));
            if (!t.period || periodic_horizon <= 0) break;
            ++k;
        }
    }
    std::stable_sort(jobs_.begin(), jobs_.end(), precedes);
    for (JobIndex i = 0; i < jobs_.size(); ++i) {
        index_[{jobs_[i].spec.id, jobs_[i].index}] = i;
    }
    return Status::success();
}

std::size_t TaskRegistry::completed_count() const {
    return static_cast<std::size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const Job& j) {
        return j.state == JobState::Completed;
    }));
}

} // namespace rtsim
