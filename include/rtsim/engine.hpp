#pragma once
#include "adaptive.hpp"
#include "core_model.hpp"
#include "events.hpp"
#include "feed.hpp"
#include "metrics.hpp"
#include "policy.hpp"
#include "resource_graph.hpp"
#include "status.hpp"
#include "task.hpp"
#include "task_registry.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace rtsim {

struct SimulationConfig {
    PolicyKind policy = PolicyKind::FCFS;
    Tick quantum = 2;                  // RR time slice
    bool priority_preemptive = false;
    CoreId cores = 1;
    Tick max_ticks = 1000000;          // divergence guard
    Tick periodic_horizon = 0;         // 0 = only the first release of periodic tasks
    AdaptiveConfig adaptive{};
    CoreModelConfig core_model{};
    bool verbose = false;
    bool debug_logging = false;
};

Status validate_config(const SimulationConfig& cfg);

struct SchedulerState {
    Tick now{0};
    PolicyKind active_policy{PolicyKind::FCFS};
    std::vector<std::vector<JobIndex>> ready;       // per core, queue order
    std::vector<std::optional<JobIndex>> running;   // per core
    std::vector<JobIndex> blocked;
    std::vector<JobIndex> completed;                // completion order
    std::vector<JobIndex> pending;
};

struct RunResult {
    Status status;
    bool finished{false};   // every job completed
    bool stopped{false};    // request_stop() honoured
    std::vector<ExecutionInterval> timeline;
    std::vector<Event> events;
    MetricsSnapshot metrics;
    SchedulerState state;
    std::vector<Job> jobs;

    bool ok() const { return status.ok(); }
};

class Engine {
public:
    explicit Engine(SimulationConfig cfg = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Optional live consumer; records are pushed after every tick.
    void attach_feed(std::shared_ptr<TickFeed> feed);

    // Validates config and task set and builds the initial state. Nothing
    // is simulated if this fails.
    Status start(const TaskSet& tasks, const ResourceGraph& resources);
    // Runs one tick. Returns false when nothing ran (finished, failed, not started).
    bool step();
    // Ticks until finished, failed, or stopped.
    RunResult resume();
    RunResult run(const TaskSet& tasks, const ResourceGraph& resources);

    // Safe from another thread; honoured between ticks.
    void request_stop();

    bool finished() const;
    Tick now() const;
    PolicyKind active_policy() const;
    RunResult snapshot() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

RunResult simulate(const TaskSet& tasks, const ResourceGraph& resources, const SimulationConfig& cfg);
RunResult simulate(const TaskSet& tasks, const ResourceGraph& resources, PolicyKind policy,
                   std::optional<Tick> quantum = std::nullopt);

} // namespace rtsim
