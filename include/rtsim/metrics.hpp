#pragma once
#include "core_model.hpp"
#include "events.hpp"
#include "task.hpp"
#include "task_registry.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rtsim {

struct TaskMetrics {
    TaskId task{};
    uint32_t job{0};
    std::string name;
    Tick arrival{0};
    Tick burst{0};
    Tick executed{0};
    std::optional<Tick> deadline{};
    std::optional<Tick> first_run{};
    std::optional<Tick> completion{};
    std::optional<Tick> waiting{};
    std::optional<Tick> turnaround{};
    std::optional<Tick> response{};
    bool completed{false};
    bool deadline_missed{false};
};

struct CoreMetrics {
    CoreId core{0};
    Tick busy{0};
    Tick idle{0};
    double utilization{0.0};
    double energy_j{0.0};
    double avg_temperature_c{0.0};
    double peak_temperature_c{0.0};
    double final_frequency_ghz{0.0};
};

struct MetricsSnapshot {
    std::vector<TaskMetrics> tasks;
    std::vector<CoreMetrics> cores;
    Tick total_time{0};
    std::size_t completed{0};
    double utilization{0.0};
    double throughput{0.0};
    double avg_waiting{0.0};
    double avg_turnaround{0.0};
    double avg_response{0.0};
    std::size_t missed_deadlines{0};
    double miss_ratio{0.0};
    double energy_j{0.0};
    double avg_temperature_c{0.0};
    uint64_t preemptions{0};
    uint64_t context_switches{0};
    uint64_t deadlock_resolutions{0};
    uint64_t policy_switches{0};
};

// Pure derivation from the interval log; the registry only supplies the
// descriptors (arrival, burst, deadline). Runtime counters kept by the
// engine are never read here.
MetricsSnapshot compute_metrics(const TaskRegistry& registry,
                                const std::vector<ExecutionInterval>& timeline,
                                const std::vector<Event>& events,
                                CoreId cores,
                                const CoreModelConfig& model = {});

std::string display_name(TaskId id, uint32_t job, const std::string& name = {});

} // namespace rtsim
