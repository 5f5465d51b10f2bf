#include "rtsim/metrics.hpp"
#include <algorithm>

namespace rtsim {

std::string display_name(TaskId id, uint32_t job, const std::string& name) {
    std::string base = name.empty() ? "T" + std::to_string(id) : name;
    if (job > 0) base += "#" + std::to_string(job);
    return base;
}

namespace {

void replay_core(CoreMetrics& cm, const std::vector<bool>& busy, const CoreModelConfig& model) {
    CoreStatusModel core(model);
    double temp_sum = 0.0;
    for (bool b : busy) {
        auto s = core.observe(b);
        cm.energy_j += s.power_w;   // one tick = one second
        temp_sum += s.temperature_c;
        cm.peak_temperature_c = std::max(cm.peak_temperature_c, s.temperature_c);
    }
    cm.avg_temperature_c = busy.empty() ? model.ambient_c : temp_sum / static_cast<double>(busy.size());
    if (busy.empty()) cm.peak_temperature_c = model.ambient_c;
    cm.final_frequency_ghz = core.frequency_ghz();
}

} // namespace

MetricsSnapshot compute_metrics(const TaskRegistry& registry,
                                const std::vector<ExecutionInterval>& timeline,
                                const std::vector<Event>& events,
                                CoreId cores,
                                const CoreModelConfig& model) {
    MetricsSnapshot snap;
    if (cores == 0) cores = 1;

    for (const auto& iv : timeline) snap.total_time = std::max(snap.total_time, iv.end);

    snap.tasks.reserve(registry.size());
    for (const auto& j : registry.jobs()) {
        TaskMetrics tm;
        tm.task = j.spec.id;
        tm.job = j.index;
        tm.name = display_name(j.spec.id, j.index, j.spec.name);
        tm.arrival = j.spec.arrival;
        tm.burst = j.spec.burst;
        tm.deadline = j.spec.deadline;
        snap.tasks.push_back(std::move(tm));
    }

    snap.cores.resize(cores);
    std::vector<std::vector<bool>> busy(cores, std::vector<bool>(static_cast<std::size_t>(snap.total_time), false));
    std::vector<std::optional<std::pair<TaskId, uint32_t>>> last_job(cores);

    for (const auto& iv : timeline) {
        if (iv.core >= cores || iv.idle()) continue;
        for (Tick t = iv.start; t < iv.end; ++t) busy[iv.core][static_cast<std::size_t>(t)] = true;
        snap.cores[iv.core].busy += iv.duration();

        std::pair<TaskId, uint32_t> key{*iv.task, iv.job};
        if (last_job[iv.core] && *last_job[iv.core] != key) ++snap.context_switches;
        last_job[iv.core] = key;

        auto idx = registry.lookup(*iv.task, iv.job);
        if (!idx) continue;
        auto& tm = snap.tasks[*idx];
        tm.executed += iv.duration();
        tm.first_run = tm.first_run ? std::min(*tm.first_run, iv.start) : iv.start;
        tm.completion = tm.completion ? std::max(*tm.completion, iv.end) : iv.end;
    }

    Tick sum_wait = 0, sum_turn = 0, sum_resp = 0;
    for (auto& tm : snap.tasks) {
        tm.completed = tm.executed >= tm.burst;
        if (tm.first_run) tm.response = *tm.first_run - tm.arrival;
        if (tm.completed) {
            tm.turnaround = *tm.completion - tm.arrival;
            tm.waiting = *tm.turnaround - tm.burst;
            ++snap.completed;
            sum_wait += *tm.waiting;
            sum_turn += *tm.turnaround;
            sum_resp += tm.response.value_or(0);
            if (tm.deadline) tm.deadline_missed = *tm.completion > *tm.deadline;
        } else {
            tm.completion.reset();
            // Unfinished: missed once the remaining work no longer fits.
            if (tm.deadline) {
                tm.deadline_missed = *tm.deadline - snap.total_time - (tm.burst - tm.executed) < 0;
            }
        }
        if (tm.deadline_missed) ++snap.missed_deadlines;
    }

    if (snap.completed > 0) {
        auto n = static_cast<double>(snap.completed);
        snap.avg_waiting = static_cast<double>(sum_wait) / n;
        snap.avg_turnaround = static_cast<double>(sum_turn) / n;
        snap.avg_response = static_cast<double>(sum_resp) / n;
    }
    if (!snap.tasks.empty()) {
        snap.miss_ratio = static_cast<double>(snap.missed_deadlines) / static_cast<double>(snap.tasks.size());
    }

    Tick busy_total = 0;
    double temp_total = 0.0;
    for (CoreId c = 0; c < cores; ++c) {
        auto& cm = snap.cores[c];
        cm.core = c;
        cm.idle = snap.total_time - cm.busy;
        cm.utilization = snap.total_time > 0
            ? static_cast<double>(cm.busy) / static_cast<double>(snap.total_time) : 0.0;
        replay_core(cm, busy[c], model);
        busy_total += cm.busy;
        snap.energy_j += cm.energy_j;
        temp_total += cm.avg_temperature_c;
    }
    if (snap.total_time > 0) {
        snap.utilization = static_cast<double>(busy_total) /
                           (static_cast<double>(snap.total_time) * static_cast<double>(cores));
        snap.throughput = static_cast<double>(snap.completed) / static_cast<double>(snap.total_time);
    }
    snap.avg_temperature_c = temp_total / static_cast<double>(cores);

    for (const auto& e : events) {
        switch (e.kind) {
        case EventKind::TaskPreempted: ++snap.preemptions; break;
        case EventKind::DeadlockResolved: ++snap.deadlock_resolutions; break;
        case EventKind::PolicySwitched: ++snap.policy_switches; break;
        default: break;
        }
    }
    return snap;
}

} // namespace rtsim
