/**
 * @file workload_test.cpp
 * @brief Seeded synthetic workloads are valid, reproducible and schedulable.
 */

#include "rtsim/engine.hpp"
#include "rtsim/workload.hpp"

#include <cstdio>
#include <cstdlib>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

using namespace rtsim;

static void test_reproducible() {
    std::printf("  test_reproducible...\n");
    WorkloadOptions opts;
    opts.count = 20;
    opts.seed = 1234;
    auto a = generate_workload(opts);
    auto b = generate_workload(opts);
    CHECK(a.tasks.size() == 20);
    for (std::size_t i = 0; i < a.tasks.size(); ++i) {
        CHECK(a.tasks[i].id == b.tasks[i].id);
        CHECK(a.tasks[i].arrival == b.tasks[i].arrival);
        CHECK(a.tasks[i].burst == b.tasks[i].burst);
        CHECK(a.tasks[i].deadline == b.tasks[i].deadline);
    }
    std::printf("    reproducible verified ✓\n");
}

static void test_ranges_and_validity() {
    std::printf("  test_ranges_and_validity...\n");
    WorkloadOptions opts;
    opts.count = 40;
    opts.seed = 99;
    opts.min_burst = 2;
    opts.max_burst = 5;
    opts.max_arrival = 10;
    opts.resources = 3;
    opts.resource_fraction = 0.6;
    opts.periodic_fraction = 0.3;
    auto w = generate_workload(opts);
    CHECK(w.resources.size() == 3);
    for (const auto& t : w.tasks) {
        CHECK(t.burst >= 2 && t.burst <= 5);
        CHECK(t.arrival >= 0 && t.arrival <= 10);
        CHECK(t.priority >= 0 && t.priority < opts.priority_levels);
        CHECK(t.deadline && *t.deadline >= t.arrival + t.burst);
        if (t.period) CHECK(*t.period >= t.burst);
        CHECK(t.resources.size() <= 2);
    }
    CHECK(validate_task_set(w.tasks, w.resources, 1).ok());

    opts.deadline_slack = 0.0;
    for (const auto& t : generate_workload(opts).tasks) CHECK(!t.deadline);
    std::printf("    ranges verified ✓\n");
}

static void test_contended_run_completes() {
    std::printf("  test_contended_run_completes...\n");
    WorkloadOptions opts;
    opts.count = 16;
    opts.seed = 7;
    opts.resources = 2;
    opts.resource_fraction = 1.0;
    auto w = generate_workload(opts);

    const PolicyKind kinds[] = {PolicyKind::FCFS, PolicyKind::SRTF, PolicyKind::EDF,
                                PolicyKind::RR, PolicyKind::LLF, PolicyKind::Hybrid};
    for (auto kind : kinds) {
        SimulationConfig cfg;
        cfg.policy = kind;
        cfg.cores = 2;
        auto r = simulate(w.tasks, w.resources, cfg);
        CHECK(r.ok());
        CHECK(r.finished);
        Tick executed = 0;
        for (const auto& iv : r.timeline) {
            if (!iv.idle()) executed += iv.duration();
        }
        Tick expected = 0;
        for (const auto& t : w.tasks) expected += t.burst;
        CHECK(executed == expected);
    }
    std::printf("    contended runs verified ✓\n");
}

static void test_run_properties_and_determinism() {
    std::printf("  test_run_properties_and_determinism...\n");
    WorkloadOptions opts;
    opts.count = 24;
    opts.seed = 2024;
    opts.resources = 2;
    opts.periodic_fraction = 0.25;

    SimulationConfig cfg;
    cfg.policy = PolicyKind::Hybrid;
    cfg.cores = 3;
    cfg.periodic_horizon = 60;
    cfg.adaptive.decision_window = 6;

    auto w = generate_workload(opts);
    auto first = simulate(w.tasks, w.resources, cfg);
    auto second = simulate(w.tasks, w.resources, cfg);
    CHECK(first.ok() && first.finished);

    for (const auto& j : first.jobs) {
        Tick executed = 0;
        for (const auto& iv : first.timeline) {
            if (!iv.idle() && *iv.task == j.spec.id && iv.job == j.index) executed += iv.duration();
        }
        CHECK(executed == j.spec.burst);
        Tick turnaround = *j.completion - j.spec.arrival;
        CHECK(turnaround >= j.spec.burst);
        CHECK(j.waiting == turnaround - j.spec.burst);
    }
    for (CoreId c = 0; c < cfg.cores; ++c) {
        Tick cursor = 0;
        for (const auto& iv : first.timeline) {
            if (iv.core != c) continue;
            CHECK(iv.start >= cursor);
            CHECK(iv.end > iv.start);
            cursor = iv.end;
        }
    }
    CHECK(first.metrics.utilization >= 0.0 && first.metrics.utilization <= 1.0);

    CHECK(first.timeline.size() == second.timeline.size());
    for (std::size_t i = 0; i < first.timeline.size(); ++i) {
        CHECK(first.timeline[i].task == second.timeline[i].task);
        CHECK(first.timeline[i].start == second.timeline[i].start);
        CHECK(first.timeline[i].core == second.timeline[i].core);
    }
    CHECK(first.events.size() == second.events.size());
    std::printf("    run properties and determinism verified ✓\n");
}

int main() {
    std::printf("workload_test\n");
    test_reproducible();
    test_ranges_and_validity();
    test_contended_run_completes();
    test_run_properties_and_determinism();
    std::printf("all passed\n");
    return 0;
}
