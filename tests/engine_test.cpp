/**
 * @file engine_test.cpp
 * @brief End-to-end schedules for every policy, plus the run-control surface.
 */

#include "rtsim/engine.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <memory>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

using namespace rtsim;

namespace {

struct Slice {
    TaskId task;
    Tick start;
    Tick end;
};

Task make_task(TaskId id, Tick arrival, Tick burst) {
    Task t;
    t.id = id;
    t.arrival = arrival;
    t.burst = burst;
    return t;
}

std::vector<Slice> busy_on(const RunResult& r, CoreId core = 0) {
    std::vector<Slice> out;
    for (const auto& iv : r.timeline) {
        if (iv.core == core && !iv.idle()) out.push_back({*iv.task, iv.start, iv.end});
    }
    return out;
}

bool same(const std::vector<Slice>& got, std::initializer_list<Slice> want) {
    if (got.size() != want.size()) {
        std::fprintf(stderr, "    got %zu slices, want %zu\n", got.size(), want.size());
        return false;
    }
    std::size_t i = 0;
    for (const auto& w : want) {
        const auto& g = got[i++];
        if (g.task != w.task || g.start != w.start || g.end != w.end) {
            std::fprintf(stderr, "    slice %zu: got T%llu [%lld-%lld)\n", i - 1,
                         static_cast<unsigned long long>(g.task), static_cast<long long>(g.start),
                         static_cast<long long>(g.end));
            return false;
        }
    }
    return true;
}

const Job& job_of(const RunResult& r, TaskId id, uint32_t index = 0) {
    for (const auto& j : r.jobs) {
        if (j.spec.id == id && j.index == index) return j;
    }
    std::fprintf(stderr, "no job T%llu#%u\n", static_cast<unsigned long long>(id), index);
    std::abort();
}

std::size_t count_events(const RunResult& r, EventKind kind) {
    return static_cast<std::size_t>(std::count_if(r.events.begin(), r.events.end(),
                                                  [kind](const Event& e) { return e.kind == kind; }));
}

} // namespace

static void test_fcfs() {
    std::printf("  test_fcfs...\n");
    auto r = simulate({make_task(1, 0, 4), make_task(2, 1, 2)}, ResourceGraph{}, PolicyKind::FCFS);
    CHECK(r.ok());
    CHECK(r.finished);
    CHECK(same(busy_on(r), {{1, 0, 4}, {2, 4, 6}}));
    CHECK(job_of(r, 1).waiting == 0);
    CHECK(job_of(r, 2).waiting == 3);
    CHECK(job_of(r, 2).completion.value() == 6);
    CHECK(r.metrics.tasks[1].waiting.value() == 3);
    CHECK(count_events(r, EventKind::TaskArrived) == 2);
    CHECK(count_events(r, EventKind::TaskCompleted) == 2);
    CHECK(r.state.completed.size() == 2);
    std::printf("    fcfs verified ✓\n");
}

static void test_sjf_and_srtf() {
    std::printf("  test_sjf_and_srtf...\n");
    auto sjf = simulate({make_task(1, 0, 5), make_task(2, 1, 3), make_task(3, 1, 1)},
                        ResourceGraph{}, PolicyKind::SJF);
    CHECK(sjf.ok());
    CHECK(same(busy_on(sjf), {{1, 0, 5}, {3, 5, 6}, {2, 6, 9}}));

    auto srtf = simulate({make_task(1, 0, 5), make_task(2, 1, 2)}, ResourceGraph{}, PolicyKind::SRTF);
    CHECK(srtf.ok());
    CHECK(same(busy_on(srtf), {{1, 0, 1}, {2, 1, 3}, {1, 3, 7}}));
    CHECK(job_of(srtf, 1).preemptions == 1);
    CHECK(count_events(srtf, EventKind::TaskPreempted) == 1);
    std::printf("    sjf and srtf verified ✓\n");
}

static void test_edf() {
    std::printf("  test_edf...\n");
    auto a = make_task(1, 0, 3);
    a.deadline = 5;
    auto b = make_task(2, 1, 2);
    b.deadline = 3;
    auto r = simulate({a, b}, ResourceGraph{}, PolicyKind::EDF);
    CHECK(r.ok());
    CHECK(same(busy_on(r), {{1, 0, 1}, {2, 1, 3}, {1, 3, 5}}));
    CHECK(count_events(r, EventKind::DeadlineMissed) == 0);
    CHECK(r.metrics.missed_deadlines == 0);
    std::printf("    edf verified ✓\n");
}

static void test_round_robin() {
    std::printf("  test_round_robin...\n");
    auto r = simulate({make_task(1, 0, 3), make_task(2, 0, 3)}, ResourceGraph{}, PolicyKind::RR, Tick{2});
    CHECK(r.ok());
    CHECK(same(busy_on(r), {{1, 0, 2}, {2, 2, 4}, {1, 4, 5}, {2, 5, 6}}));
    for (const auto& iv : r.timeline) CHECK(iv.duration() <= 2);

    auto bad = simulate({make_task(1, 0, 3)}, ResourceGraph{}, PolicyKind::RR, Tick{0});
    CHECK(bad.status.code == ErrorCode::InvalidConfig);
    CHECK(bad.timeline.empty());
    CHECK(!bad.finished);
    std::printf("    round robin verified ✓\n");
}

static void test_priority() {
    std::printf("  test_priority...\n");
    auto a = make_task(1, 0, 3);
    a.priority = 5;
    auto b = make_task(2, 1, 1);
    b.priority = 1;

    auto np = simulate({a, b}, ResourceGraph{}, PolicyKind::Priority);
    CHECK(same(busy_on(np), {{1, 0, 3}, {2, 3, 4}}));

    SimulationConfig cfg;
    cfg.policy = PolicyKind::Priority;
    cfg.priority_preemptive = true;
    auto p = simulate({a, b}, ResourceGraph{}, cfg);
    CHECK(same(busy_on(p), {{1, 0, 1}, {2, 1, 2}, {1, 2, 4}}));
    std::printf("    priority verified ✓\n");
}

static void test_rms_and_llf() {
    std::printf("  test_rms_and_llf...\n");
    auto slow = make_task(1, 0, 2);
    slow.period = 10;
    auto fast = make_task(2, 0, 2);
    fast.period = 5;
    auto rms = simulate({slow, fast}, ResourceGraph{}, PolicyKind::RMS);
    CHECK(same(busy_on(rms), {{2, 0, 2}, {1, 2, 4}}));

    auto a = make_task(1, 0, 3);
    a.deadline = 10;
    auto b = make_task(2, 0, 2);
    b.deadline = 4;
    auto llf = simulate({a, b}, ResourceGraph{}, PolicyKind::LLF);
    CHECK(same(busy_on(llf), {{2, 0, 2}, {1, 2, 5}}));

    auto hopeless = make_task(1, 0, 5);
    hopeless.deadline = 3;
    auto late = simulate({hopeless}, ResourceGraph{}, PolicyKind::LLF);
    CHECK(late.ok());
    CHECK(count_events(late, EventKind::DeadlineMissed) == 1);
    CHECK(late.events.size() >= 2);
    bool seen = false;
    for (const auto& e : late.events) {
        if (e.kind == EventKind::DeadlineMissed) {
            CHECK(e.time == 0);
            seen = true;
        }
    }
    CHECK(seen);
    CHECK(job_of(late, 1).completion.value() == 5);
    CHECK(late.metrics.missed_deadlines == 1);
    std::printf("    rms and llf verified ✓\n");
}

static void test_idle_gap_and_periodic() {
    std::printf("  test_idle_gap_and_periodic...\n");
    auto gap = simulate({make_task(1, 0, 1), make_task(2, 3, 1)}, ResourceGraph{}, PolicyKind::FCFS);
    CHECK(gap.timeline.size() == 3);
    CHECK(gap.timeline[1].idle());
    CHECK(gap.timeline[1].start == 1 && gap.timeline[1].end == 3);

    auto t = make_task(1, 0, 1);
    t.period = 4;
    SimulationConfig cfg;
    cfg.periodic_horizon = 12;
    auto r = simulate({t}, ResourceGraph{}, cfg);
    CHECK(r.ok());
    CHECK(r.jobs.size() == 3);
    CHECK(same(busy_on(r), {{1, 0, 1}, {1, 4, 5}, {1, 8, 9}}));
    CHECK(r.metrics.total_time == 9);
    CHECK(r.metrics.utilization > 0.333 && r.metrics.utilization < 0.334);
    CHECK(job_of(r, 1, 2).completion.value() == 9);
    std::printf("    idle gap and periodic verified ✓\n");
}

static void test_two_cores() {
    std::printf("  test_two_cores...\n");
    SimulationConfig cfg;
    cfg.cores = 2;
    auto r = simulate({make_task(1, 0, 2), make_task(2, 0, 2), make_task(3, 0, 2), make_task(4, 0, 2)},
                      ResourceGraph{}, cfg);
    CHECK(r.ok());
    CHECK(same(busy_on(r, 0), {{1, 0, 2}, {3, 2, 4}}));
    CHECK(same(busy_on(r, 1), {{2, 0, 2}, {4, 2, 4}}));
    CHECK(r.metrics.total_time == 4);
    CHECK(r.metrics.utilization == 1.0);
    CHECK(r.metrics.cores.size() == 2);

    auto pinned = make_task(5, 0, 1);
    pinned.affinity = 1;
    auto p = simulate({make_task(1, 0, 1), pinned}, ResourceGraph{}, cfg);
    CHECK(same(busy_on(p, 1), {{5, 0, 1}}));
    std::printf("    two cores verified ✓\n");
}

static void test_deadlock_resolution() {
    std::printf("  test_deadlock_resolution...\n");
    ResourceGraph res;
    res.add_resource(1);
    res.add_resource(2);

    auto a = make_task(1, 0, 3);
    a.priority = 1;
    a.resources = {{1, 0, std::nullopt}, {2, 1, std::nullopt}};
    auto b = make_task(2, 0, 3);
    b.priority = 2;
    b.resources = {{2, 0, std::nullopt}, {1, 1, std::nullopt}};

    auto r = simulate({a, b}, res, PolicyKind::RR, Tick{1});
    CHECK(r.ok());
    CHECK(r.finished);
    CHECK(count_events(r, EventKind::DeadlockResolved) == 1);
    for (const auto& e : r.events) {
        if (e.kind != EventKind::DeadlockResolved) continue;
        CHECK(e.time == 2);
        CHECK(e.task.value() == 2);
        CHECK(e.cycle.size() == 2);
        CHECK(std::find(e.cycle.begin(), e.cycle.end(), TaskId{1}) != e.cycle.end());
    }
    CHECK(job_of(r, 1).completion.value() == 4);
    CHECK(job_of(r, 2).completion.value() == 6);
    CHECK(same(busy_on(r), {{1, 0, 1}, {2, 1, 2}, {1, 2, 3}, {1, 3, 4}, {2, 4, 5}, {2, 5, 6}}));
    CHECK(r.metrics.deadlock_resolutions == 1);
    CHECK(count_events(r, EventKind::TaskBlocked) >= 2);

    // The victim's forced preemption is reported like any other.
    CHECK(job_of(r, 1).preemptions == 1);
    CHECK(job_of(r, 2).preemptions == 1);
    CHECK(count_events(r, EventKind::TaskPreempted) == 2);
    CHECK(r.metrics.preemptions == 2);
    std::printf("    deadlock resolution verified ✓\n");
}

static void test_hybrid_switches_at_boundary() {
    std::printf("  test_hybrid_switches_at_boundary...\n");
    auto a = make_task(1, 0, 4);
    a.priority = 0;
    auto b = make_task(2, 0, 2);
    b.deadline = 3;
    b.priority = 5;
    auto c = make_task(3, 0, 2);
    c.deadline = 4;
    c.priority = 5;

    SimulationConfig cfg;
    cfg.policy = PolicyKind::Hybrid;
    cfg.adaptive.decision_window = 5;
    auto r = simulate({a, b, c}, ResourceGraph{}, cfg);
    CHECK(r.ok());
    CHECK(count_events(r, EventKind::DeadlineMissed) == 2);
    CHECK(count_events(r, EventKind::PolicySwitched) == 1);
    for (const auto& e : r.events) {
        if (e.kind == EventKind::DeadlineMissed) CHECK(e.time == 2 || e.time == 3);
        if (e.kind != EventKind::PolicySwitched) continue;
        CHECK(e.time == 5);
        CHECK(e.from_policy.value() == PolicyKind::Priority);
        CHECK(e.to_policy.value() == PolicyKind::EDF);
    }
    CHECK(r.state.active_policy == PolicyKind::EDF);
    CHECK(r.metrics.policy_switches == 1);

    cfg.adaptive.rules.clear();
    auto bad = simulate({a}, ResourceGraph{}, cfg);
    CHECK(bad.status.code == ErrorCode::InvalidConfig);
    std::printf("    hybrid verified ✓\n");
}

static void test_errors() {
    std::printf("  test_errors...\n");
    auto dup = simulate({make_task(1, 0, 1), make_task(1, 1, 1)}, ResourceGraph{}, PolicyKind::FCFS);
    CHECK(dup.status.code == ErrorCode::InvalidTaskSet);
    CHECK(dup.timeline.empty());

    SimulationConfig cfg;
    cfg.max_ticks = 3;
    auto div = simulate({make_task(1, 0, 10)}, ResourceGraph{}, cfg);
    CHECK(div.status.code == ErrorCode::SimulationDivergence);
    CHECK(!div.finished);
    CHECK(div.timeline.size() == 1);
    CHECK(div.timeline[0].end == 3);
    CHECK(div.metrics.tasks.size() == 1);
    CHECK(!div.metrics.tasks[0].completed);

    auto empty = simulate({}, ResourceGraph{}, PolicyKind::EDF);
    CHECK(empty.ok());
    CHECK(empty.finished);
    CHECK(empty.timeline.empty());
    CHECK(empty.metrics.total_time == 0);
    std::printf("    errors verified ✓\n");
}

static void test_stepping_and_stop() {
    std::printf("  test_stepping_and_stop...\n");
    Engine engine;
    CHECK(engine.start({make_task(1, 0, 3), make_task(2, 0, 2)}, ResourceGraph{}).ok());
    CHECK(engine.step());
    CHECK(engine.step());
    CHECK(engine.now() == 2);
    auto mid = engine.snapshot();
    CHECK(!mid.finished);
    CHECK(mid.state.running[0].has_value());
    CHECK(mid.state.ready[0].size() == 2);

    engine.request_stop();
    auto stopped = engine.resume();
    CHECK(stopped.stopped);
    CHECK(!stopped.finished);
    CHECK(engine.now() == 2);

    auto done = engine.resume();
    CHECK(done.ok());
    CHECK(done.finished);
    CHECK(!done.stopped);
    CHECK(engine.now() == 5);
    CHECK(!engine.step());
    std::printf("    stepping and stop verified ✓\n");
}

static void test_late_stop_does_not_carry_over() {
    std::printf("  test_late_stop_does_not_carry_over...\n");
    Engine engine;
    auto first = engine.run({make_task(1, 0, 3)}, ResourceGraph{});
    CHECK(first.finished);

    // A stop that arrives after the run ended applies to nothing.
    engine.request_stop();
    auto second = engine.run({make_task(1, 0, 3)}, ResourceGraph{});
    CHECK(second.ok());
    CHECK(second.finished);
    CHECK(!second.stopped);
    CHECK(same(busy_on(second), {{1, 0, 3}}));

    // Same for start() followed by resume().
    engine.request_stop();
    CHECK(engine.start({make_task(2, 0, 2)}, ResourceGraph{}).ok());
    auto third = engine.resume();
    CHECK(third.finished);
    CHECK(!third.stopped);
    CHECK(engine.now() == 2);
    std::printf("    late stop verified ✓\n");
}

static void test_feed_drops_oldest() {
    std::printf("  test_feed_drops_oldest...\n");
    Engine engine;
    auto feed = std::make_shared<TickFeed>(4);
    engine.attach_feed(feed);
    auto r = engine.run({make_task(1, 0, 10)}, ResourceGraph{});
    CHECK(r.finished);
    CHECK(feed->closed());
    CHECK(feed->size() == 4);
    CHECK(feed->dropped() == 6);
    auto first = feed->try_pop();
    CHECK(first && first->time == 6);
    CHECK(first->slices.size() == 1);
    CHECK(first->cores.size() == 1);
    std::printf("    feed verified ✓\n");
}

int main() {
    std::printf("engine_test\n");
    test_fcfs();
    test_sjf_and_srtf();
    test_edf();
    test_round_robin();
    test_priority();
    test_rms_and_llf();
    test_idle_gap_and_periodic();
    test_two_cores();
    test_deadlock_resolution();
    test_hybrid_switches_at_boundary();
    test_errors();
    test_stepping_and_stop();
    test_late_stop_does_not_carry_over();
    test_feed_drops_oldest();
    std::printf("all passed\n");
    return 0;
}
