#include "rtsim/engine.hpp"
#include "rtsim/reporting.hpp"
#include "rtsim/workload.hpp"
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>

using namespace rtsim;

static unsigned parse_unsigned(const std::string& value, unsigned default_value) {
    if (value.empty()) return default_value;
    unsigned result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') return default_value;
        auto digit = static_cast<unsigned>(c - '0');
        if (result > (std::numeric_limits<unsigned>::max() - digit) / 10) return default_value;
        result = result * 10 + digit;
    }
    return result;
}

static uint32_t parse_seed(int argc, char** argv) {
    uint32_t seed = 7;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind("--seed=", 0) == 0) {
            seed = static_cast<uint32_t>(parse_unsigned(a.substr(sizeof("--seed=") - 1), seed));
        }
    }
    return seed;
}

int main(int argc, char** argv) {
    WorkloadOptions opts;
    opts.count = 12;
    opts.seed = parse_seed(argc, argv);
    opts.deadline_slack = 1.5;
    opts.resources = 2;
    opts.resource_fraction = 0.4;

    auto workload = generate_workload(opts);

    SimulationConfig cfg;
    cfg.policy = PolicyKind::Hybrid;
    cfg.cores = 2;
    cfg.adaptive.decision_window = 4;
    cfg.verbose = true;

    Engine engine(cfg);
    auto feed = std::make_shared<TickFeed>(64);
    engine.attach_feed(feed);

    // Live view: one line per tick with a policy change or a deadline event.
    std::thread viewer([feed] {
        while (auto rec = feed->pop_blocking()) {
            for (const auto& e : rec->events) {
                if (e.kind == EventKind::PolicySwitched || e.kind == EventKind::DeadlineMissed) {
                    std::cout << "[viewer] t=" << rec->time << " " << event_name(e.kind)
                              << " running " << policy_name(rec->policy) << "\n";
                }
            }
        }
    });

    auto result = engine.run(workload.tasks, workload.resources);
    feed->close();
    viewer.join();

    std::cout << reporting::format_timeline(result.timeline);
    std::cout << reporting::format_metrics(result.metrics);
    if (feed->dropped() > 0) std::cout << "viewer fell behind, dropped " << feed->dropped() << " records\n";
    return result.ok() ? 0 : 1;
}
