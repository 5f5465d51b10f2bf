#include "rtsim/workload.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace rtsim {

namespace {

Tick uniform_tick(std::mt19937& rng, Tick lo, Tick hi) {
    if (hi < lo) std::swap(lo, hi);
    std::uniform_int_distribution<Tick> dist(lo, hi);
    return dist(rng);
}

bool coin(std::mt19937& rng, double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    std::bernoulli_distribution dist(p);
    return dist(rng);
}

} // namespace

Workload generate_workload(const WorkloadOptions& opts) {
    Workload w;
    std::mt19937 rng(opts.seed);

    for (uint32_t r = 1; r <= opts.resources; ++r) w.resources.add_resource(r);

    const Tick min_burst = std::max<Tick>(1, opts.min_burst);
    const Tick max_burst = std::max(min_burst, opts.max_burst);
    const int levels = std::max(1, opts.priority_levels);

    w.tasks.reserve(opts.count);
    for (std::size_t i = 0; i < opts.count; ++i) {
        Task t;
        t.id = static_cast<TaskId>(i + 1);
        t.arrival = uniform_tick(rng, 0, std::max<Tick>(0, opts.max_arrival));
        t.burst = uniform_tick(rng, min_burst, max_burst);
        t.priority = static_cast<int>(uniform_tick(rng, 0, levels - 1));
        if (opts.deadline_slack > 0.0) {
            auto budget = static_cast<Tick>(std::ceil(static_cast<double>(t.burst) * opts.deadline_slack));
            t.deadline = t.arrival + std::max(budget, t.burst);
        }
        if (coin(rng, opts.periodic_fraction)) {
            Tick lo = std::max<Tick>(t.burst, opts.min_period);
            t.period = uniform_tick(rng, lo, std::max(lo, opts.max_period));
        }

        if (opts.resources > 0 && coin(rng, opts.resource_fraction)) {
            std::vector<ResourceId> ids;
            for (uint32_t r = 1; r <= opts.resources; ++r) ids.push_back(r);
            std::shuffle(ids.begin(), ids.end(), rng);
            std::size_t wanted = (opts.resources > 1 && t.burst > 1 && coin(rng, 0.5)) ? 2 : 1;
            for (std::size_t k = 0; k < wanted; ++k) {
                ResourceRequest req;
                req.resource = ids[k];
                req.acquire_at = k == 0 ? 0 : uniform_tick(rng, 1, t.burst - 1);
                t.resources.push_back(req);
            }
        }
        w.tasks.push_back(std::move(t));
    }
    return w;
}

} // namespace rtsim
