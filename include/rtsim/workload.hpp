#pragma once
#include "resource_graph.hpp"
#include "task.hpp"
#include <cstdint>

namespace rtsim {

struct WorkloadOptions {
    std::size_t count = 8;
    uint32_t seed = 42;
    Tick max_arrival = 20;
    Tick min_burst = 1;
    Tick max_burst = 8;
    double deadline_slack = 2.0;     // deadline = arrival + ceil(burst * slack); <= 0 disables deadlines
    int priority_levels = 4;
    double periodic_fraction = 0.0;  // share of tasks that get a period
    Tick min_period = 10;
    Tick max_period = 40;
    uint32_t resources = 0;          // shared resources R1..Rn
    double resource_fraction = 0.5;  // share of tasks that request resources
};

struct Workload {
    TaskSet tasks;
    ResourceGraph resources;
};

// Same options and seed always produce the same task set.
Workload generate_workload(const WorkloadOptions& opts);

} // namespace rtsim
