#pragma once
#include "resource_graph.hpp"
#include "task_registry.hpp"
#include <optional>
#include <vector>

namespace rtsim {

// Wait-for graph over job indices. Edge a -> b: job a waits on a resource
// job b holds. Nodes are plain indices, no pointers between them.
class WaitForGraph {
public:
    explicit WaitForGraph(std::size_t nodes = 0) : adj_(nodes) {}

    void add_edge(JobIndex from, JobIndex to);
    const std::vector<JobIndex>& successors(JobIndex node) const { return adj_[node]; }
    std::size_t node_count() const { return adj_.size(); }
    std::size_t edge_count() const;

    // DFS with recursion-stack marking. Returns the nodes of the first
    // cycle found, in wait order.
    std::optional<std::vector<JobIndex>> find_cycle() const;
    std::optional<std::vector<JobIndex>> find_cycle_from(JobIndex start) const;

    static WaitForGraph from_resources(const ResourceGraph& resources, std::size_t nodes);

private:
    bool visit(JobIndex node, std::vector<int>& color, std::vector<JobIndex>& stack,
               std::vector<JobIndex>& cycle) const;

    std::vector<std::vector<JobIndex>> adj_;
};

struct DeadlockReport {
    std::vector<JobIndex> cycle;
    JobIndex victim{};
};

class DeadlockDetector {
public:
    // Analyses the current holders/waiters. The caller applies the
    // resolution (preempting the victim) since it owns the state.
    std::optional<DeadlockReport> inspect(const ResourceGraph& resources,
                                          const TaskRegistry& registry,
                                          std::optional<JobIndex> requester = std::nullopt) const;

    // Lowest priority in the cycle: largest priority number, then latest
    // arrival, then largest id.
    static JobIndex choose_victim(const std::vector<JobIndex>& cycle, const TaskRegistry& registry);
};

} // namespace rtsim
