#include "rtsim/deadlock.hpp"
#include <algorithm>

namespace rtsim {

namespace {
constexpr int kWhite = 0;
constexpr int kGray = 1;   // on the recursion stack
constexpr int kBlack = 2;
}

void WaitForGraph::add_edge(JobIndex from, JobIndex to) {
    auto hi = std::max(from, to);
    if (hi >= adj_.size()) adj_.resize(hi + 1);
    auto& out = adj_[from];
    if (std::find(out.begin(), out.end(), to) == out.end()) out.push_back(to);
}

std::size_t WaitForGraph::edge_count() const {
    std::size_t n = 0;
    for (const auto& out : adj_) n += out.size();
    return n;
}

bool WaitForGraph::visit(JobIndex node, std::vector<int>& color, std::vector<JobIndex>& stack,
                         std::vector<JobIndex>& cycle) const {
    color[node] = kGray;
    stack.push_back(node);
    for (auto next : adj_[node]) {
        if (color[next] == kGray) {
            auto it = std::find(stack.begin(), stack.end(), next);
            cycle.assign(it, stack.end());
            return true;
        }
        if (color[next] == kWhite && visit(next, color, stack, cycle)) return true;
    }
    stack.pop_back();
    color[node] = kBlack;
    return false;
}

std::optional<std::vector<JobIndex>> WaitForGraph::find_cycle_from(JobIndex start) const {
    if (start >= adj_.size()) return std::nullopt;
    std::vector<int> color(adj_.size(), kWhite);
    std::vector<JobIndex> stack;
    std::vector<JobIndex> cycle;
    if (visit(start, color, stack, cycle)) return cycle;
    return std::nullopt;
}

std::optional<std::vector<JobIndex>> WaitForGraph::find_cycle() const {
    std::vector<int> color(adj_.size(), kWhite);
    std::vector<JobIndex> stack;
    std::vector<JobIndex> cycle;
    for (JobIndex n = 0; n < adj_.size(); ++n) {
        if (color[n] != kWhite) continue;
        stack.clear();
        if (visit(n, color, stack, cycle)) return cycle;
    }
    return std::nullopt;
}

WaitForGraph WaitForGraph::from_resources(const ResourceGraph& resources, std::size_t nodes) {
    WaitForGraph g(nodes);
    for (const auto& r : resources.resources()) {
        if (!r.holder) continue;
        for (auto w : r.waiters) {
            if (w != *r.holder) g.add_edge(w, *r.holder);
        }
    }
    return g;
}

JobIndex DeadlockDetector::choose_victim(const std::vector<JobIndex>& cycle,
                                         const TaskRegistry& registry) {
    JobIndex victim = cycle.front();
    for (auto idx : cycle) {
        const auto& a = registry.job(idx);
        const auto& b = registry.job(victim);
        if (a.spec.priority != b.spec.priority) {
            if (a.spec.priority > b.spec.priority) victim = idx;
            continue;
        }
        if (precedes(b, a)) victim = idx;
    }
    return victim;
}

std::optional<DeadlockReport> DeadlockDetector::inspect(const ResourceGraph& resources,
                                                        const TaskRegistry& registry,
                                                        std::optional<JobIndex> requester) const {
    auto graph = WaitForGraph::from_resources(resources, registry.size());
    std::optional<std::vector<JobIndex>> cycle;
    if (requester) cycle = graph.find_cycle_from(*requester);
    if (!cycle) cycle = graph.find_cycle();
    if (!cycle) return std::nullopt;
    DeadlockReport report;
    report.victim = choose_victim(*cycle, registry);
    report.cycle = std::move(*cycle);
    return report;
}

} // namespace rtsim
