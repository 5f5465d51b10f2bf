#pragma once
#include "policy.hpp"
#include "status.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rtsim {

// Rolling metrics over one decision window [start, end).
struct WindowMetrics {
    Tick start{0};
    Tick end{0};
    std::size_t ready_length{0};     // sampled at the boundary
    std::size_t tasks_seen{0};
    std::size_t deadline_misses{0};
    double miss_rate{0.0};
    uint64_t preemptions{0};
    double burst_spread{1.0};        // max / min remaining among ready jobs
    double cpu_load{0.0};            // busy core-ticks / (ticks * cores)
};

// A rule matches when every threshold it sets is reached.
struct AdaptiveRule {
    std::string label;
    PolicyKind target{PolicyKind::Priority};
    std::optional<double> min_miss_rate{};
    std::optional<std::size_t> min_ready{};
    std::optional<double> min_burst_spread{};
    std::optional<uint64_t> min_preemptions{};
    std::optional<double> min_cpu_load{};

    bool matches(const WindowMetrics& m) const;
};

std::vector<AdaptiveRule> default_adaptive_rules();

struct AdaptiveConfig {
    Tick decision_window = 5;
    PolicyKind initial = PolicyKind::Priority;
    std::vector<AdaptiveRule> rules = default_adaptive_rules();
};

Status validate_adaptive(const AdaptiveConfig& cfg, const PolicyParams& params);

// First matching rule wins; no match keeps the current policy. Pure so a
// recorded window can be replayed.
std::optional<PolicyKind> select_policy(const std::vector<AdaptiveRule>& rules,
                                        const WindowMetrics& m);

struct PolicySwitch {
    PolicyKind from;
    PolicyKind to;
    WindowMetrics window;
};

class AdaptiveController {
public:
    AdaptiveController(AdaptiveConfig cfg, PolicyParams params);

    const Policy& policy() const { return hybrid_; }
    PolicyKind active() const { return active_; }
    const AdaptiveConfig& config() const { return cfg_; }

    bool is_boundary(Tick now) const {
        return now > 0 && cfg_.decision_window > 0 && now % cfg_.decision_window == 0;
    }

    void note_tick(std::size_t busy_cores, std::size_t cores);
    void note_seen(JobIndex job) { seen_.insert(job); }
    void note_miss() { ++misses_; }
    void note_preemption() { ++preemptions_; }

    WindowMetrics window_metrics(Tick now, std::size_t ready_length, double burst_spread) const;
    // Called at a boundary only. Applies the rule table, starts a new window.
    std::optional<PolicySwitch> decide(Tick now, std::size_t ready_length, double burst_spread);

private:
    const Policy& variant(PolicyKind kind);

    AdaptiveConfig cfg_;
    PolicyParams params_;
    std::map<PolicyKind, std::unique_ptr<Policy>> variants_;
    HybridPolicy hybrid_;
    PolicyKind active_;

    Tick window_start_{0};
    std::set<JobIndex> seen_;
    std::size_t misses_{0};
    uint64_t preemptions_{0};
    uint64_t busy_core_ticks_{0};
    uint64_t core_ticks_{0};
};

} // namespace rtsim
