#include "rtsim/adaptive.hpp"
#include <utility>

namespace rtsim {

bool AdaptiveRule::matches(const WindowMetrics& m) const {
    if (min_miss_rate && m.miss_rate < *min_miss_rate) return false;
    if (min_ready && m.ready_length < *min_ready) return false;
    if (min_burst_spread && m.burst_spread < *min_burst_spread) return false;
    if (min_preemptions && m.preemptions < *min_preemptions) return false;
    if (min_cpu_load && m.cpu_load < *min_cpu_load) return false;
    return true;
}

std::vector<AdaptiveRule> default_adaptive_rules() {
    std::vector<AdaptiveRule> rules;

    AdaptiveRule deadline_pressure;
    deadline_pressure.label = "deadline-pressure";
    deadline_pressure.target = PolicyKind::EDF;
    deadline_pressure.min_miss_rate = 0.2;
    rules.push_back(deadline_pressure);

    AdaptiveRule mixed_backlog;
    mixed_backlog.label = "mixed-backlog";
    mixed_backlog.target = PolicyKind::SRTF;
    mixed_backlog.min_ready = 4;
    mixed_backlog.min_burst_spread = 2.0;
    rules.push_back(mixed_backlog);

    AdaptiveRule fallback;
    fallback.label = "steady";
    fallback.target = PolicyKind::Priority;
    rules.push_back(fallback);
    return rules;
}

Status validate_adaptive(const AdaptiveConfig& cfg, const PolicyParams& params) {
    if (cfg.decision_window <= 0) {
        return Status::failure(ErrorCode::InvalidConfig, "adaptive decision window must be > 0");
    }
    if (cfg.rules.empty()) {
        return Status::failure(ErrorCode::InvalidConfig, "adaptive rule table is empty");
    }
    auto check_target = [&](PolicyKind k, const std::string& where) -> Status {
        if (k == PolicyKind::Hybrid) {
            return Status::failure(ErrorCode::InvalidConfig, where + " cannot target HYBRID");
        }
        if (k == PolicyKind::RR && params.quantum <= 0) {
            return Status::failure(ErrorCode::InvalidConfig, where + " targets RR without a positive quantum");
        }
        return Status::success();
    };
    auto st = check_target(cfg.initial, "initial adaptive policy");
    if (!st.ok()) return st;
    for (const auto& r : cfg.rules) {
        st = check_target(r.target, "adaptive rule '" + r.label + "'");
        if (!st.ok()) return st;
    }
    return Status::success();
}

std::optional<PolicyKind> select_policy(const std::vector<AdaptiveRule>& rules,
                                        const WindowMetrics& m) {
    for (const auto& r : rules) {
        if (r.matches(m)) return r.target;
    }
    return std::nullopt;
}

AdaptiveController::AdaptiveController(AdaptiveConfig cfg, PolicyParams params)
    : cfg_(std::move(cfg)), params_(params), active_(cfg_.initial) {
    hybrid_.set_active(&variant(active_));
}

const Policy& AdaptiveController::variant(PolicyKind kind) {
    auto it = variants_.find(kind);
    if (it == variants_.end()) {
        it = variants_.emplace(kind, make_policy(kind, params_)).first;
    }
    return *it->second;
}

void AdaptiveController::note_tick(std::size_t busy_cores, std::size_t cores) {
    busy_core_ticks_ += busy_cores;
    core_ticks_ += cores;
}

WindowMetrics AdaptiveController::window_metrics(Tick now, std::size_t ready_length,
                                                 double burst_spread) const {
    WindowMetrics m;
    m.start = window_start_;
    m.end = now;
    m.ready_length = ready_length;
    m.tasks_seen = seen_.size();
    m.deadline_misses = misses_;
    m.miss_rate = seen_.empty() ? 0.0
                                : static_cast<double>(misses_) / static_cast<double>(seen_.size());
    m.preemptions = preemptions_;
    m.burst_spread = burst_spread;
    m.cpu_load = core_ticks_ == 0 ? 0.0
                                  : static_cast<double>(busy_core_ticks_) / static_cast<double>(core_ticks_);
    return m;
}

std::optional<PolicySwitch> AdaptiveController::decide(Tick now, std::size_t ready_length,
                                                       double burst_spread) {
    auto m = window_metrics(now, ready_length, burst_spread);
    window_start_ = now;
    seen_.clear();
    misses_ = 0;
    preemptions_ = 0;
    busy_core_ticks_ = 0;
    core_ticks_ = 0;

    auto next = select_policy(cfg_.rules, m);
    if (!next || *next == active_) return std::nullopt;
    PolicySwitch sw{active_, *next, m};
    active_ = *next;
    hybrid_.set_active(&variant(active_));
    return sw;
}

} // namespace rtsim
