#include "rtsim/policy.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace {

using rtsim::Job;
using rtsim::JobIndex;
using rtsim::ReadyView;
using rtsim::Tick;

constexpr Tick kUnbounded = std::numeric_limits<Tick>::max();

// Smallest key wins; equal keys fall back to arrival, task id, job index.
template <typename KeyFn>
std::optional<JobIndex> pick_min(const ReadyView& view, KeyFn key) {
    std::optional<JobIndex> best;
    Tick best_key = 0;
    for (auto idx : view.ready) {
        const Job& j = view.registry.job(idx);
        Tick k = key(j);
        if (!best || k < best_key ||
            (k == best_key && rtsim::precedes(j, view.registry.job(*best)))) {
            best = idx;
            best_key = k;
        }
    }
    return best;
}

class FcfsPolicy : public rtsim::Policy {
public:
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::FCFS; }
    bool is_preemptive() const override { return false; }
    std::optional<JobIndex> select(const ReadyView& view) const override {
        return pick_min(view, [](const Job& j) { return j.spec.arrival; });
    }
};

class SjfPolicy : public rtsim::Policy {
public:
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::SJF; }
    bool is_preemptive() const override { return false; }
    std::optional<JobIndex> select(const ReadyView& view) const override {
        return pick_min(view, [](const Job& j) { return j.spec.burst; });
    }
};

class SrtfPolicy : public rtsim::Policy {
public:
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::SRTF; }
    bool is_preemptive() const override { return true; }
    std::optional<JobIndex> select(const ReadyView& view) const override {
        return pick_min(view, [](const Job& j) { return j.remaining; });
    }
};

class EdfPolicy : public rtsim::Policy {
public:
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::EDF; }
    bool is_preemptive() const override { return true; }
    std::optional<JobIndex> select(const ReadyView& view) const override {
        return pick_min(view, [](const Job& j) {
            return j.spec.deadline ? *j.spec.deadline : kUnbounded;
        });
    }
};

class RoundRobinPolicy : public rtsim::Policy {
public:
    explicit RoundRobinPolicy(Tick quantum) : quantum_(quantum) {}
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::RR; }
    bool is_preemptive() const override { return false; }
    Tick quantum() const override { return quantum_; }
    // The engine rotates expired jobs to the back, so the head of the
    // queue is always next.
    std::optional<JobIndex> select(const ReadyView& view) const override {
        if (view.ready.empty()) return std::nullopt;
        return view.ready.front();
    }
private:
    Tick quantum_;
};

class PriorityPolicy : public rtsim::Policy {
public:
    explicit PriorityPolicy(bool preemptive) : preemptive_(preemptive) {}
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::Priority; }
    bool is_preemptive() const override { return preemptive_; }
    std::optional<JobIndex> select(const ReadyView& view) const override {
        return pick_min(view, [](const Job& j) { return static_cast<Tick>(j.spec.priority); });
    }
private:
    bool preemptive_;
};

class RmsPolicy : public rtsim::Policy {
public:
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::RMS; }
    bool is_preemptive() const override { return true; }
    std::optional<JobIndex> select(const ReadyView& view) const override {
        return pick_min(view, [](const Job& j) {
            return j.spec.period ? *j.spec.period : kUnbounded;
        });
    }
};

class LlfPolicy : public rtsim::Policy {
public:
    rtsim::PolicyKind kind() const override { return rtsim::PolicyKind::LLF; }
    bool is_preemptive() const override { return true; }
    // Negative laxity still sorts first: the miss is already recorded and
    // finishing the job soonest limits the damage.
    std::optional<JobIndex> select(const ReadyView& view) const override {
        Tick now = view.now;
        return pick_min(view, [now](const Job& j) {
            auto lax = j.laxity(now);
            return lax ? *lax : kUnbounded;
        });
    }
};

} // namespace

namespace rtsim {

const char* policy_name(PolicyKind kind) {
    switch (kind) {
    case PolicyKind::FCFS: return "FCFS";
    case PolicyKind::SJF: return "SJF";
    case PolicyKind::SRTF: return "SRTF";
    case PolicyKind::EDF: return "EDF";
    case PolicyKind::RR: return "RR";
    case PolicyKind::Priority: return "PRIORITY";
    case PolicyKind::RMS: return "RMS";
    case PolicyKind::LLF: return "LLF";
    case PolicyKind::Hybrid: return "HYBRID";
    }
    return "UNKNOWN";
}

std::optional<PolicyKind> parse_policy(const std::string& value) {
    std::string v;
    v.reserve(value.size());
    for (char c : value) v.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (v == "FCFS") return PolicyKind::FCFS;
    if (v == "SJF") return PolicyKind::SJF;
    if (v == "SRTF") return PolicyKind::SRTF;
    if (v == "EDF") return PolicyKind::EDF;
    if (v == "RR") return PolicyKind::RR;
    if (v == "PRIORITY") return PolicyKind::Priority;
    if (v == "RMS") return PolicyKind::RMS;
    if (v == "LLF") return PolicyKind::LLF;
    if (v == "HYBRID" || v == "ADAPTIVE") return PolicyKind::Hybrid;
    return std::nullopt;
}

std::string HybridPolicy::name() const {
    if (!active_) return "HYBRID";
    return "HYBRID(" + active_->name() + ")";
}

std::unique_ptr<Policy> make_fcfs() { return std::make_unique<FcfsPolicy>(); }
std::unique_ptr<Policy> make_sjf() { return std::make_unique<SjfPolicy>(); }
std::unique_ptr<Policy> make_srtf() { return std::make_unique<SrtfPolicy>(); }
std::unique_ptr<Policy> make_edf() { return std::make_unique<EdfPolicy>(); }
std::unique_ptr<Policy> make_round_robin(Tick quantum) {
    return std::make_unique<RoundRobinPolicy>(quantum);
}
std::unique_ptr<Policy> make_priority(bool preemptive) {
    return std::make_unique<PriorityPolicy>(preemptive);
}
std::unique_ptr<Policy> make_rms() { return std::make_unique<RmsPolicy>(); }
std::unique_ptr<Policy> make_llf() { return std::make_unique<LlfPolicy>(); }

std::unique_ptr<Policy> make_policy(PolicyKind kind, const PolicyParams& params) {
    switch (kind) {
    case PolicyKind::FCFS: return make_fcfs();
    case PolicyKind::SJF: return make_sjf();
    case PolicyKind::SRTF: return make_srtf();
    case PolicyKind::EDF: return make_edf();
    case PolicyKind::RR: return make_round_robin(params.quantum);
    case PolicyKind::Priority: return make_priority(params.priority_preemptive);
    case PolicyKind::RMS: return make_rms();
    case PolicyKind::LLF: return make_llf();
    case PolicyKind::Hybrid: return nullptr;
    }
    return nullptr;
}

} // namespace rtsim
