#pragma once
#include "task_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rtsim {

enum class PolicyKind { FCFS, SJF, SRTF, EDF, RR, Priority, RMS, LLF, Hybrid };

const char* policy_name(PolicyKind kind);
std::optional<PolicyKind> parse_policy(const std::string& value);

// Read-only view of one core's ready partition. `ready` is in queue order
// (admission order, rotated by RR) and includes the job that ran last tick.
struct ReadyView {
    Tick now{0};
    CoreId core{0};
    const std::vector<JobIndex>& ready;
    const TaskRegistry& registry;
    std::optional<JobIndex> current{};
};

struct PolicyParams {
    Tick quantum{2};
    bool priority_preemptive{false};
};

class Policy {
public:
    virtual ~Policy() = default;
    virtual PolicyKind kind() const = 0;
    virtual std::string name() const { return policy_name(kind()); }
    virtual bool is_preemptive() const = 0;
    // Maximum ticks per dispatch; 0 = run until completion or block.
    virtual Tick quantum() const { return 0; }
    virtual std::optional<JobIndex> select(const ReadyView& view) const = 0;
};

// Delegates every decision to the variant the adaptive controller picked.
class HybridPolicy : public Policy {
public:
    explicit HybridPolicy(const Policy* active = nullptr) : active_(active) {}
    PolicyKind kind() const override { return PolicyKind::Hybrid; }
    std::string name() const override;
    bool is_preemptive() const override { return active_ && active_->is_preemptive(); }
    Tick quantum() const override { return active_ ? active_->quantum() : 0; }
    std::optional<JobIndex> select(const ReadyView& view) const override {
        if (!active_) return std::nullopt;
        return active_->select(view);
    }
    void set_active(const Policy* p) { active_ = p; }
    const Policy* active() const { return active_; }
private:
    const Policy* active_;
};

/// Factory helpers (implemented in policy.cpp). Hybrid is not built here,
/// see AdaptiveController.
std::unique_ptr<Policy> make_policy(PolicyKind kind, const PolicyParams& params = {});
std::unique_ptr<Policy> make_fcfs();
std::unique_ptr<Policy> make_sjf();
std::unique_ptr<Policy> make_srtf();
std::unique_ptr<Policy> make_edf();
std::unique_ptr<Policy> make_round_robin(Tick quantum);
std::unique_ptr<Policy> make_priority(bool preemptive = false);
std::unique_ptr<Policy> make_rms();
std::unique_ptr<Policy> make_llf();

} // namespace rtsim
