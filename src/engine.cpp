#include "rtsim/engine.hpp"
#include "rtsim/deadlock.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace rtsim {

const char* event_name(EventKind kind) {
    switch (kind) {
    case EventKind::TaskArrived: return "TaskArrived";
    case EventKind::TaskCompleted: return "TaskCompleted";
    case EventKind::DeadlineMissed: return "DeadlineMissed";
    case EventKind::DeadlockResolved: return "DeadlockResolved";
    case EventKind::PolicySwitched: return "PolicySwitched";
    case EventKind::TaskBlocked: return "TaskBlocked";
    case EventKind::TaskPreempted: return "TaskPreempted";
    }
    return "Unknown";
}

namespace {

PolicyParams params_of(const SimulationConfig& cfg) {
    PolicyParams p;
    p.quantum = cfg.quantum;
    p.priority_preemptive = cfg.priority_preemptive;
    return p;
}

Status invalid_config(const std::string& why) {
    return Status::failure(ErrorCode::InvalidConfig, why);
}

struct CoreState {
    explicit CoreState(const CoreModelConfig& cfg) : model(cfg) {}

    std::vector<JobIndex> ready;          // includes the running job
    std::optional<JobIndex> current{};
    Tick slice{0};                        // ticks since the current dispatch began
    std::optional<std::size_t> last_interval{};
    CoreStatusModel model;
};

void erase_job(std::vector<JobIndex>& v, JobIndex j) {
    v.erase(std::remove(v.begin(), v.end(), j), v.end());
}

} // namespace

Status validate_config(const SimulationConfig& cfg) {
    if (cfg.cores == 0) return invalid_config("at least one core is required");
    if (cfg.max_ticks <= 0) return invalid_config("max_ticks must be > 0");
    if (cfg.periodic_horizon < 0) return invalid_config("periodic horizon must be >= 0");
    if (cfg.policy == PolicyKind::RR && cfg.quantum <= 0) {
        return invalid_config("RR quantum must be > 0 (got " + std::to_string(cfg.quantum) + ")");
    }
    const auto& m = cfg.core_model;
    if (m.window == 0) return invalid_config("core model window must be > 0");
    if (m.min_ghz <= 0.0 || m.max_ghz < m.min_ghz) return invalid_config("core model frequency range is invalid");
    if (m.decay <= 0.0 || m.decay > 1.0) return invalid_config("core model decay must be in (0, 1]");
    if (m.max_temp_c < m.ambient_c) return invalid_config("core model max temperature below ambient");
    if (cfg.policy == PolicyKind::Hybrid) return validate_adaptive(cfg.adaptive, params_of(cfg));
    return Status::success();
}

class Engine::Impl {
public:
    explicit Impl(SimulationConfig cfg) : cfg_(std::move(cfg)) {}

    void attach_feed(std::shared_ptr<TickFeed> feed) { feed_ = std::move(feed); }

    Status start(const TaskSet& tasks, const ResourceGraph& resources) {
        reset();
        auto st = validate_config(cfg_);
        if (!st.ok()) return fail_start(st);

        resources_ = resources;
        resources_.reset();
        st = registry_.load(tasks, resources_, cfg_.cores, cfg_.periodic_horizon);
        if (!st.ok()) return fail_start(st);

        if (cfg_.policy == PolicyKind::Hybrid) {
            controller_ = std::make_unique<AdaptiveController>(cfg_.adaptive, params_of(cfg_));
        } else {
            policy_ = make_policy(cfg_.policy, params_of(cfg_));
        }
        for (CoreId c = 0; c < cfg_.cores; ++c) cores_.emplace_back(cfg_.core_model);
        for (JobIndex i = 0; i < registry_.size(); ++i) pending_.push_back(i);
        started_ = true;
        log("engine", "start policy=" + policy().name() + " jobs=" + std::to_string(registry_.size())
                          + " cores=" + std::to_string(cfg_.cores));
        return status_;
    }

    bool step() {
        if (!started_ || !status_.ok() || registry_.all_completed()) return false;
        if (now_ >= cfg_.max_ticks) {
            status_ = Status::failure(ErrorCode::SimulationDivergence,
                                      "no termination after " + std::to_string(cfg_.max_ticks) + " ticks ("
                                      + std::to_string(registry_.size() - registry_.completed_count())
                                      + " jobs unfinished)");
            log("engine", status_.message);
            close_feed();
            return false;
        }
        tick();
        if (!status_.ok() || registry_.all_completed()) close_feed();
        return true;
    }

    RunResult resume() {
        stopped_ = false;
        while (true) {
            if (stop_requested_.exchange(false)) {
                stopped_ = true;
                log("engine", "stopped on request");
                break;
            }
            if (!step()) break;
        }
        if (started_ && registry_.all_completed()) close_feed();
        return snapshot();
    }

    void request_stop() { stop_requested_.store(true); }

    bool finished() const { return started_ && status_.ok() && registry_.all_completed(); }
    Tick now() const { return now_; }

    PolicyKind active_kind() const {
        if (controller_) return controller_->active();
        return cfg_.policy;
    }

    RunResult snapshot() const {
        RunResult r;
        r.status = status_;
        r.finished = finished();
        r.stopped = stopped_;
        r.timeline = timeline_;
        r.events = events_;
        r.metrics = compute_metrics(registry_, timeline_, events_, cfg_.cores, cfg_.core_model);
        r.state = state();
        r.jobs = registry_.jobs();
        return r;
    }

private:
    const Policy& policy() const {
        if (controller_) return controller_->policy();
        return *policy_;
    }

    ReadyView view(CoreId c) const {
        return ReadyView{now_, c, cores_[c].ready, registry_, cores_[c].current};
    }

    void reset() {
        registry_ = TaskRegistry{};
        resources_ = ResourceGraph{};
        policy_.reset();
        controller_.reset();
        cores_.clear();
        pending_.clear();
        pending_cursor_ = 0;
        completed_order_.clear();
        timeline_.clear();
        events_.clear();
        now_ = 0;
        status_ = Status::success();
        started_ = false;
        stopped_ = false;
        stop_requested_.store(false);
    }

    Status fail_start(Status st) {
        status_ = st;
        started_ = false;
        log("engine", std::string("rejected: ") + error_name(st.code) + ": " + st.message);
        return st;
    }

    void close_feed() {
        if (feed_) feed_->close();
    }

    void tick() {
        const std::size_t first_event = events_.size();

        if (controller_ && controller_->is_boundary(now_)) evaluate_window();
        admit_arrivals();
        check_deadlines();
        if (controller_) {
            for (JobIndex i = 0; i < registry_.size(); ++i) {
                auto s = registry_.job(i).state;
                if (s == JobState::Ready || s == JobState::Running || s == JobState::Blocked) {
                    controller_->note_seen(i);
                }
            }
        }

        std::vector<ExecutionInterval> slices;
        std::vector<CoreStatus> statuses;
        std::size_t busy = 0;
        for (CoreId c = 0; c < cfg_.cores; ++c) {
            auto slice = run_core(c);
            if (!status_.ok()) return;
            if (!slice.idle()) ++busy;
            statuses.push_back(cores_[c].model.observe(!slice.idle()));
            slices.push_back(slice);
        }

        for (JobIndex i = 0; i < registry_.size(); ++i) {
            auto& j = registry_.job(i);
            if (j.state == JobState::Ready || j.state == JobState::Blocked) ++j.waiting;
        }
        if (controller_) controller_->note_tick(busy, cfg_.cores);

        if (feed_) {
            TickRecord rec;
            rec.time = now_;
            rec.policy = active_kind();
            rec.slices = std::move(slices);
            rec.cores = std::move(statuses);
            rec.events.assign(events_.begin() + static_cast<std::ptrdiff_t>(first_event), events_.end());
            feed_->push(std::move(rec));
        }
        ++now_;
    }

    void evaluate_window() {
        std::size_t ready_len = 0;
        Tick most = 0;
        Tick least = std::numeric_limits<Tick>::max();
        for (const auto& cs : cores_) {
            for (auto idx : cs.ready) {
                ++ready_len;
                Tick rem = registry_.job(idx).remaining;
                most = std::max(most, rem);
                least = std::min(least, rem);
            }
        }
        double spread = (ready_len >= 2 && least > 0)
            ? static_cast<double>(most) / static_cast<double>(least) : 1.0;
        auto sw = controller_->decide(now_, ready_len, spread);
        if (!sw) return;

        Event e;
        e.kind = EventKind::PolicySwitched;
        e.time = now_;
        e.from_policy = sw->from;
        e.to_policy = sw->to;
        emit(std::move(e));
        std::ostringstream oss;
        oss << policy_name(sw->from) << " -> " << policy_name(sw->to)
            << " (miss_rate=" << sw->window.miss_rate << " ready=" << sw->window.ready_length
            << " spread=" << sw->window.burst_spread << ")";
        log("adaptive", oss.str());
    }

    void admit_arrivals() {
        while (pending_cursor_ < pending_.size()) {
            JobIndex j = pending_[pending_cursor_];
            auto& job = registry_.job(j);
            if (job.spec.arrival > now_) break;
            ++pending_cursor_;
            CoreId core = job.spec.affinity ? *job.spec.affinity : least_loaded_core();
            job.core = core;
            job.state = JobState::Ready;
            cores_[core].ready.push_back(j);

            Event e = job_event(EventKind::TaskArrived, j);
            emit(std::move(e));
            log_debug("engine", "arrived " + display_name(job.spec.id, job.index, job.spec.name)
                                    + " core=" + std::to_string(core));
        }
    }

    CoreId least_loaded_core() const {
        CoreId best = 0;
        for (CoreId c = 1; c < cores_.size(); ++c) {
            if (cores_[c].ready.size() < cores_[best].ready.size()) best = c;
        }
        return best;
    }

    // Laxity below zero means the deadline can no longer be met whatever
    // the policy does, so the miss is recorded as soon as it is certain.
    void check_deadlines() {
        for (JobIndex i = 0; i < registry_.size(); ++i) {
            auto& j = registry_.job(i);
            if (j.state == JobState::Pending || j.state == JobState::Completed || j.deadline_missed) continue;
            auto lax = j.laxity(now_);
            if (!lax || *lax >= 0) continue;
            j.deadline_missed = true;
            emit(job_event(EventKind::DeadlineMissed, i));
            if (controller_) controller_->note_miss();
            log("engine", "deadline miss " + display_name(j.spec.id, j.index, j.spec.name)
                              + " laxity=" + std::to_string(*lax));
        }
    }

    ExecutionInterval run_core(CoreId c) {
        auto& cs = cores_[c];
        const Policy& pol = policy();
        bool rotated = false;
        std::optional<JobIndex> chosen;

        if (cs.current) {
            Tick q = pol.quantum();
            if (q > 0 && cs.slice >= q) {
                erase_job(cs.ready, *cs.current);
                cs.ready.push_back(*cs.current);
                rotated = true;
            } else if (!pol.is_preemptive()) {
                chosen = cs.current;
            }
        }
        if (!chosen) chosen = pol.select(view(c));

        const std::size_t limit = 4 * registry_.size() + 8;
        std::size_t rounds = 0;
        while (chosen) {
            auto missing = acquire_due(*chosen);
            if (!missing) break;
            block(*chosen, *missing);
            if (!resolve_deadlocks(*chosen)) return idle_slice(c);
            if (++rounds > limit) {
                status_ = Status::failure(ErrorCode::DeadlockUnresolved,
                                          "resource acquisition did not settle on core " + std::to_string(c));
                log("deadlock", status_.message);
                return idle_slice(c);
            }
            chosen = pol.select(view(c));
        }

        if (!chosen) {
            cs.current.reset();
            cs.slice = 0;
            return record(c, std::nullopt, true);
        }

        auto& job = registry_.job(*chosen);
        bool continued = cs.current && *cs.current == *chosen && !rotated;
        if (cs.current && *cs.current != *chosen) preempt_running(*cs.current, c);
        if (!continued) {
            cs.slice = 0;
            log_debug("engine", "dispatch " + display_name(job.spec.id, job.index, job.spec.name)
                                    + " core=" + std::to_string(c));
        }
        cs.current = *chosen;
        job.state = JobState::Running;
        if (!job.first_run) job.first_run = now_;

        auto slice = record(c, chosen, continued);
        --job.remaining;
        ++cs.slice;
        release_finished_requests(*chosen);
        if (job.remaining == 0) complete(*chosen, c);
        return slice;
    }

    ExecutionInterval idle_slice(CoreId c) const {
        ExecutionInterval iv;
        iv.start = now_;
        iv.end = now_ + 1;
        iv.core = c;
        return iv;
    }

    // Appends [now, now+1). A continuation of the same dispatch extends the
    // core's last interval instead.
    ExecutionInterval record(CoreId c, std::optional<JobIndex> j, bool extend) {
        auto iv = idle_slice(c);
        if (j) {
            iv.task = registry_.job(*j).spec.id;
            iv.job = registry_.job(*j).index;
        }
        auto& cs = cores_[c];
        if (extend && cs.last_interval) {
            auto& last = timeline_[*cs.last_interval];
            if (last.end == now_ && last.task == iv.task && last.job == iv.job) {
                last.end = now_ + 1;
                return iv;
            }
        }
        cs.last_interval = timeline_.size();
        timeline_.push_back(iv);
        return iv;
    }

    std::optional<ResourceId> acquire_due(JobIndex j) {
        auto& job = registry_.job(j);
        Tick p = job.progress();
        for (std::size_t i = 0; i < job.spec.resources.size(); ++i) {
            if (job.held[i]) continue;
            const auto& req = job.spec.resources[i];
            if (req.acquire_at > p || p >= job.release_point(i)) continue;
            if (!resources_.try_acquire(req.resource, j)) return req.resource;
            job.held[i] = true;
            log_debug("engine", display_name(job.spec.id, job.index, job.spec.name)
                                    + " acquired R" + std::to_string(req.resource));
        }
        return std::nullopt;
    }

    void block(JobIndex j, ResourceId res) {
        auto& job = registry_.job(j);
        auto& cs = cores_[job.core];
        job.state = JobState::Blocked;
        erase_job(cs.ready, j);
        if (cs.current && *cs.current == j) {
            cs.current.reset();
            cs.slice = 0;
        }
        resources_.wait(res, j);

        Event e = job_event(EventKind::TaskBlocked, j);
        e.resource = res;
        emit(std::move(e));
        log_debug("engine", display_name(job.spec.id, job.index, job.spec.name)
                                + " blocked on R" + std::to_string(res));
    }

    bool resolve_deadlocks(JobIndex requester) {
        for (std::size_t round = 0;; ++round) {
            auto report = detector_.inspect(resources_, registry_, requester);
            if (!report) return true;
            if (round >= registry_.size()) {
                status_ = Status::failure(ErrorCode::DeadlockUnresolved,
                                          "wait-for cycle persists after " + std::to_string(round)
                                          + " resolutions");
                log("deadlock", status_.message);
                return false;
            }

            const auto& victim = registry_.job(report->victim);
            Event e = job_event(EventKind::DeadlockResolved, report->victim);
            e.resource = resources_.waiting_on(report->victim);
            std::ostringstream oss;
            oss << "cycle";
            for (auto idx : report->cycle) {
                const auto& member = registry_.job(idx);
                e.cycle.push_back(member.spec.id);
                oss << " " << display_name(member.spec.id, member.index, member.spec.name);
            }
            oss << " victim " << display_name(victim.spec.id, victim.index, victim.spec.name);

            preempt_victim(report->victim);
            emit(std::move(e));
            log("deadlock", oss.str());
        }
    }

    // Forced preemption: the victim gives up everything it holds and goes
    // back to the ready set. Executed progress is kept.
    void preempt_victim(JobIndex v) {
        auto& job = registry_.job(v);
        resources_.cancel_wait(v);
        for (std::size_t i = 0; i < job.held.size(); ++i) {
            if (!job.held[i]) continue;
            job.held[i] = false;
            hand_off(job.spec.resources[i].resource, v);
        }
        job.state = JobState::Ready;
        ++job.preemptions;
        emit(job_event(EventKind::TaskPreempted, v));
        if (controller_) controller_->note_preemption();
        auto& cs = cores_[job.core];
        if (std::find(cs.ready.begin(), cs.ready.end(), v) == cs.ready.end()) cs.ready.push_back(v);
    }

    void preempt_running(JobIndex j, CoreId c) {
        auto& job = registry_.job(j);
        if (job.state != JobState::Running) return;
        job.state = JobState::Ready;
        ++job.preemptions;
        emit(job_event(EventKind::TaskPreempted, j));
        if (controller_) controller_->note_preemption();
        log_debug("engine", "preempted " + display_name(job.spec.id, job.index, job.spec.name)
                                + " core=" + std::to_string(c));
    }

    void hand_off(ResourceId res, JobIndex from) {
        auto next = resources_.release(res, from);
        if (!next) return;
        auto& w = registry_.job(*next);
        for (std::size_t i = 0; i < w.spec.resources.size(); ++i) {
            if (w.spec.resources[i].resource == res) w.held[i] = true;
        }
        if (w.state == JobState::Blocked) {
            w.state = JobState::Ready;
            cores_[w.core].ready.push_back(*next);
        }
        log_debug("engine", "R" + std::to_string(res) + " handed to "
                                + display_name(w.spec.id, w.index, w.spec.name));
    }

    void release_finished_requests(JobIndex j) {
        auto& job = registry_.job(j);
        if (job.remaining == 0) return;
        Tick p = job.progress();
        for (std::size_t i = 0; i < job.held.size(); ++i) {
            if (job.held[i] && p >= job.release_point(i)) {
                job.held[i] = false;
                hand_off(job.spec.resources[i].resource, j);
            }
        }
    }

    void complete(JobIndex j, CoreId c) {
        auto& job = registry_.job(j);
        auto& cs = cores_[c];
        job.state = JobState::Completed;
        job.completion = now_ + 1;
        for (std::size_t i = 0; i < job.held.size(); ++i) {
            if (!job.held[i]) continue;
            job.held[i] = false;
            hand_off(job.spec.resources[i].resource, j);
        }
        erase_job(cs.ready, j);
        cs.current.reset();
        cs.slice = 0;
        completed_order_.push_back(j);

        Event e = job_event(EventKind::TaskCompleted, j);
        e.time = now_ + 1;
        emit(std::move(e));
        log("engine", "completed " + display_name(job.spec.id, job.index, job.spec.name)
                          + " turnaround=" + std::to_string(*job.completion - job.spec.arrival));
    }

    Event job_event(EventKind kind, JobIndex j) const {
        const auto& job = registry_.job(j);
        Event e;
        e.kind = kind;
        e.time = now_;
        e.task = job.spec.id;
        e.job = job.index;
        e.core = job.core;
        return e;
    }

    void emit(Event e) { events_.push_back(std::move(e)); }

    SchedulerState state() const {
        SchedulerState s;
        s.now = now_;
        s.active_policy = active_kind();
        for (const auto& cs : cores_) {
            s.ready.push_back(cs.ready);
            s.running.push_back(cs.current);
        }
        for (JobIndex i = 0; i < registry_.size(); ++i) {
            if (registry_.job(i).state == JobState::Blocked) s.blocked.push_back(i);
        }
        s.completed = completed_order_;
        s.pending.assign(pending_.begin() + static_cast<std::ptrdiff_t>(pending_cursor_), pending_.end());
        return s;
    }

    void log(const char* tag, const std::string& msg) const {
        if (!cfg_.verbose) return;
        std::cout << "[" << tag << "] t=" << now_ << " " << msg << std::endl;
    }

    void log_debug(const char* tag, const std::string& msg) const {
        if (!cfg_.debug_logging) return;
        std::cout << "[" << tag << "] [debug] t=" << now_ << " " << msg << std::endl;
    }

    SimulationConfig cfg_;
    std::shared_ptr<TickFeed> feed_;

    TaskRegistry registry_;
    ResourceGraph resources_;
    std::unique_ptr<Policy> policy_;
    std::unique_ptr<AdaptiveController> controller_;
    DeadlockDetector detector_;
    std::vector<CoreState> cores_;

    std::vector<JobIndex> pending_;
    std::size_t pending_cursor_{0};
    std::vector<JobIndex> completed_order_;
    std::vector<ExecutionInterval> timeline_;
    std::vector<Event> events_;

    Tick now_{0};
    Status status_;
    bool started_{false};
    bool stopped_{false};
    std::atomic<bool> stop_requested_{false};
};

// -------------- thin wrappers --------------
Engine::Engine(SimulationConfig cfg) : impl_(std::make_unique<Impl>(std::move(cfg))) {}
Engine::~Engine() = default;

void Engine::attach_feed(std::shared_ptr<TickFeed> feed) { impl_->attach_feed(std::move(feed)); }
Status Engine::start(const TaskSet& tasks, const ResourceGraph& resources) { return impl_->start(tasks, resources); }
bool Engine::step() { return impl_->step(); }
RunResult Engine::resume() { return impl_->resume(); }
void Engine::request_stop() { impl_->request_stop(); }
bool Engine::finished() const { return impl_->finished(); }
Tick Engine::now() const { return impl_->now(); }
PolicyKind Engine::active_policy() const { return impl_->active_kind(); }
RunResult Engine::snapshot() const { return impl_->snapshot(); }

RunResult Engine::run(const TaskSet& tasks, const ResourceGraph& resources) {
    auto st = impl_->start(tasks, resources);
    if (!st.ok()) return impl_->snapshot();
    return impl_->resume();
}

RunResult simulate(const TaskSet& tasks, const ResourceGraph& resources, const SimulationConfig& cfg) {
    Engine engine(cfg);
    return engine.run(tasks, resources);
}

RunResult simulate(const TaskSet& tasks, const ResourceGraph& resources, PolicyKind policy,
                   std::optional<Tick> quantum) {
    SimulationConfig cfg;
    cfg.policy = policy;
    if (quantum) cfg.quantum = *quantum;
    return simulate(tasks, resources, cfg);
}

} // namespace rtsim
