#include "rtsim/engine.hpp"
#include "rtsim/reporting.hpp"
#include "rtsim/workload.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace rtsim;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--policy=NAME] [--quantum=N] [--cores=N] [--task=...]... \n";
    std::cout << "  --policy=NAME         FCFS|SJF|SRTF|EDF|RR|PRIORITY|RMS|LLF|HYBRID\n";
    std::cout << "  --quantum=N           RR time slice (default 2)\n";
    std::cout << "  --preemptive-priority let a more urgent arrival preempt under PRIORITY\n";
    std::cout << "  --cores=N             number of simulated cores\n";
    std::cout << "  --task=ID:ARRIVAL:BURST[:DEADLINE[:PRIORITY[:PERIOD]]]  ('-' skips a field)\n";
    std::cout << "  --resource=ID         declare a shared resource\n";
    std::cout << "  --request=TASK:RES[:ACQUIRE[:RELEASE]]\n";
    std::cout << "  --generate=N          synthesize N tasks instead of --task (see --seed)\n";
    std::cout << "  --seed=N --window=N --horizon=N --max-ticks=N\n";
    std::cout << "  --snapshot=PATH       write a zlib-packed snapshot of the run\n";
    std::cout << "  --csv-report          emit timeline/events/metrics as CSV\n";
    std::cout << "  --feed                print per-tick records from a consumer thread\n";
    std::cout << "  --verbose --debug     engine logging\n";
}

std::vector<std::string> split(const std::string& spec) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= spec.size()) {
        auto pos = spec.find(':', start);
        if (pos == std::string::npos) pos = spec.size();
        parts.push_back(spec.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool parse_tick(const std::string& value, Tick& out) {
    if (value.empty()) return false;
    size_t i = value[0] == '-' ? 1 : 0;
    if (i == value.size()) return false;
    Tick result = 0;
    for (; i < value.size(); ++i) {
        char c = value[i];
        if (c < '0' || c > '9') return false;
        Tick digit = c - '0';
        if (result > (std::numeric_limits<Tick>::max() - digit) / 10) return false;
        result = result * 10 + digit;
    }
    out = value[0] == '-' ? -result : result;
    return true;
}

unsigned parse_unsigned(const std::string& value, unsigned default_value) {
    unsigned result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') return default_value;
        auto digit = static_cast<unsigned>(c - '0');
        if (result > (std::numeric_limits<unsigned>::max() - digit) / 10) return default_value;
        result = result * 10 + digit;
    }
    return result > 0 ? result : default_value;
}

bool parse_task(const std::string& spec, Task& t) {
    auto parts = split(spec);
    if (parts.size() < 3) return false;
    Tick v = 0;
    if (!parse_tick(parts[0], v) || v < 0) return false;
    t.id = static_cast<TaskId>(v);
    if (!parse_tick(parts[1], t.arrival) || !parse_tick(parts[2], t.burst)) return false;
    if (parts.size() > 3 && parts[3] != "-") {
        if (!parse_tick(parts[3], v)) return false;
        t.deadline = v;
    }
    if (parts.size() > 4 && parts[4] != "-") {
        if (!parse_tick(parts[4], v)) return false;
        t.priority = static_cast<int>(v);
    }
    if (parts.size() > 5 && parts[5] != "-") {
        if (!parse_tick(parts[5], v)) return false;
        t.period = v;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    SimulationConfig cfg;
    TaskSet tasks;
    ResourceGraph resources;
    WorkloadOptions gen;
    bool generate = false;
    bool csv_report = false;
    bool feed_enabled = false;
    std::string snapshot_path;
    std::vector<std::string> requests;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg.rfind("--policy=", 0) == 0) {
            auto kind = parse_policy(arg.substr(sizeof("--policy=") - 1));
            if (!kind) {
                std::cerr << "Unknown policy: " << arg << "\n";
                return 1;
            }
            cfg.policy = *kind;
            continue;
        }
        if (arg.rfind("--quantum=", 0) == 0) {
            if (!parse_tick(arg.substr(sizeof("--quantum=") - 1), cfg.quantum)) {
                std::cerr << "Bad quantum: " << arg << "\n";
                return 1;
            }
            continue;
        }
        if (arg == "--preemptive-priority") {
            cfg.priority_preemptive = true;
            continue;
        }
        if (arg.rfind("--cores=", 0) == 0) {
            cfg.cores = parse_unsigned(arg.substr(sizeof("--cores=") - 1), cfg.cores);
            continue;
        }
        if (arg.rfind("--task=", 0) == 0) {
            Task t;
            if (!parse_task(arg.substr(sizeof("--task=") - 1), t)) {
                std::cerr << "Bad task spec: " << arg << "\n";
                return 1;
            }
            tasks.push_back(t);
            continue;
        }
        if (arg.rfind("--resource=", 0) == 0) {
            Tick id = 0;
            if (!parse_tick(arg.substr(sizeof("--resource=") - 1), id) || id < 0
                || !resources.add_resource(static_cast<ResourceId>(id))) {
                std::cerr << "Bad or duplicate resource: " << arg << "\n";
                return 1;
            }
            continue;
        }
        if (arg.rfind("--request=", 0) == 0) {
            requests.push_back(arg.substr(sizeof("--request=") - 1));
            continue;
        }
        if (arg.rfind("--generate=", 0) == 0) {
            generate = true;
            gen.count = parse_unsigned(arg.substr(sizeof("--generate=") - 1), 8);
            continue;
        }
        if (arg.rfind("--seed=", 0) == 0) {
            gen.seed = parse_unsigned(arg.substr(sizeof("--seed=") - 1), gen.seed);
            continue;
        }
        if (arg.rfind("--window=", 0) == 0) {
            cfg.adaptive.decision_window = parse_unsigned(arg.substr(sizeof("--window=") - 1), 5);
            continue;
        }
        if (arg.rfind("--horizon=", 0) == 0) {
            if (!parse_tick(arg.substr(sizeof("--horizon=") - 1), cfg.periodic_horizon)) {
                std::cerr << "Bad horizon: " << arg << "\n";
                return 1;
            }
            continue;
        }
        if (arg.rfind("--max-ticks=", 0) == 0) {
            if (!parse_tick(arg.substr(sizeof("--max-ticks=") - 1), cfg.max_ticks)) {
                std::cerr << "Bad max ticks: " << arg << "\n";
                return 1;
            }
            continue;
        }
        if (arg.rfind("--snapshot=", 0) == 0) {
            snapshot_path = arg.substr(sizeof("--snapshot=") - 1);
            continue;
        }
        if (arg == "--csv-report") {
            csv_report = true;
            continue;
        }
        if (arg == "--feed") {
            feed_enabled = true;
            continue;
        }
        if (arg == "--verbose") {
            cfg.verbose = true;
            continue;
        }
        if (arg == "--debug") {
            cfg.verbose = true;
            cfg.debug_logging = true;
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (generate) {
        // Generated requests name R1..Rn, so --resource only sets the count here.
        gen.resources = static_cast<uint32_t>(resources.size());
        auto w = generate_workload(gen);
        tasks = std::move(w.tasks);
        resources = std::move(w.resources);
    }

    for (const auto& spec : requests) {
        auto parts = split(spec);
        Tick task_id = 0, res = 0;
        if (parts.size() < 2 || !parse_tick(parts[0], task_id) || !parse_tick(parts[1], res)) {
            std::cerr << "Bad request spec: " << spec << "\n";
            return 1;
        }
        ResourceRequest req;
        req.resource = static_cast<ResourceId>(res);
        Tick v = 0;
        if (parts.size() > 2 && parse_tick(parts[2], v)) req.acquire_at = v;
        if (parts.size() > 3 && parse_tick(parts[3], v)) req.release_at = v;
        bool attached = false;
        for (auto& t : tasks) {
            if (t.id == static_cast<TaskId>(task_id)) {
                t.resources.push_back(req);
                attached = true;
                break;
            }
        }
        if (!attached) {
            std::cerr << "Request names unknown task: " << spec << "\n";
            return 1;
        }
    }

    if (tasks.empty()) {
        std::cerr << "No tasks given (use --task=... or --generate=N)\n";
        print_usage(argv[0]);
        return 1;
    }

    reporting::set_csv(csv_report);

    Engine engine(cfg);
    std::shared_ptr<TickFeed> feed;
    std::thread consumer;
    if (feed_enabled) {
        feed = std::make_shared<TickFeed>(1024);
        engine.attach_feed(feed);
        consumer = std::thread([feed] {
            while (auto rec = feed->pop_blocking()) {
                std::cout << "[feed] t=" << rec->time << " " << policy_name(rec->policy);
                for (const auto& s : rec->slices) {
                    std::cout << " c" << s.core << "=" << (s.idle() ? std::string("idle") : display_name(*s.task, s.job));
                }
                std::cout << "\n";
            }
        });
    }

    auto result = engine.run(tasks, resources);
    if (feed) {
        feed->close();
        consumer.join();
    }

    std::cout << reporting::format_report(result);

    if (!snapshot_path.empty()) {
        auto blob = reporting::pack_snapshot(result);
        if (!blob.ok) {
            std::cerr << blob.message << "\n";
            return 1;
        }
        std::ofstream out(snapshot_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(blob.bytes.data()), static_cast<std::streamsize>(blob.bytes.size()));
        if (!out) {
            std::cerr << "failed to write " << snapshot_path << "\n";
            return 1;
        }
        std::cout << blob.message << " -> " << snapshot_path << "\n";
    }
    return result.ok() ? 0 : 2;
}
