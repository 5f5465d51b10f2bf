#include "rtsim/reporting.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <iomanip>
#include <sstream>

namespace rtsim {
namespace reporting {

static std::atomic<bool> g_csv{false};

void set_csv(bool value) {
    g_csv.store(value, std::memory_order_relaxed);
}

bool csv_enabled() {
    return g_csv.load(std::memory_order_relaxed);
}

namespace {

std::string interval_label(const ExecutionInterval& iv) {
    if (iv.idle()) return "idle";
    return display_name(*iv.task, iv.job);
}

template <typename T>
std::string opt(const std::optional<T>& v) {
    return v ? std::to_string(*v) : std::string("-");
}

std::string event_detail(const Event& e) {
    std::ostringstream oss;
    if (e.task) oss << " " << display_name(*e.task, e.job);
    if (e.core) oss << " core=" << *e.core;
    if (e.resource) oss << " R" << *e.resource;
    if (!e.cycle.empty()) {
        oss << " cycle=";
        for (std::size_t i = 0; i < e.cycle.size(); ++i) oss << (i ? "," : "") << e.cycle[i];
    }
    if (e.from_policy && e.to_policy) {
        oss << " " << policy_name(*e.from_policy) << "->" << policy_name(*e.to_policy);
    }
    return oss.str();
}

} // namespace

std::string format_timeline(const std::vector<ExecutionInterval>& timeline) {
    std::ostringstream oss;
    if (csv_enabled()) {
        oss << "core,start,end,task,job\n";
        for (const auto& iv : timeline) {
            oss << iv.core << "," << iv.start << "," << iv.end << ","
                << (iv.task ? std::to_string(*iv.task) : std::string()) << "," << iv.job << "\n";
        }
        return oss.str();
    }
    CoreId cores = 0;
    for (const auto& iv : timeline) cores = std::max<CoreId>(cores, iv.core + 1);
    for (CoreId c = 0; c < cores; ++c) {
        oss << "core " << c << ":";
        for (const auto& iv : timeline) {
            if (iv.core != c) continue;
            oss << " [" << iv.start << "-" << iv.end << ") " << interval_label(iv);
        }
        oss << "\n";
    }
    return oss.str();
}

std::string format_metrics(const MetricsSnapshot& m) {
    std::ostringstream oss;
    if (csv_enabled()) {
        oss << "task,job,arrival,burst,completion,waiting,turnaround,response,deadline,missed\n";
        for (const auto& t : m.tasks) {
            oss << t.task << "," << t.job << "," << t.arrival << "," << t.burst << ","
                << opt(t.completion) << "," << opt(t.waiting) << "," << opt(t.turnaround) << ","
                << opt(t.response) << "," << opt(t.deadline) << "," << (t.deadline_missed ? 1 : 0) << "\n";
        }
        oss << "summary,total_time,completed,utilization,throughput,avg_waiting,avg_turnaround,"
               "avg_response,missed,miss_ratio,energy_j,avg_temp_c,preemptions,context_switches,"
               "deadlocks,policy_switches\n";
        oss << "summary," << m.total_time << "," << m.completed << "," << m.utilization << ","
            << m.throughput << "," << m.avg_waiting << "," << m.avg_turnaround << "," << m.avg_response << ","
            << m.missed_deadlines << "," << m.miss_ratio << "," << m.energy_j << "," << m.avg_temperature_c << ","
            << m.preemptions << "," << m.context_switches << "," << m.deadlock_resolutions << ","
            << m.policy_switches << "\n";
        return oss.str();
    }

    oss << std::left << std::setw(10) << "task" << std::setw(8) << "arrive" << std::setw(7) << "burst"
        << std::setw(7) << "done" << std::setw(7) << "wait" << std::setw(7) << "turn"
        << std::setw(7) << "resp" << "deadline\n";
    for (const auto& t : m.tasks) {
        oss << std::setw(10) << t.name << std::setw(8) << t.arrival << std::setw(7) << t.burst
            << std::setw(7) << opt(t.completion) << std::setw(7) << opt(t.waiting)
            << std::setw(7) << opt(t.turnaround) << std::setw(7) << opt(t.response)
            << opt(t.deadline) << (t.deadline_missed ? " MISSED" : "") << "\n";
    }
    oss << std::fixed << std::setprecision(3);
    oss << "total time " << m.total_time << ", completed " << m.completed << "/" << m.tasks.size() << "\n";
    oss << "utilization " << m.utilization << ", throughput " << m.throughput << "\n";
    oss << "avg waiting " << m.avg_waiting << ", avg turnaround " << m.avg_turnaround
        << ", avg response " << m.avg_response << "\n";
    oss << "deadline misses " << m.missed_deadlines << " (" << m.miss_ratio << ")\n";
    oss << "preemptions " << m.preemptions << ", context switches " << m.context_switches
        << ", deadlocks resolved " << m.deadlock_resolutions << ", policy switches " << m.policy_switches << "\n";
    oss << "energy " << m.energy_j << " J, avg temperature " << m.avg_temperature_c << " C\n";
    for (const auto& c : m.cores) {
        oss << "  core " << c.core << ": busy " << c.busy << " idle " << c.idle
            << " util " << c.utilization << " energy " << c.energy_j << " J"
            << " peak " << c.peak_temperature_c << " C freq " << c.final_frequency_ghz << " GHz\n";
    }
    return oss.str();
}

std::string format_events(const std::vector<Event>& events) {
    std::ostringstream oss;
    if (csv_enabled()) oss << "time,event,task,job,core,resource\n";
    for (const auto& e : events) {
        if (csv_enabled()) {
            oss << e.time << "," << event_name(e.kind) << "," << opt(e.task) << "," << e.job << ","
                << opt(e.core) << "," << opt(e.resource) << "\n";
        } else {
            oss << "t=" << e.time << " " << event_name(e.kind) << event_detail(e) << "\n";
        }
    }
    return oss.str();
}

std::string format_report(const RunResult& result) {
    std::ostringstream oss;
    if (!result.ok()) {
        oss << "error: " << error_name(result.status.code) << ": " << result.status.message << "\n";
    }
    oss << format_timeline(result.timeline);
    oss << format_events(result.events);
    oss << format_metrics(result.metrics);
    return oss.str();
}

std::string serialize_snapshot(const RunResult& r) {
    std::ostringstream oss;
    oss << "rtsim-snapshot 1\n";
    oss << "status " << error_name(r.status.code) << "\n";
    oss << "finished " << (r.finished ? 1 : 0) << " stopped " << (r.stopped ? 1 : 0) << "\n";
    oss << "now " << r.state.now << " policy " << policy_name(r.state.active_policy) << "\n";
    for (const auto& j : r.jobs) {
        oss << "job " << j.spec.id << " " << j.index << " " << static_cast<int>(j.state) << " "
            << j.remaining << " " << j.waiting << " " << opt(j.completion) << " "
            << (j.deadline_missed ? 1 : 0) << " " << j.preemptions << "\n";
    }
    for (const auto& iv : r.timeline) {
        oss << "interval " << iv.core << " " << iv.start << " " << iv.end << " " << opt(iv.task)
            << " " << iv.job << "\n";
    }
    for (const auto& e : r.events) {
        oss << "event " << e.time << " " << event_name(e.kind) << event_detail(e) << "\n";
    }
    return oss.str();
}

SnapshotBlob pack_snapshot(const RunResult& result, int level) {
    SnapshotBlob blob;
    const std::string text = serialize_snapshot(result);
    uLongf dest_len = compressBound(static_cast<uLong>(text.size()));
    blob.bytes.resize(8 + dest_len);
    uint64_t raw = text.size();
    for (int i = 0; i < 8; ++i) blob.bytes[i] = static_cast<uint8_t>(raw >> (8 * i));

    int ret = compress2(blob.bytes.data() + 8, &dest_len,
                        reinterpret_cast<const Bytef*>(text.data()), static_cast<uLong>(text.size()),
                        std::clamp(level, 0, 9));
    if (ret != Z_OK) {
        blob.bytes.clear();
        blob.message = "snapshot: zlib error " + std::to_string(ret);
        return blob;
    }
    blob.bytes.resize(8 + dest_len);
    blob.ok = true;
    blob.message = "snapshot: compressed (" + std::to_string(text.size()) + " -> "
        + std::to_string(blob.bytes.size()) + ")";
    return blob;
}

UnpackedSnapshot unpack_snapshot(const std::vector<uint8_t>& blob) {
    UnpackedSnapshot out;
    if (blob.size() < 8) {
        out.message = "snapshot: truncated header";
        return out;
    }
    uint64_t raw = 0;
    for (int i = 0; i < 8; ++i) raw |= static_cast<uint64_t>(blob[i]) << (8 * i);
    // zlib cannot expand by more than ~1032x; anything larger is corrupt.
    if (raw > (blob.size() - 8) * 1032 + 64) {
        out.message = "snapshot: implausible length " + std::to_string(raw);
        return out;
    }
    out.text.resize(static_cast<std::size_t>(raw));
    uLongf dest_len = static_cast<uLongf>(raw);
    int ret = uncompress(reinterpret_cast<Bytef*>(&out.text[0]), &dest_len,
                         blob.data() + 8, static_cast<uLong>(blob.size() - 8));
    if (ret != Z_OK || dest_len != raw) {
        out.text.clear();
        out.message = "snapshot: zlib error " + std::to_string(ret);
        return out;
    }
    out.ok = true;
    out.message = "snapshot: decompressed (" + std::to_string(blob.size()) + " -> " + std::to_string(raw) + ")";
    return out;
}

} // namespace reporting
} // namespace rtsim
