#pragma once
#include "engine.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace rtsim {
namespace reporting {

// Global output mode for the format_* helpers.
void set_csv(bool value);
bool csv_enabled();

std::string format_timeline(const std::vector<ExecutionInterval>& timeline);
std::string format_metrics(const MetricsSnapshot& metrics);
std::string format_events(const std::vector<Event>& events);
std::string format_report(const RunResult& result);

// Line-oriented text form of a finished (or partial) run.
std::string serialize_snapshot(const RunResult& result);

struct SnapshotBlob {
    bool ok{false};
    std::string message;
    std::vector<uint8_t> bytes;
};

// zlib-compressed snapshot with an 8-byte little-endian length prefix.
SnapshotBlob pack_snapshot(const RunResult& result, int level = 6);

struct UnpackedSnapshot {
    bool ok{false};
    std::string message;
    std::string text;
};

UnpackedSnapshot unpack_snapshot(const std::vector<uint8_t>& blob);

} // namespace reporting
} // namespace rtsim
