#pragma once
#include <cstddef>
#include <deque>

namespace rtsim {

struct CoreModelConfig {
    std::size_t window = 8;         // samples in the sliding utilization window
    double min_ghz = 0.8;
    double max_ghz = 2.4;
    double ambient_c = 20.0;
    double max_temp_c = 100.0;
    double decay = 0.7;             // per-sample weight falloff for temperature
    double idle_w = 2.0;
    double busy_base_w = 5.0;
    double busy_per_ghz_w = 10.0;
};

struct CoreStatus {
    bool busy = false;
    double utilization = 0.0;
    double frequency_ghz = 0.0;
    double temperature_c = 0.0;
    double power_w = 0.0;
};

// Load -> (frequency, temperature) response curve for one core. Everything
// is derived from the sliding window; idle samples pull both values back
// down as they displace busy ones.
class CoreStatusModel {
public:
    explicit CoreStatusModel(CoreModelConfig cfg = {}) : cfg_(cfg) {}

    CoreStatus observe(bool busy);
    CoreStatus current() const;

    double utilization() const;
    double frequency_ghz() const;
    double temperature_c() const;
    const CoreModelConfig& config() const { return cfg_; }

    static double power_w(const CoreModelConfig& cfg, bool busy, double ghz) {
        return busy ? cfg.busy_base_w + ghz * cfg.busy_per_ghz_w : cfg.idle_w;
    }

private:
    CoreModelConfig cfg_;
    std::deque<bool> window_;
};

} // namespace rtsim
