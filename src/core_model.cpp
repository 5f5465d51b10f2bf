#include "rtsim/core_model.hpp"
#include <algorithm>

namespace rtsim {

CoreStatus CoreStatusModel::observe(bool busy) {
    window_.push_back(busy);
    while (window_.size() > std::max<std::size_t>(cfg_.window, 1)) window_.pop_front();
    return current();
}

CoreStatus CoreStatusModel::current() const {
    CoreStatus s;
    s.busy = !window_.empty() && window_.back();
    s.utilization = utilization();
    s.frequency_ghz = frequency_ghz();
    s.temperature_c = temperature_c();
    s.power_w = power_w(cfg_, s.busy, s.frequency_ghz);
    return s;
}

double CoreStatusModel::utilization() const {
    if (cfg_.window == 0) return 0.0;
    auto busy = std::count(window_.begin(), window_.end(), true);
    return static_cast<double>(busy) / static_cast<double>(cfg_.window);
}

double CoreStatusModel::frequency_ghz() const {
    return cfg_.min_ghz + (cfg_.max_ghz - cfg_.min_ghz) * utilization();
}

double CoreStatusModel::temperature_c() const {
    // Normalised over the full window so a cold start stays near ambient.
    double weight = 1.0;
    double norm = 0.0;
    double heat = 0.0;
    std::size_t age = 0;
    for (auto it = window_.rbegin(); age < cfg_.window; ++age) {
        if (it != window_.rend()) {
            if (*it) heat += weight;
            ++it;
        }
        norm += weight;
        weight *= cfg_.decay;
    }
    double level = norm > 0.0 ? heat / norm : 0.0;
    return cfg_.ambient_c + (cfg_.max_temp_c - cfg_.ambient_c) * level;
}

} // namespace rtsim
