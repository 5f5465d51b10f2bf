/**
 * @file core_model_test.cpp
 * @brief Frequency, temperature and power response of the core status model.
 */

#include "rtsim/core_model.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

using namespace rtsim;

static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) < eps; }

static void test_cold_core() {
    std::printf("  test_cold_core...\n");
    CoreStatusModel core;
    auto s = core.current();
    CHECK(!s.busy);
    CHECK(near(s.utilization, 0.0));
    CHECK(near(s.frequency_ghz, 0.8));
    CHECK(near(s.temperature_c, 20.0));
    CHECK(near(s.power_w, 2.0));
    std::printf("    cold core verified ✓\n");
}

static void test_ramp_up_and_down() {
    std::printf("  test_ramp_up_and_down...\n");
    CoreStatusModel core;
    auto first = core.observe(true);
    CHECK(first.busy);
    CHECK(near(first.utilization, 0.125));
    CHECK(near(first.frequency_ghz, 1.0));
    CHECK(near(first.power_w, 15.0));
    CHECK(first.temperature_c > 20.0 && first.temperature_c < 60.0);

    double last_temp = first.temperature_c;
    for (int i = 0; i < 7; ++i) {
        auto s = core.observe(true);
        CHECK(s.temperature_c > last_temp);
        last_temp = s.temperature_c;
    }
    CHECK(near(core.utilization(), 1.0));
    CHECK(near(core.frequency_ghz(), 2.4));
    CHECK(near(core.temperature_c(), 100.0));

    // Older samples fall out of the window; a run of idles cools it fully.
    auto cooling = core.observe(false);
    CHECK(!cooling.busy);
    CHECK(near(cooling.power_w, 2.0));
    CHECK(cooling.temperature_c < 100.0);
    for (int i = 0; i < 7; ++i) core.observe(false);
    CHECK(near(core.utilization(), 0.0));
    CHECK(near(core.temperature_c(), 20.0));
    std::printf("    ramp verified ✓\n");
}

static void test_recent_load_runs_hotter() {
    std::printf("  test_recent_load_runs_hotter...\n");
    CoreStatusModel recent;
    CoreStatusModel old;
    for (int i = 0; i < 4; ++i) old.observe(true);
    for (int i = 0; i < 4; ++i) old.observe(false);
    for (int i = 0; i < 4; ++i) recent.observe(false);
    for (int i = 0; i < 4; ++i) recent.observe(true);
    CHECK(near(recent.utilization(), old.utilization()));
    CHECK(recent.temperature_c() > old.temperature_c());
    std::printf("    decay weighting verified ✓\n");
}

static void test_power_curve() {
    std::printf("  test_power_curve...\n");
    CoreModelConfig cfg;
    CHECK(near(CoreStatusModel::power_w(cfg, false, 2.4), cfg.idle_w));
    CHECK(near(CoreStatusModel::power_w(cfg, true, 2.0), 25.0));
    cfg.window = 2;
    CoreStatusModel small(cfg);
    small.observe(true);
    small.observe(true);
    small.observe(false);
    CHECK(near(small.utilization(), 0.5));
    std::printf("    power curve verified ✓\n");
}

int main() {
    std::printf("core_model_test\n");
    test_cold_core();
    test_ramp_up_and_down();
    test_recent_load_runs_hotter();
    test_power_curve();
    std::printf("all passed\n");
    return 0;
}
