/**
 * @file example_basic.cpp
 * @brief Basic example demonstrating the three ways to time code.
 *
 * Shows:
 * - Explicit start()/stop() pairs with block labels
 * - Scope guards via Timer::scope() and WF_TIMER()
 * - Wrapping a function so every call is timed
 * - Report saved automatically at exit
 *
 * Run it, then draw the chart with:
 *   waterfalls-viewer <directory>
 */

#include <waterfalls/waterfalls.hpp>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

/**
 * @brief Pretend to load a file.
 */
static void load(int i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10 + 5 * i));
}

/**
 * @brief CPU-bound work, shows up darker in the chart.
 */
static double crunch(int n) {
    double acc = 0.0;
    for (int i = 1; i < n; ++i) {
        acc += 1.0 / i;
    }
    return acc;
}

int main(int argc, char** argv) {
    if (argc > 1) {
        waterfalls::config.output_dir = argv[1];
    }

    waterfalls::Timer loading("Loading");
    for (int i = 0; i < 3; ++i) {
        loading.start("file " + std::to_string(i));
        load(i);
        loading.stop();
    }

    auto timed_crunch = waterfalls::Timer("Crunch").wrap(crunch);
    double result = timed_crunch(5000000);

    {
        WF_TIMER_TEXT("Report", "summary");
        std::printf("result = %f\n", result);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    waterfalls::Timer idle("Idle");
    {
        auto guard = idle.scope("waiting");
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    // waterfalls.json is written when main() returns
    return 0;
}
