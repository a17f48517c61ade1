/**
 * @file example_threads.cpp
 * @brief Several threads sharing timer names.
 *
 * Every worker creates its own "Worker" timer. The viewer splits that
 * name into one row per thread id; pass -t to annotate all rows.
 */

#include <waterfalls/waterfalls.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

static void worker(int id) {
    waterfalls::Timer t("Worker");
    for (int i = 0; i < 4; ++i) {
        auto guard = t.scope("task " + std::to_string(i));
        std::this_thread::sleep_for(std::chrono::milliseconds(5 + 3 * id));
    }
}

int main(int argc, char** argv) {
    if (argc > 1) {
        waterfalls::config.output_dir = argv[1];
    }

    WF_FUNCTION_TIMER();

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }
    return 0;
}
