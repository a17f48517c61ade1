/**
 * @file test_timer.cpp
 * @brief Tests for Timer: start/stop state machine, block labels, scope
 * guard, function wrapper and multi-threaded registration.
 */

#include <waterfalls/waterfalls.hpp>
#include "test_framework.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using test_helpers::DiagnosticCapture;

BEFORE_EACH() {
    test_helpers::reset_state();
}

/**
 * @brief Two timers, four blocks each, labels set in every possible way.
 */
static void create_class_blocks(waterfalls::Timer& a, waterfalls::Timer& b) {
    a.start();
    a.stop();
    a.start("Block A");
    a.stop();
    a.start();
    a.stop("Block B");
    a.start();
    a.stop();

    b.start("Block C");
    b.stop();
    b.start("Block D");
    b.stop();
    b.start("Block E");
    b.stop();
    b.start();
    b.stop();
}

TEST(class_instances) {
    waterfalls::Timer a("Timer A");
    waterfalls::Timer b("Timer B");
    create_class_blocks(a, b);

    TEST_ASSERT_EQ(waterfalls::registry().size(), (size_t)2, "two timers registered");
    TEST_ASSERT_STR_EQ(a.name(), "Timer A", "name of a");
    TEST_ASSERT_STR_EQ(b.name(), "Timer B", "name of b");
    TEST_ASSERT_EQ(a.blocks().size(), (size_t)4, "blocks of a");
    TEST_ASSERT_EQ(b.blocks().size(), (size_t)4, "blocks of b");

    TEST_ASSERT(!a.blocks()[0].text, "first block of a has no text");
    TEST_ASSERT_STR_EQ(*a.blocks()[1].text, "Block A", "text from start()");
    TEST_ASSERT_STR_EQ(*a.blocks()[2].text, "Block B", "text from stop()");
    TEST_ASSERT(!a.blocks()[3].text, "label does not leak into the next block");
    TEST_ASSERT_STR_EQ(*b.blocks()[0].text, "Block C", "b block 0");
    TEST_ASSERT_STR_EQ(*b.blocks()[2].text, "Block E", "b block 2");
    TEST_ASSERT(!b.blocks()[3].text, "b block 3");

    for (const waterfalls::Timer* t : {&a, &b}) {
        for (const waterfalls::Block& block : t->blocks()) {
            TEST_ASSERT(block.start_time <= block.stop_time, "start_time <= stop_time");
            TEST_ASSERT(block.thread_duration >= 0, "thread_duration >= 0");
        }
    }
}

TEST(class_report_order) {
    waterfalls::Timer a("Timer A");
    waterfalls::Timer b("Timer B");
    create_class_blocks(a, b);

    std::vector<waterfalls::ReportRecord> report = waterfalls::generate_report();
    TEST_ASSERT_EQ(report.size(), (size_t)8, "one record per block");
    for (size_t i = 0; i < 4; ++i) {
        TEST_ASSERT_STR_EQ(report[i].name, "Timer A", "timer A first");
        TEST_ASSERT_STR_EQ(report[i + 4].name, "Timer B", "timer B second");
    }
    for (size_t i = 0; i + 1 < 4; ++i) {
        TEST_ASSERT(report[i].stop_time <= report[i + 1].start_time, "blocks of A in call order");
    }
    for (const auto& r : report) {
        TEST_ASSERT_EQ(r.thread_id, waterfalls::native_thread_id(), "all on the main thread");
    }
}

TEST(block_text_precedence) {
    waterfalls::Timer a("Timer A", std::string("Block A"));
    a.start();
    a.stop();

    waterfalls::Timer b("Timer B", std::string("Block B"));
    b.start("Block B2");
    b.stop();

    waterfalls::Timer c("Timer C", std::string("Block C"));
    c.start();
    c.stop("Block C3");

    waterfalls::Timer d("Timer D", std::string("Block D"));
    d.start("Block D2");
    d.stop("Block D3");

    waterfalls::Timer e("Timer E");
    e.start();
    e.stop("Block E3");

    auto report = waterfalls::generate_report();
    TEST_ASSERT_EQ(report.size(), (size_t)5, "five blocks");
    TEST_ASSERT_STR_EQ(*report[0].text, "Block A", "constructor text");
    TEST_ASSERT_STR_EQ(*report[1].text, "Block B2", "start text beats constructor");
    TEST_ASSERT_STR_EQ(*report[2].text, "Block C3", "stop text beats constructor");
    TEST_ASSERT_STR_EQ(*report[3].text, "Block D3", "stop text beats start");
    TEST_ASSERT_STR_EQ(*report[4].text, "Block E3", "stop text alone");
}

TEST(never_started) {
    DiagnosticCapture diag;
    waterfalls::Timer t("Timer A");

    TEST_ASSERT(waterfalls::generate_report().empty(), "no block, empty report");
    TEST_ASSERT(!t.running(), "idle");
    TEST_ASSERT_EQ(diag.warnings(), (size_t)0, "creating a timer is not a warning");
}

TEST(prevent_double_start) {
    DiagnosticCapture diag;
    waterfalls::Timer t("Timer A");
    t.start();
    t.start();

    TEST_ASSERT_EQ(diag.count(waterfalls::DiagnosticKind::DoubleStart), (size_t)1, "one warning");
    TEST_ASSERT(waterfalls::generate_report().empty(), "no block yet");
    TEST_ASSERT(t.running(), "still running");

    t.stop();
    TEST_ASSERT_EQ(waterfalls::generate_report().size(), (size_t)1, "one valid block");
    TEST_ASSERT_EQ(diag.warnings(), (size_t)1, "stop after double start is fine");
}

TEST(double_start_keeps_first_start_time) {
    DiagnosticCapture diag;
    waterfalls::Timer t("Timer A");
    t.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    t.start("ignored");
    t.stop();

    TEST_ASSERT_EQ(t.blocks().size(), (size_t)1, "one block");
    TEST_ASSERT(t.blocks()[0].stop_time - t.blocks()[0].start_time >= 5000000,
                "rejected start() does not move the start time");
    TEST_ASSERT(!t.blocks()[0].text, "rejected start() does not set the label");
}

TEST(prevent_stop_without_start) {
    DiagnosticCapture diag;
    waterfalls::Timer t("Timer A");
    t.stop();

    TEST_ASSERT_EQ(diag.count(waterfalls::DiagnosticKind::StopWithoutStart), (size_t)1, "one warning");
    TEST_ASSERT(waterfalls::generate_report().empty(), "no block");

    t.start();
    t.stop();
    TEST_ASSERT_EQ(waterfalls::generate_report().size(), (size_t)1, "one valid block");
    TEST_ASSERT_EQ(diag.warnings(), (size_t)1, "no further warnings");
}

TEST(warning_printed_without_handler) {
    test_helpers::TempDir dir;
    std::string log_path = dir.file("warnings.log");
    waterfalls::config.out = std::fopen(log_path.c_str(), "w");
    TEST_ASSERT(waterfalls::config.out != nullptr, "log file opened");

    waterfalls::Timer t("Timer A");
    t.stop();
    std::fclose(waterfalls::config.out);
    waterfalls::config.out = stderr;

    std::string content = test_helpers::read_file(log_path);
    TEST_ASSERT(content.find("waterfalls: Warning:") != std::string::npos, "warning prefix");
    TEST_ASSERT(content.find("Timer A") != std::string::npos, "names the timer");
}

TEST(scope_guard) {
    {
        waterfalls::Timer t("Timer A");
        auto guard = t.scope();
        TEST_ASSERT(t.running(), "running inside the scope");
    }
    {
        waterfalls::Timer t("Timer A", std::string("Block A"));
        auto guard = t.scope();
    }
    {
        waterfalls::Timer t("Timer B");
        auto guard = t.scope("Block B");
    }

    auto report = waterfalls::generate_report();
    TEST_ASSERT_EQ(report.size(), (size_t)3, "one block per scope");
    TEST_ASSERT(!report[0].text, "no text");
    TEST_ASSERT_STR_EQ(*report[1].text, "Block A", "constructor text");
    TEST_ASSERT_STR_EQ(*report[2].text, "Block B", "scope text");
}

TEST(scope_guard_closes_on_exception) {
    waterfalls::Timer t("Timer A");
    try {
        auto guard = t.scope();
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    TEST_ASSERT(!t.running(), "stopped by unwinding");
    TEST_ASSERT_EQ(t.blocks().size(), (size_t)1, "block recorded");
}

TEST(scoped_timer_macros) {
    {
        WF_TIMER("Macro timer");
    }
    {
        WF_TIMER_TEXT("Macro timer", "labelled");
    }
    {
        WF_FUNCTION_TIMER();
    }

    auto report = waterfalls::generate_report();
    TEST_ASSERT_EQ(report.size(), (size_t)3, "three blocks");
    TEST_ASSERT_STR_EQ(report[0].name, "Macro timer", "WF_TIMER name");
    TEST_ASSERT_STR_EQ(*report[1].text, "labelled", "WF_TIMER_TEXT label");
    TEST_ASSERT_STR_EQ(report[2].name, "test_scoped_timer_macros", "WF_FUNCTION_TIMER name");
}

static int add(int a, int b) {
    return a + b;
}

TEST(wrapped_function) {
    waterfalls::Timer t("Timer A", std::string("first call"));
    auto timed_add = t.wrap(add);

    TEST_ASSERT_EQ(timed_add(2, 3), 5, "return value forwarded");
    TEST_ASSERT_EQ(timed_add(4, 4), 8, "second call");

    TEST_ASSERT_EQ(t.blocks().size(), (size_t)2, "one block per call");
    TEST_ASSERT_STR_EQ(*t.blocks()[0].text, "first call", "constructor text on the first block");
    TEST_ASSERT(!t.blocks()[1].text, "later calls have no text");
    TEST_ASSERT_EQ(waterfalls::registry().size(), (size_t)1, "wrapping does not register a new timer");
}

TEST(wrapped_void_lambda_throwing) {
    waterfalls::Timer t("Timer A");
    auto timed = t.wrap([](bool fail) {
        if (fail) throw std::runtime_error("fail");
    });

    timed(false);
    try {
        timed(true);
    } catch (const std::runtime_error&) {
    }
    TEST_ASSERT_EQ(t.blocks().size(), (size_t)2, "block recorded even when the call throws");
    TEST_ASSERT(!t.running(), "idle after the throw");
}

TEST(nested_timers) {
    waterfalls::Timer outer("Decorator timer");
    auto work = outer.wrap([](int i) {
        waterfalls::Timer context("Context timer");
        auto guard = context.scope();
        waterfalls::Timer inner("Class timer");
        inner.start(std::to_string(i));
        inner.stop();
    });
    work(0);
    work(1);

    auto report = waterfalls::generate_report();
    // Registration order: Decorator, Context(0), Class(0), Context(1), Class(1)
    TEST_ASSERT_EQ(report.size(), (size_t)6, "six blocks");
    TEST_ASSERT_STR_EQ(report[0].name, "Decorator timer", "outer registered first");
    TEST_ASSERT_STR_EQ(report[2].name, "Context timer", "context");
    TEST_ASSERT_STR_EQ(report[3].name, "Class timer", "class");
    TEST_ASSERT_STR_EQ(*report[3].text, "0", "class text");

    const auto& o = report[0];
    const auto& c = report[3];
    TEST_ASSERT(o.start_time <= c.start_time && c.stop_time <= o.stop_time, "inner within outer");
}

TEST(timer_outlives_handle) {
    {
        waterfalls::Timer t("Short lived");
        t.start();
        t.stop();
    }
    TEST_ASSERT_EQ(waterfalls::generate_report().size(), (size_t)1, "block kept after the handle is gone");
}

TEST(describe) {
    waterfalls::Timer a("Timer A");
    TEST_ASSERT_STR_EQ(a.describe(), "Timer (name='Timer A', text=None)", "no text");

    waterfalls::Timer b("Timer B", std::string("Block A"));
    TEST_ASSERT_STR_EQ(b.describe(), "Timer (name='Timer B', text='Block A')", "constructor text");
    b.start("Block B");
    TEST_ASSERT_STR_EQ(b.describe(), "Timer (name='Timer B', text='Block B')", "start text");
    b.stop();
    TEST_ASSERT_STR_EQ(b.describe(), "Timer (name='Timer B', text=None)", "cleared by stop");
}

TEST(thread_cpu_duration_counts_work) {
    waterfalls::Timer busy("Busy");
    busy.start();
    volatile uint64_t x = 0;
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(20);
    while (std::chrono::steady_clock::now() < until) {
        x = x + 1;
    }
    busy.stop();

    waterfalls::Timer idle("Idle");
    idle.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    idle.stop();

    const waterfalls::Block b = busy.blocks()[0];
    const waterfalls::Block i = idle.blocks()[0];
    TEST_ASSERT(b.thread_duration > 0, "busy loop consumes CPU");
    TEST_ASSERT(b.thread_duration <= (b.stop_time - b.start_time) + 1000000, "cpu time bounded by wall time");
    TEST_ASSERT(i.thread_duration < b.thread_duration, "sleeping consumes less CPU than spinning");
}

TEST(threaded_timing) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([i]() {
            waterfalls::Timer t("Timer A", std::to_string(i));
            auto guard = t.scope();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        });
    }
    for (auto& t : threads) t.join();

    auto report = waterfalls::generate_report();
    TEST_ASSERT_EQ(report.size(), (size_t)2, "one block per thread");
    TEST_ASSERT_STR_EQ(report[0].name, "Timer A", "name 0");
    TEST_ASSERT_STR_EQ(report[1].name, "Timer A", "name 1");
    TEST_ASSERT_NE(report[0].thread_id, report[1].thread_id, "distinct thread ids");
    TEST_ASSERT_NE(report[0].thread_id, waterfalls::native_thread_id(), "not the main thread");

    std::vector<std::string> texts = {*report[0].text, *report[1].text};
    std::sort(texts.begin(), texts.end());
    TEST_ASSERT_STR_EQ(texts[0], "0", "text of thread 0");
    TEST_ASSERT_STR_EQ(texts[1], "1", "text of thread 1");
}

TEST(concurrent_registration) {
    const int num_threads = 8;
    const int per_thread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                WF_TIMER("Worker");
            }
        });
    }
    for (auto& t : threads) t.join();

    TEST_ASSERT_EQ(waterfalls::registry().size(), (size_t)(num_threads * per_thread), "every timer registered");
    TEST_ASSERT_EQ(waterfalls::generate_report().size(), (size_t)(num_threads * per_thread), "every block reported");
}

TEST(report_while_recording) {
    const int iterations = 10000;
    std::atomic<bool> done{false};
    waterfalls::Timer t("Worker");

    std::thread worker([&]() {
        for (int i = 0; i < iterations; ++i) {
            t.start();
            t.stop();
        }
        done = true;
    });

    size_t last = 0;
    bool monotonic = true;
    bool ordered = true;
    while (!done) {
        auto report = waterfalls::generate_report();
        if (report.size() < last) monotonic = false;
        last = report.size();
        for (const auto& r : report) {
            if (r.start_time > r.stop_time) ordered = false;
        }
        if (t.blocks().size() < last) monotonic = false;
    }
    worker.join();

    TEST_ASSERT(monotonic, "reports only grow while the worker records");
    TEST_ASSERT(ordered, "every copied block is complete");
    TEST_ASSERT_EQ(waterfalls::generate_report().size(), (size_t)iterations, "every block reported");
}

TEST(thread_id_fixed_at_construction) {
    waterfalls::Timer t("Timer A");
    const uint64_t creator = t.thread_id();

    std::thread other([&t]() {
        t.start();
        t.stop();
    });
    other.join();

    auto report = waterfalls::generate_report();
    TEST_ASSERT_EQ(report.size(), (size_t)1, "one block");
    TEST_ASSERT_EQ(report[0].thread_id, creator, "thread id of the constructing thread");
}

TEST(injected_registry) {
    waterfalls::Registry private_registry;
    waterfalls::Timer t("Private", std::nullopt, private_registry);
    t.start();
    t.stop();

    TEST_ASSERT(waterfalls::registry().empty(), "default registry untouched");
    TEST_ASSERT_EQ(waterfalls::generate_report(private_registry).size(), (size_t)1, "recorded in the injected one");
}

TEST(main_process_role) {
    waterfalls::Timer t("Timer A");
    TEST_ASSERT(t.role() == waterfalls::ProcessRole::Main, "test process is the main process");
    TEST_ASSERT(waterfalls::current_process_role() == waterfalls::ProcessRole::Main, "current role");
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
