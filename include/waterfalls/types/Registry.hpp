#pragma once
/**
 * @file Registry.hpp
 * @brief Process-wide, append-only list of timelines.
 */

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Block.hpp"
#include "Config.hpp"
#include "enums.hpp"
#include "../platform.hpp"

namespace waterfalls {

/**
 * @brief State behind one Timer: identity, in-flight block, completed blocks.
 *
 * Only the thread driving the owning Timer touches the in-flight fields,
 * so they carry no lock of their own. `blocks` is also read by report
 * generation from any thread and is guarded by the owning Registry::mtx.
 */
struct Timeline {
    std::string name;                 ///< Timer name (not unique)
    uint64_t    thread_id = 0;        ///< Native id of the constructing thread
    ProcessRole role = ProcessRole::Main;
    bool        inherited = false;    ///< Registered by the parent before fork()
    std::vector<Block> blocks;        ///< Completed blocks in stop() order (Registry::mtx)

    // In-flight block
    bool running = false;
    int64_t start_time = 0;
    int64_t start_thread_time = 0;
    std::optional<std::string> text;  ///< Pending label for the next block
};

/**
 * @brief Ordered collection of every Timeline created in this process.
 *
 * Appends are serialized by `mtx`; the order of appends from different
 * threads is whatever order they acquire the lock in. Entries are never
 * removed except by reset().
 */
struct Registry {
    std::mutex mtx;  ///< Protects timelines and every Timeline::blocks
    std::vector<std::shared_ptr<Timeline>> timelines;

    /**
     * @brief Create and register a timeline for the calling thread.
     * @param name Timer name
     * @param text Label for the first block
     */
    inline std::shared_ptr<Timeline> add(std::string name, std::optional<std::string> text) {
        auto t = std::make_shared<Timeline>();
        t->name = std::move(name);
        t->text = std::move(text);
        t->thread_id = native_thread_id();
        t->role = current_process_role();

        std::lock_guard<std::mutex> lock(mtx);
        timelines.push_back(t);
        return t;
    }

    inline bool empty() {
        std::lock_guard<std::mutex> lock(mtx);
        return timelines.empty();
    }

    inline size_t size() {
        std::lock_guard<std::mutex> lock(mtx);
        return timelines.size();
    }

    /**
     * @brief Record a completed block of @p t.
     */
    inline void append_block(Timeline& t, Block b) {
        std::lock_guard<std::mutex> lock(mtx);
        t.blocks.push_back(std::move(b));
    }

    /**
     * @brief Copy of the completed blocks of @p t.
     */
    inline std::vector<Block> blocks_of(const Timeline& t) {
        std::lock_guard<std::mutex> lock(mtx);
        return t.blocks;
    }

    /**
     * @brief True when this is a forked child that has neither created a
     * timeline nor completed a block since the fork.
     */
    inline bool idle_since_fork() {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& t : timelines) {
            if (!t->inherited || !t->blocks.empty()) return false;
        }
        return !timelines.empty();
    }

    /**
     * @brief Drop every timeline. Timers already handed out keep working
     * but no longer contribute to reports.
     */
    inline void reset() {
        std::lock_guard<std::mutex> lock(mtx);
        timelines.clear();
    }

    /**
     * @brief Child side of fork(): forget blocks the parent completed.
     *
     * Inherited timelines stay registered so a block started before the
     * fork and stopped in the child is still reported, but under the
     * child's role. Caller holds `mtx`.
     */
    inline void adopt_after_fork() {
        for (auto& t : timelines) {
            t->blocks.clear();
            t->role = ProcessRole::Child;
            t->inherited = true;
        }
    }
};

/**
 * @brief Write the report of @p reg. Defined in namespaces/report.hpp.
 */
inline std::string save_report(Registry& reg, const std::optional<std::string>& directory, ProcessRole role);

inline Registry& registry();

namespace internal {

/**
 * @brief atexit() handler. A forked child that never timed anything of its
 * own leaves silently instead of warning about an empty report.
 */
inline void save_at_exit() {
    if (!get_config().auto_save_at_exit) return;

    Registry& reg = registry();
    const ProcessRole role = current_process_role();
    if (role == ProcessRole::Child && reg.idle_since_fork()) return;
    save_report(reg, std::nullopt, role);
}

#ifndef _WIN32
inline void before_fork() { registry().mtx.lock(); }
inline void after_fork_parent() { registry().mtx.unlock(); }
inline void after_fork_child() {
    Registry& r = registry();
    r.adopt_after_fork();
    r.mtx.unlock();
}
#endif

/**
 * @brief Install the exit-time save and fork handlers, once per process.
 *
 * Forked children inherit the atexit() registration but it does not run
 * when the child leaves through _exit(), so children also save on every
 * Timer::stop().
 */
inline void ensure_process_hooks_registered() {
    static const bool registered = [] {
        std::atexit(save_at_exit);
#ifndef _WIN32
        pthread_atfork(before_fork, after_fork_parent, after_fork_child);
#endif
        return true;
    }();
    (void)registered;
}

} // namespace internal

/**
 * @brief Get the active registry.
 *
 * Returns the registry installed with set_external_state(), otherwise
 * the process-wide instance, created on first use. The process hooks are
 * installed after the built-in instance is constructed so the exit-time
 * save runs before it is destroyed.
 */
inline Registry& registry() {
    static Registry r;
    internal::ensure_process_hooks_registered();
    if (internal::g_external_registry) return *internal::g_external_registry;
    return r;
}

} // namespace waterfalls
