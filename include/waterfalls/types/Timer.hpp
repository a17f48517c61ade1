#pragma once
/**
 * @file Timer.hpp
 * @brief Named start/stop timer, its scope guard and function wrapper.
 */

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Block.hpp"
#include "Registry.hpp"
#include "enums.hpp"
#include "../namespaces/diagnostics.hpp"
#include "../namespaces/report.hpp"
#include "../platform.hpp"

namespace waterfalls {

/**
 * @brief Records timing blocks under one name.
 *
 * Idle -> start() -> Running -> stop() -> Idle, one Block per cycle.
 * Starting twice or stopping while idle only emits a warning.
 *
 * A Timer is a handle: copies share the same timeline, which is owned by
 * the registry and outlives the handle, so the blocks are still reported
 * after the Timer goes out of scope.
 *
 * @code
 * waterfalls::Timer t("Load config");
 * t.start();
 * load();
 * t.stop();
 *
 * {
 *     waterfalls::Timer scoped("Parse");
 *     auto guard = scoped.scope();
 *     parse();
 * }
 *
 * auto timed_solve = waterfalls::Timer("Solve").wrap(solve);
 * timed_solve(42);
 * @endcode
 */
class Timer {
public:
    /**
     * @brief Create a timer and register it.
     *
     * The thread id and process role are captured here and never change.
     *
     * @param name Timer name; several timers may share one
     * @param text Label of the first block
     * @param reg Registry to register into (default: registry())
     */
    explicit Timer(std::string name,
                   std::optional<std::string> text = std::nullopt,
                   Registry& reg = registry())
        : timeline_(reg.add(std::move(name), std::move(text))), registry_(&reg) {}

    /**
     * @brief Start a block.
     * @param text Overrides the pending label when set
     */
    inline void start(std::optional<std::string> text = std::nullopt) {
        Timeline& t = *timeline_;
        if (t.running) {
            emit(DiagnosticKind::DoubleStart, Severity::Warning,
                 "Timer '" + t.name + "' can't be started twice. Use stop() to stop it first.");
            return;
        }
        if (text) t.text = std::move(text);

        t.running = true;
        t.start_time = now_ns();
        t.start_thread_time = thread_cpu_ns();
    }

    /**
     * @brief Stop the running block and record it.
     *
     * The block label is @p text if set, else the label given to start(),
     * else the constructor's. The pending label is cleared afterwards.
     * In a child process the whole registry is saved immediately.
     *
     * @param text Final label of the block when set
     */
    inline void stop(std::optional<std::string> text = std::nullopt) {
        const int64_t stop_time = now_ns();
        const int64_t stop_thread_time = thread_cpu_ns();

        Timeline& t = *timeline_;
        if (!t.running) {
            emit(DiagnosticKind::StopWithoutStart, Severity::Warning,
                 "Timer '" + t.name + "' hasn't been started yet. Use start() to start it first.");
            return;
        }
        if (text) t.text = std::move(text);

        Block b;
        b.start_time = t.start_time;
        b.stop_time = std::max(stop_time, t.start_time);
        b.thread_duration = std::max<int64_t>(0, stop_thread_time - t.start_thread_time);
        b.text = std::move(t.text);
        registry_->append_block(t, std::move(b));

        t.text.reset();
        t.running = false;

        if (t.role == ProcessRole::Child) {
            save_report(*registry_, std::nullopt, ProcessRole::Child);
        }
    }

    inline bool running() const { return timeline_->running; }
    inline const std::string& name() const { return timeline_->name; }
    inline uint64_t thread_id() const { return timeline_->thread_id; }
    inline ProcessRole role() const { return timeline_->role; }

    /**
     * @brief Copy of the completed blocks, safe while reports are generated.
     */
    inline std::vector<Block> blocks() const { return registry_->blocks_of(*timeline_); }

    /**
     * @brief Label the next block will get unless start()/stop() override it.
     */
    inline const std::optional<std::string>& text() const { return timeline_->text; }

    /**
     * @brief Debug description: `Timer (name='<name>', text='<text>')`,
     * with `text=None` when there is no pending label.
     */
    inline std::string describe() const {
        std::string s = "Timer (name='" + timeline_->name + "', text=";
        s += timeline_->text ? "'" + *timeline_->text + "'" : std::string("None");
        s += ")";
        return s;
    }

    /**
     * @brief RAII guard: start() on construction, stop() on destruction.
     */
    struct Scope {
        Timer& timer;

        inline explicit Scope(Timer& t, std::optional<std::string> text = std::nullopt) : timer(t) {
            timer.start(std::move(text));
        }
        inline ~Scope() {
            timer.stop();
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
    };

    /**
     * @brief Guard timing the enclosing scope.
     */
    inline Scope scope(std::optional<std::string> text = std::nullopt) {
        return Scope(*this, std::move(text));
    }

    /**
     * @brief Wrap a callable so every call is one block of this timer.
     *
     * The returned callable shares this timer's timeline and forwards
     * arguments and the return value. The block is closed even when the
     * call throws.
     */
    template <class F>
    inline auto wrap(F f) const {
        Timer self = *this;
        return [self, f = std::move(f)](auto&&... args) mutable -> decltype(auto) {
            Scope guard(self);
            return f(std::forward<decltype(args)>(args)...);
        };
    }

private:
    std::shared_ptr<Timeline> timeline_;
    Registry* registry_;
};

/**
 * @brief A Timer that lives exactly as long as the enclosing scope.
 *
 * Use via the WF_TIMER() family of macros.
 */
struct ScopedTimer {
    Timer timer;
    Timer::Scope scope;

    inline explicit ScopedTimer(std::string name, std::optional<std::string> text = std::nullopt)
        : timer(std::move(name), std::move(text)), scope(timer) {}
};

} // namespace waterfalls
