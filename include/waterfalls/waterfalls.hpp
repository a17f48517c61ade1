#pragma once
/**
 * @file waterfalls.hpp
 * @brief Header-only timing of named code blocks with waterfall reports.
 *
 * Features:
 *  - waterfalls::Timer: start()/stop() blocks with wall-clock and thread CPU time.
 *  - Scope guard (Timer::scope(), WF_TIMER()) and function wrapper (Timer::wrap()).
 *  - One JSON report per process, saved automatically at exit; forked
 *    children save their own PID-qualified report on every stop().
 *  - Viewer: merges the reports of a directory, groups rows by timer name
 *    (split per thread when a name is used from several threads), sorts
 *    them and draws a waterfall chart as text or SVG.
 *
 * Report directory precedence:
 *   save_report(dir) argument > config.output_dir > $WATERFALLS_DIRECTORY > cwd
 *
 * Example:
 * @code
 * #include <waterfalls/waterfalls.hpp>
 *
 * void work() {
 *     WF_FUNCTION_TIMER();
 *     ...
 * }
 *
 * int main() {
 *     waterfalls::Timer t("Setup", "reading input");
 *     t.start();
 *     setup();
 *     t.stop();
 *     work();
 * }   // waterfalls.json written at exit
 * @endcode
 */

// Version information
#define WATERFALLS_VERSION "0.2.1"
#define WATERFALLS_VERSION_MAJOR 0
#define WATERFALLS_VERSION_MINOR 2
#define WATERFALLS_VERSION_PATCH 1

#include "types/enums.hpp"
#include "platform.hpp"
#include "namespaces/ini_parser.hpp"
#include "namespaces/time_units.hpp"
#include "types/Diagnostic.hpp"
#include "types/Config.hpp"
#include "namespaces/diagnostics.hpp"
#include "types/Block.hpp"
#include "types/Registry.hpp"
#include "namespaces/report.hpp"
#include "types/Timer.hpp"
#include "namespaces/viewer.hpp"
#include "types/Renderer.hpp"
#include "types/Viewer.hpp"

#define WF_CONCAT_INNER(a, b) a##b
#define WF_CONCAT(a, b) WF_CONCAT_INNER(a, b)

/**
 * @def WF_TIMER(name)
 * @brief Time the rest of the enclosing scope under @p name.
 *
 * Example:
 * @code
 * for (auto& file : files) {
 *     WF_TIMER("Load file");
 *     load(file);
 * }
 * @endcode
 */
#define WF_TIMER(name) ::waterfalls::ScopedTimer WF_CONCAT(_wf_timer_obj_, __LINE__)(name)

/**
 * @def WF_TIMER_TEXT(name, text)
 * @brief Like WF_TIMER() with a block label.
 */
#define WF_TIMER_TEXT(name, text) ::waterfalls::ScopedTimer WF_CONCAT(_wf_timer_obj_, __LINE__)(name, text)

/**
 * @def WF_FUNCTION_TIMER()
 * @brief Time the enclosing function, named after it.
 */
#define WF_FUNCTION_TIMER() ::waterfalls::ScopedTimer WF_CONCAT(_wf_timer_obj_, __LINE__)(__func__)
