#pragma once
/**
 * @file Config.hpp
 * @brief Process-wide settings for timers, report saving and the viewer.
 */

#include <cstdio>
#include <optional>
#include <string>

#include "Diagnostic.hpp"
#include "enums.hpp"
#include "../namespaces/ini_parser.hpp"
#include "../namespaces/time_units.hpp"

namespace waterfalls {

struct Registry;

/**
 * @brief Global configuration.
 *
 * All settings can be modified at runtime. Changes while other threads
 * are saving a report are not thread-safe.
 */
struct Config {
    FILE* out = stderr;               ///< Stream for printed diagnostics (default: stderr)
    bool print_info = true;           ///< Print informational events such as "report saved"
    DiagnosticHandler on_diagnostic;  ///< When set, receives every diagnostic instead of `out`

    // Report saving
    std::string output_dir;           ///< Process-level report directory override (empty = unset)
    bool auto_save_at_exit = true;    ///< Save the report from an atexit() handler

    // Viewer defaults, overridden by command-line flags
    std::optional<TimeUnit> viewer_unit;  ///< Forced chart unit (nullopt = automatic)
    bool viewer_show_thread_id = false;   ///< Annotate every row with its thread id
    bool viewer_lines = false;            ///< Draw separator lines between rows
    bool viewer_image = false;            ///< Write waterfalls.svg instead of drawing to the terminal
    bool viewer_colorize = false;         ///< ANSI colors in the terminal chart

    /**
     * @brief Load configuration from INI file.
     *
     * Supports sections: [report], [diagnostics], [viewer]. Unknown keys and
     * malformed lines are reported as ConfigWarning diagnostics and skipped.
     *
     * @param path Path to INI file (relative or absolute)
     * @return true on success, false if the file could not be opened
     *
     * Example INI format:
     * @code
     * [report]
     * directory = /tmp/waterfalls
     * auto_save = true
     *
     * [diagnostics]
     * print_info = false
     *
     * [viewer]
     * unit = msec
     * thread_id = yes
     * @endcode
     */
    inline bool load_from_file(const char* path);
};

inline Config config;

namespace internal {
inline Config*   g_external_config = nullptr;
inline Registry* g_external_registry = nullptr;
} // namespace internal

/**
 * @brief Substitute the Config and/or Registry used by default.
 *
 * Pass nullptr to go back to the built-in instance. Used to share one
 * registry between components, and by tests to run against a private one.
 *
 * @param cfg Config that must outlive all timing, or nullptr
 * @param reg Registry that must outlive all timing, or nullptr
 */
inline void set_external_state(Config* cfg, Registry* reg) {
    internal::g_external_config = cfg;
    internal::g_external_registry = reg;
}

/**
 * @brief Get the active config instance.
 */
inline Config& get_config() {
    return internal::g_external_config ? *internal::g_external_config : config;
}

inline bool Config::load_from_file(const char* path) {
    FILE* f = std::fopen(path, "r");
    if (!f) {
        emit(DiagnosticKind::ConfigWarning, Severity::Warning,
             std::string("Could not open config file: ") + path);
        return false;
    }

    std::string current_section;
    char line_buf[512];
    int line_num = 0;

    auto warn = [&](const std::string& what) {
        emit(DiagnosticKind::ConfigWarning, Severity::Warning,
             what + " in " + path + ":" + std::to_string(line_num));
    };

    while (std::fgets(line_buf, sizeof(line_buf), f)) {
        ++line_num;
        std::string line = ini_parser::trim(line_buf);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line[line.length()-1] == ']') {
            current_section = ini_parser::trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            warn("Invalid line (no '=')");
            continue;
        }

        std::string key = ini_parser::trim(line.substr(0, eq_pos));
        std::string value = ini_parser::strip_comment(line.substr(eq_pos + 1));

        bool ok = true;
        if (current_section == "report") {
            if (key == "directory") output_dir = ini_parser::unquote(value);
            else if (key == "auto_save") auto_save_at_exit = ini_parser::parse_bool(value, &ok);
            else warn("Unknown key '" + key + "'");
        }
        else if (current_section == "diagnostics") {
            if (key == "print_info") print_info = ini_parser::parse_bool(value, &ok);
            else warn("Unknown key '" + key + "'");
        }
        else if (current_section == "viewer") {
            if (key == "unit") {
                std::string u = ini_parser::unquote(value);
                if (u.empty() || ini_parser::to_lower(u) == "auto") {
                    viewer_unit.reset();
                } else if (auto parsed = time_units::parse(u)) {
                    viewer_unit = parsed;
                } else {
                    ok = false;
                }
            }
            else if (key == "thread_id") viewer_show_thread_id = ini_parser::parse_bool(value, &ok);
            else if (key == "lines") viewer_lines = ini_parser::parse_bool(value, &ok);
            else if (key == "image") viewer_image = ini_parser::parse_bool(value, &ok);
            else if (key == "colorize") viewer_colorize = ini_parser::parse_bool(value, &ok);
            else warn("Unknown key '" + key + "'");
        }
        else {
            warn("Key '" + key + "' outside of a known section");
        }

        if (!ok) {
            warn("Invalid value '" + value + "' for '" + key + "'");
        }
    }

    std::fclose(f);
    return true;
}

/**
 * @brief Load configuration from INI file into the active config.
 */
inline bool load_config(const char* path) {
    return get_config().load_from_file(path);
}

} // namespace waterfalls
