#pragma once
/**
 * @file Viewer.hpp
 * @brief Aggregation tool: options, command-line parsing and the Viewer.
 */

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "Block.hpp"
#include "Config.hpp"
#include "Renderer.hpp"
#include "enums.hpp"
#include "../namespaces/diagnostics.hpp"
#include "../namespaces/time_units.hpp"
#include "../namespaces/viewer.hpp"

#define WATERFALLS_CONFIG_ENV "WATERFALLS_CONFIG"
#define WATERFALLS_IMAGE_NAME "waterfalls.svg"

namespace waterfalls {

struct ViewerOptions {
    std::string directory;            ///< Report directory (empty = current working directory)
    std::optional<TimeUnit> unit;     ///< Forced unit (nullopt = automatic)
    bool show_thread_id = false;      ///< Annotate every row with its thread id
    bool lines = false;               ///< Separator lines between rows
    bool image = false;               ///< Save waterfalls.svg instead of drawing to stdout
    bool colorize = false;            ///< ANSI colors in the terminal chart
    std::string config_file;          ///< --config FILE
    bool help = false;                ///< -h / --help was given

    /**
     * @brief Options preset from the [viewer] section of a Config.
     */
    static inline ViewerOptions from_config(const Config& cfg) {
        ViewerOptions o;
        o.unit = cfg.viewer_unit;
        o.show_thread_id = cfg.viewer_show_thread_id;
        o.lines = cfg.viewer_lines;
        o.image = cfg.viewer_image;
        o.colorize = cfg.viewer_colorize;
        return o;
    }
};

inline void print_usage(const char* prog_name, FILE* out = stdout) {
    std::fprintf(out, "Usage: %s [OPTIONS] [DIRECTORY]\n\n", prog_name);
    std::fprintf(out, "Draws a waterfall chart of the waterfalls*.json reports in DIRECTORY\n");
    std::fprintf(out, "(default: current working directory).\n\n");
    std::fprintf(out, "Options:\n");
    std::fprintf(out, "  -u, --unit CODE   Time unit: nsec, usec, msec, sec, min, hour (default: automatic)\n");
    std::fprintf(out, "  -t, --thread-id   Show thread id of every timer\n");
    std::fprintf(out, "  -l, --lines       Draw lines between rows\n");
    std::fprintf(out, "  -i, --image       Save the chart as " WATERFALLS_IMAGE_NAME " in DIRECTORY\n");
    std::fprintf(out, "  -c, --colorize    Color terminal output per thread\n");
    std::fprintf(out, "      --config FILE Load defaults from an INI file (also $" WATERFALLS_CONFIG_ENV ")\n");
    std::fprintf(out, "  -h, --help        Show this help message\n");
}

/**
 * @brief Parse viewer command-line arguments.
 *
 * Short flags can be combined (`-tli`); `-u` takes the rest of its token
 * or the next argument. The first positional argument is the directory.
 *
 * @param defaults Starting values, typically from ViewerOptions::from_config()
 * @throws std::invalid_argument on unknown flags, unknown unit codes,
 *         missing flag values or extra positional arguments
 */
inline ViewerOptions parse_arguments(int argc, const char* const* argv, ViewerOptions defaults = ViewerOptions()) {
    ViewerOptions o = std::move(defaults);
    bool have_directory = false;
    bool options_done = false;

    auto set_unit = [&](const std::string& value) {
        auto unit = time_units::parse(value);
        if (!unit) {
            throw std::invalid_argument("unknown time unit '" + value + "'");
        }
        o.unit = unit;
    };
    auto next_value = [&](int& i, const char* flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("option '") + flag + "' requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (options_done || arg[0] != '-' || arg[1] == '\0') {
            if (have_directory) {
                throw std::invalid_argument(std::string("unexpected argument '") + arg + "'");
            }
            o.directory = arg;
            have_directory = true;
            continue;
        }

        if (std::strcmp(arg, "--") == 0) { options_done = true; continue; }
        if (std::strcmp(arg, "--help") == 0) { o.help = true; continue; }
        if (std::strcmp(arg, "--thread-id") == 0) { o.show_thread_id = true; continue; }
        if (std::strcmp(arg, "--lines") == 0) { o.lines = true; continue; }
        if (std::strcmp(arg, "--image") == 0) { o.image = true; continue; }
        if (std::strcmp(arg, "--colorize") == 0) { o.colorize = true; continue; }
        if (std::strcmp(arg, "--unit") == 0) { set_unit(next_value(i, "--unit")); continue; }
        if (std::strncmp(arg, "--unit=", 7) == 0) { set_unit(arg + 7); continue; }
        if (std::strcmp(arg, "--config") == 0) { o.config_file = next_value(i, "--config"); continue; }
        if (std::strncmp(arg, "--config=", 9) == 0) { o.config_file = arg + 9; continue; }
        if (arg[1] == '-') {
            throw std::invalid_argument(std::string("unknown option '") + arg + "'");
        }

        // Combined short flags
        for (const char* c = arg + 1; *c; ++c) {
            switch (*c) {
                case 'h': o.help = true; break;
                case 't': o.show_thread_id = true; break;
                case 'l': o.lines = true; break;
                case 'i': o.image = true; break;
                case 'c': o.colorize = true; break;
                case 'u':
                    if (c[1] != '\0') {
                        set_unit(c + 1);
                    } else {
                        set_unit(next_value(i, "-u"));
                    }
                    c += std::strlen(c) - 1;
                    break;
                default:
                    throw std::invalid_argument(std::string("unknown option '-") + *c + "'");
            }
        }
    }
    return o;
}

/**
 * @brief Loads the reports of one directory and draws them.
 */
class Viewer {
public:
    explicit Viewer(ViewerOptions options = ViewerOptions()) : options_(std::move(options)) {
        if (options_.directory.empty()) {
            std::error_code ec;
            std::filesystem::path cwd = std::filesystem::current_path(ec);
            options_.directory = ec ? "." : cwd.string();
        }
    }

    inline const ViewerOptions& options() const { return options_; }

    /**
     * @brief Report files of the directory; terminates if it does not exist.
     */
    inline std::vector<std::filesystem::path> report_file_paths() const {
        return viewer::report_file_paths(options_.directory);
    }

    /**
     * @brief Merged records; terminates if there are none.
     */
    inline std::vector<ReportRecord> load_records() const {
        return viewer::load_records(report_file_paths());
    }

    inline Chart prepare() const {
        return viewer::prepare_chart(load_records(), options_.show_thread_id, options_.unit);
    }

    inline std::string image_path() const {
        return (std::filesystem::path(options_.directory) / WATERFALLS_IMAGE_NAME).string();
    }

    /**
     * @brief Load, aggregate and draw the reports.
     *
     * Draws to stdout, or writes waterfalls.svg into the report directory
     * when the image option is set.
     *
     * @return 0 on success, 1 when the chart could not be written
     */
    inline int visualize_report(FILE* out = stdout) const {
        Chart chart = prepare();
        RenderOptions ro;
        ro.lines = options_.lines;
        ro.colorize = options_.colorize;

        if (options_.image) {
            SvgRenderer renderer(image_path(), ro);
            if (!renderer.render(chart)) {
                emit(DiagnosticKind::ReportWriteFailed, Severity::Error,
                     "Failed to write image '" + renderer.path() + "'");
                return 1;
            }
            emit(DiagnosticKind::ReportSaved, Severity::Info, "Chart saved into file '" + renderer.path() + "'");
            return 0;
        }

        TextRenderer renderer(out, ro);
        return renderer.render(chart) ? 0 : 1;
    }

private:
    ViewerOptions options_;
};

} // namespace waterfalls
