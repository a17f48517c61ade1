#pragma once
/**
 * @file viewer.hpp
 * @brief Offline side: load report files, merge, group, name, sort, scale.
 *
 * Pipeline:
 *   report_file_paths() -> load_records() -> group_records()
 *     -> format_group_names() -> sort_groups() -> resolve_time_unit()
 *
 * prepare_chart() runs the steps after loading in one call.
 */

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "../types/Block.hpp"
#include "../types/enums.hpp"
#include "report.hpp"
#include "time_units.hpp"

namespace waterfalls {

/**
 * @brief One chart row: a display label and its records in merge order.
 */
struct TimerGroup {
    std::string label;
    std::vector<ReportRecord> records;
};

/**
 * @brief Records grouped by timer name plus the global time span.
 */
struct Grouping {
    std::vector<TimerGroup> groups;  ///< One per distinct name, first-seen order
    int64_t time_total = 0;          ///< max(stop_time) - time_min
    int64_t time_min = 0;            ///< min(start_time)
};

/**
 * @brief Everything a Renderer needs.
 */
struct Chart {
    std::vector<TimerGroup> groups;  ///< Named, split and sorted rows
    TimeUnit unit = TimeUnit::Nanoseconds;
    int64_t time_total = 0;
    int64_t time_min = 0;
};

namespace viewer {

/**
 * @brief Print an error and terminate the process with status 1.
 */
[[noreturn]] inline void fatal(const std::string& message) {
    std::fflush(stdout);
    std::fprintf(stderr, "waterfalls: Error: %s\n", message.c_str());
    std::fflush(stderr);
    std::exit(1);
}

/**
 * @brief True for `waterfalls.json` and `waterfalls.<digits>.json`.
 */
inline bool is_report_file_name(const std::string& file_name) {
    const std::string prefix = WATERFALLS_REPORT_BASENAME ".";
    const std::string suffix = "json";
    if (file_name.compare(0, prefix.size(), prefix) != 0) return false;

    std::string rest = file_name.substr(prefix.size());
    if (rest == suffix) return true;

    size_t dot = rest.find('.');
    if (dot == std::string::npos || dot == 0) return false;
    if (rest.substr(dot + 1) != suffix) return false;
    for (size_t i = 0; i < dot; ++i) {
        if (rest[i] < '0' || rest[i] > '9') return false;
    }
    return true;
}

/**
 * @brief Report files in @p directory, sorted by file name.
 *
 * Terminates the process when the directory does not exist.
 */
inline std::vector<std::filesystem::path> report_file_paths(const std::filesystem::path& directory) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        fatal("Directory '" + directory.string() + "' does not exist.");
    }

    std::vector<fs::path> paths;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && is_report_file_name(it->path().filename().string())) {
            paths.push_back(it->path());
        }
    }
    if (ec) {
        fatal("Cannot list directory '" + directory.string() + "': " + ec.message());
    }

    std::sort(paths.begin(), paths.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return paths;
}

/**
 * @brief Parse one report file.
 *
 * Terminates the process when the file cannot be read or is not a JSON
 * array of records.
 */
inline std::vector<ReportRecord> load_report_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        fatal("Cannot open report file '" + path.string() + "'.");
    }
    std::stringstream buf;
    buf << in.rdbuf();

    try {
        nlohmann::json j = nlohmann::json::parse(buf.str());
        if (!j.is_array()) {
            fatal("Report file '" + path.string() + "' is not a JSON array.");
        }
        return j.get<std::vector<ReportRecord>>();
    } catch (const nlohmann::json::exception& e) {
        fatal("Malformed report file '" + path.string() + "': " + e.what());
    }
}

/**
 * @brief Concatenate the records of all @p paths in the given order.
 *
 * Terminates the process when the merge holds no record at all.
 */
inline std::vector<ReportRecord> load_records(const std::vector<std::filesystem::path>& paths) {
    std::vector<ReportRecord> records;
    for (const auto& p : paths) {
        std::vector<ReportRecord> part = load_report_file(p);
        records.insert(records.end(), std::make_move_iterator(part.begin()),
                       std::make_move_iterator(part.end()));
    }
    if (records.empty()) {
        fatal("No timing blocks found in the report files.");
    }
    return records;
}

/**
 * @brief Whether any two blocks intersect.
 *
 * @p records must be sorted by start_time. Only adjacent pairs are
 * compared; blocks that merely touch do not overlap.
 */
inline bool detect_overlap(const std::vector<ReportRecord>& records) {
    for (size_t i = 1; i < records.size(); ++i) {
        if (records[i].start_time < records[i - 1].stop_time) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Group records by name and compute the global time span.
 */
inline Grouping group_records(const std::vector<ReportRecord>& records) {
    Grouping g;
    if (records.empty()) return g;

    int64_t time_min = records.front().start_time;
    int64_t time_max = records.front().stop_time;

    for (const ReportRecord& r : records) {
        time_min = std::min(time_min, r.start_time);
        time_max = std::max(time_max, r.stop_time);

        auto it = std::find_if(g.groups.begin(), g.groups.end(),
                               [&](const TimerGroup& tg) { return tg.label == r.name; });
        if (it == g.groups.end()) {
            g.groups.push_back(TimerGroup{r.name, {r}});
        } else {
            it->records.push_back(r);
        }
    }

    g.time_min = time_min;
    g.time_total = time_max - time_min;
    return g;
}

inline std::string thread_label(const std::string& name, uint64_t thread_id) {
    return name + "\nthread: " + std::to_string(thread_id);
}

/**
 * @brief Final row labels.
 *
 * A name used from more than one thread is always split into one row per
 * thread id, labeled "<name>\nthread: <id>". A single-thread name keeps
 * its bare label unless @p show_thread_id is set.
 */
inline std::vector<TimerGroup> format_group_names(const std::vector<TimerGroup>& groups, bool show_thread_id) {
    std::vector<TimerGroup> formatted;

    for (const TimerGroup& g : groups) {
        std::vector<uint64_t> thread_ids;
        for (const ReportRecord& r : g.records) {
            if (std::find(thread_ids.begin(), thread_ids.end(), r.thread_id) == thread_ids.end()) {
                thread_ids.push_back(r.thread_id);
            }
        }

        if (thread_ids.size() <= 1) {
            TimerGroup out = g;
            if (show_thread_id && !thread_ids.empty()) {
                out.label = thread_label(g.label, thread_ids.front());
            }
            formatted.push_back(std::move(out));
            continue;
        }

        for (uint64_t tid : thread_ids) {
            TimerGroup out;
            out.label = thread_label(g.label, tid);
            for (const ReportRecord& r : g.records) {
                if (r.thread_id == tid) out.records.push_back(r);
            }
            formatted.push_back(std::move(out));
        }
    }
    return formatted;
}

/**
 * @brief Row order: by the first record's start_time, or by
 * (thread_id, start_time) of the first record when @p show_thread_id.
 */
inline std::vector<TimerGroup> sort_groups(std::vector<TimerGroup> groups, bool show_thread_id) {
    auto first = [](const TimerGroup& g) -> const ReportRecord& { return g.records.front(); };

    std::stable_sort(groups.begin(), groups.end(), [&](const TimerGroup& a, const TimerGroup& b) {
        if (a.records.empty() || b.records.empty()) return !a.records.empty() && b.records.empty();
        if (show_thread_id && first(a).thread_id != first(b).thread_id) {
            return first(a).thread_id < first(b).thread_id;
        }
        return first(a).start_time < first(b).start_time;
    });
    return groups;
}

/**
 * @brief Chart unit for a span of @p time_total ns; @p user_unit wins.
 */
inline TimeUnit resolve_time_unit(int64_t time_total, std::optional<TimeUnit> user_unit = std::nullopt) {
    return time_units::resolve(time_total, user_unit);
}

/**
 * @brief Group, name, sort and scale merged records.
 */
inline Chart prepare_chart(const std::vector<ReportRecord>& records, bool show_thread_id,
                           std::optional<TimeUnit> user_unit = std::nullopt) {
    Grouping g = group_records(records);

    Chart chart;
    chart.groups = sort_groups(format_group_names(g.groups, show_thread_id), show_thread_id);
    chart.time_min = g.time_min;
    chart.time_total = g.time_total;
    chart.unit = resolve_time_unit(g.time_total, user_unit);
    return chart;
}

} // namespace viewer
} // namespace waterfalls
