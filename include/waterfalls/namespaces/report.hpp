#pragma once
/**
 * @file report.hpp
 * @brief Flatten the registry into ReportRecords and persist them as JSON.
 *
 * One report file per process:
 *   main process  -> <dir>/waterfalls.json
 *   child process -> <dir>/waterfalls.<pid>.json
 *
 * The directory is, in order of precedence: the explicit argument,
 * Config::output_dir, $WATERFALLS_DIRECTORY, the current working directory.
 */

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "../platform.hpp"
#include "../types/Block.hpp"
#include "../types/Config.hpp"
#include "../types/Registry.hpp"
#include "diagnostics.hpp"

#define WATERFALLS_REPORT_BASENAME "waterfalls"
#define WATERFALLS_DIRECTORY_ENV "WATERFALLS_DIRECTORY"

namespace waterfalls {

/**
 * @brief Report of @p reg: timelines in registration order, each
 * timeline's blocks in completion order.
 *
 * Has no side effects and can be called any number of times.
 */
inline std::vector<ReportRecord> generate_report(Registry& reg) {
    std::vector<ReportRecord> report;

    std::lock_guard<std::mutex> lock(reg.mtx);
    for (const auto& t : reg.timelines) {
        for (const Block& b : t->blocks) {
            ReportRecord r;
            r.name = t->name;
            r.text = b.text;
            r.start_time = b.start_time;
            r.stop_time = b.stop_time;
            r.thread_duration = b.thread_duration;
            r.thread_id = t->thread_id;
            report.push_back(std::move(r));
        }
    }
    return report;
}

inline std::vector<ReportRecord> generate_report() {
    return generate_report(registry());
}

/**
 * @brief Directory a report is saved into.
 *
 * @param directory Explicit directory; takes precedence when set
 */
inline std::filesystem::path report_directory(const std::optional<std::string>& directory = std::nullopt) {
    if (directory) return std::filesystem::path(*directory);

    const Config& cfg = get_config();
    if (!cfg.output_dir.empty()) return std::filesystem::path(cfg.output_dir);

    const char* env = std::getenv(WATERFALLS_DIRECTORY_ENV);
    if (env != nullptr) return std::filesystem::path(env);

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

/**
 * @brief Report file name for a process of the given role.
 *
 * Children embed their pid so concurrent processes never share a file.
 */
inline std::string report_file_name(ProcessRole role) {
    if (role == ProcessRole::Main) {
        return WATERFALLS_REPORT_BASENAME ".json";
    }
    return std::string(WATERFALLS_REPORT_BASENAME ".") + std::to_string(current_pid()) + ".json";
}

/**
 * @brief Save the report of @p reg as one JSON array.
 *
 * Does nothing when no Timer was ever created. Warns and writes nothing
 * when Timers exist but none completed a block. Otherwise the directory is
 * created if needed and the file is written in one piece, replacing any
 * previous report of the same process.
 *
 * @param reg Registry to report
 * @param directory Explicit target directory (see report_directory())
 * @param role Selects the file name (see report_file_name())
 * @return Path of the written file, empty string if nothing was written
 */
inline std::string save_report(Registry& reg, const std::optional<std::string>& directory, ProcessRole role) {
    namespace fs = std::filesystem;

    if (reg.empty()) {
        return "";
    }

    std::vector<ReportRecord> report = generate_report(reg);
    if (report.empty()) {
        emit(DiagnosticKind::EmptyReport, Severity::Warning,
             "No Timer block has been created, report will not be saved.");
        return "";
    }

    fs::path dir_path = report_directory(directory);
    std::error_code ec;
    if (!dir_path.empty()) {
        fs::create_directories(dir_path, ec);
        if (ec) {
            emit(DiagnosticKind::ReportWriteFailed, Severity::Error,
                 "Failed to create directory '" + dir_path.string() + "': " + ec.message());
            return "";
        }
    }

    fs::path file_path = dir_path / report_file_name(role);
    // Names and labels are arbitrary bytes; invalid UTF-8 becomes U+FFFD.
    std::string payload;
    try {
        payload = nlohmann::json(report).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        emit(DiagnosticKind::ReportWriteFailed, Severity::Error,
             std::string("Failed to encode report: ") + e.what());
        return "";
    }

    FILE* f = std::fopen(file_path.string().c_str(), "wb");
    if (!f) {
        emit(DiagnosticKind::ReportWriteFailed, Severity::Error,
             "Failed to open report file '" + file_path.string() + "'");
        return "";
    }
    const size_t written = std::fwrite(payload.data(), 1, payload.size(), f);
    const bool closed = std::fclose(f) == 0;
    if (written != payload.size() || !closed) {
        emit(DiagnosticKind::ReportWriteFailed, Severity::Error,
             "Failed to write report file '" + file_path.string() + "'");
        return "";
    }

    fs::path shown = fs::absolute(file_path, ec);
    emit(DiagnosticKind::ReportSaved, Severity::Info,
         "Waterfalls report saved into file '" + (ec ? file_path : shown).string() + "'");
    return file_path.string();
}

/**
 * @brief Save the active registry's report for the calling process.
 */
inline std::string save_report() {
    return save_report(registry(), std::nullopt, current_process_role());
}

/**
 * @brief Save the active registry's report into @p directory.
 */
inline std::string save_report(const std::string& directory) {
    return save_report(registry(), directory, current_process_role());
}

} // namespace waterfalls
