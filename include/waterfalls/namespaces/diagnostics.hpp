#pragma once
/**
 * @file diagnostics.hpp
 * @brief Diagnostic routing.
 */

#include <cstdio>
#include <mutex>
#include <string>

#include "../types/Config.hpp"
#include "../types/Diagnostic.hpp"

namespace waterfalls {

namespace diagnostics {

inline const char* severity_label(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "Info";
        case Severity::Warning: return "Warning";
        case Severity::Error:   return "Error";
    }
    return "Info";
}

} // namespace diagnostics

inline void emit(DiagnosticKind kind, Severity severity, const std::string& message) {
    Config& cfg = get_config();
    if (cfg.on_diagnostic) {
        cfg.on_diagnostic(Diagnostic{kind, severity, message});
        return;
    }
    if (severity == Severity::Info && !cfg.print_info) {
        return;
    }

    static std::mutex io_mtx;
    std::lock_guard<std::mutex> lock(io_mtx);
    FILE* out = cfg.out ? cfg.out : stderr;
    std::fprintf(out, "waterfalls: %s: %s\n", diagnostics::severity_label(severity), message.c_str());
    std::fflush(out);
}

} // namespace waterfalls
