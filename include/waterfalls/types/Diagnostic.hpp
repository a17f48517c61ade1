#pragma once
/**
 * @file Diagnostic.hpp
 * @brief Structured diagnostic event emitted on misuse and report I/O.
 */

#include <functional>
#include <string>

#include "enums.hpp"

namespace waterfalls {

struct Diagnostic {
    DiagnosticKind kind;
    Severity       severity;
    std::string    message;
};

using DiagnosticHandler = std::function<void(const Diagnostic&)>;

/**
 * @brief Route a diagnostic to Config::on_diagnostic or to Config::out.
 *
 * Defined in namespaces/diagnostics.hpp once Config is complete.
 */
inline void emit(DiagnosticKind kind, Severity severity, const std::string& message);

} // namespace waterfalls
