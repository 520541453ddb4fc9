#pragma once

#include <cstddef>
#include <string>

namespace sblint {

// ============================================================================
// Severity
// ============================================================================

enum class Severity {
    Error,  // blocks success
    Warn    // reported, never blocks
};

inline const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warn: return "warn";
        default: return "error";
    }
}

// ============================================================================
// Diagnostic
// ============================================================================

struct Diagnostic {
    std::string field;
    std::string message;
    std::size_t line = 0;  // 1-based, 0 = unknown
    Severity severity = Severity::Error;
};

} // namespace sblint
