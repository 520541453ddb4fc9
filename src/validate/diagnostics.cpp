#include "sblint/diagnostics.hpp"

#include <algorithm>
#include <sstream>

namespace sblint {

// ============================================================================
// DiagnosticStore Implementation
// ============================================================================

void DiagnosticStore::record(const std::string& field, const std::string& message,
                             std::size_t line, Severity severity) {
    auto it = std::find_if(diagnostics_.begin(), diagnostics_.end(),
                           [&field](const Diagnostic& d) { return d.field == field; });
    if (it != diagnostics_.end()) {
        it->line = line;
        return;
    }
    diagnostics_.push_back({field, message, line, severity});
}

bool DiagnosticStore::has_fatal() const {
    for (const auto& d : diagnostics_) {
        if (d.severity == Severity::Error) {
            return true;
        }
    }
    return false;
}

std::size_t DiagnosticStore::error_count() const {
    return static_cast<std::size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(),
                      [](const Diagnostic& d) { return d.severity == Severity::Error; }));
}

std::size_t DiagnosticStore::warning_count() const {
    return diagnostics_.size() - error_count();
}

const Diagnostic* DiagnosticStore::find(const std::string& field) const {
    for (const auto& d : diagnostics_) {
        if (d.field == field) {
            return &d;
        }
    }
    return nullptr;
}

// ============================================================================
// Rendering
// ============================================================================

std::string format_diagnostic(const Diagnostic& diagnostic) {
    return diagnostic.field + " -> " + diagnostic.message;
}

std::vector<std::string> highlight_source_line(const std::string& source, std::size_t line) {
    std::vector<std::string> result;
    if (line == 0) {
        return result;
    }

    std::vector<std::string> lines;
    std::istringstream iss(source);
    std::string current;
    while (std::getline(iss, current)) {
        if (!current.empty() && current.back() == '\r') {
            current.pop_back();
        }
        lines.push_back(current);
    }
    if (line > lines.size()) {
        return result;
    }

    std::size_t first = line > 1 ? line - 1 : 1;
    std::size_t last = std::min(line + 1, lines.size());
    std::size_t width = std::to_string(last).size();

    for (std::size_t n = first; n <= last; ++n) {
        std::string number = std::to_string(n);
        std::string text = (n == line) ? " > " : "   ";
        text += std::string(width - number.size(), ' ') + number + " | " + lines[n - 1];
        result.push_back(text);
    }
    return result;
}

} // namespace sblint
