#pragma once

#include "sblint/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sblint {

// ============================================================================
// Diagnostic Store
// ============================================================================

/**
 * Field-keyed diagnostic collection.
 *
 * Holds at most one diagnostic per field. Recording a field that already has
 * a diagnostic only moves its line; the first message and severity stay.
 * Diagnostics are never removed.
 */
class DiagnosticStore {
public:
    DiagnosticStore() = default;

    void record(const std::string& field, const std::string& message,
                std::size_t line, Severity severity);

    // True if any stored diagnostic is an error
    bool has_fatal() const;

    std::size_t error_count() const;
    std::size_t warning_count() const;

    const Diagnostic* find(const std::string& field) const;

    // In order of first occurrence
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    bool empty() const { return diagnostics_.empty(); }
    std::size_t size() const { return diagnostics_.size(); }

private:
    std::vector<Diagnostic> diagnostics_;
};

// ============================================================================
// Rendering
// ============================================================================

// "field -> message"
std::string format_diagnostic(const Diagnostic& diagnostic);

// Source excerpt around a 1-based line, target marked with '>'.
// Returns no lines when line is 0 or past the end of the source.
std::vector<std::string> highlight_source_line(const std::string& source, std::size_t line);

} // namespace sblint
