#pragma once

#include "sblint/diagnostics.hpp"
#include "sblint/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace sblint {

// ============================================================================
// DistroPkg
// ============================================================================

struct DistroPkgEntry;

/**
 * Per-distribution package name overrides.
 *
 * Either a list of package names, or an ordered mapping whose children are
 * again DistroPkg nodes, e.g. distro -> release -> names. Repeated keys are
 * kept so that they can be reported.
 */
struct DistroPkg {
    using List = std::vector<std::string>;
    using InnerNode = std::vector<DistroPkgEntry>;

    std::variant<List, InnerNode> node;

    bool is_list() const { return std::holds_alternative<List>(node); }
    const List& list() const { return std::get<List>(node); }
    const InnerNode& children() const { return std::get<InnerNode>(node); }

    // nullopt if value is not a string list or a mapping of such nodes
    static std::optional<DistroPkg> from_value(const Value& value);
};

struct DistroPkgEntry {
    std::string key;
    DistroPkg value;
};

// ============================================================================
// Duplicate Checker
// ============================================================================

/**
 * Reports repeated values in lists and repeated key paths in DistroPkg trees.
 *
 * Paths are dotted ("distro_pkg.fedora.41"). A checker instance remembers
 * every path it has visited, so use one instance per traversal.
 */
class DuplicateChecker {
public:
    explicit DuplicateChecker(DiagnosticStore& sink) : sink_(sink) {}

    void check_duplicate_values(const std::vector<std::string>& list,
                                const std::string& field_path, std::size_t line);

    void check_distro_pkg_duplicates(const DistroPkg& node, const std::string& field_path,
                                     std::size_t line);

private:
    DiagnosticStore& sink_;
    std::unordered_set<std::string> visited_;
};

} // namespace sblint
