#pragma once

#include "sblint/diagnostics.hpp"
#include "sblint/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sblint {

// ============================================================================
// Field Validator Registry
// ============================================================================

// Shape check for one field. Returns the accepted value, or records
// diagnostics and returns nullopt.
using ValidateFn = std::optional<Value> (*)(const std::string& name, const Value& value,
                                            DiagnosticStore& sink, std::size_t line,
                                            bool required);

struct FieldValidator {
    const char* name;
    bool required;
    ValidateFn validate;
};

// The descriptor schema, in declaration order
const std::vector<FieldValidator>& field_validators();

// Exact-name lookup in a registry, nullptr if absent
const FieldValidator* find_field_validator(const std::vector<FieldValidator>& registry,
                                           const std::string& name);

// Shape failures block success only for required fields
inline Severity shape_severity(bool required) {
    return required ? Severity::Error : Severity::Warn;
}

// ============================================================================
// Shape validators
// ============================================================================

namespace shapes {

std::optional<Value> boolean(const std::string& name, const Value& value,
                             DiagnosticStore& sink, std::size_t line, bool required);

// Non-empty string
std::optional<Value> string(const std::string& name, const Value& value,
                            DiagnosticStore& sink, std::size_t line, bool required);

// Non-empty sequence of non-empty strings
std::optional<Value> string_list(const std::string& name, const Value& value,
                                 DiagnosticStore& sink, std::size_t line, bool required);

// String, or mapping of string -> string
std::optional<Value> text_or_map(const std::string& name, const Value& value,
                                 DiagnosticStore& sink, std::size_t line, bool required);

// String, or mapping with one of url/file/dir
std::optional<Value> resource(const std::string& name, const Value& value,
                              DiagnosticStore& sink, std::size_t line, bool required);

std::optional<Value> license(const std::string& name, const Value& value,
                             DiagnosticStore& sink, std::size_t line, bool required);

std::optional<Value> build_asset(const std::string& name, const Value& value,
                                 DiagnosticStore& sink, std::size_t line, bool required);

std::optional<Value> distro_pkg(const std::string& name, const Value& value,
                                DiagnosticStore& sink, std::size_t line, bool required);

std::optional<Value> x_exec(const std::string& name, const Value& value,
                            DiagnosticStore& sink, std::size_t line, bool required);

} // namespace shapes

// ============================================================================
// Value predicates
// ============================================================================

// Letters, digits and + - _ . only; must be non-empty
bool is_valid_alpha(const std::string& value);

// scheme://authority[path], no whitespace
bool is_valid_url(const std::string& value);

// freedesktop.org registered category
bool is_valid_category(const std::string& value);

bool is_valid_pkg_type(const std::string& value);

const std::vector<std::string>& valid_pkg_types();

} // namespace sblint
