#pragma once

#include "sblint/value.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace sblint {

// ============================================================================
// Raw Document
// ============================================================================

struct RawDocument {
    std::vector<Value::Entry> entries;  // top-level fields in source order
    std::string source;                 // original text, for line lookup
};

struct DocumentParseResult {
    bool ok = false;
    std::string error;
    RawDocument document;
};

// Parse descriptor JSON. Repeated keys are kept at every nesting level and
// comments are ignored. The root must be an object.
DocumentParseResult parse_document(const std::string& text);

// ============================================================================
// Key Locator
// ============================================================================

/**
 * Maps top-level keys to the source lines they appear on.
 *
 * The source is scanned textually: only string tokens directly inside the
 * root object and followed by ':' count as keys, so nested keys with the
 * same name do not shift the occurrence count. Escapes in keys are decoded
 * so lookups use the same names the parser reports.
 */
class KeyLocator {
public:
    explicit KeyLocator(const std::string& source);

    // 1-based line of the n-th (0-based) occurrence of key, 0 if absent
    std::size_t line_of(const std::string& key, std::size_t occurrence = 0) const;

private:
    std::unordered_map<std::string, std::vector<std::size_t>> lines_;
};

// ============================================================================
// Validated Config
// ============================================================================

/**
 * Accepted fields in source order. Built once by the validator and never
 * modified afterwards.
 */
class ValidatedConfig {
public:
    ValidatedConfig() = default;
    explicit ValidatedConfig(std::vector<Value::Entry> fields)
        : fields_(std::move(fields)) {}

    const Value* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    std::vector<Value::Entry>::const_iterator begin() const { return fields_.begin(); }
    std::vector<Value::Entry>::const_iterator end() const { return fields_.end(); }

    bool operator==(const ValidatedConfig& other) const { return fields_ == other.fields_; }

private:
    std::vector<Value::Entry> fields_;
};

// ============================================================================
// JSON output
// ============================================================================

// Repeated mapping keys collapse to their first occurrence.
nlohmann::ordered_json to_json(const Value& value);
nlohmann::ordered_json to_json(const ValidatedConfig& config);

} // namespace sblint
