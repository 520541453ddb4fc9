#include "sblint/validator.hpp"

#include "sblint/diagnostics.hpp"
#include "sblint/distro_pkg.hpp"

#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace sblint {

namespace {

std::vector<std::string> string_items(const Value& value) {
    std::vector<std::string> items;
    for (const auto& item : value.as_sequence()) {
        if (item.is_string()) {
            items.push_back(item.as_string());
        }
    }
    return items;
}

std::string join_quoted(const std::vector<std::string>& values) {
    std::string result = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) result += ", ";
        result += "\"" + values[i] + "\"";
    }
    return result + "]";
}

// Checks that need the field name to mean something; run only on values the
// registry already accepted.
void check_field_semantics(const std::string& key, const Value& value,
                           DiagnosticStore& store, std::size_t line) {
    if (key == "distro_pkg") {
        if (auto distro_pkg = DistroPkg::from_value(value)) {
            DuplicateChecker checker(store);
            checker.check_distro_pkg_duplicates(*distro_pkg, key, line);
        }
        return;
    }

    if (key == "pkg" || key == "pkg_id" || key == "app_id") {
        if (value.is_string() && !is_valid_alpha(value.as_string())) {
            store.record(key, "Invalid '" + key + "': '" + value.as_string() +
                         "'. Value should only contain alphanumeric, +, -, _, .",
                         line, Severity::Error);
        }
        return;
    }

    if (key == "pkg_type") {
        if (value.is_string() && !is_valid_pkg_type(value.as_string())) {
            store.record(key, "Invalid '" + key + "': '" + value.as_string() +
                         "'. Valid values are: " + join_quoted(valid_pkg_types()),
                         line, Severity::Error);
        }
        return;
    }

    if (!value.is_string_sequence()) {
        return;
    }

    auto items = string_items(value);
    if (key == "category") {
        for (const auto& item : items) {
            if (!is_valid_category(item)) {
                store.record(key, "Invalid '" + key + "': '" + item +
                             "' is not a valid category.", line, Severity::Error);
            }
        }
    } else if (key == "homepage" || key == "src_url") {
        for (const auto& item : items) {
            if (!is_valid_url(item)) {
                store.record(key, "Invalid '" + key + "': '" + item +
                             "' is not a valid URL.", line, Severity::Error);
            }
        }
    }

    DuplicateChecker checker(store);
    checker.check_duplicate_values(items, key, line);
}

void report(const DiagnosticStore& store, const std::string& source, const Logger& logger) {
    for (const auto& diagnostic : store.diagnostics()) {
        if (diagnostic.severity == Severity::Error) {
            logger.error(format_diagnostic(diagnostic));
        } else {
            logger.warn(format_diagnostic(diagnostic));
        }
        for (const auto& excerpt : highlight_source_line(source, diagnostic.line)) {
            logger.custom(excerpt);
        }
    }
}

} // anonymous namespace

DocumentValidator::DocumentValidator() : registry_(field_validators()) {}

DocumentValidator::DocumentValidator(std::vector<FieldValidator> registry)
    : registry_(std::move(registry)) {}

ValidationResult DocumentValidator::validate(const RawDocument& document,
                                             const Logger& logger) const {
    ValidationResult result;

    DiagnosticStore store;
    KeyLocator locator(document.source);
    std::unordered_set<std::string> visited;
    std::unordered_map<std::string, std::size_t> occurrences;
    std::vector<Value::Entry> accepted;

    for (const auto& entry : document.entries) {
        const std::string& key = entry.key;
        std::size_t line = locator.line_of(key, occurrences[key]++);

        if (visited.count(key)) {
            store.record(key, "'" + key + "' field is duplicated", line, Severity::Error);
            continue;
        }

        const FieldValidator* validator = find_field_validator(registry_, key);
        if (!validator) {
            store.record(key, "'" + key + "' is not a valid field.", line, Severity::Warn);
            continue;
        }

        auto validated = validator->validate(key, entry.value, store, line, validator->required);
        if (validated) {
            check_field_semantics(key, *validated, store, line);
            accepted.push_back(Value::Entry{key, std::move(*validated)});
        }
        visited.insert(key);
    }

    for (const auto& validator : registry_) {
        if (validator.required && !visited.count(validator.name)) {
            store.record(validator.name,
                         std::string("Missing required field: ") + validator.name,
                         0, Severity::Error);
        }
    }

    result.diagnostics = store.diagnostics();
    result.error_count = store.error_count();
    result.warning_count = store.warning_count();

    if (store.has_fatal()) {
        report(store, document.source, logger);
        result.error = std::to_string(result.error_count) + " error(s)";
        if (result.warning_count > 0) {
            result.error += " & " + std::to_string(result.warning_count) + " warning(s)";
        }
        result.error += " found during deserialization.";
        return result;
    }

    if (!store.empty()) {
        report(store, document.source, logger);
        logger.custom(std::to_string(result.warning_count) +
                      " warning(s) found during deserialization");
    }

    result.config = ValidatedConfig(std::move(accepted));
    result.ok = true;
    return result;
}

} // namespace sblint
