#pragma once

#include "sblint/document.hpp"
#include "sblint/field_validators.hpp"
#include "sblint/logger.hpp"
#include "sblint/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sblint {

// ============================================================================
// Validation Result
// ============================================================================

struct ValidationResult {
    bool ok = false;
    std::string error;                     // aggregate summary when !ok
    ValidatedConfig config;                // only meaningful when ok
    std::vector<Diagnostic> diagnostics;   // discovery order, one per field
    std::size_t error_count = 0;
    std::size_t warning_count = 0;
};

// ============================================================================
// Document Validator
// ============================================================================

/**
 * Walks a RawDocument against a validator registry.
 *
 * Every key is looked up in source order. Repeated keys and unknown keys are
 * reported, accepted fields get field-specific checks (identifier charset,
 * categories, package type, URLs, nested distro_pkg duplicates), and required
 * fields that never appeared are reported at line 0. Any error fails the
 * whole document; warnings alone do not.
 *
 * Diagnostics are reported to the logger only once the walk is complete.
 * The validator keeps no state between calls.
 */
class DocumentValidator {
public:
    DocumentValidator();
    explicit DocumentValidator(std::vector<FieldValidator> registry);

    ValidationResult validate(const RawDocument& document,
                              const Logger& logger = Logger()) const;

private:
    std::vector<FieldValidator> registry_;
};

} // namespace sblint
