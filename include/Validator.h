#pragma once

#include "Taxonomy.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
class RE2;
}

enum class ValidationCheck { PATTERN, MIN_LENGTH, MAX_LENGTH, MINIMUM, MAXIMUM, ENUM };

std::string validationCheckName(ValidationCheck check);

struct ValidationFailure {
    ValidationCheck check;
    std::string message;
};

struct ValidationResult {
    bool isValid = true;
    std::vector<ValidationFailure> errors;

    bool hasFailure(ValidationCheck check) const;
};

enum class InvalidStrategy { QUARANTINE, SET_NULL, FORWARD_FILL, BACKWARD_FILL };

std::string invalidStrategyToString(InvalidStrategy strategy);
std::optional<InvalidStrategy> invalidStrategyFromString(const std::string& text);

struct QuarantinedValue {
    size_t rowIndex = 0;
    std::string value;
    std::vector<ValidationFailure> errors;
};

struct ColumnStats {
    size_t validCount = 0;
    size_t invalidCount = 0;
    size_t nullCount = 0;
    size_t totalCount = 0;
    std::map<ValidationCheck, size_t> errorsByCheck;

    /// valid / (total - null); 0 when the column has no non-null values.
    double validityRate() const;
};

struct ColumnValidationResult {
    std::vector<std::optional<std::string>> values;
    ColumnStats stats;
    std::vector<QuarantinedValue> quarantined;
};

/**
 * @brief A Validation schema with its pattern compiled once.
 *
 * Patterns use RE2 syntax and are searched unanchored in time linear in the
 * value length. compile() keeps a broken pattern
 * as a diagnostic: every validated value then fails the pattern check with an
 * "Invalid regex pattern" message.
 */
class CompiledSchema {
public:
    static CompiledSchema compile(const Validation& schema);

    /// @throws Finetype::InvalidPatternException when the pattern does not compile.
    static CompiledSchema compileStrict(const std::string& label, const Validation& schema);

    ValidationResult validate(std::string_view value) const;
    const Validation& schema() const { return schema_; }
    bool patternCompiled() const { return regex_ != nullptr; }

private:
    Validation schema_;
    std::shared_ptr<const re2::RE2> regex_;
    std::string patternError_;
};

namespace Validator {

/// Runs every check in the schema; failures accumulate.
ValidationResult validateValue(std::string_view value, const Validation& schema);

/**
 * @throws Finetype::UnknownLabelException, Finetype::NoSchemaException,
 *         Finetype::InvalidPatternException
 */
ValidationResult validateValueForLabel(std::string_view value, const std::string& label, const Taxonomy& taxonomy);

ColumnValidationResult validateColumn(const std::vector<std::optional<std::string>>& values,
                                      const Validation& schema,
                                      InvalidStrategy strategy = InvalidStrategy::QUARANTINE);

ColumnValidationResult validateColumn(const std::vector<std::optional<std::string>>& values,
                                      const CompiledSchema& schema,
                                      InvalidStrategy strategy = InvalidStrategy::QUARANTINE);

/// Same errors as validateValueForLabel, raised before any row is touched.
ColumnValidationResult validateColumnForLabel(const std::vector<std::optional<std::string>>& values,
                                              const std::string& label,
                                              const Taxonomy& taxonomy,
                                              InvalidStrategy strategy = InvalidStrategy::QUARANTINE);

} // namespace Validator
