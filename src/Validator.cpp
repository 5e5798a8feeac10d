#include "Validator.h"
#include "CommonUtils.h"
#include "FinetypeExceptions.h"

#include <re2/re2.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
#ifdef USE_OPENMP
constexpr long long kParallelRowThreshold = 4096;
#endif

std::string formatNumber(double value) {
    std::ostringstream os;
    os << std::setprecision(15) << value;
    return os.str();
}

std::string formatAllowed(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += "\"" + values[i] + "\"";
    }
    return out + "]";
}

const Validation& schemaForLabel(const std::string& label, const Taxonomy& taxonomy) {
    const Definition* def = taxonomy.get(label);
    if (!def) throw Finetype::UnknownLabelException(label);
    if (!def->validation) throw Finetype::NoSchemaException(label);
    return *def->validation;
}
} // namespace

std::string validationCheckName(ValidationCheck check) {
    switch (check) {
        case ValidationCheck::PATTERN: return "pattern";
        case ValidationCheck::MIN_LENGTH: return "minLength";
        case ValidationCheck::MAX_LENGTH: return "maxLength";
        case ValidationCheck::MINIMUM: return "minimum";
        case ValidationCheck::MAXIMUM: return "maximum";
        case ValidationCheck::ENUM: return "enum";
    }
    return "unknown";
}

bool ValidationResult::hasFailure(ValidationCheck check) const {
    return std::any_of(errors.begin(), errors.end(), [check](const ValidationFailure& f) { return f.check == check; });
}

std::string invalidStrategyToString(InvalidStrategy strategy) {
    switch (strategy) {
        case InvalidStrategy::QUARANTINE: return "quarantine";
        case InvalidStrategy::SET_NULL: return "set_null";
        case InvalidStrategy::FORWARD_FILL: return "ffill";
        case InvalidStrategy::BACKWARD_FILL: return "bfill";
    }
    return "quarantine";
}

std::optional<InvalidStrategy> invalidStrategyFromString(const std::string& text) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(text));
    if (v == "quarantine") return InvalidStrategy::QUARANTINE;
    if (v == "set_null" || v == "null") return InvalidStrategy::SET_NULL;
    if (v == "ffill" || v == "forward_fill") return InvalidStrategy::FORWARD_FILL;
    if (v == "bfill" || v == "backward_fill") return InvalidStrategy::BACKWARD_FILL;
    return std::nullopt;
}

double ColumnStats::validityRate() const {
    const size_t nonNull = totalCount - nullCount;
    if (nonNull == 0) return 0.0;
    return static_cast<double>(validCount) / static_cast<double>(nonNull);
}

CompiledSchema CompiledSchema::compile(const Validation& schema) {
    CompiledSchema compiled;
    compiled.schema_ = schema;
    if (schema.pattern) {
        RE2::Options options;
        options.set_log_errors(false);
        auto regex = std::make_shared<const RE2>(*schema.pattern, options);
        if (regex->ok()) {
            compiled.regex_ = std::move(regex);
        } else {
            compiled.patternError_ = regex->error();
        }
    }
    return compiled;
}

CompiledSchema CompiledSchema::compileStrict(const std::string& label, const Validation& schema) {
    CompiledSchema compiled = compile(schema);
    if (schema.pattern && !compiled.regex_) {
        throw Finetype::InvalidPatternException(label, *schema.pattern, compiled.patternError_);
    }
    return compiled;
}

ValidationResult CompiledSchema::validate(std::string_view value) const {
    ValidationResult result;
    auto fail = [&result](ValidationCheck check, std::string message) {
        result.errors.push_back({check, std::move(message)});
    };

    if (schema_.pattern) {
        if (!regex_) {
            fail(ValidationCheck::PATTERN, "Invalid regex pattern '" + *schema_.pattern + "': " + patternError_);
        } else if (!RE2::PartialMatch(re2::StringPiece(value.data(), value.size()), *regex_)) {
            fail(ValidationCheck::PATTERN, "Value does not match pattern: " + *schema_.pattern);
        }
    }

    const size_t length = value.size();
    if (schema_.minLength && length < *schema_.minLength) {
        fail(ValidationCheck::MIN_LENGTH,
             "Value length " + std::to_string(length) + " is less than minimum " + std::to_string(*schema_.minLength));
    }
    if (schema_.maxLength && length > *schema_.maxLength) {
        fail(ValidationCheck::MAX_LENGTH,
             "Value length " + std::to_string(length) + " exceeds maximum " + std::to_string(*schema_.maxLength));
    }

    if (schema_.minimum || schema_.maximum) {
        if (const auto number = CommonUtils::parseDouble(value)) {
            if (schema_.minimum && *number < *schema_.minimum) {
                fail(ValidationCheck::MINIMUM,
                     "Value " + formatNumber(*number) + " is less than minimum " + formatNumber(*schema_.minimum));
            }
            if (schema_.maximum && *number > *schema_.maximum) {
                fail(ValidationCheck::MAXIMUM,
                     "Value " + formatNumber(*number) + " exceeds maximum " + formatNumber(*schema_.maximum));
            }
        }
    }

    if (schema_.enumValues) {
        const auto& allowed = *schema_.enumValues;
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            fail(ValidationCheck::ENUM,
                 "Value '" + std::string(value) + "' is not in allowed values: " + formatAllowed(allowed));
        }
    }

    result.isValid = result.errors.empty();
    return result;
}

namespace Validator {

ValidationResult validateValue(std::string_view value, const Validation& schema) {
    return CompiledSchema::compile(schema).validate(value);
}

ValidationResult validateValueForLabel(std::string_view value, const std::string& label, const Taxonomy& taxonomy) {
    const Validation& schema = schemaForLabel(label, taxonomy);
    return CompiledSchema::compileStrict(label, schema).validate(value);
}

ColumnValidationResult validateColumn(const std::vector<std::optional<std::string>>& values,
                                      const Validation& schema,
                                      InvalidStrategy strategy) {
    return validateColumn(values, CompiledSchema::compile(schema), strategy);
}

ColumnValidationResult validateColumn(const std::vector<std::optional<std::string>>& values,
                                      const CompiledSchema& schema,
                                      InvalidStrategy strategy) {
    const size_t n = values.size();
    std::vector<ValidationResult> perRow(n);

    // Rows are independent here; only the strategy pass below depends on order.
#ifdef USE_OPENMP
    #pragma omp parallel for schedule(static) if(static_cast<long long>(n) >= kParallelRowThreshold)
#endif
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const auto& cell = values[static_cast<size_t>(i)];
        if (cell) perRow[static_cast<size_t>(i)] = schema.validate(*cell);
    }

    ColumnValidationResult out;
    out.values.resize(n);
    out.stats.totalCount = n;

    for (size_t i = 0; i < n; ++i) {
        if (!values[i]) {
            ++out.stats.nullCount;
            continue;
        }
        const ValidationResult& row = perRow[i];
        if (row.isValid) {
            ++out.stats.validCount;
            out.values[i] = values[i];
            continue;
        }
        ++out.stats.invalidCount;
        for (const auto& failure : row.errors) ++out.stats.errorsByCheck[failure.check];
        if (strategy == InvalidStrategy::QUARANTINE) {
            out.quarantined.push_back({i, *values[i], row.errors});
        }
    }

    if (strategy == InvalidStrategy::FORWARD_FILL) {
        std::optional<std::string> lastValid;
        for (size_t i = 0; i < n; ++i) {
            if (!values[i]) continue;
            if (perRow[i].isValid) {
                lastValid = values[i];
            } else {
                out.values[i] = lastValid;
            }
        }
    } else if (strategy == InvalidStrategy::BACKWARD_FILL) {
        std::optional<std::string> nextValid;
        for (size_t i = n; i-- > 0;) {
            if (!values[i]) continue;
            if (perRow[i].isValid) {
                nextValid = values[i];
            } else {
                out.values[i] = nextValid;
            }
        }
    }

    return out;
}

ColumnValidationResult validateColumnForLabel(const std::vector<std::optional<std::string>>& values,
                                              const std::string& label,
                                              const Taxonomy& taxonomy,
                                              InvalidStrategy strategy) {
    const Validation& schema = schemaForLabel(label, taxonomy);
    return validateColumn(values, CompiledSchema::compileStrict(label, schema), strategy);
}

} // namespace Validator
