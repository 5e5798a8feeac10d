#include "Checker.h"
#include "FinetypeExceptions.h"
#include "Validator.h"

#include <iostream>
#include <optional>

namespace {
FailureReason reasonFor(const ValidationFailure& failure,
                        const CompiledSchema& schema,
                        const std::string& sample) {
    const Validation& v = schema.schema();
    FailureReason reason;
    switch (failure.check) {
        case ValidationCheck::PATTERN:
            reason.kind = FailureKind::PATTERN_MISMATCH;
            reason.detail = schema.patternCompiled() ? *v.pattern : "INVALID REGEX: " + *v.pattern;
            break;
        case ValidationCheck::MIN_LENGTH:
            reason.kind = FailureKind::TOO_SHORT;
            reason.actual = sample.size();
            reason.bound = *v.minLength;
            break;
        case ValidationCheck::MAX_LENGTH:
            reason.kind = FailureKind::TOO_LONG;
            reason.actual = sample.size();
            reason.bound = *v.maxLength;
            break;
        case ValidationCheck::MINIMUM:
            reason.kind = FailureKind::BELOW_MINIMUM;
            reason.detail = failure.message;
            break;
        case ValidationCheck::MAXIMUM:
            reason.kind = FailureKind::ABOVE_MAXIMUM;
            reason.detail = failure.message;
            break;
        case ValidationCheck::ENUM:
            reason.kind = FailureKind::NOT_IN_ENUM;
            reason.detail = failure.message;
            break;
    }
    return reason;
}
} // namespace

std::string FailureReason::describe() const {
    switch (kind) {
        case FailureKind::PATTERN_MISMATCH:
            return "pattern mismatch (expected: " + detail + ")";
        case FailureKind::TOO_SHORT:
            return "too short (" + std::to_string(actual) + " < " + std::to_string(bound) + ")";
        case FailureKind::TOO_LONG:
            return "too long (" + std::to_string(actual) + " > " + std::to_string(bound) + ")";
        case FailureKind::BELOW_MINIMUM:
        case FailureKind::ABOVE_MAXIMUM:
        case FailureKind::NOT_IN_ENUM:
            return detail;
        case FailureKind::GENERATOR_ERROR:
            return "generator error: " + detail;
    }
    return detail;
}

double DefinitionCheckResult::passRate() const {
    if (samplesGenerated == 0) return 0.0;
    return static_cast<double>(samplesPassed) / static_cast<double>(samplesGenerated);
}

CheckReport CheckReport::fromResults(std::vector<DefinitionCheckResult> results, size_t totalDefinitions) {
    CheckReport report;
    report.totalDefinitions = totalDefinitions;
    for (const auto& r : results) {
        if (r.generatorExists) {
            ++report.generatorsFound;
        } else {
            ++report.generatorsMissing;
        }
        if (r.passed()) ++report.fullyPassing;
        if (r.generatorExists && r.samplesFailed > 0) ++report.hasFailures;
        if (!r.hasPattern) ++report.noPattern;
        report.totalSamples += r.samplesGenerated;
        report.totalPassed += r.samplesPassed;
        report.totalFailed += r.samplesFailed;
    }
    report.results = std::move(results);
    return report;
}

double CheckReport::passRate() const {
    if (totalSamples == 0) return 0.0;
    return static_cast<double>(totalPassed) / static_cast<double>(totalSamples);
}

std::map<std::string, std::vector<const DefinitionCheckResult*>> CheckReport::byDomain() const {
    std::map<std::string, std::vector<const DefinitionCheckResult*>> out;
    for (const auto& r : results) out[r.domain].push_back(&r);
    return out;
}

std::vector<const DefinitionCheckResult*> CheckReport::failures() const {
    std::vector<const DefinitionCheckResult*> out;
    for (const auto& r : results) {
        if (!r.passed()) out.push_back(&r);
    }
    return out;
}

std::vector<const DefinitionCheckResult*> CheckReport::atPriority(uint8_t minPriority) const {
    std::vector<const DefinitionCheckResult*> out;
    for (const auto& r : results) {
        if (r.releasePriority >= minPriority) out.push_back(&r);
    }
    return out;
}

Checker::Checker(CheckerConfig config) : config_(config) {}

CheckReport Checker::run(const Taxonomy& taxonomy) const {
    DefinitionSampleGenerator generator(taxonomy, config_.seed);
    return run(taxonomy, generator);
}

CheckReport Checker::run(const Taxonomy& taxonomy, SampleGenerator& generator) const {
    std::vector<DefinitionCheckResult> results;
    results.reserve(taxonomy.size());
    for (const auto& key : taxonomy.labels()) {
        results.push_back(checkDefinition(key, taxonomy.get(key), generator));
        if (config_.verbose) {
            const auto& r = results.back();
            std::cerr << "[Finetype][Checker] " << key << ": "
                      << (r.generatorExists ? std::to_string(r.samplesPassed) + "/" + std::to_string(r.samplesGenerated) + " passed"
                                            : std::string("no generator"))
                      << "\n";
        }
    }
    return CheckReport::fromResults(std::move(results), taxonomy.size());
}

DefinitionCheckResult Checker::checkDefinition(const std::string& key,
                                               const Definition* definition,
                                               SampleGenerator& generator) const {
    DefinitionCheckResult result;
    result.key = key;
    const size_t dot = key.find('.');
    result.domain = dot == std::string::npos ? key : key.substr(0, dot);
    if (definition) {
        result.hasPattern = definition->hasPattern();
        result.releasePriority = definition->releasePriority;
    }

    std::optional<CompiledSchema> schema;
    if (definition && definition->validation) schema = CompiledSchema::compile(*definition->validation);

    auto recordFailure = [&](CheckFailure failure) {
        ++result.samplesFailed;
        if (result.failures.size() < config_.maxFailuresPerKey) result.failures.push_back(std::move(failure));
    };

    for (size_t attempt = 0; attempt < config_.samplesPerKey; ++attempt) {
        std::string sample;
        try {
            sample = SampleGeneration::generateValue(generator, key);
        } catch (const Finetype::GeneratorException& ex) {
            if (attempt == 0 && ex.kind() != Finetype::GeneratorException::Kind::FAILED) break;
            result.generatorExists = true;
            ++result.samplesGenerated;
            recordFailure({"", {FailureKind::GENERATOR_ERROR, ex.what(), 0, 0}});
            continue;
        } catch (const std::exception& ex) {
            result.generatorExists = true;
            ++result.samplesGenerated;
            recordFailure({"", {FailureKind::GENERATOR_ERROR, ex.what(), 0, 0}});
            continue;
        }

        result.generatorExists = true;
        ++result.samplesGenerated;
        if (!schema) {
            ++result.samplesPassed;
            continue;
        }
        const ValidationResult validation = schema->validate(sample);
        if (validation.isValid) {
            ++result.samplesPassed;
        } else {
            recordFailure({sample, reasonFor(validation.errors.front(), *schema, sample)});
        }
    }
    return result;
}
