#pragma once

#include "Generator.h"
#include "Taxonomy.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum class FailureKind {
    PATTERN_MISMATCH,
    TOO_SHORT,
    TOO_LONG,
    BELOW_MINIMUM,
    ABOVE_MAXIMUM,
    NOT_IN_ENUM,
    GENERATOR_ERROR
};

struct FailureReason {
    FailureKind kind = FailureKind::GENERATOR_ERROR;
    // Pattern for PATTERN_MISMATCH ("INVALID REGEX: ..." when it does not compile),
    // validator message for the numeric/enum kinds, error text for GENERATOR_ERROR.
    std::string detail;
    size_t actual = 0;
    size_t bound = 0;

    std::string describe() const;
};

struct CheckFailure {
    std::string sample;
    FailureReason reason;
};

struct DefinitionCheckResult {
    std::string key;
    bool generatorExists = false;
    size_t samplesGenerated = 0;
    size_t samplesPassed = 0;
    size_t samplesFailed = 0;
    bool hasPattern = false;
    std::vector<CheckFailure> failures;
    uint8_t releasePriority = 0;
    std::string domain;

    bool passed() const { return generatorExists && samplesFailed == 0; }
    double passRate() const;
};

struct CheckReport {
    std::vector<DefinitionCheckResult> results;
    size_t totalDefinitions = 0;
    size_t generatorsFound = 0;
    size_t generatorsMissing = 0;
    size_t fullyPassing = 0;
    size_t hasFailures = 0;
    size_t noPattern = 0;
    size_t totalSamples = 0;
    size_t totalPassed = 0;
    size_t totalFailed = 0;

    static CheckReport fromResults(std::vector<DefinitionCheckResult> results, size_t totalDefinitions);

    double passRate() const;
    /// Gate for CI: no missing generators and no definition with a failing sample.
    bool allPassed() const { return generatorsMissing == 0 && hasFailures == 0; }
    std::map<std::string, std::vector<const DefinitionCheckResult*>> byDomain() const;
    std::vector<const DefinitionCheckResult*> failures() const;
    std::vector<const DefinitionCheckResult*> atPriority(uint8_t minPriority) const;
};

struct CheckerConfig {
    size_t samplesPerKey = 50;
    size_t maxFailuresPerKey = 5;
    uint64_t seed = 42;
    bool verbose = false;
};

/**
 * @brief Alignment gate between the taxonomy and a sample generator.
 *
 * Every label (sorted) gets samplesPerKey generation attempts, each sample
 * checked against the label's own schema.
 */
class Checker {
public:
    explicit Checker(CheckerConfig config = CheckerConfig{});

    /// Runs against a DefinitionSampleGenerator seeded with config().seed.
    CheckReport run(const Taxonomy& taxonomy) const;
    CheckReport run(const Taxonomy& taxonomy, SampleGenerator& generator) const;

    DefinitionCheckResult checkDefinition(const std::string& key,
                                          const Definition* definition,
                                          SampleGenerator& generator) const;

    const CheckerConfig& config() const { return config_; }

private:
    CheckerConfig config_;
};
