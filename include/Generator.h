#pragma once

#include "Taxonomy.h"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct Sample {
    std::string text;
    std::string label;
};

/**
 * @brief Source of synthetic values for a label.
 *
 * generate() throws Finetype::GeneratorException: kind UNKNOWN_LABEL or NOT_IMPLEMENTED
 * when no generator exists for the label, FAILED when one exists but could not
 * produce a value.
 */
class SampleGenerator {
public:
    virtual ~SampleGenerator() = default;
    virtual std::string generate(const std::string& provider, const std::string& method) = 0;
    virtual void setLocale(const std::optional<std::string>&) {}
};

// Replays each definition's literal samples in seeded random order.
class DefinitionSampleGenerator : public SampleGenerator {
public:
    DefinitionSampleGenerator(const Taxonomy& taxonomy, uint64_t seed);

    std::string generate(const std::string& provider, const std::string& method) override;
    void setLocale(const std::optional<std::string>& locale) override { locale_ = locale; }
    const std::optional<std::string>& locale() const { return locale_; }

private:
    const Taxonomy& taxonomy_;
    std::mt19937_64 rng_;
    std::optional<std::string> locale_;
};

namespace SampleGeneration {

/// Splits a taxonomy key and asks the generator for one value.
std::string generateValue(SampleGenerator& generator, const std::string& key);

/// samplesPerLabel values for every label at or above minPriority, labels in sorted order.
std::vector<Sample> generateAll(SampleGenerator& generator,
                                const Taxonomy& taxonomy,
                                uint8_t minPriority,
                                size_t samplesPerLabel);

/**
 * @brief Like generateAll but with four-segment labels.
 *
 * Locale-specific definitions yield samplesPerLabel values per declared locale,
 * labelled key.LOCALE; every other definition is labelled key.UNIVERSAL.
 */
std::vector<Sample> generateAllLocalized(SampleGenerator& generator,
                                         const Taxonomy& taxonomy,
                                         uint8_t minPriority,
                                         size_t samplesPerLabel);

} // namespace SampleGeneration
