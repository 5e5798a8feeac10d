#include "Generator.h"
#include "FinetypeExceptions.h"

#include <algorithm>

namespace {
bool generatorMissing(const Finetype::GeneratorException& ex) {
    return ex.kind() != Finetype::GeneratorException::Kind::FAILED;
}

std::vector<const Definition*> sortedAtPriority(const Taxonomy& taxonomy, uint8_t minPriority) {
    auto defs = taxonomy.atPriority(minPriority);
    std::sort(defs.begin(), defs.end(), [](const Definition* a, const Definition* b) { return a->key < b->key; });
    return defs;
}

// Appends up to count samples; stops early once the generator reports it has none for the key.
void appendSamples(SampleGenerator& generator,
                   const std::string& key,
                   const std::string& label,
                   size_t count,
                   std::vector<Sample>& out) {
    for (size_t i = 0; i < count; ++i) {
        try {
            out.push_back({SampleGeneration::generateValue(generator, key), label});
        } catch (const Finetype::GeneratorException& ex) {
            if (generatorMissing(ex)) return;
        }
    }
}
} // namespace

DefinitionSampleGenerator::DefinitionSampleGenerator(const Taxonomy& taxonomy, uint64_t seed)
    : taxonomy_(taxonomy), rng_(seed) {}

std::string DefinitionSampleGenerator::generate(const std::string& provider, const std::string& method) {
    const std::string key = provider + "." + method;
    const Definition* def = taxonomy_.get(key);
    if (!def) {
        throw Finetype::GeneratorException(Finetype::GeneratorException::Kind::UNKNOWN_LABEL, key);
    }
    if (def->samples.empty()) {
        throw Finetype::GeneratorException(Finetype::GeneratorException::Kind::NOT_IMPLEMENTED, key);
    }
    std::uniform_int_distribution<size_t> pick(0, def->samples.size() - 1);
    return def->samples[pick(rng_)];
}

namespace SampleGeneration {

std::string generateValue(SampleGenerator& generator, const std::string& key) {
    const auto label = Label::parse(key);
    if (!label) {
        throw Finetype::GeneratorException(Finetype::GeneratorException::Kind::UNKNOWN_LABEL, key);
    }
    return generator.generate(label->provider, label->method);
}

std::vector<Sample> generateAll(SampleGenerator& generator,
                                const Taxonomy& taxonomy,
                                uint8_t minPriority,
                                size_t samplesPerLabel) {
    std::vector<Sample> samples;
    for (const Definition* def : sortedAtPriority(taxonomy, minPriority)) {
        appendSamples(generator, def->key, def->key, samplesPerLabel, samples);
    }
    return samples;
}

std::vector<Sample> generateAllLocalized(SampleGenerator& generator,
                                         const Taxonomy& taxonomy,
                                         uint8_t minPriority,
                                         size_t samplesPerLabel) {
    std::vector<Sample> samples;
    for (const Definition* def : sortedAtPriority(taxonomy, minPriority)) {
        if (def->designation == Designation::LOCALE_SPECIFIC) {
            for (const auto& locale : def->locales) {
                generator.setLocale(locale);
                appendSamples(generator, def->key, def->key + "." + locale, samplesPerLabel, samples);
            }
            generator.setLocale(std::nullopt);
        } else {
            appendSamples(generator, def->key, def->key + ".UNIVERSAL", samplesPerLabel, samples);
        }
    }
    return samples;
}

} // namespace SampleGeneration
