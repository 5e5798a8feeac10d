#include "SchemaClassifier.h"

#include <algorithm>

SchemaClassifier::SchemaClassifier(const Taxonomy& taxonomy, uint8_t minPriority) {
    for (const auto& key : taxonomy.labels()) {
        const Definition* def = taxonomy.get(key);
        if (!def || !def->hasPattern() || def->releasePriority < minPriority) continue;

        CompiledSchema schema = CompiledSchema::compile(*def->validation);
        if (!schema.patternCompiled()) {
            skipped_.push_back(key);
            continue;
        }
        candidates_.push_back({key, std::move(schema), 1.0 + def->releasePriority, def->validation->pattern->size()});
    }
}

ClassificationResult SchemaClassifier::classify(const std::string& text) const {
    std::vector<const Candidate*> matches;
    double totalWeight = 0.0;
    for (const auto& candidate : candidates_) {
        if (candidate.schema.validate(text).isValid) {
            matches.push_back(&candidate);
            totalWeight += candidate.weight;
        }
    }

    ClassificationResult result;
    if (matches.empty()) {
        result.label = "unknown";
        return result;
    }

    std::stable_sort(matches.begin(), matches.end(), [](const Candidate* a, const Candidate* b) {
        if (a->weight != b->weight) return a->weight > b->weight;
        if (a->specificity != b->specificity) return a->specificity > b->specificity;
        return a->label < b->label;
    });

    for (const Candidate* match : matches) {
        result.allScores.emplace_back(match->label, match->weight / totalWeight);
    }
    result.label = matches.front()->label;
    result.confidence = result.allScores.front().second;
    return result;
}
