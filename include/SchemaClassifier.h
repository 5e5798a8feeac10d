#pragma once

#include "Classifier.h"
#include "Taxonomy.h"
#include "Validator.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Rule-based classifier over the taxonomy's own validation schemas.
 *
 * Every definition with a compilable pattern votes for a value its full schema
 * accepts. Votes are weighted by 1 + release_priority; ties go to the longer
 * pattern, then to the smaller label. A value no schema accepts is "unknown".
 */
class SchemaClassifier : public ValueClassifier {
public:
    explicit SchemaClassifier(const Taxonomy& taxonomy, uint8_t minPriority = 0);

    ClassificationResult classify(const std::string& text) const override;

    size_t candidateCount() const { return candidates_.size(); }
    const std::vector<std::string>& skippedLabels() const { return skipped_; }

private:
    struct Candidate {
        std::string label;
        CompiledSchema schema;
        double weight = 1.0;
        size_t specificity = 0;
    };

    std::vector<Candidate> candidates_;
    std::vector<std::string> skipped_;
};
