#pragma once

#include <string>
#include <utility>
#include <vector>

struct ClassificationResult {
    std::string label;
    double confidence = 0.0;
    std::vector<std::pair<std::string, double>> allScores;
};

/**
 * @brief Single-value classifier seam.
 *
 * Implementations report failures as Finetype::ClassifierException. Callers
 * serialize access to implementations that are not thread-safe.
 */
class ValueClassifier {
public:
    virtual ~ValueClassifier() = default;

    virtual ClassificationResult classify(const std::string& text) const = 0;

    /// One result per input, in input order.
    virtual std::vector<ClassificationResult> classifyBatch(const std::vector<std::string>& texts) const;
};
