#include "Classifier.h"

std::vector<ClassificationResult> ValueClassifier::classifyBatch(const std::vector<std::string>& texts) const {
    std::vector<ClassificationResult> results;
    results.reserve(texts.size());
    for (const auto& text : texts) results.push_back(classify(text));
    return results;
}
