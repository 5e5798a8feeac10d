#include "TieredClassifier.h"
#include "FinetypeExceptions.h"

TieredClassifier::TieredClassifier(TierGraph graph, StageMap stages)
    : graph_(std::move(graph)), stages_(std::move(stages)) {
    const auto it = stages_.find(TierGraph::tier0StageKey());
    if (it == stages_.end() || !it->second) {
        throw Finetype::ClassifierException("tiered classifier requires a '" + TierGraph::tier0StageKey() + "' stage");
    }
    tier0_ = it->second;
}

ClassificationResult TieredClassifier::classify(const std::string& text) const {
    return resolveBelowTier0(text, tier0_->classify(text));
}

std::vector<ClassificationResult> TieredClassifier::classifyBatch(const std::vector<std::string>& texts) const {
    const auto tier0 = tier0_->classifyBatch(texts);
    if (tier0.size() != texts.size()) {
        throw Finetype::ClassifierException("tier 0 stage returned " + std::to_string(tier0.size()) +
                                            " results for " + std::to_string(texts.size()) + " inputs");
    }
    std::vector<ClassificationResult> results;
    results.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) results.push_back(resolveBelowTier0(texts[i], tier0[i]));
    return results;
}

ClassificationResult TieredClassifier::resolveBelowTier0(const std::string& text, const ClassificationResult& tier0) const {
    const std::string& broadType = tier0.label;
    const auto [category, tier1Confidence] = resolve(graph_.tier1Resolution(broadType), text, "unknown");
    const auto [label, tier2Confidence] =
        resolve(graph_.tier2Resolution(broadType, category), text, broadType + "." + category);

    ClassificationResult result;
    result.label = label;
    result.confidence = tier0.confidence * tier1Confidence * tier2Confidence;
    return result;
}

std::pair<std::string, double> TieredClassifier::resolve(const Resolution& resolution,
                                                         const std::string& text,
                                                         const std::string& fallbackLabel) const {
    if (const auto* direct = std::get_if<DirectResolution>(&resolution)) {
        return {direct->label, 1.0};
    }
    const auto& delegate = std::get<DelegateResolution>(resolution);
    const auto it = stages_.find(delegate.stageKey);
    if (it == stages_.end() || !it->second) return {fallbackLabel, 0.0};

    const ClassificationResult stage = it->second->classify(text);
    return {stage.label, stage.confidence};
}
