#pragma once

#include "Classifier.h"
#include "TierGraph.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Chains per-tier classifiers along a TierGraph.
 *
 * Stage keys are TierGraph::tier0StageKey(), tier1StageKey(broad) and
 * tier2StageKey(broad, category). Nodes the graph resolves directly need no
 * stage. A delegated node with no registered stage falls back to "unknown"
 * (tier 1) or "broad.category" (tier 2) with zero confidence. The combined
 * confidence is the product of the per-tier confidences.
 */
class TieredClassifier : public ValueClassifier {
public:
    using StageMap = std::unordered_map<std::string, std::shared_ptr<const ValueClassifier>>;

    /// @throws Finetype::ClassifierException when no tier 0 stage is registered.
    TieredClassifier(TierGraph graph, StageMap stages);

    ClassificationResult classify(const std::string& text) const override;
    std::vector<ClassificationResult> classifyBatch(const std::vector<std::string>& texts) const override;

    const TierGraph& graph() const { return graph_; }
    bool hasStage(const std::string& stageKey) const { return stages_.count(stageKey) > 0; }

private:
    ClassificationResult resolveBelowTier0(const std::string& text, const ClassificationResult& tier0) const;
    std::pair<std::string, double> resolve(const Resolution& resolution,
                                           const std::string& text,
                                           const std::string& fallbackLabel) const;

    TierGraph graph_;
    StageMap stages_;
    std::shared_ptr<const ValueClassifier> tier0_;
};
