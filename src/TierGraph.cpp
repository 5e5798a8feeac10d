#include "TierGraph.h"
#include "Taxonomy.h"

#include <algorithm>

namespace {
const std::vector<std::string>& emptyList() {
    static const std::vector<std::string> empty;
    return empty;
}
} // namespace

TierGraph TierGraph::fromTaxonomy(const Taxonomy& taxonomy) {
    TierGraph graph;
    for (const auto& key : taxonomy.labels()) {
        const Definition* def = taxonomy.get(key);
        if (!def || def->tier.size() < 2) continue;

        const std::string& broadType = def->tier[0];
        const std::string& category = def->tier[1];
        graph.categories_[broadType].push_back(category);
        graph.types_[{broadType, category}].push_back(key);
        graph.labelPath_[key] = {broadType, category};
    }

    for (auto& [broadType, cats] : graph.categories_) {
        std::sort(cats.begin(), cats.end());
        cats.erase(std::unique(cats.begin(), cats.end()), cats.end());
        graph.broadTypes_.push_back(broadType);
    }
    for (auto& [group, labels] : graph.types_) {
        std::sort(labels.begin(), labels.end());
    }
    return graph;
}

const std::vector<std::string>& TierGraph::categoriesFor(const std::string& broadType) const {
    const auto it = categories_.find(broadType);
    return it == categories_.end() ? emptyList() : it->second;
}

const std::vector<std::string>& TierGraph::typesFor(const std::string& broadType, const std::string& category) const {
    const auto it = types_.find({broadType, category});
    return it == types_.end() ? emptyList() : it->second;
}

std::optional<std::pair<std::string, std::string>> TierGraph::tierPath(const std::string& label) const {
    const auto it = labelPath_.find(label);
    if (it == labelPath_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> TierGraph::broadTypeFor(const std::string& label) const {
    const auto path = tierPath(label);
    if (!path) return std::nullopt;
    return path->first;
}

std::optional<std::string> TierGraph::categoryFor(const std::string& label) const {
    const auto path = tierPath(label);
    if (!path) return std::nullopt;
    return path->second;
}

bool TierGraph::needsTier2(const std::string& broadType, const std::string& category, size_t minTypes) const {
    return typesFor(broadType, category).size() > minTypes;
}

std::vector<std::pair<std::string, std::string>> TierGraph::tier2Groups(size_t minTypes) const {
    std::vector<std::pair<std::string, std::string>> groups;
    for (const auto& [group, labels] : types_) {
        if (labels.size() > minTypes) groups.push_back(group);
    }
    return groups;
}

std::vector<DirectResolveGroup> TierGraph::directResolveGroups() const {
    std::vector<DirectResolveGroup> groups;
    for (const auto& [group, labels] : types_) {
        if (labels.size() == 1) groups.push_back({group.first, group.second, labels.front()});
    }
    return groups;
}

TierGraphSummary TierGraph::summary() const {
    TierGraphSummary s;
    s.tier0Classes = broadTypes_.size();
    s.tier1Models = broadTypes_.size();
    s.tier2ModelsGt5 = tier2Groups(5).size();
    s.tier2ModelsGt1 = tier2Groups(1).size();
    s.directResolveGroups = directResolveGroups().size();
    s.totalLabels = labelPath_.size();
    return s;
}

std::string TierGraph::tier0StageKey() {
    return "tier0";
}

std::string TierGraph::tier1StageKey(const std::string& broadType) {
    return "tier1/" + broadType;
}

std::string TierGraph::tier2StageKey(const std::string& broadType, const std::string& category) {
    return "tier2/" + broadType + "/" + category;
}

Resolution TierGraph::tier1Resolution(const std::string& broadType) const {
    const auto& cats = categoriesFor(broadType);
    if (cats.size() == 1) return DirectResolution{cats.front()};
    return DelegateResolution{tier1StageKey(broadType)};
}

Resolution TierGraph::tier2Resolution(const std::string& broadType, const std::string& category) const {
    const auto& labels = typesFor(broadType, category);
    if (labels.size() == 1) return DirectResolution{labels.front()};
    return DelegateResolution{tier2StageKey(broadType, category)};
}
