#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

class Taxonomy;

// The node's answer is fixed: a category (tier 1) or a full label (tier 2).
struct DirectResolution {
    std::string label;
};

// The node needs the classifier registered under stageKey.
struct DelegateResolution {
    std::string stageKey;
};

using Resolution = std::variant<DirectResolution, DelegateResolution>;

struct TierGraphSummary {
    size_t tier0Classes = 0;
    size_t tier1Models = 0;
    size_t tier2ModelsGt5 = 0;
    size_t tier2ModelsGt1 = 0;
    size_t directResolveGroups = 0;
    size_t totalLabels = 0;
};

struct DirectResolveGroup {
    std::string broadType;
    std::string category;
    std::string label;
};

/**
 * @brief broad_type -> category -> label hierarchy built from each definition's tier path.
 *
 * Definitions whose tier field has fewer than two entries are left out.
 */
class TierGraph {
public:
    static TierGraph fromTaxonomy(const Taxonomy& taxonomy);

    const std::vector<std::string>& broadTypes() const { return broadTypes_; }
    const std::vector<std::string>& categoriesFor(const std::string& broadType) const;
    const std::vector<std::string>& typesFor(const std::string& broadType, const std::string& category) const;

    std::optional<std::pair<std::string, std::string>> tierPath(const std::string& label) const;
    std::optional<std::string> broadTypeFor(const std::string& label) const;
    std::optional<std::string> categoryFor(const std::string& label) const;

    /// True when the (broad_type, category) group holds more than minTypes labels.
    bool needsTier2(const std::string& broadType, const std::string& category, size_t minTypes) const;
    std::vector<std::pair<std::string, std::string>> tier2Groups(size_t minTypes) const;
    std::vector<DirectResolveGroup> directResolveGroups() const;
    TierGraphSummary summary() const;

    static std::string tier0StageKey();
    static std::string tier1StageKey(const std::string& broadType);
    static std::string tier2StageKey(const std::string& broadType, const std::string& category);

    /// Direct(category) when the broad type has exactly one category, otherwise Delegate.
    Resolution tier1Resolution(const std::string& broadType) const;
    /// Direct(label) when the group has exactly one label, otherwise Delegate.
    Resolution tier2Resolution(const std::string& broadType, const std::string& category) const;

private:
    std::vector<std::string> broadTypes_;
    std::map<std::string, std::vector<std::string>> categories_;
    std::map<std::pair<std::string, std::string>, std::vector<std::string>> types_;
    std::unordered_map<std::string, std::pair<std::string, std::string>> labelPath_;
};
