#include "ColumnClassifier.h"
#include "CommonUtils.h"
#include "FinetypeExceptions.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace {
bool containsLabel(const std::vector<std::string>& labels, const std::string& label) {
    return std::find(labels.begin(), labels.end(), label) != labels.end();
}

bool containsPair(const std::vector<std::string>& labels, const char* a, const char* b) {
    return containsLabel(labels, a) && containsLabel(labels, b);
}

// Shared by the slash and dash date rules: which of the first two fields ever exceeds 12.
std::optional<std::string> resolveDayMonthOrder(const std::vector<std::string>& values,
                                                const char* separator,
                                                const char* dayFirstLabel,
                                                const char* monthFirstLabel) {
    bool firstOver12 = false;
    bool secondOver12 = false;
    for (const auto& value : values) {
        const auto parts = CommonUtils::splitAny(value, separator);
        if (parts.size() < 2) continue;
        const auto first = CommonUtils::parseUInt64(parts[0]);
        const auto second = CommonUtils::parseUInt64(parts[1]);
        if (first && *first > 12) firstOver12 = true;
        if (second && *second > 12) secondOver12 = true;
    }
    if (firstOver12 && !secondOver12) return std::string(dayFirstLabel);
    if (secondOver12 && !firstOver12) return std::string(monthFirstLabel);
    return std::nullopt;
}

bool isSequential(std::vector<int64_t> parsed, double varianceFactor) {
    std::sort(parsed.begin(), parsed.end());
    parsed.erase(std::unique(parsed.begin(), parsed.end()), parsed.end());
    if (parsed.size() < 3) return false;

    std::vector<double> diffs;
    diffs.reserve(parsed.size() - 1);
    for (size_t i = 1; i < parsed.size(); ++i) diffs.push_back(static_cast<double>(parsed[i] - parsed[i - 1]));
    const double mean = std::accumulate(diffs.begin(), diffs.end(), 0.0) / static_cast<double>(diffs.size());
    double variance = 0.0;
    for (double d : diffs) variance += (d - mean) * (d - mean);
    variance /= static_cast<double>(diffs.size());
    const double tolerance = mean * varianceFactor;
    return variance < tolerance * tolerance && mean > 0.0;
}

bool isYearLike(const std::vector<std::string>& values, const NumericRuleTuning& tuning) {
    if (values.empty()) return false;
    size_t yearCount = 0;
    for (const auto& value : values) {
        const std::string trimmed = CommonUtils::trim(value);
        if (trimmed.size() != tuning.yearDigits || !CommonUtils::isAllDigits(trimmed)) continue;
        const auto year = CommonUtils::parseInt64(trimmed);
        if (year && *year >= tuning.yearMin && *year <= tuning.yearMax) ++yearCount;
    }
    return static_cast<double>(yearCount) / static_cast<double>(values.size()) >= tuning.yearFraction;
}

bool hasConsistentDigitLength(const std::vector<std::string>& values) {
    std::optional<size_t> width;
    for (const auto& value : values) {
        const std::string trimmed = CommonUtils::trim(value);
        if (!CommonUtils::isAllDigits(trimmed)) continue;
        if (!width) {
            width = trimmed.size();
        } else if (*width != trimmed.size()) {
            return false;
        }
    }
    return width.has_value();
}
} // namespace

namespace ColumnDisambiguation {

std::vector<std::string> sampleEvenly(const std::vector<std::string>& values, size_t sampleSize) {
    if (values.size() <= sampleSize) return values;
    const double step = static_cast<double>(values.size()) / static_cast<double>(sampleSize);
    std::vector<std::string> sample;
    sample.reserve(sampleSize);
    for (size_t i = 0; i < sampleSize; ++i) {
        sample.push_back(values[static_cast<size_t>(static_cast<double>(i) * step)]);
    }
    return sample;
}

std::optional<std::string> resolveSlashDates(const std::vector<std::string>& values) {
    return resolveDayMonthOrder(values, "/", kEuSlash, kUsSlash);
}

std::optional<std::string> resolveShortDates(const std::vector<std::string>& values) {
    return resolveDayMonthOrder(values, "-", kShortDmy, kShortMdy);
}

std::optional<std::string> resolveCoordinates(const std::vector<std::string>& values) {
    bool anyOver90 = false;
    bool allParsed = true;
    size_t parsedCount = 0;
    for (const auto& value : values) {
        const auto v = CommonUtils::parseDouble(CommonUtils::trim(value));
        if (!v) {
            allParsed = false;
            continue;
        }
        ++parsedCount;
        if (std::abs(*v) > 90.0) anyOver90 = true;
    }
    if (parsedCount < 3) return std::nullopt;
    if (anyOver90) return std::string(kLongitude);
    if (allParsed) return std::string(kLatitude);
    return std::nullopt;
}

std::optional<RuleOutcome> resolveNumeric(const std::vector<std::string>& values,
                                          const std::vector<std::string>& topLabels,
                                          const NumericRuleTuning& tuning) {
    static const std::vector<std::string> kNumericFamily = {
        kPort, kIncrement, kIntegerNumber, kDecimalNumber, kPostalCode, kStreetNumber, kYear};
    const bool engaged = std::any_of(topLabels.begin(), topLabels.end(), [](const std::string& label) {
        return containsLabel(kNumericFamily, label);
    });
    if (!engaged) return std::nullopt;

    std::vector<int64_t> parsed;
    for (const auto& value : values) {
        if (const auto n = CommonUtils::parseInt64(CommonUtils::trim(value))) parsed.push_back(*n);
    }
    if (parsed.size() < tuning.minParsedValues) return std::nullopt;

    const auto [minIt, maxIt] = std::minmax_element(parsed.begin(), parsed.end());
    const int64_t min = *minIt;
    const int64_t max = *maxIt;
    const int64_t range = max - min;

    if (isYearLike(values, tuning)) {
        return RuleOutcome{kYear, "numeric_year_detection"};
    }

    const bool sequential = isSequential(parsed, tuning.sequentialVarianceFactor);
    if (sequential && min >= 0 && range > 0) {
        return RuleOutcome{kIncrement, "numeric_sequential_detection"};
    }

    const bool inPortRange = min >= 0 && max <= tuning.portMax;
    const bool hasCommonPort = std::any_of(parsed.begin(), parsed.end(), [&tuning](int64_t v) {
        return std::find(tuning.commonPorts.begin(), tuning.commonPorts.end(), v) != tuning.commonPorts.end();
    });
    if (hasCommonPort && inPortRange && !sequential) {
        return RuleOutcome{kPort, "numeric_port_detection"};
    }

    const bool allPositive = min > 0;
    const bool postalRange = allPositive && min >= tuning.postalMin && max <= tuning.postalMax;
    const bool consistentDigits = hasConsistentDigitLength(values);
    if (consistentDigits && postalRange && !sequential) {
        return RuleOutcome{kPostalCode, "numeric_postal_code_detection"};
    }

    const bool streetRange = allPositive && min >= 1 && max < tuning.streetMax;
    if (containsLabel(topLabels, kStreetNumber) && streetRange && !sequential && !hasCommonPort && !consistentDigits) {
        return RuleOutcome{kStreetNumber, "numeric_street_number_detection"};
    }
    return std::nullopt;
}

std::optional<RuleOutcome> disambiguate(const std::vector<std::string>& values,
                                        const std::vector<std::string>& topLabels,
                                        const NumericRuleTuning& tuning) {
    if (containsPair(topLabels, kUsSlash, kEuSlash)) {
        if (auto label = resolveSlashDates(values)) return RuleOutcome{*label, "date_slash_disambiguation"};
    }
    if (containsPair(topLabels, kShortMdy, kShortDmy)) {
        if (auto label = resolveShortDates(values)) return RuleOutcome{*label, "short_date_disambiguation"};
    }
    if (containsPair(topLabels, kLatitude, kLongitude)) {
        if (auto label = resolveCoordinates(values)) return RuleOutcome{*label, "coordinate_disambiguation"};
    }
    return resolveNumeric(values, topLabels, tuning);
}

} // namespace ColumnDisambiguation

ColumnClassifier::ColumnClassifier(std::shared_ptr<const ValueClassifier> classifier, ColumnConfig config)
    : classifier_(std::move(classifier)), config_(std::move(config)) {
    if (!classifier_) throw Finetype::ClassifierException("column classifier requires a value classifier");
    if (config_.sampleSize == 0) throw Finetype::ClassifierException("column classifier requires a sample size > 0");
}

ColumnResult ColumnClassifier::classifyColumn(const std::vector<std::string>& values) const {
    ColumnResult result;
    if (values.empty()) {
        result.label = "unknown";
        return result;
    }

    const auto sample = ColumnDisambiguation::sampleEvenly(values, config_.sampleSize);
    const size_t n = sample.size();
    const auto predictions = classifier_->classifyBatch(sample);
    if (predictions.size() != n) {
        throw Finetype::ClassifierException("classifier returned " + std::to_string(predictions.size()) +
                                            " results for " + std::to_string(n) + " values");
    }

    std::vector<std::pair<std::string, size_t>> votes;
    std::unordered_map<std::string, size_t> slot;
    for (const auto& prediction : predictions) {
        const auto [it, inserted] = slot.emplace(prediction.label, votes.size());
        if (inserted) votes.emplace_back(prediction.label, 0);
        ++votes[it->second].second;
    }
    std::stable_sort(votes.begin(), votes.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

    for (const auto& [label, count] : votes) {
        result.voteDistribution.emplace_back(label, static_cast<double>(count) / static_cast<double>(n));
    }
    result.samplesUsed = n;

    const double majorityFraction = result.voteDistribution.front().second;
    std::vector<std::string> topLabels;
    for (size_t i = 0; i < votes.size() && i < 3; ++i) topLabels.push_back(votes[i].first);

    if (auto outcome = ColumnDisambiguation::disambiguate(sample, topLabels, config_.numeric)) {
        result.label = std::move(outcome->label);
        result.confidence = std::max(majorityFraction, config_.ruleConfidenceFloor);
        result.disambiguationApplied = true;
        result.disambiguationRule = std::move(outcome->rule);
        return result;
    }

    result.label = votes.front().first;
    result.confidence = majorityFraction >= config_.minAgreement ? majorityFraction : majorityFraction * 0.5;
    return result;
}
