#pragma once

#include "Classifier.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Thresholds for the numeric family rule. Defaults are the tuned values.
struct NumericRuleTuning {
    size_t minParsedValues = 3;
    // Year-like: at least this fraction of values are yearDigits-digit integers in [yearMin, yearMax].
    double yearFraction = 0.8;
    int64_t yearMin = 1900;
    int64_t yearMax = 2100;
    size_t yearDigits = 4;
    // Sequential when the variance of successive differences is below (mean diff * factor)^2.
    double sequentialVarianceFactor = 0.5;
    std::vector<int64_t> commonPorts = {80, 443, 8080, 3306, 5432, 22, 21, 25, 53, 3000, 8000, 8443};
    int64_t portMax = 65535;
    int64_t postalMin = 100;
    int64_t postalMax = 99999;
    int64_t streetMax = 100000;
};

struct ColumnConfig {
    size_t sampleSize = 100;
    double minAgreement = 0.3;
    // Confidence floor applied when a disambiguation rule decides the column.
    double ruleConfidenceFloor = 0.8;
    NumericRuleTuning numeric;
};

struct ColumnResult {
    std::string label;
    double confidence = 0.0;
    std::vector<std::pair<std::string, double>> voteDistribution;
    bool disambiguationApplied = false;
    std::optional<std::string> disambiguationRule;
    size_t samplesUsed = 0;
};

namespace ColumnDisambiguation {

struct RuleOutcome {
    std::string label;
    std::string rule;
};

inline constexpr const char* kUsSlash = "datetime.date.us_slash";
inline constexpr const char* kEuSlash = "datetime.date.eu_slash";
inline constexpr const char* kShortMdy = "datetime.date.short_mdy";
inline constexpr const char* kShortDmy = "datetime.date.short_dmy";
inline constexpr const char* kLatitude = "geography.coordinate.latitude";
inline constexpr const char* kLongitude = "geography.coordinate.longitude";
inline constexpr const char* kPort = "technology.internet.port";
inline constexpr const char* kIncrement = "representation.numeric.increment";
inline constexpr const char* kIntegerNumber = "representation.numeric.integer_number";
inline constexpr const char* kDecimalNumber = "representation.numeric.decimal_number";
inline constexpr const char* kPostalCode = "geography.address.postal_code";
inline constexpr const char* kStreetNumber = "geography.address.street_number";
inline constexpr const char* kYear = "datetime.component.year";

/// Evenly spaced deterministic sample: index floor(i * len / sampleSize).
std::vector<std::string> sampleEvenly(const std::vector<std::string>& values, size_t sampleSize);

/// Field1 > 12 anywhere -> day first (eu_slash); field2 > 12 anywhere -> us_slash; otherwise undecided.
std::optional<std::string> resolveSlashDates(const std::vector<std::string>& values);
/// Same test on '-' separated values, deciding short_dmy against short_mdy.
std::optional<std::string> resolveShortDates(const std::vector<std::string>& values);
/// Needs at least 3 numeric values; any |v| > 90 is longitude, all numeric and within 90 is latitude.
std::optional<std::string> resolveCoordinates(const std::vector<std::string>& values);

/**
 * @brief Numeric family rule: year, increment, port, postal code, street number.
 *
 * Engages only when one of the numeric family labels is among topLabels.
 */
std::optional<RuleOutcome> resolveNumeric(const std::vector<std::string>& values,
                                          const std::vector<std::string>& topLabels,
                                          const NumericRuleTuning& tuning);

/// Rules in fixed order; the first one that resolves wins.
std::optional<RuleOutcome> disambiguate(const std::vector<std::string>& values,
                                        const std::vector<std::string>& topLabels,
                                        const NumericRuleTuning& tuning);

} // namespace ColumnDisambiguation

/**
 * @brief Resolves per-value predictions into one column-level type.
 *
 * Samples the column, batch-classifies the sample, tallies votes (ties keep
 * first-seen order) and lets the disambiguation rules override the majority.
 */
class ColumnClassifier {
public:
    /// @throws Finetype::ClassifierException for a null classifier or a zero sample size.
    explicit ColumnClassifier(std::shared_ptr<const ValueClassifier> classifier, ColumnConfig config = ColumnConfig{});

    /// @throws Finetype::ClassifierException when the underlying classifier fails.
    ColumnResult classifyColumn(const std::vector<std::string>& values) const;

    const ColumnConfig& config() const { return config_; }
    const ValueClassifier& classifier() const { return *classifier_; }

private:
    std::shared_ptr<const ValueClassifier> classifier_;
    ColumnConfig config_;
};
