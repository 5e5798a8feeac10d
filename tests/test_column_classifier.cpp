#include <gtest/gtest.h>

#include "ColumnClassifier.h"
#include "FinetypeExceptions.h"
#include "fake_classifier.h"

#include <memory>

using namespace ColumnDisambiguation;

namespace {
std::shared_ptr<FunctionClassifier> constant(const std::string& label) {
    return std::make_shared<FunctionClassifier>([label](const std::string&) { return label; });
}

// Leading '0' votes month-first, anything else day-first.
std::shared_ptr<FunctionClassifier> slashVoter() {
    return std::make_shared<FunctionClassifier>(
        [](const std::string& text) { return text.front() == '0' ? kUsSlash : kEuSlash; });
}
} // namespace

class ColumnClassifierTest : public ::testing::Test {
protected:
    ColumnConfig config_;
};

TEST_F(ColumnClassifierTest, EmptyColumnIsUnknown) {
    const ColumnClassifier classifier(constant("x"), config_);
    const auto result = classifier.classifyColumn({});
    EXPECT_EQ(result.label, "unknown");
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.samplesUsed, 0u);
    EXPECT_TRUE(result.voteDistribution.empty());
    EXPECT_FALSE(result.disambiguationApplied);
}

TEST_F(ColumnClassifierTest, RequiresClassifier) {
    EXPECT_THROW(ColumnClassifier(nullptr, config_), Finetype::ClassifierException);
}

TEST_F(ColumnClassifierTest, RejectsZeroSampleSize) {
    config_.sampleSize = 0;
    EXPECT_THROW(ColumnClassifier(constant(kIntegerNumber), config_), Finetype::ClassifierException);
}

// Test that a day above 12 in the first field settles a mixed slash vote
TEST_F(ColumnClassifierTest, SlashDatesDayFirst) {
    const ColumnClassifier classifier(slashVoter(), config_);
    const auto result =
        classifier.classifyColumn({"15/01/2024", "20/02/2024", "03/04/2024", "07/08/2024", "25/12/2024"});
    EXPECT_EQ(result.label, kEuSlash);
    EXPECT_TRUE(result.disambiguationApplied);
    ASSERT_TRUE(result.disambiguationRule.has_value());
    EXPECT_EQ(*result.disambiguationRule, "date_slash_disambiguation");
    EXPECT_DOUBLE_EQ(result.confidence, 0.8);
}

TEST_F(ColumnClassifierTest, SlashDatesMonthFirst) {
    const ColumnClassifier classifier(slashVoter(), config_);
    const auto result = classifier.classifyColumn({"01/15/2024", "02/20/2024", "12/25/2024", "03/04/2024"});
    EXPECT_EQ(result.label, kUsSlash);
    EXPECT_EQ(*result.disambiguationRule, "date_slash_disambiguation");
}

// Test that the majority stands when no value decides the order
TEST_F(ColumnClassifierTest, AmbiguousSlashDatesKeepMajority) {
    const ColumnClassifier classifier(slashVoter(), config_);
    const auto result = classifier.classifyColumn({"01/02/2024", "03/04/2024", "11/12/2024"});
    EXPECT_EQ(result.label, kUsSlash);
    EXPECT_FALSE(result.disambiguationApplied);
    EXPECT_NEAR(result.confidence, 2.0 / 3.0, 1e-12);
}

TEST_F(ColumnClassifierTest, SequentialIntegersAreIncrement) {
    const ColumnClassifier classifier(constant(kIntegerNumber), config_);
    const auto result = classifier.classifyColumn({"1", "2", "3", "4", "5", "6", "7", "8", "9", "10"});
    EXPECT_EQ(result.label, kIncrement);
    EXPECT_EQ(*result.disambiguationRule, "numeric_sequential_detection");
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
}

// Test that year detection runs before the sequential check
TEST_F(ColumnClassifierTest, YearsBeatSequence) {
    const ColumnClassifier classifier(constant(kIntegerNumber), config_);
    const auto result = classifier.classifyColumn(
        {"2015", "2016", "2017", "2018", "2019", "2020", "2021", "2022", "2023", "2024"});
    EXPECT_EQ(result.label, kYear);
    EXPECT_EQ(*result.disambiguationRule, "numeric_year_detection");
}

TEST_F(ColumnClassifierTest, CommonPortsArePorts) {
    const ColumnClassifier classifier(constant(kIntegerNumber), config_);
    const auto result = classifier.classifyColumn({"80", "443", "8080", "22", "3306"});
    EXPECT_EQ(result.label, kPort);
    EXPECT_EQ(*result.disambiguationRule, "numeric_port_detection");
}

TEST_F(ColumnClassifierTest, FixedWidthCodesArePostal) {
    const ColumnClassifier classifier(constant(kIntegerNumber), config_);
    const auto result = classifier.classifyColumn({"10001", "10002", "94105", "60614", "30301"});
    EXPECT_EQ(result.label, kPostalCode);
    EXPECT_EQ(*result.disambiguationRule, "numeric_postal_code_detection");
}

TEST_F(ColumnClassifierTest, StreetNumbersNeedTheirLabelInTheVote) {
    const std::vector<std::string> values = {"12", "345", "7", "1500"};
    const auto outcome = resolveNumeric(values, {kStreetNumber}, NumericRuleTuning{});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->label, kStreetNumber);
    EXPECT_EQ(outcome->rule, "numeric_street_number_detection");

    EXPECT_FALSE(resolveNumeric(values, {kIntegerNumber}, NumericRuleTuning{}).has_value());
    EXPECT_FALSE(resolveNumeric(values, {"representation.text.word"}, NumericRuleTuning{}).has_value());
}

TEST_F(ColumnClassifierTest, NumericRuleNeedsEnoughParsedValues) {
    EXPECT_FALSE(resolveNumeric({"1", "2", "x"}, {kIntegerNumber}, NumericRuleTuning{}).has_value());
}

// Test that the year thresholds come from the tuning
TEST_F(ColumnClassifierTest, TunableYearRange) {
    NumericRuleTuning tuning;
    tuning.yearMin = 2000;
    const auto outcome = resolveNumeric({"1990", "1991", "1993", "1997"}, {kIntegerNumber}, tuning);
    EXPECT_TRUE(!outcome || outcome->label != kYear);
}

TEST_F(ColumnClassifierTest, Coordinates) {
    const auto voter = std::make_shared<FunctionClassifier>(
        [](const std::string& text) { return text.front() == '-' ? kLatitude : kLongitude; });
    const ColumnClassifier classifier(voter, config_);

    const auto longitude = classifier.classifyColumn({"45.1", "-33.9", "120.5", "10.0"});
    EXPECT_EQ(longitude.label, kLongitude);
    EXPECT_EQ(*longitude.disambiguationRule, "coordinate_disambiguation");

    const auto latitude = classifier.classifyColumn({"45.1", "-33.9", "-12.0", "-10.0"});
    EXPECT_EQ(latitude.label, kLatitude);

    EXPECT_FALSE(resolveCoordinates({"45.1", "-33.9"}).has_value());
    EXPECT_FALSE(resolveCoordinates({"45.1", "-33.9", "12.5", "north"}).has_value());
}

TEST_F(ColumnClassifierTest, ShortDates) {
    EXPECT_EQ(resolveShortDates({"25-01-24", "03-04-24"}), std::optional<std::string>(kShortDmy));
    EXPECT_EQ(resolveShortDates({"01-25-24", "03-04-24"}), std::optional<std::string>(kShortMdy));
    EXPECT_FALSE(resolveShortDates({"01-02-24"}).has_value());
}

// Test the halved confidence under low agreement
TEST_F(ColumnClassifierTest, LowAgreementHalvesConfidence) {
    const auto voter =
        std::make_shared<FunctionClassifier>([](const std::string& text) { return "representation.text." + text; });
    const ColumnClassifier classifier(voter, config_);
    const auto result = classifier.classifyColumn({"a", "b", "c", "d", "e", "f", "g", "h", "i", "j"});
    EXPECT_EQ(result.label, "representation.text.a");
    EXPECT_DOUBLE_EQ(result.confidence, 0.05);
    EXPECT_FALSE(result.disambiguationApplied);
    EXPECT_FALSE(result.disambiguationRule.has_value());
}

TEST_F(ColumnClassifierTest, VoteDistributionIsSortedWithStableTies) {
    const ColumnClassifier classifier(
        std::make_shared<TableClassifier>(std::unordered_map<std::string, std::string>{
            {"b", "beta"}, {"a", "alpha"}, {"c", "gamma"}}),
        config_);
    const auto result = classifier.classifyColumn({"b", "a", "c", "a", "c"});
    ASSERT_EQ(result.voteDistribution.size(), 3u);
    EXPECT_EQ(result.voteDistribution[0].first, "alpha");
    EXPECT_EQ(result.voteDistribution[1].first, "gamma");
    EXPECT_EQ(result.voteDistribution[2].first, "beta");
    EXPECT_DOUBLE_EQ(result.voteDistribution[0].second, 0.4);
    EXPECT_EQ(result.label, "alpha");
    EXPECT_DOUBLE_EQ(result.confidence, 0.4);
}

TEST_F(ColumnClassifierTest, SampleEvenlyUsesFixedStride) {
    const std::vector<std::string> values = {"0", "1", "2", "3", "4", "5", "6", "7", "8", "9"};
    EXPECT_EQ(sampleEvenly(values, 4), (std::vector<std::string>{"0", "2", "5", "7"}));
    EXPECT_EQ(sampleEvenly(values, 10), values);
    EXPECT_EQ(sampleEvenly(values, 50), values);
}

TEST_F(ColumnClassifierTest, ClassifiesOnlyTheSample) {
    config_.sampleSize = 4;
    const auto table = std::make_shared<TableClassifier>(std::unordered_map<std::string, std::string>{}, "word");
    const ColumnClassifier classifier(table, config_);
    std::vector<std::string> values;
    for (int i = 0; i < 40; ++i) values.push_back("v" + std::to_string(i));

    const auto result = classifier.classifyColumn(values);
    EXPECT_EQ(result.samplesUsed, 4u);
    EXPECT_EQ(table->calls(), 4u);
}

TEST_F(ColumnClassifierTest, ClassifierErrorsPropagate) {
    const ColumnClassifier failing(std::make_shared<FailingClassifier>(), config_);
    EXPECT_THROW(failing.classifyColumn({"a", "b"}), Finetype::ClassifierException);

    const ColumnClassifier shortBatch(std::make_shared<ShortBatchClassifier>(), config_);
    EXPECT_THROW(shortBatch.classifyColumn({"a", "b"}), Finetype::ClassifierException);
}
