#include <gtest/gtest.h>

#include "FinetypeExceptions.h"
#include "Taxonomy.h"

#include <algorithm>
#include <string>

namespace {
const char* kTaxonomyYaml = R"(
technology.internet.ip_v4:
  title: "IPv4 address"
  broad_type: INET
  designation: universal
  tier: [VARCHAR, internet]
  release_priority: 4
  validation:
    type: string
    pattern: "^(\\d{1,3}\\.){3}\\d{1,3}$"
    minLength: 7
    maxLength: 15
  aliases: [ipv4, ip]
  samples: ["192.168.0.1", "10.0.0.1"]
  references: "https://www.rfc-editor.org/rfc/rfc791"

datetime.date.abbreviated_month:
  title: "Abbreviated month date"
  broad_type: DATE
  designation: locale_specific
  locales: [EN, FR]
  tier: [DATE, date]
  release_priority: 2
  samples: ["Jan 15, 2024"]

representation.numeric.integer_number:
  broad_type: BIGINT
  designation: broad_numbers
  validation:
    pattern: "^-?\\d+$"
  samples: [1, 42, -7]
)";
} // namespace

class TaxonomyTest : public ::testing::Test {
protected:
    void SetUp() override {
        taxonomy_ = Taxonomy::fromYaml(kTaxonomyYaml);
    }

    Taxonomy taxonomy_;
};

// Test parsing of the fields that make up a definition
TEST_F(TaxonomyTest, ParsesDefinitionFields) {
    ASSERT_EQ(taxonomy_.size(), 3u);
    const Definition* ip = taxonomy_.get("technology.internet.ip_v4");
    ASSERT_NE(ip, nullptr);
    EXPECT_EQ(ip->provider, "technology.internet");
    EXPECT_EQ(ip->method, "ip_v4");
    EXPECT_EQ(ip->label(), "technology.internet.ip_v4");
    EXPECT_EQ(ip->domain(), "technology");
    EXPECT_EQ(ip->title.value_or(""), "IPv4 address");
    EXPECT_EQ(ip->broadType.value_or(""), "INET");
    EXPECT_EQ(ip->releasePriority, 4);
    ASSERT_EQ(ip->tier.size(), 2u);
    EXPECT_EQ(ip->tier[0], "VARCHAR");
    EXPECT_EQ(ip->tier[1], "internet");
    ASSERT_TRUE(ip->validation.has_value());
    EXPECT_EQ(ip->validation->minLength.value_or(0), 7u);
    EXPECT_EQ(ip->validation->maxLength.value_or(0), 15u);
    EXPECT_EQ(ip->validation->schemaType.value_or(""), "string");
    EXPECT_TRUE(ip->hasPattern());
    EXPECT_EQ(ip->aliases.size(), 2u);
    ASSERT_EQ(ip->references.size(), 1u);
}

// Test designation defaults and locale lists
TEST_F(TaxonomyTest, DesignationAndLocales) {
    const Definition* month = taxonomy_.get("datetime.date.abbreviated_month");
    ASSERT_NE(month, nullptr);
    EXPECT_EQ(month->designation, Designation::LOCALE_SPECIFIC);
    ASSERT_EQ(month->locales.size(), 2u);
    EXPECT_EQ(month->locales[1], "FR");
    EXPECT_FALSE(month->hasPattern());

    const Definition* integer = taxonomy_.get("representation.numeric.integer_number");
    ASSERT_NE(integer, nullptr);
    EXPECT_EQ(integer->designation, Designation::BROAD_NUMBERS);
    EXPECT_EQ(integer->releasePriority, 0);
}

// Test that numeric samples are kept as their string form
TEST_F(TaxonomyTest, ScalarSamplesBecomeStrings) {
    const Definition* integer = taxonomy_.get("representation.numeric.integer_number");
    ASSERT_NE(integer, nullptr);
    ASSERT_EQ(integer->samples.size(), 3u);
    EXPECT_EQ(integer->samples[0], "1");
    EXPECT_EQ(integer->samples[2], "-7");
}

// Test the query helpers
TEST_F(TaxonomyTest, Queries) {
    EXPECT_EQ(taxonomy_.get("does.not.exist"), nullptr);
    EXPECT_EQ(taxonomy_.atPriority(3).size(), 1u);
    EXPECT_EQ(taxonomy_.atPriority(0).size(), 3u);
    EXPECT_EQ(taxonomy_.byDomain("datetime").size(), 1u);
    EXPECT_EQ(taxonomy_.byCategory("technology", "internet").size(), 1u);
    EXPECT_EQ(taxonomy_.byProvider("representation.numeric").size(), 1u);

    const auto domains = taxonomy_.domains();
    ASSERT_EQ(domains.size(), 3u);
    EXPECT_EQ(domains[0], "datetime");
    EXPECT_EQ(domains[2], "technology");

    const auto categories = taxonomy_.categories("technology");
    ASSERT_EQ(categories.size(), 1u);
    EXPECT_EQ(categories[0], "internet");
}

// Test that labels are sorted and the index maps are inverse
TEST_F(TaxonomyTest, LabelIndexRoundTrip) {
    const auto& labels = taxonomy_.labels();
    ASSERT_TRUE(std::is_sorted(labels.begin(), labels.end()));

    const auto toIndex = taxonomy_.labelToIndex();
    const auto toLabel = taxonomy_.indexToLabel();
    ASSERT_EQ(toIndex.size(), toLabel.size());
    for (size_t i = 0; i < toLabel.size(); ++i) {
        EXPECT_EQ(toIndex.at(toLabel[i]), i);
    }
}

// Test index stability across independent loads of the same text
TEST_F(TaxonomyTest, IndexStableAcrossLoads) {
    const Taxonomy again = Taxonomy::fromYaml(kTaxonomyYaml);
    EXPECT_EQ(again.indexToLabel(), taxonomy_.indexToLabel());
    EXPECT_EQ(again.labelToIndex(), taxonomy_.labelToIndex());
}

// Test label parsing
TEST(LabelTest, ParsesThreeAndFourSegments) {
    const auto label = Label::parse("datetime.date.iso");
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->provider, "datetime.date");
    EXPECT_EQ(label->method, "iso");
    EXPECT_EQ(label->domain(), "datetime");
    EXPECT_EQ(label->category(), "date");
    EXPECT_FALSE(label->hasLocale());

    const auto localized = Label::parse("datetime.date.abbreviated_month.FR");
    ASSERT_TRUE(localized.has_value());
    EXPECT_EQ(localized->locale, "FR");
    EXPECT_EQ(localized->base(), "datetime.date.abbreviated_month");
    EXPECT_EQ(localized->full(), "datetime.date.abbreviated_month.FR");
}

TEST(LabelTest, RejectsMalformedLabels) {
    EXPECT_FALSE(Label::parse("datetime").has_value());
    EXPECT_FALSE(Label::parse("datetime..iso").has_value());
    EXPECT_FALSE(Label::parse("a.b.c.lower").has_value());
    EXPECT_FALSE(Label::parse("a.b.c.D.e").has_value());

    const auto twoPart = Label::parse("provider.method");
    ASSERT_TRUE(twoPart.has_value());
    EXPECT_EQ(twoPart->provider, "provider");
    EXPECT_EQ(twoPart->method, "method");
}

// Test parse errors
TEST(TaxonomyErrorTest, RejectsNonMappingRoot) {
    EXPECT_THROW(Taxonomy::fromYaml("- just\n- a list\n"), Finetype::ParseException);
}

TEST(TaxonomyErrorTest, RejectsInvalidYaml) {
    EXPECT_THROW(Taxonomy::fromYaml("key: [unterminated\n"), Finetype::ParseException);
}

TEST(TaxonomyErrorTest, RejectsInvalidKey) {
    EXPECT_THROW(Taxonomy::fromYaml("nodots:\n  title: x\n"), Finetype::ParseException);
    EXPECT_THROW(Taxonomy::fromYaml("a.b.c.EN:\n  title: x\n"), Finetype::ParseException);
}

TEST(TaxonomyErrorTest, RejectsPriorityOutOfRange) {
    EXPECT_THROW(Taxonomy::fromYaml("a.b.c:\n  release_priority: 300\n"), Finetype::ParseException);
}

TEST(TaxonomyErrorTest, RejectsUnknownDesignation) {
    EXPECT_THROW(Taxonomy::fromYaml("a.b.c:\n  designation: sometimes\n"), Finetype::ParseException);
}

TEST(TaxonomyErrorTest, MissingFileIsIOError) {
    EXPECT_THROW(Taxonomy::fromFile("/nonexistent/finetype/labels.yaml"), Finetype::IOException);
}

// Test loading a directory of definitions_*.yaml files
TEST(TaxonomyDirectoryTest, MergesFilesInSortedOrder) {
    const Taxonomy taxonomy = Taxonomy::fromDirectory(std::string(FINETYPE_TEST_DATA_DIR) + "/taxonomy");
    EXPECT_EQ(taxonomy.size(), 4u);
    EXPECT_EQ(taxonomy.get("not.a.definition"), nullptr);

    // definitions_technology.yaml sorts after definitions_datetime.yaml and wins.
    const Definition* year = taxonomy.get("datetime.component.year");
    ASSERT_NE(year, nullptr);
    EXPECT_EQ(year->title.value_or(""), "Year (overridden)");
    EXPECT_EQ(year->releasePriority, 0);
}

TEST(TaxonomyDirectoryTest, MissingDirectoryIsIOError) {
    EXPECT_THROW(Taxonomy::fromDirectory("/nonexistent/finetype/labels"), Finetype::IOException);
}

TEST(TaxonomyDirectoryTest, DirectoryWithoutDefinitionsIsIOError) {
    EXPECT_THROW(Taxonomy::fromDirectory(FINETYPE_TEST_DATA_DIR), Finetype::IOException);
}
