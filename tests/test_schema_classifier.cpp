#include <gtest/gtest.h>

#include "SchemaClassifier.h"
#include "Taxonomy.h"

namespace {
const char* kSchemaYaml = R"(
technology.internet.ip_v4:
  release_priority: 4
  validation:
    pattern: "^(\\d{1,3}\\.){3}\\d{1,3}$"
    minLength: 7
representation.numeric.integer_number:
  release_priority: 1
  validation:
    pattern: "^-?\\d+$"
technology.internet.port:
  release_priority: 1
  validation:
    pattern: "^\\d{1,5}$"
    maximum: 65535
technology.development.boolean:
  release_priority: 3
  validation:
    enum: ["true", "false"]
identity.person.email:
  release_priority: 2
  validation:
    pattern: "^[^@\\s]+@[^@\\s]+\\.[a-z]+$"
broken.schema.type:
  release_priority: 5
  validation:
    pattern: "(["
)";
} // namespace

class SchemaClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        taxonomy_ = Taxonomy::fromYaml(kSchemaYaml);
    }

    Taxonomy taxonomy_;
};

// Test candidate selection: pattern required, broken patterns skipped
TEST_F(SchemaClassifierTest, Candidates) {
    const SchemaClassifier classifier(taxonomy_);
    EXPECT_EQ(classifier.candidateCount(), 4u);
    ASSERT_EQ(classifier.skippedLabels().size(), 1u);
    EXPECT_EQ(classifier.skippedLabels()[0], "broken.schema.type");

    const SchemaClassifier highPriority(taxonomy_, 3);
    EXPECT_EQ(highPriority.candidateCount(), 1u);
}

// Test that the only matching schema wins
TEST_F(SchemaClassifierTest, SingleMatch) {
    const SchemaClassifier classifier(taxonomy_);
    const auto ip = classifier.classify("192.168.1.1");
    EXPECT_EQ(ip.label, "technology.internet.ip_v4");
    EXPECT_DOUBLE_EQ(ip.confidence, 1.0);

    EXPECT_EQ(classifier.classify("user@example.com").label, "identity.person.email");
}

// Test that specificity breaks a tie between equal priorities
TEST_F(SchemaClassifierTest, LongerPatternBreaksTie) {
    const SchemaClassifier classifier(taxonomy_);
    const auto result = classifier.classify("8080");
    ASSERT_EQ(result.allScores.size(), 2u);
    EXPECT_EQ(result.label, "technology.internet.port");
    EXPECT_EQ(result.allScores[1].first, "representation.numeric.integer_number");
    EXPECT_DOUBLE_EQ(result.confidence, 0.5);
    EXPECT_DOUBLE_EQ(result.allScores[0].second + result.allScores[1].second, 1.0);
}

// Test that the full schema, not only the pattern, gates a vote
TEST_F(SchemaClassifierTest, FullSchemaMustAccept) {
    const SchemaClassifier classifier(taxonomy_);
    const auto result = classifier.classify("99999");
    EXPECT_EQ(result.label, "representation.numeric.integer_number");
    EXPECT_EQ(result.allScores.size(), 1u);
}

TEST_F(SchemaClassifierTest, NoMatchIsUnknown) {
    const SchemaClassifier classifier(taxonomy_);
    const auto result = classifier.classify("hello world");
    EXPECT_EQ(result.label, "unknown");
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_TRUE(result.allScores.empty());
}

// Test the default batch path preserves order and length
TEST_F(SchemaClassifierTest, BatchPreservesOrder) {
    const SchemaClassifier classifier(taxonomy_);
    const auto results = classifier.classifyBatch({"10.0.0.1", "nope", "-5"});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].label, "technology.internet.ip_v4");
    EXPECT_EQ(results[1].label, "unknown");
    EXPECT_EQ(results[2].label, "representation.numeric.integer_number");
}
