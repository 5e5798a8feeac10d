#include <gtest/gtest.h>

#include "FinetypeExceptions.h"
#include "Generator.h"
#include "Taxonomy.h"

#include <algorithm>
#include <set>

namespace {
const char* kGeneratorYaml = R"(
technology.development.boolean:
  release_priority: 5
  samples: ["true", "false"]
datetime.date.abbreviated_month:
  designation: locale_specific
  locales: [EN, FR]
  release_priority: 3
  samples: ["Jan 15, 2024", "15 janv. 2024"]
identity.person.email:
  release_priority: 1
  samples: ["a@example.com"]
representation.text.word:
  release_priority: 5
)";

// Records the locale seen by every call.
class LocaleRecordingGenerator : public SampleGenerator {
public:
    std::string generate(const std::string& provider, const std::string& method) override {
        calls.push_back(provider + "." + method + "@" + locale_.value_or("-"));
        return "v";
    }
    void setLocale(const std::optional<std::string>& locale) override { locale_ = locale; }

    std::vector<std::string> calls;

private:
    std::optional<std::string> locale_;
};
} // namespace

class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        taxonomy_ = Taxonomy::fromYaml(kGeneratorYaml);
    }

    Taxonomy taxonomy_;
};

// Test that generated values come from the definition's samples
TEST_F(GeneratorTest, ReplaysDefinitionSamples) {
    DefinitionSampleGenerator generator(taxonomy_, 42);
    const std::set<std::string> allowed = {"true", "false"};
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(allowed.count(generator.generate("technology.development", "boolean")), 1u);
    }
}

// Test determinism under a fixed seed
TEST_F(GeneratorTest, SameSeedSameSequence) {
    DefinitionSampleGenerator a(taxonomy_, 7);
    DefinitionSampleGenerator b(taxonomy_, 7);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.generate("datetime.date", "abbreviated_month"), b.generate("datetime.date", "abbreviated_month"));
    }
}

// Test the error kinds that mean "no generator"
TEST_F(GeneratorTest, MissingGeneratorKinds) {
    DefinitionSampleGenerator generator(taxonomy_, 1);
    try {
        generator.generate("no.such", "label");
        FAIL() << "expected GeneratorException";
    } catch (const Finetype::GeneratorException& ex) {
        EXPECT_EQ(ex.kind(), Finetype::GeneratorException::Kind::UNKNOWN_LABEL);
    }
    try {
        generator.generate("representation.text", "word");
        FAIL() << "expected GeneratorException";
    } catch (const Finetype::GeneratorException& ex) {
        EXPECT_EQ(ex.kind(), Finetype::GeneratorException::Kind::NOT_IMPLEMENTED);
    }
}

TEST_F(GeneratorTest, GenerateValueSplitsKey) {
    DefinitionSampleGenerator generator(taxonomy_, 1);
    EXPECT_EQ(SampleGeneration::generateValue(generator, "identity.person.email"), "a@example.com");
    EXPECT_THROW(SampleGeneration::generateValue(generator, "nodots"), Finetype::GeneratorException);
}

// Test bulk generation: sorted labels, priority filter, missing generators skipped
TEST_F(GeneratorTest, GenerateAll) {
    DefinitionSampleGenerator generator(taxonomy_, 42);
    const auto samples = SampleGeneration::generateAll(generator, taxonomy_, 3, 4);
    ASSERT_EQ(samples.size(), 8u);
    EXPECT_EQ(samples.front().label, "datetime.date.abbreviated_month");
    EXPECT_EQ(samples.back().label, "technology.development.boolean");
    EXPECT_TRUE(std::none_of(samples.begin(), samples.end(), [](const Sample& s) {
        return s.label == "representation.text.word" || s.label == "identity.person.email";
    }));
}

// Test four-segment labels for localized generation
TEST_F(GeneratorTest, GenerateAllLocalized) {
    DefinitionSampleGenerator generator(taxonomy_, 42);
    const auto samples = SampleGeneration::generateAllLocalized(generator, taxonomy_, 0, 2);
    ASSERT_EQ(samples.size(), 2u * 2u + 2u + 2u);
    EXPECT_EQ(samples[0].label, "datetime.date.abbreviated_month.EN");
    EXPECT_EQ(samples[2].label, "datetime.date.abbreviated_month.FR");
    EXPECT_EQ(samples[4].label, "identity.person.email.UNIVERSAL");
    EXPECT_EQ(samples[6].label, "technology.development.boolean.UNIVERSAL");
    EXPECT_FALSE(generator.locale().has_value());
}

TEST_F(GeneratorTest, LocalizedGenerationSetsLocale) {
    LocaleRecordingGenerator generator;
    SampleGeneration::generateAllLocalized(generator, taxonomy_, 3, 1);
    ASSERT_EQ(generator.calls.size(), 4u);
    EXPECT_EQ(generator.calls[0], "datetime.date.abbreviated_month@EN");
    EXPECT_EQ(generator.calls[1], "datetime.date.abbreviated_month@FR");
    EXPECT_EQ(generator.calls[2], "representation.text.word@-");
    EXPECT_EQ(generator.calls[3], "technology.development.boolean@-");
}
