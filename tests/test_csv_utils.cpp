#include <gtest/gtest.h>

#include "CSVUtils.h"
#include "FinetypeExceptions.h"
#include "Validator.h"

#include <sstream>

using CSVUtils::parseCSVLine;

TEST(CSVUtilsTest, SplitsAndTrimsUnquotedFields) {
    std::istringstream in(" a , b,c\n");
    EXPECT_EQ(parseCSVLine(in, ','), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(parseCSVLine(in, ',').empty());
}

// Test quoting: embedded delimiters, doubled quotes, newlines and kept spaces
TEST(CSVUtilsTest, QuotedFields) {
    std::istringstream in("\"x, y\",\"say \"\"hi\"\"\",\" padded \"\n\"two\nlines\",z\r\n");
    EXPECT_EQ(parseCSVLine(in, ','), (std::vector<std::string>{"x, y", "say \"hi\"", " padded "}));
    EXPECT_EQ(parseCSVLine(in, ','), (std::vector<std::string>{"two\nlines", "z"}));
}

TEST(CSVUtilsTest, EmptyFieldsAreKept) {
    std::istringstream in("a,,c,\n");
    EXPECT_EQ(parseCSVLine(in, ','), (std::vector<std::string>{"a", "", "c", ""}));
}

TEST(CSVUtilsTest, CustomDelimiter) {
    std::istringstream in("a;b\tc\n");
    EXPECT_EQ(parseCSVLine(in, ';'), (std::vector<std::string>{"a", "b\tc"}));
}

TEST(CSVUtilsTest, UnterminatedQuoteIsMalformed) {
    std::istringstream in("a,\"never closed\n");
    CSVUtils::LineStatus status;
    parseCSVLine(in, ',', &status);
    EXPECT_TRUE(status.malformed);
}

TEST(CSVUtilsTest, FieldLimit) {
    CSVUtils::ParseLimits limits;
    limits.maxFieldBytes = 4;
    std::istringstream in("abcdefgh,x\n");
    CSVUtils::LineStatus status;
    parseCSVLine(in, ',', &status, limits);
    EXPECT_TRUE(status.limitExceeded);
}

TEST(CSVUtilsTest, SkipBOM) {
    std::istringstream withBom("\xEF\xBB\xBFname\n");
    CSVUtils::skipBOM(withBom);
    EXPECT_EQ(parseCSVLine(withBom, ','), (std::vector<std::string>{"name"}));

    std::istringstream withoutBom("name\n");
    CSVUtils::skipBOM(withoutBom);
    EXPECT_EQ(parseCSVLine(withoutBom, ','), (std::vector<std::string>{"name"}));
}

TEST(CSVUtilsTest, NormalizeHeader) {
    EXPECT_EQ(CSVUtils::normalizeHeader({"id", "", "id", " name ", "id"}),
              (std::vector<std::string>{"id", "column_2", "id_2", "name", "id_3"}));
}

TEST(CSVUtilsTest, MissingTokens) {
    for (const char* token : {"", "  ", "NA", "n/a", "NULL", "None", "NaN", "-"}) {
        EXPECT_TRUE(CSVUtils::isMissingToken(token)) << token;
    }
    for (const char* token : {"0", "nil", "--", "false"}) {
        EXPECT_FALSE(CSVUtils::isMissingToken(token)) << token;
    }
}

// Test column extraction with nulls, short rows and blank lines
// Test that every data record yields exactly one entry, blank lines included
TEST(CSVUtilsTest, ReadColumn) {
    std::istringstream in("\xEF\xBB\xBFid,when,note\n"
                          "1,2024-01-15,a\n"
                          "2,NA,b\n"
                          "\n"
                          "3\n"
                          "4,\"2024-02-01\",c\n"
                          "5,,d\n");
    const auto values = CSVUtils::readColumn(in, ',', "when", true);
    ASSERT_EQ(values.size(), 6u);
    EXPECT_EQ(values[0], std::optional<std::string>("2024-01-15"));
    EXPECT_FALSE(values[1].has_value());
    EXPECT_FALSE(values[2].has_value());
    EXPECT_FALSE(values[3].has_value());
    EXPECT_EQ(values[4], std::optional<std::string>("2024-02-01"));
    EXPECT_FALSE(values[5].has_value());
}

// Test that missing-value tokens stay literal unless asked for
TEST(CSVUtilsTest, ReadColumnKeepsMissingTokensByDefault) {
    const std::string csv = "id,reading\n1,-\n2,NaN\n3,null\n4,\n5,7.5\n";

    std::istringstream literal(csv);
    const auto kept = CSVUtils::readColumn(literal, ',', "reading");
    ASSERT_EQ(kept.size(), 5u);
    EXPECT_EQ(kept[0], std::optional<std::string>("-"));
    EXPECT_EQ(kept[1], std::optional<std::string>("NaN"));
    EXPECT_EQ(kept[2], std::optional<std::string>("null"));
    EXPECT_FALSE(kept[3].has_value());
    EXPECT_EQ(kept[4], std::optional<std::string>("7.5"));

    std::istringstream nulled(csv);
    const auto missing = CSVUtils::readColumn(nulled, ',', "reading", true);
    ASSERT_EQ(missing.size(), 5u);
    EXPECT_FALSE(missing[0].has_value());
    EXPECT_FALSE(missing[1].has_value());
    EXPECT_FALSE(missing[2].has_value());
    EXPECT_EQ(missing[4], std::optional<std::string>("7.5"));
}

// Test that quarantine row indices line up with data records across blank lines
TEST(CSVUtilsTest, BlankLinesKeepRowIndices) {
    std::istringstream in("port\n80\n\nabc\n443\n\n\nxyz\n");
    const auto values = CSVUtils::readColumn(in, ',', "port");
    ASSERT_EQ(values.size(), 7u);

    Validation digits;
    digits.pattern = "^\\d+$";
    const auto result = Validator::validateColumn(values, digits, InvalidStrategy::QUARANTINE);
    ASSERT_EQ(result.quarantined.size(), 2u);
    EXPECT_EQ(result.quarantined[0].rowIndex, 2u);
    EXPECT_EQ(result.quarantined[0].value, "abc");
    EXPECT_EQ(result.quarantined[1].rowIndex, 6u);
    EXPECT_EQ(result.stats.nullCount, 3u);
}

TEST(CSVUtilsTest, ReadLinesSkipsEmptyLines) {
    std::istringstream in("\xEF\xBB\xBF" "2024-01-15\r\n\nhello world\n  \n8080");
    EXPECT_EQ(CSVUtils::readLines(in), (std::vector<std::string>{"2024-01-15", "hello world", "  ", "8080"}));
}

TEST(CSVUtilsTest, ReadColumnErrors) {
    std::istringstream empty("");
    EXPECT_THROW(CSVUtils::readColumn(empty, ',', "x"), Finetype::IOException);

    std::istringstream noColumn("a,b\n1,2\n");
    try {
        CSVUtils::readColumn(noColumn, ',', "c");
        FAIL() << "expected IOException";
    } catch (const Finetype::IOException& ex) {
        EXPECT_EQ(std::string(ex.what()), "Column not found in CSV header: c");
    }

    std::istringstream unterminated("a,b\n1,\"2\n");
    EXPECT_THROW(CSVUtils::readColumn(unterminated, ',', "b"), Finetype::ParseException);
}
