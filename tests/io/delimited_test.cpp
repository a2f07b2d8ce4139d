// =============================================================================
// seqcov - Delimited Text Utility Tests
// =============================================================================

#include "seqcov/io/delimited.h"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

namespace seqcov::io {
namespace {

TEST(DelimitedTest, DetectDelimiterPrefersTab) {
    EXPECT_EQ(detectDelimiter("sample_id\tgenome_size_bp"), '\t');
    EXPECT_EQ(detectDelimiter("sample_id,genome_size_bp"), ',');
    EXPECT_EQ(detectDelimiter("a,b\tc"), '\t');
}

TEST(DelimitedTest, SplitFieldsKeepsEmptyFields) {
    auto fields = splitFields("a,,c,", ',');
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "");
    EXPECT_EQ(fields[2], "c");
    EXPECT_EQ(fields[3], "");
}

TEST(DelimitedTest, SplitQuotedFieldsHonoursQuotes) {
    auto fields = splitQuotedFields(R"(A1, "E. coli, K-12" ,4.6,"say ""hi""",)", ',');
    ASSERT_TRUE(fields.has_value());
    ASSERT_EQ(fields->size(), 5u);
    EXPECT_EQ((*fields)[0], "A1");
    EXPECT_EQ((*fields)[1], "E. coli, K-12");
    EXPECT_EQ((*fields)[2], "4.6");
    EXPECT_EQ((*fields)[3], "say \"hi\"");
    EXPECT_EQ((*fields)[4], "");
}

TEST(DelimitedTest, SplitQuotedFieldsWithTabs) {
    auto fields = splitQuotedFields("S1\t\t\" a\tb \"", '\t');
    ASSERT_TRUE(fields.has_value());
    ASSERT_EQ(fields->size(), 3u);
    EXPECT_EQ((*fields)[1], "");
    EXPECT_EQ((*fields)[2], " a\tb ");
}

TEST(DelimitedTest, SplitQuotedFieldsRejectsUnterminatedQuote) {
    EXPECT_FALSE(splitQuotedFields("S1,\"open,100", ',').has_value());
}

TEST(DelimitedTest, StripByteOrderMark) {
    std::string line = "\xEF\xBB\xBFsample_id";
    stripByteOrderMark(line);
    EXPECT_EQ(line, "sample_id");
    stripByteOrderMark(line);
    EXPECT_EQ(line, "sample_id");
}

TEST(DelimitedTest, TrimFieldStripsWhitespaceAndQuotes) {
    EXPECT_EQ(trimField("  S1 "), "S1");
    EXPECT_EQ(trimField("\"barcode01\""), "barcode01");
    EXPECT_EQ(trimField(" \" x \" "), " x ");
    EXPECT_EQ(trimField("\""), "\"");
}

TEST(DelimitedTest, StripCarriageReturn) {
    std::string line = "S1,100\r";
    stripCarriageReturn(line);
    EXPECT_EQ(line, "S1,100");
}

TEST(DelimitedTest, ParseUnsigned) {
    EXPECT_EQ(parseUnsigned("8000"), 8000u);
    EXPECT_EQ(parseUnsigned("0"), 0u);
    EXPECT_FALSE(parseUnsigned("").has_value());
    EXPECT_FALSE(parseUnsigned("-5").has_value());
    EXPECT_FALSE(parseUnsigned("+5").has_value());
    EXPECT_FALSE(parseUnsigned("12abc").has_value());
    EXPECT_FALSE(parseUnsigned("1.5").has_value());
    EXPECT_FALSE(parseUnsigned("99999999999999999999999").has_value());
}

TEST(DelimitedTest, ParseDecimal) {
    EXPECT_DOUBLE_EQ(*parseDecimal("4.6"), 4.6);
    EXPECT_DOUBLE_EQ(*parseDecimal("-1"), -1.0);
    EXPECT_FALSE(parseDecimal("abc").has_value());
    EXPECT_FALSE(parseDecimal("inf").has_value());
    EXPECT_FALSE(parseDecimal("nan").has_value());
}

TEST(DelimitedTest, FindColumnHonorsNamePriority) {
    std::vector<std::string_view> header = {"Lane", "Barcode", "genome_size_bp"};
    std::array<std::string_view, 2> names = {"barcode", "lane"};

    EXPECT_EQ(findColumn(header, names), 1u);

    std::array<std::string_view, 1> missing = {"alias"};
    EXPECT_FALSE(findColumn(header, missing).has_value());
}

}  // namespace
}  // namespace seqcov::io
