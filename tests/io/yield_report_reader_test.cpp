// =============================================================================
// seqcov - Yield Report Reader Tests
// =============================================================================
// Unit tests for extracting per-barcode yield totals and the run identifier
// from an aggregate JSON report.
// =============================================================================

#include "seqcov/io/yield_report_reader.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace seqcov::io {
namespace {

/// @brief One barcode entry with cumulative snapshots.
std::string barcodeEntry(const std::string& barcode, const std::string& earlyBases,
                         const std::string& finalBases, const std::string& finalReads) {
    return R"({"filtering": [{"barcode_name": ")" + barcode + R"("}],
               "snapshots": [
                 {"yield_summary": {"basecalled_pass_bases": )" + earlyBases + R"(,
                                    "basecalled_pass_read_count": "1"}},
                 {"yield_summary": {"basecalled_pass_bases": )" + finalBases + R"(,
                                    "basecalled_pass_read_count": )" + finalReads + R"(}}
               ]})";
}

/// @brief Full report with one SplitByBarcode output.
std::string reportWith(const std::string& entries, const std::string& runId = "EXP-42") {
    return R"({"protocol_run_info": {"user_info": {"protocol_group_id": ")" + runId + R"("}},
               "acquisitions": [
                 {"acquisition_output": [
                   {"type": "AllData", "plot": []},
                   {"type": "SplitByBarcode",
                    "plot": [{"snapshots": [)" + entries + R"(]}]}
                 ]}
               ]})";
}

YieldReport parse(const std::string& json) {
    std::istringstream input(json);
    return parseYieldReport(input, "report.json");
}

TEST(YieldReportReaderTest, UsesLastSnapshotPerBarcode) {
    auto report = parse(reportWith(barcodeEntry("barcode01", "\"10\"", "\"18000\"", "3") + "," +
                                   barcodeEntry("barcode02", "5", "2500", "\"2\"")));

    ASSERT_EQ(report.samples.size(), 2u);
    EXPECT_EQ(report.samples[0].key, "barcode01");
    EXPECT_EQ(report.samples[0].totalBases, 18000u);
    EXPECT_EQ(report.samples[0].readCount, 3u);
    EXPECT_EQ(report.samples[1].key, "barcode02");
    EXPECT_EQ(report.samples[1].totalBases, 2500u);
    EXPECT_EQ(report.samples[1].readCount, 2u);
    EXPECT_EQ(report.runId, "EXP-42");
    EXPECT_EQ(report.barcodeOutputs, 1u);
}

TEST(YieldReportReaderTest, RepeatedBarcodeIsSummed) {
    auto report = parse(reportWith(barcodeEntry("barcode01", "0", "100", "1") + "," +
                                   barcodeEntry("barcode01", "0", "50", "2")));

    ASSERT_EQ(report.samples.size(), 1u);
    EXPECT_EQ(report.samples[0].totalBases, 150u);
    EXPECT_EQ(report.samples[0].readCount, 3u);
}

TEST(YieldReportReaderTest, MissingRunInfo) {
    auto report = parse(R"({"acquisitions": [{"acquisition_output": [
                              {"type": "SplitByBarcode", "plot": []}]}]})");

    EXPECT_TRUE(report.samples.empty());
    EXPECT_FALSE(report.runId.has_value());
    EXPECT_EQ(report.barcodeOutputs, 1u);
}

TEST(YieldReportReaderTest, NoBarcodeOutputIsMalformed) {
    EXPECT_THROW((void)parse("{}"), MalformedInputError);
    EXPECT_THROW((void)parse(R"({"acquisitions": []})"), MalformedInputError);
    EXPECT_THROW((void)parse(R"({"acquisitions": [{"acquisition_output": [
                                   {"type": "AllData", "plot": []}]}]})"),
                 MalformedInputError);
}

TEST(YieldReportReaderTest, InvalidJsonIsMalformed) {
    EXPECT_THROW((void)parse("{\"acquisitions\": ["), MalformedInputError);
    EXPECT_THROW((void)parse("[1, 2, 3]"), MalformedInputError);
}

TEST(YieldReportReaderTest, SchemaMismatchIsMalformed) {
    EXPECT_THROW((void)parse(R"({"acquisitions": {"not": "an array"}})"), MalformedInputError);
    EXPECT_THROW((void)parse(reportWith(barcodeEntry("barcode01", "0", "\"lots\"", "1"))),
                 MalformedInputError);
    EXPECT_THROW((void)parse(reportWith(barcodeEntry("barcode01", "0", "-4", "1"))),
                 MalformedInputError);
}

TEST(YieldReportReaderTest, MissingFileIsIOError) {
    EXPECT_THROW((void)readYieldReport("/nonexistent/seqcov/report.json"), IOError);
}

}  // namespace
}  // namespace seqcov::io
