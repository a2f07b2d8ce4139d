// =============================================================================
// seqcov - Report Renderer Tests
// =============================================================================

#include "seqcov/report/report_renderer.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace seqcov::report {
namespace {

using stats::CoverageReport;
using stats::CoverageResult;
using stats::OrphanSample;

[[nodiscard]] CoverageResult scenarioResult() {
    CoverageResult result;
    result.sampleId = "S1";
    result.genomeSizeBp = 5'000'000;
    result.totalBases = 18000;
    result.readCount = 3;
    result.coverageX = 0.0036;
    result.meanReadLength = 6000.0;
    result.n50 = 6000;
    result.readsAboveThreshold = 1;
    result.basesAboveThreshold = 8000;
    result.pctReadsAboveThreshold = 100.0 / 3.0;
    result.readsBelowThreshold = 2;
    result.basesBelowThreshold = 10000;
    result.meanLengthBelowThreshold = 5000.0;
    result.meanLengthAboveThreshold = 8000.0;
    return result;
}

[[nodiscard]] CoverageResult emptyResult(std::string id) {
    CoverageResult result;
    result.sampleId = std::move(id);
    result.genomeSizeBp = 1000;
    return result;
}

[[nodiscard]] CoverageReport scenarioReport() {
    CoverageReport report;
    report.threshold = 7000;
    report.results.push_back(scenarioResult());
    return report;
}

// =============================================================================
// Table
// =============================================================================

TEST(ReportRendererTest, TableLayout) {
    ReportRenderer renderer(OutputFormat::kTable);

    std::string output = renderer.renderToString(scenarioReport());

    EXPECT_EQ(output,
              "sample  coverage (x)  total bases  mean length   N50  % >= 7000\n"
              "S1            0.0036        18000       6000.0  6000      33.33\n");
}

TEST(ReportRendererTest, TableShowsBarcodeAndAliasWhenPresent) {
    CoverageReport report = scenarioReport();
    report.results[0].barcode = "barcode01";
    report.results[0].alias = "ecoli";
    report.results.push_back(emptyResult("S2"));

    std::string output = ReportRenderer().renderToString(report);

    EXPECT_EQ(output,
              "sample  barcode    alias  coverage (x)  total bases  mean length   N50  % >= 7000\n"
              "S1      barcode01  ecoli        0.0036        18000       6000.0  6000      33.33\n"
              "S2                              0.0000            0          0.0   n/a        n/a\n");
}

TEST(ReportRendererTest, UnavailableMetricsRenderAsNa) {
    CoverageReport report = scenarioReport();
    report.results.push_back(emptyResult("S2"));

    std::string output = ReportRenderer().renderToString(report);

    std::istringstream lines(output);
    std::string header, first, second;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);
    EXPECT_EQ(second.rfind("S2", 0), 0u);
    EXPECT_NE(second.find("0.0000"), std::string::npos);
    EXPECT_NE(second.find("n/a"), std::string::npos);
    EXPECT_EQ(header.size(), second.size());
}

TEST(ReportRendererTest, WarningsFollowTable) {
    CoverageReport report = scenarioReport();
    report.orphans.push_back(OrphanSample{.key = "barcode09", .totalBases = 500, .readCount = 2});
    report.warnings.push_back("3 malformed summary lines skipped");

    std::string output = ReportRenderer().renderToString(report);

    auto orphanPos = output.find("warning: sample 'barcode09' not in registry");
    auto skippedPos = output.find("warning: 3 malformed summary lines skipped\n");
    ASSERT_NE(orphanPos, std::string::npos);
    ASSERT_NE(skippedPos, std::string::npos);
    EXPECT_LT(orphanPos, skippedPos);
    EXPECT_GT(orphanPos, output.find("S1"));
}

TEST(ReportRendererTest, RenderingIsDeterministic) {
    CoverageReport report = scenarioReport();
    report.results.push_back(emptyResult("S2"));
    report.orphans.push_back(OrphanSample{.key = "x", .totalBases = 1, .readCount = 1});

    ReportRenderer renderer;
    EXPECT_EQ(renderer.renderToString(report), renderer.renderToString(report));

    std::ostringstream stream;
    renderer.render(report, stream);
    EXPECT_EQ(stream.str(), renderer.renderToString(report));
}

// =============================================================================
// CSV
// =============================================================================

TEST(ReportRendererTest, CsvLayout) {
    CoverageReport report = scenarioReport();
    report.results[0].alias = "E. coli, K-12";
    report.results[0].barcode = "barcode01";
    report.results.push_back(emptyResult("S,2"));
    report.warnings.push_back("not in the csv");

    std::string output = ReportRenderer(OutputFormat::kCsv).renderToString(report);

    EXPECT_EQ(output,
              "sample,alias,barcode,genome_size_bp,total_bases,read_count,coverage_x,"
              "mean_read_length,n50,reads_below_7000,bases_below_7000,mean_length_below_7000,"
              "reads_above_7000,bases_above_7000,mean_length_above_7000,pct_reads_above_7000\n"
              "S1,\"E. coli, K-12\",barcode01,5000000,18000,3,0.0036,6000.0,6000,"
              "2,10000,5000.0,1,8000,8000.0,33.33\n"
              "\"S,2\",,,1000,0,0,0.0000,0.0,,,,,,,,\n");
}

TEST(CsvEscapeTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(escapeCsvField("plain"), "plain");
    EXPECT_EQ(escapeCsvField("a,b"), "\"a,b\"");
    EXPECT_EQ(escapeCsvField("say \"hi\""), "\"say \"\"hi\"\"\"");
}

}  // namespace
}  // namespace seqcov::report
