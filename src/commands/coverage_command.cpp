// =============================================================================
// seqcov - Coverage Command Implementation
// =============================================================================

#include "coverage_command.h"

#include <iostream>

#include <fmt/format.h>

#include "seqcov/common/logger.h"
#include "seqcov/io/summary_reader.h"
#include "seqcov/io/yield_report_reader.h"
#include "seqcov/report/report_renderer.h"

namespace seqcov::commands {

// =============================================================================
// CoverageCommand Implementation
// =============================================================================

CoverageCommand::CoverageCommand(CoverageOptions options) : options_(std::move(options)) {}

int CoverageCommand::execute() { return execute(std::cout); }

int CoverageCommand::execute(std::ostream& out) {
    try {
        validate();
        stats::CoverageReport report = run();

        report::ReportRenderer renderer(options_.format);
        renderer.render(report, out);
        out.flush();
        if (!out) {
            throw IOError("failed to write report");
        }
        return 0;

    } catch (const SeqcovException& e) {
        SEQCOV_LOG_ERROR("Coverage command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SEQCOV_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void CoverageCommand::validate() const {
    const bool hasSummary = options_.summaryPath.has_value();
    const bool hasJson = options_.jsonPath.has_value();
    if (hasSummary == hasJson) {
        throw UsageError(hasSummary ? "--summary and --json are mutually exclusive"
                                    : "one of --summary or --json is required");
    }
}

stats::AggregatorOptions CoverageCommand::aggregatorOptions() const noexcept {
    return stats::AggregatorOptions{.threshold = options_.threshold,
                                    .qcPolicy = options_.qcPolicy};
}

stats::CoverageReport CoverageCommand::run() const {
    validate();

    auto registry = registry::SampleRegistry::load(options_.registryPath);

    stats::StatsAggregator aggregator(aggregatorOptions());
    std::vector<std::string> warnings;
    if (options_.summaryPath.has_value()) {
        ingestSummary(aggregator, warnings);
    } else {
        ingestYieldReport(registry, aggregator, warnings);
    }

    stats::CoverageCalculator calculator(registry);
    stats::CoverageReport report = calculator.compute(aggregator);
    report.warnings.insert(report.warnings.end(), warnings.begin(), warnings.end());

    SEQCOV_LOG_INFO("Computed coverage for {} samples ({} orphan keys)", report.results.size(),
                    report.orphans.size());
    return report;
}

void CoverageCommand::ingestSummary(stats::StatsAggregator& aggregator,
                                    std::vector<std::string>& warnings) const {
    io::SummaryReader reader(*options_.summaryPath);
    if (!reader.hasBarcodes()) {
        SEQCOV_LOG_INFO("Summary has no barcode column; reads attributed to '{}'",
                        kDefaultSampleKey);
    }

    aggregator.addAll(reader);

    SEQCOV_LOG_INFO("Read {} records from {} ({} lines skipped)", reader.recordsRead(),
                    reader.sourceName(), reader.skippedLines());

    if (reader.skippedLines() > 0) {
        std::string message =
            fmt::format("{} malformed summary lines skipped", reader.skippedLines());
        if (const auto& last = reader.lastSkipped()) {
            message += fmt::format(" (last at line {}: {})", last->lineNumber, last->reason);
        }
        warnings.push_back(std::move(message));
    }
    if (aggregator.qcFailedExcluded() > 0) {
        warnings.push_back(fmt::format("{} of {} reads excluded by failed QC",
                                       aggregator.qcFailedExcluded(), aggregator.readsSeen()));
    }
}

void CoverageCommand::ingestYieldReport(const registry::SampleRegistry& registry,
                                        stats::StatsAggregator& aggregator,
                                        std::vector<std::string>& warnings) const {
    io::YieldReport report = io::readYieldReport(*options_.jsonPath);

    auto registryRunId = registry.experimentId();
    if (registryRunId.has_value() && report.runId.has_value() && *registryRunId != *report.runId) {
        if (!options_.allowRunMismatch) {
            throw RunMismatchError(*registryRunId, *report.runId);
        }
        warnings.push_back(fmt::format("registry experiment '{}' does not match report run '{}'",
                                       *registryRunId, *report.runId));
    } else if (!registryRunId.has_value() || !report.runId.has_value()) {
        SEQCOV_LOG_DEBUG("Run id check skipped: identifier missing on one side");
    }

    if (report.samples.empty()) {
        warnings.push_back("yield report contains no barcoded yield data");
    }

    aggregator.addReport(report);
}

}  // namespace seqcov::commands
