// =============================================================================
// seqcov - Coverage Command
// =============================================================================
// Orchestrates one coverage run:
//
//   registry ─┐
//             ├─> StatsAggregator ─> CoverageCalculator ─> ReportRenderer
//   summary  ─┤      (per-read)
//   or json  ─┘      (yield totals)
//
// Exactly one of the per-read summary and the JSON yield report is read.
// Argument validation happens before any file is opened.
// =============================================================================

#ifndef SEQCOV_COMMANDS_COVERAGE_COMMAND_H
#define SEQCOV_COMMANDS_COVERAGE_COMMAND_H

#include <filesystem>
#include <iosfwd>
#include <optional>

#include "seqcov/common/error.h"
#include "seqcov/common/types.h"
#include "seqcov/registry/sample_registry.h"
#include "seqcov/stats/coverage_calculator.h"
#include "seqcov/stats/stats_aggregator.h"

namespace seqcov::commands {

// =============================================================================
// Coverage Options
// =============================================================================

/// @brief Configuration options for the coverage command.
struct CoverageOptions {
    /// @brief Sample sheet path.
    std::filesystem::path registryPath;

    /// @brief Per-read summary path (plain or gzip).
    std::optional<std::filesystem::path> summaryPath;

    /// @brief Aggregate JSON yield report path.
    std::optional<std::filesystem::path> jsonPath;

    /// @brief Read-length qualification cutoff (bp, inclusive).
    ReadLength threshold = kDefaultThreshold;

    /// @brief Treatment of QC-failed reads.
    QcPolicy qcPolicy = QcPolicy::kIncludeAll;

    /// @brief Report format.
    OutputFormat format = OutputFormat::kTable;

    /// @brief Downgrade a registry/report run id mismatch to a warning.
    bool allowRunMismatch = false;
};

// =============================================================================
// CoverageCommand Class
// =============================================================================

/// @brief Command handler for computing and printing a coverage report.
class CoverageCommand {
public:
    /// @brief Construct with options.
    explicit CoverageCommand(CoverageOptions options);

    /// @brief Execute the command, printing the report to @p out.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute(std::ostream& out);

    /// @brief Execute the command, printing the report to standard output.
    [[nodiscard]] int execute();

    /// @brief Validate the options without touching the filesystem.
    /// @throws UsageError if neither or both inputs are given.
    void validate() const;

    /// @brief Load inputs and compute the report.
    /// @throws SeqcovException on any fatal error.
    [[nodiscard]] stats::CoverageReport run() const;

    /// @brief Get the options.
    [[nodiscard]] const CoverageOptions& options() const noexcept { return options_; }

    /// @brief Aggregation options derived from the command options.
    [[nodiscard]] stats::AggregatorOptions aggregatorOptions() const noexcept;

private:
    /// @brief Fold the per-read summary into the aggregator.
    void ingestSummary(stats::StatsAggregator& aggregator,
                       std::vector<std::string>& warnings) const;

    /// @brief Fold the JSON yield report into the aggregator.
    void ingestYieldReport(const registry::SampleRegistry& registry,
                           stats::StatsAggregator& aggregator,
                           std::vector<std::string>& warnings) const;

    CoverageOptions options_;
};

}  // namespace seqcov::commands

#endif  // SEQCOV_COMMANDS_COVERAGE_COMMAND_H
