// =============================================================================
// seqcov - Report Renderer
// =============================================================================
// Renders a CoverageReport as a fixed-width table or as CSV.
//
// Table layout:
//   sample  [barcode]  [alias]  coverage (x)  total bases  mean length  N50  % >= <threshold>
// followed by one "warning:" line per orphan sample and run-level warning.
// The barcode and alias columns appear only when some sample has one.
//
// CSV always carries alias and barcode plus the yield split at the
// threshold (reads, bases and mean length below and at-or-above it).
// Unavailable distribution metrics render as "n/a" in the table and as
// empty fields in CSV. CSV output carries no warnings.
//
// Rendering is a pure function of the report: identical reports give
// byte-identical output.
// =============================================================================

#ifndef SEQCOV_REPORT_REPORT_RENDERER_H
#define SEQCOV_REPORT_REPORT_RENDERER_H

#include <ostream>
#include <string>
#include <vector>

#include "seqcov/common/types.h"
#include "seqcov/stats/coverage_calculator.h"

namespace seqcov::report {

/// @brief Placeholder for metrics that cannot be computed.
inline constexpr std::string_view kNotAvailable = "n/a";

// =============================================================================
// ReportRenderer Class
// =============================================================================

/// @brief Writes a CoverageReport in one output format.
class ReportRenderer {
public:
    explicit ReportRenderer(OutputFormat format = OutputFormat::kTable);

    /// @brief Render the report to a stream.
    void render(const stats::CoverageReport& report, std::ostream& out) const;

    /// @brief Render the report to a string.
    [[nodiscard]] std::string renderToString(const stats::CoverageReport& report) const;

    [[nodiscard]] OutputFormat format() const noexcept { return format_; }

private:
    void renderTable(const stats::CoverageReport& report, std::ostream& out) const;
    void renderCsv(const stats::CoverageReport& report, std::ostream& out) const;

    OutputFormat format_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Warning lines for a report: orphans first, then run-level warnings.
[[nodiscard]] std::vector<std::string> collectWarnings(const stats::CoverageReport& report);

/// @brief Quote a CSV field if it contains a delimiter, quote or newline.
[[nodiscard]] std::string escapeCsvField(std::string_view field);

}  // namespace seqcov::report

#endif  // SEQCOV_REPORT_REPORT_RENDERER_H
