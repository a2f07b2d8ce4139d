// =============================================================================
// seqcov - Report Renderer Implementation
// =============================================================================

#include "seqcov/report/report_renderer.h"

#include <algorithm>
#include <sstream>

#include <fmt/format.h>

#include "seqcov/common/logger.h"

namespace seqcov::report {

namespace {

constexpr std::string_view kColumnGap = "  ";

using Row = std::vector<std::string>;

std::string formatCoverage(double coverage) { return fmt::format("{:.4f}", coverage); }

std::string formatMeanLength(double mean) { return fmt::format("{:.1f}", mean); }

template <typename T>
std::string formatOptional(const std::optional<T>& value, std::string_view missing) {
    return value.has_value() ? fmt::format("{}", *value) : std::string(missing);
}

std::string formatPercent(const std::optional<double>& pct, std::string_view missing) {
    return pct.has_value() ? fmt::format("{:.2f}", *pct) : std::string(missing);
}

std::string formatOptionalMean(const std::optional<double>& mean, std::string_view missing) {
    return mean.has_value() ? formatMeanLength(*mean) : std::string(missing);
}

/// @brief Text columns shown in the table only when some sample has a value.
struct TextColumns {
    bool barcode = false;
    bool alias = false;

    [[nodiscard]] std::size_t count() const noexcept {
        return 1 + (barcode ? 1 : 0) + (alias ? 1 : 0);
    }
};

TextColumns textColumns(const stats::CoverageReport& report) {
    TextColumns columns;
    for (const auto& result : report.results) {
        columns.barcode = columns.barcode || result.barcode.has_value();
        columns.alias = columns.alias || result.alias.has_value();
    }
    return columns;
}

Row tableRow(const stats::CoverageResult& result, const TextColumns& text) {
    Row row{result.sampleId};
    if (text.barcode) {
        row.push_back(result.barcode.value_or(""));
    }
    if (text.alias) {
        row.push_back(result.alias.value_or(""));
    }
    row.push_back(formatCoverage(result.coverageX));
    row.push_back(fmt::format("{}", result.totalBases));
    row.push_back(formatMeanLength(result.meanReadLength));
    row.push_back(formatOptional(result.n50, kNotAvailable));
    row.push_back(formatPercent(result.pctReadsAboveThreshold, kNotAvailable));
    return row;
}

void writeRow(const Row& row, const std::vector<std::size_t>& widths, std::size_t leftAligned,
              std::ostream& out) {
    std::string line;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line += kColumnGap;
        }
        line += i < leftAligned ? fmt::format("{:<{}}", row[i], widths[i])
                                : fmt::format("{:>{}}", row[i], widths[i]);
    }
    out << line << '\n';
}

}  // namespace

// =============================================================================
// ReportRenderer Implementation
// =============================================================================

ReportRenderer::ReportRenderer(OutputFormat format) : format_(format) {}

void ReportRenderer::render(const stats::CoverageReport& report, std::ostream& out) const {
    switch (format_) {
        case OutputFormat::kTable:
            renderTable(report, out);
            break;
        case OutputFormat::kCsv:
            renderCsv(report, out);
            break;
    }
}

std::string ReportRenderer::renderToString(const stats::CoverageReport& report) const {
    std::ostringstream out;
    render(report, out);
    return out.str();
}

void ReportRenderer::renderTable(const stats::CoverageReport& report, std::ostream& out) const {
    TextColumns text = textColumns(report);

    Row header{"sample"};
    if (text.barcode) {
        header.emplace_back("barcode");
    }
    if (text.alias) {
        header.emplace_back("alias");
    }
    for (std::string_view name : {"coverage (x)", "total bases", "mean length", "N50"}) {
        header.emplace_back(name);
    }
    header.push_back(fmt::format("% >= {}", report.threshold));

    std::vector<Row> rows;
    rows.reserve(report.results.size() + 1);
    rows.push_back(std::move(header));
    for (const auto& result : report.results) {
        rows.push_back(tableRow(result, text));
    }

    std::vector<std::size_t> widths(rows.front().size(), 0);
    for (const auto& row : rows) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    for (const auto& row : rows) {
        writeRow(row, widths, text.count(), out);
    }

    for (const auto& warning : collectWarnings(report)) {
        out << "warning: " << warning << '\n';
    }
}

void ReportRenderer::renderCsv(const stats::CoverageReport& report, std::ostream& out) const {
    out << fmt::format(
        "sample,alias,barcode,genome_size_bp,total_bases,read_count,coverage_x,"
        "mean_read_length,n50,reads_below_{0},bases_below_{0},mean_length_below_{0},"
        "reads_above_{0},bases_above_{0},mean_length_above_{0},pct_reads_above_{0}\n",
        report.threshold);

    for (const auto& result : report.results) {
        out << fmt::format(
            "{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n", escapeCsvField(result.sampleId),
            escapeCsvField(result.alias.value_or("")), escapeCsvField(result.barcode.value_or("")),
            result.genomeSizeBp, result.totalBases, result.readCount,
            formatCoverage(result.coverageX), formatMeanLength(result.meanReadLength),
            formatOptional(result.n50, ""), formatOptional(result.readsBelowThreshold, ""),
            formatOptional(result.basesBelowThreshold, ""),
            formatOptionalMean(result.meanLengthBelowThreshold, ""),
            formatOptional(result.readsAboveThreshold, ""),
            formatOptional(result.basesAboveThreshold, ""),
            formatOptionalMean(result.meanLengthAboveThreshold, ""),
            formatPercent(result.pctReadsAboveThreshold, ""));
    }

    for (const auto& warning : collectWarnings(report)) {
        SEQCOV_LOG_WARNING("{}", warning);
    }
}

// =============================================================================
// Utility Functions
// =============================================================================

std::vector<std::string> collectWarnings(const stats::CoverageReport& report) {
    std::vector<std::string> warnings;
    warnings.reserve(report.orphans.size() + report.warnings.size());
    for (const auto& orphan : report.orphans) {
        warnings.push_back(
            fmt::format("sample '{}' not in registry ({} reads, {} bases ignored)", orphan.key,
                        orphan.readCount, orphan.totalBases));
    }
    warnings.insert(warnings.end(), report.warnings.begin(), report.warnings.end());
    return warnings;
}

std::string escapeCsvField(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace seqcov::report
