// =============================================================================
// seqcov - Yield Report Reader
// =============================================================================
// Parser for the aggregate JSON run report, which carries only per-barcode
// yield totals (no per-read lengths).
//
// Totals are taken from acquisition outputs of type "SplitByBarcode":
//
//   acquisitions[].acquisition_output[]            type == "SplitByBarcode"
//     .plot[0].snapshots[]                         one entry per barcode
//        .filtering[].barcode_name                 barcode key
//        .snapshots[-1].yield_summary              cumulative totals
//            .basecalled_pass_bases
//            .basecalled_pass_read_count
//
// Totals of the same barcode across acquisitions are summed. The run id is
// protocol_run_info.user_info.protocol_group_id.
// =============================================================================

#ifndef SEQCOV_IO_YIELD_REPORT_READER_H
#define SEQCOV_IO_YIELD_REPORT_READER_H

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "seqcov/common/error.h"
#include "seqcov/common/types.h"

namespace seqcov::io {

/// @brief Pre-summarized totals for one barcode.
struct SampleYield {
    /// @brief Barcode name as reported by the sequencer.
    std::string key;

    /// @brief Bases of reads that passed filtering.
    BaseCount totalBases = 0;

    /// @brief Reads that passed filtering.
    ReadCount readCount = 0;
};

/// @brief Contents of an aggregate run report.
struct YieldReport {
    /// @brief Per-barcode totals, in order of first appearance.
    std::vector<SampleYield> samples;

    /// @brief Run identifier (protocol_group_id), when present.
    std::optional<std::string> runId;

    /// @brief Number of SplitByBarcode outputs found (at least one).
    std::size_t barcodeOutputs = 0;
};

/// @brief Read and parse a report from disk.
/// @throws IOError if the file cannot be read.
/// @throws MalformedInputError on invalid JSON, schema mismatch or a report
///         without any SplitByBarcode output.
[[nodiscard]] YieldReport readYieldReport(const std::filesystem::path& path);

/// @brief Parse a report from a stream.
/// @param input JSON text.
/// @param sourceName Name used in error messages.
/// @throws MalformedInputError on invalid JSON, schema mismatch or a report
///         without any SplitByBarcode output.
[[nodiscard]] YieldReport parseYieldReport(std::istream& input,
                                           const std::string& sourceName = "<stream>");

}  // namespace seqcov::io

#endif  // SEQCOV_IO_YIELD_REPORT_READER_H
