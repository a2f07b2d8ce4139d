// =============================================================================
// seqcov - Coverage Calculator
// =============================================================================
// Joins aggregated statistics with the sample registry and derives coverage
// and read-length distribution metrics, one result per registry sample.
//
// - coverage_x      = total_bases / genome_size_bp (all reads counted)
// - mean length     = total_bases / read_count (0 without reads)
// - N50             = length at which the descending cumulative sum first
//                     reaches half of total_bases (per-read input only)
// - % >= threshold  = 100 * reads_above_threshold / read_count
// - below/above     = bases, reads and mean length on each side of the
//                     threshold (per-read input only)
//
// Input keys that match no registry sample are returned as orphans.
// =============================================================================

#ifndef SEQCOV_STATS_COVERAGE_CALCULATOR_H
#define SEQCOV_STATS_COVERAGE_CALCULATOR_H

#include <optional>
#include <string>
#include <vector>

#include "seqcov/common/types.h"
#include "seqcov/registry/sample_registry.h"
#include "seqcov/stats/stats_aggregator.h"

namespace seqcov::stats {

// =============================================================================
// Result Types
// =============================================================================

/// @brief Final metrics for one registry sample.
struct CoverageResult {
    std::string sampleId;
    std::optional<std::string> alias;
    std::optional<std::string> barcode;
    BaseCount genomeSizeBp = 0;
    BaseCount totalBases = 0;
    ReadCount readCount = 0;
    double coverageX = 0.0;
    double meanReadLength = 0.0;

    /// @brief Distribution metrics; nullopt means "not available".
    std::optional<ReadLength> n50;
    std::optional<double> pctReadsAboveThreshold;
    std::optional<ReadCount> readsAboveThreshold;
    std::optional<BaseCount> basesAboveThreshold;

    /// @brief Yield split at the threshold; means are 0 for an empty side.
    std::optional<ReadCount> readsBelowThreshold;
    std::optional<BaseCount> basesBelowThreshold;
    std::optional<double> meanLengthBelowThreshold;
    std::optional<double> meanLengthAboveThreshold;
};

/// @brief Input data attributed to a key the registry does not know.
struct OrphanSample {
    std::string key;
    BaseCount totalBases = 0;
    ReadCount readCount = 0;
};

/// @brief Everything the renderer needs.
struct CoverageReport {
    /// @brief One entry per registry sample, in registry order.
    std::vector<CoverageResult> results;

    /// @brief Unmatched input keys, sorted by key.
    std::vector<OrphanSample> orphans;

    /// @brief Threshold the distribution metrics refer to.
    ReadLength threshold = kDefaultThreshold;

    /// @brief Run-level warnings (skipped lines, excluded reads, ...).
    std::vector<std::string> warnings;
};

// =============================================================================
// CoverageCalculator Class
// =============================================================================

/// @brief Produces a CoverageReport from a registry and aggregated stats.
class CoverageCalculator {
public:
    /// @param registry Sample registry; must outlive the calculator.
    explicit CoverageCalculator(const registry::SampleRegistry& registry);

    /// @brief Compute one result per registry sample plus orphan entries.
    [[nodiscard]] CoverageReport compute(const StatsAggregator& aggregator) const;

    /// @brief Metrics for one sample.
    /// @param sample Registry entry.
    /// @param stats Attributed stats, or nullptr when no reads matched.
    [[nodiscard]] static CoverageResult computeSample(const registry::SampleRecord& sample,
                                                      const SampleStats* stats);

private:
    const registry::SampleRegistry& registry_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief N50 of a length histogram.
/// @param histogram Read length -> count.
/// @param totalBases Sum of length * count over the histogram.
/// @return The N50 length, or nullopt for an empty histogram.
[[nodiscard]] std::optional<ReadLength> computeN50(const LengthHistogram& histogram,
                                                   BaseCount totalBases);

}  // namespace seqcov::stats

#endif  // SEQCOV_STATS_COVERAGE_CALCULATOR_H
