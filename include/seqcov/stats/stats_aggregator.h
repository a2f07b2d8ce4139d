// =============================================================================
// seqcov - Stats Aggregator
// =============================================================================
// Folds per-read records (or pre-aggregated yield totals) into one running
// SampleStats per sample key.
//
// Per-read input keeps a length histogram so N50 and other distribution
// metrics can be derived later; its size depends on the number of distinct
// read lengths, not on the number of reads. Yield totals carry no lengths and
// mark the sample as having no distribution.
//
// Aggregators built from independent shards of the same input can be merged;
// merging is commutative and associative.
// =============================================================================

#ifndef SEQCOV_STATS_STATS_AGGREGATOR_H
#define SEQCOV_STATS_STATS_AGGREGATOR_H

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "seqcov/common/types.h"
#include "seqcov/io/summary_reader.h"
#include "seqcov/io/yield_report_reader.h"

namespace seqcov::stats {

/// @brief Read length -> number of reads with that length.
using LengthHistogram = std::map<ReadLength, ReadCount>;

// =============================================================================
// Aggregator Options
// =============================================================================

/// @brief Aggregation policy, passed explicitly to every aggregator.
struct AggregatorOptions {
    /// @brief Reads with length >= threshold qualify (inclusive).
    ReadLength threshold = kDefaultThreshold;

    /// @brief Whether QC-failed reads count toward totals.
    QcPolicy qcPolicy = QcPolicy::kIncludeAll;

    friend bool operator==(const AggregatorOptions&, const AggregatorOptions&) = default;
};

// =============================================================================
// SampleStats Class
// =============================================================================

/// @brief Running totals for one sample.
class SampleStats {
public:
    /// @brief Fold one read into the totals.
    /// @param length Read length in bp.
    /// @param threshold Inclusive qualification cutoff.
    void addRead(ReadLength length, ReadLength threshold);

    /// @brief Fold pre-aggregated totals (no per-read detail).
    void addTotals(BaseCount bases, ReadCount reads);

    /// @brief Combine another sample's totals into this one.
    void merge(const SampleStats& other);

    [[nodiscard]] BaseCount totalBases() const noexcept { return totalBases_; }
    [[nodiscard]] ReadCount readCount() const noexcept { return readCount_; }
    [[nodiscard]] BaseCount basesAboveThreshold() const noexcept { return basesAboveThreshold_; }
    [[nodiscard]] ReadCount readsAboveThreshold() const noexcept { return readsAboveThreshold_; }

    /// @brief Whether per-read lengths are available for every read counted.
    [[nodiscard]] bool hasDistribution() const noexcept { return !fromTotals_; }

    [[nodiscard]] const LengthHistogram& lengthHistogram() const noexcept {
        return lengthHistogram_;
    }

    friend bool operator==(const SampleStats&, const SampleStats&) = default;

private:
    BaseCount totalBases_ = 0;
    ReadCount readCount_ = 0;
    BaseCount basesAboveThreshold_ = 0;
    ReadCount readsAboveThreshold_ = 0;
    LengthHistogram lengthHistogram_;
    bool fromTotals_ = false;
};

// =============================================================================
// StatsAggregator Class
// =============================================================================

/// @brief Per-sample accumulation of reads or yield totals.
class StatsAggregator {
public:
    using SampleMap = std::map<std::string, SampleStats, std::less<>>;

    explicit StatsAggregator(AggregatorOptions options = {});

    /// @brief Fold one read; a SampleStats entry is created on first use.
    void add(const io::ReadRecord& read);

    /// @brief Fold every record of a lazy read sequence.
    template <typename ReadRange>
    void addAll(ReadRange&& reads) {
        for (const io::ReadRecord& read : reads) {
            add(read);
        }
    }

    /// @brief Fold pre-aggregated totals for one key.
    void addTotals(std::string_view key, BaseCount bases, ReadCount reads);

    /// @brief Fold every sample of a yield report.
    void addReport(const io::YieldReport& report);

    /// @brief Combine a shard aggregated with the same options.
    /// @throws UsageError if the options differ.
    void merge(const StatsAggregator& other);

    /// @brief Stats for a key, or nullptr if nothing was attributed to it.
    [[nodiscard]] const SampleStats* find(std::string_view key) const;

    /// @brief All samples, ordered by key.
    [[nodiscard]] const SampleMap& samples() const noexcept { return samples_; }

    [[nodiscard]] const AggregatorOptions& options() const noexcept { return options_; }

    /// @brief Reads offered to add(), including excluded ones.
    [[nodiscard]] ReadCount readsSeen() const noexcept { return readsSeen_; }

    /// @brief Reads dropped by the pass-only QC policy.
    [[nodiscard]] ReadCount qcFailedExcluded() const noexcept { return qcFailedExcluded_; }

private:
    SampleStats& statsFor(std::string_view key);

    AggregatorOptions options_;
    SampleMap samples_;
    ReadCount readsSeen_ = 0;
    ReadCount qcFailedExcluded_ = 0;
};

}  // namespace seqcov::stats

#endif  // SEQCOV_STATS_STATS_AGGREGATOR_H
