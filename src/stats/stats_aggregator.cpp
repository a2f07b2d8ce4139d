// =============================================================================
// seqcov - Stats Aggregator Implementation
// =============================================================================

#include "seqcov/stats/stats_aggregator.h"

#include "seqcov/common/error.h"
#include "seqcov/common/logger.h"

namespace seqcov::stats {

// =============================================================================
// SampleStats Implementation
// =============================================================================

void SampleStats::addRead(ReadLength length, ReadLength threshold) {
    ++readCount_;
    totalBases_ += length;
    ++lengthHistogram_[length];

    if (length >= threshold) {
        ++readsAboveThreshold_;
        basesAboveThreshold_ += length;
    }
}

void SampleStats::addTotals(BaseCount bases, ReadCount reads) {
    totalBases_ += bases;
    readCount_ += reads;
    fromTotals_ = true;
}

void SampleStats::merge(const SampleStats& other) {
    totalBases_ += other.totalBases_;
    readCount_ += other.readCount_;
    basesAboveThreshold_ += other.basesAboveThreshold_;
    readsAboveThreshold_ += other.readsAboveThreshold_;
    for (const auto& [length, count] : other.lengthHistogram_) {
        lengthHistogram_[length] += count;
    }
    fromTotals_ = fromTotals_ || other.fromTotals_;
}

// =============================================================================
// StatsAggregator Implementation
// =============================================================================

StatsAggregator::StatsAggregator(AggregatorOptions options) : options_(options) {}

void StatsAggregator::add(const io::ReadRecord& read) {
    ++readsSeen_;
    if (options_.qcPolicy == QcPolicy::kPassOnly && !read.qcPass) {
        ++qcFailedExcluded_;
        return;
    }
    statsFor(read.key()).addRead(read.lengthBp, options_.threshold);
}

void StatsAggregator::addTotals(std::string_view key, BaseCount bases, ReadCount reads) {
    statsFor(key).addTotals(bases, reads);
}

void StatsAggregator::addReport(const io::YieldReport& report) {
    for (const auto& sample : report.samples) {
        addTotals(sample.key, sample.totalBases, sample.readCount);
    }
}

void StatsAggregator::merge(const StatsAggregator& other) {
    if (options_ != other.options_) {
        throw UsageError("cannot merge statistics aggregated with different options");
    }
    for (const auto& [key, stats] : other.samples_) {
        statsFor(key).merge(stats);
    }
    readsSeen_ += other.readsSeen_;
    qcFailedExcluded_ += other.qcFailedExcluded_;
}

const SampleStats* StatsAggregator::find(std::string_view key) const {
    auto it = samples_.find(key);
    return it == samples_.end() ? nullptr : &it->second;
}

SampleStats& StatsAggregator::statsFor(std::string_view key) {
    auto it = samples_.find(key);
    if (it == samples_.end()) {
        SEQCOV_LOG_TRACE("New sample key: {}", key);
        it = samples_.emplace(std::string(key), SampleStats{}).first;
    }
    return it->second;
}

}  // namespace seqcov::stats
