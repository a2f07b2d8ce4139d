// =============================================================================
// seqcov - Coverage Calculator Implementation
// =============================================================================

#include "seqcov/stats/coverage_calculator.h"

#include <unordered_set>

#include "seqcov/common/logger.h"

namespace seqcov::stats {

// =============================================================================
// Utility Functions
// =============================================================================

namespace {

double meanLength(BaseCount bases, ReadCount reads) {
    return reads > 0 ? static_cast<double>(bases) / static_cast<double>(reads) : 0.0;
}

}  // namespace

std::optional<ReadLength> computeN50(const LengthHistogram& histogram, BaseCount totalBases) {
    if (histogram.empty() || totalBases == 0) {
        return std::nullopt;
    }

    // Walk lengths longest first; 2 * cumulative >= total avoids rounding
    BaseCount cumulative = 0;
    for (auto it = histogram.rbegin(); it != histogram.rend(); ++it) {
        cumulative += it->first * it->second;
        if (2 * cumulative >= totalBases) {
            return it->first;
        }
    }
    return histogram.begin()->first;
}

// =============================================================================
// CoverageCalculator Implementation
// =============================================================================

CoverageCalculator::CoverageCalculator(const registry::SampleRegistry& registry)
    : registry_(registry) {}

CoverageResult CoverageCalculator::computeSample(const registry::SampleRecord& sample,
                                                 const SampleStats* stats) {
    CoverageResult result;
    result.sampleId = sample.id;
    result.alias = sample.alias;
    result.barcode = sample.barcode;
    result.genomeSizeBp = sample.genomeSizeBp;

    if (stats == nullptr) {
        return result;
    }

    result.totalBases = stats->totalBases();
    result.readCount = stats->readCount();
    result.coverageX =
        static_cast<double>(result.totalBases) / static_cast<double>(result.genomeSizeBp);
    result.meanReadLength = meanLength(result.totalBases, result.readCount);

    if (stats->hasDistribution()) {
        result.n50 = computeN50(stats->lengthHistogram(), stats->totalBases());
        result.readsAboveThreshold = stats->readsAboveThreshold();
        result.basesAboveThreshold = stats->basesAboveThreshold();
        result.readsBelowThreshold = result.readCount - stats->readsAboveThreshold();
        result.basesBelowThreshold = result.totalBases - stats->basesAboveThreshold();
        result.meanLengthAboveThreshold =
            meanLength(stats->basesAboveThreshold(), stats->readsAboveThreshold());
        result.meanLengthBelowThreshold =
            meanLength(*result.basesBelowThreshold, *result.readsBelowThreshold);
        result.pctReadsAboveThreshold =
            result.readCount > 0 ? 100.0 * static_cast<double>(stats->readsAboveThreshold()) /
                                       static_cast<double>(result.readCount)
                                 : 0.0;
    }

    return result;
}

CoverageReport CoverageCalculator::compute(const StatsAggregator& aggregator) const {
    CoverageReport report;
    report.threshold = aggregator.options().threshold;
    report.results.reserve(registry_.size());

    // Key each registry sample's data is found under
    std::vector<const SampleStats*> matched(registry_.size(), nullptr);
    std::unordered_set<std::string_view> usedKeys;

    for (std::size_t i = 0; i < registry_.size(); ++i) {
        const auto& sample = registry_.samples()[i];
        std::string_view key = sample.joinKey();
        if (const SampleStats* stats = aggregator.find(key)) {
            matched[i] = stats;
            usedKeys.insert(key);
        } else if (sample.barcode.has_value()) {
            // Inputs may be keyed by sample id even when a barcode is known
            if (const SampleStats* byId = aggregator.find(sample.id)) {
                matched[i] = byId;
                usedKeys.insert(sample.id);
            }
        }
    }

    // Unbarcoded input against a single-sample registry belongs to that sample
    const auto& allStats = aggregator.samples();
    if (registry_.size() == 1 && matched.front() == nullptr && allStats.size() == 1 &&
        allStats.begin()->first == kDefaultSampleKey) {
        matched.front() = &allStats.begin()->second;
        usedKeys.insert(kDefaultSampleKey);
        SEQCOV_LOG_INFO("Attributing unbarcoded reads to sole sample {}",
                        registry_.samples().front().id);
    }

    for (std::size_t i = 0; i < registry_.size(); ++i) {
        const auto& sample = registry_.samples()[i];
        report.results.push_back(computeSample(sample, matched[i]));
        if (matched[i] == nullptr) {
            SEQCOV_LOG_DEBUG("No reads attributed to sample {}", sample.id);
        }
    }

    for (const auto& [key, stats] : allStats) {
        if (usedKeys.contains(key)) {
            continue;
        }
        report.orphans.push_back(OrphanSample{
            .key = key, .totalBases = stats.totalBases(), .readCount = stats.readCount()});
        SEQCOV_LOG_WARNING("Input sample '{}' ({} reads) is not in the registry", key,
                           stats.readCount());
    }

    return report;
}

}  // namespace seqcov::stats
