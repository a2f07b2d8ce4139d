// =============================================================================
// seqcov - Coverage Calculator Tests
// =============================================================================
// Unit and property tests for coverage, mean length, N50, the threshold
// percentage, orphan detection and single-sample attribution.
// =============================================================================

#include "seqcov/stats/coverage_calculator.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

namespace seqcov::stats::test {

using registry::SampleRecord;
using registry::SampleRegistry;

[[nodiscard]] SampleRegistry makeRegistry(std::vector<SampleRecord> samples) {
    return SampleRegistry(std::move(samples));
}

[[nodiscard]] io::ReadRecord read(ReadLength length, std::optional<std::string> key) {
    return io::ReadRecord{.lengthBp = length, .sampleKey = std::move(key)};
}

// =============================================================================
// N50
// =============================================================================

TEST(N50Test, EqualLengths) {
    LengthHistogram histogram{{10, 4}};
    EXPECT_EQ(computeN50(histogram, 40), 10u);
}

TEST(N50Test, HalfwayPointIsInclusive) {
    // 8000 + 6000 + 4000 = 18000; 8000 alone is < 9000, 8000 + 6000 >= 9000
    LengthHistogram histogram{{4000, 1}, {6000, 1}, {8000, 1}};
    EXPECT_EQ(computeN50(histogram, 18000), 6000u);

    // 20 alone is exactly half of 40
    LengthHistogram exact{{10, 2}, {20, 1}};
    EXPECT_EQ(computeN50(exact, 40), 20u);
}

TEST(N50Test, EmptyHistogramHasNoN50) {
    EXPECT_FALSE(computeN50({}, 0).has_value());
}

// =============================================================================
// Per-sample Metrics
// =============================================================================

TEST(CoverageCalculatorTest, ReferenceScenario) {
    auto registry = makeRegistry({SampleRecord{.id = "S1", .genomeSizeBp = 5'000'000}});
    StatsAggregator aggregator(AggregatorOptions{.threshold = 7000});
    aggregator.add(read(8000, "S1"));
    aggregator.add(read(6000, "S1"));
    aggregator.add(read(4000, "S1"));

    auto report = CoverageCalculator(registry).compute(aggregator);

    ASSERT_EQ(report.results.size(), 1u);
    const auto& result = report.results[0];
    EXPECT_EQ(result.sampleId, "S1");
    EXPECT_EQ(result.totalBases, 18000u);
    EXPECT_EQ(result.readCount, 3u);
    EXPECT_DOUBLE_EQ(result.coverageX, 0.0036);
    EXPECT_DOUBLE_EQ(result.meanReadLength, 6000.0);
    EXPECT_EQ(result.n50, 6000u);
    EXPECT_EQ(result.readsAboveThreshold, 1u);
    EXPECT_EQ(result.basesAboveThreshold, 8000u);
    ASSERT_TRUE(result.pctReadsAboveThreshold.has_value());
    EXPECT_NEAR(*result.pctReadsAboveThreshold, 33.33, 0.005);
    EXPECT_TRUE(report.orphans.empty());
    EXPECT_EQ(report.threshold, 7000u);
}

TEST(CoverageCalculatorTest, YieldSplitAtThreshold) {
    auto registry = makeRegistry({SampleRecord{
        .id = "S1", .genomeSizeBp = 5'000'000, .barcode = "barcode01", .alias = "ecoli"}});
    StatsAggregator aggregator(AggregatorOptions{.threshold = 7000});
    aggregator.add(read(8000, "barcode01"));
    aggregator.add(read(6000, "barcode01"));
    aggregator.add(read(4000, "barcode01"));
    aggregator.add(read(7000, "barcode01"));

    const auto result = CoverageCalculator(registry).compute(aggregator).results.at(0);

    EXPECT_EQ(result.alias, "ecoli");
    EXPECT_EQ(result.barcode, "barcode01");
    EXPECT_EQ(result.readsBelowThreshold, 2u);
    EXPECT_EQ(result.basesBelowThreshold, 10000u);
    ASSERT_TRUE(result.meanLengthBelowThreshold.has_value());
    EXPECT_DOUBLE_EQ(*result.meanLengthBelowThreshold, 5000.0);
    EXPECT_EQ(result.readsAboveThreshold, 2u);
    EXPECT_EQ(result.basesAboveThreshold, 15000u);
    ASSERT_TRUE(result.meanLengthAboveThreshold.has_value());
    EXPECT_DOUBLE_EQ(*result.meanLengthAboveThreshold, 7500.0);
}

TEST(CoverageCalculatorTest, EmptySideOfThresholdHasZeroMean) {
    auto registry = makeRegistry({SampleRecord{.id = "S1", .genomeSizeBp = 1000}});
    StatsAggregator aggregator(AggregatorOptions{.threshold = 7000});
    aggregator.add(read(100, "S1"));

    const auto result = CoverageCalculator(registry).compute(aggregator).results.at(0);

    EXPECT_EQ(result.readsAboveThreshold, 0u);
    EXPECT_EQ(result.meanLengthAboveThreshold, 0.0);
    EXPECT_EQ(result.meanLengthBelowThreshold, 100.0);
}

TEST(CoverageCalculatorTest, SampleWithoutReadsIsZeroAndUnavailable) {
    auto registry = makeRegistry({SampleRecord{.id = "S1", .genomeSizeBp = 1000},
                                  SampleRecord{.id = "S2", .genomeSizeBp = 1000}});
    StatsAggregator aggregator;
    aggregator.add(read(500, "S1"));

    auto report = CoverageCalculator(registry).compute(aggregator);

    ASSERT_EQ(report.results.size(), 2u);
    const auto& empty = report.results[1];
    EXPECT_EQ(empty.sampleId, "S2");
    EXPECT_EQ(empty.totalBases, 0u);
    EXPECT_EQ(empty.readCount, 0u);
    EXPECT_DOUBLE_EQ(empty.coverageX, 0.0);
    EXPECT_DOUBLE_EQ(empty.meanReadLength, 0.0);
    EXPECT_FALSE(empty.n50.has_value());
    EXPECT_FALSE(empty.pctReadsAboveThreshold.has_value());
}

TEST(CoverageCalculatorTest, YieldTotalsLeaveDistributionUnavailable) {
    auto registry = makeRegistry(
        {SampleRecord{.id = "S1", .genomeSizeBp = 1000, .barcode = "barcode01"}});
    StatsAggregator aggregator;
    aggregator.addTotals("barcode01", 3000, 4);

    auto report = CoverageCalculator(registry).compute(aggregator);

    const auto& result = report.results[0];
    EXPECT_DOUBLE_EQ(result.coverageX, 3.0);
    EXPECT_DOUBLE_EQ(result.meanReadLength, 750.0);
    EXPECT_FALSE(result.n50.has_value());
    EXPECT_FALSE(result.pctReadsAboveThreshold.has_value());
    EXPECT_FALSE(result.readsAboveThreshold.has_value());
    EXPECT_FALSE(result.basesAboveThreshold.has_value());
    EXPECT_FALSE(result.basesBelowThreshold.has_value());
    EXPECT_FALSE(result.meanLengthBelowThreshold.has_value());
    EXPECT_FALSE(result.meanLengthAboveThreshold.has_value());
}

TEST(CoverageCalculatorTest, JoinsByBarcodeOrId) {
    auto registry = makeRegistry(
        {SampleRecord{.id = "S1", .genomeSizeBp = 100, .barcode = "barcode01"},
         SampleRecord{.id = "S2", .genomeSizeBp = 100, .barcode = "barcode02"}});
    StatsAggregator aggregator;
    aggregator.add(read(10, "barcode01"));
    aggregator.add(read(20, "S2"));

    auto report = CoverageCalculator(registry).compute(aggregator);

    EXPECT_EQ(report.results[0].totalBases, 10u);
    EXPECT_EQ(report.results[1].totalBases, 20u);
    EXPECT_TRUE(report.orphans.empty());
}

TEST(CoverageCalculatorTest, KeyNeverMatchesTwoSamples) {
    // A barcode equal to another sample's id would attribute one read twice
    EXPECT_THROW((void)makeRegistry({SampleRecord{.id = "S1", .genomeSizeBp = 5'000'000,
                                                  .barcode = "bc01"},
                                     SampleRecord{.id = "bc01", .genomeSizeBp = 5'000'000}}),
                 DuplicateSampleError);

    auto registry = makeRegistry(
        {SampleRecord{.id = "bc01", .genomeSizeBp = 5'000'000, .barcode = "bc01"},
         SampleRecord{.id = "S2", .genomeSizeBp = 5'000'000}});
    StatsAggregator aggregator;
    aggregator.add(read(8000, "bc01"));

    auto report = CoverageCalculator(registry).compute(aggregator);

    EXPECT_EQ(report.results[0].totalBases, 8000u);
    EXPECT_EQ(report.results[1].totalBases, 0u);
}

TEST(CoverageCalculatorTest, UnknownKeysBecomeSortedOrphans) {
    auto registry = makeRegistry({SampleRecord{.id = "S1", .genomeSizeBp = 100}});
    StatsAggregator aggregator;
    aggregator.add(read(10, "S1"));
    aggregator.add(read(30, "zeta"));
    aggregator.add(read(20, "alpha"));
    aggregator.add(read(25, "alpha"));

    auto report = CoverageCalculator(registry).compute(aggregator);

    ASSERT_EQ(report.results.size(), 1u);
    ASSERT_EQ(report.orphans.size(), 2u);
    EXPECT_EQ(report.orphans[0].key, "alpha");
    EXPECT_EQ(report.orphans[0].totalBases, 45u);
    EXPECT_EQ(report.orphans[0].readCount, 2u);
    EXPECT_EQ(report.orphans[1].key, "zeta");
}

TEST(CoverageCalculatorTest, UnbarcodedReadsGoToSoleSample) {
    auto registry = makeRegistry({SampleRecord{.id = "S1", .genomeSizeBp = 100}});
    StatsAggregator aggregator;
    aggregator.add(read(50, std::nullopt));
    aggregator.add(read(150, std::nullopt));

    auto report = CoverageCalculator(registry).compute(aggregator);

    EXPECT_EQ(report.results[0].totalBases, 200u);
    EXPECT_DOUBLE_EQ(report.results[0].coverageX, 2.0);
    EXPECT_TRUE(report.orphans.empty());
}

TEST(CoverageCalculatorTest, UnbarcodedReadsWithSeveralSamplesAreOrphans) {
    auto registry = makeRegistry({SampleRecord{.id = "S1", .genomeSizeBp = 100},
                                  SampleRecord{.id = "S2", .genomeSizeBp = 100}});
    StatsAggregator aggregator;
    aggregator.add(read(50, std::nullopt));

    auto report = CoverageCalculator(registry).compute(aggregator);

    EXPECT_EQ(report.results[0].totalBases, 0u);
    EXPECT_EQ(report.results[1].totalBases, 0u);
    ASSERT_EQ(report.orphans.size(), 1u);
    EXPECT_EQ(report.orphans[0].key, kDefaultSampleKey);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(CoverageCalculatorProperty, OneRowPerRegistrySample, ()) {
    const auto sampleCount = *rc::gen::inRange<std::size_t>(1, 20);
    const auto keys = *rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 40));

    std::vector<SampleRecord> samples;
    for (std::size_t i = 0; i < sampleCount; ++i) {
        samples.push_back(SampleRecord{.id = "S" + std::to_string(i), .genomeSizeBp = 1000});
    }
    auto registry = makeRegistry(samples);

    StatsAggregator aggregator;
    for (int key : keys) {
        aggregator.add(read(100, "S" + std::to_string(key)));
    }

    auto report = CoverageCalculator(registry).compute(aggregator);

    RC_ASSERT(report.results.size() == registry.size());
    for (std::size_t i = 0; i < sampleCount; ++i) {
        RC_ASSERT(report.results[i].sampleId == samples[i].id);
    }
}

RC_GTEST_PROP(CoverageCalculatorProperty, CoverageIsLinearInBases, ()) {
    const auto genomeSize = *rc::gen::inRange<BaseCount>(1, 10'000'000'000ULL);
    const auto bases = *rc::gen::inRange<BaseCount>(0, 1ULL << 40);
    SampleRecord sample{.id = "S1", .genomeSizeBp = genomeSize};

    StatsAggregator single;
    single.addTotals("S1", bases, 1);
    StatsAggregator doubled;
    doubled.addTotals("S1", 2 * bases, 2);

    auto once = CoverageCalculator::computeSample(sample, single.find("S1"));
    auto twice = CoverageCalculator::computeSample(sample, doubled.find("S1"));

    RC_ASSERT(twice.coverageX == 2.0 * once.coverageX);
}

RC_GTEST_PROP(CoverageCalculatorProperty, N50IsAnObservedLength, ()) {
    const auto lengths =
        *rc::gen::nonEmpty(rc::gen::container<std::vector<ReadLength>>(
            rc::gen::inRange<ReadLength>(1, 100'000)));

    LengthHistogram histogram;
    BaseCount total = 0;
    for (ReadLength length : lengths) {
        ++histogram[length];
        total += length;
    }

    auto n50 = computeN50(histogram, total);

    RC_ASSERT(n50.has_value());
    RC_ASSERT(histogram.contains(*n50));

    // Reads at least as long as the N50 hold at least half of the bases
    BaseCount atLeast = 0;
    for (ReadLength length : lengths) {
        if (length >= *n50) {
            atLeast += length;
        }
    }
    RC_ASSERT(2 * atLeast >= total);
}

RC_GTEST_PROP(CoverageCalculatorProperty, EveryBaseCountedOnce, ()) {
    const auto sampleCount = *rc::gen::inRange<std::size_t>(1, 10);
    const auto lengths = *rc::gen::container<std::vector<ReadLength>>(
        rc::gen::inRange<ReadLength>(0, 20000));

    // Half the samples are keyed by barcode, the rest by id
    std::vector<SampleRecord> samples;
    std::vector<std::string> keys;
    for (std::size_t i = 0; i < sampleCount; ++i) {
        SampleRecord sample{.id = "S" + std::to_string(i), .genomeSizeBp = 1000};
        if (i % 2 == 0) {
            sample.barcode = "barcode" + std::to_string(i);
            keys.push_back(sample.id);
        }
        keys.push_back(std::string(sample.joinKey()));
        samples.push_back(std::move(sample));
    }
    keys.emplace_back("unknown");
    auto registry = makeRegistry(samples);

    StatsAggregator aggregator;
    BaseCount expected = 0;
    for (std::size_t i = 0; i < lengths.size(); ++i) {
        aggregator.add(read(lengths[i], keys[i % keys.size()]));
        expected += lengths[i];
    }

    auto report = CoverageCalculator(registry).compute(aggregator);

    BaseCount counted = 0;
    for (const auto& result : report.results) {
        counted += result.totalBases;
    }
    for (const auto& orphan : report.orphans) {
        counted += orphan.totalBases;
    }
    RC_ASSERT(counted == expected);
}

}  // namespace seqcov::stats::test
