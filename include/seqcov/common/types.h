// =============================================================================
// seqcov - Common Type Definitions
// =============================================================================
// Core type definitions shared across the seqcov library.
//
// This module defines:
// - BaseCount, ReadCount, ReadLength: integer aliases for yield arithmetic
// - QcPolicy: whether QC-failed reads contribute to totals
// - OutputFormat: report rendering format
// - Defaults for the read-length threshold and the unbarcoded sample key
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef SEQCOV_COMMON_TYPES_H
#define SEQCOV_COMMON_TYPES_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace seqcov {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Number of sequenced bases (yield).
using BaseCount = std::uint64_t;

/// @brief Number of reads.
using ReadCount = std::uint64_t;

/// @brief Length of a single read in base pairs.
using ReadLength = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default read-length qualification cutoff (bp, inclusive).
inline constexpr ReadLength kDefaultThreshold = 7'000;

/// @brief Sample key for reads without barcode attribution.
inline constexpr std::string_view kDefaultSampleKey = "unclassified";

/// @brief Bases per megabase, for sample sheets that give genome size in Mb.
inline constexpr double kBasesPerMegabase = 1'000'000.0;

// =============================================================================
// QC Policy Enumeration
// =============================================================================

/// @brief Treatment of reads whose QC flag is false.
enum class QcPolicy : std::uint8_t {
    /// @brief Every read counts toward totals regardless of QC (default).
    kIncludeAll = 0,

    /// @brief QC-failed reads are excluded from every total.
    kPassOnly = 1
};

[[nodiscard]] constexpr std::string_view qcPolicyToString(QcPolicy policy) noexcept {
    switch (policy) {
        case QcPolicy::kIncludeAll:
            return "include-all";
        case QcPolicy::kPassOnly:
            return "pass-only";
    }
    return "unknown";
}

// =============================================================================
// Output Format Enumeration
// =============================================================================

/// @brief Report rendering format.
enum class OutputFormat : std::uint8_t {
    /// @brief Fixed-width human-readable table (default).
    kTable = 0,

    /// @brief Comma-separated values with a header row.
    kCsv = 1
};

[[nodiscard]] constexpr std::string_view outputFormatToString(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::kTable:
            return "table";
        case OutputFormat::kCsv:
            return "csv";
    }
    return "unknown";
}

/// @brief Parse an output format name.
/// @return The format, or nullopt for an unknown name.
[[nodiscard]] constexpr std::optional<OutputFormat> outputFormatFromString(
    std::string_view name) noexcept {
    if (name == "table") {
        return OutputFormat::kTable;
    }
    if (name == "csv") {
        return OutputFormat::kCsv;
    }
    return std::nullopt;
}

static_assert(sizeof(QcPolicy) == 1, "QcPolicy must be 1 byte");
static_assert(sizeof(OutputFormat) == 1, "OutputFormat must be 1 byte");

}  // namespace seqcov

#endif  // SEQCOV_COMMON_TYPES_H
