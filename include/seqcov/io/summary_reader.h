// =============================================================================
// seqcov - Sequencing Summary Reader
// =============================================================================
// Streaming reader for the per-read sequencing summary (tab-separated, one
// header row, one row per read). Plain or gzip-compressed.
//
// This module provides:
// - ReadRecord: length, sample key and QC flag of one read
// - SummaryLayout: column positions recognized from the header
// - SummaryReader: lazy, single-pass sequence of ReadRecord
//
// Only one line is held in memory at a time. Lines that cannot be parsed are
// skipped and counted; only an unrecognizable header is fatal.
//
// Usage:
//   SummaryReader reader("/runs/x/sequencing_summary.txt");
//   for (const ReadRecord& read : reader) {
//       aggregator.add(read);
//   }
//   if (reader.skippedLines() > 0) { ... }
// =============================================================================

#ifndef SEQCOV_IO_SUMMARY_READER_H
#define SEQCOV_IO_SUMMARY_READER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "seqcov/common/error.h"
#include "seqcov/common/types.h"

namespace seqcov::io {

// =============================================================================
// Read Record
// =============================================================================

/// @brief One sequenced read, as far as coverage statistics are concerned.
struct ReadRecord {
    /// @brief Template length in base pairs.
    ReadLength lengthBp = 0;

    /// @brief Barcode (or sample) the read is attributed to, if any.
    std::optional<std::string> sampleKey;

    /// @brief Whether the read passed basecaller quality filtering.
    bool qcPass = true;

    /// @brief Aggregation key; unbarcoded reads share kDefaultSampleKey.
    [[nodiscard]] std::string_view key() const noexcept {
        return sampleKey.has_value() ? std::string_view(*sampleKey) : kDefaultSampleKey;
    }
};

// =============================================================================
// Summary Layout
// =============================================================================

/// @brief Column positions recognized from the summary header.
struct SummaryLayout {
    /// @brief Number of columns in the header.
    std::size_t columnCount = 0;

    /// @brief Read length column (sequence_length_template et al.).
    std::size_t lengthColumn = 0;

    /// @brief Barcode column, absent for unbarcoded runs.
    std::optional<std::size_t> barcodeColumn;

    /// @brief QC flag column (passes_filtering), absent means every read passes.
    std::optional<std::size_t> qcColumn;
};

/// @brief Information about the most recent skipped line.
struct SkippedLine {
    /// @brief Line number (1-based, header is line 1).
    std::uint64_t lineNumber = 0;

    /// @brief Why the line was rejected.
    std::string reason;
};

// =============================================================================
// SummaryReader Class
// =============================================================================

/// @brief Lazy, finite, non-restartable sequence of ReadRecord.
///
/// The input is released as soon as the sequence is exhausted, on close(),
/// or when the reader is destroyed (including during exception unwinding).
///
/// Thread Safety: not thread-safe; shard by file or line range instead.
class SummaryReader {
public:
    // =========================================================================
    // Iterator
    // =========================================================================

    /// @brief Single-pass input iterator over the remaining records.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ReadRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const ReadRecord*;
        using reference = const ReadRecord&;

        Iterator() = default;

        explicit Iterator(SummaryReader* reader) : reader_(reader) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept {
            return !it.current_.has_value();
        }

    private:
        void advance() { current_ = reader_ != nullptr ? reader_->next() : std::nullopt; }

        SummaryReader* reader_ = nullptr;
        std::optional<ReadRecord> current_;
    };

    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    /// @brief Open a summary file and recognize its header.
    /// @throws IOError if the file cannot be opened.
    /// @throws UnrecognizedFormatError if the file is empty or the header has
    ///         no read-length column.
    explicit SummaryReader(const std::filesystem::path& filePath);

    /// @brief Read a summary from an already open stream.
    /// @param stream Input stream (plain text).
    /// @param sourceName Name used in messages.
    explicit SummaryReader(std::unique_ptr<std::istream> stream,
                           std::string sourceName = "<stream>");

    ~SummaryReader();

    SummaryReader(const SummaryReader&) = delete;
    SummaryReader& operator=(const SummaryReader&) = delete;
    SummaryReader(SummaryReader&&) noexcept;
    SummaryReader& operator=(SummaryReader&&) noexcept;

    // =========================================================================
    // Reading
    // =========================================================================

    /// @brief Produce the next record.
    /// @return The record, or nullopt once the input is exhausted.
    /// @throws IOError on a read failure of the underlying stream.
    [[nodiscard]] std::optional<ReadRecord> next();

    /// @brief Iterator over the remaining records.
    [[nodiscard]] Iterator begin() { return Iterator(this); }

    [[nodiscard]] std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    /// @brief Release the input early.
    void close() noexcept;

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] bool isOpen() const noexcept { return stream_ != nullptr; }

    [[nodiscard]] const SummaryLayout& layout() const noexcept { return layout_; }

    /// @brief Whether reads are attributed by a barcode column.
    [[nodiscard]] bool hasBarcodes() const noexcept { return layout_.barcodeColumn.has_value(); }

    /// @brief Records produced so far.
    [[nodiscard]] std::uint64_t recordsRead() const noexcept { return recordsRead_; }

    /// @brief Malformed lines skipped so far.
    [[nodiscard]] std::uint64_t skippedLines() const noexcept { return skippedLines_; }

    /// @brief Last skipped line, if any.
    [[nodiscard]] const std::optional<SkippedLine>& lastSkipped() const noexcept {
        return lastSkipped_;
    }

    /// @brief Current line number (header is line 1).
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

    [[nodiscard]] const std::string& sourceName() const noexcept { return sourceName_; }

    // =========================================================================
    // Parsing Primitives
    // =========================================================================

    /// @brief Recognize the column layout from a header line.
    /// @throws UnrecognizedFormatError if no read-length column is present.
    [[nodiscard]] static SummaryLayout recognizeHeader(std::string_view headerLine,
                                                       const std::string& sourceName);

    /// @brief Parse one data line against a layout.
    /// @return The record, or a MalformedInput error describing the problem.
    [[nodiscard]] static Result<ReadRecord> parseLine(std::string_view line,
                                                      const SummaryLayout& layout);

private:
    void readHeader();

    std::string sourceName_;
    std::unique_ptr<std::istream> stream_;
    SummaryLayout layout_;
    std::string line_;
    std::uint64_t lineNumber_ = 0;
    std::uint64_t recordsRead_ = 0;
    std::uint64_t skippedLines_ = 0;
    std::optional<SkippedLine> lastSkipped_;
};

/// @brief Parse a QC flag literal (TRUE/FALSE, true/false, 1/0).
[[nodiscard]] std::optional<bool> parseQcFlag(std::string_view field) noexcept;

}  // namespace seqcov::io

#endif  // SEQCOV_IO_SUMMARY_READER_H
