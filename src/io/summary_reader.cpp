// =============================================================================
// seqcov - Sequencing Summary Reader Implementation
// =============================================================================

#include "seqcov/io/summary_reader.h"

#include <array>
#include <istream>
#include <vector>

#include <fmt/format.h>

#include "seqcov/common/logger.h"
#include "seqcov/io/compressed_stream.h"
#include "seqcov/io/delimited.h"

namespace seqcov::io {

namespace {

constexpr std::array<std::string_view, 3> kLengthColumns = {"sequence_length_template",
                                                            "sequence_length", "read_length"};
constexpr std::array<std::string_view, 2> kBarcodeColumns = {"barcode_arrangement", "barcode"};
constexpr std::array<std::string_view, 2> kQcColumns = {"passes_filtering", "qc_pass"};

constexpr char kSummaryDelimiter = '\t';

}  // namespace

// =============================================================================
// Utility Functions
// =============================================================================

std::optional<bool> parseQcFlag(std::string_view field) noexcept {
    if (field == "TRUE" || field == "True" || field == "true" || field == "1") {
        return true;
    }
    if (field == "FALSE" || field == "False" || field == "false" || field == "0") {
        return false;
    }
    return std::nullopt;
}

// =============================================================================
// SummaryReader Implementation
// =============================================================================

SummaryReader::SummaryReader(const std::filesystem::path& filePath)
    : sourceName_(filePath.string()), stream_(openInputFile(filePath)) {
    SEQCOV_LOG_DEBUG("Opened sequencing summary: {}", sourceName_);
    readHeader();
}

SummaryReader::SummaryReader(std::unique_ptr<std::istream> stream, std::string sourceName)
    : sourceName_(std::move(sourceName)), stream_(std::move(stream)) {
    if (!stream_) {
        throw IOError("No summary stream available", ErrorContext(sourceName_));
    }
    readHeader();
}

SummaryReader::~SummaryReader() { close(); }

SummaryReader::SummaryReader(SummaryReader&&) noexcept = default;
SummaryReader& SummaryReader::operator=(SummaryReader&&) noexcept = default;

void SummaryReader::readHeader() {
    if (!std::getline(*stream_, line_)) {
        close();
        throw UnrecognizedFormatError("sequencing summary is empty", ErrorContext(sourceName_));
    }
    ++lineNumber_;
    stripCarriageReturn(line_);
    stripByteOrderMark(line_);

    layout_ = recognizeHeader(line_, sourceName_);

    SEQCOV_LOG_DEBUG("Summary layout: {} columns, length col {}, barcode {}, qc {}",
                     layout_.columnCount, layout_.lengthColumn,
                     layout_.barcodeColumn.has_value() ? "yes" : "no",
                     layout_.qcColumn.has_value() ? "yes" : "no");
}

SummaryLayout SummaryReader::recognizeHeader(std::string_view headerLine,
                                             const std::string& sourceName) {
    auto rawFields = splitFields(headerLine, kSummaryDelimiter);
    std::vector<std::string_view> fields;
    fields.reserve(rawFields.size());
    for (auto field : rawFields) {
        fields.push_back(trimField(field));
    }

    auto lengthColumn = findColumn(fields, kLengthColumns);
    if (!lengthColumn.has_value()) {
        throw UnrecognizedFormatError(
            "summary header has no read length column (expected sequence_length_template)",
            ErrorContext(sourceName).withLine(1));
    }

    SummaryLayout layout;
    layout.columnCount = fields.size();
    layout.lengthColumn = *lengthColumn;
    layout.barcodeColumn = findColumn(fields, kBarcodeColumns);
    layout.qcColumn = findColumn(fields, kQcColumns);
    return layout;
}

Result<ReadRecord> SummaryReader::parseLine(std::string_view line, const SummaryLayout& layout) {
    auto fields = splitFields(line, kSummaryDelimiter);
    if (fields.size() != layout.columnCount) {
        return makeError<ReadRecord>(
            ErrorCode::kMalformedInput,
            fmt::format("expected {} columns, found {}", layout.columnCount, fields.size()));
    }

    ReadRecord record;

    auto lengthField = trimField(fields[layout.lengthColumn]);
    auto length = parseUnsigned(lengthField);
    if (!length.has_value()) {
        return makeError<ReadRecord>(ErrorCode::kMalformedInput,
                                     fmt::format("invalid read length '{}'", lengthField));
    }
    record.lengthBp = *length;

    if (layout.barcodeColumn.has_value()) {
        auto barcode = trimField(fields[*layout.barcodeColumn]);
        if (!barcode.empty()) {
            record.sampleKey = std::string(barcode);
        }
    }

    if (layout.qcColumn.has_value()) {
        auto qcField = trimField(fields[*layout.qcColumn]);
        auto qcPass = parseQcFlag(qcField);
        if (!qcPass.has_value()) {
            return makeError<ReadRecord>(ErrorCode::kMalformedInput,
                                         fmt::format("invalid QC flag '{}'", qcField));
        }
        record.qcPass = *qcPass;
    }

    return record;
}

std::optional<ReadRecord> SummaryReader::next() {
    if (!stream_) {
        return std::nullopt;
    }

    while (std::getline(*stream_, line_)) {
        ++lineNumber_;
        stripCarriageReturn(line_);
        if (line_.empty()) {
            continue;
        }

        auto record = parseLine(line_, layout_);
        if (record.has_value()) {
            ++recordsRead_;
            return std::move(*record);
        }

        ++skippedLines_;
        lastSkipped_ = SkippedLine{.lineNumber = lineNumber_, .reason = record.error().message()};
        SEQCOV_LOG_DEBUG("Skipping {} line {}: {}", sourceName_, lineNumber_,
                         record.error().message());
    }

    if (stream_->bad()) {
        auto failedAt = lineNumber_;
        close();
        throw IOError("failed while reading sequencing summary",
                      ErrorContext(sourceName_).withLine(failedAt));
    }

    SEQCOV_LOG_DEBUG("Finished {}: {} records, {} skipped lines", sourceName_, recordsRead_,
                     skippedLines_);
    close();
    return std::nullopt;
}

void SummaryReader::close() noexcept {
    stream_.reset();
    line_.clear();
    line_.shrink_to_fit();
}

}  // namespace seqcov::io
