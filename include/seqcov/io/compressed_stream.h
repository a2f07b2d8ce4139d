// =============================================================================
// seqcov - Compressed Stream Support
// =============================================================================
// Transparent gzip decompression for sequencer output files.
//
// Sequencing summaries are frequently archived as .txt.gz; the summary reader
// opens every input through openInputFile() so both layouts stream the same
// way, one buffer at a time.
//
// Usage:
//   auto stream = seqcov::io::openInputFile("/runs/x/sequencing_summary.txt.gz");
//   std::string line;
//   while (std::getline(*stream, line)) { ... }
// =============================================================================

#ifndef SEQCOV_IO_COMPRESSED_STREAM_H
#define SEQCOV_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "seqcov/common/error.h"

namespace seqcov::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Input compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,  ///< Uncompressed (plain text)
    kGzip = 1,  ///< gzip (.gz)
    kBzip2 = 2,  ///< bzip2 (.bz2), detected but not decoded
    kXz = 3,  ///< xz (.xz), detected but not decoded
    kUnknown = 255
};

/// @brief Detect compression format from file magic bytes.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression.
/// @note Uses zlib for streaming decompression; handles concatenated members.
class GzipStreamBuf : public std::streambuf {
public:
    /// @brief Construct a gzip stream buffer.
    /// @param source Source stream to decompress (must outlive the buffer).
    /// @param bufferSize Internal buffer size.
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;
    GzipStreamBuf(GzipStreamBuf&&) = delete;
    GzipStreamBuf& operator=(GzipStreamBuf&&) = delete;

protected:
    int_type underflow() override;

private:
    void initZlib();

    void cleanupZlib() noexcept;

    /// @brief Decompress more data into the output buffer.
    /// @return Number of bytes decompressed (0 at end of stream).
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    bool streamEnd_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream over a file, decompressing gzip transparently.
class CompressedInputStream : public std::istream {
public:
    /// @brief Open a file and detect its compression from magic bytes.
    /// @throws IOError if the file cannot be opened or its format is unsupported.
    explicit CompressedInputStream(const std::filesystem::path& path);

    /// @brief Wrap an existing stream.
    /// @param source Source stream.
    /// @param format Compression format (auto-detect if kUnknown).
    explicit CompressedInputStream(std::unique_ptr<std::istream> source,
                                   CompressionFormat format = CompressionFormat::kUnknown);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;
    CompressedInputStream(CompressedInputStream&&) = delete;
    CompressedInputStream& operator=(CompressedInputStream&&) = delete;

    /// @brief Get the detected compression format.
    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    /// @brief Check if the stream is compressed.
    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    /// @brief Install the decompressing buffer for the detected format.
    void setup();

    std::unique_ptr<std::istream> sourceStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kUnknown;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file with automatic decompression.
/// @throws IOError if the file is missing, cannot be opened, or uses an
///         unsupported compression format.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

}  // namespace seqcov::io

#endif  // SEQCOV_IO_COMPRESSED_STREAM_H
