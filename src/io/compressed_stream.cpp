// =============================================================================
// seqcov - Compressed Stream Implementation
// =============================================================================

#include "seqcov/io/compressed_stream.h"

#include <zlib.h>

#include <cstring>
#include <string>

#include "seqcov/common/logger.h"

namespace seqcov::io {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

template <std::size_t N>
bool hasMagic(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (hasMagic(data, kGzipMagic)) {
        return CompressionFormat::kGzip;
    }
    if (hasMagic(data, kBzip2Magic)) {
        return CompressionFormat::kBzip2;
    }
    if (hasMagic(data, kXzMagic)) {
        return CompressionFormat::kXz;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kUnknown:
            break;
    }
    return "unknown";
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib();
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto stream = std::make_unique<z_stream>();
    std::memset(stream.get(), 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = inflateInit2(stream.get(), 16 + MAX_WBITS);
    if (ret != Z_OK) {
        throw IOError("Failed to initialize zlib: " + std::string(zError(ret)));
    }

    zlibStream_ = stream.release();
}

void GzipStreamBuf::cleanupZlib() noexcept {
    if (zlibStream_ != nullptr) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    bool memberOpen = stream->total_in > 0;

    while (true) {
        if (stream->avail_in == 0) {
            source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                          static_cast<std::streamsize>(inputBuffer_.size()));
            auto bytesRead = static_cast<std::size_t>(source_->gcount());
            if (bytesRead == 0) {
                streamEnd_ = true;
                if (memberOpen) {
                    throw IOError("Gzip stream is truncated");
                }
                return 0;
            }
            stream->avail_in = static_cast<uInt>(bytesRead);
            stream->next_in = inputBuffer_.data();
        }

        stream->avail_out = static_cast<uInt>(outputBuffer_.size());
        stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

        int ret = inflate(stream, Z_NO_FLUSH);
        std::size_t produced = outputBuffer_.size() - stream->avail_out;

        if (ret == Z_STREAM_END) {
            // Concatenated members (bgzip, cat a.gz b.gz) continue after a reset
            inflateReset(stream);
            memberOpen = false;
        } else if (ret == Z_OK || ret == Z_BUF_ERROR) {
            memberOpen = true;
        } else {
            throw IOError("Gzip decompression failed: " + std::string(zError(ret)));
        }

        if (produced > 0) {
            return produced;
        }
    }
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    auto fileStream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream->is_open()) {
        throw IOError("Failed to open file", ErrorContext(path.string()));
    }

    std::uint8_t magic[8];
    fileStream->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream->gcount());
    fileStream->clear();
    fileStream->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});
    sourceStream_ = std::move(fileStream);
    setup();
}

CompressedInputStream::CompressedInputStream(std::unique_ptr<std::istream> source,
                                             CompressionFormat format)
    : std::istream(nullptr), sourceStream_(std::move(source)), format_(format) {
    if (format_ == CompressionFormat::kUnknown && sourceStream_) {
        std::uint8_t magic[8];
        sourceStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
        auto bytesRead = static_cast<std::size_t>(sourceStream_->gcount());
        sourceStream_->clear();
        sourceStream_->seekg(0, std::ios::beg);

        format_ = detectCompressionFormat({magic, bytesRead});
    }

    setup();
}

CompressedInputStream::~CompressedInputStream() {
    // The decompressing buffer must not outlive the istream that points at it
    rdbuf(nullptr);
}

void CompressedInputStream::setup() {
    if (!sourceStream_) {
        throw IOError("No source stream available");
    }

    switch (format_) {
        case CompressionFormat::kNone:
            rdbuf(sourceStream_->rdbuf());
            break;

        case CompressionFormat::kGzip:
            decompressBuf_ = std::make_unique<GzipStreamBuf>(*sourceStream_);
            rdbuf(decompressBuf_.get());
            SEQCOV_LOG_DEBUG("Opened gzip compressed stream");
            break;

        case CompressionFormat::kBzip2:
        case CompressionFormat::kXz:
        case CompressionFormat::kUnknown:
            throw IOError("Unsupported input compression: " +
                          std::string(compressionFormatName(format_)));
    }
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw IOError("Input file not found", ErrorContext(path.string()));
    }
    if (std::filesystem::is_directory(path, ec)) {
        throw IOError("Input path is a directory", ErrorContext(path.string()));
    }
    return std::make_unique<CompressedInputStream>(path);
}

}  // namespace seqcov::io
