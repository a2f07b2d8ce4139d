// =============================================================================
// seqcov - Error Handling Framework Implementation
// =============================================================================

#include "seqcov/common/error.h"

#include <format>
#include <sstream>

namespace seqcov {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (lineNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "line: " << *lineNumber;
        hasContent = true;
    }

    if (sampleKey.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "sample: " << *sampleKey;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// SeqcovException Implementation
// =============================================================================

void SeqcovException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// RunMismatchError Implementation
// =============================================================================

std::string RunMismatchError::formatMismatch(const std::string& registryRunId,
                                             const std::string& reportRunId) {
    return std::format("registry experiment_id ({}) != report protocol_group_id ({})",
                       registryRunId, reportRunId);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw UnrecognizedFormatError(message_);
        case ErrorCode::kMalformedInput:
            throw MalformedInputError(message_);
        case ErrorCode::kInvalidGenomeSize:
            throw InvalidGenomeSizeError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kDuplicateSample:
        case ErrorCode::kRunMismatch:
            break;
    }
    throw SeqcovException(code_, message_);
}

}  // namespace seqcov
