// =============================================================================
// seqcov - Error Handling Framework
// =============================================================================
// Error handling for the seqcov library and command-line tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - SeqcovException hierarchy for structured error handling
// - Result<T, E> type for recoverable per-line failures (using std::expected)
// - Error context (file path, line number) for messages
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read failure)
// - 3: Format error (unrecognized input layout)
// - 4: Malformed input (row or schema cannot be parsed)
// - 5: Duplicate sample in registry
// - 6: Invalid genome size
// - 7: Run identifier mismatch between registry and report
// =============================================================================

#ifndef SEQCOV_COMMON_ERROR_H
#define SEQCOV_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace seqcov {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Includes supplying neither or both of --summary and --json.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read failure, permission denied, etc.
    kIOError = 2,

    /// @brief Input layout not recognized (e.g. summary header).
    kFormatError = 3,

    /// @brief A row or JSON document does not have the expected shape.
    kMalformedInput = 4,

    /// @brief A sample id or barcode appears twice in the registry.
    kDuplicateSample = 5,

    /// @brief Genome size is missing, non-numeric or not positive.
    kInvalidGenomeSize = 6,

    /// @brief Registry experiment id differs from the report run id.
    kRunMismatch = 7
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "unrecognized format";
        case ErrorCode::kMalformedInput:
            return "malformed input";
        case ErrorCode::kDuplicateSample:
            return "duplicate sample";
        case ErrorCode::kInvalidGenomeSize:
            return "invalid genome size";
        case ErrorCode::kRunMismatch:
            return "run mismatch";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief 1-based line number where the error occurred (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Sample id or barcode involved (if applicable).
    std::optional<std::string> sampleKey;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the line number.
    /// @return Reference to this for method chaining.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Set the sample key.
    /// @return Reference to this for method chaining.
    ErrorContext& withSample(std::string key) {
        sampleKey = std::move(key);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all seqcov errors.
/// @note Provides error code, message, and optional context.
class SeqcovException : public std::exception {
public:
    SeqcovException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    SeqcovException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~SeqcovException() override = default;

    SeqcovException(const SeqcovException&) = default;
    SeqcovException(SeqcovException&&) noexcept = default;
    SeqcovException& operator=(const SeqcovException&) = default;
    SeqcovException& operator=(SeqcovException&&) noexcept = default;

    /// @brief Get the formatted error message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public SeqcovException {
public:
    explicit UsageError(std::string message)
        : SeqcovException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : SeqcovException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for missing files, open failures and decompression failures.
class IOError : public SeqcovException {
public:
    explicit IOError(std::string message)
        : SeqcovException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : SeqcovException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : SeqcovException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for unrecognized input layouts (exit code 3).
/// @note Thrown when the summary header has no read-length column.
class UnrecognizedFormatError : public SeqcovException {
public:
    explicit UnrecognizedFormatError(std::string message)
        : SeqcovException(ErrorCode::kFormatError, std::move(message)) {}

    UnrecognizedFormatError(std::string message, ErrorContext context)
        : SeqcovException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for rows or documents that cannot be parsed (exit code 4).
class MalformedInputError : public SeqcovException {
public:
    explicit MalformedInputError(std::string message)
        : SeqcovException(ErrorCode::kMalformedInput, std::move(message)) {}

    MalformedInputError(std::string message, ErrorContext context)
        : SeqcovException(ErrorCode::kMalformedInput, std::move(message), std::move(context)) {}
};

/// @brief Exception for a repeated sample id or barcode (exit code 5).
class DuplicateSampleError : public SeqcovException {
public:
    DuplicateSampleError(std::string sampleKey, ErrorContext context)
        : SeqcovException(ErrorCode::kDuplicateSample,
                          "duplicate sample in registry: " + sampleKey,
                          std::move(context.withSample(sampleKey))),
          sampleKey_(std::move(sampleKey)) {}

    /// @brief The repeated id or barcode.
    [[nodiscard]] const std::string& sampleKey() const noexcept { return sampleKey_; }

private:
    std::string sampleKey_;
};

/// @brief Exception for a non-numeric or non-positive genome size (exit code 6).
class InvalidGenomeSizeError : public SeqcovException {
public:
    explicit InvalidGenomeSizeError(std::string message)
        : SeqcovException(ErrorCode::kInvalidGenomeSize, std::move(message)) {}

    InvalidGenomeSizeError(std::string message, ErrorContext context)
        : SeqcovException(ErrorCode::kInvalidGenomeSize, std::move(message), std::move(context)) {}
};

/// @brief Exception for registry/report run identifier mismatch (exit code 7).
class RunMismatchError : public SeqcovException {
public:
    RunMismatchError(std::string registryRunId, std::string reportRunId)
        : SeqcovException(ErrorCode::kRunMismatch,
                          formatMismatch(registryRunId, reportRunId)) {}

private:
    static std::string formatMismatch(const std::string& registryRunId,
                                      const std::string& reportRunId);
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a SeqcovException.
    explicit Error(const SeqcovException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const SeqcovException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Return the value of a Result or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if a VoidResult holds an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace seqcov

#endif  // SEQCOV_COMMON_ERROR_H
