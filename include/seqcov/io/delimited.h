// =============================================================================
// seqcov - Delimited Text Utilities
// =============================================================================
// Field splitting and strict numeric parsing shared by the sample registry
// and the sequencing summary reader.
// =============================================================================

#ifndef SEQCOV_IO_DELIMITED_H
#define SEQCOV_IO_DELIMITED_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seqcov::io {

/// @brief Pick the field delimiter for a header or first data line.
/// @return '\t' if the line contains a tab, otherwise ','.
[[nodiscard]] char detectDelimiter(std::string_view line) noexcept;

/// @brief Split a line into fields without copying.
/// @note Empty fields are preserved ("a,,b" yields three fields).
/// @note The returned views point into @p line.
[[nodiscard]] std::vector<std::string_view> splitFields(std::string_view line, char delimiter);

/// @brief Split a CSV-style line honouring double-quoted fields.
///
/// A field starting with '"' runs to the matching closing quote, may contain
/// the delimiter, and uses "" for a literal quote. Whitespace around each
/// field is trimmed (inside quotes it is kept).
/// @return Unquoted fields, or nullopt if a quoted field is not terminated.
[[nodiscard]] std::optional<std::vector<std::string>> splitQuotedFields(std::string_view line,
                                                                        char delimiter);

/// @brief Remove leading/trailing whitespace and surrounding double quotes.
[[nodiscard]] std::string_view trimField(std::string_view field) noexcept;

/// @brief Remove a trailing '\r' left by CRLF line endings.
void stripCarriageReturn(std::string& line) noexcept;

/// @brief UTF-8 byte-order mark some spreadsheet exports put before the header.
inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Drop a leading UTF-8 byte-order mark.
void stripByteOrderMark(std::string& line) noexcept;

/// @brief Parse a non-negative decimal integer occupying the whole field.
/// @return The value, or nullopt for empty, signed, fractional or overflowing input.
[[nodiscard]] std::optional<std::uint64_t> parseUnsigned(std::string_view field) noexcept;

/// @brief Parse a finite decimal number occupying the whole field.
[[nodiscard]] std::optional<double> parseDecimal(std::string_view field) noexcept;

/// @brief ASCII lowercase copy.
[[nodiscard]] std::string toLower(std::string_view text);

/// @brief Index of the first header column whose lowercase name is in @p names.
/// @param header Header fields (already trimmed).
/// @param names Candidate names, lowercase, in priority order.
[[nodiscard]] std::optional<std::size_t> findColumn(std::span<const std::string_view> header,
                                                    std::span<const std::string_view> names);

}  // namespace seqcov::io

#endif  // SEQCOV_IO_DELIMITED_H
