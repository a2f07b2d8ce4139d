// =============================================================================
// seqcov - Delimited Text Utilities Implementation
// =============================================================================

#include "seqcov/io/delimited.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>

namespace seqcov::io {

char detectDelimiter(std::string_view line) noexcept {
    return line.find('\t') != std::string_view::npos ? '\t' : ',';
}

std::vector<std::string_view> splitFields(std::string_view line, char delimiter) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::optional<std::vector<std::string>> splitQuotedFields(std::string_view line,
                                                        char delimiter) {
    auto isBlank = [delimiter](char c) {
        return c != delimiter && std::isspace(static_cast<unsigned char>(c)) != 0;
    };

    std::vector<std::string> fields;
    std::size_t pos = 0;
    while (true) {
        while (pos < line.size() && isBlank(line[pos])) {
            ++pos;
        }

        std::string field;
        if (pos < line.size() && line[pos] == '"') {
            ++pos;
            bool closed = false;
            while (pos < line.size()) {
                char c = line[pos++];
                if (c != '"') {
                    field += c;
                } else if (pos < line.size() && line[pos] == '"') {
                    field += '"';
                    ++pos;
                } else {
                    closed = true;
                    break;
                }
            }
            if (!closed) {
                return std::nullopt;
            }
            // Text between the closing quote and the delimiter is kept verbatim
            auto next = line.find(delimiter, pos);
            auto tail = trimField(line.substr(pos, next == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : next - pos));
            field += tail;
            pos = next;
        } else {
            auto next = line.find(delimiter, pos);
            field = std::string(trimField(line.substr(
                pos, next == std::string_view::npos ? std::string_view::npos : next - pos)));
            pos = next;
        }

        fields.push_back(std::move(field));
        if (pos == std::string_view::npos) {
            break;
        }
        ++pos;
    }
    return fields;
}

std::string_view trimField(std::string_view field) noexcept {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!field.empty() && isSpace(field.front())) {
        field.remove_prefix(1);
    }
    while (!field.empty() && isSpace(field.back())) {
        field.remove_suffix(1);
    }
    if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
        field = field.substr(1, field.size() - 2);
    }
    return field;
}

void stripCarriageReturn(std::string& line) noexcept {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

void stripByteOrderMark(std::string& line) noexcept {
    if (std::string_view(line).starts_with(kUtf8Bom)) {
        line.erase(0, kUtf8Bom.size());
    }
}

std::optional<std::uint64_t> parseUnsigned(std::string_view field) noexcept {
    if (field.empty() || field.front() == '+' || field.front() == '-') {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const char* end = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(field.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseDecimal(std::string_view field) noexcept {
    if (field.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* end = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(field.data(), end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<std::size_t> findColumn(std::span<const std::string_view> header,
                                      std::span<const std::string_view> names) {
    for (std::string_view name : names) {
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (toLower(header[i]) == name) {
                return i;
            }
        }
    }
    return std::nullopt;
}

}  // namespace seqcov::io
