// =============================================================================
// seqcov - Sample Registry Implementation
// =============================================================================

#include "seqcov/registry/sample_registry.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <set>

#include <fmt/format.h>

#include "seqcov/common/logger.h"
#include "seqcov/io/compressed_stream.h"
#include "seqcov/io/delimited.h"

namespace seqcov::registry {

namespace {

// =============================================================================
// Column Names
// =============================================================================

constexpr std::array<std::string_view, 4> kIdColumns = {"sample_id", "id", "sample", "alias"};
constexpr std::array<std::string_view, 3> kGenomeBpColumns = {"genome_size_bp", "genome_size",
                                                              "genome_bp"};
constexpr std::array<std::string_view, 2> kGenomeMbColumns = {"genome_size_mb",
                                                              "cntn_cf_genomesizemb"};
constexpr std::array<std::string_view, 2> kBarcodeColumns = {"barcode", "lane"};
constexpr std::array<std::string_view, 1> kAliasColumns = {"alias"};
constexpr std::array<std::string_view, 1> kExperimentColumns = {"experiment_id"};

// Largest Mb-derived size that still fits the signed rounding result
constexpr double kMaxGenomeBases = 9.2e18;

/// @brief Resolved column positions for one sample sheet.
struct ColumnLayout {
    std::vector<std::size_t> idColumns;
    std::size_t genomeColumn = 1;
    bool genomeInMegabases = false;
    std::optional<std::size_t> barcodeColumn;
    std::optional<std::size_t> aliasColumn;
    std::optional<std::size_t> experimentColumn;

    /// @brief Smallest field count a data row must have.
    [[nodiscard]] std::size_t requiredFields() const {
        std::size_t required = genomeColumn + 1;
        for (std::size_t col : idColumns) {
            required = std::max(required, col + 1);
        }
        return required;
    }
};

/// @brief Layout of a headerless sheet: id, genome_size_bp[, barcode].
ColumnLayout positionalLayout() {
    ColumnLayout layout;
    layout.idColumns = {0};
    layout.genomeColumn = 1;
    layout.barcodeColumn = 2;
    return layout;
}

bool isHeader(std::span<const std::string_view> fields) {
    for (std::string_view field : fields) {
        auto name = io::toLower(field);
        auto matches = [&name](const auto& names) {
            return std::find(names.begin(), names.end(), name) != names.end();
        };
        if (matches(kIdColumns) || matches(kGenomeBpColumns) || matches(kGenomeMbColumns)) {
            return true;
        }
    }
    return false;
}

ColumnLayout headerLayout(std::span<const std::string_view> header, const std::string& source) {
    ColumnLayout layout;

    for (std::string_view name : kIdColumns) {
        std::array<std::string_view, 1> single = {name};
        if (auto col = io::findColumn(header, single)) {
            layout.idColumns.push_back(*col);
        }
    }
    if (layout.idColumns.empty()) {
        throw MalformedInputError("sample sheet header has no sample id column",
                                  ErrorContext(source).withLine(1));
    }

    if (auto col = io::findColumn(header, kGenomeBpColumns)) {
        layout.genomeColumn = *col;
    } else if (auto mbCol = io::findColumn(header, kGenomeMbColumns)) {
        layout.genomeColumn = *mbCol;
        layout.genomeInMegabases = true;
    } else {
        throw MalformedInputError("sample sheet header has no genome size column",
                                  ErrorContext(source).withLine(1));
    }

    layout.barcodeColumn = io::findColumn(header, kBarcodeColumns);
    layout.aliasColumn = io::findColumn(header, kAliasColumns);
    layout.experimentColumn = io::findColumn(header, kExperimentColumns);
    return layout;
}

std::optional<std::string> optionalField(std::span<const std::string_view> fields,
                                         std::optional<std::size_t> column) {
    if (!column.has_value() || *column >= fields.size()) {
        return std::nullopt;
    }
    if (fields[*column].empty()) {
        return std::nullopt;
    }
    return std::string(fields[*column]);
}

SampleRecord parseRow(std::span<const std::string_view> fields, const ColumnLayout& layout,
                      const std::string& source, std::uint64_t lineNumber) {
    if (fields.size() < layout.requiredFields()) {
        throw MalformedInputError(
            fmt::format("expected at least {} columns, found {}", layout.requiredFields(),
                        fields.size()),
            ErrorContext(source).withLine(lineNumber));
    }

    SampleRecord record;
    for (std::size_t col : layout.idColumns) {
        if (!fields[col].empty()) {
            record.id = std::string(fields[col]);
            break;
        }
    }
    if (record.id.empty()) {
        throw MalformedInputError("empty sample id", ErrorContext(source).withLine(lineNumber));
    }

    auto genomeSize = parseGenomeSize(fields[layout.genomeColumn], layout.genomeInMegabases);
    if (!genomeSize) {
        throw InvalidGenomeSizeError(
            genomeSize.error().message(),
            ErrorContext(source).withLine(lineNumber).withSample(record.id));
    }
    record.genomeSizeBp = *genomeSize;

    record.barcode = optionalField(fields, layout.barcodeColumn);
    record.alias = optionalField(fields, layout.aliasColumn);
    record.experimentId = optionalField(fields, layout.experimentColumn);
    return record;
}

}  // namespace

// =============================================================================
// Utility Functions
// =============================================================================

Result<BaseCount> parseGenomeSize(std::string_view field, bool megabases) {
    if (field.empty()) {
        return makeError<BaseCount>(ErrorCode::kInvalidGenomeSize, "missing genome size");
    }

    if (!megabases) {
        auto bp = io::parseUnsigned(field);
        if (!bp.has_value()) {
            std::string_view reason = io::parseDecimal(field).has_value()
                                          ? "genome size in bp must be a whole number"
                                          : "genome size is not numeric";
            return makeError<BaseCount>(ErrorCode::kInvalidGenomeSize,
                                        fmt::format("{}: '{}'", reason, field));
        }
        if (*bp == 0) {
            return makeError<BaseCount>(ErrorCode::kInvalidGenomeSize,
                                        "genome size must be positive: 0");
        }
        return *bp;
    }

    auto value = io::parseDecimal(field);
    if (!value.has_value()) {
        return makeError<BaseCount>(ErrorCode::kInvalidGenomeSize,
                                    fmt::format("genome size is not numeric: '{}'", field));
    }

    double bases = *value * kBasesPerMegabase;
    if (bases < 0.5) {
        return makeError<BaseCount>(ErrorCode::kInvalidGenomeSize,
                                    fmt::format("genome size must be positive: {}", field));
    }
    if (bases >= kMaxGenomeBases) {
        return makeError<BaseCount>(ErrorCode::kInvalidGenomeSize,
                                    fmt::format("genome size out of range: {} Mb", field));
    }
    return static_cast<BaseCount>(std::llround(bases));
}

// =============================================================================
// SampleRegistry Implementation
// =============================================================================

SampleRegistry::SampleRegistry(std::vector<SampleRecord> samples) : samples_(std::move(samples)) {
    for (std::size_t i = 0; i < samples_.size(); ++i) {
        const auto& sample = samples_[i];
        if (sample.genomeSizeBp == 0) {
            throw InvalidGenomeSizeError("genome size must be positive",
                                         ErrorContext().withSample(sample.id));
        }
        if (!byId_.emplace(sample.id, i).second) {
            throw DuplicateSampleError(sample.id, ErrorContext());
        }
        if (sample.barcode.has_value() && !byBarcode_.emplace(*sample.barcode, i).second) {
            throw DuplicateSampleError(*sample.barcode, ErrorContext());
        }
    }

    // An input key must select at most one sample
    for (const auto& [barcode, index] : byBarcode_) {
        auto it = byId_.find(barcode);
        if (it != byId_.end() && it->second != index) {
            throw DuplicateSampleError(
                barcode, ErrorContext().withSample(samples_[it->second].id));
        }
    }
}

SampleRegistry SampleRegistry::load(const std::filesystem::path& path) {
    auto stream = io::openInputFile(path);
    SampleRegistry registry = parse(*stream, path.string());
    SEQCOV_LOG_INFO("Loaded {} samples from {}", registry.size(), path.string());
    return registry;
}

SampleRegistry SampleRegistry::parse(std::istream& input, const std::string& sourceName) {
    std::vector<SampleRecord> samples;
    std::optional<ColumnLayout> layout;
    std::optional<char> delimiter;
    std::set<std::string> ids;
    std::set<std::string> barcodes;

    std::string line;
    std::uint64_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        io::stripCarriageReturn(line);
        if (lineNumber == 1) {
            io::stripByteOrderMark(line);
        }
        if (io::trimField(line).empty() || line.front() == '#') {
            continue;
        }

        if (!delimiter.has_value()) {
            delimiter = io::detectDelimiter(line);
        }
        auto values = io::splitQuotedFields(line, *delimiter);
        if (!values.has_value()) {
            throw MalformedInputError("unterminated quoted field",
                                      ErrorContext(sourceName).withLine(lineNumber));
        }
        std::vector<std::string_view> fields(values->begin(), values->end());

        if (!layout.has_value()) {
            if (isHeader(fields)) {
                layout = headerLayout(fields, sourceName);
                continue;
            }
            layout = positionalLayout();
        }

        SampleRecord record = parseRow(fields, *layout, sourceName, lineNumber);

        // Report duplicates with the offending line before building the index.
        // Ids and barcodes share one key space; a row may reuse its own id.
        auto context = ErrorContext(sourceName).withLine(lineNumber);
        if (!ids.insert(record.id).second || barcodes.contains(record.id)) {
            throw DuplicateSampleError(record.id, context);
        }
        if (record.barcode.has_value()) {
            const bool clashesWithId = *record.barcode != record.id && ids.contains(*record.barcode);
            if (clashesWithId || !barcodes.insert(*record.barcode).second) {
                throw DuplicateSampleError(*record.barcode, context);
            }
        }
        samples.push_back(std::move(record));
    }

    if (input.bad()) {
        throw IOError("failed while reading sample sheet", ErrorContext(sourceName));
    }
    if (samples.empty()) {
        throw MalformedInputError("sample sheet contains no samples", ErrorContext(sourceName));
    }

    SampleRegistry registry(std::move(samples));

    std::optional<std::string> firstExperiment;
    for (const auto& sample : registry) {
        if (!sample.experimentId.has_value()) {
            continue;
        }
        if (!firstExperiment.has_value()) {
            firstExperiment = sample.experimentId;
        } else if (*firstExperiment != *sample.experimentId) {
            SEQCOV_LOG_WARNING("Multiple experiment ids in sample sheet: {}, {}", *firstExperiment,
                               *sample.experimentId);
        }
    }

    return registry;
}

const SampleRecord* SampleRegistry::find(std::string_view id) const {
    auto it = byId_.find(std::string(id));
    return it == byId_.end() ? nullptr : &samples_[it->second];
}

const SampleRecord* SampleRegistry::resolve(std::string_view key) const {
    if (auto it = byBarcode_.find(std::string(key)); it != byBarcode_.end()) {
        return &samples_[it->second];
    }
    return find(key);
}

std::optional<std::string> SampleRegistry::experimentId() const {
    for (const auto& sample : samples_) {
        if (sample.experimentId.has_value()) {
            return sample.experimentId;
        }
    }
    return std::nullopt;
}

}  // namespace seqcov::registry
