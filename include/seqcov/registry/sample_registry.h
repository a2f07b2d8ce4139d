// =============================================================================
// seqcov - Sample Registry
// =============================================================================
// Loads the sample sheet that maps each sample to its expected genome size.
//
// Accepted layouts (comma or tab separated, detected from the first line):
// - With a header row. Columns are located by name, case-insensitively:
//     id            sample_id | id | sample | alias (first non-empty wins)
//     genome (bp)   genome_size_bp | genome_size | genome_bp
//     genome (Mb)   genome_size_mb | cntn_cf_genomesizemb
//     barcode       barcode | lane
//     alias         alias
//     experiment    experiment_id
// - Without a header: id, genome_size_bp[, barcode]
//
// Blank lines and lines starting with '#' are skipped. Loading is atomic:
// any bad row throws and no registry is produced.
// =============================================================================

#ifndef SEQCOV_REGISTRY_SAMPLE_REGISTRY_H
#define SEQCOV_REGISTRY_SAMPLE_REGISTRY_H

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "seqcov/common/error.h"
#include "seqcov/common/types.h"

namespace seqcov::registry {

// =============================================================================
// Sample Record
// =============================================================================

/// @brief One sample of the registry.
struct SampleRecord {
    /// @brief Unique sample identifier.
    std::string id;

    /// @brief Expected genome size in base pairs (always > 0).
    BaseCount genomeSizeBp = 0;

    /// @brief Barcode or lane name the reads of this sample are tagged with.
    std::optional<std::string> barcode;

    /// @brief Free-form sample alias from the sample sheet.
    std::optional<std::string> alias;

    /// @brief Experiment (run) identifier from the sample sheet.
    std::optional<std::string> experimentId;

    /// @brief Key the input data uses for this sample.
    [[nodiscard]] std::string_view joinKey() const noexcept {
        return barcode.has_value() ? std::string_view(*barcode) : std::string_view(id);
    }

    friend bool operator==(const SampleRecord&, const SampleRecord&) = default;
};

// =============================================================================
// SampleRegistry Class
// =============================================================================

/// @brief Immutable, ordered collection of samples.
///
/// Iteration order is the order of rows in the sample sheet.
class SampleRegistry {
public:
    using const_iterator = std::vector<SampleRecord>::const_iterator;

    /// @brief Build a registry from already parsed records.
    /// @throws InvalidGenomeSizeError if a genome size is zero.
    /// @throws DuplicateSampleError if an id or barcode repeats.
    explicit SampleRegistry(std::vector<SampleRecord> samples);

    /// @brief Load a sample sheet from disk.
    /// @throws IOError if the file cannot be read.
    /// @throws MalformedInputError, DuplicateSampleError, InvalidGenomeSizeError.
    [[nodiscard]] static SampleRegistry load(const std::filesystem::path& path);

    /// @brief Parse a sample sheet from a stream.
    /// @param input Sample sheet text.
    /// @param sourceName Name used in error messages.
    [[nodiscard]] static SampleRegistry parse(std::istream& input,
                                              const std::string& sourceName = "<stream>");

    [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
    [[nodiscard]] const std::vector<SampleRecord>& samples() const noexcept { return samples_; }
    [[nodiscard]] const_iterator begin() const noexcept { return samples_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return samples_.end(); }

    /// @brief Find a sample by id.
    [[nodiscard]] const SampleRecord* find(std::string_view id) const;

    /// @brief Match an input key (barcode first, then id) to a sample.
    /// @return The sample, or nullptr if the key is unknown.
    [[nodiscard]] const SampleRecord* resolve(std::string_view key) const;

    /// @brief Experiment id of the first sample that has one.
    [[nodiscard]] std::optional<std::string> experimentId() const;

private:
    std::vector<SampleRecord> samples_;
    std::unordered_map<std::string, std::size_t> byId_;
    std::unordered_map<std::string, std::size_t> byBarcode_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Parse a genome size field.
/// @param field Raw field text.
/// @param megabases Whether the column holds Mb instead of bp.
/// @return Size in bp, or an InvalidGenomeSize error for non-numeric or
///         non-positive values.
[[nodiscard]] Result<BaseCount> parseGenomeSize(std::string_view field, bool megabases);

}  // namespace seqcov::registry

#endif  // SEQCOV_REGISTRY_SAMPLE_REGISTRY_H
