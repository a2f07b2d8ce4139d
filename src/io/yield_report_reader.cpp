// =============================================================================
// seqcov - Yield Report Reader Implementation
// =============================================================================

#include "seqcov/io/yield_report_reader.h"

#include <cstdint>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "seqcov/common/logger.h"
#include "seqcov/io/compressed_stream.h"
#include "seqcov/io/delimited.h"

namespace seqcov::io {

namespace {

using nlohmann::json;

constexpr std::string_view kSplitByBarcode = "SplitByBarcode";

/// @brief Walks one report document, accumulating per-barcode totals.
class ReportWalker {
public:
    explicit ReportWalker(const std::string& sourceName) : sourceName_(sourceName) {}

    YieldReport walk(const json& doc) {
        if (!doc.is_object()) {
            fail("report root is not an object");
        }

        report_.runId = runId(doc);

        if (auto it = doc.find("acquisitions"); it != doc.end()) {
            for (const auto& acquisition : arrayAt(*it, "acquisitions")) {
                walkAcquisition(acquisition);
            }
        }
        if (report_.barcodeOutputs == 0) {
            fail("report has no SplitByBarcode acquisition output");
        }

        return std::move(report_);
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw MalformedInputError(message, ErrorContext(sourceName_));
    }

    const json& arrayAt(const json& value, std::string_view what) const {
        if (!value.is_array()) {
            fail(fmt::format("'{}' is not an array", what));
        }
        return value;
    }

    const json& objectAt(const json& value, std::string_view what) const {
        if (!value.is_object()) {
            fail(fmt::format("'{}' is not an object", what));
        }
        return value;
    }

    static std::optional<std::string> runId(const json& doc) {
        auto runInfo = doc.find("protocol_run_info");
        if (runInfo == doc.end() || !runInfo->is_object()) {
            return std::nullopt;
        }
        auto userInfo = runInfo->find("user_info");
        if (userInfo == runInfo->end() || !userInfo->is_object()) {
            return std::nullopt;
        }
        auto groupId = userInfo->find("protocol_group_id");
        if (groupId == userInfo->end() || !groupId->is_string()) {
            return std::nullopt;
        }
        return groupId->get<std::string>();
    }

    void walkAcquisition(const json& acquisition) {
        objectAt(acquisition, "acquisitions[]");
        auto outputs = acquisition.find("acquisition_output");
        if (outputs == acquisition.end()) {
            return;
        }
        for (const auto& output : arrayAt(*outputs, "acquisition_output")) {
            objectAt(output, "acquisition_output[]");
            auto type = output.find("type");
            if (type == output.end() || !type->is_string() ||
                type->get_ref<const std::string&>() != kSplitByBarcode) {
                continue;
            }
            ++report_.barcodeOutputs;
            walkBarcodeOutput(output);
        }
    }

    void walkBarcodeOutput(const json& output) {
        auto plot = output.find("plot");
        if (plot == output.end()) {
            return;
        }
        const json& plots = arrayAt(*plot, "plot");
        if (plots.empty()) {
            return;
        }
        const json& firstPlot = objectAt(plots.front(), "plot[0]");
        auto entries = firstPlot.find("snapshots");
        if (entries == firstPlot.end()) {
            return;
        }

        for (const auto& entry : arrayAt(*entries, "plot[0].snapshots")) {
            walkBarcodeEntry(objectAt(entry, "plot[0].snapshots[]"));
        }
    }

    void walkBarcodeEntry(const json& entry) {
        auto barcode = barcodeName(entry);
        if (!barcode.has_value()) {
            return;
        }

        auto snapshots = entry.find("snapshots");
        if (snapshots == entry.end()) {
            return;
        }
        const json& series = arrayAt(*snapshots, "snapshots");
        if (series.empty()) {
            return;
        }

        // Snapshots are cumulative; the last one holds the barcode's total
        const json& last = objectAt(series.back(), "snapshots[]");
        auto summary = last.find("yield_summary");
        if (summary == last.end()) {
            return;
        }
        const json& yields = objectAt(*summary, "yield_summary");

        auto& sample = sampleFor(*barcode);
        sample.totalBases += countField(yields, "basecalled_pass_bases", *barcode);
        sample.readCount += countField(yields, "basecalled_pass_read_count", *barcode);
    }

    std::optional<std::string> barcodeName(const json& entry) const {
        auto filtering = entry.find("filtering");
        if (filtering == entry.end()) {
            return std::nullopt;
        }
        for (const auto& filter : arrayAt(*filtering, "filtering")) {
            if (!filter.is_object()) {
                continue;
            }
            auto name = filter.find("barcode_name");
            if (name != filter.end() && name->is_string()) {
                return name->get<std::string>();
            }
        }
        return std::nullopt;
    }

    std::uint64_t countField(const json& yields, const char* field,
                             const std::string& barcode) const {
        auto it = yields.find(field);
        if (it == yields.end() || it->is_null()) {
            return 0;
        }
        if (it->is_number_unsigned()) {
            return it->get<std::uint64_t>();
        }
        if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
            return static_cast<std::uint64_t>(it->get<std::int64_t>());
        }
        if (it->is_string()) {
            if (auto value = parseUnsigned(it->get_ref<const std::string&>())) {
                return *value;
            }
        }
        throw MalformedInputError(fmt::format("'{}' is not a non-negative integer", field),
                                  ErrorContext(sourceName_).withSample(barcode));
    }

    SampleYield& sampleFor(const std::string& barcode) {
        auto [it, inserted] = index_.try_emplace(barcode, report_.samples.size());
        if (inserted) {
            report_.samples.push_back(SampleYield{.key = barcode});
        }
        return report_.samples[it->second];
    }

    const std::string& sourceName_;
    YieldReport report_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace

// =============================================================================
// Public Interface
// =============================================================================

YieldReport readYieldReport(const std::filesystem::path& path) {
    auto stream = openInputFile(path);
    YieldReport report = parseYieldReport(*stream, path.string());
    SEQCOV_LOG_INFO("Read yield report {}: {} barcodes from {} barcode outputs", path.string(),
                    report.samples.size(), report.barcodeOutputs);
    return report;
}

YieldReport parseYieldReport(std::istream& input, const std::string& sourceName) {
    json doc = json::parse(input, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        throw MalformedInputError("report is not valid JSON", ErrorContext(sourceName));
    }

    ReportWalker walker(sourceName);
    return walker.walk(doc);
}

}  // namespace seqcov::io
