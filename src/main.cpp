// =============================================================================
// seqcov - Sequencing Coverage Calculator
// =============================================================================
// Main entry point for the seqcov command-line tool.
//
// This file implements the CLI using CLI11, providing:
// - Positional sample sheet plus exactly one of --summary / --json
// - Aggregation options: threshold, QC policy
// - Output format and logging options
// - --config for reading any option from a TOML/INI file
//
// Process exit codes are the ErrorCode values of the failure.
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "seqcov/common/error.h"
#include "seqcov/common/logger.h"
#include "seqcov/common/types.h"

#include "commands/coverage_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "seqcov: per-sample sequencing yield and genome coverage\n"
    "Joins a sample sheet with a per-read sequencing summary (plain or gzip)\n"
    "or an aggregate JSON yield report and prints coverage per sample.";

// =============================================================================
// CLI Options
// =============================================================================

struct CliOptions {
    std::string registry;
    std::string summary;
    std::string json;
    seqcov::ReadLength threshold = seqcov::kDefaultThreshold;
    bool passOnly = false;
    std::string format = "table";
    bool allowRunMismatch = false;
    int verbosity = 0;  // 0 = info, 1 = debug, 2+ = trace
    bool quiet = false;
    std::string logFile;
};

void setupOptions(CLI::App& app, CliOptions& opts) {
    app.add_option("registry", opts.registry, "Sample sheet (CSV/TSV)")->required();

    auto* summary = app.add_option("-s,--summary", opts.summary,
                                   "Per-read sequencing summary (plain or .gz)");

    auto* json = app.add_option("-j,--json", opts.json, "Aggregate JSON yield report");
    summary->excludes(json);

    app.add_option("-t,--threshold", opts.threshold,
                   "Read-length cutoff in bp for the qualifying-reads column")
        ->default_val(seqcov::kDefaultThreshold)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("--pass-only", opts.passOnly, "Exclude QC-failed reads from all totals");

    app.add_option("-f,--format", opts.format, "Output format: table, csv")
        ->default_val("table")
        ->check(CLI::IsMember({"table", "csv"}));

    app.add_flag("--allow-run-mismatch", opts.allowRunMismatch,
                 "Warn instead of failing when sample sheet and report runs differ");

    app.add_flag("-v,--verbose", opts.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", opts.quiet, "Only log errors");

    app.add_option("--log-file", opts.logFile, "Also write the log to this file");

    app.set_config("--config", "", "Read options from a TOML/INI file");
}

[[nodiscard]] seqcov::log::Level logLevel(const CliOptions& opts) noexcept {
    if (opts.quiet) {
        return seqcov::log::Level::kError;
    }
    if (opts.verbosity >= 2) {
        return seqcov::log::Level::kTrace;
    }
    if (opts.verbosity == 1) {
        return seqcov::log::Level::kDebug;
    }
    return seqcov::log::Level::kInfo;
}

[[nodiscard]] seqcov::commands::CoverageOptions toCommandOptions(const CliOptions& opts) {
    seqcov::commands::CoverageOptions options;
    options.registryPath = opts.registry;
    if (!opts.summary.empty()) {
        options.summaryPath = opts.summary;
    }
    if (!opts.json.empty()) {
        options.jsonPath = opts.json;
    }
    options.threshold = opts.threshold;
    options.qcPolicy = opts.passOnly ? seqcov::QcPolicy::kPassOnly : seqcov::QcPolicy::kIncludeAll;
    options.format = seqcov::outputFormatFromString(opts.format).value_or(seqcov::OutputFormat::kTable);
    options.allowRunMismatch = opts.allowRunMismatch;
    return options;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription, "seqcov"};
    app.set_version_flag("-V,--version", kVersion);

    CliOptions opts;
    setupOptions(app, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version exit 0; everything else is a usage error
        const int cliExit = app.exit(e);
        return cliExit == 0 ? EXIT_SUCCESS : seqcov::toExitCode(seqcov::ErrorCode::kUsageError);
    }

    seqcov::commands::CoverageCommand command(toCommandOptions(opts));

    // Argument errors are reported before any file (the log file included) is opened
    try {
        command.validate();
    } catch (const seqcov::UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return e.exitCode();
    }

    try {
        seqcov::log::Config logConfig;
        logConfig.logFile = opts.logFile;
        logConfig.level = logLevel(opts);
        seqcov::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return seqcov::toExitCode(seqcov::ErrorCode::kIOError);
    }

    const int exitCode = command.execute();

    seqcov::log::shutdown();
    return exitCode;
}
