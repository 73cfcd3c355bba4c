// =============================================================================
// lrf - Linear Region File Tool
// =============================================================================
// Main entry point for the lrf command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: info, verify, recompress
// - Global options: threads, verbosity, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "lrf/common/error.h"
#include "lrf/common/logger.h"
#include "lrf/common/types.h"
#include "lrf/format/region_format.h"

#include "commands/info_command.h"
#include "commands/recompress_command.h"
#include "commands/verify_command.h"

namespace lrf::commands {
int runInfo(CLI::App* app);
int runVerify(CLI::App* app);
int runRecompress(CLI::App* app);
}  // namespace lrf::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "lrf: inspect, verify and recompress Linear region files\n"
    "A region file stores a 32x32 grid of chunks as one zstd-compressed blob.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;     // 0 = auto-detect
    int verbosity = 0;   // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliInfoOptions {
    std::string input;
    bool json = false;
    bool map = false;
};

CliInfoOptions gInfoOpts;

struct CliVerifyOptions {
    std::vector<std::string> inputs;
    bool lenient = false;
    bool failFast = false;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

struct CliRecompressOptions {
    std::vector<std::string> inputs;
    std::string outputDir;
    int level = lrf::kDefaultCompressionLevel;
    int formatVersion = lrf::format::toRaw(lrf::format::kCurrentVersion);
    bool lenient = false;
    bool force = false;
    bool noSync = false;
};

CliRecompressOptions gRecompressOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display region file information");
    info->alias("i");

    info->add_option("-i,--input", gInfoOpts.input, "Input region file")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");

    info->add_flag("--map", gInfoOpts.map, "Show the slot occupancy grid");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Verify region file integrity");
    verify->alias("v");

    verify->add_option("-i,--input", gVerifyOpts.inputs, "Input region file(s)")
        ->required()
        ->check(CLI::ExistingFile);

    verify->add_flag("--lenient", gVerifyOpts.lenient,
                     "Salvage damaged files and report dropped slots");

    verify->add_flag("--fail-fast", gVerifyOpts.failFast, "Stop on first failed file");

    verify->add_flag("--verbose", gVerifyOpts.verbose, "Show every check");
}

void setupRecompressCommand(CLI::App& app) {
    auto* recompress =
        app.add_subcommand("recompress", "Rewrite region files at a new level or version");
    recompress->alias("r");

    recompress->add_option("-i,--input", gRecompressOpts.inputs, "Input region file(s)")
        ->required()
        ->check(CLI::ExistingFile);

    recompress->add_option("-o,--output", gRecompressOpts.outputDir, "Output directory")
        ->required();

    recompress->add_option("-l,--level", gRecompressOpts.level, "Compression level (1-22)")
        ->default_val(lrf::kDefaultCompressionLevel)
        ->check(CLI::Range(lrf::kMinCompressionLevel, lrf::kMaxCompressionLevel));

    recompress->add_option("--format-version", gRecompressOpts.formatVersion,
                           "Format version to write (1-3)")
        ->default_val(lrf::format::toRaw(lrf::format::kCurrentVersion))
        ->check(CLI::Range(1, 3));

    recompress->add_flag("--lenient", gRecompressOpts.lenient,
                         "Salvage damaged inputs instead of skipping them");

    recompress->add_flag("-f,--force", gRecompressOpts.force, "Overwrite existing outputs");

    recompress->add_flag("--no-sync", gRecompressOpts.noSync,
                         "Skip fsync of written files (faster, less durable)");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupInfoCommand(app);
    setupVerifyCommand(app);
    setupRecompressCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        lrf::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.enableConsole = true;
        if (gOptions.quiet) {
            logConfig.level = lrf::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logConfig.level = lrf::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = lrf::log::Level::kDebug;
        } else {
            logConfig.level = lrf::log::Level::kWarning;
        }
        lrf::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("info")) {
            exitCode = lrf::commands::runInfo(app.get_subcommand("info"));
        } else if (app.got_subcommand("verify")) {
            exitCode = lrf::commands::runVerify(app.get_subcommand("verify"));
        } else if (app.got_subcommand("recompress")) {
            exitCode = lrf::commands::runRecompress(app.get_subcommand("recompress"));
        }
    } catch (const lrf::LRFException& ex) {
        LRF_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        LRF_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    lrf::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace lrf::commands {

int runInfo([[maybe_unused]] CLI::App* app) {
    auto cmd = createInfoCommand(gInfoOpts.input, gInfoOpts.json, gInfoOpts.map);
    return cmd->execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    auto cmd = createVerifyCommand(gVerifyOpts.inputs, gVerifyOpts.lenient,
                                   gVerifyOpts.failFast, gVerifyOpts.verbose, gOptions.quiet);
    return cmd->execute();
}

int runRecompress([[maybe_unused]] CLI::App* app) {
    RecompressOptions opts;
    opts.inputPaths.assign(gRecompressOpts.inputs.begin(), gRecompressOpts.inputs.end());
    opts.outputDir = gRecompressOpts.outputDir;
    opts.compressionLevel = gRecompressOpts.level;
    opts.lenient = gRecompressOpts.lenient;
    opts.forceOverwrite = gRecompressOpts.force;
    opts.threads = gOptions.threads;
    opts.syncToDisk = !gRecompressOpts.noSync;
    opts.quiet = gOptions.quiet;

    const auto version =
        format::toFormatVersion(static_cast<std::uint8_t>(gRecompressOpts.formatVersion));
    if (!version) {
        throw UsageError("Unsupported format version: " +
                         std::to_string(gRecompressOpts.formatVersion));
    }
    opts.version = *version;

    auto cmd = std::make_unique<RecompressCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace lrf::commands
