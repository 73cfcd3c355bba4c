// =============================================================================
// lrf - Recompress Command Implementation
// =============================================================================

#include "recompress_command.h"

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <set>
#include <utility>

#include "lrf/common/logger.h"
#include "lrf/format/region_reader.h"
#include "lrf/format/region_writer.h"

namespace lrf::commands {

RecompressCommand::RecompressCommand(RecompressOptions options) : options_(std::move(options)) {}

RecompressCommand::~RecompressCommand() = default;

RecompressCommand::RecompressCommand(RecompressCommand&&) noexcept = default;
RecompressCommand& RecompressCommand::operator=(RecompressCommand&&) noexcept = default;

int RecompressCommand::execute() {
    try {
        validateOptions();

        std::error_code ec;
        std::filesystem::create_directories(options_.outputDir, ec);
        if (ec) {
            throw IOError("Failed to create output directory", ec,
                          ErrorContext(options_.outputDir.string()));
        }

        const auto& inputs = options_.inputPaths;
        outcomes_.assign(inputs.size(), RecompressOutcome{});

        // Each task owns one slot of outcomes_, so no locking is needed.
        auto body = [&](const tbb::blocked_range<std::size_t>& range) {
            for (std::size_t i = range.begin(); i != range.end(); ++i) {
                outcomes_[i] = processFile(inputs[i]);
            }
        };

        if (options_.threads > 0) {
            tbb::task_arena arena(options_.threads);
            arena.execute([&] {
                tbb::parallel_for(tbb::blocked_range<std::size_t>(0, inputs.size()), body);
            });
        } else {
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, inputs.size()), body);
        }

        printSummary();

        for (const auto& outcome : outcomes_) {
            if (!outcome.succeeded) {
                return toExitCode(outcome.code);
            }
        }
        return 0;

    } catch (const LRFException& e) {
        LRF_LOG_ERROR("Recompression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        LRF_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void RecompressCommand::validateOptions() const {
    if (options_.inputPaths.empty()) {
        throw UsageError("No input files given");
    }
    if (options_.outputDir.empty()) {
        throw UsageError("No output directory given");
    }
    if (!isValidCompressionLevel(options_.compressionLevel)) {
        throw UsageError(fmt::format("Compression level {} outside [{}, {}]",
                                     options_.compressionLevel, kMinCompressionLevel,
                                     kMaxCompressionLevel));
    }
    if (options_.threads < 0) {
        throw UsageError("Thread count must be non-negative");
    }

    // Two inputs with the same file name would race for one output path.
    std::set<std::filesystem::path> names;
    for (const auto& input : options_.inputPaths) {
        if (!names.insert(input.filename()).second) {
            throw UsageError("Duplicate input file name: " + input.filename().string());
        }
    }
}

RecompressOutcome RecompressCommand::processFile(const std::filesystem::path& inputPath) const {
    RecompressOutcome outcome;
    outcome.inputPath = inputPath;
    outcome.outputPath = options_.outputDir / inputPath.filename();

    auto result = tryExecute([&] {
        std::error_code ec;
        if (!options_.forceOverwrite && std::filesystem::exists(outcome.outputPath, ec)) {
            throw IOError("Output file exists (use --force to overwrite): " +
                              outcome.outputPath.string(),
                          ErrorContext(outcome.outputPath.string()));
        }

        format::ReadOptions readOptions;
        readOptions.mode =
            options_.lenient ? format::ReadMode::kLenient : format::ReadMode::kStrict;
        auto read = format::RegionReader(readOptions).readFile(inputPath);

        format::WriteOptions writeOptions;
        writeOptions.compressionLevel = options_.compressionLevel;
        writeOptions.version = options_.version;
        writeOptions.syncToDisk = options_.syncToDisk;
        format::RegionWriter(writeOptions).writeFile(read.region, outcome.outputPath);

        outcome.inputBytes = read.report.fileSize;
        outcome.outputBytes = std::filesystem::file_size(outcome.outputPath);
        outcome.chunkCount = read.region.chunkCount();
        outcome.droppedSlots = read.report.dropped.size();
    });

    if (result) {
        outcome.succeeded = true;
        LRF_LOG_DEBUG("Recompressed {} -> {} ({} -> {} bytes)", inputPath.string(),
                      outcome.outputPath.string(), outcome.inputBytes, outcome.outputBytes);
    } else {
        outcome.code = result.error().code();
        outcome.errorMessage = result.error().message();
        LRF_LOG_ERROR("Failed to recompress {}: {}", inputPath.string(), outcome.errorMessage);
    }
    return outcome;
}

void RecompressCommand::printSummary() const {
    std::size_t succeeded = 0;
    std::uint64_t inputTotal = 0;
    std::uint64_t outputTotal = 0;
    for (const auto& outcome : outcomes_) {
        if (outcome.succeeded) {
            ++succeeded;
            inputTotal += outcome.inputBytes;
            outputTotal += outcome.outputBytes;
            if (outcome.droppedSlots > 0 && !options_.quiet) {
                fmt::print("[SALVAGED] {}: {} slots dropped\n", outcome.inputPath.string(),
                           outcome.droppedSlots);
            }
        } else {
            fmt::print("[FAIL] {}: {}\n", outcome.inputPath.string(), outcome.errorMessage);
        }
    }

    if (options_.quiet) {
        return;
    }
    fmt::print("Recompressed {} of {} files: {} -> {} bytes (level {}, version {})\n", succeeded,
               outcomes_.size(), inputTotal, outputTotal, options_.compressionLevel,
               format::toRaw(options_.version));
}

}  // namespace lrf::commands
