// =============================================================================
// lrf - Recompress Command
// =============================================================================
// Command handler for rewriting region files at a new compression level or
// format version.
//
// This module provides:
// - RecompressCommand: reads every input, re-encodes it into the output
//   directory under the same file name
// - Parallel batch processing with oneTBB
// - Lenient salvage of damaged inputs
//
// Each file is written through the atomic writer, so an interrupted batch
// never leaves partial outputs behind.
// =============================================================================

#ifndef LRF_COMMANDS_RECOMPRESS_COMMAND_H
#define LRF_COMMANDS_RECOMPRESS_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "lrf/common/error.h"
#include "lrf/common/types.h"
#include "lrf/format/region_format.h"

namespace lrf::commands {

// =============================================================================
// Recompress Options
// =============================================================================

/// @brief Configuration options for recompress command.
struct RecompressOptions {
    std::vector<std::filesystem::path> inputPaths;

    /// @brief Directory receiving the rewritten files.
    std::filesystem::path outputDir;

    int compressionLevel = kDefaultCompressionLevel;

    format::FormatVersion version = format::kCurrentVersion;

    /// @brief Salvage damaged inputs instead of skipping them.
    bool lenient = false;

    /// @brief Overwrite existing outputs.
    bool forceOverwrite = false;

    /// @brief Worker threads (0 = auto-detect).
    int threads = 0;

    bool syncToDisk = true;

    /// @brief Print failures only.
    bool quiet = false;
};

/// @brief Outcome for one input file.
struct RecompressOutcome {
    std::filesystem::path inputPath;
    std::filesystem::path outputPath;
    bool succeeded = false;
    ErrorCode code = ErrorCode::kSuccess;
    std::string errorMessage;
    std::uint64_t inputBytes = 0;
    std::uint64_t outputBytes = 0;
    std::size_t chunkCount = 0;
    std::size_t droppedSlots = 0;
};

// =============================================================================
// RecompressCommand Class
// =============================================================================

/// @brief Command handler for batch recompression.
class RecompressCommand {
public:
    explicit RecompressCommand(RecompressOptions options);

    ~RecompressCommand();

    RecompressCommand(const RecompressCommand&) = delete;
    RecompressCommand& operator=(const RecompressCommand&) = delete;
    RecompressCommand(RecompressCommand&&) noexcept;
    RecompressCommand& operator=(RecompressCommand&&) noexcept;

    /// @brief Execute the recompress command.
    /// @return Exit code (0 = every file rewritten).
    [[nodiscard]] int execute();

    /// @brief Per-file outcomes in input order.
    [[nodiscard]] const std::vector<RecompressOutcome>& outcomes() const noexcept {
        return outcomes_;
    }

    [[nodiscard]] const RecompressOptions& options() const noexcept { return options_; }

private:
    void validateOptions() const;

    [[nodiscard]] RecompressOutcome processFile(const std::filesystem::path& inputPath) const;

    void printSummary() const;

    RecompressOptions options_;
    std::vector<RecompressOutcome> outcomes_;
};

}  // namespace lrf::commands

#endif  // LRF_COMMANDS_RECOMPRESS_COMMAND_H
