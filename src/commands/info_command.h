// =============================================================================
// lrf - Info Command
// =============================================================================
// Command handler for displaying region file information.
//
// This module provides:
// - InfoCommand: header fields, sizes, compression ratio, checksum status
// - JSON output format
// - Occupancy grid of the 32x32 slots
// =============================================================================

#ifndef LRF_COMMANDS_INFO_COMMAND_H
#define LRF_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

#include "lrf/common/error.h"
#include "lrf/format/region_reader.h"

namespace lrf::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input region file path.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Print the occupancy grid.
    bool showMap = false;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying region file information.
/// @note Reads leniently so damaged files can still be inspected.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    ~InfoCommand();

    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    void printTextInfo(const format::ReadResult& result) const;

    void printJsonInfo(const format::ReadResult& result) const;

    InfoOptions options_;
};

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath,
                                                             bool jsonOutput,
                                                             bool showMap);

}  // namespace lrf::commands

#endif  // LRF_COMMANDS_INFO_COMMAND_H
