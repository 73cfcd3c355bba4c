// =============================================================================
// lrf - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <fmt/format.h>

#include <string_view>
#include <utility>

#include "lrf/common/logger.h"
#include "lrf/format/region_format.h"

namespace lrf::commands {

namespace {

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

double compressionRatio(const format::ReadReport& report) {
    if (report.header.compressedSize == 0) {
        return 0.0;
    }
    return static_cast<double>(report.payloadSize) /
           static_cast<double>(report.header.compressedSize);
}

}  // namespace

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    try {
        if (!std::filesystem::exists(options_.inputPath)) {
            throw IOError("Input file not found: " + options_.inputPath.string(),
                          ErrorContext(options_.inputPath.string()));
        }

        format::ReadOptions readOptions;
        readOptions.mode = format::ReadMode::kLenient;
        const auto result = format::RegionReader(readOptions).readFile(options_.inputPath);

        if (options_.jsonOutput) {
            printJsonInfo(result);
        } else {
            printTextInfo(result);
        }
        return 0;

    } catch (const LRFException& e) {
        LRF_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        LRF_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void InfoCommand::printTextInfo(const format::ReadResult& result) const {
    const auto& report = result.report;
    const auto& header = report.header;
    const auto& region = result.region;

    fmt::print("=== Region File Information ===\n\n");
    fmt::print("File:             {}\n", options_.inputPath.string());
    if (const auto& coord = region.coord()) {
        fmt::print("Region:           ({}, {})\n", coord->x, coord->z);
    }
    fmt::print("Size:             {} bytes\n", report.fileSize);
    fmt::print("Version:          {} ({} index)\n", format::toRaw(header.version),
               format::layoutName(format::indexLayoutFor(header.version)));
    fmt::print("Compression:      zstd level {}\n", header.compressionLevel);
    fmt::print("Compressed blob:  {} bytes\n", header.compressedSize);
    fmt::print("Payload:          {} bytes (ratio {:.2f})\n", report.payloadSize,
               compressionRatio(report));
    fmt::print("Chunks:           {} of {}\n", region.chunkCount(), kSlotCount);
    fmt::print("Newest timestamp: {}\n", header.newestTimestamp);
    fmt::print("Checksum:         {:016x} ({})\n", header.checksum,
               format::checksumStatusToString(report.checksum));

    if (!report.dropped.empty()) {
        fmt::print("\n--- Dropped Slots ---\n");
        for (const auto& dropped : report.dropped) {
            fmt::print("({:2}, {:2})  {}: {}\n", dropped.x(), dropped.z(),
                       format::dropReasonToString(dropped.reason), dropped.detail);
        }
    }
    if (!report.warnings.empty()) {
        fmt::print("\n--- Warnings ---\n");
        for (const auto& warning : report.warnings) {
            fmt::print("{}\n", warning);
        }
    }

    if (options_.showMap) {
        fmt::print("\n--- Occupancy ---\n{}", region.occupancyMap());
    }
    fmt::print("\n===============================\n");
}

void InfoCommand::printJsonInfo(const format::ReadResult& result) const {
    const auto& report = result.report;
    const auto& header = report.header;
    const auto& region = result.region;

    fmt::print("{{\n");
    fmt::print("  \"file\": \"{}\",\n", jsonEscape(options_.inputPath.string()));
    if (const auto& coord = region.coord()) {
        fmt::print("  \"region\": {{ \"x\": {}, \"z\": {} }},\n", coord->x, coord->z);
    }
    fmt::print("  \"size\": {},\n", report.fileSize);
    fmt::print("  \"version\": {},\n", format::toRaw(header.version));
    fmt::print("  \"compression_level\": {},\n", header.compressionLevel);
    fmt::print("  \"compressed_size\": {},\n", header.compressedSize);
    fmt::print("  \"payload_size\": {},\n", report.payloadSize);
    fmt::print("  \"ratio\": {:.4f},\n", compressionRatio(report));
    fmt::print("  \"chunk_count\": {},\n", region.chunkCount());
    fmt::print("  \"newest_timestamp\": {},\n", header.newestTimestamp);
    fmt::print("  \"checksum\": \"{:016x}\",\n", header.checksum);
    fmt::print("  \"checksum_status\": \"{}\",\n",
               format::checksumStatusToString(report.checksum));

    fmt::print("  \"dropped\": [");
    for (std::size_t i = 0; i < report.dropped.size(); ++i) {
        const auto& dropped = report.dropped[i];
        fmt::print("{}\n    {{ \"x\": {}, \"z\": {}, \"reason\": \"{}\" }}", i == 0 ? "" : ",",
                   dropped.x(), dropped.z(), format::dropReasonToString(dropped.reason));
    }
    fmt::print("{}],\n", report.dropped.empty() ? "" : "\n  ");

    fmt::print("  \"occupied\": [");
    bool first = true;
    for (const auto& slot : region) {
        if (slot.chunk) {
            fmt::print("{}[{}, {}]", first ? "" : ", ", slot.x, slot.z);
            first = false;
        }
    }
    fmt::print("]\n}}\n");
}

std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath,
                                               bool jsonOutput,
                                               bool showMap) {
    InfoOptions opts;
    opts.inputPath = inputPath;
    opts.jsonOutput = jsonOutput;
    opts.showMap = showMap;
    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace lrf::commands
