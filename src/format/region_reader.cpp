// =============================================================================
// lrf - Region File Reader Implementation
// =============================================================================

#include "lrf/format/region_reader.h"

#include <algorithm>
#include <format>
#include <fstream>
#include <limits>
#include <utility>
#include <variant>
#include <vector>

#include "lrf/common/error.h"
#include "lrf/common/logger.h"
#include "lrf/format/checksum.h"
#include "lrf/format/header_codec.h"
#include "lrf/format/index_codec.h"

namespace lrf::format {

namespace {

ErrorContext sourceContext(const std::string& source) {
    ErrorContext context;
    if (!source.empty()) {
        context.withFile(source);
    }
    return context;
}

/// @brief Re-throw a codec error with the file path attached.
[[noreturn]] void rethrowWithSource(const FormatError& ex, const std::string& source) {
    ErrorContext context = ex.context().value_or(ErrorContext{});
    if (!source.empty()) {
        context.withFile(source);
    }
    throw FormatError(ex.kind(), ex.message(), std::move(context));
}

std::string describeRange(const IndexEntry& entry, std::size_t regionSize) {
    if (entry.length == std::numeric_limits<std::uint64_t>::max()) {
        return "negative chunk length";
    }
    return std::format("range [{}, {}) exceeds chunk region of {} bytes", entry.offset,
                       entry.end(), regionSize);
}

}  // namespace

RegionReader::RegionReader(ReadOptions options,
                           std::shared_ptr<const algo::ICompressor> compressor)
    : options_(options), compressor_(std::move(compressor)) {
    if (!compressor_) {
        throw LRFException(ErrorCode::kInvalidArgument, "RegionReader requires a compressor");
    }
}

ReadResult RegionReader::read(std::span<const std::uint8_t> bytes) const {
    return decode(bytes, std::string{});
}

ReadResult RegionReader::readFile(const std::filesystem::path& path) const {
    const auto bytes = readFileBytes(path);
    ReadResult result = decode(bytes, path.string());
    result.region.setCoord(parseRegionFileName(path));
    return result;
}

ReadResult RegionReader::decode(std::span<const std::uint8_t> bytes,
                                const std::string& source) const {
    const bool strict = options_.mode == ReadMode::kStrict;

    ReadResult result;
    ReadReport& report = result.report;
    report.fileSize = bytes.size();

    // Framing and count violations: errors in strict mode, warnings otherwise.
    auto violation = [&](FormatErrorKind kind, std::string message) {
        if (strict) {
            throw FormatError(kind, std::move(message), sourceContext(source));
        }
        LRF_LOG_WARNING("{}: {}", source, message);
        report.warnings.push_back(std::move(message));
    };

    // --- Header ---------------------------------------------------------------
    RegionHeader header;
    try {
        header = decodeHeader(bytes);
    } catch (const FormatError& ex) {
        rethrowWithSource(ex, source);
    }
    report.header = header;

    // --- Framing --------------------------------------------------------------
    const std::uint64_t expectedSize = header.expectedFileSize();
    if (bytes.size() < expectedSize) {
        throw FormatError(FormatErrorKind::kTruncated,
                          std::format("file holds {} bytes, header declares {}", bytes.size(),
                                      expectedSize),
                          sourceContext(source).withOffset(bytes.size()));
    }
    if (bytes.size() > expectedSize) {
        violation(FormatErrorKind::kTrailingData,
                  std::format("{} bytes after the footer", bytes.size() - expectedSize));
    }

    const auto blob = bytes.subspan(kHeaderSize, header.compressedSize);
    const auto footer = bytes.subspan(kHeaderSize + header.compressedSize, kFooterSize);
    if (!isValidFooter(footer)) {
        violation(FormatErrorKind::kBadFooter, "footer signature mismatch");
    }

    // --- Decompression --------------------------------------------------------
    auto decompressed = compressor_->decompress(blob, options_.maxPayloadSize);
    if (!decompressed) {
        decompressed.error().throwException(sourceContext(source).withOffset(kHeaderSize));
    }
    const std::vector<std::uint8_t> payload = std::move(*decompressed);
    report.payloadSize = payload.size();

    // --- File checksum --------------------------------------------------------
    report.computedChecksum =
        calculateFileChecksum(bytes.first(kChecksummedHeaderSize), payload);
    if (!header.hasChecksum()) {
        report.checksum = ChecksumStatus::kNotRecorded;
        LRF_LOG_DEBUG("{}: version {} file without checksum, verification skipped", source,
                      toRaw(header.version));
    } else if (report.computedChecksum != header.checksum) {
        if (strict) {
            throw IntegrityError(header.checksum, report.computedChecksum,
                                 sourceContext(source));
        }
        report.checksum = ChecksumStatus::kMismatch;
        LRF_LOG_WARNING("{}: file checksum mismatch (stored {:016x}, computed {:016x})", source,
                        header.checksum, report.computedChecksum);
    } else {
        report.checksum = ChecksumStatus::kVerified;
    }

    // --- Index ----------------------------------------------------------------
    const IndexLayout layout = indexLayoutFor(header.version);
    std::vector<IndexEntry> entries;
    try {
        entries = decodeIndex(payload, layout);
    } catch (const FormatError& ex) {
        rethrowWithSource(ex, source);
    }
    const auto chunkRegion = std::span<const std::uint8_t>(payload).subspan(indexTableSize(layout));
    const bool legacy = std::holds_alternative<LegacyIndexLayout>(layout);

    // --- Slots ----------------------------------------------------------------
    auto drop = [&](SlotIndex slot, DropReason reason, std::string detail) {
        LRF_LOG_WARNING("{}: dropping slot ({}, {}): {}", source, slotX(slot), slotZ(slot),
                        detail);
        report.dropped.push_back(DroppedSlot{slot, reason, std::move(detail)});
    };

    // Legacy offsets are prefix sums, so every slot after a negative length
    // sits at an unknown position.
    SlotIndex firstNegative = kSlotCount;
    std::uint64_t legacyTotal = 0;
    if (legacy) {
        for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
            if (entries[slot].length == std::numeric_limits<std::uint64_t>::max()) {
                firstNegative = slot;
                break;
            }
            legacyTotal += entries[slot].length;
        }
    }

    std::vector<bool> keep(kSlotCount, false);
    std::size_t presentCount = 0;

    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        const IndexEntry& entry = entries[slot];
        if (!entry.isPresent()) {
            continue;
        }
        ++presentCount;

        if (entry.end() > chunkRegion.size()) {
            std::string detail = describeRange(entry, chunkRegion.size());
            if (strict) {
                throw FormatError(FormatErrorKind::kIndexOutOfBounds, std::move(detail),
                                  sourceContext(source).withSlot(slot));
            }
            drop(slot, DropReason::kOutOfBounds, std::move(detail));
            continue;
        }
        if (slot > firstNegative) {
            drop(slot, DropReason::kOutOfBounds, "implicit offset unknown");
            continue;
        }

        if (!legacy) {
            const auto chunk = chunkRegion.subspan(entry.offset, entry.length);
            const Checksum actual = calculateSlotChecksum(chunk, entry.timestamp);
            if (actual != entry.checksum) {
                if (strict) {
                    throw IntegrityError(entry.checksum, actual,
                                         sourceContext(source).withSlot(slot));
                }
                drop(slot, DropReason::kChecksumMismatch,
                     std::format("stored {:016x}, computed {:016x}", entry.checksum, actual));
                continue;
            }
        }
        keep[slot] = true;
    }

    // A legacy index whose lengths do not add up to the chunk region has no
    // trustworthy offsets at all.
    if (legacy && firstNegative == kSlotCount && legacyTotal != chunkRegion.size()) {
        violation(FormatErrorKind::kPayloadSizeMismatch,
                  std::format("index covers {} bytes, chunk region holds {}", legacyTotal,
                              chunkRegion.size()));
        for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
            if (keep[slot]) {
                keep[slot] = false;
                drop(slot, DropReason::kOutOfBounds, "implicit offset unknown");
            }
        }
    }

    // Overlap is only judged among slots that survived the checks above, so a
    // corrupt entry pointing into a neighbour does not take the neighbour down.
    std::vector<SlotIndex> order;
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        if (keep[slot]) {
            order.push_back(slot);
        }
    }
    std::ranges::sort(order, [&](SlotIndex a, SlotIndex b) {
        return entries[a].offset < entries[b].offset ||
               (entries[a].offset == entries[b].offset && a < b);
    });

    std::vector<bool> overlapping(kSlotCount, false);
    for (std::size_t i = 0; i < order.size(); ++i) {
        const IndexEntry& current = entries[order[i]];
        for (std::size_t j = i + 1; j < order.size() && entries[order[j]].offset < current.end();
             ++j) {
            if (strict) {
                throw FormatError(
                    FormatErrorKind::kIndexOverlap,
                    std::format("slots ({}, {}) and ({}, {}) share payload bytes",
                                slotX(order[i]), slotZ(order[i]), slotX(order[j]),
                                slotZ(order[j])),
                    sourceContext(source).withSlot(order[j]));
            }
            overlapping[order[i]] = true;
            overlapping[order[j]] = true;
        }
    }
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        if (overlapping[slot]) {
            keep[slot] = false;
            drop(slot, DropReason::kOverlap, "payload range overlaps another slot");
        }
    }

    if (header.chunkCount != presentCount) {
        violation(FormatErrorKind::kChunkCountMismatch,
                  std::format("header declares {} chunks, index holds {}", header.chunkCount,
                              presentCount));
    }

    // --- Materialize ----------------------------------------------------------
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        if (!keep[slot]) {
            continue;
        }
        const IndexEntry& entry = entries[slot];
        const auto chunk = chunkRegion.subspan(entry.offset, entry.length);
        result.region.set(slotX(slot), slotZ(slot),
                          std::vector<std::uint8_t>(chunk.begin(), chunk.end()), entry.timestamp);
    }

    LRF_LOG_DEBUG("{}: decoded version {} region, {} chunks, {} dropped", source,
                  toRaw(header.version), result.region.chunkCount(), report.dropped.size());
    return result;
}

// =============================================================================
// Convenience Functions
// =============================================================================

Region openRegion(std::span<const std::uint8_t> bytes, const ReadOptions& options) {
    return RegionReader(options).read(bytes).region;
}

Region openRegion(const std::filesystem::path& path, const ReadOptions& options) {
    return RegionReader(options).readFile(path).region;
}

std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IOError("Failed to stat region file", ec, ErrorContext(path.string()));
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw IOError("Failed to open region file: " + path.string(),
                      ErrorContext(path.string()));
    }

    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
    stream.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::uintmax_t>(stream.gcount()) != size) {
        throw IOError("Short read from region file: " + path.string(),
                      ErrorContext(path.string()));
    }
    return bytes;
}

}  // namespace lrf::format
