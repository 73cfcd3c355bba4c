// =============================================================================
// lrf - Region File Writer Implementation
// =============================================================================

#include "lrf/format/region_writer.h"

#include <format>
#include <limits>
#include <utility>
#include <variant>

#include "lrf/common/error.h"
#include "lrf/common/logger.h"
#include "lrf/format/checksum.h"
#include "lrf/format/header_codec.h"
#include "lrf/format/index_codec.h"
#include "lrf/io/atomic_file.h"
#include "lrf/io/byte_buffer.h"

namespace lrf::format {

RegionWriter::RegionWriter(WriteOptions options,
                           std::shared_ptr<const algo::ICompressor> compressor)
    : options_(options), compressor_(std::move(compressor)) {
    if (!isValidCompressionLevel(options_.compressionLevel)) {
        throw LRFException(ErrorCode::kInvalidArgument,
                           std::format("compression level {} outside [{}, {}]",
                                       options_.compressionLevel, kMinCompressionLevel,
                                       kMaxCompressionLevel));
    }
    if (!compressor_) {
        throw LRFException(ErrorCode::kInvalidArgument, "RegionWriter requires a compressor");
    }
}

std::vector<std::uint8_t> RegionWriter::serialize(const Region& region) const {
    const IndexLayout layout = indexLayoutFor(options_.version);
    const bool slotChecksums = std::holds_alternative<ExtendedIndexLayout>(layout);
    const std::uint64_t maxRegionBytes =
        std::visit([](const auto& l) { return l.kMaxLength; }, layout);

    const std::uint64_t totalBytes = region.totalChunkBytes();
    if (totalBytes > maxRegionBytes) {
        throw FormatError(FormatErrorKind::kValueOutOfRange,
                          std::format("{} bytes of chunk data exceed the {} layout limit of {}",
                                      totalBytes, layoutName(layout), maxRegionBytes));
    }

    // Dense layout: chunks in slot order, offsets relative to the chunk region.
    std::vector<IndexEntry> entries(kSlotCount);
    io::ByteWriter chunks(static_cast<std::size_t>(totalBytes));
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        const auto& record = region.slot(slot);
        if (!record) {
            continue;
        }
        IndexEntry& entry = entries[slot];
        entry.offset = chunks.size();
        entry.length = record->data.size();
        entry.timestamp = record->timestamp;
        if (slotChecksums) {
            entry.checksum = calculateSlotChecksum(record->data, record->timestamp);
        }
        chunks.writeBytes(record->data);
    }

    io::ByteWriter payload(indexTableSize(layout) + chunks.size());
    payload.writeBytes(encodeIndex(entries, layout));
    payload.writeBytes(chunks.bytes());

    auto compressed = compressor_->compress(payload.bytes(), options_.compressionLevel);
    if (!compressed) {
        compressed.error().throwException();
    }
    if (compressed->size() > std::numeric_limits<std::uint32_t>::max()) {
        throw FormatError(FormatErrorKind::kValueOutOfRange,
                          std::format("compressed blob of {} bytes exceeds the header field",
                                      compressed->size()));
    }

    RegionHeader header;
    header.version = options_.version;
    header.newestTimestamp = region.newestTimestamp();
    header.compressionLevel = static_cast<std::int8_t>(options_.compressionLevel);
    header.chunkCount = static_cast<std::uint16_t>(region.chunkCount());
    header.compressedSize = static_cast<std::uint32_t>(compressed->size());
    header.checksum = 0;
    header.checksum = calculateFileChecksum(headerChecksumPrefix(encodeHeader(header)),
                                            payload.bytes());

    const auto headerBytes = encodeHeader(header);
    const auto footerBytes = encodeFooter();

    io::ByteWriter file(kHeaderSize + compressed->size() + kFooterSize);
    file.writeBytes(headerBytes);
    file.writeBytes(*compressed);
    file.writeBytes(footerBytes);

    LRF_LOG_DEBUG("Serialized region: version={}, chunks={}, payload={}, compressed={}",
                  toRaw(header.version), header.chunkCount, payload.size(), compressed->size());
    return file.release();
}

void RegionWriter::writeFile(const Region& region, const std::filesystem::path& path) const {
    const auto bytes = serialize(region);
    io::writeFileAtomically(path, bytes, options_.syncToDisk);
    LRF_LOG_INFO("Wrote region file: {} ({} chunks, {} bytes)", path.string(),
                 region.chunkCount(), bytes.size());
}

std::filesystem::path RegionWriter::writeToDirectory(const Region& region,
                                                     const std::filesystem::path& directory) const {
    if (!region.coord()) {
        throw LRFException(ErrorCode::kInvalidArgument,
                           "region has no coordinate to derive a file name from");
    }
    auto path = directory / regionFileName(*region.coord());
    writeFile(region, path);
    return path;
}

std::vector<std::uint8_t> saveRegion(const Region& region, int compressionLevel) {
    WriteOptions options;
    options.compressionLevel = compressionLevel;
    return RegionWriter(options).serialize(region);
}

void saveRegion(const Region& region, const std::filesystem::path& path,
                const WriteOptions& options) {
    RegionWriter(options).writeFile(region, path);
}

}  // namespace lrf::format
