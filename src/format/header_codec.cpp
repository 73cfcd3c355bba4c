// =============================================================================
// lrf - Region Header Codec Implementation
// =============================================================================

#include "lrf/format/header_codec.h"

#include <algorithm>
#include <format>

#include "lrf/common/error.h"
#include "lrf/io/byte_buffer.h"

namespace lrf::format {

HeaderBytes encodeHeader(const RegionHeader& header) {
    io::ByteWriter out(kHeaderSize);
    out.writeBE<std::uint64_t>(kRegionMagic);
    out.writeBE<std::uint8_t>(toRaw(header.version));
    out.writeBE<std::int64_t>(header.newestTimestamp);
    out.writeBE<std::int8_t>(header.compressionLevel);
    out.writeBE<std::uint16_t>(header.chunkCount);
    out.writeBE<std::uint32_t>(header.compressedSize);
    out.writeBE<std::uint64_t>(header.checksum);

    HeaderBytes bytes{};
    std::ranges::copy(out.bytes(), bytes.begin());
    return bytes;
}

RegionHeader decodeHeader(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < kHeaderSize) {
        throw FormatError(FormatErrorKind::kTruncated,
                          std::format("file too short for header: {} of {} bytes", bytes.size(),
                                      kHeaderSize));
    }

    io::ByteReader in(bytes.first(kHeaderSize));

    const auto magic = in.readBE<std::uint64_t>();
    if (magic != kRegionMagic) {
        throw FormatError(FormatErrorKind::kBadMagic,
                          std::format("bad magic {:#018x}", magic), ErrorContext{}.withOffset(0));
    }

    const auto rawVersion = in.readBE<std::uint8_t>();
    const auto version = toFormatVersion(rawVersion);
    if (!version) {
        throw FormatError(FormatErrorKind::kUnsupportedVersion,
                          std::format("unsupported version {}", rawVersion),
                          ErrorContext{}.withOffset(8));
    }

    RegionHeader header;
    header.version = *version;
    header.newestTimestamp = in.readBE<std::int64_t>();
    header.compressionLevel = in.readBE<std::int8_t>();
    header.chunkCount = in.readBE<std::uint16_t>();
    header.compressedSize = in.readBE<std::uint32_t>();
    header.checksum = in.readBE<std::uint64_t>();

    if (header.chunkCount > kSlotCount) {
        throw FormatError(FormatErrorKind::kInvalidHeader,
                          std::format("chunk count {} exceeds {}", header.chunkCount, kSlotCount),
                          ErrorContext{}.withOffset(18));
    }
    return header;
}

std::array<std::uint8_t, kFooterSize> encodeFooter() {
    io::ByteWriter out(kFooterSize);
    out.writeBE<std::uint64_t>(kRegionMagic);
    std::array<std::uint8_t, kFooterSize> bytes{};
    std::ranges::copy(out.bytes(), bytes.begin());
    return bytes;
}

bool isValidFooter(std::span<const std::uint8_t> bytes) {
    const auto expected = encodeFooter();
    return std::ranges::equal(bytes, expected);
}

}  // namespace lrf::format
