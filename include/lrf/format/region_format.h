// =============================================================================
// lrf - Linear Region File Format Definitions
// =============================================================================
// Binary format definitions for .linear region files.
//
// All multi-byte fields are big-endian.
//
// File Layout:
// +--------------------+
// |      Header        |  (32 bytes)
// +--------------------+
// |  Compressed Blob   |  (compressed_size bytes, one zstd frame)
// +--------------------+
// |   Footer Magic     |  (8 bytes)
// +--------------------+
//
// Decompressed Payload:
// +--------------------+
// |    Index Table     |  (1024 entries, width depends on version)
// +--------------------+
// |  Chunk Data Region |  (present chunks, concatenated in slot order)
// +--------------------+
//
// Header Layout:
//   0  u64 magic             0xC3FF13183CCA9D9A
//   8  u8  version           1, 2 or 3
//   9  i64 newest_timestamp  max timestamp over present slots
//  17  i8  compression_level informational only
//  18  u16 chunk_count       number of present slots
//  20  u32 compressed_size   size of the compressed blob
//  24  u64 checksum          xxHash64 over header[0, 24) || payload
//
// Index layouts:
// - Legacy (versions 1, 2): i32 length, i32 timestamp (8 bytes). Offsets are
//   implicit: chunk bytes follow in slot order.
// - Extended (version 3): u32 offset, u32 length, i64 timestamp, u64 slot
//   checksum (24 bytes). The slot checksum is xxHash64 of the chunk bytes
//   seeded with the timestamp.
//
// Checksum rules:
// - Versions 1 and 2 store 0 when the writer did not compute a checksum;
//   readers skip verification in that case.
// - Version 3 always carries both the file and the per-slot checksums.
// =============================================================================

#ifndef LRF_FORMAT_REGION_FORMAT_H
#define LRF_FORMAT_REGION_FORMAT_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <variant>

#include "lrf/common/types.h"

namespace lrf::format {

// =============================================================================
// Magic and Size Constants
// =============================================================================

/// @brief Leading and trailing file signature.
inline constexpr std::uint64_t kRegionMagic = 0xC3FF13183CCA9D9AULL;

/// @brief Fixed header size in bytes.
inline constexpr std::size_t kHeaderSize = 32;

/// @brief Number of header bytes covered by the file checksum.
/// @note Everything before the checksum field.
inline constexpr std::size_t kChecksummedHeaderSize = 24;

/// @brief Footer size in bytes (repeated magic).
inline constexpr std::size_t kFooterSize = 8;

/// @brief Smallest possible file: header + empty blob + footer.
inline constexpr std::size_t kMinFileSize = kHeaderSize + kFooterSize;

/// @brief Default cap on the decompressed payload (1 GiB).
inline constexpr std::size_t kDefaultMaxPayloadSize = std::size_t{1} << 30;

// =============================================================================
// Format Versions
// =============================================================================

/// @brief Closed set of implemented format versions.
enum class FormatVersion : std::uint8_t {
    kV1 = 1,
    kV2 = 2,
    kV3 = 3
};

/// @brief Version written unless the caller chooses otherwise.
inline constexpr FormatVersion kCurrentVersion = FormatVersion::kV3;

/// @brief Map a raw version byte onto the closed set.
/// @return The version, or nullopt when it is not implemented.
[[nodiscard]] constexpr std::optional<FormatVersion> toFormatVersion(std::uint8_t raw) noexcept {
    switch (raw) {
        case 1:
            return FormatVersion::kV1;
        case 2:
            return FormatVersion::kV2;
        case 3:
            return FormatVersion::kV3;
        default:
            return std::nullopt;
    }
}

[[nodiscard]] constexpr std::uint8_t toRaw(FormatVersion version) noexcept {
    return static_cast<std::uint8_t>(version);
}

// =============================================================================
// Header
// =============================================================================

/// @brief Decoded file header.
struct RegionHeader {
    /// @brief Format version.
    FormatVersion version = kCurrentVersion;

    /// @brief Newest timestamp over all present slots (0 for an empty region).
    Timestamp newestTimestamp = 0;

    /// @brief Compression level used when the file was written.
    std::int8_t compressionLevel = 0;

    /// @brief Number of present slots.
    std::uint16_t chunkCount = 0;

    /// @brief Size of the compressed blob in bytes.
    std::uint32_t compressedSize = 0;

    /// @brief xxHash64 over header[0, 24) followed by the decompressed payload.
    Checksum checksum = 0;

    /// @brief Whether this header records a checksum that must be verified.
    [[nodiscard]] bool hasChecksum() const noexcept {
        return version == FormatVersion::kV3 || checksum != 0;
    }

    /// @brief Total file size implied by the header.
    [[nodiscard]] std::uint64_t expectedFileSize() const noexcept {
        return kHeaderSize + static_cast<std::uint64_t>(compressedSize) + kFooterSize;
    }

    bool operator==(const RegionHeader&) const = default;
};

// =============================================================================
// Index Entry
// =============================================================================

/// @brief One slot's entry in the index table.
struct IndexEntry {
    /// @brief Byte offset into the chunk data region (after the index).
    std::uint64_t offset = 0;

    /// @brief Chunk length in bytes; 0 means the slot is absent.
    std::uint64_t length = 0;

    /// @brief Modification timestamp of the chunk.
    Timestamp timestamp = 0;

    /// @brief Per-slot checksum (extended layout only, 0 otherwise).
    Checksum checksum = 0;

    [[nodiscard]] bool isPresent() const noexcept { return length != 0; }

    /// @brief One past the last byte, computed without overflow.
    [[nodiscard]] std::uint64_t end() const noexcept {
        if (offset > std::numeric_limits<std::uint64_t>::max() - length) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        return offset + length;
    }

    bool operator==(const IndexEntry&) const = default;
};

// =============================================================================
// Index Layouts
// =============================================================================

/// @brief Implicit-offset layout shared by versions 1 and 2.
struct LegacyIndexLayout {
    static constexpr std::size_t kEntrySize = 8;
    static constexpr bool kHasExplicitOffsets = false;
    static constexpr bool kHasSlotChecksums = false;
    /// @brief Largest chunk length or total chunk region size.
    static constexpr std::uint64_t kMaxLength =
        static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
    static constexpr Timestamp kMinTimestamp = std::numeric_limits<std::int32_t>::min();
    static constexpr Timestamp kMaxTimestamp = std::numeric_limits<std::int32_t>::max();
    static constexpr std::string_view kName = "legacy";
};

/// @brief Explicit-offset layout with per-slot checksums (version 3).
struct ExtendedIndexLayout {
    static constexpr std::size_t kEntrySize = 24;
    static constexpr bool kHasExplicitOffsets = true;
    static constexpr bool kHasSlotChecksums = true;
    static constexpr std::uint64_t kMaxLength = std::numeric_limits<std::uint32_t>::max();
    static constexpr Timestamp kMinTimestamp = std::numeric_limits<Timestamp>::min();
    static constexpr Timestamp kMaxTimestamp = std::numeric_limits<Timestamp>::max();
    static constexpr std::string_view kName = "extended";
};

/// @brief Tagged variant over the implemented index layouts.
using IndexLayout = std::variant<LegacyIndexLayout, ExtendedIndexLayout>;

/// @brief Explicit mapping from format version to index layout.
[[nodiscard]] constexpr IndexLayout indexLayoutFor(FormatVersion version) noexcept {
    switch (version) {
        case FormatVersion::kV1:
        case FormatVersion::kV2:
            return LegacyIndexLayout{};
        case FormatVersion::kV3:
            return ExtendedIndexLayout{};
    }
    return ExtendedIndexLayout{};
}

/// @brief Size of one index entry for the layout.
[[nodiscard]] constexpr std::size_t entrySize(const IndexLayout& layout) noexcept {
    return std::visit([](const auto& l) { return l.kEntrySize; }, layout);
}

/// @brief Size of the whole index table for the layout.
[[nodiscard]] constexpr std::size_t indexTableSize(const IndexLayout& layout) noexcept {
    return entrySize(layout) * kSlotCount;
}

/// @brief Human-readable layout name.
[[nodiscard]] constexpr std::string_view layoutName(const IndexLayout& layout) noexcept {
    return std::visit([](const auto& l) { return l.kName; }, layout);
}

static_assert(LegacyIndexLayout::kEntrySize * kSlotCount == 8192,
              "legacy index table must be 8192 bytes");
static_assert(ExtendedIndexLayout::kEntrySize * kSlotCount == 24576,
              "extended index table must be 24576 bytes");

}  // namespace lrf::format

#endif  // LRF_FORMAT_REGION_FORMAT_H
