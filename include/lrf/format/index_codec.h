// =============================================================================
// lrf - Index Table Codec
// =============================================================================
// Encoding and decoding of the 1024-entry index table at the start of the
// decompressed payload.
//
// The codec is a pure structural parse: it does not check entries against the
// payload length, nor for overlapping ranges. Those checks belong to the
// reader, which decides between failing and dropping slots.
//
// Legacy layout decoding derives each offset as the running sum of the
// preceding lengths. A negative legacy length decodes to a length no payload
// can satisfy, so the reader classifies it as out of bounds.
// =============================================================================

#ifndef LRF_FORMAT_INDEX_CODEC_H
#define LRF_FORMAT_INDEX_CODEC_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "lrf/format/region_format.h"

namespace lrf::format {

/// @brief Decode `count` index entries.
/// @param bytes Start of the decompressed payload.
/// @param layout Index layout selected by the file version.
/// @param count Number of entries (kSlotCount for a region file).
/// @throws FormatError(kTruncated) if fewer than count * entrySize bytes are given.
[[nodiscard]] std::vector<IndexEntry> decodeIndex(std::span<const std::uint8_t> bytes,
                                                  const IndexLayout& layout,
                                                  std::size_t count = kSlotCount);

/// @brief Encode entries in slot order.
/// @throws FormatError(kValueOutOfRange) if a value does not fit the layout.
/// @note Legacy layouts drop offsets; the caller lays chunks out in slot order.
[[nodiscard]] std::vector<std::uint8_t> encodeIndex(std::span<const IndexEntry> entries,
                                                    const IndexLayout& layout);

}  // namespace lrf::format

#endif  // LRF_FORMAT_INDEX_CODEC_H
