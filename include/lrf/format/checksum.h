// =============================================================================
// lrf - Region Checksums
// =============================================================================
// xxHash64 helpers shared by the reader and the writer.
//
// - File checksum: seed 0, over header[0, 24) followed by the whole
//   decompressed payload
// - Slot checksum: seeded with the slot timestamp, over the chunk bytes, so a
//   damaged timestamp is detected as well as damaged data
// =============================================================================

#ifndef LRF_FORMAT_CHECKSUM_H
#define LRF_FORMAT_CHECKSUM_H

#include <cstdint>
#include <span>
#include <vector>

#include "lrf/common/types.h"

namespace lrf::format {

/// @brief xxHash64 of a contiguous buffer.
[[nodiscard]] Checksum calculateXxHash64(std::span<const std::uint8_t> data,
                                         std::uint64_t seed = 0);

/// @brief xxHash64 of several buffers hashed as if concatenated.
/// @throws IOError if the hash state cannot be allocated.
[[nodiscard]] Checksum calculateXxHash64(
    const std::vector<std::span<const std::uint8_t>>& segments, std::uint64_t seed = 0);

/// @brief File checksum over the checksummed header prefix and the payload.
[[nodiscard]] Checksum calculateFileChecksum(std::span<const std::uint8_t> headerPrefix,
                                             std::span<const std::uint8_t> payload);

/// @brief Per-slot checksum of the extended index layout.
[[nodiscard]] Checksum calculateSlotChecksum(std::span<const std::uint8_t> chunk,
                                             Timestamp timestamp);

}  // namespace lrf::format

#endif  // LRF_FORMAT_CHECKSUM_H
