// =============================================================================
// lrf - Region Header Codec
// =============================================================================
// Encoding and decoding of the fixed 32-byte region file header.
//
// decodeHeader() validates, in order:
// 1. At least kHeaderSize bytes are present (kTruncated)
// 2. Leading magic (kBadMagic)
// 3. Version byte belongs to the implemented set (kUnsupportedVersion)
// 4. chunk_count <= 1024 (kInvalidHeader)
// =============================================================================

#ifndef LRF_FORMAT_HEADER_CODEC_H
#define LRF_FORMAT_HEADER_CODEC_H

#include <array>
#include <cstdint>
#include <span>

#include "lrf/format/region_format.h"

namespace lrf::format {

/// @brief Serialized header bytes.
using HeaderBytes = std::array<std::uint8_t, kHeaderSize>;

/// @brief Encode a header into its 32-byte big-endian form.
[[nodiscard]] HeaderBytes encodeHeader(const RegionHeader& header);

/// @brief Decode and validate the header at the start of `bytes`.
/// @throws FormatError with kTruncated, kBadMagic, kUnsupportedVersion or kInvalidHeader.
[[nodiscard]] RegionHeader decodeHeader(std::span<const std::uint8_t> bytes);

/// @brief Header bytes covered by the file checksum ([0, 24)).
[[nodiscard]] inline std::span<const std::uint8_t> headerChecksumPrefix(const HeaderBytes& bytes) {
    return std::span<const std::uint8_t>(bytes).first(kChecksummedHeaderSize);
}

/// @brief Encode the footer (trailing magic).
[[nodiscard]] std::array<std::uint8_t, kFooterSize> encodeFooter();

/// @brief Check that `bytes` holds exactly the footer magic.
[[nodiscard]] bool isValidFooter(std::span<const std::uint8_t> bytes);

}  // namespace lrf::format

#endif  // LRF_FORMAT_HEADER_CODEC_H
