// =============================================================================
// lrf - Compression Boundary
// =============================================================================
// Byte-oriented compression interface used by the region codec.
//
// The region format compresses the whole payload (index table followed by the
// chunk data region) as a single blob. The codec only depends on ICompressor,
// so the algorithm is a single swappable component.
//
// ZstdCompressor is the only implementation:
// - compress() emits exactly one zstd frame with the content size recorded
// - decompress() streams the frame and refuses to grow the output past a
//   caller-supplied cap, so hostile frames cannot exhaust memory
// =============================================================================

#ifndef LRF_ALGO_COMPRESSOR_H
#define LRF_ALGO_COMPRESSOR_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "lrf/common/error.h"

namespace lrf::algo {

/// @brief Abstract byte compressor.
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /// @brief Compress a byte sequence.
    /// @param data Input bytes.
    /// @param level Compression level in [kMinCompressionLevel, kMaxCompressionLevel].
    /// @return Compressed bytes, or kInvalidArgument / kIOError on failure.
    [[nodiscard]] virtual Result<std::vector<std::uint8_t>> compress(
        std::span<const std::uint8_t> data, int level) const = 0;

    /// @brief Decompress a byte sequence produced by compress().
    /// @param data Compressed bytes.
    /// @param maxOutputSize Upper bound on the decompressed size.
    /// @return Decompressed bytes, or kDecompressionError for corrupt input or
    ///         output exceeding maxOutputSize.
    [[nodiscard]] virtual Result<std::vector<std::uint8_t>> decompress(
        std::span<const std::uint8_t> data, std::size_t maxOutputSize) const = 0;

    /// @brief Algorithm name for diagnostics.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// @brief zstd-backed compressor.
class ZstdCompressor final : public ICompressor {
public:
    [[nodiscard]] Result<std::vector<std::uint8_t>> compress(
        std::span<const std::uint8_t> data, int level) const override;

    [[nodiscard]] Result<std::vector<std::uint8_t>> decompress(
        std::span<const std::uint8_t> data, std::size_t maxOutputSize) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "zstd"; }
};

/// @brief Shared default compressor instance (zstd).
[[nodiscard]] std::shared_ptr<const ICompressor> defaultCompressor();

}  // namespace lrf::algo

#endif  // LRF_ALGO_COMPRESSOR_H
