// =============================================================================
// lrf - Region File Reader
// =============================================================================
// Decodes a complete region file into a Region.
//
// Decoding pipeline:
// 1. Header (magic, version, chunk count)
// 2. Framing (header + compressed blob + footer, nothing after it)
// 3. Decompression, capped at ReadOptions::maxPayloadSize
// 4. File checksum
// 5. Index table
// 6. Per-slot validation: bounds, slot checksum (version 3), overlap,
//    payload size (legacy layouts), header chunk count
//
// Modes:
// - kStrict: any violation throws and no Region is produced
// - kLenient: slots failing step 6 are dropped and listed in the report;
//   framing, file checksum and count problems become warnings. A truncated
//   header or index, an unsupported version and a corrupt compressed stream
//   still throw, since nothing trustworthy can be recovered. Legacy slots
//   whose implicit offset depends on a damaged entry are dropped as well.
//
// Usage:
//   RegionReader reader(ReadOptions{.mode = ReadMode::kLenient});
//   auto result = reader.readFile("region/r.0.0.linear");
//   for (const auto& dropped : result.report.dropped) { ... }
// =============================================================================

#ifndef LRF_FORMAT_REGION_READER_H
#define LRF_FORMAT_REGION_READER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lrf/algo/compressor.h"
#include "lrf/format/region.h"
#include "lrf/format/region_format.h"

namespace lrf::format {

// =============================================================================
// Options and Report
// =============================================================================

/// @brief Validation policy.
enum class ReadMode : std::uint8_t {
    kStrict = 0,
    kLenient = 1
};

/// @brief Reader configuration.
struct ReadOptions {
    ReadMode mode = ReadMode::kStrict;

    /// @brief Upper bound on the decompressed payload.
    std::size_t maxPayloadSize = kDefaultMaxPayloadSize;
};

/// @brief Why a slot was dropped in lenient mode.
enum class DropReason : std::uint8_t {
    kChecksumMismatch,
    kOutOfBounds,
    kOverlap
};

[[nodiscard]] constexpr std::string_view dropReasonToString(DropReason reason) noexcept {
    switch (reason) {
        case DropReason::kChecksumMismatch:
            return "checksum mismatch";
        case DropReason::kOutOfBounds:
            return "out of bounds";
        case DropReason::kOverlap:
            return "overlap";
    }
    return "unknown";
}

/// @brief A slot removed during lenient decoding.
struct DroppedSlot {
    SlotIndex slot = 0;
    DropReason reason = DropReason::kOutOfBounds;
    std::string detail;

    [[nodiscard]] std::uint32_t x() const noexcept { return slotX(slot); }
    [[nodiscard]] std::uint32_t z() const noexcept { return slotZ(slot); }
};

/// @brief Outcome of the file checksum check.
enum class ChecksumStatus : std::uint8_t {
    /// @brief Stored and computed checksums match.
    kVerified,
    /// @brief Legacy file without a recorded checksum.
    kNotRecorded,
    /// @brief Mismatch tolerated in lenient mode.
    kMismatch
};

[[nodiscard]] constexpr std::string_view checksumStatusToString(ChecksumStatus status) noexcept {
    switch (status) {
        case ChecksumStatus::kVerified:
            return "verified";
        case ChecksumStatus::kNotRecorded:
            return "not recorded";
        case ChecksumStatus::kMismatch:
            return "mismatch";
    }
    return "unknown";
}

/// @brief Diagnostics collected while decoding.
struct ReadReport {
    RegionHeader header;
    std::uint64_t fileSize = 0;
    std::uint64_t payloadSize = 0;
    ChecksumStatus checksum = ChecksumStatus::kVerified;
    Checksum computedChecksum = 0;
    std::vector<DroppedSlot> dropped;
    std::vector<std::string> warnings;

    /// @brief No slot dropped and no warning raised.
    [[nodiscard]] bool isClean() const noexcept {
        return dropped.empty() && warnings.empty() && checksum != ChecksumStatus::kMismatch;
    }
};

/// @brief Decoded region with its report.
struct ReadResult {
    Region region;
    ReadReport report;
};

// =============================================================================
// RegionReader
// =============================================================================

/// @brief Stateless region file decoder.
/// @note Safe to share between threads decoding independent inputs.
class RegionReader {
public:
    explicit RegionReader(ReadOptions options = {},
                          std::shared_ptr<const algo::ICompressor> compressor =
                              algo::defaultCompressor());

    /// @brief Decode an in-memory file image.
    /// @throws FormatError, IntegrityError or DecompressionError.
    [[nodiscard]] ReadResult read(std::span<const std::uint8_t> bytes) const;

    /// @brief Read and decode a file. The region coordinate is taken from the
    ///        file name when it follows r.<x>.<z>.linear.
    /// @throws IOError if the file cannot be read, otherwise as read().
    [[nodiscard]] ReadResult readFile(const std::filesystem::path& path) const;

    [[nodiscard]] const ReadOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] ReadResult decode(std::span<const std::uint8_t> bytes,
                                    const std::string& source) const;

    ReadOptions options_;
    std::shared_ptr<const algo::ICompressor> compressor_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Decode an in-memory file image.
[[nodiscard]] Region openRegion(std::span<const std::uint8_t> bytes,
                                const ReadOptions& options = {});

/// @brief Read and decode a file.
[[nodiscard]] Region openRegion(const std::filesystem::path& path,
                                const ReadOptions& options = {});

/// @brief Read a whole file into memory.
/// @throws IOError on any access failure.
[[nodiscard]] std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path);

}  // namespace lrf::format

#endif  // LRF_FORMAT_REGION_READER_H
