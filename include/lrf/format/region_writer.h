// =============================================================================
// lrf - Region File Writer
// =============================================================================
// Serializes a Region into the region file format and persists it atomically.
//
// Serialization:
// 1. Present chunks are concatenated in slot order (dense layout)
// 2. The index table is built from the resulting offsets
// 3. Per-slot checksums (version 3) and the file checksum are computed
// 4. The payload is compressed at WriteOptions::compressionLevel
// 5. Header, blob and footer are concatenated
//
// Persistence goes through io::AtomicFile, so the target path always holds
// either the previous file or the complete new one.
//
// Usage:
//   RegionWriter writer(WriteOptions{.compressionLevel = 9});
//   writer.writeFile(region, "region/r.0.0.linear");
// =============================================================================

#ifndef LRF_FORMAT_REGION_WRITER_H
#define LRF_FORMAT_REGION_WRITER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "lrf/algo/compressor.h"
#include "lrf/common/types.h"
#include "lrf/format/region.h"
#include "lrf/format/region_format.h"

namespace lrf::format {

/// @brief Writer configuration.
struct WriteOptions {
    /// @brief Compression level in [kMinCompressionLevel, kMaxCompressionLevel].
    int compressionLevel = kDefaultCompressionLevel;

    /// @brief Format version to emit.
    FormatVersion version = kCurrentVersion;

    /// @brief fsync the file and its directory around the rename.
    bool syncToDisk = true;
};

/// @brief Stateless region file encoder.
class RegionWriter {
public:
    /// @throws LRFException(kInvalidArgument) for an out-of-range level.
    explicit RegionWriter(WriteOptions options = {},
                          std::shared_ptr<const algo::ICompressor> compressor =
                              algo::defaultCompressor());

    /// @brief Encode a region into a complete file image.
    /// @throws FormatError(kValueOutOfRange) if the region does not fit the version.
    [[nodiscard]] std::vector<std::uint8_t> serialize(const Region& region) const;

    /// @brief Encode and atomically replace `path`.
    /// @throws IOError on storage failure; `path` keeps its previous content.
    void writeFile(const Region& region, const std::filesystem::path& path) const;

    /// @brief Write into `directory` as r.<x>.<z>.linear.
    /// @return The written path.
    /// @throws LRFException(kInvalidArgument) if the region has no coordinate.
    std::filesystem::path writeToDirectory(const Region& region,
                                           const std::filesystem::path& directory) const;

    [[nodiscard]] const WriteOptions& options() const noexcept { return options_; }

private:
    WriteOptions options_;
    std::shared_ptr<const algo::ICompressor> compressor_;
};

/// @brief Encode with the given level and the current version.
[[nodiscard]] std::vector<std::uint8_t> saveRegion(const Region& region,
                                                   int compressionLevel = kDefaultCompressionLevel);

/// @brief Encode and atomically write to `path`.
void saveRegion(const Region& region, const std::filesystem::path& path,
                const WriteOptions& options = {});

}  // namespace lrf::format

#endif  // LRF_FORMAT_REGION_WRITER_H
