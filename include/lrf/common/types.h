// =============================================================================
// lrf - Common Type Definitions
// =============================================================================
// Core type definitions shared by the codec, the container and the CLI.
//
// This module defines:
// - Timestamp, SlotIndex: type aliases
// - Grid geometry constants (32x32 slots)
// - Compression level bounds
// - RegionCoord and the r.<x>.<z>.linear naming convention
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef LRF_COMMON_TYPES_H
#define LRF_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lrf {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Epoch seconds of a chunk's last modification.
using Timestamp = std::int64_t;

/// @brief Slot index in row-major order: x + z * kRegionWidth.
using SlotIndex = std::uint32_t;

/// @brief Checksum values (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Grid Geometry
// =============================================================================

/// @brief Number of slots along each axis of a region.
inline constexpr std::uint32_t kRegionWidth = 32;

/// @brief Total number of slots in a region.
inline constexpr std::uint32_t kSlotCount = kRegionWidth * kRegionWidth;

static_assert(kSlotCount == 1024, "a region holds exactly 1024 slots");

/// @brief Check that (x, z) addresses a slot.
[[nodiscard]] constexpr bool isValidSlot(std::uint32_t x, std::uint32_t z) noexcept {
    return x < kRegionWidth && z < kRegionWidth;
}

/// @brief Slot index of (x, z). Caller guarantees isValidSlot(x, z).
[[nodiscard]] constexpr SlotIndex slotIndex(std::uint32_t x, std::uint32_t z) noexcept {
    return x + z * kRegionWidth;
}

[[nodiscard]] constexpr std::uint32_t slotX(SlotIndex index) noexcept {
    return index % kRegionWidth;
}

[[nodiscard]] constexpr std::uint32_t slotZ(SlotIndex index) noexcept {
    return index / kRegionWidth;
}

// =============================================================================
// Compression Levels
// =============================================================================

/// @brief Minimum accepted compression level.
inline constexpr int kMinCompressionLevel = 1;

/// @brief Maximum accepted compression level (zstd ultra range).
inline constexpr int kMaxCompressionLevel = 22;

/// @brief Default compression level.
inline constexpr int kDefaultCompressionLevel = 6;

[[nodiscard]] constexpr bool isValidCompressionLevel(int level) noexcept {
    return level >= kMinCompressionLevel && level <= kMaxCompressionLevel;
}

// =============================================================================
// Region Coordinates
// =============================================================================

/// @brief File extension of region files.
inline constexpr std::string_view kRegionFileExtension = ".linear";

/// @brief Suffix appended to the target path while a write is in flight.
inline constexpr std::string_view kWorkInProgressSuffix = ".wip";

/// @brief Position of a region in the world, in region units.
struct RegionCoord {
    std::int32_t x = 0;
    std::int32_t z = 0;

    bool operator==(const RegionCoord&) const = default;
};

/// @brief Absolute chunk coordinate in the world.
struct ChunkCoord {
    std::int64_t x = 0;
    std::int64_t z = 0;

    bool operator==(const ChunkCoord&) const = default;
};

/// @brief File name of a region: "r.<x>.<z>.linear".
[[nodiscard]] std::string regionFileName(RegionCoord coord);

/// @brief Parse "r.<x>.<z>.linear" from the final path component.
/// @return Coordinates, or nullopt if the name does not follow the convention.
[[nodiscard]] std::optional<RegionCoord> parseRegionFileName(const std::filesystem::path& path);

/// @brief World coordinate of slot (x, z) in the given region.
[[nodiscard]] constexpr ChunkCoord chunkWorldCoord(RegionCoord region,
                                                   std::uint32_t x,
                                                   std::uint32_t z) noexcept {
    return ChunkCoord{static_cast<std::int64_t>(region.x) * kRegionWidth + x,
                      static_cast<std::int64_t>(region.z) * kRegionWidth + z};
}

}  // namespace lrf

#endif  // LRF_COMMON_TYPES_H
