// =============================================================================
// lrf - Region Container
// =============================================================================
// In-memory model of one region: a 32x32 grid of optional chunk payloads.
//
// This module provides:
// - ChunkRecord: owned payload bytes plus modification timestamp
// - ChunkView: borrowed view into a slot, valid until the slot is mutated
// - Region: random-access get/set/clear of slots and row-major iteration
//
// Payloads are opaque; the container never inspects or alters their bytes.
// A Region holds no reference to any file. It is produced empty by its
// constructor or populated by RegionReader, and persisted only by
// RegionWriter.
//
// Usage:
//   Region region(RegionCoord{0, 0});
//   region.set(3, 7, bytes, 1700000000);
//   if (auto chunk = region.get(3, 7)) {
//       consume(chunk->data);
//   }
//   for (const auto& slot : region) { ... }
// =============================================================================

#ifndef LRF_FORMAT_REGION_H
#define LRF_FORMAT_REGION_H

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "lrf/common/types.h"

namespace lrf::format {

// =============================================================================
// Chunk Types
// =============================================================================

/// @brief Owned chunk payload.
struct ChunkRecord {
    std::vector<std::uint8_t> data;
    Timestamp timestamp = 0;

    bool operator==(const ChunkRecord&) const = default;
};

/// @brief Borrowed chunk payload.
/// @note Invalidated by set() or clear() on the same slot, or by destroying the Region.
struct ChunkView {
    std::span<const std::uint8_t> data;
    Timestamp timestamp = 0;

    [[nodiscard]] std::size_t size() const noexcept { return data.size(); }

    /// @brief Copy into an independent ChunkRecord.
    [[nodiscard]] ChunkRecord toOwned() const {
        return ChunkRecord{std::vector<std::uint8_t>(data.begin(), data.end()), timestamp};
    }
};

/// @brief One item of Region iteration.
struct SlotEntry {
    std::uint32_t x = 0;
    std::uint32_t z = 0;
    std::optional<ChunkView> chunk;

    [[nodiscard]] SlotIndex index() const noexcept { return slotIndex(x, z); }
};

// =============================================================================
// Region
// =============================================================================

/// @brief Fixed grid of kSlotCount optional chunks.
class Region {
public:
    /// @brief Restartable row-major iterator over all slots, absent ones included.
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = SlotEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = SlotEntry;

        const_iterator() = default;

        [[nodiscard]] SlotEntry operator*() const;

        const_iterator& operator++() noexcept {
            ++index_;
            return *this;
        }

        const_iterator operator++(int) noexcept {
            auto copy = *this;
            ++index_;
            return copy;
        }

        bool operator==(const const_iterator& other) const noexcept {
            return region_ == other.region_ && index_ == other.index_;
        }

    private:
        friend class Region;

        const_iterator(const Region* region, SlotIndex index) noexcept
            : region_(region), index_(index) {}

        const Region* region_ = nullptr;
        SlotIndex index_ = 0;
    };

    /// @brief Empty region without coordinates.
    Region();

    /// @brief Empty region at the given world position.
    explicit Region(RegionCoord coord);

    /// @brief Borrow the chunk at (x, z).
    /// @return nullopt for an absent slot.
    /// @throws LRFException(kInvalidArgument) if (x, z) is outside the grid.
    [[nodiscard]] std::optional<ChunkView> get(std::uint32_t x, std::uint32_t z) const;

    /// @brief Store a chunk, replacing any previous one.
    /// @throws LRFException(kInvalidArgument) for coordinates outside the grid or empty data.
    void set(std::uint32_t x, std::uint32_t z, std::vector<std::uint8_t> data, Timestamp timestamp);

    /// @brief Store an owned record.
    void set(std::uint32_t x, std::uint32_t z, ChunkRecord record);

    /// @brief Make the slot absent.
    /// @return true if a chunk was removed.
    bool clear(std::uint32_t x, std::uint32_t z);

    [[nodiscard]] bool has(std::uint32_t x, std::uint32_t z) const;

    /// @brief Number of present slots.
    [[nodiscard]] std::size_t chunkCount() const noexcept { return chunkCount_; }

    [[nodiscard]] bool empty() const noexcept { return chunkCount_ == 0; }

    /// @brief Largest timestamp over present slots, 0 for an empty region.
    [[nodiscard]] Timestamp newestTimestamp() const noexcept;

    /// @brief Sum of all payload lengths.
    [[nodiscard]] std::uint64_t totalChunkBytes() const noexcept;

    /// @brief Slot access by index (x + z * 32), for codecs.
    [[nodiscard]] const std::optional<ChunkRecord>& slot(SlotIndex index) const {
        return slots_.at(index);
    }

    [[nodiscard]] const std::optional<RegionCoord>& coord() const noexcept { return coord_; }

    void setCoord(std::optional<RegionCoord> coord) noexcept { coord_ = coord; }

    /// @brief 32 rows of filled/empty squares, one row per z.
    [[nodiscard]] std::string occupancyMap() const;

    [[nodiscard]] const_iterator begin() const noexcept { return const_iterator(this, 0); }

    [[nodiscard]] const_iterator end() const noexcept { return const_iterator(this, kSlotCount); }

    /// @brief Slot-by-slot equality; coordinates are not compared.
    bool operator==(const Region& other) const { return slots_ == other.slots_; }

private:
    static SlotIndex checkedIndex(std::uint32_t x, std::uint32_t z);

    std::vector<std::optional<ChunkRecord>> slots_;
    std::size_t chunkCount_ = 0;
    std::optional<RegionCoord> coord_;
};

}  // namespace lrf::format

#endif  // LRF_FORMAT_REGION_H
