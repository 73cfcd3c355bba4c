// =============================================================================
// lrf - Region Container Implementation
// =============================================================================

#include "lrf/format/region.h"

#include <algorithm>
#include <format>
#include <limits>
#include <utility>

#include "lrf/common/error.h"

namespace lrf::format {

SlotEntry Region::const_iterator::operator*() const {
    SlotEntry entry{slotX(index_), slotZ(index_), std::nullopt};
    if (const auto& record = region_->slots_[index_]; record.has_value()) {
        entry.chunk = ChunkView{record->data, record->timestamp};
    }
    return entry;
}

Region::Region() : slots_(kSlotCount) {}

Region::Region(RegionCoord coord) : slots_(kSlotCount), coord_(coord) {}

SlotIndex Region::checkedIndex(std::uint32_t x, std::uint32_t z) {
    if (!isValidSlot(x, z)) {
        throw LRFException(ErrorCode::kInvalidArgument,
                           std::format("slot ({}, {}) outside the {}x{} grid", x, z, kRegionWidth,
                                       kRegionWidth));
    }
    return slotIndex(x, z);
}

std::optional<ChunkView> Region::get(std::uint32_t x, std::uint32_t z) const {
    const auto& record = slots_[checkedIndex(x, z)];
    if (!record) {
        return std::nullopt;
    }
    return ChunkView{record->data, record->timestamp};
}

void Region::set(std::uint32_t x, std::uint32_t z, ChunkRecord record) {
    const SlotIndex index = checkedIndex(x, z);
    if (record.data.empty()) {
        throw LRFException(ErrorCode::kInvalidArgument,
                           std::format("empty payload for slot ({}, {})", x, z),
                           ErrorContext{}.withSlot(index));
    }

    auto& target = slots_[index];
    if (!target) {
        ++chunkCount_;
    }
    target = std::move(record);
}

void Region::set(std::uint32_t x, std::uint32_t z, std::vector<std::uint8_t> data,
                 Timestamp timestamp) {
    set(x, z, ChunkRecord{std::move(data), timestamp});
}

bool Region::clear(std::uint32_t x, std::uint32_t z) {
    auto& target = slots_[checkedIndex(x, z)];
    if (!target) {
        return false;
    }
    target.reset();
    --chunkCount_;
    return true;
}

bool Region::has(std::uint32_t x, std::uint32_t z) const {
    return slots_[checkedIndex(x, z)].has_value();
}

Timestamp Region::newestTimestamp() const noexcept {
    bool any = false;
    Timestamp newest = std::numeric_limits<Timestamp>::min();
    for (const auto& record : slots_) {
        if (record) {
            newest = std::max(newest, record->timestamp);
            any = true;
        }
    }
    return any ? newest : 0;
}

std::uint64_t Region::totalChunkBytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& record : slots_) {
        if (record) {
            total += record->data.size();
        }
    }
    return total;
}

std::string Region::occupancyMap() const {
    std::string map;
    map.reserve(kSlotCount * 4 + kRegionWidth);
    for (std::uint32_t z = 0; z < kRegionWidth; ++z) {
        for (std::uint32_t x = 0; x < kRegionWidth; ++x) {
            map += slots_[slotIndex(x, z)] ? "■" : "□";
        }
        map += '\n';
    }
    return map;
}

}  // namespace lrf::format
