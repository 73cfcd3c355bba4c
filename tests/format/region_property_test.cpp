// =============================================================================
// lrf - Region Round-Trip Property Tests
// =============================================================================
// Property-based tests for the reader/writer pair:
// - Any region survives a write/read cycle at any level and version
// - Absent slots stay absent
// - Reading is deterministic and independent of the compression level
// - Any single-bit change to a checksummed byte is detected
// - A damaged payload byte never yields altered chunks for other slots in
//   lenient mode, and with slot checksums costs only the slot that owns it
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <tuple>
#include <vector>

#include "lrf/common/error.h"
#include "lrf/format/region_reader.h"
#include "lrf/format/region_writer.h"
#include "test_support.h"

namespace lrf::format {
namespace {

// =============================================================================
// Generators
// =============================================================================

using SlotSpec = std::tuple<SlotIndex, std::vector<std::uint8_t>, Timestamp>;

/// @brief Sparse region with up to 64 chunks of up to 512 bytes.
rc::Gen<Region> genRegion(Timestamp minTimestamp, Timestamp maxTimestamp) {
    auto genSlot = rc::gen::tuple(
        rc::gen::inRange<SlotIndex>(0, kSlotCount),
        rc::gen::resize(512, rc::gen::nonEmpty<std::vector<std::uint8_t>>()),
        rc::gen::inRange<Timestamp>(minTimestamp, maxTimestamp));

    auto genSpecs = rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, 65), [genSlot](std::size_t n) {
        return rc::gen::container<std::vector<SlotSpec>>(n, genSlot);
    });

    return rc::gen::map(genSpecs, [](const std::vector<SlotSpec>& specs) {
        Region region;
        for (const auto& [slot, data, timestamp] : specs) {
            region.set(slotX(slot), slotZ(slot), data, timestamp);
        }
        return region;
    });
}

rc::Gen<FormatVersion> genVersion() {
    return rc::gen::element(FormatVersion::kV1, FormatVersion::kV2, FormatVersion::kV3);
}

Timestamp maxTimestampFor(FormatVersion version) {
    return version == FormatVersion::kV3 ? Timestamp{1} << 40 : LegacyIndexLayout::kMaxTimestamp;
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(RegionRoundTripProperty, WriteThenReadRestoresRegion, ()) {
    const auto version = *genVersion();
    const auto level = *rc::gen::inRange(kMinCompressionLevel, kMaxCompressionLevel + 1);
    const auto region = *genRegion(-1000, maxTimestampFor(version));

    const RegionWriter writer(WriteOptions{.compressionLevel = level, .version = version});
    const auto result = RegionReader().read(writer.serialize(region));

    RC_ASSERT(result.region == region);
    RC_ASSERT(result.report.isClean());
    RC_ASSERT(result.report.header.chunkCount == region.chunkCount());
    RC_ASSERT(result.report.header.newestTimestamp == region.newestTimestamp());

    for (const auto& entry : result.region) {
        RC_ASSERT(entry.chunk.has_value() == region.has(entry.x, entry.z));
    }
}

RC_GTEST_PROP(RegionRoundTripProperty, ReadingIsDeterministic, ()) {
    const auto region = *genRegion(0, 1 << 20);
    const auto bytes = saveRegion(region);

    const RegionReader reader;
    RC_ASSERT(reader.read(bytes).region == reader.read(bytes).region);
}

RC_GTEST_PROP(RegionRoundTripProperty, LevelDoesNotChangeDecodedRegion, ()) {
    const auto region = *genRegion(0, 1 << 20);
    const auto fast = *rc::gen::inRange(kMinCompressionLevel, kMaxCompressionLevel + 1);
    const auto slow = *rc::gen::inRange(kMinCompressionLevel, kMaxCompressionLevel + 1);

    RC_ASSERT(openRegion(saveRegion(region, fast)) == openRegion(saveRegion(region, slow)));
}

RC_GTEST_PROP(RegionRoundTripProperty, ChecksummedHeaderBitFlipIsDetected, ()) {
    const auto region = *genRegion(0, 1 << 20);
    auto bytes = saveRegion(region);

    // Bytes 9..17 (timestamp, level) and 24..31 (checksum) decode without a
    // structural error, so only the checksum can catch the change.
    const auto offset = *rc::gen::elementOf(std::vector<std::size_t>{9, 12, 16, 17, 24, 28, 31});
    const auto bit = *rc::gen::inRange(0, 8);
    bytes[offset] ^= static_cast<std::uint8_t>(1u << bit);

    RC_ASSERT_THROWS_AS((void)RegionReader().read(bytes), IntegrityError);
}

/// @brief Slot whose index entry or chunk bytes contain the payload byte at target.
SlotIndex owningSlot(const Region& region, const IndexLayout& layout, std::uint64_t target) {
    const std::size_t indexSize = indexTableSize(layout);
    if (target < indexSize) {
        return static_cast<SlotIndex>(target / entrySize(layout));
    }
    // Chunks are stored densely in slot order.
    std::uint64_t offset = indexSize;
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        if (const auto& record = region.slot(slot)) {
            if (target < offset + record->data.size()) {
                return slot;
            }
            offset += record->data.size();
        }
    }
    return kSlotCount;
}

RC_GTEST_PROP(RegionRoundTripProperty, PayloadByteFlipOnlyCostsAffectedSlot, ()) {
    const auto version = *genVersion();
    const auto region = *genRegion(0, 1 << 20);
    const auto bytes = RegionWriter(WriteOptions{.version = version}).serialize(region);

    const IndexLayout layout = indexLayoutFor(version);
    const std::uint64_t payloadSize = indexTableSize(layout) + region.totalChunkBytes();
    const auto target = *rc::gen::inRange<std::uint64_t>(0, payloadSize);
    const auto mask = *rc::gen::inRange<int>(1, 256);
    const auto damaged = test::editPayload(
        bytes,
        [&](std::vector<std::uint8_t>& payload) {
            payload[target] ^= static_cast<std::uint8_t>(mask);
        },
        false);

    RC_ASSERT_THROWS_AS((void)RegionReader().read(damaged), IntegrityError);

    const SlotIndex hit = owningSlot(region, layout, target);
    RC_ASSERT(hit < kSlotCount);

    const auto result = RegionReader(ReadOptions{.mode = ReadMode::kLenient}).read(damaged);
    RC_ASSERT(result.report.checksum == ChecksumStatus::kMismatch);

    // Whatever survives is byte-identical to what was written.
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        const auto& decoded = result.region.slot(slot);
        if (slot == hit || !decoded) {
            continue;
        }
        RC_ASSERT(region.slot(slot).has_value());
        RC_ASSERT(*decoded == *region.slot(slot));
    }

    if (version != FormatVersion::kV3) {
        return;
    }

    // Slot checksums confine the damage: other slots are only lost when the
    // damaged entry now overlaps them.
    for (const auto& dropped : result.report.dropped) {
        RC_ASSERT(dropped.slot == hit || dropped.reason == DropReason::kOverlap);
    }
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        if (slot == hit || !region.slot(slot)) {
            continue;
        }
        const bool dropped = std::ranges::any_of(
            result.report.dropped, [&](const DroppedSlot& d) { return d.slot == slot; });
        RC_ASSERT(dropped || result.region.has(slotX(slot), slotZ(slot)));
    }
}

// =============================================================================
// Scenarios
// =============================================================================

TEST(RegionScenarioTest, SingleChunkAtOrigin) {
    Region region(RegionCoord{0, 0});
    region.set(0, 0, std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, 1000);

    test::TempDir dir;
    const auto path = RegionWriter().writeToDirectory(region, dir.path());
    EXPECT_EQ(path.filename().string(), "r.0.0.linear");

    const auto restored = openRegion(path);
    const auto chunk = restored.get(0, 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->toOwned(), (ChunkRecord{{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, 1000}));
    EXPECT_FALSE(restored.get(1, 0).has_value());
    EXPECT_EQ(restored.chunkCount(), 1u);
}

TEST(RegionScenarioTest, FirstRowOfTenChunks) {
    Region region;
    for (std::uint32_t x = 1; x <= 10; ++x) {
        region.set(x, 0, test::patternBytes(100 * x, x), 1000);
    }

    const auto result = RegionReader().read(saveRegion(region));
    EXPECT_EQ(result.region, region);
    EXPECT_EQ(result.report.header.chunkCount, 10u);
    EXPECT_EQ(result.report.header.newestTimestamp, 1000);
    EXPECT_FALSE(result.region.has(0, 0));
    EXPECT_FALSE(result.region.has(11, 0));
}

TEST(RegionScenarioTest, FullRegion) {
    Region region;
    for (SlotIndex slot = 0; slot < kSlotCount; ++slot) {
        region.set(slotX(slot), slotZ(slot), std::vector<std::uint8_t>{static_cast<std::uint8_t>(slot)},
                   slot);
    }

    for (auto version : {FormatVersion::kV1, FormatVersion::kV3}) {
        const auto bytes = RegionWriter(WriteOptions{.version = version}).serialize(region);
        const auto result = RegionReader().read(bytes);
        EXPECT_EQ(result.region.chunkCount(), kSlotCount);
        EXPECT_EQ(result.report.header.chunkCount, kSlotCount);
        EXPECT_EQ(result.report.header.newestTimestamp, 1023);
        EXPECT_EQ(result.region, region);
    }
}

TEST(RegionScenarioTest, RewriteAfterEdit) {
    test::TempDir dir;
    const auto path = dir.file("r.2.2.linear");
    saveRegion(test::regionWithSlots({0, 1, 2}), path);

    auto region = openRegion(path);
    region.clear(1, 0);
    region.set(5, 5, std::vector<std::uint8_t>{42}, 99999);
    saveRegion(region, path);

    const auto restored = openRegion(path);
    EXPECT_EQ(restored, region);
    EXPECT_EQ(restored.chunkCount(), 3u);
    EXPECT_EQ(restored.get(5, 5)->timestamp, 99999);
}

}  // namespace
}  // namespace lrf::format
