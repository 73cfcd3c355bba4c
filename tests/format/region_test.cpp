// =============================================================================
// lrf - Region Container Tests
// =============================================================================

#include "lrf/format/region.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "lrf/common/error.h"
#include "test_support.h"

namespace lrf::format {
namespace {

TEST(RegionTest, NewRegionIsEmpty) {
    const Region region(RegionCoord{2, -3});
    EXPECT_TRUE(region.empty());
    EXPECT_EQ(region.chunkCount(), 0u);
    EXPECT_EQ(region.newestTimestamp(), 0);
    EXPECT_EQ(region.totalChunkBytes(), 0u);
    EXPECT_FALSE(region.get(0, 0).has_value());
    ASSERT_TRUE(region.coord().has_value());
    EXPECT_EQ(*region.coord(), (RegionCoord{2, -3}));
}

TEST(RegionTest, SetAndGet) {
    Region region;
    const std::vector<std::uint8_t> data{1, 2, 3};
    region.set(3, 7, data, 1700000000);

    auto chunk = region.get(3, 7);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(std::ranges::equal(chunk->data, data));
    EXPECT_EQ(chunk->timestamp, 1700000000);
    EXPECT_TRUE(region.has(3, 7));
    EXPECT_FALSE(region.has(7, 3));
    EXPECT_EQ(region.chunkCount(), 1u);
}

TEST(RegionTest, SetReplacesWithoutChangingCount) {
    Region region;
    region.set(0, 0, std::vector<std::uint8_t>{1}, 10);
    region.set(0, 0, ChunkRecord{{4, 5}, 20});

    EXPECT_EQ(region.chunkCount(), 1u);
    EXPECT_EQ(region.get(0, 0)->toOwned(), (ChunkRecord{{4, 5}, 20}));
}

TEST(RegionTest, SetAcceptsBracedBytes) {
    Region region;
    region.set(0, 0, {1, 2, 3}, 5);
    region.set(1, 0, {{9}, 6});

    EXPECT_EQ(region.get(0, 0)->toOwned(), (ChunkRecord{{1, 2, 3}, 5}));
    EXPECT_EQ(region.get(1, 0)->toOwned(), (ChunkRecord{{9}, 6}));
}

TEST(RegionTest, ClearRemovesSlot) {
    Region region = test::regionWithSlots({0, 1});
    EXPECT_TRUE(region.clear(0, 0));
    EXPECT_FALSE(region.clear(0, 0));
    EXPECT_EQ(region.chunkCount(), 1u);
    EXPECT_FALSE(region.has(0, 0));
}

TEST(RegionTest, OutOfGridCoordinatesAreRejected) {
    Region region;
    try {
        (void)region.get(32, 0);
        FAIL() << "expected LRFException";
    } catch (const LRFException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInvalidArgument);
    }
    EXPECT_THROW(region.set(0, 32, std::vector<std::uint8_t>{1}, 0), LRFException);
    EXPECT_THROW((void)region.clear(40, 40), LRFException);
}

TEST(RegionTest, EmptyPayloadIsRejected) {
    Region region;
    EXPECT_THROW(region.set(1, 1, std::vector<std::uint8_t>{}, 5), LRFException);
    EXPECT_FALSE(region.has(1, 1));
}

TEST(RegionTest, NewestTimestampTracksPresentSlots) {
    Region region;
    region.set(0, 0, std::vector<std::uint8_t>{1}, -50);
    EXPECT_EQ(region.newestTimestamp(), -50);
    region.set(1, 0, std::vector<std::uint8_t>{1}, 900);
    region.set(2, 0, std::vector<std::uint8_t>{1}, 300);
    EXPECT_EQ(region.newestTimestamp(), 900);
    region.clear(1, 0);
    EXPECT_EQ(region.newestTimestamp(), 300);
}

TEST(RegionTest, IterationIsRowMajorAndComplete) {
    const Region region = test::regionWithSlots({1, 40});

    std::vector<SlotIndex> visited;
    std::vector<SlotIndex> present;
    for (const auto& entry : region) {
        visited.push_back(entry.index());
        if (entry.chunk) {
            present.push_back(entry.index());
        }
    }

    ASSERT_EQ(visited.size(), kSlotCount);
    EXPECT_TRUE(std::ranges::is_sorted(visited));
    EXPECT_EQ(present, (std::vector<SlotIndex>{1, 40}));

    // Restartable
    EXPECT_EQ(std::distance(region.begin(), region.end()), static_cast<std::ptrdiff_t>(kSlotCount));
    const auto first = *region.begin();
    EXPECT_EQ(first.x, 0u);
    EXPECT_EQ(first.z, 0u);
}

TEST(RegionTest, EqualityIgnoresCoordinate) {
    Region a = test::regionWithSlots({3, 9});
    Region b = test::regionWithSlots({3, 9});
    b.setCoord(RegionCoord{1, 1});
    EXPECT_EQ(a, b);

    b.set(0, 0, std::vector<std::uint8_t>{1}, 0);
    EXPECT_NE(a, b);
}

TEST(RegionTest, OccupancyMap) {
    Region region;
    region.set(0, 0, std::vector<std::uint8_t>{1}, 0);
    region.set(31, 31, std::vector<std::uint8_t>{1}, 0);

    const auto map = region.occupancyMap();
    EXPECT_EQ(std::ranges::count(map, '\n'), 32);
    EXPECT_EQ(map.rfind("■", 0), 0u);
}

}  // namespace
}  // namespace lrf::format
