// =============================================================================
// lrf - Region Writer Tests
// =============================================================================

#include "lrf/format/region_writer.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <vector>

#include "lrf/common/error.h"
#include "lrf/format/checksum.h"
#include "lrf/format/index_codec.h"
#include "lrf/format/region_reader.h"
#include "test_support.h"

namespace lrf::format {
namespace {

TEST(RegionWriterTest, HeaderDescribesRegion) {
    const auto region = test::regionWithSlots({3, 100, 500}, 80);
    const auto bytes = RegionWriter(WriteOptions{.compressionLevel = 9}).serialize(region);
    const auto parts = test::splitFile(bytes);

    EXPECT_EQ(parts.header.version, FormatVersion::kV3);
    EXPECT_EQ(parts.header.compressionLevel, 9);
    EXPECT_EQ(parts.header.chunkCount, 3u);
    EXPECT_EQ(parts.header.newestTimestamp, 1500);
    EXPECT_EQ(parts.header.expectedFileSize(), bytes.size());
    EXPECT_TRUE(isValidFooter(std::span<const std::uint8_t>(bytes).last(kFooterSize)));
}

TEST(RegionWriterTest, ChunksAreLaidOutDenselyInSlotOrder) {
    Region region;
    region.set(slotX(900), slotZ(900), std::vector<std::uint8_t>(10, 0xAA), 1);
    region.set(slotX(2), slotZ(2), std::vector<std::uint8_t>(20, 0xBB), 2);

    const auto parts = test::splitFile(saveRegion(region));
    const auto entries = decodeIndex(parts.payload, ExtendedIndexLayout{});

    EXPECT_EQ(entries[2].offset, 0u);
    EXPECT_EQ(entries[2].length, 20u);
    EXPECT_EQ(entries[900].offset, 20u);
    EXPECT_EQ(entries[900].length, 10u);
    EXPECT_EQ(parts.payload.size(), indexTableSize(ExtendedIndexLayout{}) + 30);

    const auto chunk = std::span<const std::uint8_t>(parts.payload)
                           .subspan(indexTableSize(ExtendedIndexLayout{}) + 20, 10);
    EXPECT_EQ(entries[900].checksum, calculateSlotChecksum(chunk, 1));
}

TEST(RegionWriterTest, FileChecksumCoversHeaderPrefixAndPayload) {
    const auto bytes = saveRegion(test::regionWithSlots({1, 2}));
    const auto parts = test::splitFile(bytes);

    auto header = parts.header;
    header.checksum = 0;
    const auto expected =
        calculateFileChecksum(headerChecksumPrefix(encodeHeader(header)), parts.payload);
    EXPECT_EQ(parts.header.checksum, expected);
}

TEST(RegionWriterTest, LegacyVersionsWriteImplicitOffsets) {
    for (auto version : {FormatVersion::kV1, FormatVersion::kV2}) {
        const auto region = test::regionWithSlots({0, 31, 32});
        const auto bytes = RegionWriter(WriteOptions{.version = version}).serialize(region);
        const auto parts = test::splitFile(bytes);

        EXPECT_EQ(parts.header.version, version);
        EXPECT_EQ(parts.payload.size(), indexTableSize(LegacyIndexLayout{}) + 3 * 64);
        EXPECT_NE(parts.header.checksum, 0u);
        EXPECT_EQ(openRegion(bytes), region);
    }
}

TEST(RegionWriterTest, LegacyVersionsRejectWideTimestamps) {
    Region region;
    region.set(0, 0, std::vector<std::uint8_t>{1}, std::int64_t{1} << 40);

    const RegionWriter legacy(WriteOptions{.version = FormatVersion::kV2});
    try {
        (void)legacy.serialize(region);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::kValueOutOfRange);
    }

    EXPECT_NO_THROW((void)RegionWriter().serialize(region));
}

TEST(RegionWriterTest, RejectsInvalidLevel) {
    EXPECT_THROW(RegionWriter(WriteOptions{.compressionLevel = 0}), LRFException);
    EXPECT_THROW(RegionWriter(WriteOptions{.compressionLevel = 23}), LRFException);
    EXPECT_THROW((void)saveRegion(Region{}, -1), LRFException);
}

TEST(RegionWriterTest, WriteFileLeavesNoTemporary) {
    test::TempDir dir;
    const auto path = dir.file("r.0.0.linear");
    const auto region = test::regionWithSlots({10, 20});

    saveRegion(region, path, WriteOptions{.syncToDisk = false});

    EXPECT_EQ(openRegion(path), region);
    EXPECT_FALSE(std::filesystem::exists(dir.file("r.0.0.linear.wip")));
}

TEST(RegionWriterTest, WriteFileReplacesExisting) {
    test::TempDir dir;
    const auto path = dir.file("r.0.0.linear");
    saveRegion(test::regionWithSlots({1}), path);
    saveRegion(test::regionWithSlots({2, 3}), path);

    EXPECT_EQ(openRegion(path), test::regionWithSlots({2, 3}));
}

TEST(RegionWriterTest, FailedWriteKeepsPreviousFile) {
    test::TempDir dir;
    const auto path = dir.file("r.0.0.linear");
    const auto original = test::regionWithSlots({1});
    saveRegion(original, path);

    Region tooWide;
    tooWide.set(0, 0, std::vector<std::uint8_t>{1}, std::int64_t{1} << 40);
    EXPECT_THROW(saveRegion(tooWide, path, WriteOptions{.version = FormatVersion::kV1}),
                 FormatError);

    EXPECT_EQ(openRegion(path), original);
    EXPECT_FALSE(std::filesystem::exists(dir.file("r.0.0.linear.wip")));
}

TEST(RegionWriterTest, WriteToDirectoryUsesCoordinate) {
    test::TempDir dir;
    Region region(RegionCoord{-1, 5});
    region.set(0, 0, std::vector<std::uint8_t>{1, 2}, 3);

    const auto path = RegionWriter().writeToDirectory(region, dir.path());
    EXPECT_EQ(path.string(), dir.file("r.-1.5.linear").string());

    const auto restored = RegionReader().readFile(path).region;
    EXPECT_EQ(restored, region);
    EXPECT_EQ(restored.coord(), region.coord());
}

TEST(RegionWriterTest, WriteToDirectoryNeedsCoordinate) {
    test::TempDir dir;
    try {
        (void)RegionWriter().writeToDirectory(Region{}, dir.path());
        FAIL() << "expected LRFException";
    } catch (const LRFException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInvalidArgument);
    }
}

}  // namespace
}  // namespace lrf::format
