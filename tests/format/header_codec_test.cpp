// =============================================================================
// lrf - Header Codec Tests
// =============================================================================

#include "lrf/format/header_codec.h"

#include <gtest/gtest.h>

#include <vector>

#include "lrf/common/error.h"

namespace lrf::format {
namespace {

RegionHeader sampleHeader() {
    RegionHeader header;
    header.version = FormatVersion::kV3;
    header.newestTimestamp = 1700000000;
    header.compressionLevel = 6;
    header.chunkCount = 12;
    header.compressedSize = 4096;
    header.checksum = 0x0123456789ABCDEFULL;
    return header;
}

FormatErrorKind kindOf(std::span<const std::uint8_t> bytes) {
    try {
        (void)decodeHeader(bytes);
    } catch (const FormatError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decodeHeader accepted invalid input";
    return FormatErrorKind::kInvalidHeader;
}

TEST(HeaderCodecTest, FieldLayoutIsBigEndian) {
    const auto bytes = encodeHeader(sampleHeader());

    // magic
    EXPECT_EQ(bytes[0], 0xC3);
    EXPECT_EQ(bytes[7], 0x9A);
    // version
    EXPECT_EQ(bytes[8], 3);
    // newest timestamp 1700000000 = 0x6553F100
    EXPECT_EQ(bytes[13], 0x65);
    EXPECT_EQ(bytes[16], 0x00);
    // level, chunk count, compressed size
    EXPECT_EQ(bytes[17], 6);
    EXPECT_EQ(bytes[18], 0);
    EXPECT_EQ(bytes[19], 12);
    EXPECT_EQ(bytes[22], 0x10);
    // checksum
    EXPECT_EQ(bytes[24], 0x01);
    EXPECT_EQ(bytes[31], 0xEF);
}

TEST(HeaderCodecTest, DecodeRestoresEncodedHeader) {
    for (auto version : {FormatVersion::kV1, FormatVersion::kV2, FormatVersion::kV3}) {
        auto header = sampleHeader();
        header.version = version;
        header.newestTimestamp = -42;
        header.compressionLevel = -3;
        EXPECT_EQ(decodeHeader(encodeHeader(header)), header);
    }
}

TEST(HeaderCodecTest, BadMagic) {
    auto bytes = encodeHeader(sampleHeader());
    bytes[0] ^= 0xFF;
    EXPECT_EQ(kindOf(bytes), FormatErrorKind::kBadMagic);
}

TEST(HeaderCodecTest, UnsupportedVersions) {
    for (std::uint8_t version : {0, 4, 255}) {
        auto bytes = encodeHeader(sampleHeader());
        bytes[8] = version;
        EXPECT_EQ(kindOf(bytes), FormatErrorKind::kUnsupportedVersion) << int(version);
    }
}

TEST(HeaderCodecTest, ShortInputIsTruncated) {
    const auto bytes = encodeHeader(sampleHeader());
    EXPECT_EQ(kindOf(std::span<const std::uint8_t>(bytes).first(31)), FormatErrorKind::kTruncated);
    EXPECT_EQ(kindOf({}), FormatErrorKind::kTruncated);
}

TEST(HeaderCodecTest, ChunkCountAboveGridIsInvalid) {
    auto header = sampleHeader();
    header.chunkCount = kSlotCount;
    EXPECT_NO_THROW((void)decodeHeader(encodeHeader(header)));

    header.chunkCount = kSlotCount + 1;
    EXPECT_EQ(kindOf(encodeHeader(header)), FormatErrorKind::kInvalidHeader);
}

TEST(HeaderCodecTest, ChecksumPrefixExcludesChecksumField) {
    const auto bytes = encodeHeader(sampleHeader());
    const auto prefix = headerChecksumPrefix(bytes);
    EXPECT_EQ(prefix.size(), 24u);
    EXPECT_EQ(prefix.data(), bytes.data());
}

TEST(HeaderCodecTest, Footer) {
    const auto footer = encodeFooter();
    EXPECT_TRUE(isValidFooter(footer));

    auto damaged = footer;
    damaged[3] ^= 0x01;
    EXPECT_FALSE(isValidFooter(damaged));
    EXPECT_FALSE(isValidFooter(std::span<const std::uint8_t>(footer).first(7)));
}

}  // namespace
}  // namespace lrf::format
