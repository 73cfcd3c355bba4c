// =============================================================================
// lrf - Byte Buffer Tests
// =============================================================================

#include "lrf/io/byte_buffer.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace lrf::io {
namespace {

TEST(ByteWriterTest, WritesBigEndian) {
    ByteWriter out;
    out.writeBE<std::uint16_t>(0x0102);
    out.writeBE<std::uint32_t>(0x03040506);
    out.writeBE<std::int8_t>(-1);

    const std::vector<std::uint8_t> expected{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0xFF};
    EXPECT_EQ(out.release(), expected);
}

TEST(ByteReaderTest, ReadsWhatWasWritten) {
    ByteWriter out;
    out.writeBE<std::uint64_t>(0xC3FF13183CCA9D9AULL);
    out.writeBE<std::int64_t>(-5);
    out.writeBE<std::int32_t>(-123456);

    ByteReader in(out.bytes());
    EXPECT_EQ(in.readBE<std::uint64_t>(), 0xC3FF13183CCA9D9AULL);
    EXPECT_EQ(in.readBE<std::int64_t>(), -5);
    EXPECT_EQ(in.readBE<std::int32_t>(), -123456);
    EXPECT_EQ(in.remaining(), 0u);
}

TEST(ByteReaderTest, OverrunIsTruncation) {
    const std::vector<std::uint8_t> bytes{0x00, 0x01, 0x02};
    ByteReader in(bytes);
    (void)in.readBE<std::uint16_t>();

    try {
        (void)in.readBE<std::uint32_t>();
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::kTruncated);
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->byteOffset, 2u);
    }
    EXPECT_EQ(in.position(), 2u);
}

TEST(ByteReaderTest, ReadBytesBorrows) {
    const std::vector<std::uint8_t> bytes{1, 2, 3, 4, 5};
    ByteReader in(bytes);
    (void)in.readBE<std::uint8_t>();
    auto view = in.readBytes(3);
    ASSERT_EQ(view.size(), 3u);
    EXPECT_EQ(view.data(), bytes.data() + 1);
    EXPECT_THROW((void)in.readBytes(2), FormatError);
}

}  // namespace
}  // namespace lrf::io
