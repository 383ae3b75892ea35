#include <msgdec/io/byte_reader.h>
#include <msgdec/io/byte_source.h>
#include <msgdec/wire/container_length.h>
#include <gtest/gtest.h>

#include <support/wire_bytes.h>

#include <cstdint>

using msgdec::core::DecodeResult;
using msgdec::core::ErrorKind;
using msgdec::io::ByteReader;
using msgdec::io::MemorySource;
using msgdec::test::WireBytes;
using msgdec::wire::ContainerType;

namespace {

DecodeResult length_of(const WireBytes& body, uint8_t tag, ContainerType type,
                       std::size_t& length) {
    MemorySource source(body.data());
    ByteReader reader(source);
    return msgdec::wire::read_container_length(reader, tag, type, length);
}

}  // namespace

// ------------------------------------------------------------------
// 1. Inline counts
// ------------------------------------------------------------------

TEST(ContainerLengthTest, InlineRawUsesLowFiveBits) {
    std::size_t length = 99;
    ASSERT_TRUE(length_of({}, 0xa0, ContainerType::RawBytes, length).ok);
    EXPECT_EQ(length, 0u);
    ASSERT_TRUE(length_of({}, 0xbf, ContainerType::RawBytes, length).ok);
    EXPECT_EQ(length, 31u);
}

TEST(ContainerLengthTest, InlineSequenceAndMapUseLowFourBits) {
    std::size_t length = 0;
    ASSERT_TRUE(length_of({}, 0x93, ContainerType::Sequence, length).ok);
    EXPECT_EQ(length, 3u);
    ASSERT_TRUE(length_of({}, 0x8f, ContainerType::Map, length).ok);
    EXPECT_EQ(length, 15u);
}

// ------------------------------------------------------------------
// 2. 16-bit and 32-bit counts
// ------------------------------------------------------------------

TEST(ContainerLengthTest, SixteenBitCounts) {
    std::size_t length = 0;
    ASSERT_TRUE(length_of(WireBytes().be16(0x1234), 0xda, ContainerType::RawBytes, length).ok);
    EXPECT_EQ(length, 0x1234u);
    ASSERT_TRUE(length_of(WireBytes().be16(0xffff), 0xdc, ContainerType::Sequence, length).ok);
    EXPECT_EQ(length, 0xffffu);
    ASSERT_TRUE(length_of(WireBytes().be16(2), 0xde, ContainerType::Map, length).ok);
    EXPECT_EQ(length, 2u);
}

TEST(ContainerLengthTest, ThirtyTwoBitCounts) {
    std::size_t length = 0;
    ASSERT_TRUE(length_of(WireBytes().be32(0x00010000), 0xdb, ContainerType::RawBytes, length).ok);
    EXPECT_EQ(length, 0x10000u);
    ASSERT_TRUE(length_of(WireBytes().be32(0xffffffff), 0xdd, ContainerType::Sequence, length).ok);
    EXPECT_EQ(length, 0xffffffffu);
    ASSERT_TRUE(length_of(WireBytes().be32(7), 0xdf, ContainerType::Map, length).ok);
    EXPECT_EQ(length, 7u);
}

TEST(ContainerLengthTest, SameLengthInEveryEncoding) {
    std::size_t a = 0, b = 0, c = 0;
    ASSERT_TRUE(length_of({}, 0x95, ContainerType::Sequence, a).ok);
    ASSERT_TRUE(length_of(WireBytes().be16(5), 0xdc, ContainerType::Sequence, b).ok);
    ASSERT_TRUE(length_of(WireBytes().be32(5), 0xdd, ContainerType::Sequence, c).ok);
    EXPECT_EQ(a, 5u);
    EXPECT_EQ(b, 5u);
    EXPECT_EQ(c, 5u);
}

// ------------------------------------------------------------------
// 3. Faults
// ------------------------------------------------------------------

TEST(ContainerLengthTest, UnrecognizedDescriptorIsFormatFault) {
    std::size_t length = 0;
    DecodeResult r = length_of({}, 0x05, ContainerType::Map, length);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Format);
    EXPECT_NE(r.message.find("unrecognized descriptor"), std::string::npos);
    EXPECT_NE(r.message.find("0x05"), std::string::npos);
}

TEST(ContainerLengthTest, OtherCategoryTag16IsNotAccepted) {
    std::size_t length = 0;
    // 0xdc & 0x80 == 0x80, so the inline rule applies to a map descriptor
    // and yields 0x5c; the sequence tag16 is never read as a map count.
    ASSERT_TRUE(length_of(WireBytes().be16(1), 0xdc, ContainerType::Map, length).ok);
    EXPECT_EQ(length, 0x5cu);
    EXPECT_FALSE(length_of({}, 0x12, ContainerType::Sequence, length).ok);
}

TEST(ContainerLengthTest, TruncatedCountIsReadFault) {
    std::size_t length = 0;
    DecodeResult r = length_of({0x01}, 0xdd, ContainerType::Sequence, length);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Read);
}
