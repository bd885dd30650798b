#include "bit_writer.hpp"

#include "gnss_rtk_bridge/bit_cursor.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace gnss_rtk_bridge;

TEST(BitCursor, ReadsUnalignedFields) {
    const uint8_t data[] = {0xD3, 0x00, 0x13, 0x3E, 0xD0};
    BitCursor bits(data, sizeof(data));
    EXPECT_EQ(bits.readUnsigned(8), 0xD3u);
    EXPECT_EQ(bits.readUnsigned(6), 0u);
    EXPECT_EQ(bits.readUnsigned(10), 0x13u);
    EXPECT_EQ(bits.readUnsigned(12), 0x3EDu);
    EXPECT_EQ(bits.position(), 36u);
    EXPECT_EQ(bits.remaining(), 4u);
}

TEST(BitCursor, SignedFields) {
    test::BitWriter w;
    w.putSigned(-1, 5).putSigned(-16, 5).putSigned(15, 5).putSigned(-123456789012LL, 38);
    BitCursor bits(w.bytes().data(), w.bytes().size());
    EXPECT_EQ(bits.readSigned(5), -1);
    EXPECT_EQ(bits.readSigned(5), -16);
    EXPECT_EQ(bits.readSigned(5), 15);
    EXPECT_EQ(bits.readSigned(38), -123456789012LL);
}

TEST(BitCursor, SignMagnitudeFields) {
    test::BitWriter w;
    w.put(0b10101, 5).put(0b00101, 5).put(0b10000, 5);
    BitCursor bits(w.bytes().data(), w.bytes().size());
    EXPECT_EQ(bits.readSignMagnitude(5), -5);
    EXPECT_EQ(bits.readSignMagnitude(5), 5);
    EXPECT_EQ(bits.readSignMagnitude(5), 0);
}

TEST(BitCursor, FullWidthField) {
    test::BitWriter w;
    w.put(0x8000000000000001ULL, 64);
    BitCursor bits(w.bytes().data(), w.bytes().size());
    EXPECT_EQ(bits.readUnsigned(64), 0x8000000000000001ULL);
    EXPECT_THROW(bits.readUnsigned(65), std::invalid_argument);
}

TEST(BitCursor, ScaledFields) {
    test::BitWriter w;
    w.putSigned(-12345, 20).put(4000, 16);
    BitCursor bits(w.bytes().data(), w.bytes().size());
    EXPECT_DOUBLE_EQ(bits.readScaled(20, 0.5), -6172.5);
    EXPECT_DOUBLE_EQ(bits.readScaledUnsigned(16, 1e-4), 0.4);
}

TEST(BitCursor, OverrunThrowsAndKeepsPosition) {
    const uint8_t data[] = {0xFF, 0x0F};
    BitCursor bits(data, sizeof(data));
    bits.skip(10);
    EXPECT_THROW(bits.readUnsigned(7), FieldBoundsError);
    EXPECT_EQ(bits.position(), 10u);
    EXPECT_EQ(bits.readUnsigned(6), 0x0Fu);
    EXPECT_THROW(bits.readBool(), FieldBoundsError);
    EXPECT_THROW(bits.skip(1), FieldBoundsError);
}

TEST(BitCursor, Strings) {
    test::BitWriter w;
    w.put(1, 4).putString("ADVNULLANTENNA").putString("");
    BitCursor bits(w.bytes().data(), w.bytes().size());
    bits.skip(4);
    EXPECT_EQ(bits.readString(), "ADVNULLANTENNA");
    EXPECT_EQ(bits.readString(), "");
}

TEST(BitCursor, TruncatedStringThrows) {
    test::BitWriter w;
    w.put(10, 8).put('A', 8).put('B', 8);
    BitCursor bits(w.bytes().data(), w.bytes().size());
    EXPECT_THROW(bits.readString(), FieldBoundsError);
    EXPECT_EQ(bits.position(), 0u);
}
