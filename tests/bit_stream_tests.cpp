#include "compression/huffman/bit_stream.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

using huffpack::compression::huffman::BitInputStream;
using huffpack::compression::huffman::BitOutputStream;

TEST(BitOutputStreamTest, PacksMostSignificantBitFirstAndPads)
{
    BitOutputStream writer;
    writer.writeBits(3, 0b101U);
    writer.close();

    EXPECT_EQ(writer.bytes(), std::vector<std::uint8_t>({0xA0}));
    EXPECT_EQ(writer.bitsWritten(), 3U);
    EXPECT_TRUE(writer.closed());
}

TEST(BitOutputStreamTest, CloseIsIdempotentAndBlocksWrites)
{
    BitOutputStream writer;
    writer.writeCode({true, false, true, true, false, false, true, false, true});
    writer.close();
    writer.close();

    EXPECT_EQ(writer.bytes(), std::vector<std::uint8_t>({0xB2, 0x80}));
    EXPECT_THROW(writer.writeBit(true), std::logic_error);
}

TEST(BitInputStreamTest, ReadsFullWidthValues)
{
    BitOutputStream writer;
    writer.writeBits(32, 0xface8201U);
    writer.writeBits(9, 256U);
    writer.close();

    BitInputStream reader(writer.bytes());
    std::uint32_t value = 0;
    ASSERT_TRUE(reader.readBits(32, value));
    EXPECT_EQ(value, 0xface8201U);
    ASSERT_TRUE(reader.readBits(9, value));
    EXPECT_EQ(value, 256U);
}

TEST(BitInputStreamTest, ReportsExhaustionWithoutConsuming)
{
    BitInputStream reader(std::vector<std::uint8_t> {0xFF});
    std::uint32_t value = 0;

    EXPECT_FALSE(reader.readBits(9, value));
    EXPECT_EQ(reader.remainingBits(), 8U);
    EXPECT_EQ(reader.bitsRead(), 0U);

    ASSERT_TRUE(reader.readBits(8, value));
    EXPECT_EQ(value, 0xFFU);

    bool bit = false;
    EXPECT_FALSE(reader.readBit(bit));
    EXPECT_FALSE(reader.readBits(8, value));
}

TEST(BitInputStreamTest, ResetRewindsButKeepsCounting)
{
    BitInputStream reader(std::vector<std::uint8_t> {0x12, 0x34});
    std::uint32_t value = 0;

    ASSERT_TRUE(reader.readBits(16, value));
    EXPECT_EQ(value, 0x1234U);

    reader.reset();
    ASSERT_TRUE(reader.readBits(8, value));
    EXPECT_EQ(value, 0x12U);
    EXPECT_EQ(reader.bitsRead(), 24U);
    EXPECT_EQ(reader.remainingBits(), 8U);
}

TEST(BitInputStreamTest, RejectsOversizedReads)
{
    BitInputStream reader(std::vector<std::uint8_t>(8, 0));
    std::uint32_t value = 0;
    EXPECT_THROW(reader.readBits(33, value), std::invalid_argument);
}

} // namespace
