#include <gtest/gtest.h>
#include <string>
#include "../../Src/HuffmanCodec/BitStream.hpp"

using namespace huffcpp::algorithms;

static boost::dynamic_bitset<> bitsFromString(const std::string& text)
{
    boost::dynamic_bitset<> bits;
    for (char c : text)
    {
        bits.push_back(c == '1');
    }
    return bits;
}

TEST(BitStreamTest, BitWriter_PacksMostSignificantBitFirst)
{
    BitWriter writer;
    writer.writeBits(bitsFromString("0000101010111111110"));

    EXPECT_EQ(writer.validBitCount(), 19);
    std::vector<uint8_t> packed = writer.finish();
    std::vector<uint8_t> expected = {0x0A, 0xBF, 0xC0};
    EXPECT_EQ(packed, expected);
}

TEST(BitStreamTest, BitWriter_FullBytes_AddNoPadding)
{
    BitWriter writer;
    writer.writeBits(bitsFromString("1000000100000001"));
    std::vector<uint8_t> packed = writer.finish();
    std::vector<uint8_t> expected = {0x81, 0x01};
    EXPECT_EQ(packed, expected);
}

TEST(BitStreamTest, BitWriter_Finish_ResetsWriter)
{
    BitWriter writer;
    writer.writeBit(true);
    EXPECT_EQ(writer.finish().size(), 1);
    EXPECT_EQ(writer.validBitCount(), 0);
    EXPECT_TRUE(writer.finish().empty());
}

TEST(BitStreamTest, BitReader_ReadsBackWrittenBits)
{
    const std::string pattern = "1101001110001011011";
    BitWriter writer;
    writer.writeBits(bitsFromString(pattern));
    uint64_t validBits = writer.validBitCount();
    std::vector<uint8_t> packed = writer.finish();

    BitReader reader(packed, validBits);
    ASSERT_TRUE(reader.isConsistent());

    std::string read;
    while (reader.hasMore())
    {
        read.push_back(reader.readBit() ? '1' : '0');
    }
    EXPECT_EQ(read, pattern);
    EXPECT_EQ(reader.bitsRead(), pattern.size());
    EXPECT_EQ(reader.remaining(), 0);
    EXPECT_FALSE(reader.hasNonZeroPadding());
}

TEST(BitStreamTest, BitReader_TooManyValidBits_IsInconsistent)
{
    std::vector<uint8_t> packed = {0xFF};
    EXPECT_TRUE(BitReader(packed, 8).isConsistent());
    EXPECT_FALSE(BitReader(packed, 9).isConsistent());
}

TEST(BitStreamTest, BitReader_DetectsNonZeroPadding)
{
    std::vector<uint8_t> clean = {0xC0};
    std::vector<uint8_t> dirty = {0xC1};
    EXPECT_FALSE(BitReader(clean, 3).hasNonZeroPadding());
    EXPECT_TRUE(BitReader(dirty, 3).hasNonZeroPadding());
}

TEST(BitStreamTest, BytesForBits_RoundsUp)
{
    EXPECT_EQ(bytesForBits(0), 0);
    EXPECT_EQ(bytesForBits(1), 1);
    EXPECT_EQ(bytesForBits(8), 1);
    EXPECT_EQ(bytesForBits(9), 2);
    EXPECT_EQ(bytesForBits(19), 3);
}
