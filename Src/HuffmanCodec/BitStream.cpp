#include "BitStream.hpp"
#include <utility>

void huffcpp::algorithms::BitWriter::writeBits(const boost::dynamic_bitset<>& bits)
{
    for (size_t i = 0; i < bits.size(); ++i)
    {
        writeBit(bits[i]);
    }
}

std::vector<uint8_t> huffcpp::algorithms::BitWriter::finish()
{
    if (bitCount > 0)
    {
        output.push_back(static_cast<uint8_t>(bitBuffer << (8 - bitCount)));
        bitBuffer = 0;
        bitCount = 0;
    }
    std::vector<uint8_t> packed = std::move(output);
    output.clear();
    totalBits = 0;
    return packed;
}

bool huffcpp::algorithms::BitReader::hasNonZeroPadding() const
{
    uint8_t usedBits = static_cast<uint8_t>(validBits & 7);
    size_t usedBytes = bytesForBits(validBits);
    if (usedBits != 0 && usedBytes <= input.size())
    {
        uint8_t paddingMask = static_cast<uint8_t>(0xFF >> usedBits);
        if ((input[usedBytes - 1] & paddingMask) != 0) {
            return true;
        }
    }
    for (size_t i = usedBytes; i < input.size(); ++i)
    {
        if (input[i] != 0) {
            return true;
        }
    }
    return false;
}
