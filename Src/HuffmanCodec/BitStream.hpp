#pragma once
#ifndef HUFFCPP_BITSTREAM_HPP
#define HUFFCPP_BITSTREAM_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <boost/dynamic_bitset.hpp>

namespace huffcpp::algorithms
{
    /* Packs bits most-significant-bit first; the last byte is zero-padded on finish(). */
    class BitWriter
    {
      private:
        std::vector<uint8_t> output;
        uint8_t bitBuffer = 0;
        uint8_t bitCount = 0;       // bits held in bitBuffer (0..7)
        uint64_t totalBits = 0;

      public:
        BitWriter() = default;

        void reserveBytes(size_t bytes) { output.reserve(bytes); }

        void writeBit(bool bit)
        {
            bitBuffer = static_cast<uint8_t>((bitBuffer << 1) | (bit ? 1 : 0));
            ++bitCount;
            ++totalBits;
            if (bitCount == 8)
            {
                output.push_back(bitBuffer);
                bitBuffer = 0;
                bitCount = 0;
            }
        }

        void writeBits(const boost::dynamic_bitset<>& bits);

        uint64_t validBitCount() const { return totalBits; }

        // flushes the partial byte and hands the buffer over; the writer is empty afterwards
        std::vector<uint8_t> finish();
    };

    /* Reads bits most-significant-bit first and never past the valid bit count. */
    class BitReader
    {
      private:
        const std::vector<uint8_t>& input;
        uint64_t validBits;
        uint64_t position = 0;

      public:
        BitReader(const std::vector<uint8_t>& input, uint64_t validBits)
            : input(input)
            , validBits(validBits)
        {}

        // valid bits that fit into the buffer
        bool isConsistent() const
        {
            return validBits <= static_cast<uint64_t>(input.size()) * 8;
        }

        bool hasMore() const { return position < validBits; }
        uint64_t bitsRead() const { return position; }
        uint64_t remaining() const { return validBits - position; }

        bool readBit()
        {
            uint8_t byte = input[static_cast<size_t>(position >> 3)];
            bool bit = ((byte >> (7 - (position & 7))) & 1u) != 0;
            ++position;
            return bit;
        }

        // true when any bit after the valid bit count in the last byte is set
        bool hasNonZeroPadding() const;
    };

    inline size_t bytesForBits(uint64_t bits)
    {
        return static_cast<size_t>((bits + 7) / 8);
    }
}

#endif // HUFFCPP_BITSTREAM_HPP
