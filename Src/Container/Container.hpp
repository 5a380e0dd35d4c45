#pragma once
#ifndef HUFFCPP_CONTAINER_HPP
#define HUFFCPP_CONTAINER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../HuffmanCodec/Encoder.hpp"
#include "../HuffmanCodec/FrequencyTable.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::container
{
    /*
     * Layout, all integers big-endian:
     *   [4]  distinct symbol count N
     *   N x  [1] symbol, [4] frequency      (ascending symbol order)
     *   [8]  valid bit count of the payload
     *   [..] payload, MSB-first, final byte zero-padded
     */
    constexpr size_t SYMBOL_COUNT_BYTES = 4;
    constexpr size_t SYMBOL_BYTES = 1;
    constexpr size_t FREQUENCY_BYTES = 4;
    constexpr size_t SYMBOL_ENTRY_BYTES = SYMBOL_BYTES + FREQUENCY_BYTES;
    constexpr size_t VALID_BIT_COUNT_BYTES = 8;

    constexpr uint64_t MAX_FREQUENCY = 0xFFFFFFFFull;

    struct ContainerView
    {
        algorithms::FrequencyTable frequencyTable;
        uint64_t validBitCount = 0;
        std::vector<uint8_t> payload;
    };

    struct Container
    {
        static Result<std::vector<uint8_t>> serialize(
            const algorithms::FrequencyTable& frequencyTable,
            const algorithms::EncodedPayload& payload
        );

        static Result<ContainerView> parse(const std::vector<uint8_t>& input);

        static size_t headerSize(size_t distinctSymbols)
        {
            return SYMBOL_COUNT_BYTES + distinctSymbols * SYMBOL_ENTRY_BYTES + VALID_BIT_COUNT_BYTES;
        }
    };
}

#endif // HUFFCPP_CONTAINER_HPP
