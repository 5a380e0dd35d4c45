#pragma once
#ifndef HUFFCPP_ENCODER_HPP
#define HUFFCPP_ENCODER_HPP

#include <cstdint>
#include <vector>
#include "CodeTable.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::algorithms
{
    struct EncodedPayload
    {
        std::vector<uint8_t> bytes;     // MSB-first, last byte zero-padded
        uint64_t validBitCount = 0;
    };

    struct Encoder
    {
        static Result<EncodedPayload> encode(
            const std::vector<uint8_t>& input,
            const CodeTable& codeTable
        );
    };
}

#endif // HUFFCPP_ENCODER_HPP
