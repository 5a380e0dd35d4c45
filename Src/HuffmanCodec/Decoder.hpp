#pragma once
#ifndef HUFFCPP_DECODER_HPP
#define HUFFCPP_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "HuffmanTree.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::algorithms
{
    struct Decoder
    {
        /*
         * Walks the tree from the root, left on 0 and right on 1, emitting a symbol and
         * restarting at the root on every leaf. Exactly validBitCount bits are consumed;
         * padding after them is never decoded. Fails with CORRUPT_STREAM on a missing
         * child, when the bits end in the middle of a code, or when validBitCount does
         * not fit into the payload. Non-zero padding only adds a warning.
         */
        static Result<std::vector<uint8_t>> decode(
            const std::vector<uint8_t>& payload,
            uint64_t validBitCount,
            const HuffmanTree& tree
        );

        // expectedSymbols only sizes the output buffer up front
        static Result<std::vector<uint8_t>> decode(
            const std::vector<uint8_t>& payload,
            uint64_t validBitCount,
            const HuffmanTree& tree,
            size_t expectedSymbols
        );
    };
}

#endif // HUFFCPP_DECODER_HPP
