#pragma once
#ifndef HUFFCPP_HUFFMAN_COMPRESSOR_HPP
#define HUFFCPP_HUFFMAN_COMPRESSOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../HuffmanCodec/FrequencyTable.hpp"
#include "../Helpers/IByteStorage.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::compressor
{
    struct SymbolStatistics
    {
        algorithms::Symbol symbol;
        uint64_t frequency;
        std::string code;
    };

    struct CompressionStatistics
    {
        uint64_t inputSize = 0;
        size_t distinctSymbols = 0;
        double entropy = 0.0;               // bits per symbol
        double averageCodeLength = 0.0;     // bits per symbol
        uint64_t payloadBits = 0;
        uint64_t containerSize = 0;
        double compressionRatio = 0.0;      // input size / container size

        std::vector<SymbolStatistics> symbols;  // ascending symbol order
    };

    struct HuffmanCompressor
    {
        // bytes -> container bytes
        static Result<std::vector<uint8_t>> compress(const std::vector<uint8_t>& input);

        /*
         * container bytes -> original bytes. Besides the decoder's own checks, the declared
         * valid bit count has to match the rebuilt code lengths (MALFORMED_CONTAINER) and the
         * decoded symbols have to reproduce the header's frequencies (CORRUPT_STREAM).
         */
        static Result<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& input);

        static Result<CompressionStatistics> analyze(const std::vector<uint8_t>& input);
    };

    // Shannon entropy of the byte distribution in bits per symbol
    double getSourceEntropy(const algorithms::FrequencyTable& table);

    Result<size_t> compressFile(IByteSource& source, IByteSink& sink);

    Result<size_t> decompressFile(IByteSource& source, IByteSink& sink);
}

#endif // HUFFCPP_HUFFMAN_COMPRESSOR_HPP
