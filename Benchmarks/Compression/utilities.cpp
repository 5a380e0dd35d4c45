#include "utilities.hpp"
#include "../../Src/Helpers/SharedMemoryStorage.hpp"
#include "../../Src/HuffmanCompressor/HuffmanCompressor.hpp"
#include <cstdlib>
#include <iostream>

std::vector<uint8_t> benchmark::utilities::GenerateInput(
    const std::string& kind,
    int size
) {
    srand(static_cast<unsigned>(size));

    std::vector<uint8_t> res;
    res.reserve(size);
    if (kind == "text")
    {
        const std::string popularSymbols = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
        for (int i = 0; i < size; i++) {
            res.push_back(popularSymbols[rand() % popularSymbols.size()]);
        }
    }
    else if (kind == "ascii")
    {
        for (int i = 0; i < size; i++) {
            res.push_back(32 + (rand() % 95));
        }
    }
    else if (kind == "skewed")
    {
        // roughly geometric: 'a' half of the time, 'b' a quarter, ...
        for (int i = 0; i < size; i++) {
            uint8_t symbol = 'a';
            while (symbol < 'z' && rand() % 2 == 0) ++symbol;
            res.push_back(symbol);
        }
    }
    else
    {
        for (int i = 0; i < size; i++) {
            res.push_back(static_cast<uint8_t>(rand() % 256));
        }
    }
    return res;
}

Result<size_t> benchmark::utilities::SharedMemoryCompress(const std::vector<uint8_t>& input)
{
    SharedMemoryStorage source(SharedMemoryName);
    SharedMemoryStorage sink(SharedMemoryOutputName);

    Result<size_t> loaded = source.write(input);
    if (!loaded.success()) {
        return loaded;
    }
    return huffcpp::compressor::compressFile(source, sink);
}

Result<size_t> benchmark::utilities::SharedMemoryDecompress()
{
    SharedMemoryStorage source(SharedMemoryOutputName);
    SharedMemoryStorage sink(SharedMemoryName);
    return huffcpp::compressor::decompressFile(source, sink);
}

void benchmark::utilities::ReportWarnings(const std::vector<std::string>& warnings)
{
    for (const auto& warning : warnings)
    {
        std::cerr << "Warning: " << warning << std::endl;
    }
}
