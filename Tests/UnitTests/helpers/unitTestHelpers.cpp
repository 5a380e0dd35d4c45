#include "unitTestHelpers.hpp"
#include <cstdlib>
#include <fstream>

void createTempFile(const std::string& filename, const std::string& content)
{
    std::ofstream file(filename, std::ios::binary);
    file << content;
    file.close();
}

std::vector<uint8_t> toBytes(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string toString(const std::vector<uint8_t>& bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> genRandomTextInput(int size)
{
    std::vector<uint8_t> res;
    const std::string popularSymbols = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    for (int i = 0; i < size; i++) {
        res.push_back(popularSymbols[rand() % popularSymbols.size()]);
    }
    return res;
}

std::vector<uint8_t> genRandomPopularSymbolsInput(int size)
{
    std::vector<uint8_t> res;
    for (int i = 0; i < size; i++) {
        res.push_back(32 + (rand() % 95));
    }
    return res;
}

std::vector<uint8_t> genRandomBinaryInput(int size)
{
    std::vector<uint8_t> res;
    for (int i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(rand() % 256));
    }
    return res;
}
