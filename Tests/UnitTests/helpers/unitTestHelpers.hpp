#pragma once
#include <cstdint>
#include <string>
#include <vector>

void createTempFile(const std::string& filename, const std::string& content);

std::vector<uint8_t> toBytes(const std::string& text);

std::string toString(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> genRandomTextInput(int size);

// ascii symbols from 32 to 126
std::vector<uint8_t> genRandomPopularSymbolsInput(int size);

// every byte value, uniformly
std::vector<uint8_t> genRandomBinaryInput(int size);
