#include "Container.hpp"
#include "../HuffmanCodec/BitStream.hpp"
#include <string>
#include <utility>

using namespace huffcpp::algorithms;

namespace
{
    void writeUnsigned(std::vector<uint8_t>& output, uint64_t value, size_t width)
    {
        for (size_t i = width; i > 0; --i)
        {
            output.push_back(static_cast<uint8_t>((value >> (8 * (i - 1))) & 0xFF));
        }
    }

    uint64_t readUnsigned(const std::vector<uint8_t>& input, size_t offset, size_t width)
    {
        uint64_t value = 0;
        for (size_t i = 0; i < width; ++i)
        {
            value = (value << 8) | input[offset + i];
        }
        return value;
    }
}

Result<std::vector<uint8_t>> huffcpp::container::Container::serialize(
    const FrequencyTable& frequencyTable,
    const EncodedPayload& payload
) {
    Result<std::vector<uint8_t>> result;

    if (payload.bytes.size() != bytesForBits(payload.validBitCount))
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::INVALID_INPUT,
            "Payload of " + std::to_string(payload.bytes.size()) + " bytes does not match "
                + std::to_string(payload.validBitCount) + " valid bits");
    }

    const auto entries = frequencyTable.entries();

    std::vector<uint8_t> output;
    output.reserve(headerSize(entries.size()) + payload.bytes.size());

    writeUnsigned(output, entries.size(), SYMBOL_COUNT_BYTES);
    for (const auto& [symbol, frequency] : entries)
    {
        if (frequency > MAX_FREQUENCY)
        {
            return makeError<std::vector<uint8_t>>(
                ErrorCode::INVALID_INPUT,
                "Frequency " + std::to_string(frequency) + " of symbol "
                    + std::to_string(symbol) + " does not fit into 32 bits");
        }
        writeUnsigned(output, symbol, SYMBOL_BYTES);
        writeUnsigned(output, frequency, FREQUENCY_BYTES);
    }
    writeUnsigned(output, payload.validBitCount, VALID_BIT_COUNT_BYTES);
    output.insert(output.end(), payload.bytes.begin(), payload.bytes.end());

    return makeResult<std::vector<uint8_t>>(std::move(output), &result);
}

Result<huffcpp::container::ContainerView> huffcpp::container::Container::parse(
    const std::vector<uint8_t>& input
) {
    Result<ContainerView> result;

    if (input.size() < SYMBOL_COUNT_BYTES)
    {
        return makeError<ContainerView>(
            ErrorCode::MALFORMED_CONTAINER,
            "Container of " + std::to_string(input.size()) + " bytes is too short for the symbol count");
    }

    size_t offset = 0;
    uint64_t symbolCount = readUnsigned(input, offset, SYMBOL_COUNT_BYTES);
    offset += SYMBOL_COUNT_BYTES;

    if (symbolCount > ALPHABET_SIZE)
    {
        return makeError<ContainerView>(
            ErrorCode::MALFORMED_CONTAINER,
            "Declared symbol count " + std::to_string(symbolCount) + " exceeds the alphabet");
    }

    const size_t fixedBytes = headerSize(static_cast<size_t>(symbolCount));
    if (input.size() < fixedBytes)
    {
        return makeError<ContainerView>(
            ErrorCode::MALFORMED_CONTAINER,
            "Container of " + std::to_string(input.size()) + " bytes cannot hold a header for "
                + std::to_string(symbolCount) + " symbols");
    }

    std::vector<std::pair<Symbol, uint64_t>> entries;
    entries.reserve(static_cast<size_t>(symbolCount));
    for (uint64_t i = 0; i < symbolCount; ++i)
    {
        Symbol symbol = static_cast<Symbol>(readUnsigned(input, offset, SYMBOL_BYTES));
        offset += SYMBOL_BYTES;
        uint64_t frequency = readUnsigned(input, offset, FREQUENCY_BYTES);
        offset += FREQUENCY_BYTES;

        if (frequency == 0)
        {
            return makeError<ContainerView>(
                ErrorCode::MALFORMED_CONTAINER,
                "Symbol " + std::to_string(symbol) + " is declared with frequency 0");
        }
        if (!entries.empty() && symbol <= entries.back().first)
        {
            return makeError<ContainerView>(
                ErrorCode::MALFORMED_CONTAINER,
                "Symbols are not in strictly ascending order at entry " + std::to_string(i));
        }
        entries.emplace_back(symbol, frequency);
    }

    uint64_t validBitCount = readUnsigned(input, offset, VALID_BIT_COUNT_BYTES);
    offset += VALID_BIT_COUNT_BYTES;

    if (symbolCount == 0 && validBitCount != 0)
    {
        return makeError<ContainerView>(
            ErrorCode::MALFORMED_CONTAINER,
            "Container without symbols declares " + std::to_string(validBitCount) + " payload bits");
    }

    const size_t payloadBytes = input.size() - offset;
    if (validBitCount > static_cast<uint64_t>(payloadBytes) * 8)
    {
        return makeError<ContainerView>(
            ErrorCode::MALFORMED_CONTAINER,
            "Valid bit count " + std::to_string(validBitCount) + " exceeds the "
                + std::to_string(payloadBytes * 8) + " payload bits available");
    }
    if (payloadBytes != bytesForBits(validBitCount))
    {
        return makeError<ContainerView>(
            ErrorCode::MALFORMED_CONTAINER,
            std::to_string(payloadBytes - bytesForBits(validBitCount))
                + " trailing bytes after the payload");
    }

    ContainerView view;
    view.frequencyTable = FrequencyTable::fromEntries(entries);
    view.validBitCount = validBitCount;
    view.payload.assign(input.begin() + static_cast<std::ptrdiff_t>(offset), input.end());

    return makeResult<ContainerView>(std::move(view), &result);
}
