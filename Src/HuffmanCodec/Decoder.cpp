#include "Decoder.hpp"
#include "BitStream.hpp"
#include <string>
#include <utility>

Result<std::vector<uint8_t>> huffcpp::algorithms::Decoder::decode(
    const std::vector<uint8_t>& payload,
    uint64_t validBitCount,
    const HuffmanTree& tree
) {
    return decode(payload, validBitCount, tree, 0);
}

Result<std::vector<uint8_t>> huffcpp::algorithms::Decoder::decode(
    const std::vector<uint8_t>& payload,
    uint64_t validBitCount,
    const HuffmanTree& tree,
    size_t expectedSymbols
) {
    Result<std::vector<uint8_t>> result;

    BitReader reader(payload, validBitCount);
    if (!reader.isConsistent())
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::CORRUPT_STREAM,
            "Valid bit count " + std::to_string(validBitCount) + " exceeds the "
                + std::to_string(payload.size() * 8) + " bits in the payload");
    }

    std::vector<uint8_t> decoded;
    if (tree.empty())
    {
        if (validBitCount != 0)
        {
            return makeError<std::vector<uint8_t>>(
                ErrorCode::CORRUPT_STREAM,
                "Payload holds bits but there is no tree to decode them with");
        }
        return makeResult<std::vector<uint8_t>>(std::move(decoded), &result);
    }
    decoded.reserve(expectedSymbols);

    const int32_t root = tree.root();
    const bool rootIsLeaf = tree.node(root).isLeaf();
    int32_t current = root;

    while (reader.hasMore())
    {
        uint64_t offset = reader.bitsRead();
        Direction direction = directionForBit(reader.readBit());

        if (rootIsLeaf)
        {
            // bare leaf root: its code is a single LEFT bit
            if (direction != Direction::LEFT)
            {
                return makeError<std::vector<uint8_t>>(
                    ErrorCode::CORRUPT_STREAM,
                    "Bit " + std::to_string(offset) + " leads to a missing child");
            }
            decoded.push_back(tree.node(root).symbol);
            continue;
        }

        int32_t next = tree.child(current, direction);
        if (next == NO_CHILD)
        {
            return makeError<std::vector<uint8_t>>(
                ErrorCode::CORRUPT_STREAM,
                "Bit " + std::to_string(offset) + " leads to a missing child");
        }

        current = next;
        const HuffmanNode& reached = tree.node(current);
        if (reached.isLeaf())
        {
            decoded.push_back(reached.symbol);
            current = root;
        }
    }

    if (current != root)
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::CORRUPT_STREAM,
            "Stream ends in the middle of a code after "
                + std::to_string(validBitCount) + " bits");
    }

    if (reader.hasNonZeroPadding())
    {
        result.addWarning("Padding bits after the valid bit count are not zero");
    }

    return makeResult<std::vector<uint8_t>>(std::move(decoded), &result);
}
