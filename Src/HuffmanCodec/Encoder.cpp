#include "Encoder.hpp"
#include "BitStream.hpp"
#include <string>
#include <utility>

Result<huffcpp::algorithms::EncodedPayload> huffcpp::algorithms::Encoder::encode(
    const std::vector<uint8_t>& input,
    const CodeTable& codeTable
) {
    Result<EncodedPayload> result;

    BitWriter writer;
    writer.reserveBytes(input.size());

    for (size_t i = 0; i < input.size(); ++i)
    {
        Symbol symbol = input[i];
        if (!codeTable.contains(symbol))
        {
            return makeError<EncodedPayload>(
                ErrorCode::UNKNOWN_SYMBOL,
                "No code for symbol " + std::to_string(symbol) + " at offset " + std::to_string(i));
        }
        writer.writeBits(codeTable.code(symbol));
    }

    EncodedPayload payload;
    payload.validBitCount = writer.validBitCount();
    payload.bytes = writer.finish();
    return makeResult<EncodedPayload>(std::move(payload), &result);
}
