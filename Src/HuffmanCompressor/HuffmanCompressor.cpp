#include "HuffmanCompressor.hpp"
#include "../Container/Container.hpp"
#include "../HuffmanCodec/CodeTable.hpp"
#include "../HuffmanCodec/Decoder.hpp"
#include "../HuffmanCodec/Encoder.hpp"
#include "../HuffmanCodec/HuffmanTree.hpp"
#include <cmath>
#include <utility>

using namespace huffcpp::algorithms;
using huffcpp::container::Container;
using huffcpp::container::ContainerView;

Result<std::vector<uint8_t>> huffcpp::compressor::HuffmanCompressor::compress(
    const std::vector<uint8_t>& input
) {
    FrequencyTable frequencyTable = FrequencyTable::count(input);

    EncodedPayload payload;
    if (!frequencyTable.empty())
    {
        Result<HuffmanTree> tree = TreeBuilder::build(frequencyTable);
        if (!tree.success()) {
            return forwardError<std::vector<uint8_t>>(tree);
        }

        CodeTable codeTable = CodeTable::fromTree(tree.getValue());
        Result<EncodedPayload> encoded = Encoder::encode(input, codeTable);
        if (!encoded.success()) {
            return forwardError<std::vector<uint8_t>>(encoded);
        }
        payload = encoded.takeValue();
    }

    Result<std::vector<uint8_t>> result = Container::serialize(frequencyTable, payload);
    if (result.success() && !input.empty() && result.getValue().size() >= input.size())
    {
        result.addWarning(
            "Container of " + std::to_string(result.getValue().size())
                + " bytes is not smaller than the " + std::to_string(input.size()) + " input bytes");
    }
    return result;
}

Result<std::vector<uint8_t>> huffcpp::compressor::HuffmanCompressor::decompress(
    const std::vector<uint8_t>& input
) {
    Result<std::vector<uint8_t>> result;

    Result<ContainerView> parsed = Container::parse(input);
    if (!parsed.success()) {
        return forwardError<std::vector<uint8_t>>(parsed);
    }
    const ContainerView& view = parsed.getValue();

    if (view.frequencyTable.empty()) {
        return makeResult<std::vector<uint8_t>>(std::vector<uint8_t>(), &result);
    }

    Result<HuffmanTree> tree = TreeBuilder::build(view.frequencyTable);
    if (!tree.success()) {
        return forwardError<std::vector<uint8_t>>(tree);
    }

    uint64_t expectedBits = CodeTable::fromTree(tree.getValue()).weightedLength(view.frequencyTable);
    if (expectedBits != view.validBitCount)
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::MALFORMED_CONTAINER,
            "Declared " + std::to_string(view.validBitCount) + " payload bits but the frequencies imply "
                + std::to_string(expectedBits));
    }

    Result<std::vector<uint8_t>> decoded = Decoder::decode(
        view.payload,
        view.validBitCount,
        tree.getValue(),
        static_cast<size_t>(view.frequencyTable.totalCount()));
    if (!decoded.success()) {
        return decoded;
    }

    if (FrequencyTable::count(decoded.getValue()) != view.frequencyTable)
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::CORRUPT_STREAM,
            "Decoded symbols do not match the frequencies declared in the header");
    }
    return decoded;
}

Result<huffcpp::compressor::CompressionStatistics> huffcpp::compressor::HuffmanCompressor::analyze(
    const std::vector<uint8_t>& input
) {
    Result<CompressionStatistics> result;

    CompressionStatistics statistics;
    FrequencyTable frequencyTable = FrequencyTable::count(input);
    statistics.inputSize = input.size();
    statistics.distinctSymbols = frequencyTable.distinctCount();
    statistics.entropy = getSourceEntropy(frequencyTable);

    CodeTable codeTable;
    if (!frequencyTable.empty())
    {
        Result<HuffmanTree> tree = TreeBuilder::build(frequencyTable);
        if (!tree.success()) {
            return forwardError<CompressionStatistics>(tree);
        }
        codeTable = CodeTable::fromTree(tree.getValue());
    }

    statistics.payloadBits = codeTable.weightedLength(frequencyTable);
    statistics.containerSize = Container::headerSize(frequencyTable.distinctCount())
        + (statistics.payloadBits + 7) / 8;
    if (!input.empty()) {
        statistics.averageCodeLength = static_cast<double>(statistics.payloadBits) / input.size();
    }
    statistics.compressionRatio = static_cast<double>(statistics.inputSize) / statistics.containerSize;

    for (const auto& [symbol, frequency] : frequencyTable.entries())
    {
        statistics.symbols.push_back({symbol, frequency, codeToString(codeTable.code(symbol))});
    }

    return makeResult<CompressionStatistics>(std::move(statistics), &result);
}

double huffcpp::compressor::getSourceEntropy(const FrequencyTable& table)
{
    if (table.empty()) return 0.0;

    double entropy = 0.0;
    double dataSize = static_cast<double>(table.totalCount());
    for (const auto& [symbol, count] : table.entries())
    {
        double p = count / dataSize;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

Result<size_t> huffcpp::compressor::compressFile(IByteSource& source, IByteSink& sink)
{
    Result<std::vector<uint8_t>> input = source.read();
    if (!input.success()) {
        return forwardError<size_t>(input);
    }

    Result<std::vector<uint8_t>> compressed = HuffmanCompressor::compress(input.getValue());
    if (!compressed.success()) {
        return forwardError<size_t>(compressed);
    }

    Result<size_t> written = sink.write(compressed.getValue());
    for (const auto& warning : compressed.getWarnings())
    {
        written.addWarning(warning);
    }
    return written;
}

Result<size_t> huffcpp::compressor::decompressFile(IByteSource& source, IByteSink& sink)
{
    Result<std::vector<uint8_t>> input = source.read();
    if (!input.success()) {
        return forwardError<size_t>(input);
    }

    Result<std::vector<uint8_t>> decompressed = HuffmanCompressor::decompress(input.getValue());
    if (!decompressed.success()) {
        return forwardError<size_t>(decompressed);
    }

    Result<size_t> written = sink.write(decompressed.getValue());
    for (const auto& warning : decompressed.getWarnings())
    {
        written.addWarning(warning);
    }
    return written;
}
