#include "CliHelpers.hpp"
#include "Helpers/StorageLocation.hpp"
#include "HuffmanCompressor/HuffmanCompressor.hpp"
#include <chrono>
#include <iostream>
#include <string>

using namespace huffcpp::compressor;

static int runCompress(const CliOptions& options)
{
    auto source = openSource(options.arguments[0]);
    auto sink = openSink(options.arguments[1]);

    const auto start = std::chrono::high_resolution_clock::now();
    Result<size_t> result = compressFile(*source, *sink);
    const auto end = std::chrono::high_resolution_clock::now();

    return handleResult("compress", result, start, end, options.verbose);
}

static int runDecompress(const CliOptions& options)
{
    auto source = openSource(options.arguments[0]);
    auto sink = openSink(options.arguments[1]);

    const auto start = std::chrono::high_resolution_clock::now();
    Result<size_t> result = decompressFile(*source, *sink);
    const auto end = std::chrono::high_resolution_clock::now();

    return handleResult("decompress", result, start, end, options.verbose);
}

// encode, store the container, read it back, decode and store the decoded bytes
static int runRoundtrip(const CliOptions& options)
{
    auto inputSource = openSource(options.arguments[0]);
    auto encodedSink = openSink(options.arguments[1]);

    auto start = std::chrono::high_resolution_clock::now();
    Result<size_t> encoded = compressFile(*inputSource, *encodedSink);
    auto end = std::chrono::high_resolution_clock::now();
    int status = handleResult("compress", encoded, start, end, options.verbose);
    if (status != 0) {
        return status;
    }

    auto encodedSource = openSource(options.arguments[1]);
    auto decodedSink = openSink(options.arguments[2]);

    start = std::chrono::high_resolution_clock::now();
    Result<size_t> decoded = decompressFile(*encodedSource, *decodedSink);
    end = std::chrono::high_resolution_clock::now();
    status = handleResult("decompress", decoded, start, end, options.verbose);
    if (status == 0) {
        std::cout << "Encoding and decoding complete: " << options.arguments[1]
                  << ", " << options.arguments[2] << std::endl;
    }
    return status;
}

static int runInspect(const CliOptions& options)
{
    auto source = openSource(options.arguments[0]);
    Result<std::vector<uint8_t>> input = source->read();
    if (!input.success())
    {
        std::cerr << "Error (" << errorCodeToString(input.errorCode) << "): " << input.getError() << std::endl;
        return 1;
    }

    Result<CompressionStatistics> statistics = HuffmanCompressor::analyze(input.getValue());
    if (!statistics.success())
    {
        std::cerr << "Error (" << errorCodeToString(statistics.errorCode) << "): "
                  << statistics.getError() << std::endl;
        return 1;
    }

    if (options.jsonOutput) {
        std::cout << statisticsToJson(statistics.getValue()).dump(4) << std::endl;
    }
    else {
        printStatistics(statistics.getValue());
    }
    return 0;
}

int main(int argc, char** argv)
{
    Result<CliOptions> options = parseCommandLine(argc, argv);
    if (!options.success())
    {
        std::cerr << "Error: " << options.getError() << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    const CliOptions& parsed = options.getValue();
    if (parsed.command == "compress") {
        return runCompress(parsed);
    }
    if (parsed.command == "decompress") {
        return runDecompress(parsed);
    }
    if (parsed.command == "roundtrip") {
        return runRoundtrip(parsed);
    }
    return runInspect(parsed);
}
