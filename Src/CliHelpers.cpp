#include "CliHelpers.hpp"
#include <cstdlib>
#include <iomanip>
#include <utility>

void printUsage(const char* program)
{
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program << " compress   <input> <output> [--verbose=true]" << std::endl;
    std::cout << "  " << program << " decompress <input> <output> [--verbose=true]" << std::endl;
    std::cout << "  " << program << " roundtrip  <input> <encodedOutput> <decodedOutput> [--verbose=true]" << std::endl;
    std::cout << "  " << program << " inspect    <input> [--json=true]" << std::endl;
    std::cout << "Locations are file paths or shm://<name> for a shared memory segment." << std::endl;
}

bool parseBoolFlag(const std::string& value)
{
    return value.empty() || value == "True" || value == "true" || atoi(value.c_str()) > 0;
}

Result<CliOptions> parseCommandLine(int argc, char** argv)
{
    Result<CliOptions> result;
    CliOptions options;

    if (argc < 2)
    {
        return makeError<CliOptions>(ErrorCode::INVALID_INPUT, "No command given");
    }
    options.command = argv[1];

    for (int i = 2; i < argc; ++i)
    {
        std::string argument = argv[i];
        if (argument.rfind("--", 0) != 0)
        {
            options.arguments.push_back(argument);
            continue;
        }

        std::string name = argument.substr(2);
        std::string value;
        size_t separator = name.find('=');
        if (separator != std::string::npos)
        {
            value = name.substr(separator + 1);
            name = name.substr(0, separator);
        }

        if (name == "verbose") {
            options.verbose = parseBoolFlag(value);
        }
        else if (name == "json") {
            options.jsonOutput = parseBoolFlag(value);
        }
        else {
            return makeError<CliOptions>(ErrorCode::INVALID_INPUT, "Unknown option: --" + name);
        }
    }

    size_t expectedArguments = 0;
    if (options.command == "compress" || options.command == "decompress") {
        expectedArguments = 2;
    }
    else if (options.command == "roundtrip") {
        expectedArguments = 3;
    }
    else if (options.command == "inspect") {
        expectedArguments = 1;
    }
    else {
        return makeError<CliOptions>(ErrorCode::INVALID_INPUT, "Unknown command: " + options.command);
    }

    if (options.arguments.size() != expectedArguments)
    {
        return makeError<CliOptions>(
            ErrorCode::INVALID_INPUT,
            "'" + options.command + "' expects " + std::to_string(expectedArguments)
                + " locations, got " + std::to_string(options.arguments.size()));
    }

    return makeResult<CliOptions>(std::move(options), &result);
}

json statisticsToJson(const huffcpp::compressor::CompressionStatistics& statistics)
{
    json document;
    document["inputSize"] = statistics.inputSize;
    document["distinctSymbols"] = statistics.distinctSymbols;
    document["entropy"] = statistics.entropy;
    document["averageCodeLength"] = statistics.averageCodeLength;
    document["payloadBits"] = statistics.payloadBits;
    document["containerSize"] = statistics.containerSize;
    document["compressionRatio"] = statistics.compressionRatio;

    json symbols = json::array();
    for (const auto& symbol : statistics.symbols)
    {
        symbols.push_back(json{
            {"symbol", symbol.symbol},
            {"frequency", symbol.frequency},
            {"code", symbol.code}
        });
    }
    document["symbols"] = symbols;
    return document;
}

void printStatistics(const huffcpp::compressor::CompressionStatistics& statistics)
{
    std::cout << "Input size: " << statistics.inputSize << " bytes" << std::endl;
    std::cout << "Distinct symbols: " << statistics.distinctSymbols << std::endl;
    std::cout << "Entropy " << statistics.entropy
              << ", average code length " << statistics.averageCodeLength << " bits/symbol" << std::endl;
    std::cout << "Payload: " << statistics.payloadBits << " bits, container: "
              << statistics.containerSize << " bytes" << std::endl;
    std::cout << "Compression ratio: " << statistics.compressionRatio << std::endl;

    for (const auto& symbol : statistics.symbols)
    {
        std::cout << " - 0x" << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(symbol.symbol) << std::dec << std::setfill(' ')
                  << " x" << symbol.frequency << " -> " << symbol.code << std::endl;
    }
}
