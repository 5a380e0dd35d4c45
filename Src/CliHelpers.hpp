#pragma once
#include <chrono>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>
#include "Helpers/Result.hpp"
#include "HuffmanCompressor/HuffmanCompressor.hpp"

using json = nlohmann::json;

struct CliOptions
{
    std::string command;
    std::vector<std::string> arguments;
    bool verbose = false;
    bool jsonOutput = false;
};

void printUsage(const char* program);

bool parseBoolFlag(const std::string& value);

Result<CliOptions> parseCommandLine(int argc, char** argv);

json statisticsToJson(const huffcpp::compressor::CompressionStatistics& statistics);

void printStatistics(const huffcpp::compressor::CompressionStatistics& statistics);

template<typename T>
int handleResult(
    const std::string& action,
    const Result<T>& result,
    const std::chrono::high_resolution_clock::time_point& start,
    const std::chrono::high_resolution_clock::time_point& end,
    bool verbose
) {
    for (const auto& warning : result.warnings)
    {
        std::cerr << "Warning: " << warning << std::endl;
    }

    if (!result.success())
    {
        std::cerr << "Error (" << errorCodeToString(result.errorCode) << ") during "
                  << action << ": " << result.getError() << std::endl;
        return 1;
    }

    if (verbose)
    {
        auto timeDiff = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        std::string successMessage = action + " succeeded in " + std::to_string(timeDiff * 0.000000001) + " s.";
        if constexpr (std::is_same_v<T, size_t>)
        {
            successMessage += " Wrote " + std::to_string(result.getValue()) + " bytes.";
        }
        std::cout << successMessage << std::endl;
    }
    return 0;
};
