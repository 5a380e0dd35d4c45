#pragma once
#include "../../Src/Helpers/Result.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"

namespace benchmark
{
    namespace utilities
    {
        // kind is one of InputKinds; the same seed always gives the same bytes
        std::vector<uint8_t> GenerateInput(const std::string& kind, int size);

        // writes the input into a shared memory segment, compresses it into a second one
        Result<size_t> SharedMemoryCompress(const std::vector<uint8_t>& input);

        Result<size_t> SharedMemoryDecompress();

        void ReportWarnings(const std::vector<std::string>& warnings);

        inline std::string GetBenchmarkName(const std::string& prefix, const std::string& kind, int size) {
            return prefix + "/" + kind + "/" + std::to_string(size);
        }
    }
}
