#include "utilities.hpp"
#include "config.hpp"
#include "../../Src/Helpers/SharedMemoryStorage.hpp"
#include "../../Src/HuffmanCompressor/HuffmanCompressor.hpp"
#include <benchmark/benchmark.h>
#include <iostream>
#include <string>

using huffcpp::compressor::HuffmanCompressor;

static void BM_Compress(benchmark::State& state, std::string kind)
{
    const int size = static_cast<int>(state.range(0));
    std::vector<uint8_t> input = benchmark::utilities::GenerateInput(kind, size);

    size_t compressedSize = 0;
    for (auto _ : state)
    {
        Result<std::vector<uint8_t>> compressed = HuffmanCompressor::compress(input);
        if (!compressed.success())
        {
            state.SkipWithError(compressed.getError().c_str());
            return;
        }
        compressedSize = compressed.getValue().size();
        benchmark::DoNotOptimize(compressed);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * size);
    state.counters["ratio"] = static_cast<double>(size) / compressedSize;
}

static void BM_Decompress(benchmark::State& state, std::string kind)
{
    const int size = static_cast<int>(state.range(0));
    std::vector<uint8_t> input = benchmark::utilities::GenerateInput(kind, size);

    Result<std::vector<uint8_t>> compressed = HuffmanCompressor::compress(input);
    if (!compressed.success())
    {
        state.SkipWithError(compressed.getError().c_str());
        return;
    }

    for (auto _ : state)
    {
        Result<std::vector<uint8_t>> decompressed = HuffmanCompressor::decompress(compressed.getValue());
        if (!decompressed.success())
        {
            state.SkipWithError(decompressed.getError().c_str());
            return;
        }
        benchmark::DoNotOptimize(decompressed);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * size);
}

static void BM_SharedMemoryRoundtrip(benchmark::State& state, std::string kind)
{
    const int size = static_cast<int>(state.range(0));
    std::vector<uint8_t> input = benchmark::utilities::GenerateInput(kind, size);

    for (auto _ : state)
    {
        Result<size_t> compressed = benchmark::utilities::SharedMemoryCompress(input);
        if (!compressed.success())
        {
            state.SkipWithError(compressed.getError().c_str());
            break;
        }
        Result<size_t> decompressed = benchmark::utilities::SharedMemoryDecompress();
        if (!decompressed.success())
        {
            state.SkipWithError(decompressed.getError().c_str());
            break;
        }
        benchmark::utilities::ReportWarnings(decompressed.getWarnings());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * size);

    SharedMemoryStorage(SharedMemoryName).erase();
    SharedMemoryStorage(SharedMemoryOutputName).erase();
}

int main(int argc, char** argv)
{
    benchmark::Initialize(&argc, argv);

    for (const std::string& kind : InputKinds)
    {
        for (int size : InputSizes)
        {
            benchmark::RegisterBenchmark(
                benchmark::utilities::GetBenchmarkName("BM_Compress", kind, size).c_str(),
                &BM_Compress,
                kind
            )->Arg(size)->Iterations(IterationTimes);

            benchmark::RegisterBenchmark(
                benchmark::utilities::GetBenchmarkName("BM_Decompress", kind, size).c_str(),
                &BM_Decompress,
                kind
            )->Arg(size)->Iterations(IterationTimes);

            if (UseSharedMemory)
            {
                benchmark::RegisterBenchmark(
                    benchmark::utilities::GetBenchmarkName("BM_SharedMemoryRoundtrip", kind, size).c_str(),
                    &BM_SharedMemoryRoundtrip,
                    kind
                )->Arg(size)->Iterations(1);
            }
        }
    }

    benchmark::RunSpecifiedBenchmarks();
    return 0;
}
