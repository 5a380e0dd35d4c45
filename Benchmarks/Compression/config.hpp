#pragma once
#include <string>
#include <vector>

const int IterationTimes = 5;

const bool UseSharedMemory = true;

// bytes per generated input
const std::vector<int> InputSizes = {
    1 << 10,
    1 << 14,
    1 << 18,
    1 << 20,
    1 << 22
};

const std::vector<std::string> InputKinds = {
    "text",
    "ascii",
    "binary",
    "skewed"
};

const std::string SharedMemoryName = "benchmark_sharedMemorySegment";
const std::string SharedMemoryOutputName = "benchmark_sharedMemorySegment_out";
