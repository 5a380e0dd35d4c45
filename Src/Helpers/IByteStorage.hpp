#pragma once
#ifndef HUFFCPP_IBYTE_STORAGE_HPP
#define HUFFCPP_IBYTE_STORAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "Result.hpp"

/* Supplies raw input bytes to the codec. */
class IByteSource
{
  public:
    virtual Result<std::vector<uint8_t>> read() = 0;
    virtual ~IByteSource() = default;
};

/* Accepts the codec's output bytes; returns the number of bytes stored. */
class IByteSink
{
  public:
    virtual Result<size_t> write(const std::vector<uint8_t>& data) = 0;
    virtual ~IByteSink() = default;
};

#endif // HUFFCPP_IBYTE_STORAGE_HPP
