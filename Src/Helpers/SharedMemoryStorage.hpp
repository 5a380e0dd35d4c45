#pragma once
#ifndef HUFFCPP_SHARED_MEMORY_STORAGE_HPP
#define HUFFCPP_SHARED_MEMORY_STORAGE_HPP

#include <string>
#include <utility>
#include "IByteStorage.hpp"

/* Named POSIX shared memory segment holding exactly one artifact. */
class SharedMemoryStorage : public IByteSource, public IByteSink
{
  private:
    std::string name;

  public:
    explicit SharedMemoryStorage(std::string name) : name(std::move(name)) {}

    SharedMemoryStorage(SharedMemoryStorage const &other) = delete;
    SharedMemoryStorage &operator=(SharedMemoryStorage const &other) = delete;

    Result<std::vector<uint8_t>> read() override;

    // resizes the segment to the artifact and copies it in
    Result<size_t> write(const std::vector<uint8_t>& data) override;

    bool exists() const;

    // true when a segment was removed
    bool erase();

    const std::string& getName() const { return name; }
};

#endif // HUFFCPP_SHARED_MEMORY_STORAGE_HPP
