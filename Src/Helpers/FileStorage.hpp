#pragma once
#ifndef HUFFCPP_FILE_STORAGE_HPP
#define HUFFCPP_FILE_STORAGE_HPP

#include <string>
#include <utility>
#include "IByteStorage.hpp"

class FileStorage : public IByteSource, public IByteSink
{
  private:
    std::string path;

  public:
    explicit FileStorage(std::string path) : path(std::move(path)) {}

    Result<std::vector<uint8_t>> read() override;

    // creates missing parent directories
    Result<size_t> write(const std::vector<uint8_t>& data) override;

    const std::string& getPath() const { return path; }
};

#endif // HUFFCPP_FILE_STORAGE_HPP
