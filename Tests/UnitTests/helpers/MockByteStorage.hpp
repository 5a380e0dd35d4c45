#pragma once
#include "../../../Src/Helpers/IByteStorage.hpp"
#include <string>
#include <utility>
#include <vector>

/* Byte storage kept in memory, without touching the file system */
class MockByteStorage : public IByteSource, public IByteSink
{
  private:
    std::vector<uint8_t> memory;
    bool failing = false;
    size_t writeCount = 0;

  public:
    MockByteStorage() = default;
    explicit MockByteStorage(std::vector<uint8_t> content) : memory(std::move(content)) {}

    Result<std::vector<uint8_t>> read() override
    {
        if (failing) {
            return makeError<std::vector<uint8_t>>(ErrorCode::STORAGE_FAILURE, "mock read failure");
        }
        return makeResult<std::vector<uint8_t>>(memory);
    }

    Result<size_t> write(const std::vector<uint8_t>& data) override
    {
        if (failing) {
            return makeError<size_t>(ErrorCode::STORAGE_FAILURE, "mock write failure");
        }
        memory = data;
        ++writeCount;
        return makeResult<size_t>(data.size());
    }

    void setFailing(bool value) { failing = value; }
    const std::vector<uint8_t>& content() const { return memory; }
    size_t writes() const { return writeCount; }
};
