#include "FileStorage.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

Result<std::vector<uint8_t>> FileStorage::read()
{
    Result<std::vector<uint8_t>> result;

    std::ifstream inFile(path, std::ios::binary);
    if (!inFile.good())
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::STORAGE_FAILURE, "failed to read: " + path);
    }

    std::vector<uint8_t> data(
        (std::istreambuf_iterator<char>(inFile)),
        std::istreambuf_iterator<char>());

    if (inFile.bad())
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::STORAGE_FAILURE, "I/O error while reading: " + path);
    }
    return makeResult<std::vector<uint8_t>>(std::move(data), &result);
}

Result<size_t> FileStorage::write(const std::vector<uint8_t>& data)
{
    Result<size_t> result;

    std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code error;
        std::filesystem::create_directories(filePath.parent_path(), error);
        if (error)
        {
            return makeError<size_t>(
                ErrorCode::STORAGE_FAILURE,
                "failed to create directory for " + path + ": " + error.message());
        }
    }

    std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
    if (!outFile)
    {
        return makeError<size_t>(ErrorCode::STORAGE_FAILURE, "failed to open for writing: " + path);
    }

    outFile.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!outFile.good())
    {
        return makeError<size_t>(ErrorCode::STORAGE_FAILURE, "failed to write: " + path);
    }
    return makeResult<size_t>(data.size(), &result);
}
