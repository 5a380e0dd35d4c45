#include "SharedMemoryStorage.hpp"
#include <cstring>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <boost/interprocess/shared_memory_object.hpp>

using namespace boost::interprocess;

Result<std::vector<uint8_t>> SharedMemoryStorage::read()
{
    Result<std::vector<uint8_t>> result;

    try
    {
        shared_memory_object object(open_only, name.c_str(), read_only);

        offset_t size = 0;
        if (!object.get_size(size))
        {
            return makeError<std::vector<uint8_t>>(
                ErrorCode::STORAGE_FAILURE, "cannot query size of shared memory segment: " + name);
        }

        std::vector<uint8_t> data(static_cast<size_t>(size));
        if (size > 0)
        {
            mapped_region region(object, read_only);
            std::memcpy(data.data(), region.get_address(), data.size());
        }
        return makeResult<std::vector<uint8_t>>(std::move(data), &result);
    }
    catch (const interprocess_exception& e)
    {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::STORAGE_FAILURE,
            "failed to read shared memory segment '" + name + "': " + e.what());
    }
}

Result<size_t> SharedMemoryStorage::write(const std::vector<uint8_t>& data)
{
    Result<size_t> result;

    try
    {
        shared_memory_object object(open_or_create, name.c_str(), read_write);
        object.truncate(static_cast<offset_t>(data.size()));
        if (!data.empty())
        {
            mapped_region region(object, read_write);
            std::memcpy(region.get_address(), data.data(), data.size());
        }
        return makeResult<size_t>(data.size(), &result);
    }
    catch (const interprocess_exception& e)
    {
        return makeError<size_t>(
            ErrorCode::STORAGE_FAILURE,
            "failed to write shared memory segment '" + name + "': " + e.what());
    }
}

bool SharedMemoryStorage::exists() const
{
    try
    {
        shared_memory_object object(open_only, name.c_str(), read_only);
        return true;
    }
    catch (const interprocess_exception&)
    {
        return false;
    }
}

bool SharedMemoryStorage::erase()
{
    return shared_memory_object::remove(name.c_str());
}
