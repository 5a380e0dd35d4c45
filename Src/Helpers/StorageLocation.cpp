#include "StorageLocation.hpp"
#include "FileStorage.hpp"
#include "SharedMemoryStorage.hpp"

bool isSharedMemoryLocation(const std::string& location)
{
    return location.rfind(SHARED_MEMORY_PREFIX, 0) == 0
        && location.size() > SHARED_MEMORY_PREFIX.size();
}

std::unique_ptr<IByteSource> openSource(const std::string& location)
{
    if (isSharedMemoryLocation(location))
    {
        return std::make_unique<SharedMemoryStorage>(location.substr(SHARED_MEMORY_PREFIX.size()));
    }
    return std::make_unique<FileStorage>(location);
}

std::unique_ptr<IByteSink> openSink(const std::string& location)
{
    if (isSharedMemoryLocation(location))
    {
        return std::make_unique<SharedMemoryStorage>(location.substr(SHARED_MEMORY_PREFIX.size()));
    }
    return std::make_unique<FileStorage>(location);
}
