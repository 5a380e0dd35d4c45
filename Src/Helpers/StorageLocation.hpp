#pragma once
#ifndef HUFFCPP_STORAGE_LOCATION_HPP
#define HUFFCPP_STORAGE_LOCATION_HPP

#include <memory>
#include <string>
#include "IByteStorage.hpp"

const std::string SHARED_MEMORY_PREFIX = "shm://";

bool isSharedMemoryLocation(const std::string& location);

// "shm://<name>" opens a shared memory segment, anything else is a file path
std::unique_ptr<IByteSource> openSource(const std::string& location);
std::unique_ptr<IByteSink> openSink(const std::string& location);

#endif // HUFFCPP_STORAGE_LOCATION_HPP
