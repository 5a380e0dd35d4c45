#pragma once
#ifndef HUFFCPP_RESULT_HPP
#define HUFFCPP_RESULT_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>

enum class ErrorCode
{
    NONE,
    INVALID_INPUT,          // empty frequency table handed to the tree builder
    UNKNOWN_SYMBOL,         // encoder found no code for a symbol
    CORRUPT_STREAM,         // decoder hit a missing child or a truncated code
    MALFORMED_CONTAINER,    // inconsistent container header
    STORAGE_FAILURE         // source or sink could not be read or written
};

inline std::string errorCodeToString(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::NONE:                return "None";
        case ErrorCode::INVALID_INPUT:       return "InvalidInput";
        case ErrorCode::UNKNOWN_SYMBOL:      return "UnknownSymbol";
        case ErrorCode::CORRUPT_STREAM:      return "CorruptStream";
        case ErrorCode::MALFORMED_CONTAINER: return "MalformedContainer";
        case ErrorCode::STORAGE_FAILURE:     return "StorageFailure";
    }
    return "Unknown";
}

template<typename T>
struct Result
{
    std::optional<T> value;
    std::optional<std::string> error;
    ErrorCode errorCode = ErrorCode::NONE;
    std::vector<std::string> warnings;

    bool success() const
    {
        return value.has_value() && !error.has_value();
    }

    bool hasError() const
    {
        return error.has_value();
    }

    bool hasWarning() const
    {
        return !warnings.empty();
    }

    void setValue(T val)
    {
        value = std::move(val);
    }

    void setError(ErrorCode code, const std::string& errorMessage)
    {
        errorCode = code;
        error = errorMessage;
    }

    void addWarning(const std::string& warningMessage)
    {
        warnings.push_back(warningMessage);
    }

    std::string getError() const
    {
        return error.value_or("No error");
    }

    ErrorCode getErrorCode() const
    {
        return errorCode;
    }

    const T& getValue() const
    {
        if (value.has_value()) {
            return value.value();
        }
        else {
            throw std::runtime_error("No value set in Result");
        }
    }

    T takeValue()
    {
        if (value.has_value()) {
            return std::move(value.value());
        }
        else {
            throw std::runtime_error("No value set in Result");
        }
    }

    std::vector<std::string> getWarnings() const
    {
        return warnings;
    }
};


template<typename T>
static Result<T> makeError(ErrorCode code, const std::string& errorMessage)
{
    Result<T> result;
    result.setError(code, errorMessage);
    return result;
};

template<typename T>
static Result<T> makeResult(T value, Result<T>* result = nullptr)
{
    if (result != nullptr) {
        result->setValue(std::move(value));
        return std::move(*result);
    }
    Result<T> newResult;
    newResult.setValue(std::move(value));
    return newResult;
};

// carries the error and warnings of a failed result over to a result of another type
template<typename T, typename U>
static Result<T> forwardError(const Result<U>& other)
{
    Result<T> result;
    result.setError(other.errorCode, other.getError());
    result.warnings = other.warnings;
    return result;
};

#endif // HUFFCPP_RESULT_HPP
