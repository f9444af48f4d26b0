#pragma once
#include <stdexcept>
#include <string>

namespace core::types {

class PrintServiceException : public std::runtime_error {
public:
    explicit PrintServiceException(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief Rejected input: malformed request body or invalid endpoint fields.
 */
class ValidationException : public PrintServiceException {
public:
    explicit ValidationException(const std::string& msg)
        : PrintServiceException(msg) {}
};

class StorageException : public PrintServiceException {
public:
    explicit StorageException(const std::string& msg)
        : PrintServiceException("Storage failed: " + msg) {}
};

}
