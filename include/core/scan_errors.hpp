#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for scan failures that callers are expected to handle
 */
class ScanError : public std::runtime_error
{
public:
    explicit ScanError(const std::string &message) : std::runtime_error(message) {}
};

// Scan root does not exist
class NotFoundError : public ScanError
{
public:
    explicit NotFoundError(const std::string &path)
        : ScanError("Directory not found: " + path) {}
};

// Scan root exists but is not a directory
class NotADirectoryError : public ScanError
{
public:
    explicit NotADirectoryError(const std::string &path)
        : ScanError("Path is not a directory: " + path) {}
};

// Result store could not be created, read or written
class StoreError : public ScanError
{
public:
    explicit StoreError(const std::string &message) : ScanError(message) {}
};

// Video container could not be opened for decoding
class CannotOpenError : public ScanError
{
public:
    explicit CannotOpenError(const std::string &path)
        : ScanError("Could not open video file " + path) {}
};
