#pragma once

#include <stdexcept>
#include <string>

namespace blobfs {

enum class ErrorCode {
    InvalidPath,
    NotFound,
    AlreadyExists,
    StoreFailure
};

/**
 * FileSystemError - Base for every failure raised by the adapter
 *
 * Callers that only care about the condition can switch on code();
 * callers that want a specific condition catch the subclass.
 */
class FileSystemError : public std::runtime_error {
public:
    FileSystemError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Absolute or scheme-qualified path given where a relative one is required
class InvalidPathError : public FileSystemError {
public:
    explicit InvalidPathError(const std::string& message)
        : FileSystemError(ErrorCode::InvalidPath, message) {}
};

class NotFoundError : public FileSystemError {
public:
    explicit NotFoundError(const std::string& message)
        : FileSystemError(ErrorCode::NotFound, message) {}
};

class AlreadyExistsError : public FileSystemError {
public:
    explicit AlreadyExistsError(const std::string& message)
        : FileSystemError(ErrorCode::AlreadyExists, message) {}
};

// Transient or unexpected store failure; never retried by the adapter
class StoreError : public FileSystemError {
public:
    explicit StoreError(const std::string& message)
        : FileSystemError(ErrorCode::StoreFailure, message) {}
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPath:   return "InvalidPath";
        case ErrorCode::NotFound:      return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::StoreFailure:  return "StoreFailure";
    }
    return "Unknown";
}

} // namespace blobfs
