#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace instman {

enum class ErrorKind {
    Validation,
    NotFound,
    Conflict,
    ExternalProcess,
    TransientQuery,
    Storage
};

inline const char* to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:      return "ValidationError";
        case ErrorKind::NotFound:        return "NotFoundError";
        case ErrorKind::Conflict:        return "ConflictError";
        case ErrorKind::ExternalProcess: return "ExternalProcessError";
        case ErrorKind::TransientQuery:  return "TransientQueryError";
        case ErrorKind::Storage:         return "StorageError";
    }
    return "Error";
}

// Base for every error a request can fail with. None of them is fatal to the
// process; callers report the message and carry on.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Bad input: empty name, bad or duplicate user data dir, unbound account
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(ErrorKind::Validation, message) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) : Error(ErrorKind::NotFound, message) {}
};

// Operation not allowed in the current state (deleting the default instance)
class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message) : Error(ErrorKind::Conflict, message) {}
};

// Start/stop/live-switch failure at the OS process layer
class ExternalProcessError : public Error {
public:
    explicit ExternalProcessError(const std::string& message) : Error(ErrorKind::ExternalProcess, message) {}
};

// Process table could not be read; downgraded to "not running" by callers
class TransientQueryError : public Error {
public:
    explicit TransientQueryError(const std::string& message) : Error(ErrorKind::TransientQuery, message) {}
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& message) : Error(ErrorKind::Storage, message) {}
};

// Recent non-fatal failure surfaced in the status bar
struct QueryError {
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

} // namespace instman
