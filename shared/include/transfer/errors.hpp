#pragma once

#include <stdexcept>
#include <string>

namespace transfer {

enum class ErrorKind {
    NOT_FOUND,
    IO,
    INTEGRITY,
    METADATA,
    CANCELLED
};

const char* to_string(ErrorKind kind);
ErrorKind error_kind_from_string(const std::string& name);

// Base of every transfer failure. what() carries "<kind>: <message>".
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message);
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
private:
    ErrorKind kind_;
    std::string message_;
};

class NotFoundError : public TransferError {
public:
    explicit NotFoundError(const std::string& message) : TransferError(ErrorKind::NOT_FOUND, message) {}
};

class IOError : public TransferError {
public:
    explicit IOError(const std::string& message) : TransferError(ErrorKind::IO, message) {}
};

class IntegrityError : public TransferError {
public:
    explicit IntegrityError(const std::string& message) : TransferError(ErrorKind::INTEGRITY, message) {}
};

class MetadataError : public TransferError {
public:
    explicit MetadataError(const std::string& message) : TransferError(ErrorKind::METADATA, message) {}
};

}
