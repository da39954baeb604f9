#pragma once

#include <stdexcept>
#include <string>

namespace objdet {

enum class ErrorKind {
    Internal,
    Load,
    NotReady,
    ServiceUnavailable,
    Decode,
    InvalidParameter,
    InvalidUpload,
    PayloadTooLarge,
    UnknownClass,
    Contract,
    Config
};

// HTTP status the service boundary reports for each kind
int httpStatusFor(ErrorKind kind);
const char* errorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message, ErrorKind kind = ErrorKind::Internal)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    int httpStatus() const { return httpStatusFor(kind_); }

private:
    ErrorKind kind_;
};

// Weights missing, corrupt or incompatible with the configured label table
class LoadError : public Error {
public:
    explicit LoadError(const std::string& message) : Error(message, ErrorKind::Load) {}
};

// infer() called while the handle is not Ready
class NotReadyError : public Error {
public:
    explicit NotReadyError(const std::string& message) : Error(message, ErrorKind::NotReady) {}
};

class ServiceUnavailableError : public Error {
public:
    explicit ServiceUnavailableError(const std::string& message)
        : Error(message, ErrorKind::ServiceUnavailable) {}
};

class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message) : Error(message, ErrorKind::Decode) {}
};

class InvalidParameterError : public Error {
public:
    explicit InvalidParameterError(const std::string& message)
        : Error(message, ErrorKind::InvalidParameter) {}
};

class InvalidUploadError : public Error {
public:
    explicit InvalidUploadError(const std::string& message)
        : Error(message, ErrorKind::InvalidUpload) {}
};

class PayloadTooLargeError : public Error {
public:
    explicit PayloadTooLargeError(const std::string& message)
        : Error(message, ErrorKind::PayloadTooLarge) {}
};

// Detector produced a class index its label table does not cover
class UnknownClassError : public Error {
public:
    explicit UnknownClassError(const std::string& message)
        : Error(message, ErrorKind::UnknownClass) {}
};

// Detector output breaks the score or box contract
class ContractError : public Error {
public:
    explicit ContractError(const std::string& message) : Error(message, ErrorKind::Contract) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message, ErrorKind::Config) {}
};

} // namespace objdet
