#pragma once

#include <string>
#include <utility>

namespace warden {

enum class ErrorCode {
    OK = 0,
    POLICY_VIOLATION,
    TIMEOUT,
    RESOURCE_EXCEEDED,
    RUNTIME_ERROR,
    SANDBOX_UNAVAILABLE,
    SESSION_BUSY,
    CANCELLED,
    NOT_FOUND,
    INVALID_CONFIG,
    PARSE_ERROR,
    IO_ERROR,
    INTERNAL_ERROR
};

const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::OK) {}
    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

}
