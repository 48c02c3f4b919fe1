#pragma once

#include <stdexcept>
#include <string>

namespace proxykeeper::util {

enum class ErrorCode {
    notFound,
    unknownStatus,
    unavailable
};

const char* toString(ErrorCode code) noexcept;

class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Referenced proxy, source or provider does not exist.
class NotFoundError : public PoolError {
public:
    explicit NotFoundError(const std::string& message)
        : PoolError(ErrorCode::notFound, message) {}
};

// Reported status code is missing from the status catalog.
class UnknownStatusError : public PoolError {
public:
    explicit UnknownStatusError(int statusCode);

    int statusCode() const noexcept { return statusCode_; }

private:
    int statusCode_;
};

// Backing storage could not be reached or failed mid-operation.
class UnavailableError : public PoolError {
public:
    explicit UnavailableError(const std::string& message)
        : PoolError(ErrorCode::unavailable, message) {}
};

} // namespace proxykeeper::util
