#include "proxykeeper/util/Errors.hpp"

namespace proxykeeper::util {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::notFound:      return "not_found";
    case ErrorCode::unknownStatus: return "unknown_status";
    case ErrorCode::unavailable:   return "unavailable";
    }
    return "unknown";
}

UnknownStatusError::UnknownStatusError(int statusCode)
    : PoolError(ErrorCode::unknownStatus, "Unknown status code " + std::to_string(statusCode))
    , statusCode_(statusCode) {}

} // namespace proxykeeper::util
