/**
 * @file BackendError.hpp
 * @brief Failure taxonomy of reasoning backends.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace draftlens::domain {

enum class BackendErrorCode {
    InvalidCredential,    ///< Authentication rejected. Never retried.
    RateLimitTimeout,     ///< Admission controller wait budget exhausted.
    MaxRetriesExceeded,   ///< Transient failures persisted through every attempt.
    RequestRejected,      ///< Non-transient client error other than authentication.
    ParseError,           ///< Payload is not JSON or lacks the required shape. Never retried.
    InvalidConfiguration  ///< Adapter could not be constructed from its configuration.
};

inline std::string BackendErrorCodeToString(BackendErrorCode code) {
    switch (code) {
        case BackendErrorCode::InvalidCredential: return "INVALID_CREDENTIAL";
        case BackendErrorCode::RateLimitTimeout: return "RATE_LIMIT_TIMEOUT";
        case BackendErrorCode::MaxRetriesExceeded: return "MAX_RETRIES_EXCEEDED";
        case BackendErrorCode::RequestRejected: return "REQUEST_REJECTED";
        case BackendErrorCode::ParseError: return "PARSE_ERROR";
        case BackendErrorCode::InvalidConfiguration: return "INVALID_CONFIGURATION";
    }
    return "UNKNOWN";
}

/**
 * @class BackendError
 * @brief Exception raised by backend adapters.
 */
class BackendError : public std::runtime_error {
public:
    BackendError(BackendErrorCode code, const std::string& message, int httpStatus = 0)
        : std::runtime_error(message), m_code(code), m_httpStatus(httpStatus) {}

    BackendErrorCode code() const { return m_code; }

    /** @brief HTTP status of the failing response, 0 when there was none. */
    int httpStatus() const { return m_httpStatus; }

private:
    BackendErrorCode m_code;
    int m_httpStatus;
};

} // namespace draftlens::domain
