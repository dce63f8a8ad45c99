#pragma once

#include <string>

namespace rfaccess {
namespace redfish {

/**
 * @brief Failure classes surfaced by the device access layer
 *
 * - CONFIGURATION  -> unusable client parameters (never retried)
 * - TRANSPORT      -> connection, TLS or timeout failure (retried)
 * - PROTOCOL       -> device answered with HTTP status >= 400 (4xx not retried)
 * - AUTHENTICATION -> session login produced no token
 * - CANCELLED      -> caller cancelled the operation
 */
enum class ErrorKind {
    CONFIGURATION,
    TRANSPORT,
    PROTOCOL,
    AUTHENTICATION,
    CANCELLED
};

struct Error {
    ErrorKind kind = ErrorKind::TRANSPORT;
    int http_status = 0;  // 0 when no HTTP response was received
    std::string message;

    std::string to_string() const;
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:
            return "CONFIGURATION";
        case ErrorKind::TRANSPORT:
            return "TRANSPORT";
        case ErrorKind::PROTOCOL:
            return "PROTOCOL";
        case ErrorKind::AUTHENTICATION:
            return "AUTHENTICATION";
        case ErrorKind::CANCELLED:
            return "CANCELLED";
        default:
            return "TRANSPORT";
    }
}

inline std::string Error::to_string() const { return error_kind_to_string(kind) + ": " + message; }

inline Error make_error(ErrorKind kind, const std::string &message, int http_status = 0) {
    Error error;
    error.kind = kind;
    error.http_status = http_status;
    error.message = message;
    return error;
}

// Client-side rejections (4xx) are request/config problems; retrying cannot help.
inline bool is_client_error_status(int status) { return status >= 400 && status < 500; }

inline bool is_retryable(const Error &error) {
    switch (error.kind) {
        case ErrorKind::PROTOCOL:
            return !is_client_error_status(error.http_status);
        case ErrorKind::CONFIGURATION:
        case ErrorKind::CANCELLED:
            return false;
        default:
            return true;
    }
}

}  // namespace redfish
}  // namespace rfaccess
