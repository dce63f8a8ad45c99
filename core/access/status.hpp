#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "../redfish/errors.hpp"

namespace rfaccess {
namespace access {

/**
 * @brief Tool reply status codes
 *
 * - OK               -> request served
 * - INVALID_ARGUMENT -> malformed request, URL or tool arguments
 * - NOT_FOUND        -> unknown host, unknown tool, or device answered 404
 * - UNAVAILABLE      -> device unreachable, login failed, device error
 * - INTERNAL         -> unusable configuration or unexpected failure
 */
enum class StatusCode { OK, INVALID_ARGUMENT, NOT_FOUND, UNAVAILABLE, INTERNAL };

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

// Map a protocol client failure onto a reply status
inline StatusCode status_from_error(const redfish::Error &error) {
    switch (error.kind) {
        case redfish::ErrorKind::CONFIGURATION:
            return StatusCode::INTERNAL;
        case redfish::ErrorKind::PROTOCOL:
            return error.http_status == 404 ? StatusCode::NOT_FOUND : StatusCode::UNAVAILABLE;
        default:
            return StatusCode::UNAVAILABLE;
    }
}

/**
 * @brief Build a JSON status object
 *
 * Every reply carries a top-level "status" object with code and message.
 */
inline nlohmann::json make_status(StatusCode code, const std::string &message = "") {
    std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
    return {{"code", status_code_to_string(code)}, {"message", msg}};
}

}  // namespace access
}  // namespace rfaccess
