#include "client_config.hpp"

#include <algorithm>
#include <cctype>

namespace rfaccess {
namespace redfish {

std::optional<AuthMethod> parse_auth_method(const std::string &method_str) {
    std::string s = method_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });

    if (s == "basic") {
        return AuthMethod::BASIC;
    }
    if (s == "session") {
        return AuthMethod::SESSION;
    }
    return std::nullopt;
}

std::string auth_method_to_string(AuthMethod method) {
    switch (method) {
        case AuthMethod::BASIC:
            return "basic";
        case AuthMethod::SESSION:
            return "session";
        default:
            return "session";
    }
}

std::string ClientConfig::base_url() const {
    // Bracket bare IPv6 literals
    if (address.find(':') != std::string::npos && address.front() != '[') {
        return "https://[" + address + "]:" + std::to_string(port);
    }
    return "https://" + address + ":" + std::to_string(port);
}

bool validate_client_config(const ClientConfig &config, std::string &error) {
    if (config.address.empty()) {
        error = "client address cannot be empty";
        return false;
    }
    if (config.port < 1 || config.port > 65535) {
        error = "port must be between 1 and 65535, got: " + std::to_string(config.port);
        return false;
    }
    if (config.request_timeout_ms < 1) {
        error = "request timeout must be positive";
        return false;
    }
    if (config.retry.max_retries < 0) {
        error = "max_retries must be >= 0";
        return false;
    }
    if (config.retry.initial_delay_ms < 0 || config.retry.max_delay_ms < 0) {
        error = "retry delays must be >= 0";
        return false;
    }
    if (config.retry.backoff_factor < 1.0) {
        error = "backoff_factor must be >= 1.0";
        return false;
    }
    return true;
}

}  // namespace redfish
}  // namespace rfaccess
