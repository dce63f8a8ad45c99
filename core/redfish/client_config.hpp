#pragma once

#include <optional>
#include <string>

namespace rfaccess {
namespace redfish {

enum class AuthMethod { BASIC, SESSION };

std::optional<AuthMethod> parse_auth_method(const std::string &method_str);
std::string auth_method_to_string(AuthMethod method);

struct RetryConfig {
    int max_retries = 3;             // Retries after the first attempt
    int initial_delay_ms = 1000;     // Delay before the first retry
    int max_delay_ms = 60000;        // Cap for any single delay
    double backoff_factor = 2.0;     // Growth per retry
    bool jitter = true;              // Add up to 10% random extra delay
};

// Fully resolved parameters for one RedfishClient instance
struct ClientConfig {
    std::string address;
    int port = 443;
    std::string username;
    std::string password;
    AuthMethod auth_method = AuthMethod::SESSION;
    std::string tls_server_ca_cert;     // CA bundle path (empty = system default)
    bool insecure_skip_verify = false;  // Disable server certificate verification
    int request_timeout_ms = 30000;     // Connect/read/write timeout per HTTP exchange
    RetryConfig retry;

    // "https://address:port"
    std::string base_url() const;
};

// Returns false with a message when the config cannot drive a client
bool validate_client_config(const ClientConfig &config, std::string &error);

}  // namespace redfish
}  // namespace rfaccess
