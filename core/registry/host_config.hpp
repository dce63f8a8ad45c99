#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rfaccess {
namespace registry {

constexpr const char *kDefaultHostAddress = "127.0.0.1";

// One device's reachability and credentials as configured.
// Empty/zero fields fall back to the global defaults when a client is built.
struct HostConfig {
    std::string address;             // Required, unique within a registry
    int port = 0;                    // 0 = use default port
    std::string username;
    std::string password;
    std::string auth_method;         // "", "basic" or "session"
    std::string tls_server_ca_cert;  // CA bundle path

    bool operator==(const HostConfig &other) const {
        return address == other.address && port == other.port && username == other.username &&
               password == other.password && auth_method == other.auth_method &&
               tls_server_ca_cert == other.tls_server_ca_cert;
    }
};

bool validate_host_config(const HostConfig &host, std::string &error);

// Parse a JSON array of host objects and validate every entry
bool parse_host_list(const std::string &json_text, std::vector<HostConfig> &hosts, std::string &error);

// nlohmann::json conversions (address required, other fields optional)
void from_json(const nlohmann::json &j, HostConfig &host);
void to_json(nlohmann::json &j, const HostConfig &host);

}  // namespace registry
}  // namespace rfaccess
