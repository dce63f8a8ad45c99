#include "host_config.hpp"

#include "../redfish/client_config.hpp"

namespace rfaccess {
namespace registry {

bool validate_host_config(const HostConfig &host, std::string &error) {
    if (host.address.empty()) {
        error = "host address cannot be empty";
        return false;
    }

    if (host.port != 0 && (host.port < 1 || host.port > 65535)) {
        error = "port must be between 1 and 65535, got: " + std::to_string(host.port);
        return false;
    }

    if (!host.auth_method.empty() && !redfish::parse_auth_method(host.auth_method)) {
        error = "invalid auth_method: " + host.auth_method + ". Must be one of: basic, session";
        return false;
    }

    return true;
}

void from_json(const nlohmann::json &j, HostConfig &host) {
    j.at("address").get_to(host.address);
    host.port = j.value("port", 0);
    host.username = j.value("username", std::string());
    host.password = j.value("password", std::string());
    host.auth_method = j.value("auth_method", std::string());
    host.tls_server_ca_cert = j.value("tls_server_ca_cert", std::string());
}

void to_json(nlohmann::json &j, const HostConfig &host) {
    j = nlohmann::json{{"address", host.address}};
    if (host.port != 0) {
        j["port"] = host.port;
    }
    if (!host.username.empty()) {
        j["username"] = host.username;
    }
    if (!host.auth_method.empty()) {
        j["auth_method"] = host.auth_method;
    }
    if (!host.tls_server_ca_cert.empty()) {
        j["tls_server_ca_cert"] = host.tls_server_ca_cert;
    }
    // Password intentionally not serialised
}

bool parse_host_list(const std::string &json_text, std::vector<HostConfig> &hosts, std::string &error) {
    std::vector<HostConfig> parsed;
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_array()) {
            error = "host list must be a JSON array";
            return false;
        }
        parsed = j.get<std::vector<HostConfig>>();
    } catch (const nlohmann::json::exception &e) {
        error = std::string("invalid host list JSON: ") + e.what();
        return false;
    }

    for (size_t i = 0; i < parsed.size(); ++i) {
        std::string host_error;
        if (!validate_host_config(parsed[i], host_error)) {
            error = "invalid host configuration at index " + std::to_string(i) + ": " + host_error;
            return false;
        }
    }

    hosts = std::move(parsed);
    return true;
}

}  // namespace registry
}  // namespace rfaccess
