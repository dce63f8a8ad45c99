#include "device_access.hpp"

#include <algorithm>
#include <cctype>

namespace rfaccess {
namespace access {

namespace {

constexpr const char *kHttpsPrefix = "https://";

bool is_valid_port(const std::string &port) {
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    int value = std::stoi(port);
    return value >= 1 && value <= 65535;
}

}  // namespace

bool parse_resource_url(const std::string &url, ResourceUrl &parsed, std::string &error) {
    const std::string prefix(kHttpsPrefix);
    if (url.compare(0, prefix.size(), prefix) != 0) {
        error = "URL must use HTTPS";
        return false;
    }

    std::string rest = url.substr(prefix.size());
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        error = "URL has no resource path";
        return false;
    }

    std::string authority = rest.substr(0, slash);
    ResourceUrl result;
    result.path = rest.substr(slash);

    if (!authority.empty() && authority.front() == '[') {
        // [v6-literal] or [v6-literal]:port
        auto close = authority.find(']');
        if (close == std::string::npos) {
            error = "unterminated IPv6 address in URL";
            return false;
        }
        result.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                error = "invalid authority in URL: " + authority;
                return false;
            }
            result.port = tail.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            result.port = authority.substr(colon + 1);
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty()) {
        error = "empty server address";
        return false;
    }
    if (!result.port.empty() && !is_valid_port(result.port)) {
        error = "invalid port in URL: " + result.port;
        return false;
    }

    parsed = result;
    return true;
}

DeviceAccess::DeviceAccess(std::shared_ptr<registry::HostRegistry> registry, redfish::ClientConfig defaults,
                           logging::LoggerPtr logger, ClientFactory factory)
    : registry_(std::move(registry)),
      defaults_(std::move(defaults)),
      logger_(std::move(logger)),
      factory_(std::move(factory)) {
    if (!factory_) {
        auto factory_logger = logger_;
        factory_ = [factory_logger](const redfish::ClientConfig &config) {
            return std::make_unique<redfish::RedfishClient>(config, factory_logger);
        };
    }
}

std::vector<std::string> DeviceAccess::list_addresses() const { return registry_->get_addresses(); }

std::optional<redfish::ClientConfig> DeviceAccess::resolve(const std::string &address) const {
    auto host = registry_->get_host_by_address(address);
    if (!host) {
        return std::nullopt;
    }

    redfish::ClientConfig config = defaults_;
    config.address = host->address;

    if (host->port != 0) {
        config.port = host->port;
    }
    if (!host->username.empty()) {
        config.username = host->username;
    }
    if (!host->password.empty()) {
        config.password = host->password;
    }
    if (!host->auth_method.empty()) {
        // Validated when the host entry was loaded
        auto method = redfish::parse_auth_method(host->auth_method);
        if (method) {
            config.auth_method = *method;
        }
    }
    if (!host->tls_server_ca_cert.empty()) {
        config.tls_server_ca_cert = host->tls_server_ca_cert;
    }

    return config;
}

bool DeviceAccess::execute(const redfish::ClientConfig &config, const std::string &resource_path,
                           redfish::RedfishResponse &response, redfish::Error &error) const {
    auto client = factory_(config);
    if (!client) {
        error = redfish::make_error(redfish::ErrorKind::CONFIGURATION, "failed to create client for " + config.address);
        return false;
    }

    bool ok = client->login(error);
    if (!ok) {
        LOG_ERROR(logger_, "[Access] Login to " << config.address << " failed: " << error.to_string());
    } else {
        ok = client->get_with_headers(resource_path, response, error);
        if (!ok) {
            LOG_ERROR(logger_, "[Access] GET " << resource_path << " on " << config.address
                                               << " failed: " << error.to_string());
        }
    }

    client->close();
    return ok;
}

ResourceResult DeviceAccess::get_resource(const std::string &url) const {
    ResourceResult result;

    ResourceUrl parsed;
    std::string parse_error;
    if (!parse_resource_url(url, parsed, parse_error)) {
        result.status_code = StatusCode::INVALID_ARGUMENT;
        result.error_message = "invalid Redfish URL: " + parse_error;
        return result;
    }

    std::optional<redfish::ClientConfig> config;
    bool host_pins_port = false;
    if (!parsed.port.empty()) {
        auto host = registry_->get_host_by_address(parsed.host + ":" + parsed.port);
        if (host) {
            config = resolve(host->address);
            host_pins_port = host->port != 0;
            // Entry registered as "host:port": connect to the bare host
            if (config) {
                config->address = parsed.host;
            }
        }
    }
    if (!config) {
        auto host = registry_->get_host_by_address(parsed.host);
        if (host) {
            config = resolve(host->address);
            host_pins_port = host->port != 0;
        }
    }
    // Port given in the URL applies unless the host entry pins one
    if (config && !parsed.port.empty() && !host_pins_port) {
        config->port = std::stoi(parsed.port);
    }
    if (!config) {
        result.status_code = StatusCode::NOT_FOUND;
        result.error_message = "server " + parsed.host + " not found in configuration";
        return result;
    }

    LOG_INFO(logger_, "[Access] GET " << parsed.path << " on " << config->address << ":" << config->port);

    redfish::Error error;
    if (!execute(*config, parsed.path, result.response, error)) {
        result.status_code = status_from_error(error);
        result.error_message = error.to_string();
        return result;
    }

    result.success = true;
    result.status_code = StatusCode::OK;
    return result;
}

}  // namespace access
}  // namespace rfaccess
