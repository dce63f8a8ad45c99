#ifndef RFACCESS_ACCESS_DEVICE_ACCESS_HPP
#define RFACCESS_ACCESS_DEVICE_ACCESS_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../logging/logger.hpp"
#include "../redfish/client_config.hpp"
#include "../redfish/redfish_client.hpp"
#include "../registry/host_registry.hpp"
#include "status.hpp"

namespace rfaccess {
namespace access {

// Result of get_resource()
struct ResourceResult {
    bool success = false;
    std::string error_message;
    StatusCode status_code = StatusCode::OK;
    redfish::RedfishResponse response;
};

// "https://host[:port]/path" split into its parts
struct ResourceUrl {
    std::string host;
    std::string port;  // Empty when absent
    std::string path;
};

bool parse_resource_url(const std::string &url, ResourceUrl &parsed, std::string &error);

// Builds a protocol client for one resolved endpoint (tests inject mocks here)
using ClientFactory = std::function<std::unique_ptr<redfish::RedfishClient>(const redfish::ClientConfig &)>;

/**
 * @brief Resolves addresses through the host registry and runs one
 * request-scoped protocol client per call
 *
 * `defaults` carries the global settings. Its address is ignored; port,
 * credentials, auth method and CA path are used only where the host entry
 * leaves them empty/zero. Retry, skip-verify and timeout always come from
 * `defaults`.
 *
 * Thread-safe: the only shared state is the registry.
 */
class DeviceAccess {
public:
    DeviceAccess(std::shared_ptr<registry::HostRegistry> registry, redfish::ClientConfig defaults,
                 logging::LoggerPtr logger, ClientFactory factory = nullptr);

    std::vector<std::string> list_addresses() const;

    std::optional<redfish::ClientConfig> resolve(const std::string &address) const;

    // login -> get_with_headers -> close (close runs on every path)
    bool execute(const redfish::ClientConfig &config, const std::string &resource_path,
                 redfish::RedfishResponse &response, redfish::Error &error) const;

    // Parse the URL, resolve "host:port" then "host", then execute
    ResourceResult get_resource(const std::string &url) const;

    const redfish::ClientConfig &defaults() const { return defaults_; }

private:
    std::shared_ptr<registry::HostRegistry> registry_;
    redfish::ClientConfig defaults_;
    logging::LoggerPtr logger_;
    ClientFactory factory_;
};

}  // namespace access
}  // namespace rfaccess

#endif  // RFACCESS_ACCESS_DEVICE_ACCESS_HPP
