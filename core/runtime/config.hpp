#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../logging/logger.hpp"
#include "../redfish/client_config.hpp"
#include "../registry/host_config.hpp"

namespace rfaccess {
namespace runtime {

constexpr const char *kDefaultConfigPath = "rfaccess.yaml";

// Global Redfish defaults (redfish: in YAML). Host entries that leave a
// field empty/zero inherit it from here.
struct RedfishSettings {
    int port = 443;
    std::string auth_method = "session";  // basic | session
    std::string username;
    std::string password;
    std::string tls_server_ca_cert;
    bool insecure_skip_verify = false;
    int request_timeout_ms = 30000;

    std::vector<registry::HostConfig> hosts;  // From YAML
    std::string hosts_json;                   // Raw REDFISH_HOSTS (replaces hosts when set)
};

struct DiscoverySettings {
    bool enabled = false;
    int interval_s = 30;        // 1-3600
    int timeout_ms = 2000;      // Discovery window per cycle
    size_t buffer_size = 1024;  // Max SSDP datagram size
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    RedfishSettings redfish;
    DiscoverySettings discovery;
    redfish::RetryConfig retry;
    LoggingConfig logging;
};

// Loads configuration from a YAML file (unknown top-level keys are warned about)
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error,
                 const logging::LoggerPtr &logger = nullptr);

// Applies REDFISH_* / RFACCESS_LOG_LEVEL environment variables on top of config
bool apply_env_overrides(RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

// Static host list for the registry: REDFISH_HOSTS if set (falls back to
// the default host when unparsable), else YAML hosts, else the default host
std::vector<registry::HostConfig> resolve_static_hosts(const RuntimeConfig &config, const logging::LoggerPtr &logger);

// Global defaults as a client config template (address left empty)
redfish::ClientConfig make_client_defaults(const RuntimeConfig &config);

// Logs a one-line summary per section
void log_config_summary(const RuntimeConfig &config, const logging::LoggerPtr &logger);

}  // namespace runtime
}  // namespace rfaccess
