#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include "../registry/host_registry.hpp"

namespace rfaccess {
namespace runtime {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Unset variables leave the target untouched and succeed
bool read_env_int(const char *name, int min, int max, int &value, std::string &error) {
    const char *raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return true;
    }

    std::string text(raw);
    int parsed = 0;
    try {
        size_t consumed = 0;
        parsed = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            error = std::string("invalid integer value for ") + name + ": " + text;
            return false;
        }
    } catch (const std::exception &) {
        error = std::string("invalid integer value for ") + name + ": " + text;
        return false;
    }

    if (parsed < min || parsed > max) {
        error = std::string(name) + " must be between " + std::to_string(min) + " and " + std::to_string(max) +
                ", got: " + std::to_string(parsed);
        return false;
    }
    value = parsed;
    return true;
}

bool read_env_bool(const char *name, bool &value, std::string &error) {
    const char *raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return true;
    }

    std::string text = to_lower(raw);
    if (text == "true" || text == "1" || text == "yes" || text == "on") {
        value = true;
        return true;
    }
    if (text == "false" || text == "0" || text == "no" || text == "off") {
        value = false;
        return true;
    }
    error = std::string("invalid boolean value for ") + name + ": " + raw;
    return false;
}

// Set-but-empty counts as unset
void read_env_string(const char *name, std::string &value) {
    const char *raw = std::getenv(name);
    if (raw != nullptr && *raw != '\0') {
        value = raw;
    }
}

registry::HostConfig parse_host_node(const YAML::Node &node) {
    registry::HostConfig host;
    if (node["address"]) {
        host.address = node["address"].as<std::string>();
    }
    if (node["port"]) {
        host.port = node["port"].as<int>();
    }
    if (node["username"]) {
        host.username = node["username"].as<std::string>();
    }
    if (node["password"]) {
        host.password = node["password"].as<std::string>();
    }
    if (node["auth_method"]) {
        host.auth_method = node["auth_method"].as<std::string>();
    }
    if (node["tls_server_ca_cert"]) {
        host.tls_server_ca_cert = node["tls_server_ca_cert"].as<std::string>();
    }
    return host;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate Redfish defaults
    if (config.redfish.port < 1 || config.redfish.port > 65535) {
        error = "redfish.port must be between 1 and 65535";
        return false;
    }
    if (!redfish::parse_auth_method(config.redfish.auth_method)) {
        error = "Invalid auth_method: " + config.redfish.auth_method + ". Must be one of: basic, session";
        return false;
    }
    if (config.redfish.request_timeout_ms < 1) {
        error = "redfish.request_timeout_ms must be >= 1";
        return false;
    }

    for (size_t i = 0; i < config.redfish.hosts.size(); ++i) {
        std::string host_error;
        if (!registry::validate_host_config(config.redfish.hosts[i], host_error)) {
            error = "Invalid host configuration at index " + std::to_string(i) + ": " + host_error;
            return false;
        }
    }

    // Validate Discovery settings
    if (config.discovery.interval_s < 1 || config.discovery.interval_s > 3600) {
        error = "discovery.interval_s must be between 1 and 3600";
        return false;
    }
    if (config.discovery.timeout_ms < 1) {
        error = "discovery.timeout_ms must be >= 1";
        return false;
    }
    if (config.discovery.buffer_size < 1 || config.discovery.buffer_size > 65535) {
        error = "discovery.buffer_size must be between 1 and 65535";
        return false;
    }

    // Validate Retry settings
    if (config.retry.max_retries < 0) {
        error = "retry.max_retries must be >= 0";
        return false;
    }
    if (config.retry.initial_delay_ms < 0) {
        error = "retry.initial_delay_ms must be >= 0";
        return false;
    }
    if (config.retry.max_delay_ms < config.retry.initial_delay_ms) {
        error = "retry.max_delay_ms must be >= retry.initial_delay_ms";
        return false;
    }
    if (config.retry.backoff_factor < 1.0) {
        error = "retry.backoff_factor must be >= 1.0";
        return false;
    }

    // Validate Logging settings
    auto level = to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error,
                 const logging::LoggerPtr &logger) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"redfish", "discovery", "retry", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN(logger, "[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load Redfish defaults and static hosts
        if (yaml["redfish"]) {
            const auto &rf = yaml["redfish"];
            if (rf["port"]) {
                config.redfish.port = rf["port"].as<int>();
            }
            if (rf["auth_method"]) {
                config.redfish.auth_method = rf["auth_method"].as<std::string>();
            }
            if (rf["username"]) {
                config.redfish.username = rf["username"].as<std::string>();
            }
            if (rf["password"]) {
                config.redfish.password = rf["password"].as<std::string>();
            }
            if (rf["tls_server_ca_cert"]) {
                config.redfish.tls_server_ca_cert = rf["tls_server_ca_cert"].as<std::string>();
            }
            if (rf["insecure_skip_verify"]) {
                config.redfish.insecure_skip_verify = rf["insecure_skip_verify"].as<bool>();
            }
            if (rf["request_timeout_ms"]) {
                config.redfish.request_timeout_ms = rf["request_timeout_ms"].as<int>();
            }

            if (rf["hosts"]) {
                if (!rf["hosts"].IsSequence()) {
                    error = "redfish.hosts must be a sequence";
                    return false;
                }
                config.redfish.hosts.clear();  // Ensure idempotent parsing
                for (const auto &host_node : rf["hosts"]) {
                    config.redfish.hosts.push_back(parse_host_node(host_node));
                }
            }
        }

        // Load discovery config
        if (yaml["discovery"]) {
            const auto &disc = yaml["discovery"];
            if (disc["enabled"]) {
                config.discovery.enabled = disc["enabled"].as<bool>();
            }
            if (disc["interval_s"]) {
                config.discovery.interval_s = disc["interval_s"].as<int>();
            }
            if (disc["timeout_ms"]) {
                config.discovery.timeout_ms = disc["timeout_ms"].as<int>();
            }
            if (disc["buffer_size"]) {
                config.discovery.buffer_size = disc["buffer_size"].as<size_t>();
            }
        }

        // Load retry config
        if (yaml["retry"]) {
            const auto &retry = yaml["retry"];
            if (retry["max_retries"]) {
                config.retry.max_retries = retry["max_retries"].as<int>();
            }
            if (retry["initial_delay_ms"]) {
                config.retry.initial_delay_ms = retry["initial_delay_ms"].as<int>();
            }
            if (retry["max_delay_ms"]) {
                config.retry.max_delay_ms = retry["max_delay_ms"].as<int>();
            }
            if (retry["backoff_factor"]) {
                config.retry.backoff_factor = retry["backoff_factor"].as<double>();
            }
            if (retry["jitter"]) {
                config.retry.jitter = retry["jitter"].as<bool>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        return validate_config(config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool apply_env_overrides(RuntimeConfig &config, std::string &error) {
    read_env_string("REDFISH_HOSTS", config.redfish.hosts_json);

    if (!read_env_int("REDFISH_PORT", 1, 65535, config.redfish.port, error)) {
        return false;
    }

    read_env_string("REDFISH_AUTH_METHOD", config.redfish.auth_method);
    read_env_string("REDFISH_USERNAME", config.redfish.username);
    read_env_string("REDFISH_PASSWORD", config.redfish.password);
    read_env_string("REDFISH_SERVER_CA_CERT", config.redfish.tls_server_ca_cert);

    if (!read_env_bool("REDFISH_INSECURE_SKIP_VERIFY", config.redfish.insecure_skip_verify, error)) {
        return false;
    }
    if (!read_env_bool("REDFISH_DISCOVERY_ENABLED", config.discovery.enabled, error)) {
        return false;
    }
    if (!read_env_int("REDFISH_DISCOVERY_INTERVAL", 1, 3600, config.discovery.interval_s, error)) {
        return false;
    }

    read_env_string("RFACCESS_LOG_LEVEL", config.logging.level);

    return validate_config(config, error);
}

std::vector<registry::HostConfig> resolve_static_hosts(const RuntimeConfig &config,
                                                       const logging::LoggerPtr &logger) {
    if (!config.redfish.hosts_json.empty()) {
        return registry::parse_static_hosts(config.redfish.hosts_json, logger);
    }
    if (config.redfish.hosts.empty()) {
        return registry::parse_static_hosts("", logger);
    }
    return config.redfish.hosts;
}

redfish::ClientConfig make_client_defaults(const RuntimeConfig &config) {
    redfish::ClientConfig defaults;
    defaults.port = config.redfish.port;
    defaults.username = config.redfish.username;
    defaults.password = config.redfish.password;
    auto method = redfish::parse_auth_method(config.redfish.auth_method);
    if (method) {
        defaults.auth_method = *method;
    }
    defaults.tls_server_ca_cert = config.redfish.tls_server_ca_cert;
    defaults.insecure_skip_verify = config.redfish.insecure_skip_verify;
    defaults.request_timeout_ms = config.redfish.request_timeout_ms;
    defaults.retry = config.retry;
    return defaults;
}

void log_config_summary(const RuntimeConfig &config, const logging::LoggerPtr &logger) {
    LOG_INFO(logger, "[Config] Redfish defaults: port " << config.redfish.port << ", auth "
                                                        << config.redfish.auth_method << ", timeout "
                                                        << config.redfish.request_timeout_ms << "ms"
                                                        << (config.redfish.insecure_skip_verify
                                                                ? " (certificate verification DISABLED)"
                                                                : ""));

    std::stringstream discovery_msg;
    discovery_msg << "[Config] Discovery: " << (config.discovery.enabled ? "enabled" : "disabled");
    if (config.discovery.enabled) {
        discovery_msg << " (every " << config.discovery.interval_s << "s, window " << config.discovery.timeout_ms
                      << "ms)";
    }
    LOG_INFO(logger, discovery_msg.str());

    LOG_INFO(logger, "[Config] Retry: max " << config.retry.max_retries << ", initial "
                                            << config.retry.initial_delay_ms << "ms, cap "
                                            << config.retry.max_delay_ms << "ms, factor "
                                            << config.retry.backoff_factor
                                            << (config.retry.jitter ? ", jitter" : ""));

    LOG_INFO(logger, "[Config] Log level: " << config.logging.level);
}

}  // namespace runtime
}  // namespace rfaccess
