#pragma once

/**
 * @file ssdp_discovery.hpp
 * @brief SSDP discovery of Redfish service roots on the local segment
 *
 * One M-SEARCH datagram is sent for the Redfish service type; responses
 * are collected until the discovery window closes. A response is kept
 * only when its AL header names an https URI whose path is /redfish/v1
 * (optional trailing slash). Rejected responses are logged at debug
 * level and never abort the window.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../logging/logger.hpp"

namespace rfaccess {
namespace discovery {

constexpr const char *kSsdpMulticastAddress = "239.255.255.250";
constexpr uint16_t kSsdpPort = 1900;
constexpr int kSsdpMx = 2;
constexpr const char *kRedfishServiceType = "urn:dmtf-org:service:redfish-rest:1";

struct DiscoveryConfig {
    int timeout_ms = 2000;                           // Discovery window
    size_t buffer_size = 1024;                       // Max datagram size read per response
    std::string target_address = kSsdpMulticastAddress;
    uint16_t target_port = kSsdpPort;
    int mx = kSsdpMx;                                // Max response delay requested from devices (s)
    int multicast_ttl = 2;
};

struct DiscoveredHost {
    std::string address;       // Source IP of the response datagram
    std::string service_root;  // Validated AL URI

    bool operator==(const DiscoveredHost &other) const {
        return address == other.address && service_root == other.service_root;
    }
};

// Components of an absolute URI (scheme://authority/path?query#fragment)
struct ParsedUri {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_query = false;
    bool has_fragment = false;
};

// Build the M-SEARCH request text
std::string build_msearch_request(const DiscoveryConfig &config);

// Value of the first AL header (case-insensitive), empty if none
std::string parse_al_header(const std::string &response);

std::optional<ParsedUri> parse_uri(const std::string &uri);

// https scheme, non-empty host, path /redfish/v1 or /redfish/v1/, no query or fragment
bool is_valid_service_root(const std::string &uri, std::string &reason);

class SsdpDiscovery {
public:
    SsdpDiscovery(const DiscoveryConfig &config, logging::LoggerPtr logger);

    // Runs one discovery window. Returns false only when the socket cannot be
    // created or the query cannot be sent; no responses is a successful empty result.
    bool discover(std::vector<DiscoveredHost> &hosts, std::string &error);

    const DiscoveryConfig &config() const { return config_; }

private:
    // Returns the host if the datagram carries a valid service root
    std::optional<DiscoveredHost> evaluate_response(const std::string &response, const std::string &source_ip) const;

    DiscoveryConfig config_;
    logging::LoggerPtr logger_;
};

}  // namespace discovery
}  // namespace rfaccess
