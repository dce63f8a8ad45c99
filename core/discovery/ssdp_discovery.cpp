#include "ssdp_discovery.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <unordered_set>

#include "../net/udp_socket.hpp"

namespace rfaccess {
namespace discovery {

namespace {

std::string trim(const std::string &s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool is_all_digits(const std::string &s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

std::string build_msearch_request(const DiscoveryConfig &config) {
    std::ostringstream message;
    message << "M-SEARCH * HTTP/1.1\r\n"
            << "HOST: " << kSsdpMulticastAddress << ":" << kSsdpPort << "\r\n"
            << "MAN: \"ssdp:discover\"\r\n"
            << "MX: " << config.mx << "\r\n"
            << "ST: " << kRedfishServiceType << "\r\n\r\n";
    return message.str();
}

std::string parse_al_header(const std::string &response) {
    std::istringstream stream(response);
    std::string line;
    while (std::getline(stream, line, '\n')) {
        line = trim(line);
        if (line.size() < 3) {
            continue;
        }
        if (std::tolower(static_cast<unsigned char>(line[0])) != 'a' ||
            std::tolower(static_cast<unsigned char>(line[1])) != 'l' || line[2] != ':') {
            continue;
        }

        std::string value = trim(line.substr(3));
        if (!value.empty()) {
            return value;
        }
    }
    return "";
}

std::optional<ParsedUri> parse_uri(const std::string &uri) {
    // Split by hand: scheme "://" authority path ["?" query] ["#" fragment]
    auto scheme_end = uri.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    ParsedUri parsed;
    parsed.scheme = uri.substr(0, scheme_end);
    if (!std::isalpha(static_cast<unsigned char>(parsed.scheme.front())) ||
        !std::all_of(parsed.scheme.begin(), parsed.scheme.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
        })) {
        return std::nullopt;
    }

    std::string rest = uri.substr(scheme_end + 3);

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        parsed.has_fragment = true;
        parsed.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }

    auto question = rest.find('?');
    if (question != std::string::npos) {
        parsed.has_query = true;
        parsed.query = rest.substr(question + 1);
        rest.erase(question);
    }

    auto path_start = rest.find('/');
    std::string authority = path_start == std::string::npos ? rest : rest.substr(0, path_start);
    parsed.path = path_start == std::string::npos ? std::string() : rest.substr(path_start);

    if (std::any_of(authority.begin(), authority.end(), [](unsigned char c) { return std::isspace(c); })) {
        return std::nullopt;
    }

    // Authority: [userinfo@]host[:port]
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return std::nullopt;
            }
            parsed.port = tail.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parsed.host = authority.substr(0, colon);
            parsed.port = authority.substr(colon + 1);
        } else {
            parsed.host = authority;
        }
    }

    if (!is_all_digits(parsed.port)) {
        return std::nullopt;
    }
    return parsed;
}

bool is_valid_service_root(const std::string &uri, std::string &reason) {
    auto parsed = parse_uri(uri);
    if (!parsed) {
        reason = "parse error";
        return false;
    }

    if (parsed->scheme != "https") {
        reason = "not https";
        return false;
    }

    if (parsed->host.empty()) {
        reason = "missing host";
        return false;
    }

    if (parsed->path != "/redfish/v1" && parsed->path != "/redfish/v1/") {
        reason = "invalid path '" + parsed->path + "'";
        return false;
    }

    if (parsed->has_query || parsed->has_fragment) {
        reason = "unexpected query or fragment";
        return false;
    }

    return true;
}

SsdpDiscovery::SsdpDiscovery(const DiscoveryConfig &config, logging::LoggerPtr logger)
    : config_(config), logger_(std::move(logger)) {}

bool SsdpDiscovery::discover(std::vector<DiscoveredHost> &hosts, std::string &error) {
    LOG_INFO(logger_, "[Discovery] Starting SSDP discovery");
    hosts.clear();

    net::UdpSocket socket;
    if (!socket.is_valid()) {
        error = "failed to create UDP socket: " + socket.last_error_string();
        return false;
    }

    if (!socket.bind(0)) {
        error = "failed to bind UDP socket: " + socket.last_error_string();
        return false;
    }

    if (!socket.set_multicast_ttl(config_.multicast_ttl)) {
        LOG_WARN(logger_, "[Discovery] Could not set multicast TTL: " << socket.last_error_string());
    }

    const std::string message = build_msearch_request(config_);
    const net::SocketAddress target(config_.target_address, config_.target_port);
    if (socket.send_to(target, message.data(), message.size()) < 0) {
        error = "failed to send M-SEARCH to " + target.to_string() + ": " + socket.last_error_string();
        return false;
    }

    LOG_INFO(logger_, "[Discovery] M-SEARCH sent to " << target.to_string() << ", waiting for responses");

    std::vector<char> buffer(std::max<size_t>(config_.buffer_size, 1));
    std::unordered_set<std::string> seen_addresses;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);

    while (true) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            LOG_DEBUG(logger_, "[Discovery] Discovery window closed");
            break;
        }

        net::SocketAddress sender;
        int received = socket.receive_from(buffer.data(), buffer.size(), static_cast<int>(remaining.count()), sender);
        if (received < 0) {
            LOG_WARN(logger_, "[Discovery] Error reading SSDP response: " << socket.last_error_string());
            continue;
        }
        if (received == 0) {
            continue;
        }

        std::string response(buffer.data(), static_cast<size_t>(received));
        auto host = evaluate_response(response, sender.ip);
        if (!host) {
            continue;
        }

        if (!seen_addresses.insert(host->address).second) {
            LOG_DEBUG(logger_, "[Discovery] Duplicate response from " << host->address << " ignored");
            continue;
        }

        LOG_INFO(logger_, "[Discovery] Discovered Redfish endpoint " << host->address << " (" << host->service_root
                                                                     << ")");
        hosts.push_back(std::move(*host));
    }

    LOG_INFO(logger_, "[Discovery] SSDP discovery completed, hosts found: " << hosts.size());
    return true;
}

std::optional<DiscoveredHost> SsdpDiscovery::evaluate_response(const std::string &response,
                                                               const std::string &source_ip) const {
    std::string al = parse_al_header(response);
    if (al.empty()) {
        LOG_DEBUG(logger_, "[Discovery] Response from " << source_ip << " has no AL header");
        return std::nullopt;
    }

    std::string reason;
    if (!is_valid_service_root(al, reason)) {
        LOG_DEBUG(logger_, "[Discovery] Service root '" << al << "' from " << source_ip << " rejected (" << reason
                                                        << ")");
        return std::nullopt;
    }

    return DiscoveredHost{source_ip, al};
}

}  // namespace discovery
}  // namespace rfaccess
