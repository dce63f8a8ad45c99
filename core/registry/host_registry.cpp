#include "host_registry.hpp"

#include <mutex>
#include <unordered_map>

namespace rfaccess {
namespace registry {

std::vector<HostConfig> parse_static_hosts(const std::string &json_text, const logging::LoggerPtr &logger) {
    std::vector<HostConfig> hosts;
    if (json_text.empty()) {
        HostConfig fallback;
        fallback.address = kDefaultHostAddress;
        hosts.push_back(fallback);
        return hosts;
    }

    std::string error;
    if (!parse_host_list(json_text, hosts, error)) {
        LOG_ERROR(logger, "[Registry] Failed to parse static hosts: " << error << " (falling back to "
                                                                       << kDefaultHostAddress << ")");
        HostConfig fallback;
        fallback.address = kDefaultHostAddress;
        hosts.assign(1, fallback);
    }
    return hosts;
}

HostRegistry::HostRegistry(std::vector<HostConfig> static_hosts, logging::LoggerPtr logger)
    : static_hosts_(std::move(static_hosts)), logger_(std::move(logger)) {
    LOG_INFO(logger_, "[Registry] Loaded static hosts: " << static_hosts_.size());
}

void HostRegistry::update_discovered_hosts(std::vector<discovery::DiscoveredHost> hosts) {
    size_t count = hosts.size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        discovered_hosts_.swap(hosts);
    }
    // Old snapshot is released outside the lock
    LOG_INFO(logger_, "[Registry] Updated discovered hosts: " << count);
}

std::vector<HostConfig> HostRegistry::get_hosts() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::unordered_map<std::string, HostConfig> all_hosts;
    all_hosts.reserve(static_hosts_.size() + discovered_hosts_.size());

    // Static entries first so they win over discovery; among duplicate
    // static entries the last one wins
    for (const auto &host : static_hosts_) {
        all_hosts.insert_or_assign(host.address, host);
    }

    for (const auto &discovered : discovered_hosts_) {
        if (all_hosts.find(discovered.address) == all_hosts.end()) {
            HostConfig host;
            host.address = discovered.address;
            all_hosts.emplace(discovered.address, host);
        }
    }

    std::vector<HostConfig> result;
    result.reserve(all_hosts.size());
    for (auto &entry : all_hosts) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

std::optional<HostConfig> HostRegistry::get_host_by_address(const std::string &address) const {
    for (auto &host : get_hosts()) {
        if (host.address == address) {
            return host;
        }
    }
    return std::nullopt;
}

std::vector<std::string> HostRegistry::get_addresses() const {
    auto hosts = get_hosts();
    std::vector<std::string> addresses;
    addresses.reserve(hosts.size());
    for (const auto &host : hosts) {
        addresses.push_back(host.address);
    }
    return addresses;
}

size_t HostRegistry::static_host_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_hosts_.size();
}

size_t HostRegistry::discovered_host_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return discovered_hosts_.size();
}

}  // namespace registry
}  // namespace rfaccess
