#ifndef RFACCESS_REGISTRY_HOST_REGISTRY_HPP
#define RFACCESS_REGISTRY_HOST_REGISTRY_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "../discovery/ssdp_discovery.hpp"
#include "../logging/logger.hpp"
#include "host_config.hpp"

namespace rfaccess {
namespace registry {

// Parse the static host list; on any failure log it and fall back to
// a single default host instead of failing hard.
std::vector<HostConfig> parse_static_hosts(const std::string &json_text, const logging::LoggerPtr &logger);

// Host Registry - single source of truth for known hosts
/**
 * Thread Safety:
 * - All read methods use shared_lock (concurrent reads safe)
 * - update_discovered_hosts() uses unique_lock and swaps the list wholesale
 * - Returns by-value so callers never observe a half-applied update
 *
 * Merge rules:
 * - Static hosts always win for a given address
 * - Discovered hosts contribute only their address (credentials come from defaults)
 * - Result order is unspecified; only address uniqueness is guaranteed
 */
class HostRegistry {
public:
    HostRegistry(std::vector<HostConfig> static_hosts, logging::LoggerPtr logger);

    // Replace the discovered snapshot (taking ownership)
    void update_discovered_hosts(std::vector<discovery::DiscoveredHost> hosts);

    // Merged, de-duplicated view
    std::vector<HostConfig> get_hosts() const;
    std::optional<HostConfig> get_host_by_address(const std::string &address) const;
    std::vector<std::string> get_addresses() const;

    size_t static_host_count() const;
    size_t discovered_host_count() const;

private:
    std::vector<HostConfig> static_hosts_;
    std::vector<discovery::DiscoveredHost> discovered_hosts_;
    logging::LoggerPtr logger_;

    // Thread safety: shared_mutex allows concurrent reads, exclusive writes
    mutable std::shared_mutex mutex_;
};

}  // namespace registry
}  // namespace rfaccess

#endif  // RFACCESS_REGISTRY_HOST_REGISTRY_HPP
