#include "registry/host_registry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace rfaccess;
using namespace rfaccess::registry;
using namespace testing;

namespace {

HostConfig make_host(const std::string &address, const std::string &username = "") {
    HostConfig host;
    host.address = address;
    host.username = username;
    return host;
}

std::optional<HostConfig> find_host(const std::vector<HostConfig> &hosts, const std::string &address) {
    auto it = std::find_if(hosts.begin(), hosts.end(), [&](const HostConfig &h) { return h.address == address; });
    if (it == hosts.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace

TEST(HostRegistryTest, StaticHostsOnly) {
    HostRegistry registry({make_host("10.0.0.5", "admin"), make_host("10.0.0.6")}, nullptr);

    auto hosts = registry.get_hosts();
    EXPECT_EQ(hosts.size(), 2u);
    EXPECT_THAT(registry.get_addresses(), UnorderedElementsAre("10.0.0.5", "10.0.0.6"));
    EXPECT_EQ(registry.static_host_count(), 2u);
    EXPECT_EQ(registry.discovered_host_count(), 0u);
}

TEST(HostRegistryTest, StaticHostWinsOverDiscoveredDuplicate) {
    HostRegistry registry({make_host("10.0.0.5", "admin")}, nullptr);
    registry.update_discovered_hosts({{"10.0.0.5", "https://10.0.0.5/redfish/v1"},
                                      {"10.0.0.9", "https://10.0.0.9/redfish/v1/"}});

    auto hosts = registry.get_hosts();
    ASSERT_EQ(hosts.size(), 2u);

    auto static_host = find_host(hosts, "10.0.0.5");
    ASSERT_TRUE(static_host.has_value());
    EXPECT_EQ(static_host->username, "admin");

    auto discovered = find_host(hosts, "10.0.0.9");
    ASSERT_TRUE(discovered.has_value());
    EXPECT_TRUE(discovered->username.empty());
    EXPECT_EQ(discovered->port, 0);
}

TEST(HostRegistryTest, DiscoveredSnapshotReplacedWholesale) {
    HostRegistry registry({}, nullptr);
    registry.update_discovered_hosts({{"10.0.0.7", "https://10.0.0.7/redfish/v1"},
                                      {"10.0.0.8", "https://10.0.0.8/redfish/v1"}});
    EXPECT_EQ(registry.discovered_host_count(), 2u);

    registry.update_discovered_hosts({{"10.0.0.9", "https://10.0.0.9/redfish/v1"}});
    EXPECT_THAT(registry.get_addresses(), ElementsAre("10.0.0.9"));

    registry.update_discovered_hosts({});
    EXPECT_TRUE(registry.get_hosts().empty());
}

TEST(HostRegistryTest, AddressesAreUnique) {
    HostRegistry registry({make_host("10.0.0.5"), make_host("10.0.0.5", "second")}, nullptr);
    registry.update_discovered_hosts({{"10.0.0.5", "https://10.0.0.5/redfish/v1"}});

    auto addresses = registry.get_addresses();
    EXPECT_THAT(addresses, ElementsAre("10.0.0.5"));
}

TEST(HostRegistryTest, LastDuplicateStaticEntryWins) {
    auto hosts = parse_static_hosts(
        R"([{"address":"10.0.0.5","username":"old"},{"address":"10.0.0.5","username":"new"}])", nullptr);
    HostRegistry registry(hosts, nullptr);
    registry.update_discovered_hosts({{"10.0.0.5", "https://10.0.0.5/redfish/v1"}});

    ASSERT_EQ(registry.get_hosts().size(), 1u);
    auto host = registry.get_host_by_address("10.0.0.5");
    ASSERT_TRUE(host.has_value());
    EXPECT_EQ(host->username, "new");
}

TEST(HostRegistryTest, LookupByAddress) {
    HostRegistry registry({make_host("10.0.0.5", "admin")}, nullptr);
    registry.update_discovered_hosts({{"10.0.0.9", "https://10.0.0.9/redfish/v1"}});

    auto host = registry.get_host_by_address("10.0.0.5");
    ASSERT_TRUE(host.has_value());
    EXPECT_EQ(host->username, "admin");

    EXPECT_TRUE(registry.get_host_by_address("10.0.0.9").has_value());
    EXPECT_FALSE(registry.get_host_by_address("10.0.0.1").has_value());
}

TEST(StaticHostParsingTest, ValidJson) {
    auto hosts = parse_static_hosts(R"([{"address":"10.0.0.5","username":"admin"},{"address":"10.0.0.6"}])", nullptr);
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].address, "10.0.0.5");
    EXPECT_EQ(hosts[0].username, "admin");
}

TEST(StaticHostParsingTest, EmptyInputYieldsDefaultHost) {
    auto hosts = parse_static_hosts("", nullptr);
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].address, kDefaultHostAddress);
}

TEST(StaticHostParsingTest, MalformedJsonFallsBackAndLogs) {
    std::ostringstream out;
    auto logger = std::make_shared<logging::Logger>(logging::Level::LVL_DEBUG, out);

    auto hosts = parse_static_hosts("[{broken", logger);
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].address, "127.0.0.1");
    EXPECT_NE(out.str().find("[ERROR]"), std::string::npos);
}

TEST(StaticHostParsingTest, InvalidEntryFallsBack) {
    auto hosts = parse_static_hosts(R"([{"address":"10.0.0.5"},{"username":"nobody"}])", nullptr);
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].address, "127.0.0.1");
}
