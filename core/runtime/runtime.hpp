#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <string>

#include "access/device_access.hpp"
#include "access/tool_dispatcher.hpp"
#include "config.hpp"
#include "discovery/ssdp_discovery.hpp"
#include "discovery_loop.hpp"
#include "logging/logger.hpp"
#include "registry/host_registry.hpp"

namespace rfaccess {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config, logging::LoggerPtr logger);
    ~Runtime();

    // Build registry, access facade, dispatcher and (if enabled) the discovery loop
    bool initialize(std::string &error);

    // Serve tool requests from `in` until EOF, stop() or a shutdown signal (blocking)
    void run(std::istream &in = std::cin, std::ostream &out = std::cout);

    // Triggers the serve loop to exit after the current request
    void stop() { running_ = false; }

    // Stop background discovery
    void shutdown();

    // One SSDP window straight into the registry
    bool discover_now(std::string &error);

    registry::HostRegistry &get_registry() { return *registry_; }
    access::DeviceAccess &get_access() { return *access_; }
    access::ToolDispatcher &get_dispatcher() { return *dispatcher_; }

private:
    discovery::DiscoveryConfig make_discovery_config() const;

    RuntimeConfig config_;
    logging::LoggerPtr logger_;

    std::shared_ptr<registry::HostRegistry> registry_;
    std::shared_ptr<access::DeviceAccess> access_;
    std::unique_ptr<access::ToolDispatcher> dispatcher_;
    std::unique_ptr<DiscoveryLoop> discovery_loop_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace rfaccess
