#include "runtime.hpp"

#include <chrono>

#include "signal_handler.hpp"

namespace rfaccess {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config, logging::LoggerPtr logger)
    : config_(config), logger_(std::move(logger)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO(logger_, "[Runtime] Initializing rfaccess");

    if (!validate_config(config_, error)) {
        return false;
    }

    registry_ = std::make_shared<registry::HostRegistry>(resolve_static_hosts(config_, logger_), logger_);
    access_ = std::make_shared<access::DeviceAccess>(registry_, make_client_defaults(config_), logger_);
    dispatcher_ = std::make_unique<access::ToolDispatcher>(access_, logger_);

    if (config_.discovery.enabled) {
        auto discovery_config = make_discovery_config();
        auto discovery_logger = logger_;
        DiscoverFunction discover = [discovery_config, discovery_logger](
                                        std::vector<discovery::DiscoveredHost> &hosts, std::string &discover_error) {
            discovery::SsdpDiscovery engine(discovery_config, discovery_logger);
            return engine.discover(hosts, discover_error);
        };
        discovery_loop_ = std::make_unique<DiscoveryLoop>(
            registry_, std::move(discover), std::chrono::seconds(config_.discovery.interval_s), logger_);
    }

    LOG_INFO(logger_, "[Runtime] Initialization complete (" << registry_->static_host_count() << " static host(s))");
    return true;
}

discovery::DiscoveryConfig Runtime::make_discovery_config() const {
    discovery::DiscoveryConfig discovery_config;
    discovery_config.timeout_ms = config_.discovery.timeout_ms;
    discovery_config.buffer_size = config_.discovery.buffer_size;
    return discovery_config;
}

void Runtime::run(std::istream &in, std::ostream &out) {
    LOG_INFO(logger_, "[Runtime] Starting tool loop");
    running_ = true;

    if (discovery_loop_ && !discovery_loop_->start()) {
        LOG_WARN(logger_, "[Runtime] Discovery loop failed to start");
    }

    size_t served = dispatcher_->serve(in, out, [this]() {
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO(logger_, "[Runtime] Signal received, stopping...");
            return false;
        }
        return running_.load();
    });

    running_ = false;
    LOG_INFO(logger_, "[Runtime] Tool loop finished (" << served << " request(s) served)");
    shutdown();
}

void Runtime::shutdown() {
    if (discovery_loop_) {
        discovery_loop_->stop();
    }
}

bool Runtime::discover_now(std::string &error) {
    discovery::SsdpDiscovery engine(make_discovery_config(), logger_);
    std::vector<discovery::DiscoveredHost> hosts;
    if (!engine.discover(hosts, error)) {
        return false;
    }
    registry_->update_discovered_hosts(std::move(hosts));
    return true;
}

}  // namespace runtime
}  // namespace rfaccess
