#include "discovery_loop.hpp"

namespace rfaccess {
namespace runtime {

DiscoveryLoop::DiscoveryLoop(std::shared_ptr<registry::HostRegistry> registry, DiscoverFunction discover,
                             std::chrono::milliseconds interval, logging::LoggerPtr logger)
    : registry_(std::move(registry)), discover_(std::move(discover)), interval_(interval), logger_(std::move(logger)) {}

DiscoveryLoop::~DiscoveryLoop() { stop(); }

bool DiscoveryLoop::start() {
    if (running_.load()) {
        LOG_WARN(logger_, "[Discovery] Loop already running");
        return false;
    }

    running_.store(true);
    thread_ = std::thread(&DiscoveryLoop::loop, this);
    LOG_INFO(logger_, "[Discovery] Loop started (interval " << interval_.count() << "ms)");
    return true;
}

void DiscoveryLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO(logger_, "[Discovery] Loop stopped");
}

bool DiscoveryLoop::run_once() {
    std::vector<discovery::DiscoveredHost> hosts;
    std::string error;
    if (!discover_(hosts, error)) {
        ++cycles_failed_;
        LOG_ERROR(logger_, "[Discovery] Discovery cycle failed: " << error << " (keeping previous hosts)");
        return false;
    }

    registry_->update_discovered_hosts(std::move(hosts));
    ++cycles_completed_;
    return true;
}

void DiscoveryLoop::loop() {
    while (running_.load()) {
        run_once();

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

}  // namespace runtime
}  // namespace rfaccess
