#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../discovery/ssdp_discovery.hpp"
#include "../logging/logger.hpp"
#include "../registry/host_registry.hpp"

namespace rfaccess {
namespace runtime {

// One discovery window; false + error when no result could be produced
using DiscoverFunction = std::function<bool(std::vector<discovery::DiscoveredHost> &, std::string &)>;

/**
 * @brief Periodic discovery feeding the host registry
 *
 * Runs one cycle immediately on start(), then one per interval. A failed
 * cycle is logged and leaves the previous discovered snapshot in place.
 * stop() wakes the waiting thread and joins it.
 */
class DiscoveryLoop {
public:
    DiscoveryLoop(std::shared_ptr<registry::HostRegistry> registry, DiscoverFunction discover,
                  std::chrono::milliseconds interval, logging::LoggerPtr logger);
    ~DiscoveryLoop();

    DiscoveryLoop(const DiscoveryLoop &) = delete;
    DiscoveryLoop &operator=(const DiscoveryLoop &) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Run a single cycle on the calling thread
    bool run_once();

    size_t cycles_completed() const { return cycles_completed_.load(); }
    size_t cycles_failed() const { return cycles_failed_.load(); }

private:
    void loop();

    std::shared_ptr<registry::HostRegistry> registry_;
    DiscoverFunction discover_;
    std::chrono::milliseconds interval_;
    logging::LoggerPtr logger_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> cycles_completed_{0};
    std::atomic<size_t> cycles_failed_{0};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace runtime
}  // namespace rfaccess
