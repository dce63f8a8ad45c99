// rfaccess
// Redfish device access with SSDP discovery, config-based with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: rfaccess [OPTIONS] [COMMAND]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  serve            Answer JSON tool requests on stdin (default)\n";
    std::cerr << "  list             Print known server addresses\n";
    std::cerr << "  get URL          Fetch one resource, e.g. https://10.0.0.5/redfish/v1\n";
    std::cerr << "  discover         Run one SSDP discovery window and print the merged host list\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH    Path to config file (default: rfaccess.yaml, optional)\n";
    std::cerr << "  --help, -h       Show this help\n";
}

}  // namespace

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = rfaccess::runtime::kDefaultConfigPath;
    bool config_path_explicit = false;
    std::string command = "serve";
    std::string url;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            config_path_explicit = true;
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
            config_path_explicit = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "serve" || arg == "list" || arg == "discover") {
            command = arg;
        } else if (arg == "get" && i + 1 < argc) {
            command = arg;
            url = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    auto logger = std::make_shared<rfaccess::logging::Logger>();

    rfaccess::runtime::RuntimeConfig config;
    std::string error;

    // The config file is optional; environment variables alone are enough
    if (std::filesystem::exists(config_path)) {
        LOG_INFO(logger, "Loading config: " << config_path);
        if (!rfaccess::runtime::load_config(config_path, config, error, logger)) {
            LOG_ERROR(logger, "Failed to load config: " << error);
            return 1;
        }
    } else if (config_path_explicit) {
        LOG_ERROR(logger, "Config file not found: " << config_path);
        return 1;
    }

    if (!rfaccess::runtime::apply_env_overrides(config, error)) {
        LOG_ERROR(logger, "Invalid environment configuration: " << error);
        return 1;
    }

    // Initialize logger level
    logger->set_level(rfaccess::logging::string_to_level(config.logging.level));
    rfaccess::runtime::log_config_summary(config, logger);

    rfaccess::runtime::Runtime runtime(config, logger);
    if (!runtime.initialize(error)) {
        LOG_ERROR(logger, "Runtime initialization failed: " << error);
        return 1;
    }

    if (command == "list") {
        std::cout << runtime.get_dispatcher().handle({{"id", 1}, {"tool", "list_servers"}}).dump(2) << "\n";
        return 0;
    }

    if (command == "get") {
        auto reply = runtime.get_dispatcher().handle(
            {{"id", 1}, {"tool", "get_resource_data"}, {"arguments", {{"url", url}}}});
        std::cout << reply.dump(2) << "\n";
        return reply["status"]["code"] == "OK" ? 0 : 2;
    }

    if (command == "discover") {
        if (!runtime.discover_now(error)) {
            LOG_ERROR(logger, "Discovery failed: " << error);
            return 2;
        }
        std::cout << runtime.get_dispatcher().handle({{"id", 1}, {"tool", "list_servers"}}).dump(2) << "\n";
        return 0;
    }

    // Install signal handler for graceful shutdown
    rfaccess::runtime::SignalHandler::install();

    LOG_INFO(logger, "rfaccess ready");
    LOG_INFO(logger, "  Static hosts: " << runtime.get_registry().static_host_count());
    LOG_INFO(logger, "  Discovery: " << (config.discovery.enabled ? "enabled" : "disabled"));

    // Run tool loop (blocking)
    runtime.run(std::cin, std::cout);

    LOG_INFO(logger, "Shutdown complete");
    return 0;
}
