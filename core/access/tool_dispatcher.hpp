#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

#include "../logging/logger.hpp"
#include "device_access.hpp"

namespace rfaccess {
namespace access {

constexpr const char *kToolListServers = "list_servers";
constexpr const char *kToolGetResourceData = "get_resource_data";

/**
 * @brief Line-delimited JSON tool front end over DeviceAccess
 *
 * Request:  {"id": any, "tool": "list_servers"}
 *           {"id": any, "tool": "get_resource_data", "arguments": {"url": "https://..."}}
 * Reply:    {"id": <echoed>, "status": {"code", "message"}, "result": {...}}
 *
 * A malformed line produces an INVALID_ARGUMENT reply; the loop keeps going.
 */
class ToolDispatcher {
public:
    ToolDispatcher(std::shared_ptr<DeviceAccess> access, logging::LoggerPtr logger);

    // Handle one decoded request
    nlohmann::json handle(const nlohmann::json &request) const;

    // Handle one raw input line
    nlohmann::json handle_line(const std::string &line) const;

    // Read lines until EOF or until keep_running() returns false; returns the number of replies written
    size_t serve(std::istream &in, std::ostream &out, const std::function<bool()> &keep_running) const;

private:
    nlohmann::json list_servers() const;
    nlohmann::json get_resource_data(const nlohmann::json &arguments, nlohmann::json &status) const;

    std::shared_ptr<DeviceAccess> access_;
    logging::LoggerPtr logger_;
};

}  // namespace access
}  // namespace rfaccess
