#include "tool_dispatcher.hpp"

namespace rfaccess {
namespace access {

namespace {

nlohmann::json make_reply(const nlohmann::json &id, const nlohmann::json &status,
                          const nlohmann::json &result = nlohmann::json::object()) {
    return {{"id", id}, {"status", status}, {"result", result}};
}

}  // namespace

ToolDispatcher::ToolDispatcher(std::shared_ptr<DeviceAccess> access, logging::LoggerPtr logger)
    : access_(std::move(access)), logger_(std::move(logger)) {}

nlohmann::json ToolDispatcher::handle(const nlohmann::json &request) const {
    if (!request.is_object()) {
        return make_reply(nullptr, make_status(StatusCode::INVALID_ARGUMENT, "request must be a JSON object"));
    }

    nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json();

    auto tool_it = request.find("tool");
    if (tool_it == request.end() || !tool_it->is_string()) {
        return make_reply(id, make_status(StatusCode::INVALID_ARGUMENT, "missing 'tool' field"));
    }
    const std::string tool = tool_it->get<std::string>();

    LOG_INFO(logger_, "[Tools] Handling " << tool << " request");

    if (tool == kToolListServers) {
        return make_reply(id, make_status(StatusCode::OK), list_servers());
    }

    if (tool == kToolGetResourceData) {
        nlohmann::json arguments = request.contains("arguments") ? request["arguments"] : nlohmann::json::object();
        nlohmann::json status;
        nlohmann::json result = get_resource_data(arguments, status);
        return make_reply(id, status, result);
    }

    return make_reply(id, make_status(StatusCode::NOT_FOUND, "unknown tool: " + tool));
}

nlohmann::json ToolDispatcher::handle_line(const std::string &line) const {
    auto request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        LOG_WARN(logger_, "[Tools] Ignoring malformed request line");
        return make_reply(nullptr, make_status(StatusCode::INVALID_ARGUMENT, "malformed JSON request"));
    }
    return handle(request);
}

size_t ToolDispatcher::serve(std::istream &in, std::ostream &out, const std::function<bool()> &keep_running) const {
    size_t replies = 0;
    std::string line;
    while ((!keep_running || keep_running()) && std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        out << handle_line(line).dump() << "\n" << std::flush;
        ++replies;
    }
    return replies;
}

nlohmann::json ToolDispatcher::list_servers() const {
    return {{"servers", access_->list_addresses()}};
}

nlohmann::json ToolDispatcher::get_resource_data(const nlohmann::json &arguments, nlohmann::json &status) const {
    if (!arguments.is_object() || !arguments.contains("url") || !arguments["url"].is_string()) {
        status = make_status(StatusCode::INVALID_ARGUMENT, "arguments.url must be a string");
        return nlohmann::json::object();
    }

    auto result = access_->get_resource(arguments["url"].get<std::string>());
    if (!result.success) {
        LOG_WARN(logger_, "[Tools] get_resource_data failed: " << result.error_message);
        status = make_status(result.status_code, result.error_message);
        return nlohmann::json::object();
    }

    status = make_status(StatusCode::OK);
    return {{"headers", result.response.headers}, {"data", result.response.data}};
}

}  // namespace access
}  // namespace rfaccess
