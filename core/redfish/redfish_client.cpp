#include "redfish_client.hpp"

#include <httplib.h>

#include <thread>

#include "https_transport.hpp"

namespace rfaccess {
namespace redfish {

namespace {
constexpr int kStatusOk = 200;
constexpr int kStatusCreated = 201;
constexpr int kStatusFirstError = 400;

struct CanonicalHeader {
    const char *lower;
    const char *canonical;
};

const CanonicalHeader kAllowedHeaders[] = {
    {"allow", "Allow"},
    {"content-type", "Content-Type"},
    {"content-encoding", "Content-Encoding"},
    {"etag", "ETag"},
    {"link", "Link"},
};

nlohmann::json decode_body(const std::string &body, const logging::LoggerPtr &logger) {
    if (body.empty()) {
        return std::string();
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        LOG_WARN(logger, "[Redfish] Failed to parse JSON response, returning raw body");
        return body;
    }
    return parsed;
}
}  // namespace

const std::vector<std::string> &allowed_response_headers() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto &header : kAllowedHeaders) {
            result.emplace_back(header.canonical);
        }
        return result;
    }();
    return names;
}

std::map<std::string, std::vector<std::string>> filter_response_headers(const HeaderList &headers) {
    std::map<std::string, std::vector<std::string>> filtered;
    for (const auto &header : headers) {
        for (const auto &allowed : kAllowedHeaders) {
            if (header_name_equals(header.first, allowed.lower)) {
                filtered[allowed.canonical].push_back(header.second);
                break;
            }
        }
    }
    return filtered;
}

std::string normalize_resource_path(const std::string &resource_path) {
    if (!resource_path.empty() && resource_path.front() == '/') {
        return resource_path;
    }
    return "/" + resource_path;
}

RedfishClient::RedfishClient(const ClientConfig &config, logging::LoggerPtr logger,
                             std::unique_ptr<ITransport> transport)
    : config_(config), logger_(std::move(logger)), transport_(std::move(transport)) {
    std::string error;
    if (!validate_client_config(config_, error)) {
        config_error_ = error;
        LOG_ERROR(logger_, "[Redfish] Invalid client configuration: " << error);
        return;
    }

    if (!transport_) {
        transport_ = std::make_unique<HttpsTransport>(config_, logger_);
    }
}

RedfishClient::~RedfishClient() { close(); }

std::string RedfishClient::build_url(const std::string &resource_path) const {
    return config_.base_url() + normalize_resource_path(resource_path);
}

bool RedfishClient::login(Error &error) {
    if (!config_error_.empty()) {
        error = make_error(ErrorKind::CONFIGURATION, config_error_);
        return false;
    }

    switch (config_.auth_method) {
        case AuthMethod::BASIC:
            // Credentials are attached to every request; nothing to negotiate
            LOG_INFO(logger_, "[Redfish] Using basic authentication for " << config_.address);
            return true;
        case AuthMethod::SESSION:
            return login_session(error);
        default:
            error = make_error(ErrorKind::CONFIGURATION,
                               "unsupported auth method: " + auth_method_to_string(config_.auth_method));
            return false;
    }
}

bool RedfishClient::login_session(Error &error) {
    if (is_cancelled()) {
        error = make_error(ErrorKind::CANCELLED, "login cancelled");
        return false;
    }

    session_token_.clear();

    nlohmann::json login_data = {{"UserName", config_.username}, {"Password", config_.password}};

    HttpRequest request;
    request.method = "POST";
    request.path = kSessionsPath;
    request.body = login_data.dump();
    request.headers.emplace("Content-Type", "application/json");
    request.headers.emplace("Accept", "application/json");

    LOG_DEBUG(logger_, "[Redfish] Creating session at " << build_url(kSessionsPath));

    HttpResponse response;
    std::string transport_error;
    if (!transport_->send(request, response, transport_error)) {
        error = make_error(ErrorKind::TRANSPORT, "login request failed: " + transport_error);
        return false;
    }

    if (response.status != kStatusOk && response.status != kStatusCreated) {
        error = make_error(ErrorKind::PROTOCOL,
                           "login failed with status " + std::to_string(response.status) + ": " + response.body,
                           response.status);
        return false;
    }

    std::string token = find_header(response.headers, kAuthTokenHeader);
    if (token.empty()) {
        // Fallback: some services return the token in the body
        auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (!body.is_discarded() && body.is_object()) {
            auto it = body.find("token");
            if (it != body.end() && it->is_string()) {
                token = it->get<std::string>();
            }
        }
    }

    if (token.empty()) {
        error = make_error(ErrorKind::AUTHENTICATION, "no session token found in response", response.status);
        return false;
    }

    session_token_ = token;
    LOG_INFO(logger_, "[Redfish] Session authentication successful for " << config_.address);
    return true;
}

void RedfishClient::logout() {
    if (session_token_.empty()) {
        return;
    }

    // Server-side session is left to expire on its own
    session_token_.clear();
    LOG_INFO(logger_, "[Redfish] Session cleared for " << config_.address);
}

bool RedfishClient::get(const std::string &resource_path, RedfishResponse &response, Error &error) {
    return request("GET", resource_path, nullptr, response, error);
}

bool RedfishClient::post(const std::string &resource_path, const nlohmann::json &data, RedfishResponse &response,
                         Error &error) {
    const std::string body = data.dump();
    return request("POST", resource_path, &body, response, error);
}

bool RedfishClient::patch(const std::string &resource_path, const nlohmann::json &data, RedfishResponse &response,
                          Error &error) {
    const std::string body = data.dump();
    return request("PATCH", resource_path, &body, response, error);
}

bool RedfishClient::del(const std::string &resource_path, RedfishResponse &response, Error &error) {
    return request("DELETE", resource_path, nullptr, response, error);
}

bool RedfishClient::get_with_headers(const std::string &resource_path, RedfishResponse &response, Error &error) {
    HeaderList raw_headers;
    if (!request("GET", resource_path, nullptr, response, error, &raw_headers)) {
        return false;
    }

    response.headers = filter_response_headers(raw_headers);
    return true;
}

void RedfishClient::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    logout();
    if (transport_) {
        transport_->close();
    }
}

bool RedfishClient::request(const std::string &method, const std::string &resource_path, const std::string *body,
                            RedfishResponse &response, Error &error, HeaderList *raw_headers) {
    if (!config_error_.empty()) {
        error = make_error(ErrorKind::CONFIGURATION, config_error_);
        return false;
    }

    const int max_attempts = config_.retry.max_retries + 1;
    const std::string path = normalize_resource_path(resource_path);
    BackoffSchedule backoff(config_.retry, jitter_source_);

    Error last_error;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (is_cancelled()) {
            error = make_error(ErrorKind::CANCELLED, "request cancelled: " + method + " " + path);
            return false;
        }

        if (do_request(method, path, body, response, last_error, raw_headers)) {
            return true;
        }

        if (!is_retryable(last_error)) {
            LOG_DEBUG(logger_, "[Redfish] " << method << " " << path << " not retryable: " << last_error.message);
            break;
        }

        if (attempt == max_attempts) {
            break;
        }

        auto delay = backoff.next_delay();
        LOG_WARN(logger_, "[Redfish] Request failed, retrying (attempt " << attempt + 1 << "/" << max_attempts
                                                                        << " in " << delay.count()
                                                                        << "ms): " << last_error.message);

        if (!wait_before_retry(delay)) {
            error = make_error(ErrorKind::CANCELLED, "request cancelled: " + method + " " + path);
            return false;
        }
    }

    // Surface the actual cause rather than a generic "retries exhausted"
    error = last_error;
    return false;
}

bool RedfishClient::do_request(const std::string &method, const std::string &path, const std::string *body,
                               RedfishResponse &response, Error &error, HeaderList *raw_headers) {
    LOG_DEBUG(logger_, "[Redfish] Making request " << method << " " << config_.base_url() << path);

    HttpRequest request;
    request.method = method;
    request.path = path;
    if (body) {
        request.body = *body;
    }
    request.headers.emplace("Content-Type", "application/json");
    request.headers.emplace("Accept", "application/json");
    add_auth_headers(request.headers);

    HttpResponse raw;
    std::string transport_error;
    if (!transport_->send(request, raw, transport_error)) {
        error = make_error(ErrorKind::TRANSPORT, transport_error);
        return false;
    }

    if (raw.status >= kStatusFirstError) {
        error = make_error(ErrorKind::PROTOCOL, "HTTP " + std::to_string(raw.status) + ": " + raw.body, raw.status);
        return false;
    }

    response.status_code = raw.status;
    response.headers.clear();
    for (const auto &header : raw.headers) {
        response.headers[header.first].push_back(header.second);
    }
    response.data = decode_body(raw.body, logger_);
    if (raw_headers) {
        *raw_headers = std::move(raw.headers);
    }
    return true;
}

void RedfishClient::add_auth_headers(HeaderList &headers) const {
    switch (config_.auth_method) {
        case AuthMethod::BASIC:
            if (!config_.username.empty() && !config_.password.empty()) {
                headers.insert(httplib::make_basic_authentication_header(config_.username, config_.password));
            }
            break;
        case AuthMethod::SESSION:
            if (!session_token_.empty()) {
                headers.emplace(kAuthTokenHeader, session_token_);
            }
            break;
    }
}

bool RedfishClient::wait_before_retry(std::chrono::milliseconds delay) {
    if (sleeper_) {
        return sleeper_(delay) && !is_cancelled();
    }
    if (cancel_token_) {
        return cancel_token_->wait_for(delay);
    }
    std::this_thread::sleep_for(delay);
    return true;
}

}  // namespace redfish
}  // namespace rfaccess
