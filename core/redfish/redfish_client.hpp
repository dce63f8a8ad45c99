#ifndef RFACCESS_REDFISH_REDFISH_CLIENT_HPP
#define RFACCESS_REDFISH_REDFISH_CLIENT_HPP

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../logging/logger.hpp"
#include "client_config.hpp"
#include "errors.hpp"
#include "retry.hpp"
#include "transport.hpp"

namespace rfaccess {
namespace redfish {

// Well-known Redfish paths and header names
constexpr const char *kSessionsPath = "/redfish/v1/SessionService/Sessions";
constexpr const char *kAuthTokenHeader = "X-Auth-Token";

// Result of one successful request
struct RedfishResponse {
    int status_code = 0;
    std::map<std::string, std::vector<std::string>> headers;
    nlohmann::json data;  // Decoded JSON body, or the raw body as a JSON string
};

// Headers kept by get_with_headers(), in canonical casing
const std::vector<std::string> &allowed_response_headers();

// Reduce raw headers to the allow-list, renaming to canonical casing
std::map<std::string, std::vector<std::string>> filter_response_headers(const HeaderList &headers);

/**
 * @brief Redfish client for one endpoint
 *
 * Lifecycle (request scoped): construct -> login() -> one or more calls -> close().
 * Not thread-safe: the session token lives on the instance.
 *
 * Every call runs inside a retry loop of max_retries + 1 attempts with
 * exponential backoff. Protocol errors with a 4xx status are returned
 * immediately; transport failures and 5xx are retried. When attempts are
 * exhausted the last observed error is returned.
 */
class RedfishClient {
public:
    // transport == nullptr builds the default HTTPS transport
    RedfishClient(const ClientConfig &config, logging::LoggerPtr logger,
                  std::unique_ptr<ITransport> transport = nullptr);
    ~RedfishClient();

    RedfishClient(const RedfishClient &) = delete;
    RedfishClient &operator=(const RedfishClient &) = delete;

    // Authentication
    bool login(Error &error);
    void logout();
    bool is_authenticated() const { return !session_token_.empty(); }
    const std::string &session_token() const { return session_token_; }

    // Resource operations
    bool get(const std::string &resource_path, RedfishResponse &response, Error &error);
    bool post(const std::string &resource_path, const nlohmann::json &data, RedfishResponse &response, Error &error);
    bool patch(const std::string &resource_path, const nlohmann::json &data, RedfishResponse &response,
               Error &error);
    bool del(const std::string &resource_path, RedfishResponse &response, Error &error);

    // GET returning only allow-listed headers (see allowed_response_headers())
    bool get_with_headers(const std::string &resource_path, RedfishResponse &response, Error &error);

    // Logout (best effort) and drop pooled connections. Safe to call repeatedly.
    void close();

    // Optional: cancellation checked before every attempt and during backoff waits
    void set_cancellation_token(const CancellationToken *token) { cancel_token_ = token; }

    // Optional: replaces the backoff wait (tests)
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    // Optional: jitter source returning values in [0, 1) (tests)
    void set_jitter_source(std::function<double()> source) { jitter_source_ = std::move(source); }

    const ClientConfig &config() const { return config_; }

    // base_url + resource path, inserting '/' when missing
    std::string build_url(const std::string &resource_path) const;

private:
    bool login_session(Error &error);

    // raw_headers (optional) receives the unfiltered headers of the successful attempt
    bool request(const std::string &method, const std::string &resource_path, const std::string *body,
                 RedfishResponse &response, Error &error, HeaderList *raw_headers = nullptr);
    bool do_request(const std::string &method, const std::string &path, const std::string *body,
                    RedfishResponse &response, Error &error, HeaderList *raw_headers);

    void add_auth_headers(HeaderList &headers) const;
    bool wait_before_retry(std::chrono::milliseconds delay);
    bool is_cancelled() const { return cancel_token_ && cancel_token_->is_cancelled(); }

    ClientConfig config_;
    logging::LoggerPtr logger_;
    std::unique_ptr<ITransport> transport_;
    std::string config_error_;  // Non-empty when config_ failed validation

    std::string session_token_;
    bool closed_ = false;

    const CancellationToken *cancel_token_ = nullptr;
    Sleeper sleeper_;
    std::function<double()> jitter_source_;
};

// Normalise a resource path to start with '/'
std::string normalize_resource_path(const std::string &resource_path);

}  // namespace redfish
}  // namespace rfaccess

#endif  // RFACCESS_REDFISH_REDFISH_CLIENT_HPP
