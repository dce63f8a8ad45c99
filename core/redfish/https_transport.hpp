#pragma once

#include <memory>
#include <string>

#include "../logging/logger.hpp"
#include "client_config.hpp"
#include "transport.hpp"

// Forward declaration for cpp-httplib client
namespace httplib {
class SSLClient;
}

namespace rfaccess {
namespace redfish {

/**
 * @brief HTTPS transport backed by cpp-httplib with OpenSSL
 *
 * TLS settings:
 * - Minimum protocol version TLS 1.2
 * - Server certificate verification unless insecure_skip_verify is set
 * - Optional CA bundle from tls_server_ca_cert
 *
 * Timeouts: connect, read and write each bounded by request_timeout_ms.
 * Keep-alive is enabled so consecutive requests reuse the connection;
 * close() drops it.
 */
class HttpsTransport : public ITransport {
public:
    HttpsTransport(const ClientConfig &config, logging::LoggerPtr logger);
    ~HttpsTransport() override;

    HttpsTransport(const HttpsTransport &) = delete;
    HttpsTransport &operator=(const HttpsTransport &) = delete;

    bool send(const HttpRequest &request, HttpResponse &response, std::string &error) override;
    void close() override;

private:
    ClientConfig config_;
    logging::LoggerPtr logger_;
    std::unique_ptr<httplib::SSLClient> client_;
};

}  // namespace redfish
}  // namespace rfaccess
