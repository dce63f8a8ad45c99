/**
 * @file https_transport.cpp
 * @brief cpp-httplib backed implementation of the Redfish transport
 */

#include "https_transport.hpp"

// cpp-httplib with OpenSSL support (CPPHTTPLIB_OPENSSL_SUPPORT set by the build)
#include <httplib.h>
#include <openssl/ssl.h>

#include <chrono>

namespace rfaccess {
namespace redfish {

HttpsTransport::HttpsTransport(const ClientConfig &config, logging::LoggerPtr logger)
    : config_(config), logger_(std::move(logger)) {
    client_ = std::make_unique<httplib::SSLClient>(config_.address, config_.port);

    const auto timeout = std::chrono::milliseconds(config_.request_timeout_ms);
    client_->set_connection_timeout(timeout);
    client_->set_read_timeout(timeout);
    client_->set_write_timeout(timeout);
    client_->set_keep_alive(true);

    client_->enable_server_certificate_verification(!config_.insecure_skip_verify);
    if (config_.insecure_skip_verify) {
        LOG_WARN(logger_, "[Transport] Certificate verification disabled for " << config_.address);
    }

    if (!config_.tls_server_ca_cert.empty()) {
        client_->set_ca_cert_path(config_.tls_server_ca_cert);
        LOG_DEBUG(logger_, "[Transport] Using CA bundle " << config_.tls_server_ca_cert);
    }

    if (SSL_CTX *ctx = client_->ssl_context()) {
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    }
}

HttpsTransport::~HttpsTransport() { close(); }

bool HttpsTransport::send(const HttpRequest &request, HttpResponse &response, std::string &error) {
    if (!client_ || !client_->is_valid()) {
        error = "TLS client could not be initialised for " + config_.address;
        return false;
    }

    httplib::Request req;
    req.method = request.method;
    req.path = request.path;
    req.body = request.body;
    for (const auto &header : request.headers) {
        req.headers.emplace(header.first, header.second);
    }

    auto result = client_->send(req);
    if (!result) {
        error = "HTTP request failed: " + httplib::to_string(result.error());
        return false;
    }

    response.status = result->status;
    response.body = result->body;
    response.headers.clear();
    for (const auto &header : result->headers) {
        response.headers.emplace(header.first, header.second);
    }
    return true;
}

void HttpsTransport::close() {
    if (client_) {
        client_->stop();
    }
}

}  // namespace redfish
}  // namespace rfaccess
