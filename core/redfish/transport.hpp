#pragma once

#include <map>
#include <string>

namespace rfaccess {
namespace redfish {

// Header names keep the casing they arrived with; lookups must be case-insensitive
using HeaderList = std::multimap<std::string, std::string>;

struct HttpRequest {
    std::string method;  // GET, POST, PATCH, DELETE
    std::string path;    // Always starts with '/'
    HeaderList headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    HeaderList headers;
    std::string body;
};

// Interface for the HTTPS exchange to enable mocking
class ITransport {
public:
    virtual ~ITransport() = default;

    // One request/response exchange. Returns false on connection, TLS or
    // timeout failure (no HTTP status available); error describes the cause.
    virtual bool send(const HttpRequest &request, HttpResponse &response, std::string &error) = 0;

    // Drop pooled connections; the transport may be reused afterwards
    virtual void close() = 0;
};

// Case-insensitive header helpers
bool header_name_equals(const std::string &a, const std::string &b);
std::string find_header(const HeaderList &headers, const std::string &name);

}  // namespace redfish
}  // namespace rfaccess
