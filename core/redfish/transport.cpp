#include "transport.hpp"

#include <algorithm>
#include <cctype>

namespace rfaccess {
namespace redfish {

bool header_name_equals(const std::string &a, const std::string &b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string find_header(const HeaderList &headers, const std::string &name) {
    for (const auto &header : headers) {
        if (header_name_equals(header.first, name)) {
            return header.second;
        }
    }
    return "";
}

}  // namespace redfish
}  // namespace rfaccess
