/**
 * @file udp_socket.cpp
 * @brief POSIX UDP socket implementation.
 */

#include "udp_socket.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>

namespace rfaccess {
namespace net {

UdpSocket::UdpSocket() : socket_(-1), last_error_(0) {
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ < 0) {
        record_error();
    }
}

UdpSocket::~UdpSocket() { close(); }

UdpSocket::UdpSocket(UdpSocket &&other) noexcept : socket_(other.socket_), last_error_(other.last_error_) {
    other.socket_ = -1;
}

UdpSocket &UdpSocket::operator=(UdpSocket &&other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        last_error_ = other.last_error_;
        other.socket_ = -1;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string &address) {
    if (!is_valid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        last_error_ = EINVAL;
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0) {
        record_error();
        return false;
    }
    return true;
}

uint16_t UdpSocket::local_port() const {
    if (!is_valid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<struct sockaddr *>(&addr), &addr_len) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::set_multicast_ttl(int ttl) {
    if (!is_valid()) {
        return false;
    }

    unsigned char ttl_val = static_cast<unsigned char>(ttl);
    if (setsockopt(socket_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl_val, sizeof(ttl_val)) != 0) {
        record_error();
        return false;
    }
    return true;
}

int UdpSocket::send_to(const SocketAddress &dest, const void *data, size_t length) {
    if (!is_valid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);
    if (inet_pton(AF_INET, dest.ip.c_str(), &addr.sin_addr) != 1) {
        last_error_ = EINVAL;
        return -1;
    }

    ssize_t result = ::sendto(socket_, data, length, 0, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
    if (result < 0) {
        record_error();
        return -1;
    }
    return static_cast<int>(result);
}

int UdpSocket::receive_from(void *buffer, size_t buffer_size, int timeout_ms, SocketAddress &sender) {
    if (!is_valid()) {
        return -1;
    }

    // Use select() for timeout
    if (timeout_ms >= 0) {
        fd_set read_set;
        FD_ZERO(&read_set);
        FD_SET(socket_, &read_set);

        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;

        int select_result = ::select(socket_ + 1, &read_set, nullptr, nullptr, &tv);
        if (select_result < 0) {
            record_error();
            return -1;
        }
        if (select_result == 0) {
            return 0;
        }
    }

    struct sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    ssize_t result =
        ::recvfrom(socket_, buffer, buffer_size, 0, reinterpret_cast<struct sockaddr *>(&addr), &addr_len);
    if (result < 0) {
        record_error();
        return -1;
    }

    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
    sender.ip = ip_str;
    sender.port = ntohs(addr.sin_port);

    return static_cast<int>(result);
}

void UdpSocket::close() {
    if (is_valid()) {
        ::close(socket_);
        socket_ = -1;
    }
}

std::string UdpSocket::last_error_string() const { return std::strerror(last_error_); }

void UdpSocket::record_error() { last_error_ = errno; }

}  // namespace net
}  // namespace rfaccess
