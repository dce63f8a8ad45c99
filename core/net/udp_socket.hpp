/**
 * @file udp_socket.hpp
 * @brief RAII IPv4 UDP socket with multicast send and timed receive.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace rfaccess {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string &ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string to_string() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress &other) const { return ip == other.ip && port == other.port; }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.bind(0);
 * sock.set_multicast_ttl(2);
 * sock.send_to(SocketAddress("239.255.255.250", 1900), data.data(), data.size());
 *
 * char buffer[1024];
 * SocketAddress sender;
 * int received = sock.receive_from(buffer, sizeof(buffer), 1000, sender);
 * @endcode
 */
class UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket. Check is_valid() afterwards.
     */
    UdpSocket();

    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;
    UdpSocket(UdpSocket &&other) noexcept;
    UdpSocket &operator=(UdpSocket &&other) noexcept;

    bool is_valid() const { return socket_ >= 0; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     */
    bool bind(uint16_t port, const std::string &address = "0.0.0.0");

    uint16_t local_port() const;

    /**
     * @brief Set the multicast TTL (1 = local subnet only).
     */
    bool set_multicast_ttl(int ttl);

    /**
     * @brief Send data to an address.
     * @return Number of bytes sent, or -1 on error.
     */
    int send_to(const SocketAddress &dest, const void *data, size_t length);

    /**
     * @brief Receive data with timeout.
     * @param timeout_ms Timeout in milliseconds (0 = poll, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receive_from(void *buffer, size_t buffer_size, int timeout_ms, SocketAddress &sender);

    void close();

    int last_error() const { return last_error_; }
    std::string last_error_string() const;

private:
    int socket_;
    int last_error_;

    void record_error();
};

}  // namespace net
}  // namespace rfaccess
