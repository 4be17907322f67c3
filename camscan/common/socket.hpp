/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file socket.hpp
 * @brief RAII wrapper over a BSD socket fd, returning camscan_status codes instead of errno.
 **/

#ifndef __CAMSCAN_OS_SOCKET_H__
#define __CAMSCAN_OS_SOCKET_H__

#include "camscan/platform.h"
#include "camscan/camscan.h"
#include "camscan/expected.hpp"
#include "common/utils.hpp"

#include <chrono>
#include <string>

namespace camscan
{

// 12 for the octets (3 * 4, each octet<=255)
// 3 for the dots (".")
// 1 for the terminating null
#define IPV4_STRING_MAX_LENGTH (16)

#define CHECK_VALID_SOCKET_AS_EXPECTED(sock) CHECK((sock) != INVALID_SOCKET, make_unexpected(CAMSCAN_SOCKET_FAILURE), "Invalid socket")

class Socket final {
public:
    static Expected<Socket> create(int af, int type, int protocol);
    ~Socket();
    Socket(const Socket &other) = delete;
    Socket &operator=(const Socket &other) = delete;
    Socket &operator=(Socket &&other) = delete;
    Socket(Socket &&other) noexcept :
        m_socket_fd(std::exchange(other.m_socket_fd, INVALID_SOCKET))
    {};

    socket_t get_fd() const { return m_socket_fd; }

    static camscan_status ntop(int af, const void *src, char *dst, socklen_t size);
    static camscan_status pton(int af, const char *src, void *dst);
    static Expected<sockaddr_in> make_ipv4_address(const std::string &ip, uint16_t port);
    static Expected<std::string> ipv4_to_string(const sockaddr_in &addr);

    camscan_status socket_bind(const sockaddr *addr, socklen_t len);
    camscan_status get_sock_name(sockaddr *addr, socklen_t *len);

    camscan_status connect(const sockaddr *addr, socklen_t len);

    // Non-blocking connect that waits up to timeout for the handshake to complete. Failures are expected while
    // probing, so they are only logged in debug.
    camscan_status connect(const sockaddr *addr, socklen_t len, std::chrono::milliseconds timeout);

    camscan_status allow_reuse_address();
    camscan_status set_multicast_ttl(uint8_t ttl);
    camscan_status set_non_blocking(bool non_blocking);
    camscan_status close_socket_fd();

    camscan_status send_to(const uint8_t *src_buffer, size_t src_buffer_size, int flags,
        const sockaddr *dest_addr, socklen_t dest_addr_size, size_t *bytes_sent);
    camscan_status recv_from(uint8_t *dest_buffer, size_t dest_buffer_size, int flags,
        sockaddr *src_addr, socklen_t src_addr_size, size_t *bytes_received, bool log_timeouts_in_debug = false);

    // Returns CAMSCAN_SUCCESS if a datagram is ready to be read, CAMSCAN_TIMEOUT if none arrived within timeout.
    camscan_status wait_for_data(std::chrono::milliseconds timeout);

private:
    explicit Socket(const socket_t socket_fd);
    static Expected<socket_t> create_socket_fd(int af, int type, int protocol);
    static camscan_status errno_to_status(int error);

    socket_t m_socket_fd;
};

} /* namespace camscan */

#endif /* __CAMSCAN_OS_SOCKET_H__ */
