/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file socket.cpp
 * @brief Socket wrapper for Unix
 **/

#include "common/socket.hpp"

#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <limits.h>

#include <algorithm>

namespace camscan
{

// poll() treats a negative timeout as infinite
static int to_poll_timeout(std::chrono::milliseconds timeout)
{
    return static_cast<int>(std::min<int64_t>(std::max<int64_t>(timeout.count(), 0), INT_MAX));
}

Expected<Socket> Socket::create(int af, int type, int protocol)
{
    TRY(const auto socket_fd, create_socket_fd(af, type, protocol));

    auto obj = Socket(socket_fd);
    return obj;
}

Socket::Socket(const socket_t socket_fd) :
    m_socket_fd(socket_fd)
{
}

Socket::~Socket()
{
    auto status = close_socket_fd();
    if (CAMSCAN_SUCCESS != status) {
        LOGGER__ERROR("Failed to free socket fd with status {}", status);
    }
}

Expected<socket_t> Socket::create_socket_fd(int af, int type, int protocol)
{
    socket_t local_socket = INVALID_SOCKET;

    local_socket = socket(af, type, protocol);
    CHECK_VALID_SOCKET_AS_EXPECTED(local_socket);

    return Expected<socket_t>(local_socket);
}

camscan_status Socket::errno_to_status(int error)
{
    switch (error) {
    case ECONNREFUSED:
        return CAMSCAN_CONNECTION_REFUSED;
    case ETIMEDOUT:
    case EAGAIN:
    case EINPROGRESS:
        return CAMSCAN_TIMEOUT;
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN:
    case EHOSTDOWN:
        return CAMSCAN_HOST_UNREACHABLE;
    case EINTR:
        return CAMSCAN_INTERRUPTED_BY_SIGNAL;
    default:
        return CAMSCAN_SOCKET_FAILURE;
    }
}

camscan_status Socket::close_socket_fd()
{
    if (INVALID_SOCKET != m_socket_fd) {
        int socket_rc = close(m_socket_fd);
        CHECK(0 == socket_rc, CAMSCAN_CLOSE_FAILURE, "Failed to close socket. errno={}", errno);
        m_socket_fd = INVALID_SOCKET;
    }

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::socket_bind(const sockaddr *addr, socklen_t len)
{
    int socket_rc = SOCKET_ERROR;

    CHECK_ARG_NOT_NULL(addr);

    socket_rc = bind(m_socket_fd, addr, len);
    CHECK(0 == socket_rc, CAMSCAN_SOCKET_FAILURE, "Failed to bind socket. errno={}", errno);

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::get_sock_name(sockaddr *addr, socklen_t *len)
{
    int socket_rc = SOCKET_ERROR;

    CHECK_ARG_NOT_NULL(addr);
    CHECK_ARG_NOT_NULL(len);

    socket_rc = getsockname(m_socket_fd, addr, len);
    CHECK(0 == socket_rc, CAMSCAN_SOCKET_FAILURE, "Failed getsockname. errno={}", errno);

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::connect(const sockaddr *addr, socklen_t len)
{
    CHECK_ARG_NOT_NULL(addr);

    int ret = ::connect(m_socket_fd, addr, len);
    if (0 != ret) {
        const auto error = errno;
        LOGGER__DEBUG("Failed to connect socket. errno={}", error);
        return errno_to_status(error);
    }
    return CAMSCAN_SUCCESS;
}

camscan_status Socket::connect(const sockaddr *addr, socklen_t len, std::chrono::milliseconds timeout)
{
    CHECK_ARG_NOT_NULL(addr);

    auto status = set_non_blocking(true);
    CHECK_SUCCESS(status);

    int ret = ::connect(m_socket_fd, addr, len);
    if (0 == ret) {
        return CAMSCAN_SUCCESS;
    }
    if (EINPROGRESS != errno) {
        const auto error = errno;
        LOGGER__DEBUG("connect failed immediately. errno={}", error);
        return errno_to_status(error);
    }

    struct pollfd pfd = {};
    pfd.fd = m_socket_fd;
    pfd.events = POLLOUT;
    int poll_rc = ::poll(&pfd, 1, to_poll_timeout(timeout));
    if (0 == poll_rc) {
        LOGGER__DEBUG("connect timed out after {}ms", timeout.count());
        return CAMSCAN_TIMEOUT;
    }
    if (0 > poll_rc) {
        const auto error = errno;
        LOGGER__DEBUG("poll on connecting socket failed. errno={}", error);
        return errno_to_status(error);
    }

    int socket_error = 0;
    socklen_t socket_error_size = sizeof(socket_error);
    ret = getsockopt(m_socket_fd, SOL_SOCKET, SO_ERROR, &socket_error, &socket_error_size);
    CHECK(0 == ret, CAMSCAN_SOCKET_FAILURE, "getsockopt(SO_ERROR) failed. errno={}", errno);
    if (0 != socket_error) {
        LOGGER__DEBUG("connect failed. errno={}", socket_error);
        return errno_to_status(socket_error);
    }

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::ntop(int af, const void *src, char *dst, socklen_t size)
{
    CHECK_ARG_NOT_NULL(src);
    CHECK_ARG_NOT_NULL(dst);

    CHECK(NULL != inet_ntop(af, src, dst, size), CAMSCAN_SOCKET_FAILURE,
        "Could not convert sockaddr struct to string ip address");

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::pton(int af, const char *src, void *dst)
{
    int inet_rc = 0;

    CHECK_ARG_NOT_NULL(src);
    CHECK_ARG_NOT_NULL(dst);

    inet_rc = inet_pton(af, src, dst);
    if (0 == inet_rc) {
        // Not an error of the socket layer, the caller decides whether it is worth logging
        LOGGER__DEBUG("'{}' is not a valid network address in the specified address family", src);
        return CAMSCAN_INVALID_ARGUMENT;
    }
    CHECK(1 == inet_rc, CAMSCAN_SOCKET_FAILURE, "Failed to run 'inet_pton', errno = {}.", errno);

    return CAMSCAN_SUCCESS;
}

Expected<sockaddr_in> Socket::make_ipv4_address(const std::string &ip, uint16_t port)
{
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);

    auto status = pton(AF_INET, ip.c_str(), &address.sin_addr);
    if (CAMSCAN_SUCCESS != status) {
        return make_unexpected(status);
    }

    return Expected<sockaddr_in>(address);
}

Expected<std::string> Socket::ipv4_to_string(const sockaddr_in &addr)
{
    char ip_str[IPV4_STRING_MAX_LENGTH] = {};
    auto status = ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
    CHECK_SUCCESS_AS_EXPECTED(status);

    return std::string(ip_str);
}

camscan_status Socket::allow_reuse_address()
{
    int allow_reuse = 1;

    auto socket_rc = setsockopt(m_socket_fd, SOL_SOCKET, SO_REUSEADDR, &allow_reuse, sizeof(allow_reuse));
    CHECK(0 == socket_rc, CAMSCAN_SOCKET_FAILURE, "Cannot set socket to reuse address");

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::set_multicast_ttl(uint8_t ttl)
{
    auto socket_rc = setsockopt(m_socket_fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    CHECK(0 == socket_rc, CAMSCAN_SOCKET_FAILURE, "Cannot set multicast ttl to {}. errno={}", ttl, errno);

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::set_non_blocking(bool non_blocking)
{
    int flags = fcntl(m_socket_fd, F_GETFL, 0);
    CHECK(-1 != flags, CAMSCAN_SOCKET_FAILURE, "fcntl(F_GETFL) failed. errno={}", errno);

    flags = non_blocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    auto fcntl_rc = fcntl(m_socket_fd, F_SETFL, flags);
    CHECK(-1 != fcntl_rc, CAMSCAN_SOCKET_FAILURE, "fcntl(F_SETFL) failed. errno={}", errno);

    return CAMSCAN_SUCCESS;
}

camscan_status Socket::send_to(const uint8_t *src_buffer, size_t src_buffer_size, int flags,
    const sockaddr *dest_addr, socklen_t dest_addr_size, size_t *bytes_sent)
{
    ssize_t number_of_sent_bytes = 0;

    /* Validate arguments */
    CHECK_ARG_NOT_NULL(src_buffer);
    CHECK_ARG_NOT_NULL(dest_addr);
    CHECK_ARG_NOT_NULL(bytes_sent);

    number_of_sent_bytes = sendto(m_socket_fd, src_buffer, src_buffer_size, flags,
        dest_addr,  dest_addr_size);
    if (-1 == number_of_sent_bytes) {
        if ((EWOULDBLOCK == errno) || (EAGAIN == errno)) {
            LOGGER__DEBUG("Udp send timeout");
            return CAMSCAN_TIMEOUT;
        } else if (EINTR == errno) {
            LOGGER__DEBUG("Udp send interrupted!");
            return CAMSCAN_INTERRUPTED_BY_SIGNAL;
        } else if (EPIPE == errno) {
            // sendto on a socket that was shut down returns EPIPE
            LOGGER__INFO("Udp send aborted!");
            return CAMSCAN_OPERATION_ABORTED;
        } else {
            LOGGER__DEBUG("Udp failed to send data, errno:{}.", errno);
            return CAMSCAN_SEND_FAILURE;
        }
    }

    *bytes_sent = (size_t)number_of_sent_bytes;
    return CAMSCAN_SUCCESS;
}

camscan_status Socket::recv_from(uint8_t *dest_buffer, size_t dest_buffer_size, int flags,
    sockaddr *src_addr, socklen_t src_addr_size, size_t *bytes_received, bool log_timeouts_in_debug)
{
    ssize_t number_of_received_bytes = 0;
    socklen_t result_src_addr_size = src_addr_size;

    /* Validate arguments */
    CHECK_ARG_NOT_NULL(dest_buffer);
    CHECK_ARG_NOT_NULL(src_addr);
    CHECK_ARG_NOT_NULL(bytes_received);

    number_of_received_bytes = recvfrom(m_socket_fd, dest_buffer, dest_buffer_size, flags,
        src_addr, &result_src_addr_size);
    if (-1 == number_of_received_bytes) {
        if ((EWOULDBLOCK == errno) || (EAGAIN == errno)) {
            if (log_timeouts_in_debug) {
                LOGGER__DEBUG("Udp recvfrom failed with timeout");
            } else {
                LOGGER__ERROR("Udp recvfrom failed with timeout");
            }
            return CAMSCAN_TIMEOUT;
        } else if (EINTR == errno) {
            LOGGER__DEBUG("Udp recv interrupted!");
            return CAMSCAN_INTERRUPTED_BY_SIGNAL;
        } else {
            LOGGER__DEBUG("Udp failed to recv data, errno:{}.", errno);
            return CAMSCAN_RECV_FAILURE;
        }
    }

    if (result_src_addr_size > src_addr_size) {
        LOGGER__ERROR("src_addr size invalid");
        return CAMSCAN_RECV_FAILURE;
    }

    *bytes_received = (size_t)number_of_received_bytes;
    return CAMSCAN_SUCCESS;
}

camscan_status Socket::wait_for_data(std::chrono::milliseconds timeout)
{
    struct pollfd pfd = {};
    pfd.fd = m_socket_fd;
    pfd.events = POLLIN;

    int poll_rc = ::poll(&pfd, 1, to_poll_timeout(timeout));
    if (0 == poll_rc) {
        return CAMSCAN_TIMEOUT;
    }
    if (0 > poll_rc) {
        const auto error = errno;
        LOGGER__DEBUG("poll for incoming data failed. errno={}", error);
        return errno_to_status(error);
    }
    CHECK(0 == (pfd.revents & (POLLERR | POLLNVAL)), CAMSCAN_RECV_FAILURE, "Socket is in error state, revents={}",
        pfd.revents);

    return CAMSCAN_SUCCESS;
}

} /* namespace camscan */
