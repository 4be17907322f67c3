/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file multicast_prober.cpp
 **/

#include "multicast/multicast_prober.hpp"
#include "common/socket.hpp"
#include "common/string_utils.hpp"
#include "common/utils.hpp"

#include <algorithm>
#include <array>
#include <utility>
#include <vector>

namespace camscan
{

// abort() is noticed within one slice
#define LISTEN_POLL_SLICE (std::chrono::milliseconds(100))

MulticastProber::MulticastProber(const std::string &name, const std::string &target_ip, uint16_t target_port,
    std::chrono::milliseconds listen_timeout) :
    m_name(name),
    m_target_ip(target_ip),
    m_target_port(target_port),
    m_listen_timeout(listen_timeout),
    m_is_aborted(false)
{}

void MulticastProber::abort()
{
    m_is_aborted = true;
}

void MulticastProber::reset()
{
    m_is_aborted = false;
}

bool MulticastProber::is_aborted() const
{
    return m_is_aborted;
}

std::string MulticastProber::infer_manufacturer(const std::string &reply)
{
    static const std::vector<std::pair<std::string, std::string>> vendor_tokens = {
        {"hikvision", "Hikvision"},
        {"dahua", "Dahua"},
        {"axis", "Axis"},
    };

    for (const auto &vendor : vendor_tokens) {
        if (StringUtils::contains_ignore_case(reply, vendor.first)) {
            return vendor.second;
        }
    }
    return "";
}

camscan_status MulticastProber::discover(const DeviceCallback &on_device)
{
    TRY(auto socket, Socket::create(AF_INET, SOCK_DGRAM, IPPROTO_UDP));

    auto status = socket.allow_reuse_address();
    CHECK_SUCCESS(status);
    status = socket.set_multicast_ttl(CAMSCAN_MULTICAST_TTL);
    CHECK_SUCCESS(status);

    auto target_address = Socket::make_ipv4_address(m_target_ip, m_target_port);
    CHECK_EXPECTED_AS_STATUS(target_address, "{} discovery got an invalid target {}", m_name, m_target_ip);

    const auto probe = payload();
    size_t bytes_sent = 0;
    status = socket.send_to(reinterpret_cast<const uint8_t*>(probe.data()), probe.size(), 0,
        reinterpret_cast<const sockaddr*>(&target_address.value()), sizeof(target_address.value()), &bytes_sent);
    if (CAMSCAN_SUCCESS != status) {
        // Hosts without a multicast route end up here
        LOGGER__INFO("{} discovery failed to send probe to {}:{}, status {}", m_name, m_target_ip, m_target_port,
            status);
        return CAMSCAN_SEND_FAILURE;
    }
    LOGGER__DEBUG("{} discovery sent {} bytes to {}:{}", m_name, bytes_sent, m_target_ip, m_target_port);

    return listen(socket, on_device);
}

camscan_status MulticastProber::listen(Socket &socket, const DeviceCallback &on_device)
{
    std::array<uint8_t, CAMSCAN_MAX_DATAGRAM_SIZE> buffer{};
    size_t replies_count = 0;

    // The window restarts after every datagram, so discovery ends after listen_timeout of silence
    auto window_deadline = std::chrono::steady_clock::now() + m_listen_timeout;
    while (!m_is_aborted) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= window_deadline) {
            LOGGER__DEBUG("{} discovery finished after {} replies", m_name, replies_count);
            return CAMSCAN_SUCCESS;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(window_deadline - now);
        auto status = socket.wait_for_data(std::min(remaining, LISTEN_POLL_SLICE));
        if (CAMSCAN_TIMEOUT == status) {
            continue;
        }
        if (CAMSCAN_INTERRUPTED_BY_SIGNAL == status) {
            continue;
        }
        if (CAMSCAN_SUCCESS != status) {
            LOGGER__INFO("{} discovery stopped listening, status {}", m_name, status);
            return status;
        }

        sockaddr_in source_address{};
        size_t bytes_received = 0;
        status = socket.recv_from(buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr*>(&source_address),
            sizeof(source_address), &bytes_received, true);
        if (CAMSCAN_SUCCESS != status) {
            LOGGER__INFO("{} discovery failed receiving a reply, status {}", m_name, status);
            return status;
        }
        window_deadline = std::chrono::steady_clock::now() + m_listen_timeout;
        replies_count++;

        auto source_ip = Socket::ipv4_to_string(source_address);
        if (!source_ip) {
            continue;
        }

        // Undecodable bytes are kept as is, only ASCII tokens are searched
        const std::string reply(reinterpret_cast<const char*>(buffer.data()), bytes_received);
        auto device = parse_reply(source_ip.value(), reply);
        if (!device) {
            LOGGER__DEBUG("{} discovery ignored a reply from {}", m_name, source_ip.value());
            continue;
        }

        LOGGER__DEBUG("{} discovery found {}", m_name, device->key());
        on_device(device.release());
    }

    LOGGER__DEBUG("{} discovery aborted after {} replies", m_name, replies_count);
    return CAMSCAN_OPERATION_ABORTED;
}

} /* namespace camscan */
