/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file port_prober.cpp
 **/

#include "net/port_prober.hpp"
#include "common/socket.hpp"
#include "common/utils.hpp"

namespace camscan
{

const std::map<uint16_t, PortInfo> &PortProber::port_table()
{
    static const std::map<uint16_t, PortInfo> table = {
        {554,   {CAMSCAN_PROTOCOL_RTSP,  DeviceType::CAMERA}},
        {8554,  {CAMSCAN_PROTOCOL_RTSP,  DeviceType::CAMERA}},
        {80,    {CAMSCAN_PROTOCOL_HTTP,  DeviceType::UNKNOWN}},
        {8080,  {CAMSCAN_PROTOCOL_HTTP,  DeviceType::UNKNOWN}},
        {443,   {CAMSCAN_PROTOCOL_HTTPS, DeviceType::UNKNOWN}},
        {37777, {CAMSCAN_PROTOCOL_HTTP,  DeviceType::NVR}},  // Dahua
        {34567, {CAMSCAN_PROTOCOL_HTTP,  DeviceType::NVR}},  // XMEye / generic DVR
        {9000,  {CAMSCAN_PROTOCOL_HTTP,  DeviceType::NVR}},  // Hikvision SDK
    };
    return table;
}

std::vector<uint16_t> PortProber::ports()
{
    std::vector<uint16_t> result;
    result.reserve(port_table().size());
    for (const auto &entry : port_table()) {
        result.push_back(entry.first);
    }
    return result;
}

Expected<PortInfo> PortProber::lookup(uint16_t port)
{
    const auto &table = port_table();
    auto it = table.find(port);
    if (table.end() == it) {
        return make_unexpected(CAMSCAN_NOT_FOUND);
    }
    return Expected<PortInfo>(it->second);
}

Expected<DiscoveredDevice> PortProber::probe(const std::string &ip, uint16_t port, std::chrono::milliseconds timeout)
{
    auto port_info = lookup(port);
    if (!port_info) {
        LOGGER__DEBUG("Port {} is not a known camera port, skipping {}", port, ip);
        return make_unexpected(port_info.status());
    }

    auto address = Socket::make_ipv4_address(ip, port);
    if (!address) {
        return make_unexpected(address.status());
    }

    TRY(auto socket, Socket::create(AF_INET, SOCK_STREAM, 0));
    auto status = socket.connect(reinterpret_cast<const sockaddr*>(&address.value()), sizeof(address.value()),
        timeout);
    if (CAMSCAN_SUCCESS != status) {
        return make_unexpected(status);
    }

    LOGGER__DEBUG("Found open port {}:{} ({})", ip, port, port_info->protocol);
    return DiscoveredDevice(ip, port, port_info->device_type, port_info->protocol);
}

} /* namespace camscan */
