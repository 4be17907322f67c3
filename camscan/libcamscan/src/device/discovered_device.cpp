/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file discovered_device.cpp
 * @brief Discovered device value type
 **/

#include "camscan/device.hpp"

#include <vector>

namespace camscan
{

const char *device_type_to_string(DeviceType device_type)
{
    switch (device_type) {
    case DeviceType::CAMERA:
        return "camera";
    case DeviceType::NVR:
        return "nvr";
    case DeviceType::UNKNOWN:
    default:
        return "unknown";
    }
}

DiscoveredDevice::DiscoveredDevice(const std::string &ip, uint16_t port, DeviceType device_type,
    const std::string &protocol, const std::string &url) :
    ip(ip),
    port(port),
    device_type(device_type),
    protocol(protocol),
    url(url.empty() ? build_url(ip, port, protocol) : url)
{}

std::string DiscoveredDevice::build_url(const std::string &ip, uint16_t port, const std::string &protocol)
{
    const auto endpoint = ip + ":" + std::to_string(port);
    if (CAMSCAN_PROTOCOL_RTSP == protocol) {
        return "rtsp://" + endpoint + "/stream";
    }
    if ((CAMSCAN_PROTOCOL_HTTP == protocol) || (CAMSCAN_PROTOCOL_ONVIF == protocol)) {
        return "http://" + endpoint + "/";
    }
    return endpoint;
}

std::string DiscoveredDevice::key() const
{
    return ip + ":" + std::to_string(port);
}

std::string DiscoveredDevice::display_name() const
{
    std::vector<std::string> parts;
    if (!manufacturer.empty()) {
        parts.push_back(manufacturer);
    }
    if (!model.empty()) {
        parts.push_back(model);
    }
    if (!name.empty()) {
        parts.push_back("(" + name + ")");
    }

    if (parts.empty()) {
        return std::string(device_type_to_string(device_type)) + "@" + ip;
    }

    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); i++) {
        result += " " + parts[i];
    }
    return result;
}

} /* namespace camscan */
