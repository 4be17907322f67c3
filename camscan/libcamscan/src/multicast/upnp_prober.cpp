/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file upnp_prober.cpp
 **/

#include "multicast/upnp_prober.hpp"
#include "common/string_utils.hpp"
#include "common/utils.hpp"

#include <algorithm>

namespace camscan
{

static const char *SSDP_SEARCH_REQUEST =
    "M-SEARCH * HTTP/1.1\r\n"
    "HOST: 239.255.255.250:1900\r\n"
    "MAN: \"ssdp:discover\"\r\n"
    "MX: 2\r\n"
    "ST: ssdp:all\r\n"
    "\r\n";

UpnpProber::UpnpProber(std::chrono::milliseconds listen_timeout, const std::string &target_ip,
    uint16_t target_port) :
    MulticastProber("UPnP", target_ip, target_port, listen_timeout)
{}

const std::vector<std::string> &UpnpProber::video_keywords()
{
    static const std::vector<std::string> keywords = {
        "camera", "nvr", "ipcam", "video", "rtsp", "hikvision", "dahua", "axis", "onvif"
    };
    return keywords;
}

std::string UpnpProber::payload() const
{
    return SSDP_SEARCH_REQUEST;
}

Expected<DiscoveredDevice> UpnpProber::parse_reply(const std::string &source_ip, const std::string &reply) const
{
    const auto lower_reply = StringUtils::to_lower(reply);
    const auto &keywords = video_keywords();
    const bool is_video_device = std::any_of(keywords.begin(), keywords.end(),
        [&lower_reply](const std::string &keyword) { return std::string::npos != lower_reply.find(keyword); });
    if (!is_video_device) {
        return make_unexpected(CAMSCAN_NOT_FOUND);
    }

    DiscoveredDevice device(source_ip, CAMSCAN_MULTICAST_DEVICE_PORT, DeviceType::CAMERA, CAMSCAN_PROTOCOL_HTTP);
    device.manufacturer = infer_manufacturer(reply);
    return device;
}

} /* namespace camscan */
