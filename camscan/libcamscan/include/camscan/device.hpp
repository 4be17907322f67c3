/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device.hpp
 * @brief Discovered network device (IP camera / NVR) description.
 **/

#ifndef _CAMSCAN_DEVICE_HPP_
#define _CAMSCAN_DEVICE_HPP_

#include "camscan/camscan.h"

#include <string>
#include <cstdint>
#include <functional>

/** camscan namespace */
namespace camscan
{

#define CAMSCAN_PROTOCOL_RTSP ("rtsp")
#define CAMSCAN_PROTOCOL_HTTP ("http")
#define CAMSCAN_PROTOCOL_HTTPS ("https")
#define CAMSCAN_PROTOCOL_ONVIF ("onvif")

/** Classification of a discovered device */
enum class DeviceType {
    CAMERA,
    NVR,
    UNKNOWN
};

/**
 * Returns the lower-case name of @a device_type ("camera", "nvr" or "unknown").
 */
CAMSCANAPI const char *device_type_to_string(DeviceType device_type);

/**
 * One entry of the scan inventory. The pair (ip, port) is the identity of the entry.
 *
 * The url is derived from protocol/ip/port when the device is constructed (unless given explicitly) and is
 * not recomputed afterwards, even if protocol is changed later.
 */
struct CAMSCANAPI DiscoveredDevice final
{
    DiscoveredDevice(const std::string &ip, uint16_t port, DeviceType device_type = DeviceType::UNKNOWN,
        const std::string &protocol = "", const std::string &url = "");

    /**
     * Builds the url of a device:
     *  - "rtsp://{ip}:{port}/stream" for rtsp
     *  - "http://{ip}:{port}/" for http and onvif
     *  - "{ip}:{port}" otherwise
     */
    static std::string build_url(const std::string &ip, uint16_t port, const std::string &protocol);

    /**
     * Returns the identity key "{ip}:{port}".
     */
    std::string key() const;

    /**
     * Returns "manufacturer model (name)" built from the non-empty fields, or "{type}@{ip}" if all are empty.
     */
    std::string display_name() const;

    std::string ip;
    uint16_t port;
    DeviceType device_type;
    std::string protocol;
    std::string name;
    std::string manufacturer;
    std::string model;
    std::string mac;
    std::string url;
};

/** Called for every device a discovery source has found */
using DeviceCallback = std::function<void(DiscoveredDevice &&device)>;

} /* namespace camscan */

#endif /* _CAMSCAN_DEVICE_HPP_ */
