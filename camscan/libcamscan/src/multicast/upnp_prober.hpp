/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file upnp_prober.hpp
 * @brief UPnP SSDP M-SEARCH prober
 **/

#ifndef _CAMSCAN_UPNP_PROBER_HPP_
#define _CAMSCAN_UPNP_PROBER_HPP_

#include "multicast/multicast_prober.hpp"

#include <vector>

namespace camscan
{

class UpnpProber final : public MulticastProber
{
public:
    explicit UpnpProber(std::chrono::milliseconds listen_timeout =
            std::chrono::milliseconds(CAMSCAN_DEFAULT_MULTICAST_LISTEN_TIMEOUT_MS),
        const std::string &target_ip = CAMSCAN_MULTICAST_GROUP_IP,
        uint16_t target_port = CAMSCAN_SSDP_DISCOVERY_PORT);

    virtual std::string payload() const override;

    /**
     * Accepts replies mentioning one of video_keywords() (case insensitive) as a camera at source ip, port 80.
     * Any other reply (routers, media servers, printers...) yields CAMSCAN_NOT_FOUND.
     */
    virtual Expected<DiscoveredDevice> parse_reply(const std::string &source_ip,
        const std::string &reply) const override;

    static const std::vector<std::string> &video_keywords();
};

} /* namespace camscan */

#endif /* _CAMSCAN_UPNP_PROBER_HPP_ */
