/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file onvif_prober.hpp
 * @brief ONVIF WS-Discovery prober
 **/

#ifndef _CAMSCAN_ONVIF_PROBER_HPP_
#define _CAMSCAN_ONVIF_PROBER_HPP_

#include "multicast/multicast_prober.hpp"

namespace camscan
{

class OnvifProber final : public MulticastProber
{
public:
    explicit OnvifProber(std::chrono::milliseconds listen_timeout =
            std::chrono::milliseconds(CAMSCAN_DEFAULT_MULTICAST_LISTEN_TIMEOUT_MS),
        const std::string &target_ip = CAMSCAN_MULTICAST_GROUP_IP,
        uint16_t target_port = CAMSCAN_ONVIF_DISCOVERY_PORT);

    virtual std::string payload() const override;

    // Every reply is an ONVIF device: camera at source ip, port 80
    virtual Expected<DiscoveredDevice> parse_reply(const std::string &source_ip,
        const std::string &reply) const override;
};

} /* namespace camscan */

#endif /* _CAMSCAN_ONVIF_PROBER_HPP_ */
