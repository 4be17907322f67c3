/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file port_prober.hpp
 * @brief TCP connect prober and the well known camera/NVR port table
 **/

#ifndef _CAMSCAN_PORT_PROBER_HPP_
#define _CAMSCAN_PORT_PROBER_HPP_

#include "camscan/camscan.h"
#include "camscan/expected.hpp"
#include "camscan/device.hpp"

#include <chrono>
#include <map>
#include <vector>

namespace camscan
{

struct PortInfo final
{
    const char *protocol;
    DeviceType device_type;
};

class PortProber
{
public:
    PortProber() = default;
    virtual ~PortProber() = default;
    PortProber(const PortProber &) = delete;
    PortProber &operator=(const PortProber &) = delete;
    PortProber(PortProber &&) = delete;
    PortProber &operator=(PortProber &&) = delete;

    static const std::map<uint16_t, PortInfo> &port_table();

    // Ports of port_table(), ascending
    static std::vector<uint16_t> ports();

    static Expected<PortInfo> lookup(uint16_t port);

    /**
     * Attempts a single TCP connect to ip:port, bounded by timeout.
     *
     * @return The classified device if the connection was accepted. Otherwise:
     *  - CAMSCAN_NOT_FOUND if port is not in port_table() (the network is not touched)
     *  - CAMSCAN_INVALID_ARGUMENT if ip is not a valid IPv4 address
     *  - CAMSCAN_CONNECTION_REFUSED, CAMSCAN_TIMEOUT, CAMSCAN_HOST_UNREACHABLE or CAMSCAN_SOCKET_FAILURE
     */
    virtual Expected<DiscoveredDevice> probe(const std::string &ip, uint16_t port, std::chrono::milliseconds timeout);
};

} /* namespace camscan */

#endif /* _CAMSCAN_PORT_PROBER_HPP_ */
