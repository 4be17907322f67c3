/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file multicast_prober.hpp
 * @brief Base class for discovery protocols that multicast one probe datagram and collect the unicast replies
 **/

#ifndef _CAMSCAN_MULTICAST_PROBER_HPP_
#define _CAMSCAN_MULTICAST_PROBER_HPP_

#include "camscan/camscan.h"
#include "camscan/expected.hpp"
#include "camscan/device.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace camscan
{

class Socket;

class MulticastProber
{
public:
    MulticastProber(const std::string &name, const std::string &target_ip, uint16_t target_port,
        std::chrono::milliseconds listen_timeout);
    virtual ~MulticastProber() = default;
    MulticastProber(const MulticastProber &) = delete;
    MulticastProber &operator=(const MulticastProber &) = delete;
    MulticastProber(MulticastProber &&) = delete;
    MulticastProber &operator=(MulticastProber &&) = delete;

    /**
     * Sends payload() to the target endpoint and calls on_device for every reply accepted by parse_reply().
     * Returns after no datagram has arrived for listen_timeout, or after abort().
     *
     * Socket errors end the discovery early. Devices already reported are kept by the caller.
     *
     * @return CAMSCAN_SUCCESS when the listen window expired, CAMSCAN_OPERATION_ABORTED after abort(),
     *         or the socket error that ended the discovery.
     */
    virtual camscan_status discover(const DeviceCallback &on_device);

    // Thread safe. Makes a running discover() return at its next poll slice.
    void abort();

    // Clears a previous abort()
    void reset();

    bool is_aborted() const;

    const std::string &name() const { return m_name; }
    std::chrono::milliseconds listen_timeout() const { return m_listen_timeout; }

    virtual std::string payload() const = 0;

    /**
     * Turns one reply into a device.
     * @return CAMSCAN_NOT_FOUND if the reply does not describe a device of interest.
     */
    virtual Expected<DiscoveredDevice> parse_reply(const std::string &source_ip, const std::string &reply) const = 0;

    // "hikvision", "dahua" and "axis" (case insensitive, first match in that order) -> vendor display name
    static std::string infer_manufacturer(const std::string &reply);

protected:
    camscan_status listen(Socket &socket, const DeviceCallback &on_device);

    const std::string m_name;
    const std::string m_target_ip;
    const uint16_t m_target_port;
    const std::chrono::milliseconds m_listen_timeout;
    std::atomic<bool> m_is_aborted;
};

} /* namespace camscan */

#endif /* _CAMSCAN_MULTICAST_PROBER_HPP_ */
