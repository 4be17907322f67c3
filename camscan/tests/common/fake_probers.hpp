/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file fake_probers.hpp
 * @brief In-memory discovery sources for driving NetworkScanner without a network
 **/

#ifndef _CAMSCAN_TESTS_FAKE_PROBERS_HPP_
#define _CAMSCAN_TESTS_FAKE_PROBERS_HPP_

#include "net/port_prober.hpp"
#include "multicast/multicast_prober.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace camscan
{
namespace tests
{

// Reports the configured (ip, port) pairs as open, everything else as refused
class FakePortProber final : public PortProber
{
public:
    explicit FakePortProber(std::chrono::milliseconds probe_delay = std::chrono::milliseconds(0)) :
        m_probe_delay(probe_delay), m_probes_count(0)
    {}

    void add_open_port(const std::string &ip, uint16_t port)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_open_ports.emplace_back(ip, port);
    }

    virtual Expected<DiscoveredDevice> probe(const std::string &ip, uint16_t port,
        std::chrono::milliseconds /*timeout*/) override
    {
        m_probes_count++;
        if (0 != m_probe_delay.count()) {
            std::this_thread::sleep_for(m_probe_delay);
        }

        auto port_info = lookup(port);
        if (!port_info) {
            return make_unexpected(port_info.status());
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        for (const auto &open_port : m_open_ports) {
            if ((open_port.first == ip) && (open_port.second == port)) {
                return DiscoveredDevice(ip, port, port_info->device_type, port_info->protocol);
            }
        }
        return make_unexpected(CAMSCAN_CONNECTION_REFUSED);
    }

    size_t probes_count() const { return m_probes_count; }

private:
    const std::chrono::milliseconds m_probe_delay;
    std::atomic<size_t> m_probes_count;
    std::mutex m_mutex;
    std::vector<std::pair<std::string, uint16_t>> m_open_ports;
};

// Reports a fixed list of devices, then optionally keeps "listening" until aborted
class FakeMulticastProber final : public MulticastProber
{
public:
    FakeMulticastProber(const std::string &name, std::vector<DiscoveredDevice> devices,
        bool listen_until_aborted = false) :
        MulticastProber(name, "127.0.0.1", 0, std::chrono::milliseconds(100)),
        m_devices(std::move(devices)),
        m_listen_until_aborted(listen_until_aborted),
        m_discover_count(0),
        m_aborted_count(0)
    {}

    virtual camscan_status discover(const DeviceCallback &on_device) override
    {
        m_discover_count++;
        for (const auto &device : m_devices) {
            on_device(DiscoveredDevice(device));
        }

        while (m_listen_until_aborted && !is_aborted()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (is_aborted()) {
            m_aborted_count++;
            return CAMSCAN_OPERATION_ABORTED;
        }
        return CAMSCAN_SUCCESS;
    }

    virtual std::string payload() const override
    {
        return "";
    }

    virtual Expected<DiscoveredDevice> parse_reply(const std::string &/*source_ip*/,
        const std::string &/*reply*/) const override
    {
        return make_unexpected(CAMSCAN_NOT_FOUND);
    }

    size_t discover_count() const { return m_discover_count; }
    size_t aborted_count() const { return m_aborted_count; }

private:
    const std::vector<DiscoveredDevice> m_devices;
    const bool m_listen_until_aborted;
    std::atomic<size_t> m_discover_count;
    std::atomic<size_t> m_aborted_count;
};

} /* namespace tests */
} /* namespace camscan */

#endif /* _CAMSCAN_TESTS_FAKE_PROBERS_HPP_ */
