/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_registry.hpp
 * @brief Thread safe inventory of discovered devices, keyed by (ip, port)
 **/

#ifndef _CAMSCAN_DEVICE_REGISTRY_HPP_
#define _CAMSCAN_DEVICE_REGISTRY_HPP_

#include "camscan/device.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace camscan
{

class DeviceRegistry final
{
public:
    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;

    /**
     * Inserts device if its key is absent. Otherwise fills the empty manufacturer, model, name and mac of the
     * stored entry from device. The type, protocol and url of a stored entry never change.
     *
     * @return true if device was inserted as a new entry.
     */
    bool add_or_merge(DiscoveredDevice &&device);

    // Copy of all entries, in no particular order
    std::vector<DiscoveredDevice> snapshot() const;

    void clear();
    size_t size() const;

private:
    static void fill_if_empty(std::string &field, const std::string &value);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, DiscoveredDevice> m_devices;
};

} /* namespace camscan */

#endif /* _CAMSCAN_DEVICE_REGISTRY_HPP_ */
