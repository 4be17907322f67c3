/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_registry.cpp
 **/

#include "scan/device_registry.hpp"

namespace camscan
{

void DeviceRegistry::fill_if_empty(std::string &field, const std::string &value)
{
    if (field.empty() && !value.empty()) {
        field = value;
    }
}

bool DeviceRegistry::add_or_merge(DiscoveredDevice &&device)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto key = device.key();
    auto it = m_devices.find(key);
    if (m_devices.end() == it) {
        m_devices.emplace(std::move(key), std::move(device));
        return true;
    }

    auto &existing = it->second;
    fill_if_empty(existing.manufacturer, device.manufacturer);
    fill_if_empty(existing.model, device.model);
    fill_if_empty(existing.name, device.name);
    fill_if_empty(existing.mac, device.mac);
    return false;
}

std::vector<DiscoveredDevice> DeviceRegistry::snapshot() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    std::vector<DiscoveredDevice> devices;
    devices.reserve(m_devices.size());
    for (const auto &entry : m_devices) {
        devices.push_back(entry.second);
    }
    return devices;
}

void DeviceRegistry::clear()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_devices.clear();
}

size_t DeviceRegistry::size() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_devices.size();
}

} /* namespace camscan */
