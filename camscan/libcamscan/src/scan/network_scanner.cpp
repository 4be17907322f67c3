/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file network_scanner.cpp
 **/

#include "camscan/network_scanner.hpp"

#include "common/utils.hpp"
#include "common/async_thread.hpp"
#include "common/thread_pool.hpp"

#include "net/subnet_resolver.hpp"
#include "net/port_prober.hpp"
#include "multicast/onvif_prober.hpp"
#include "multicast/upnp_prober.hpp"
#include "scan/device_registry.hpp"
#include "utils/camscan_logger.hpp"

#include <algorithm>

namespace camscan
{

Expected<std::unique_ptr<NetworkScanner>> NetworkScanner::create(const ScanParams &params)
{
    return create(params, ScanComponents());
}

Expected<std::unique_ptr<NetworkScanner>> NetworkScanner::create(const ScanParams &params,
    const ScanComponents &components)
{
    // Installs the camscan logger as the default spdlog logger
    CamscanLogger::get_instance();

    CHECK_AS_EXPECTED(0 < params.max_workers, CAMSCAN_INVALID_ARGUMENT, "max_workers must be positive");
    CHECK_AS_EXPECTED(0 < params.timeout.count(), CAMSCAN_INVALID_ARGUMENT, "Probe timeout must be positive");
    CHECK_AS_EXPECTED(0 < params.multicast_listen_timeout.count(), CAMSCAN_INVALID_ARGUMENT,
        "Multicast listen timeout must be positive");
    CHECK_AS_EXPECTED(0 < params.multicast_join_timeout.count(), CAMSCAN_INVALID_ARGUMENT,
        "Multicast join timeout must be positive");

    std::string subnet = params.subnet;
    if (subnet.empty()) {
        subnet = SubnetResolver::detect_subnet();
    } else {
        CHECK_AS_EXPECTED(SubnetResolver::is_valid_subnet(subnet), CAMSCAN_INVALID_ARGUMENT,
            "Invalid subnet '{}', expected three octets (e.g. 192.168.1)", subnet);
    }

    std::shared_ptr<PortProber> port_prober = components.port_prober;
    if (nullptr == port_prober) {
        port_prober = make_shared_nothrow<PortProber>();
        CHECK_NOT_NULL_AS_EXPECTED(port_prober, CAMSCAN_OUT_OF_HOST_MEMORY);
    }

    std::shared_ptr<MulticastProber> onvif_prober = components.onvif_prober;
    if (nullptr == onvif_prober) {
        onvif_prober = make_shared_nothrow<OnvifProber>(params.multicast_listen_timeout);
        CHECK_NOT_NULL_AS_EXPECTED(onvif_prober, CAMSCAN_OUT_OF_HOST_MEMORY);
    }

    std::shared_ptr<MulticastProber> upnp_prober = components.upnp_prober;
    if (nullptr == upnp_prober) {
        upnp_prober = make_shared_nothrow<UpnpProber>(params.multicast_listen_timeout);
        CHECK_NOT_NULL_AS_EXPECTED(upnp_prober, CAMSCAN_OUT_OF_HOST_MEMORY);
    }

    auto registry = make_unique_nothrow<DeviceRegistry>();
    CHECK_NOT_NULL_AS_EXPECTED(registry, CAMSCAN_OUT_OF_HOST_MEMORY);

    auto scanner = make_unique_nothrow<NetworkScanner>(params, subnet, port_prober, onvif_prober, upnp_prober,
        std::move(registry));
    CHECK_NOT_NULL_AS_EXPECTED(scanner, CAMSCAN_OUT_OF_HOST_MEMORY);

    LOGGER__INFO("Created network scanner for {}.0/24", subnet);
    return scanner;
}

NetworkScanner::NetworkScanner(const ScanParams &params, const std::string &subnet,
    std::shared_ptr<PortProber> port_prober, std::shared_ptr<MulticastProber> onvif_prober,
    std::shared_ptr<MulticastProber> upnp_prober, std::unique_ptr<DeviceRegistry> &&registry) :
    m_params(params),
    m_subnet(subnet),
    m_port_prober(std::move(port_prober)),
    m_onvif_prober(std::move(onvif_prober)),
    m_upnp_prober(std::move(upnp_prober)),
    m_registry(std::move(registry)),
    m_is_aborted(false)
{}

NetworkScanner::~NetworkScanner() = default;

const std::string &NetworkScanner::subnet() const
{
    return m_subnet;
}

const ScanParams &NetworkScanner::params() const
{
    return m_params;
}

void NetworkScanner::abort()
{
    LOGGER__INFO("Aborting network scan");
    std::unique_lock<std::mutex> lock(m_abort_mutex);
    m_is_aborted = true;
    m_onvif_prober->abort();
    m_upnp_prober->abort();
}

void NetworkScanner::clear_abort()
{
    std::unique_lock<std::mutex> lock(m_abort_mutex);
    m_is_aborted = false;
    m_onvif_prober->reset();
    m_upnp_prober->reset();
}

void NetworkScanner::add_device(DiscoveredDevice &&device, const DeviceCallback &on_device)
{
    if (!on_device) {
        m_registry->add_or_merge(std::move(device));
        return;
    }

    DiscoveredDevice reported(device);
    if (m_registry->add_or_merge(std::move(device))) {
        std::unique_lock<std::mutex> lock(m_device_callback_mutex);
        on_device(std::move(reported));
    }
}

std::vector<DiscoveredDevice> NetworkScanner::scan(bool port_scan, bool onvif, bool upnp,
    const ProgressCallback &on_progress)
{
    ScanCallbacks callbacks;
    callbacks.on_progress = on_progress;
    return scan(port_scan, onvif, upnp, callbacks);
}

std::vector<DiscoveredDevice> NetworkScanner::scan(bool port_scan, bool onvif, bool upnp,
    const ScanCallbacks &callbacks)
{
    std::unique_lock<std::mutex> scan_lock(m_scan_mutex);
    LOGGER__INFO("Scanning {}.0/24 (ports: {}, onvif: {}, upnp: {})", m_subnet, port_scan, onvif, upnp);

    // Abort flags are cleared when a scan ends, not here
    m_registry->clear();

    DeviceCallback on_device = [this, &callbacks](DiscoveredDevice &&device) {
        add_device(std::move(device), callbacks.on_device);
    };

    std::vector<std::shared_ptr<MulticastProber>> probers;
    if (onvif) {
        probers.push_back(m_onvif_prober);
    }
    if (upnp) {
        probers.push_back(m_upnp_prober);
    }

    std::vector<AsyncThreadPtr<camscan_status>> listeners;
    for (auto &prober : probers) {
        auto listener = make_unique_nothrow<AsyncThread<camscan_status>>(prober->name(), [prober, &on_device]() {
            return prober->discover(on_device);
        });
        if (nullptr == listener) {
            LOGGER__ERROR("Failed to start {} discovery thread", prober->name());
            continue;
        }
        listeners.push_back(std::move(listener));
    }

    if (port_scan) {
        run_port_sweep(callbacks.on_progress, on_device);
    }

    for (size_t i = 0; i < listeners.size(); i++) {
        if (!listeners[i]->wait_for(m_params.multicast_join_timeout)) {
            LOGGER__INFO("{} discovery still running after {}ms, stopping it", probers[i]->name(),
                m_params.multicast_join_timeout.count());
            probers[i]->abort();
        }
        auto status = listeners[i]->get();
        if ((CAMSCAN_SUCCESS != status) && (CAMSCAN_OPERATION_ABORTED != status)) {
            LOGGER__INFO("{} discovery ended with status {}", probers[i]->name(), status);
        }
    }

    auto devices = m_registry->snapshot();
    if (m_is_aborted) {
        LOGGER__INFO("Scan of {}.0/24 was aborted", m_subnet);
    }
    clear_abort();
    LOGGER__INFO("Scan of {}.0/24 found {} devices", m_subnet, devices.size());
    return devices;
}

void NetworkScanner::run_port_sweep(const ProgressCallback &on_progress, const DeviceCallback &on_device)
{
    const auto ports = PortProber::ports();
    std::vector<std::string> hosts;
    for (uint32_t host = CAMSCAN_SUBNET_FIRST_HOST; host <= CAMSCAN_SUBNET_LAST_HOST; host++) {
        hosts.push_back(m_subnet + "." + std::to_string(host));
    }

    const size_t total = hosts.size() * ports.size();
    size_t completed = 0;
    std::mutex progress_mutex;

    ThreadPool pool(std::min(m_params.max_workers, total));
    for (const auto &host : hosts) {
        for (const auto port : ports) {
            pool.add_job([this, host, port, total, &completed, &progress_mutex, &on_progress, &on_device]() {
                if (!m_is_aborted) {
                    auto device = m_port_prober->probe(host, port, m_params.timeout);
                    if (device) {
                        on_device(device.release());
                    } else {
                        LOGGER__TRACE("Probe of {}:{} found nothing, status {}", host, port, device.status());
                    }
                }

                std::unique_lock<std::mutex> lock(progress_mutex);
                completed++;
                if (on_progress) {
                    on_progress(completed, total);
                }
                return CAMSCAN_SUCCESS;
            });
        }
    }
    pool.wait_for_all();
}

} /* namespace camscan */
