/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file network_scanner.hpp
 * @brief Discovers IP cameras and NVRs on a local /24 subnet.
 *
 * Three discovery sources run concurrently:
 *  - a TCP connect sweep of the well known camera/NVR ports of every host in the subnet,
 *  - an ONVIF WS-Discovery multicast probe,
 *  - a UPnP SSDP M-SEARCH multicast probe.
 * Their findings are merged into one inventory keyed by (ip, port).
 **/

#ifndef _CAMSCAN_NETWORK_SCANNER_HPP_
#define _CAMSCAN_NETWORK_SCANNER_HPP_

#include "camscan/camscan.h"
#include "camscan/expected.hpp"
#include "camscan/device.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/** camscan namespace */
namespace camscan
{

class PortProber;
class MulticastProber;
class DeviceRegistry;

/** Parameters of a NetworkScanner */
struct CAMSCANAPI ScanParams final
{
    /** First three octets of the subnet to sweep ("X.Y.Z"). Detected from the default route when empty. */
    std::string subnet;
    /** Bound of a single TCP connect attempt */
    std::chrono::milliseconds timeout = std::chrono::milliseconds(CAMSCAN_DEFAULT_PROBE_TIMEOUT_MS);
    /** Number of concurrent TCP connect attempts */
    size_t max_workers = CAMSCAN_DEFAULT_MAX_WORKERS;
    /** A multicast discovery ends after this long without a reply */
    std::chrono::milliseconds multicast_listen_timeout =
        std::chrono::milliseconds(CAMSCAN_DEFAULT_MULTICAST_LISTEN_TIMEOUT_MS);
    /** How long the scan waits for each multicast discovery once the TCP sweep is over */
    std::chrono::milliseconds multicast_join_timeout =
        std::chrono::milliseconds(CAMSCAN_DEFAULT_MULTICAST_JOIN_TIMEOUT_MS);
};

/** Called after every TCP probe. Calls are serialized and completed grows by one each time. */
using ProgressCallback = std::function<void(size_t completed, size_t total)>;

struct CAMSCANAPI ScanCallbacks final
{
    ProgressCallback on_progress;
    /** Called once per (ip, port) when it is first found. Calls are serialized. */
    DeviceCallback on_device;
};

/** Discovery sources of a NetworkScanner. Null members are replaced by the default implementations. */
struct CAMSCANAPI ScanComponents final
{
    std::shared_ptr<PortProber> port_prober;
    std::shared_ptr<MulticastProber> onvif_prober;
    std::shared_ptr<MulticastProber> upnp_prober;
};

class CAMSCANAPI NetworkScanner final
{
public:
    /**
     * Creates a scanner. If params.subnet is empty the subnet is detected once, here.
     *
     * @return CAMSCAN_INVALID_ARGUMENT if params are invalid (zero workers, zero timeout, malformed subnet).
     */
    static Expected<std::unique_ptr<NetworkScanner>> create(const ScanParams &params = ScanParams());
    static Expected<std::unique_ptr<NetworkScanner>> create(const ScanParams &params, const ScanComponents &components);

    /**
     * Runs the enabled discovery sources and returns the merged inventory, in no particular order.
     * Network failures never fail a scan, they only produce fewer devices.
     */
    std::vector<DiscoveredDevice> scan(bool port_scan = true, bool onvif = true, bool upnp = true,
        const ProgressCallback &on_progress = nullptr);
    std::vector<DiscoveredDevice> scan(bool port_scan, bool onvif, bool upnp, const ScanCallbacks &callbacks);

    /**
     * Stops a running scan from another thread. Pending TCP probes are skipped (but still reported to the
     * progress callback) and multicast discoveries stop listening. The scan returns what was found so far.
     * An abort() issued while no scan is running applies to the next scan.
     */
    void abort();

    const std::string &subnet() const;
    const ScanParams &params() const;

    // Use create()
    NetworkScanner(const ScanParams &params, const std::string &subnet, std::shared_ptr<PortProber> port_prober,
        std::shared_ptr<MulticastProber> onvif_prober, std::shared_ptr<MulticastProber> upnp_prober,
        std::unique_ptr<DeviceRegistry> &&registry);
    ~NetworkScanner();
    NetworkScanner(const NetworkScanner &) = delete;
    NetworkScanner &operator=(const NetworkScanner &) = delete;
    NetworkScanner(NetworkScanner &&) = delete;
    NetworkScanner &operator=(NetworkScanner &&) = delete;

private:
    void run_port_sweep(const ProgressCallback &on_progress, const DeviceCallback &on_device);
    void add_device(DiscoveredDevice &&device, const DeviceCallback &on_device);
    void clear_abort();

    const ScanParams m_params;
    const std::string m_subnet;
    std::shared_ptr<PortProber> m_port_prober;
    std::shared_ptr<MulticastProber> m_onvif_prober;
    std::shared_ptr<MulticastProber> m_upnp_prober;
    std::unique_ptr<DeviceRegistry> m_registry;
    std::atomic<bool> m_is_aborted;
    std::mutex m_abort_mutex;
    // One scan at a time
    std::mutex m_scan_mutex;
    std::mutex m_device_callback_mutex;
};

} /* namespace camscan */

#endif /* _CAMSCAN_NETWORK_SCANNER_HPP_ */
