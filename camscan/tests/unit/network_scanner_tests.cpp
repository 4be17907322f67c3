/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file network_scanner_tests.cpp
 **/

#include <gtest/gtest.h>
#include "camscan/camscan.hpp"
#include "common/async_thread.hpp"
#include "fake_probers.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

using namespace camscan;
using namespace camscan::tests;

namespace {

ScanParams test_params(const std::string &subnet = "10.0.0")
{
    ScanParams params;
    params.subnet = subnet;
    params.timeout = std::chrono::milliseconds(10);
    params.multicast_join_timeout = std::chrono::milliseconds(1000);
    return params;
}

std::shared_ptr<FakeMulticastProber> silent_prober(const std::string &name)
{
    return std::make_shared<FakeMulticastProber>(name, std::vector<DiscoveredDevice>());
}

const DiscoveredDevice *find_device(const std::vector<DiscoveredDevice> &devices, const std::string &ip,
    uint16_t port)
{
    auto it = std::find_if(devices.begin(), devices.end(), [&ip, port](const DiscoveredDevice &device) {
        return (device.ip == ip) && (device.port == port);
    });
    return (devices.end() == it) ? nullptr : &(*it);
}

} /* namespace */

TEST(NetworkScanner, RejectsInvalidParams) {
    auto params = test_params();
    params.max_workers = 0;
    EXPECT_EQ(NetworkScanner::create(params).status(), CAMSCAN_INVALID_ARGUMENT);

    params = test_params();
    params.timeout = std::chrono::milliseconds(0);
    EXPECT_EQ(NetworkScanner::create(params).status(), CAMSCAN_INVALID_ARGUMENT);

    params = test_params();
    params.multicast_listen_timeout = std::chrono::milliseconds(0);
    EXPECT_EQ(NetworkScanner::create(params).status(), CAMSCAN_INVALID_ARGUMENT);

    EXPECT_EQ(NetworkScanner::create(test_params("192.168")).status(), CAMSCAN_INVALID_ARGUMENT);
    EXPECT_EQ(NetworkScanner::create(test_params("192.168.300")).status(), CAMSCAN_INVALID_ARGUMENT);
}

TEST(NetworkScanner, UsesExplicitSubnet) {
    auto scanner = NetworkScanner::create(test_params("172.16.4"));
    ASSERT_TRUE(scanner);
    EXPECT_EQ(scanner.value()->subnet(), "172.16.4");
}

TEST(NetworkScanner, DetectsSubnetWhenNoneGiven) {
    auto scanner = NetworkScanner::create(test_params(""));
    ASSERT_TRUE(scanner);
    EXPECT_FALSE(scanner.value()->subnet().empty());
}

TEST(NetworkScanner, AllProbesFailingGivesEmptyResult) {
    ScanComponents components;
    components.port_prober = std::make_shared<FakePortProber>();
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    auto devices = scanner.value()->scan(true, false, false);
    EXPECT_TRUE(devices.empty());
}

TEST(NetworkScanner, SweepsEveryHostAndTablePort) {
    auto port_prober = std::make_shared<FakePortProber>();
    ScanComponents components;
    components.port_prober = port_prober;
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    std::mutex mutex;
    std::vector<std::pair<size_t, size_t>> progress;
    scanner.value()->scan(true, false, false, [&mutex, &progress](size_t completed, size_t total) {
        std::unique_lock<std::mutex> lock(mutex);
        progress.emplace_back(completed, total);
    });

    EXPECT_EQ(port_prober->probes_count(), 2032u);
    ASSERT_EQ(progress.size(), 2032u);
    for (size_t i = 0; i < progress.size(); i++) {
        EXPECT_EQ(progress[i].first, i + 1);
        EXPECT_EQ(progress[i].second, 2032u);
    }
}

TEST(NetworkScanner, ClassifiesOpenPorts) {
    auto port_prober = std::make_shared<FakePortProber>();
    port_prober->add_open_port("10.0.0.5", 554);
    port_prober->add_open_port("10.0.0.9", 37777);
    port_prober->add_open_port("10.0.0.9", 80);
    ScanComponents components;
    components.port_prober = port_prober;
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    auto devices = scanner.value()->scan(true, false, false);
    ASSERT_EQ(devices.size(), 3u);

    auto camera = find_device(devices, "10.0.0.5", 554);
    ASSERT_NE(nullptr, camera);
    EXPECT_EQ(camera->device_type, DeviceType::CAMERA);
    EXPECT_EQ(camera->url, "rtsp://10.0.0.5:554/stream");

    auto nvr = find_device(devices, "10.0.0.9", 37777);
    ASSERT_NE(nullptr, nvr);
    EXPECT_EQ(nvr->device_type, DeviceType::NVR);
    EXPECT_EQ(nvr->protocol, "http");

    auto web = find_device(devices, "10.0.0.9", 80);
    ASSERT_NE(nullptr, web);
    EXPECT_EQ(web->device_type, DeviceType::UNKNOWN);
}

TEST(NetworkScanner, SameHostFromTwoSourcesStaysSeparate) {
    auto port_prober = std::make_shared<FakePortProber>();
    port_prober->add_open_port("10.0.0.7", 554);

    DiscoveredDevice onvif_device("10.0.0.7", 80, DeviceType::CAMERA, CAMSCAN_PROTOCOL_ONVIF);
    onvif_device.manufacturer = "Hikvision";

    ScanComponents components;
    components.port_prober = port_prober;
    components.onvif_prober = std::make_shared<FakeMulticastProber>("ONVIF",
        std::vector<DiscoveredDevice>{onvif_device});
    components.upnp_prober = silent_prober("UPnP");
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    auto devices = scanner.value()->scan();
    ASSERT_EQ(devices.size(), 2u);

    auto rtsp = find_device(devices, "10.0.0.7", 554);
    ASSERT_NE(nullptr, rtsp);
    EXPECT_EQ(rtsp->protocol, "rtsp");
    EXPECT_EQ(rtsp->manufacturer, "");

    auto onvif = find_device(devices, "10.0.0.7", 80);
    ASSERT_NE(nullptr, onvif);
    EXPECT_EQ(onvif->protocol, "onvif");
    EXPECT_EQ(onvif->manufacturer, "Hikvision");
}

TEST(NetworkScanner, SourcesMergeOnSameKey) {
    auto port_prober = std::make_shared<FakePortProber>();
    port_prober->add_open_port("10.0.0.8", 80);

    DiscoveredDevice upnp_device("10.0.0.8", 80, DeviceType::CAMERA, CAMSCAN_PROTOCOL_HTTP);
    upnp_device.manufacturer = "Dahua";

    ScanComponents components;
    components.port_prober = port_prober;
    components.onvif_prober = silent_prober("ONVIF");
    components.upnp_prober = std::make_shared<FakeMulticastProber>("UPnP",
        std::vector<DiscoveredDevice>{upnp_device});
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    auto devices = scanner.value()->scan();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].key(), "10.0.0.8:80");
    EXPECT_EQ(devices[0].manufacturer, "Dahua");
}

TEST(NetworkScanner, DisabledSourcesAreNotRun) {
    auto port_prober = std::make_shared<FakePortProber>();
    auto onvif_prober = silent_prober("ONVIF");
    auto upnp_prober = silent_prober("UPnP");
    ScanComponents components;
    components.port_prober = port_prober;
    components.onvif_prober = onvif_prober;
    components.upnp_prober = upnp_prober;
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    scanner.value()->scan(false, true, false);
    EXPECT_EQ(port_prober->probes_count(), 0u);
    EXPECT_EQ(onvif_prober->discover_count(), 1u);
    EXPECT_EQ(upnp_prober->discover_count(), 0u);
}

TEST(NetworkScanner, ReportsEachKeyOnce) {
    auto port_prober = std::make_shared<FakePortProber>();
    port_prober->add_open_port("10.0.0.3", 80);
    port_prober->add_open_port("10.0.0.4", 8554);

    DiscoveredDevice duplicate("10.0.0.3", 80, DeviceType::CAMERA, CAMSCAN_PROTOCOL_ONVIF);
    ScanComponents components;
    components.port_prober = port_prober;
    components.onvif_prober = std::make_shared<FakeMulticastProber>("ONVIF",
        std::vector<DiscoveredDevice>{duplicate});
    components.upnp_prober = std::make_shared<FakeMulticastProber>("UPnP",
        std::vector<DiscoveredDevice>{duplicate});
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    std::multiset<std::string> reported;
    ScanCallbacks callbacks;
    callbacks.on_device = [&reported](DiscoveredDevice &&device) {
        reported.insert(device.key());
    };
    auto devices = scanner.value()->scan(true, true, true, callbacks);

    EXPECT_EQ(devices.size(), 2u);
    EXPECT_EQ(reported, (std::multiset<std::string>{"10.0.0.3:80", "10.0.0.4:8554"}));
}

TEST(NetworkScanner, RepeatedScansStartFresh) {
    auto port_prober = std::make_shared<FakePortProber>();
    port_prober->add_open_port("10.0.0.5", 554);
    ScanComponents components;
    components.port_prober = port_prober;
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    EXPECT_EQ(scanner.value()->scan(true, false, false).size(), 1u);
    EXPECT_EQ(scanner.value()->scan(false, false, false).size(), 0u);
}

TEST(NetworkScanner, StopsListenerAfterJoinTimeout) {
    DiscoveredDevice early("10.0.0.20", 80, DeviceType::CAMERA, CAMSCAN_PROTOCOL_ONVIF);
    auto onvif_prober = std::make_shared<FakeMulticastProber>("ONVIF", std::vector<DiscoveredDevice>{early}, true);
    ScanComponents components;
    components.onvif_prober = onvif_prober;
    auto params = test_params();
    params.multicast_join_timeout = std::chrono::milliseconds(200);
    auto scanner = NetworkScanner::create(params, components);
    ASSERT_TRUE(scanner);

    const auto start = std::chrono::steady_clock::now();
    auto devices = scanner.value()->scan(false, true, false);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    EXPECT_EQ(onvif_prober->aborted_count(), 1u);
    EXPECT_FALSE(onvif_prober->is_aborted());
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].key(), "10.0.0.20:80");
}

TEST(NetworkScanner, AbortEndsScanEarly) {
    // 2032 probes of 20ms on 2 workers would take about 20 seconds
    auto port_prober = std::make_shared<FakePortProber>(std::chrono::milliseconds(20));
    ScanComponents components;
    components.port_prober = port_prober;
    components.onvif_prober = std::make_shared<FakeMulticastProber>("ONVIF", std::vector<DiscoveredDevice>(), true);
    components.upnp_prober = silent_prober("UPnP");
    auto params = test_params();
    params.max_workers = 2;
    params.multicast_join_timeout = std::chrono::milliseconds(10000);
    auto scanner_exp = NetworkScanner::create(params, components);
    ASSERT_TRUE(scanner_exp);
    auto scanner = scanner_exp.release();

    size_t last_completed = 0;
    const auto start = std::chrono::steady_clock::now();
    AsyncThread<size_t> scan_thread([&scanner, &last_completed]() {
        scanner->scan(true, true, true, [&last_completed](size_t completed, size_t /*total*/) {
            last_completed = completed;
        });
        return last_completed;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    scanner->abort();

    EXPECT_EQ(scan_thread.get(), 2032u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(5000));
    EXPECT_LT(port_prober->probes_count(), 2032u);
}

TEST(NetworkScanner, AbortRightAfterScanStartIsHonored) {
    auto port_prober = std::make_shared<FakePortProber>(std::chrono::milliseconds(5));
    ScanComponents components;
    components.port_prober = port_prober;
    auto params = test_params();
    params.max_workers = 2;
    auto scanner_exp = NetworkScanner::create(params, components);
    ASSERT_TRUE(scanner_exp);
    auto scanner = scanner_exp.release();

    const auto start = std::chrono::steady_clock::now();
    AsyncThread<size_t> scan_thread([&scanner]() {
        return scanner->scan(true, false, false).size();
    });
    scanner->abort();

    EXPECT_EQ(scan_thread.get(), 0u);
    // At most the jobs already running when the abort landed
    EXPECT_LE(port_prober->probes_count(), 2u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(2000));
}

TEST(NetworkScanner, ScanAfterAbortedScanRunsFully) {
    auto port_prober = std::make_shared<FakePortProber>();
    port_prober->add_open_port("10.0.0.9", 554);
    auto onvif_prober = std::make_shared<FakeMulticastProber>("ONVIF",
        std::vector<DiscoveredDevice>{DiscoveredDevice("10.0.0.10", 80, DeviceType::CAMERA, CAMSCAN_PROTOCOL_ONVIF)});
    ScanComponents components;
    components.port_prober = port_prober;
    components.onvif_prober = onvif_prober;
    components.upnp_prober = silent_prober("UPnP");
    auto scanner = NetworkScanner::create(test_params(), components);
    ASSERT_TRUE(scanner);

    // No scan is running, so the abort applies to the next one
    scanner.value()->abort();
    EXPECT_EQ(scanner.value()->scan(true, false, false).size(), 0u);
    EXPECT_EQ(port_prober->probes_count(), 0u);

    auto devices = scanner.value()->scan(true, true, false);
    EXPECT_EQ(port_prober->probes_count(), 2032u);
    EXPECT_EQ(onvif_prober->aborted_count(), 0u);
    EXPECT_NE(find_device(devices, "10.0.0.9", 554), nullptr);
    EXPECT_NE(find_device(devices, "10.0.0.10", 80), nullptr);
}
