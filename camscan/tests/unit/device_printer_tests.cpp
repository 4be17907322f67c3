/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_printer_tests.cpp
 **/

#include <gtest/gtest.h>
#include "device_printer.hpp"
#include "scan_command.hpp"
#include "common.hpp"

#include <sstream>

namespace {

std::vector<DiscoveredDevice> unsorted_devices()
{
    std::vector<DiscoveredDevice> devices;
    devices.emplace_back("10.0.0.100", 80, DeviceType::UNKNOWN, CAMSCAN_PROTOCOL_HTTP);
    devices.emplace_back("10.0.0.9", 554, DeviceType::CAMERA, CAMSCAN_PROTOCOL_RTSP);
    devices.emplace_back("10.0.0.9", 80, DeviceType::CAMERA, CAMSCAN_PROTOCOL_ONVIF);
    devices.back().manufacturer = "Axis";
    devices.emplace_back("10.0.0.20", 37777, DeviceType::NVR, CAMSCAN_PROTOCOL_HTTP);
    return devices;
}

} /* namespace */

TEST(DevicePrinter, SortsNumericallyByIpThenPort) {
    auto devices = unsorted_devices();
    DevicePrinter::sort_devices(devices);

    ASSERT_EQ(devices.size(), 4u);
    EXPECT_EQ(devices[0].key(), "10.0.0.9:80");
    EXPECT_EQ(devices[1].key(), "10.0.0.9:554");
    EXPECT_EQ(devices[2].key(), "10.0.0.20:37777");
    EXPECT_EQ(devices[3].key(), "10.0.0.100:80");
}

TEST(DevicePrinter, JsonHasFixedKeyOrder) {
    std::vector<DiscoveredDevice> devices;
    devices.emplace_back("10.0.0.9", 554, DeviceType::CAMERA, CAMSCAN_PROTOCOL_RTSP);
    devices.back().manufacturer = "Hikvision";

    auto json = DevicePrinter::to_json(devices);
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0].dump(),
        R"({"ip":"10.0.0.9","port":554,"protocol":"rtsp","type":"camera","manufacturer":"Hikvision","model":"","url":"rtsp://10.0.0.9:554/stream"})");
}

TEST(DevicePrinter, EmptyJsonIsEmptyArray) {
    std::stringstream out;
    DevicePrinter::print_json(out, {});
    EXPECT_EQ(out.str(), "[]\n");
}

TEST(DevicePrinter, TableHasTitleAndRows) {
    auto devices = unsorted_devices();
    DevicePrinter::sort_devices(devices);
    std::stringstream out;
    DevicePrinter::print_table(out, devices);

    const auto table = out.str();
    EXPECT_NE(std::string::npos, table.find("Found 4 device(s)"));
    EXPECT_NE(std::string::npos, table.find("RTSP"));
    EXPECT_NE(std::string::npos, table.find("ONVIF"));
    EXPECT_NE(std::string::npos, table.find("Axis"));
    EXPECT_NE(std::string::npos, table.find("rtsp://10.0.0.9:554/stream"));
    EXPECT_LT(table.find("10.0.0.9 "), table.find("10.0.0.100"));
}

TEST(DevicePrinter, NextStepPrefersRtsp) {
    auto devices = unsorted_devices();
    DevicePrinter::sort_devices(devices);
    EXPECT_EQ(DevicePrinter::next_step_command(devices), "camera -u \"rtsp://10.0.0.9:554/stream\"");
}

TEST(DevicePrinter, NextStepFallsBackToHttpSnapshot) {
    std::vector<DiscoveredDevice> devices;
    devices.emplace_back("10.0.0.20", 37777, DeviceType::NVR, CAMSCAN_PROTOCOL_HTTP);
    EXPECT_EQ(DevicePrinter::next_step_command(devices), "camera -u \"http://10.0.0.20/snapshot.jpg\"");

    devices.clear();
    devices.emplace_back("10.0.0.20", 443, DeviceType::UNKNOWN, CAMSCAN_PROTOCOL_HTTPS);
    EXPECT_EQ(DevicePrinter::next_step_command(devices), "");
}

TEST(DevicePrinter, NoDevicesPrintsTips) {
    std::stringstream out;
    DevicePrinter::print_no_devices(out);
    EXPECT_NE(std::string::npos, out.str().find("No devices found."));
    EXPECT_NE(std::string::npos, out.str().find("-s <subnet>"));
    EXPECT_NE(std::string::npos, out.str().find("-t 2.0"));
}

TEST(ScanSubcommand, ConvertsSecondsToMilliseconds) {
    scan_command_params params;
    params.timeout_seconds = 2.5;
    params.max_workers = 10;
    params.subnet = "10.1.2";

    auto scan_params = ScanSubcommand::to_scan_params(params);
    EXPECT_EQ(scan_params.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(scan_params.max_workers, 10u);
    EXPECT_EQ(scan_params.subnet, "10.1.2");

    params.timeout_seconds = 0.0001;
    EXPECT_EQ(ScanSubcommand::to_scan_params(params).timeout, std::chrono::milliseconds(1));
}

TEST(ScanSubcommand, ClampsLargeTimeouts) {
    scan_command_params params;
    params.timeout_seconds = 3000000.0;
    EXPECT_EQ(ScanSubcommand::to_scan_params(params).timeout, std::chrono::milliseconds(3600000));

    params.timeout_seconds = 1e300;
    EXPECT_EQ(ScanSubcommand::to_scan_params(params).timeout, std::chrono::milliseconds(3600000));
}

TEST(ScanSubcommand, RejectsTimeoutAboveLimit) {
    CLI::App app;
    ScanSubcommand scan_command(app);
    EXPECT_THROW(app.parse("scan -t 3000000", false), CLI::ValidationError);
}

TEST(ScanSubcommand, AcceptsTimeoutWithinLimit) {
    CLI::App app;
    ScanSubcommand scan_command(app);
    EXPECT_NO_THROW(app.parse("scan -t 2.5", false));
}

TEST(CliCommon, FailureMessageNamesStatusOnce) {
    EXPECT_EQ(CliCommon::failure_message(CAMSCAN_TIMEOUT), "camscancli failed with status CAMSCAN_TIMEOUT(4)");
}
