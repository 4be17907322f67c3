/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_tests.cpp
 **/

#include <gtest/gtest.h>
#include "camscan/device.hpp"

using namespace camscan;

TEST(DiscoveredDevice, RtspUrl) {
    DiscoveredDevice device("192.168.1.10", 554, DeviceType::CAMERA, CAMSCAN_PROTOCOL_RTSP);
    EXPECT_EQ(device.url, "rtsp://192.168.1.10:554/stream");
}

TEST(DiscoveredDevice, HttpUrl) {
    DiscoveredDevice device("10.0.0.5", 8080, DeviceType::UNKNOWN, CAMSCAN_PROTOCOL_HTTP);
    EXPECT_EQ(device.url, "http://10.0.0.5:8080/");
}

TEST(DiscoveredDevice, OnvifUrlIsHttp) {
    DiscoveredDevice device("10.0.0.7", 80, DeviceType::CAMERA, CAMSCAN_PROTOCOL_ONVIF);
    EXPECT_EQ(device.url, "http://10.0.0.7:80/");
}

TEST(DiscoveredDevice, OtherProtocolsUseBareEndpoint) {
    EXPECT_EQ(DiscoveredDevice("10.0.0.7", 443, DeviceType::UNKNOWN, CAMSCAN_PROTOCOL_HTTPS).url, "10.0.0.7:443");
    EXPECT_EQ(DiscoveredDevice("10.0.0.7", 9000).url, "10.0.0.7:9000");
}

TEST(DiscoveredDevice, ExplicitUrlIsKept) {
    DiscoveredDevice device("10.0.0.7", 554, DeviceType::CAMERA, CAMSCAN_PROTOCOL_RTSP, "rtsp://10.0.0.7/main");
    EXPECT_EQ(device.url, "rtsp://10.0.0.7/main");
}

TEST(DiscoveredDevice, UrlNotRecomputedOnProtocolChange) {
    DiscoveredDevice device("10.0.0.7", 554, DeviceType::CAMERA, CAMSCAN_PROTOCOL_RTSP);
    device.protocol = CAMSCAN_PROTOCOL_HTTP;
    EXPECT_EQ(device.url, "rtsp://10.0.0.7:554/stream");
}

TEST(DiscoveredDevice, MalformedInputIsNotValidated) {
    DiscoveredDevice device("not-an-ip", 554, DeviceType::CAMERA, CAMSCAN_PROTOCOL_RTSP);
    EXPECT_EQ(device.url, "rtsp://not-an-ip:554/stream");
}

TEST(DiscoveredDevice, Key) {
    EXPECT_EQ(DiscoveredDevice("10.0.0.7", 554).key(), "10.0.0.7:554");
}

TEST(DiscoveredDevice, DisplayNameFallsBackToTypeAtIp) {
    DiscoveredDevice device("10.0.0.7", 554, DeviceType::CAMERA, CAMSCAN_PROTOCOL_RTSP);
    EXPECT_EQ(device.display_name(), "camera@10.0.0.7");
    EXPECT_EQ(DiscoveredDevice("10.0.0.8", 80).display_name(), "unknown@10.0.0.8");
}

TEST(DiscoveredDevice, DisplayNameJoinsNonEmptyFields) {
    DiscoveredDevice device("10.0.0.7", 37777, DeviceType::NVR, CAMSCAN_PROTOCOL_HTTP);
    device.manufacturer = "Dahua";
    EXPECT_EQ(device.display_name(), "Dahua");

    device.model = "NVR4104";
    EXPECT_EQ(device.display_name(), "Dahua NVR4104");

    device.name = "garage";
    EXPECT_EQ(device.display_name(), "Dahua NVR4104 (garage)");

    device.manufacturer.clear();
    EXPECT_EQ(device.display_name(), "NVR4104 (garage)");
}

TEST(DeviceType, ToString) {
    EXPECT_STREQ(device_type_to_string(DeviceType::CAMERA), "camera");
    EXPECT_STREQ(device_type_to_string(DeviceType::NVR), "nvr");
    EXPECT_STREQ(device_type_to_string(DeviceType::UNKNOWN), "unknown");
}
