/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file onvif_prober.cpp
 **/

#include "multicast/onvif_prober.hpp"

namespace camscan
{

static const char *ONVIF_PROBE_ENVELOPE = R"xml(<?xml version="1.0" encoding="UTF-8"?>
<soap:Envelope xmlns:soap="http://www.w3.org/2003/05/soap-envelope"
    xmlns:tds="http://www.onvif.org/ver10/device/wsdl"
    xmlns:d="http://schemas.xmlsoap.org/ws/2005/04/discovery">
    <soap:Header>
        <wsa:Action xmlns:wsa="http://schemas.xmlsoap.org/ws/2004/08/addressing">
            http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe
        </wsa:Action>
        <wsa:MessageID xmlns:wsa="http://schemas.xmlsoap.org/ws/2004/08/addressing">
            uuid:NetworkScanner
        </wsa:MessageID>
        <wsa:To xmlns:wsa="http://schemas.xmlsoap.org/ws/2004/08/addressing">
            urn:schemas-xmlsoap-org:ws:2005:04:discovery
        </wsa:To>
    </soap:Header>
    <soap:Body>
        <d:Probe><d:Types>tds:Device</d:Types></d:Probe>
    </soap:Body>
</soap:Envelope>)xml";

OnvifProber::OnvifProber(std::chrono::milliseconds listen_timeout, const std::string &target_ip,
    uint16_t target_port) :
    MulticastProber("ONVIF", target_ip, target_port, listen_timeout)
{}

std::string OnvifProber::payload() const
{
    return ONVIF_PROBE_ENVELOPE;
}

Expected<DiscoveredDevice> OnvifProber::parse_reply(const std::string &source_ip, const std::string &reply) const
{
    DiscoveredDevice device(source_ip, CAMSCAN_MULTICAST_DEVICE_PORT, DeviceType::CAMERA, CAMSCAN_PROTOCOL_ONVIF);
    device.manufacturer = infer_manufacturer(reply);
    return device;
}

} /* namespace camscan */
