/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_printer.cpp
 * @brief Prints scan results as a table or as JSON
 **/

#include "device_printer.hpp"
#include "common.hpp"
#include "common/socket.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <tuple>

#define JSON_INDENT (2)
#define COLUMNS_SEPARATOR ("  ")

static uint32_t ip_sort_key(const std::string &ip)
{
    auto address = Socket::make_ipv4_address(ip, 0);
    if (!address) {
        return 0;
    }
    return ntohl(address->sin_addr.s_addr);
}

void DevicePrinter::sort_devices(std::vector<DiscoveredDevice> &devices)
{
    std::sort(devices.begin(), devices.end(), [](const DiscoveredDevice &a, const DiscoveredDevice &b) {
        return std::make_tuple(ip_sort_key(a.ip), a.port) < std::make_tuple(ip_sort_key(b.ip), b.port);
    });
}

ordered_json DevicePrinter::to_json(const std::vector<DiscoveredDevice> &devices)
{
    ordered_json result = ordered_json::array();
    for (const auto &device : devices) {
        ordered_json entry;
        entry["ip"] = device.ip;
        entry["port"] = device.port;
        entry["protocol"] = device.protocol;
        entry["type"] = device_type_to_string(device.device_type);
        entry["manufacturer"] = device.manufacturer;
        entry["model"] = device.model;
        entry["url"] = device.url;
        result.push_back(entry);
    }
    return result;
}

void DevicePrinter::print_json(std::ostream &out, const std::vector<DiscoveredDevice> &devices)
{
    out << to_json(devices).dump(JSON_INDENT) << std::endl;
}

void DevicePrinter::print_table(std::ostream &out, const std::vector<DiscoveredDevice> &devices)
{
    using Row = std::array<std::string, 6>;
    std::vector<Row> rows;
    rows.push_back({"Type", "IP Address", "Port", "Protocol", "Manufacturer", "URL"});
    for (const auto &device : devices) {
        auto protocol = device.protocol;
        std::transform(protocol.begin(), protocol.end(), protocol.begin(), ::toupper);
        rows.push_back({device_type_to_string(device.device_type), device.ip, std::to_string(device.port), protocol,
            device.manufacturer.empty() ? "-" : device.manufacturer, device.url});
    }

    Row::size_type columns_count = rows[0].size();
    std::vector<size_t> widths(columns_count, 0);
    for (const auto &row : rows) {
        for (size_t i = 0; i < columns_count; i++) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    out << FORMAT_BOLD_PRINT << "Found " << devices.size() << " device(s)" << FORMAT_NORMAL_PRINT << std::endl;
    for (size_t row_index = 0; row_index < rows.size(); row_index++) {
        const auto &row = rows[row_index];
        for (size_t i = 0; i < columns_count; i++) {
            out << std::left << std::setw(static_cast<int>(widths[i])) << row[i];
            if (i + 1 < columns_count) {
                out << COLUMNS_SEPARATOR;
            }
        }
        out << std::endl;

        if (0 == row_index) {
            size_t line_width = 0;
            for (const auto width : widths) {
                line_width += width;
            }
            line_width += (columns_count - 1) * std::string(COLUMNS_SEPARATOR).size();
            out << std::string(line_width, '-') << std::endl;
        }
    }
}

std::string DevicePrinter::next_step_command(const std::vector<DiscoveredDevice> &devices)
{
    auto rtsp_device = std::find_if(devices.begin(), devices.end(),
        [](const DiscoveredDevice &device) { return CAMSCAN_PROTOCOL_RTSP == device.protocol; });
    if (devices.end() != rtsp_device) {
        return "camera -u \"" + rtsp_device->url + "\"";
    }

    auto http_device = std::find_if(devices.begin(), devices.end(),
        [](const DiscoveredDevice &device) { return CAMSCAN_PROTOCOL_HTTP == device.protocol; });
    if (devices.end() != http_device) {
        return "camera -u \"http://" + http_device->ip + "/snapshot.jpg\"";
    }

    return "";
}

void DevicePrinter::print_next_steps(std::ostream &out, const std::vector<DiscoveredDevice> &devices)
{
    out << std::endl << FORMAT_BOLD_PRINT << "Next steps:" << FORMAT_NORMAL_PRINT << std::endl;
    out << "  Use discovered URLs with the camera command:" << std::endl << std::endl;

    const auto command = next_step_command(devices);
    if (!command.empty()) {
        out << "  " << command << std::endl;
    }
}

void DevicePrinter::print_no_devices(std::ostream &out)
{
    out << FORMAT_YELLOW_PRINT << "No devices found." << FORMAT_NORMAL_PRINT << std::endl;
    out << std::endl << "Tips:" << std::endl;
    out << "  * Make sure cameras are powered on and connected" << std::endl;
    out << "  * Try a different subnet with -s <subnet>" << std::endl;
    out << "  * Increase timeout with -t 2.0" << std::endl;
}
