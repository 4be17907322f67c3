/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_printer.hpp
 * @brief Prints scan results as a table or as JSON
 **/

#ifndef _CAMSCAN_DEVICE_PRINTER_HPP_
#define _CAMSCAN_DEVICE_PRINTER_HPP_

#include "camscancli.hpp"
#include "camscan/device.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <vector>

using ordered_json = nlohmann::ordered_json;

class DevicePrinter final
{
public:
    DevicePrinter() = delete;

    // Numeric IP order, then port
    static void sort_devices(std::vector<DiscoveredDevice> &devices);

    static ordered_json to_json(const std::vector<DiscoveredDevice> &devices);

    static void print_json(std::ostream &out, const std::vector<DiscoveredDevice> &devices);
    static void print_table(std::ostream &out, const std::vector<DiscoveredDevice> &devices);
    static void print_next_steps(std::ostream &out, const std::vector<DiscoveredDevice> &devices);
    static void print_no_devices(std::ostream &out);

    // Command line that opens the first RTSP device (or the snapshot of the first HTTP device). Empty if none.
    static std::string next_step_command(const std::vector<DiscoveredDevice> &devices);
};

#endif /* _CAMSCAN_DEVICE_PRINTER_HPP_ */
