/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file common.cpp
 * @brief Common functions.
 **/
#include "common.hpp"
#include "net/subnet_resolver.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>

void CliCommon::clear_line()
{
    std::cout << FORMAT_CLEAR_LINE << std::flush;
}

std::string CliCommon::duration_to_string(std::chrono::milliseconds duration)
{
    std::stringstream result;
    result << std::fixed << std::setprecision(1) << (static_cast<double>(duration.count()) / 1000.0) << "s";
    return result.str();
}

std::string CliCommon::failure_message(camscan_status status)
{
    std::stringstream result;
    result << "camscancli failed with status " << status;
    return result.str();
}

SubnetValidator::SubnetValidator()
{
    name_ = "SUBNET";
    func_ = [](const std::string &subnet) {
        if (!SubnetResolver::is_valid_subnet(subnet)) {
            return "Invalid subnet '" + subnet + "', expected the first three octets of an IPv4 address (e.g. 192.168.1)";
        }
        // Success
        return std::string();
    };
}
