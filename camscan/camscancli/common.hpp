/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file common.hpp
 * @brief Common functions and validators of camscancli.
 **/

#ifndef _CAMSCAN_CAMSCANCLI_COMMON_HPP_
#define _CAMSCAN_CAMSCANCLI_COMMON_HPP_

#include "camscancli.hpp"
#include "CLI/CLI.hpp"

#include <chrono>
#include <string>

// http://www.climagic.org/mirrors/VT100_Escape_Codes.html
#define FORMAT_CLEAR_LINE "\033[2K\r"
#define FORMAT_BOLD_PRINT "\x1B[1m"
#define FORMAT_YELLOW_PRINT "\x1B[1;33m"
#define FORMAT_NORMAL_PRINT "\x1B[0m"

class CliCommon final
{
public:
    CliCommon() = delete;

    static void clear_line();
    static std::string duration_to_string(std::chrono::milliseconds duration);
    static std::string failure_message(camscan_status status);
};

// Validators
struct SubnetValidator : public CLI::Validator {
    SubnetValidator();
};

#endif /* _CAMSCAN_CAMSCANCLI_COMMON_HPP_ */
