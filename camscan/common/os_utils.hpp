/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.hpp
 * @brief Utilities for OS methods
 **/

#ifndef _CAMSCAN_OS_UTILS_HPP_
#define _CAMSCAN_OS_UTILS_HPP_

#include "camscan/camscan.h"
#include "camscan/expected.hpp"

#include <string>


namespace camscan
{

class OsUtils final
{
public:
    OsUtils() = delete;

    static void set_current_thread_name(const std::string &name);
    static bool is_directory(const std::string &path);
    static bool is_path_accesible(const std::string &path);
};

} /* namespace camscan */

#endif /* _CAMSCAN_OS_UTILS_HPP_ */
