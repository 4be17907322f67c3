/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file camscan.hpp
 * @brief Includes all the camscan API
 **/

#ifndef _CAMSCAN_HPP_
#define _CAMSCAN_HPP_

#include "camscan/camscan.h"
#include "camscan/expected.hpp"
#include "camscan/device.hpp"
#include "camscan/network_scanner.hpp"

#endif /* _CAMSCAN_HPP_ */
