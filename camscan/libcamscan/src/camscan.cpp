/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file camscan.cpp
 * @brief Implementation of the camscan C API.
 **/

#include "camscan/camscan.h"

#include "common/logger_macros.hpp"

using namespace camscan;

static const char *camscan_status_msg_format[] =
{
#define CAMSCAN_STATUS__X(value, name) #name,
    CAMSCAN_STATUS_VARIABLES
#undef CAMSCAN_STATUS__X
};

const char* camscan_get_status_message(camscan_status status)
{
    if ((status < 0) || (status >= CAMSCAN_STATUS_COUNT)) {
        LOGGER__ERROR("Failed to get camscan_status message because of invalid camscan_status value. Max camscan_status value = {}, given value = {}",
            (CAMSCAN_STATUS_COUNT-1), static_cast<int>(status));
        return nullptr;
    }
    return camscan_status_msg_format[status];
}
