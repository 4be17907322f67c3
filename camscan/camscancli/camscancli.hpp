/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file camscancli.hpp
 * @brief Camscan CLI.
 **/

#ifndef _CAMSCAN_CAMSCANCLI_HPP_
#define _CAMSCAN_CAMSCANCLI_HPP_

#include "camscan/camscan.h"
#include "camscan/expected.hpp"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "CLI/CLI.hpp"
#include <string>

using namespace camscan;

#define PARSE_CHECK(cond, message) \
    do {                                                                        \
        if (!(cond)) {                                                          \
            throw CLI::ParseError(message, CLI::ExitCodes::InvalidError);       \
        }                                                                       \
    } while (0)

enum class OptionVisibility {
    VISIBLE,
    HIDDEN
};

#endif /* _CAMSCAN_CAMSCANCLI_HPP_ */
