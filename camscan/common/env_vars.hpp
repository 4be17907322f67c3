/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file env_vars.hpp
 * @brief: defines a set of environment variables used in camscan
 * **/

#ifndef CAMSCAN_ENV_VARS_HPP_
#define CAMSCAN_ENV_VARS_HPP_


namespace camscan
{

/* Directory of the local log file. "NONE" (or unset) disables file logging */
#define CAMSCAN_LOGGER_PATH_ENV_VAR ("CAMSCAN_LOGGER_PATH")

/* One of: debug, info, warning, error, critical */
#define CAMSCAN_CONSOLE_LOGGER_LEVEL_ENV_VAR ("CAMSCAN_CONSOLE_LOGGER_LEVEL")

#define CAMSCAN_LOGGER_FLUSH_EVERY_PRINT_ENV_VAR ("CAMSCAN_LOGGER_FLUSH_EVERY_PRINT")

} /* namespace camscan */

#endif /* CAMSCAN_ENV_VARS_HPP_ */
