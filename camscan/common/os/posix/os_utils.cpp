/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.cpp
 * @brief Utilities for Posix methods
 **/

#include "common/os_utils.hpp"

#include <unistd.h>
#include <pthread.h>
#include <sys/stat.h>


namespace camscan
{

void OsUtils::set_current_thread_name(const std::string &name)
{
    (void)name;
#ifndef NDEBUG
    // pthread_setname_np name size is limited to 16 chars (including null terminator)
    const auto truncated_name = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated_name.c_str());
#endif /* NDEBUG */
}

bool OsUtils::is_directory(const std::string &path)
{
    struct stat path_stat = {};
    if (0 != stat(path.c_str(), &path_stat)) {
        return false;
    }
    return S_ISDIR(path_stat.st_mode);
}

bool OsUtils::is_path_accesible(const std::string &path)
{
    return (0 == access(path.c_str(), W_OK));
}

} /* namespace camscan */
