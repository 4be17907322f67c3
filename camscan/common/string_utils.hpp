/**
 * Copyright (c) 2020-2022 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file string_utils.hpp
 * @brief Defines utilities methods for string.
 **/

#ifndef _CAMSCAN_STRING_UTILS_HPP_
#define _CAMSCAN_STRING_UTILS_HPP_

#include <string>
#include <vector>

namespace camscan
{

class StringUtils {
public:
    static std::string to_lower(const std::string &str);
    static bool contains_ignore_case(const std::string &haystack, const std::string &needle);
    static std::vector<std::string> split(const std::string &str, char delimiter);
    static std::string join(const std::vector<std::string> &parts, const std::string &delimiter);
};

} /* namespace camscan */

#endif /* _CAMSCAN_STRING_UTILS_HPP_ */
