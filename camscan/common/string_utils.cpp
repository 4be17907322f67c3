/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file string_utils.cpp
 * @brief Utilities methods for string.
 **/

#include "common/string_utils.hpp"

#include <cctype>
#include <algorithm>
#include <sstream>

namespace camscan
{

std::string StringUtils::to_lower(const std::string &str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::contains_ignore_case(const std::string &haystack, const std::string &needle)
{
    return (std::string::npos != to_lower(haystack).find(to_lower(needle)));
}

std::vector<std::string> StringUtils::split(const std::string &str, char delimiter)
{
    std::vector<std::string> parts;
    std::stringstream stream(str);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty token
    if (!str.empty() && (str.back() == delimiter)) {
        parts.emplace_back();
    }
    return parts;
}

std::string StringUtils::join(const std::vector<std::string> &parts, const std::string &delimiter)
{
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (0 != i) {
            result += delimiter;
        }
        result += parts[i];
    }
    return result;
}

} /* namespace camscan */
