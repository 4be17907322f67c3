/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file string_utils_tests.cpp
 **/

#include <gtest/gtest.h>
#include "common/string_utils.hpp"

using namespace camscan;

TEST(StringUtils, ContainsIgnoreCase) {
    EXPECT_TRUE(StringUtils::contains_ignore_case("SERVER: HIKVISION/1.0", "hikvision"));
    EXPECT_TRUE(StringUtils::contains_ignore_case("ipcam", "IPCAM"));
    EXPECT_FALSE(StringUtils::contains_ignore_case("router", "camera"));
}

TEST(StringUtils, SplitKeepsEmptyTokens) {
    EXPECT_EQ(StringUtils::split("10.0.0.1", '.'), (std::vector<std::string>{"10", "0", "0", "1"}));
    EXPECT_EQ(StringUtils::split("10..1", '.'), (std::vector<std::string>{"10", "", "1"}));
    EXPECT_EQ(StringUtils::split("10.0.", '.'), (std::vector<std::string>{"10", "0", ""}));
    EXPECT_TRUE(StringUtils::split("", '.').empty());
}

TEST(StringUtils, Join) {
    EXPECT_EQ(StringUtils::join({"10", "0", "0"}, "."), "10.0.0");
    EXPECT_EQ(StringUtils::join({}, "."), "");
}
