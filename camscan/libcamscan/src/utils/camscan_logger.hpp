/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file camscan_logger.hpp
 * @brief Declares logger used by camscan.
 **/

#ifndef _CAMSCAN_LOGGER_HPP_
#define _CAMSCAN_LOGGER_HPP_


#include "camscan/camscan.h"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "common/env_vars.hpp"

#include <unordered_map>

namespace camscan
{

#define PATH_SEPARATOR "/"

class CamscanLogger {
public:
    static std::unique_ptr<CamscanLogger> &get_instance(spdlog::level::level_enum console_level = spdlog::level::warn,
        spdlog::level::level_enum file_level = spdlog::level::debug, spdlog::level::level_enum flush_level = spdlog::level::warn)
    {
        static std::unique_ptr<CamscanLogger> instance = nullptr;
        auto user_console_logger_level = get_env_variable(CAMSCAN_CONSOLE_LOGGER_LEVEL_ENV_VAR);
        if (user_console_logger_level) {
            auto expected_console_level = get_logger_level_from_string(user_console_logger_level.value());
            if (expected_console_level) {
                console_level = expected_console_level.release();
            } else {
                LOGGER__WARNING("Failed to parse console logger level from environment variable: {}, status: {}",
                    user_console_logger_level.value(), expected_console_level.status());
            }
        }
        if (nullptr == instance) {
            instance = make_unique_nothrow<CamscanLogger>(console_level, file_level, flush_level);
        }
        return instance;
    }

    CamscanLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level, spdlog::level::level_enum flush_level);
    ~CamscanLogger() = default;
    CamscanLogger(CamscanLogger const&) = delete;
    void operator=(CamscanLogger const&) = delete;

    void set_console_level(spdlog::level::level_enum console_level);

    static std::string get_log_path(const std::string &path_env_var);
    static std::shared_ptr<spdlog::sinks::sink> create_file_sink(const std::string &dir_path, const std::string &filename);
    static Expected<spdlog::level::level_enum> get_logger_level_from_string(const std::string &logger_level)
    {
        static const std::unordered_map<std::string, spdlog::level::level_enum> log_level_map = {
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical}
        };
        if(log_level_map.find(logger_level) != log_level_map.end()) {
            return Expected<spdlog::level::level_enum>(log_level_map.at(logger_level));
        }
        return make_unexpected(CAMSCAN_INVALID_ARGUMENT);
    }

private:
    static std::string parse_log_path(const char *log_path);
    void set_levels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level, spdlog::level::level_enum flush_level);

    std::shared_ptr<spdlog::sinks::sink> m_console_sink;

    // Written to the directory the user has chosen via $CAMSCAN_LOGGER_PATH
    std::shared_ptr<spdlog::sinks::sink> m_local_log_file_sink;
    std::shared_ptr<spdlog::logger> m_camscan_logger;
};


} /* namespace camscan */

#endif /* _CAMSCAN_LOGGER_HPP_ */
