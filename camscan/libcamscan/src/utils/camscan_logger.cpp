/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file camscan_logger.cpp
 * @brief Implements logger used by camscan.
 **/

#include "common/utils.hpp"
#include "common/os_utils.hpp"
#include "common/env_vars.hpp"

#include "utils/camscan_logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>
#include <cstring>
#include <iostream>


namespace camscan
{


#define MAX_LOG_FILE_SIZE (1024 * 1024) // 1MB

#define CAMSCAN_NAME ("camscan")
#define CAMSCAN_LOGGER_FILENAME ("camscan.log")
#define CAMSCAN_MAX_NUMBER_OF_LOG_FILES (1) // There will be 2 log files - 1 spare
#ifdef NDEBUG
#define CAMSCAN_CONSOLE_LOGGER_PATTERN ("[%n] [%^%l%$] %v") // Console logger will print: [camscan] [log level] msg
#else
#define CAMSCAN_CONSOLE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%P] [%t] [%n] [%^%l%$] [%s:%#] [%!] %v") // Console logger will print: [timestamp] [PID] [TID] [camscan] [log level] [source file:line number] [function name] msg
#endif
#define CAMSCAN_LOCAL_FILE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%t] [%n] [%l] [%s:%#] [%!] %v") // File logger will print: [timestamp] [TID] [camscan] [log level] [source file:line number] [function name] msg

#define PERIODIC_FLUSH_INTERVAL_IN_SECONDS (5)


std::string CamscanLogger::parse_log_path(const char *log_path)
{
    if ((nullptr == log_path) || (std::strlen(log_path) == 0)) {
        return "";
    }

    std::string log_path_str(log_path);
    if (log_path_str == "NONE") {
        return "";
    }

    return log_path_str;
}

std::string CamscanLogger::get_log_path(const std::string &path_env_var)
{
    auto log_path_c_str_exp = get_env_variable(path_env_var.c_str());
    std::string log_path_c_str = (log_path_c_str_exp) ? log_path_c_str_exp.value() : "";
    return parse_log_path(log_path_c_str.c_str());
}

std::shared_ptr<spdlog::sinks::sink> CamscanLogger::create_file_sink(const std::string &dir_path, const std::string &filename)
{
    if ("" == dir_path) {
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }

    if (!OsUtils::is_directory(dir_path)) {
        std::cerr << "camscan warning: Cannot create log file " << filename << "! Path " << dir_path << " is not valid." << std::endl;
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }

    if (!OsUtils::is_path_accesible(dir_path)) {
        std::cerr << "camscan warning: Cannot create log file " << filename << "! Please check the directory " << dir_path << " write permissions." << std::endl;
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }

    const auto file_path = dir_path + PATH_SEPARATOR + filename;
    return make_shared_nothrow<spdlog::sinks::rotating_file_sink_mt>(file_path, MAX_LOG_FILE_SIZE, CAMSCAN_MAX_NUMBER_OF_LOG_FILES);
}

CamscanLogger::CamscanLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level, spdlog::level::level_enum flush_level) :
    m_console_sink(make_shared_nothrow<spdlog::sinks::stderr_color_sink_mt>()),
    m_local_log_file_sink(create_file_sink(get_log_path(CAMSCAN_LOGGER_PATH_ENV_VAR), CAMSCAN_LOGGER_FILENAME))
{
    if ((nullptr == m_console_sink) || (nullptr == m_local_log_file_sink)) {
        std::cerr << "Allocating memory on heap for logger sinks has failed! Please check if this host has enough memory. Writing to log will result in a SEGFAULT!" << std::endl;
        return;
    }

    m_local_log_file_sink->set_pattern(CAMSCAN_LOCAL_FILE_LOGGER_PATTERN);
    m_console_sink->set_pattern(CAMSCAN_CONSOLE_LOGGER_PATTERN);
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sink_vector = { m_console_sink, m_local_log_file_sink };

    m_camscan_logger = make_shared_nothrow<spdlog::logger>(CAMSCAN_NAME, sink_vector.begin(), sink_vector.end());
    if (nullptr == m_camscan_logger) {
        std::cerr << "Allocating memory on heap for camscan logger has failed! Please check if this host has enough memory. Writing to log will result in a SEGFAULT!" << std::endl;
        return;
    }

    set_levels(console_level, file_level, flush_level);
    spdlog::set_default_logger(m_camscan_logger);
}

void CamscanLogger::set_console_level(spdlog::level::level_enum console_level)
{
    if (nullptr != m_console_sink) {
        m_console_sink->set_level(console_level);
    }
}

void CamscanLogger::set_levels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level,
    spdlog::level::level_enum flush_level)
{
    m_console_sink->set_level(console_level);
    m_local_log_file_sink->set_level(file_level);

    if (is_env_variable_on(CAMSCAN_LOGGER_FLUSH_EVERY_PRINT_ENV_VAR)) {
        m_camscan_logger->flush_on(spdlog::level::trace);
        std::cerr << "camscan warning: Flushing log file on every print. May reduce scan performance!" << std::endl;
    } else {
        m_camscan_logger->flush_on(flush_level);
    }

    // Setting logger level to min active level, as traces will only show if the sink level is set to their level
    m_camscan_logger->set_level(static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
    spdlog::flush_every(std::chrono::seconds(PERIODIC_FLUSH_INTERVAL_IN_SECONDS));
}

} /* namespace camscan */
