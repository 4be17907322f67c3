/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file camscancli.cpp
 * @brief Camscan CLI.
 *
 * Camscan command line interface.
 **/
#include "camscancli.hpp"
#include "command.hpp"
#include "common.hpp"
#include "scan_command.hpp"
#include "utils/camscan_logger.hpp"

#include "CLI/CLI.hpp"

#include <iostream>
#include <map>
#include <memory>


class CamscanCLI : public ContainerCommand {
public:
    CamscanCLI(CLI::App *app) : ContainerCommand(app)
    {
        m_app->set_version_flag("-v,--version", fmt::format("Camscan-CLI version {}.{}.{}", CAMSCAN_MAJOR_VERSION,
            CAMSCAN_MINOR_VERSION, CAMSCAN_REVISION_VERSION));

        static const std::map<std::string, spdlog::level::level_enum> log_levels = {
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical}
        };
        m_app->add_option("--log-level", m_console_level, "Console log level (overrides $" +
            std::string(CAMSCAN_CONSOLE_LOGGER_LEVEL_ENV_VAR) + ")")
            ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));

        add_subcommand<ScanSubcommand>();
    }

    int parse_and_execute(int argc, char **argv)
    {
        CLI11_PARSE(*m_app, argc, argv);

        auto &logger = CamscanLogger::get_instance();
        if ((nullptr != logger) && (spdlog::level::off != m_console_level)) {
            logger->set_console_level(m_console_level);
        }

        auto status = execute();
        if (CAMSCAN_SUCCESS != status) {
            std::cerr << CliCommon::failure_message(status) << std::endl;
            return static_cast<int>(status);
        }
        return 0;
    }

private:
    spdlog::level::level_enum m_console_level = spdlog::level::off;
};

int main(int argc, char** argv) {
    CLI::App app{"Camscan CLI: discover IP cameras and NVRs on the local network"};
    CamscanCLI cli(&app);
    return cli.parse_and_execute(argc, argv);
}
