/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_command.hpp
 * @brief Scan the local network for IP cameras and NVRs
 **/

#ifndef _CAMSCAN_SCAN_COMMAND_HPP_
#define _CAMSCAN_SCAN_COMMAND_HPP_

#include "camscancli.hpp"
#include "command.hpp"
#include "camscan/network_scanner.hpp"
#include "CLI/CLI.hpp"

#define CAMSCANCLI_MAX_TIMEOUT_SECONDS (3600.0)

struct scan_command_params {
    std::string subnet;
    double timeout_seconds = static_cast<double>(CAMSCAN_DEFAULT_PROBE_TIMEOUT_MS) / 1000.0;
    size_t max_workers = CAMSCAN_DEFAULT_MAX_WORKERS;
    bool no_ports = false;
    bool no_onvif = false;
    bool no_upnp = false;
    bool output_json = false;
};

class ScanSubcommand final : public Command {
public:
    explicit ScanSubcommand(CLI::App &parent_app);
    camscan_status execute() override;

    static ScanParams to_scan_params(const scan_command_params &params);

private:
    camscan_status scan();
    void print_methods() const;

    scan_command_params m_params;
};

#endif /* _CAMSCAN_SCAN_COMMAND_HPP_ */
