/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_command.cpp
 * @brief Scan the local network for IP cameras and NVRs
 **/
#include "scan_command.hpp"
#include "common.hpp"
#include "device_printer.hpp"
#include "scan_progress.hpp"
#include "common/string_utils.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#define PROGRESS_PRINT_INTERVAL (std::chrono::milliseconds(100))


ScanSubcommand::ScanSubcommand(CLI::App &parent_app) :
    Command(parent_app.add_subcommand("scan", "Scan the network for IP cameras and NVRs"))
{
    m_app->add_option("-s,--subnet", m_params.subnet,
        "Subnet to scan (e.g., 192.168.1). Auto-detected if not provided.")
        ->check(SubnetValidator());
    m_app->add_option("-t,--timeout", m_params.timeout_seconds, "Connection timeout in seconds")
        ->check(CLI::PositiveNumber & CLI::Range(0.0, CAMSCANCLI_MAX_TIMEOUT_SECONDS))
        ->capture_default_str();
    m_app->add_option("--max-workers", m_params.max_workers, "Number of concurrent connection attempts")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    m_app->add_flag("--no-ports", m_params.no_ports, "Disable TCP port scanning");
    m_app->add_flag("--no-onvif", m_params.no_onvif, "Disable ONVIF WS-Discovery");
    m_app->add_flag("--no-upnp", m_params.no_upnp, "Disable UPnP/SSDP discovery");
    m_app->add_flag("--json", m_params.output_json, "Output results as JSON");

    set_footer("Examples:\n"
        "  camscancli scan\n"
        "  camscancli scan -s 10.0.0\n"
        "  camscancli scan --json\n"
        "  camscancli scan --no-ports  # Only use discovery protocols");
}

camscan_status ScanSubcommand::execute()
{
    return scan();
}

ScanParams ScanSubcommand::to_scan_params(const scan_command_params &params)
{
    ScanParams scan_params;
    scan_params.subnet = params.subnet;
    const auto timeout_seconds = std::min(params.timeout_seconds, CAMSCANCLI_MAX_TIMEOUT_SECONDS);
    scan_params.timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_seconds * 1000.0));
    if (0 == scan_params.timeout.count()) {
        // Sub millisecond timeouts are rounded up
        scan_params.timeout = std::chrono::milliseconds(1);
    }
    scan_params.max_workers = params.max_workers;
    return scan_params;
}

void ScanSubcommand::print_methods() const
{
    std::vector<std::string> methods;
    if (!m_params.no_ports) {
        methods.emplace_back("Port scan");
    }
    if (!m_params.no_onvif) {
        methods.emplace_back("ONVIF");
    }
    if (!m_params.no_upnp) {
        methods.emplace_back("UPnP");
    }

    std::cout << "Methods: " << StringUtils::join(methods, ", ") << std::endl << std::endl;
}

camscan_status ScanSubcommand::scan()
{
    TRY(auto scanner, NetworkScanner::create(to_scan_params(m_params)), "Failed to create network scanner");

    if (m_params.output_json) {
        auto devices = scanner->scan(!m_params.no_ports, !m_params.no_onvif, !m_params.no_upnp);
        DevicePrinter::sort_devices(devices);
        DevicePrinter::print_json(std::cout, devices);
        return CAMSCAN_SUCCESS;
    }

    std::cout << std::endl << FORMAT_BOLD_PRINT << "Scanning network: " << scanner->subnet() << ".0/24"
        << FORMAT_NORMAL_PRINT << std::endl;
    std::cout << "This may take a minute..." << std::endl << std::endl;
    print_methods();

    ScanProgressBar progress_bar(std::cout, PROGRESS_PRINT_INTERVAL);
    ProgressCallback on_progress = nullptr;
    if (!m_params.no_ports) {
        on_progress = [&progress_bar](size_t completed, size_t total) {
            progress_bar.make_progress(completed, total);
        };
    }
    auto devices = scanner->scan(!m_params.no_ports, !m_params.no_onvif, !m_params.no_upnp, on_progress);
    progress_bar.finish();

    if (devices.empty()) {
        DevicePrinter::print_no_devices(std::cout);
        return CAMSCAN_SUCCESS;
    }

    DevicePrinter::sort_devices(devices);
    std::cout << std::endl;
    DevicePrinter::print_table(std::cout, devices);
    DevicePrinter::print_next_steps(std::cout, devices);

    return CAMSCAN_SUCCESS;
}
