/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_progress.cpp
 * @brief Show port sweep progress
 **/

#include "scan_progress.hpp"
#include "common.hpp"

#include <iomanip>
#include <sstream>

#define PROGRESS_BAR_WIDTH (30)
#define PERCENTS (100)

ScanProgressBar::ScanProgressBar(std::ostream &out, std::chrono::milliseconds print_interval) :
    m_out(out),
    m_print_interval(print_interval),
    m_start(std::chrono::steady_clock::now()),
    m_last_print(),
    m_printed(false)
{}

std::string ScanProgressBar::get_progress_text(size_t completed, size_t total) const
{
    const auto percent = (0 == total) ? PERCENTS : ((completed * PERCENTS) / total);
    const auto filled = (percent * PROGRESS_BAR_WIDTH) / PERCENTS;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_start);

    std::stringstream res;
    res << "Scanning... [" << std::string(filled, '#') << std::string(PROGRESS_BAR_WIDTH - filled, '-') << "] "
        << std::setw(3) << percent << "% (" << completed << "/" << total << ") "
        << CliCommon::duration_to_string(elapsed);
    return res.str();
}

void ScanProgressBar::make_progress(size_t completed, size_t total)
{
    const auto now = std::chrono::steady_clock::now();
    if (m_printed && (completed != total) && ((now - m_last_print) < m_print_interval)) {
        return;
    }

    m_out << FORMAT_CLEAR_LINE << get_progress_text(completed, total) << std::flush;
    m_last_print = now;
    m_printed = true;
}

void ScanProgressBar::finish()
{
    if (m_printed) {
        m_out << std::endl;
    }
}
