/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_progress.hpp
 * @brief Show port sweep progress
 **/

#ifndef _CAMSCAN_SCAN_PROGRESS_HPP_
#define _CAMSCAN_SCAN_PROGRESS_HPP_

#include "camscancli.hpp"

#include <chrono>
#include <ostream>


class ScanProgressBar final {
public:
    ScanProgressBar(std::ostream &out, std::chrono::milliseconds print_interval);

    // Matches camscan::ProgressCallback. Calls are serialized by the scanner.
    void make_progress(size_t completed, size_t total);
    void finish();

    std::string get_progress_text(size_t completed, size_t total) const;

private:
    std::ostream &m_out;
    const std::chrono::milliseconds m_print_interval;
    const std::chrono::time_point<std::chrono::steady_clock> m_start;
    std::chrono::time_point<std::chrono::steady_clock> m_last_print;
    bool m_printed;
};

#endif /* _CAMSCAN_SCAN_PROGRESS_HPP_ */
