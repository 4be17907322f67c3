/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file subnet_resolver.hpp
 * @brief Detects the /24 subnet of the host's default route interface
 **/

#ifndef _CAMSCAN_SUBNET_RESOLVER_HPP_
#define _CAMSCAN_SUBNET_RESOLVER_HPP_

#include "camscan/camscan.h"
#include "camscan/expected.hpp"

#include <string>
#include <cstdint>

namespace camscan
{

class SubnetResolver final
{
public:
    /**
     * Returns the first three octets ("X.Y.Z") of the local address the kernel would use to reach the
     * public internet. No packet is sent. Never fails: any error yields CAMSCAN_FALLBACK_SUBNET.
     */
    static std::string detect_subnet();
    static std::string detect_subnet(const std::string &rendezvous_ip, uint16_t rendezvous_port);

    // "a.b.c.d" -> "a.b.c"
    static Expected<std::string> subnet_of(const std::string &ipv4);

    static bool is_valid_subnet(const std::string &subnet);

private:
    static bool is_valid_octet(const std::string &octet);
    static bool has_valid_octets(const std::string &address, size_t octets_count);
    static Expected<std::string> get_local_address(const std::string &rendezvous_ip, uint16_t rendezvous_port);
};

} /* namespace camscan */

#endif /* _CAMSCAN_SUBNET_RESOLVER_HPP_ */
