/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file subnet_resolver.cpp
 **/

#include "net/subnet_resolver.hpp"
#include "common/socket.hpp"
#include "common/string_utils.hpp"
#include "common/utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace camscan
{

#define IPV4_OCTETS_COUNT (4)
#define SUBNET_OCTETS_COUNT (3)
#define MAX_OCTET_DIGITS (3)

std::string SubnetResolver::detect_subnet()
{
    return detect_subnet(CAMSCAN_SUBNET_RENDEZVOUS_IP, CAMSCAN_SUBNET_RENDEZVOUS_PORT);
}

std::string SubnetResolver::detect_subnet(const std::string &rendezvous_ip, uint16_t rendezvous_port)
{
    auto local_address = get_local_address(rendezvous_ip, rendezvous_port);
    if (!local_address) {
        LOGGER__INFO("Failed to detect local address (status {}), falling back to subnet {}",
            local_address.status(), CAMSCAN_FALLBACK_SUBNET);
        return CAMSCAN_FALLBACK_SUBNET;
    }

    auto subnet = subnet_of(local_address.value());
    if (!subnet) {
        LOGGER__INFO("Local address {} is not a valid IPv4 address, falling back to subnet {}",
            local_address.value(), CAMSCAN_FALLBACK_SUBNET);
        return CAMSCAN_FALLBACK_SUBNET;
    }

    LOGGER__DEBUG("Detected local address {}, subnet {}", local_address.value(), subnet.value());
    return subnet.release();
}

// Failures here are expected on hosts without a default route, so they are not logged as errors
Expected<std::string> SubnetResolver::get_local_address(const std::string &rendezvous_ip, uint16_t rendezvous_port)
{
    TRY(auto socket, Socket::create(AF_INET, SOCK_DGRAM, 0));

    auto rendezvous_address = Socket::make_ipv4_address(rendezvous_ip, rendezvous_port);
    if (!rendezvous_address) {
        return make_unexpected(rendezvous_address.status());
    }

    // Connecting a UDP socket only selects a route and a source address
    auto status = socket.connect(reinterpret_cast<const sockaddr*>(&rendezvous_address.value()),
        sizeof(rendezvous_address.value()));
    if (CAMSCAN_SUCCESS != status) {
        LOGGER__DEBUG("Failed to connect to rendezvous address {}:{}, status {}", rendezvous_ip, rendezvous_port,
            status);
        return make_unexpected(status);
    }

    sockaddr_in local_address{};
    socklen_t local_address_size = sizeof(local_address);
    status = socket.get_sock_name(reinterpret_cast<sockaddr*>(&local_address), &local_address_size);
    CHECK_SUCCESS_AS_EXPECTED(status);
    if (INADDR_ANY == local_address.sin_addr.s_addr) {
        LOGGER__DEBUG("No local address was bound for rendezvous address {}", rendezvous_ip);
        return make_unexpected(CAMSCAN_HOST_UNREACHABLE);
    }

    return Socket::ipv4_to_string(local_address);
}

bool SubnetResolver::is_valid_octet(const std::string &octet)
{
    if (octet.empty() || (octet.size() > MAX_OCTET_DIGITS)) {
        return false;
    }
    for (const auto c : octet) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return (std::stoi(octet) <= std::numeric_limits<uint8_t>::max());
}

bool SubnetResolver::has_valid_octets(const std::string &address, size_t octets_count)
{
    const auto octets = StringUtils::split(address, '.');
    if (octets_count != octets.size()) {
        return false;
    }
    return std::all_of(octets.begin(), octets.end(), is_valid_octet);
}

Expected<std::string> SubnetResolver::subnet_of(const std::string &ipv4)
{
    if (!has_valid_octets(ipv4, IPV4_OCTETS_COUNT)) {
        LOGGER__DEBUG("'{}' is not a dotted IPv4 address", ipv4);
        return make_unexpected(CAMSCAN_INVALID_ARGUMENT);
    }

    return Expected<std::string>(ipv4.substr(0, ipv4.rfind('.')));
}

bool SubnetResolver::is_valid_subnet(const std::string &subnet)
{
    return has_valid_octets(subnet, SUBNET_OCTETS_COUNT);
}

} /* namespace camscan */
