#ifndef _IK_FRAMEWORK_NET_PTR_HPP_
#define _IK_FRAMEWORK_NET_PTR_HPP_

#include <string>
#include <vector>

#include "net/ip_address.hpp"
#include "net/ip_network.hpp"

namespace ipkit::net {

/**
 * Reverse DNS name of an address, e.g. "1.1.168.192.in-addr.arpa" or the
 * 32 reversed nibbles of an IPv6 address followed by "ip6.arpa".
 */
std::string to_ptr(const ip_address&);

/**
 * Reverse zones covering a network.
 *
 * IPv4 zones are cut at no more than 24 bits and named after the masked
 * network. IPv6 zones are nibble aligned: the prefix is rounded down to a
 * multiple of 4, at most 124.
 */
std::vector<std::string> ptr_zones(const ip_network&);

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_PTR_HPP_ */
