#ifndef _IK_FRAMEWORK_NET_ADDRESS_TEXT_HPP_
#define _IK_FRAMEWORK_NET_ADDRESS_TEXT_HPP_

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace ipkit::net {

using ipv6_groups = std::array<uint16_t, 8>;

/**
 * Parse strict dotted-decimal IPv4 text: exactly four decimal octets in
 * [0, 255], no signs, no leading zeros except a lone "0".
 * Throws parse_error naming the violated constraint.
 */
uint32_t parse_ipv4_value(std::string_view input);

std::string format_ipv4_value(uint32_t value);

/**
 * Parse IPv6 text (RFC 4291), including a single "::" compression and an
 * optional dotted-decimal IPv4 tail, into eight 16 bit groups.
 * Throws parse_error naming the violated constraint.
 */
ipv6_groups parse_ipv6_groups(std::string_view input);

/**
 * Canonical RFC 5952 text for the given groups. IPv4-mapped and
 * IPv4-compatible addresses use the mixed notation of RFC 4291, except for
 * the unspecified (::) and loopback (::1) addresses.
 */
std::string format_ipv6_groups(const ipv6_groups& groups);

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_ADDRESS_TEXT_HPP_ */
