#include <algorithm>

#include "net/ptr.hpp"

namespace ipkit::net {

static constexpr auto ipv4_zone = "in-addr.arpa";
static constexpr auto ipv6_zone = "ip6.arpa";

static std::string ipv4_ptr(uint32_t value)
{
    auto output = std::string{};
    for (auto i = 0; i < 4; i++) {
        output += std::to_string((value >> (8 * i)) & 0xff) + ".";
    }
    return (output + ipv4_zone);
}

/* Reversed dotted nibbles of the leading count nibbles of value */
static std::string ipv6_ptr(uint128_t value, unsigned count)
{
    static constexpr char hex[] = "0123456789abcdef";

    auto output = std::string{};
    for (auto i = count; i > 0; i--) {
        auto shift = 4 * (32 - i);
        output += hex[static_cast<unsigned>(value >> shift) & 0xf];
        output += '.';
    }
    return (output + ipv6_zone);
}

std::string to_ptr(const ip_address& addr)
{
    if (addr.is_ipv4()) {
        return (ipv4_ptr(static_cast<uint32_t>(addr.value())));
    }
    return (ipv6_ptr(addr.value(), 32));
}

std::vector<std::string> ptr_zones(const ip_network& network)
{
    auto value = network.address().value();
    if (network.address().is_ipv4()) {
        auto prefix = std::min(network.prefix_length(), 24U);
        return {ipv4_ptr(
            static_cast<uint32_t>(network_of(value, prefix, ipv4_width)))};
    }

    auto prefix = std::min(network.prefix_length() / 4 * 4, 124U);
    return {ipv6_ptr(value, prefix / 4)};
}

} // namespace ipkit::net
