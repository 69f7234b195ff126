#include <algorithm>

#include "net/address_text.hpp"
#include "net/errors.hpp"
#include "net/ip_address.hpp"

namespace ipkit::net {

std::string to_string(ip_version version)
{
    return (version == ip_version::v4 ? "IPv4" : "IPv6");
}

static uint128_t validate_value(ip_version version, uint128_t value)
{
    if (value > all_ones(width(version))) {
        throw parse_error(to_string(version) + " value " + to_string(value)
                          + " is out of range");
    }
    return (value);
}

static uint128_t load_bytes(const uint8_t data[], size_t length)
{
    uint128_t value = 0;
    for (size_t idx = 0; idx < length; idx++) {
        value = (value << 8) | data[idx];
    }
    return (value);
}

static ip_version version_for_length(size_t length)
{
    switch (length) {
    case ip_address::ipv4_size:
        return (ip_version::v4);
    case ip_address::ipv6_size:
        return (ip_version::v6);
    default:
        throw parse_error("Address bytes must be "
                          + std::to_string(ip_address::ipv4_size) + " or "
                          + std::to_string(ip_address::ipv6_size)
                          + " bytes, got " + std::to_string(length));
    }
}

ip_address::ip_address()
    : m_version(ip_version::v4)
    , m_value(0)
{}

ip_address::ip_address(ip_version version, uint128_t value)
    : m_version(version)
    , m_value(validate_value(version, value))
{}

ip_address::ip_address(std::string_view str)
    : ip_address(parse_address(str))
{}

ip_address::ip_address(std::initializer_list<uint8_t> data)
    : m_version(version_for_length(data.size()))
    , m_value(load_bytes(data.begin(), data.size()))
{}

ip_address::ip_address(const uint8_t data[], size_t length)
    : m_version(version_for_length(length))
    , m_value(load_bytes(data, length))
{}

bool ip_address::is_loopback() const
{
    return (is_ipv4() ? (m_value >> 24) == 127 : m_value == 1);
}

bool ip_address::is_multicast() const
{
    return (is_ipv4() ? (m_value >> 28) == 0xe : (m_value >> 120) == 0xff);
}

bool ip_address::is_linklocal() const
{
    return (is_ipv4() ? (m_value >> 16) == 0xa9fe
                      : (m_value >> 118) == (0xfe80 >> 6));
}

uint8_t ip_address::operator[](size_t idx) const
{
    auto size = width() / 8;
    if (idx > (size - 1)) {
        throw out_of_range_error(std::to_string(idx) + " is not between 0 and "
                                + std::to_string(size - 1));
    }
    return (static_cast<uint8_t>(m_value >> (8 * (size - 1 - idx))));
}

std::vector<uint8_t> ip_address::to_bytes() const
{
    auto bytes = std::vector<uint8_t>(width() / 8);
    for (size_t idx = 0; idx < bytes.size(); idx++) {
        bytes[idx] = (*this)[idx];
    }
    return (bytes);
}

std::array<uint16_t, 8> ip_address::groups() const
{
    auto groups = std::array<uint16_t, 8>{};
    for (size_t idx = 0; idx < groups.size(); idx++) {
        groups[idx] = static_cast<uint16_t>(m_value >> (112 - 16 * idx));
    }
    return (groups);
}

ip_address make_ipv4(uint32_t value)
{
    return (ip_address(ip_version::v4, value));
}

ip_address make_ipv6(uint128_t value)
{
    return (ip_address(ip_version::v6, value));
}

ip_address make_address(ip_version version, uint128_t value)
{
    return (ip_address(version, value));
}

ip_address parse_ipv4(std::string_view str)
{
    return (make_ipv4(parse_ipv4_value(str)));
}

ip_address parse_ipv6(std::string_view str)
{
    auto groups = parse_ipv6_groups(str);
    uint128_t value = 0;
    for (auto group : groups) { value = (value << 16) | group; }
    return (make_ipv6(value));
}

ip_address parse_address(std::string_view str)
{
    if (str.find(':') != std::string_view::npos) { return (parse_ipv6(str)); }
    return (parse_ipv4(str));
}

bool is_ipv4_string(std::string_view str)
{
    try {
        parse_ipv4_value(str);
        return (true);
    } catch (const parse_error&) {
        return (false);
    }
}

bool is_ipv6_string(std::string_view str)
{
    try {
        parse_ipv6_groups(str);
        return (true);
    } catch (const parse_error&) {
        return (false);
    }
}

std::string to_string(const ip_address& addr)
{
    if (addr.is_ipv4()) {
        return (format_ipv4_value(static_cast<uint32_t>(addr.value())));
    }
    return (format_ipv6_groups(addr.groups()));
}

int compare(const ip_address& lhs, const ip_address& rhs)
{
    if (lhs.version() != rhs.version()) {
        throw version_mismatch_error("Cannot compare " + to_string(lhs.version())
                                     + " address " + to_string(lhs) + " with "
                                     + to_string(rhs.version()) + " address "
                                     + to_string(rhs));
    }

    if (lhs.value() < rhs.value())
        return (-1);
    else if (lhs.value() > rhs.value())
        return (1);
    else
        return (0);
}

} // namespace ipkit::net
