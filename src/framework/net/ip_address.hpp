#ifndef _IK_FRAMEWORK_NET_IP_ADDRESS_HPP_
#define _IK_FRAMEWORK_NET_IP_ADDRESS_HPP_

#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "net/bitmath.hpp"

namespace ipkit::net {

enum class ip_version : uint8_t { v4 = 4, v6 = 6 };

/**
 * Address width in bits for the given version.
 */
constexpr unsigned width(ip_version version)
{
    return (version == ip_version::v4 ? ipv4_width : ipv6_width);
}

std::string to_string(ip_version);

/**
 * Immutable IPv4 or IPv6 Address
 *
 * The version tag selects the width; the value always lives in the low
 * width bits of a 128 bit integer.
 */
class ip_address
{
public:
    static constexpr size_t ipv4_size = 4;
    static constexpr size_t ipv6_size = 16;

    /* 0.0.0.0 */
    ip_address();

    /**
     * Create an address from an integer value.
     * Throws parse_error if value does not fit the version's width.
     */
    ip_address(ip_version version, uint128_t value);

    /* Parses either IPv4 dotted-decimal or IPv6 text. */
    explicit ip_address(std::string_view str);

    /* 4 bytes for IPv4 or 16 bytes for IPv6, network order */
    ip_address(std::initializer_list<uint8_t> data);
    ip_address(const uint8_t data[], size_t length);

    ip_version version() const { return (m_version); }
    unsigned width() const { return (net::width(m_version)); }
    uint128_t value() const { return (m_value); }

    bool is_ipv4() const { return (m_version == ip_version::v4); }
    bool is_ipv6() const { return (m_version == ip_version::v6); }

    bool is_loopback() const;
    bool is_multicast() const;
    bool is_linklocal() const;

    /* Byte at idx, most significant first */
    uint8_t operator[](size_t idx) const;
    std::vector<uint8_t> to_bytes() const;

    /* 16 bit groups of an IPv6 address, most significant first */
    std::array<uint16_t, 8> groups() const;

private:
    ip_version m_version;
    uint128_t m_value;
};

ip_address make_ipv4(uint32_t value);
ip_address make_ipv6(uint128_t value);

/**
 * Create an address of the given version from an integer value.
 * Throws parse_error if value exceeds the version's width.
 */
ip_address make_address(ip_version version, uint128_t value);

/**
 * Parse text input. The version specific variants throw parse_error on
 * anything but their own grammar.
 */
ip_address parse_ipv4(std::string_view str);
ip_address parse_ipv6(std::string_view str);
ip_address parse_address(std::string_view str);

bool is_ipv4_string(std::string_view str);
bool is_ipv6_string(std::string_view str);

std::string to_string(const ip_address&);

/**
 * Ordering of same-version addresses.
 * Throws version_mismatch_error for mixed versions.
 */
int compare(const ip_address&, const ip_address&);

/* Equality never throws; addresses of different versions differ. */
inline bool operator==(const ip_address& lhs, const ip_address& rhs)
{
    return (lhs.version() == rhs.version() && lhs.value() == rhs.value());
}
inline bool operator!=(const ip_address& lhs, const ip_address& rhs)
{
    return !(lhs == rhs);
}
inline bool operator<(const ip_address& lhs, const ip_address& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const ip_address& lhs, const ip_address& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const ip_address& lhs, const ip_address& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const ip_address& lhs, const ip_address& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const ip_address& value)
{
    os << to_string(value);
    return (os);
}

} // namespace ipkit::net

namespace std {

template <> struct hash<ipkit::net::ip_address>
{
    size_t operator()(const ipkit::net::ip_address& ip) const
    {
        return (std::hash<uint64_t>{}(static_cast<uint64_t>(ip.value() >> 64))
                ^ std::hash<uint64_t>{}(static_cast<uint64_t>(ip.value()))
                ^ static_cast<size_t>(ip.version()));
    }
};

} // namespace std

#endif /* _IK_FRAMEWORK_NET_IP_ADDRESS_HPP_ */
