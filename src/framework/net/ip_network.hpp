#ifndef _IK_FRAMEWORK_NET_IP_NETWORK_HPP_
#define _IK_FRAMEWORK_NET_IP_NETWORK_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "net/address_count.hpp"
#include "net/address_sequence.hpp"
#include "net/ip_address.hpp"
#include "net/ip_range.hpp"

namespace ipkit::net {

class network_sequence;

/**
 * Immutable IP Network (CIDR block)
 *
 * The stored address may be any address inside the block; network()
 * derives the canonical network address on demand.
 */
class ip_network
{
public:
    /* Throws out_of_range_error if prefix exceeds the address width */
    ip_network(const ip_address&, unsigned prefix);

    /* Parses "address/prefix" */
    explicit ip_network(std::string_view str);

    const ip_address& address() const { return (m_addr); }
    unsigned prefix_length() const { return (m_prefix); }
    ip_version version() const { return (m_addr.version()); }
    unsigned width() const { return (m_addr.width()); }

    ip_address network() const;

    /* Throws invariant_error for IPv6, which has no broadcast address. */
    ip_address broadcast() const;

    /* Highest address of the block for either version */
    ip_address last_address() const;

    ip_address netmask() const;
    ip_address hostmask() const;

    address_count size() const;

    /**
     * First and last host of the block.
     *
     * @param[in] include_edges
     *   Whether the network and broadcast addresses count as hosts. Defaults
     *   to true for IPv6 and for point-to-point blocks (/31, /32, /127,
     *   /128), false otherwise.
     *
     * Throws invariant_error when edges are excluded on a block that has no
     * host between them.
     */
    ip_address first_host(std::optional<bool> include_edges = std::nullopt) const;
    ip_address last_host(std::optional<bool> include_edges = std::nullopt) const;

    bool contains(const ip_address&) const;
    bool contains(const ip_network&) const;
    bool overlaps(const ip_network&) const;

    /* Lazy sequence of every host; see first_host() for include_edges. */
    address_sequence hosts(std::optional<bool> include_edges = std::nullopt) const;

    /**
     * Lazy sequence of the 2^(new_prefix - prefix) subnets of the given
     * prefix length, in ascending order.
     * Throws invariant_error unless prefix < new_prefix <= width.
     */
    network_sequence subnets(unsigned new_prefix) const;

    /**
     * Split into the first parts subnets of the smallest power of two count
     * that is at least parts.
     *
     * @note The result is fully materialized; use subnets() to walk large
     *   IPv6 splits.
     */
    std::vector<ip_network> split(size_t parts) const;

    /**
     * Translate the network by n blocks of its own size.
     * Throws out_of_range_error if the result leaves the address space.
     */
    ip_network move(int64_t n) const;

    ip_range to_range() const;

private:
    ip_address m_addr;
    unsigned m_prefix;
};

/* Parse "address/prefix"; throws parse_error */
ip_network parse_network(std::string_view str);

std::string to_string(const ip_network&);

int compare(const ip_network&, const ip_network&);

inline bool operator==(const ip_network& lhs, const ip_network& rhs)
{
    return (lhs.address() == rhs.address()
            && lhs.prefix_length() == rhs.prefix_length());
}
inline bool operator!=(const ip_network& lhs, const ip_network& rhs)
{
    return !(lhs == rhs);
}
inline bool operator<(const ip_network& lhs, const ip_network& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const ip_network& lhs, const ip_network& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const ip_network& lhs, const ip_network& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const ip_network& lhs, const ip_network& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const ip_network& value)
{
    os << to_string(value);
    return (os);
}

/**
 * Lazy sequence of equally sized, consecutive networks.
 */
class network_sequence
{
public:
    network_sequence(ip_version version,
                     uint128_t first,
                     uint128_t last,
                     unsigned prefix);

    class iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ip_network;
        using difference_type = std::ptrdiff_t;
        using pointer = const ip_network*;
        using reference = ip_network;

        iterator() = default;

        ip_network operator*() const;

        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const
        {
            return (!(*this == other));
        }

    private:
        friend class network_sequence;
        iterator(const network_sequence* sequence, bool done);

        const network_sequence* m_sequence = nullptr;
        uint128_t m_value = 0;
        bool m_done = true;
    };

    iterator begin() const;
    iterator end() const;

    /* Number of networks in the sequence */
    address_count size() const;

private:
    ip_version m_version;
    uint128_t m_first;
    uint128_t m_last;
    unsigned m_prefix;
};

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_IP_NETWORK_HPP_ */
