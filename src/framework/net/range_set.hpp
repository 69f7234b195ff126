#ifndef _IK_FRAMEWORK_NET_RANGE_SET_HPP_
#define _IK_FRAMEWORK_NET_RANGE_SET_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "net/ip_network.hpp"
#include "net/ip_range.hpp"

namespace ipkit::net {

/**
 * Immutable set of addresses stored as normalized ranges.
 *
 * Member ranges are always sorted by start, disjoint and never adjacent;
 * every constructor and operation restores that form. All ranges share one
 * IP version; an empty set has no version and combines with either.
 */
class range_set
{
public:
    range_set() = default;

    /* Throws version_mismatch_error if the ranges mix IP versions */
    explicit range_set(std::vector<ip_range> ranges);

    static range_set from_networks(const std::vector<ip_network>& networks);

    range_set union_with(const range_set& other) const;
    range_set intersect(const range_set& other) const;
    range_set subtract(const range_set& other) const;

    bool contains(const ip_address&) const;

    /* True only if a single member range spans the whole network */
    bool contains(const ip_network&) const;

    address_count size() const;
    bool empty() const { return (m_ranges.empty()); }
    std::optional<ip_version> version() const;

    std::vector<ip_range> ranges() const { return (m_ranges); }

    /* Minimal CIDR decomposition of every member range, in order */
    std::vector<ip_network> to_cidrs() const;

    address_sequence ips(std::optional<uint64_t> limit = std::nullopt) const;

private:
    std::vector<ip_range> m_ranges;
};

/**
 * Parse a comma separated list of CIDRs, ranges and single addresses.
 * Throws parse_error on a malformed item.
 */
range_set parse_range_set(std::string_view str);

std::string to_string(const range_set&);

inline bool operator==(const range_set& lhs, const range_set& rhs)
{
    return (lhs.ranges() == rhs.ranges());
}
inline bool operator!=(const range_set& lhs, const range_set& rhs)
{
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& os, const range_set& value)
{
    os << to_string(value);
    return (os);
}

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_RANGE_SET_HPP_ */
