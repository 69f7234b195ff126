#ifndef _IK_FRAMEWORK_NET_IP_RANGE_HPP_
#define _IK_FRAMEWORK_NET_IP_RANGE_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "net/address_count.hpp"
#include "net/address_sequence.hpp"
#include "net/ip_address.hpp"

namespace ipkit::net {

class ip_network;

/**
 * Immutable inclusive range of addresses [start, end]
 */
class ip_range
{
public:
    /**
     * Throws version_mismatch_error if the versions differ and parse_error
     * if start is above end.
     */
    ip_range(const ip_address& start, const ip_address& end);

    /* Parses "start - end" */
    explicit ip_range(std::string_view str);

    const ip_address& start() const { return (m_start); }
    const ip_address& end() const { return (m_end); }
    ip_version version() const { return (m_start.version()); }

    address_count size() const;

    bool contains(const ip_address&) const;
    bool contains(const ip_range&) const;
    bool overlaps(const ip_range&) const;

    /* Lazy sequence of the range's addresses, optionally capped */
    address_sequence ips(std::optional<uint64_t> limit = std::nullopt) const;

    /**
     * Minimal list of networks exactly covering the range, in ascending
     * order.
     */
    std::vector<ip_network> to_cidrs() const;

private:
    ip_address m_start;
    ip_address m_end;
};

/* Parse "start - end" (whitespace around the dash optional); throws parse_error */
ip_range parse_range(std::string_view str);

std::string to_string(const ip_range&);

inline bool operator==(const ip_range& lhs, const ip_range& rhs)
{
    return (lhs.start() == rhs.start() && lhs.end() == rhs.end());
}
inline bool operator!=(const ip_range& lhs, const ip_range& rhs)
{
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& os, const ip_range& value)
{
    os << to_string(value);
    return (os);
}

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_IP_RANGE_HPP_ */
