#include <algorithm>
#include <cctype>

#include "net/errors.hpp"
#include "net/ip_network.hpp"

namespace ipkit::net {

static unsigned validate_prefix(const ip_address& addr, unsigned prefix)
{
    if (prefix > addr.width()) {
        throw out_of_range_error(
            std::to_string(prefix) + " is larger than "
            + std::to_string(addr.width()) + " for " + to_string(addr.version()));
    }
    return (prefix);
}

ip_network::ip_network(const ip_address& addr, unsigned prefix)
    : m_addr(addr)
    , m_prefix(validate_prefix(addr, prefix))
{}

ip_network::ip_network(std::string_view str)
    : ip_network(parse_network(str))
{}

ip_address ip_network::network() const
{
    return (make_address(version(),
                         network_of(m_addr.value(), m_prefix, width())));
}

ip_address ip_network::broadcast() const
{
    if (m_addr.is_ipv6()) {
        throw invariant_error("IPv6 network " + to_string(*this)
                              + " has no broadcast address");
    }
    return (last_address());
}

ip_address ip_network::last_address() const
{
    return (make_address(version(),
                         broadcast_of(m_addr.value(), m_prefix, width())));
}

ip_address ip_network::netmask() const
{
    return (make_address(version(), prefix_mask(m_prefix, width())));
}

ip_address ip_network::hostmask() const
{
    return (make_address(version(), host_mask(m_prefix, width())));
}

address_count ip_network::size() const
{
    return (address_count::power_of_two(width() - m_prefix));
}

/*
 * Edges (network and broadcast) are hosts by default for IPv6 and for the
 * point-to-point /31, /127 cases, and for host routes.
 */
static bool use_edges(const ip_network& net, std::optional<bool> include_edges)
{
    auto point_to_point = net.prefix_length() + 1 >= net.width();
    auto edges = include_edges.value_or(net.address().is_ipv6() || point_to_point);
    if (!edges && point_to_point) {
        throw invariant_error("Network " + to_string(net)
                              + " has no hosts besides its edges");
    }
    return (edges);
}

ip_address ip_network::first_host(std::optional<bool> include_edges) const
{
    auto first = network().value();
    return (make_address(version(),
                         use_edges(*this, include_edges) ? first : first + 1));
}

ip_address ip_network::last_host(std::optional<bool> include_edges) const
{
    auto last = last_address().value();
    return (make_address(version(),
                         use_edges(*this, include_edges) ? last : last - 1));
}

bool ip_network::contains(const ip_address& addr) const
{
    if (addr.version() != version()) { return (false); }
    return (network_of(addr.value(), m_prefix, width()) == network().value());
}

bool ip_network::contains(const ip_network& other) const
{
    if (other.version() != version()) { return (false); }
    return (contains(other.network()) && contains(other.last_address()));
}

bool ip_network::overlaps(const ip_network& other) const
{
    if (other.version() != version()) { return (false); }

    auto this_net = network().value();
    auto other_net = other.network().value();
    return (network_of(this_net, other.prefix_length(), width()) == other_net
            || network_of(other_net, m_prefix, width()) == this_net);
}

address_sequence ip_network::hosts(std::optional<bool> include_edges) const
{
    auto first = first_host(include_edges).value();
    auto last = last_host(include_edges).value();
    return (address_sequence(version(), {{first, last}}));
}

network_sequence ip_network::subnets(unsigned new_prefix) const
{
    if (new_prefix <= m_prefix) {
        throw invariant_error("New prefix /" + std::to_string(new_prefix)
                              + " must be greater than /"
                              + std::to_string(m_prefix));
    }
    if (new_prefix > width()) {
        throw invariant_error("New prefix /" + std::to_string(new_prefix)
                              + " exceeds the " + std::to_string(width())
                              + " bit address size");
    }

    auto first = network().value();
    auto last = network_of(last_address().value(), new_prefix, width());
    return (network_sequence(version(), first, last, new_prefix));
}

std::vector<ip_network> ip_network::split(size_t parts) const
{
    if (parts == 0) { throw invariant_error("Cannot split into 0 parts"); }
    if (parts == 1) { return {*this}; }

    unsigned bits = 0;
    while ((uint128_t{1} << bits) < parts) { bits++; }

    auto new_prefix = m_prefix + bits;
    if (new_prefix > width()) {
        throw invariant_error("Cannot split " + to_string(*this) + " into "
                              + std::to_string(parts) + " parts");
    }

    auto output = std::vector<ip_network>{};
    output.reserve(parts);
    for (auto&& subnet : subnets(new_prefix)) {
        if (output.size() == parts) { break; }
        output.push_back(subnet);
    }
    return (output);
}

ip_network ip_network::move(int64_t n) const
{
    /* Work on block indexes so /0 and /128 need no special casing */
    auto shift = width() - m_prefix;
    auto index = shift == ipv6_width ? uint128_t{0} : network().value() >> shift;
    auto last_index = m_prefix == 0
                          ? uint128_t{0}
                          : all_ones(width()) >> shift;

    uint128_t moved = 0;
    if (n >= 0) {
        auto step = static_cast<uint128_t>(n);
        if (step > last_index - index) {
            throw out_of_range_error("Moving " + to_string(*this) + " by "
                                     + std::to_string(n)
                                     + " blocks leaves the address space");
        }
        moved = index + step;
    } else {
        auto step = static_cast<uint128_t>(-(n + 1)) + 1;
        if (step > index) {
            throw out_of_range_error("Moving " + to_string(*this) + " by "
                                     + std::to_string(n)
                                     + " blocks leaves the address space");
        }
        moved = index - step;
    }

    auto value = shift == ipv6_width ? uint128_t{0} : moved << shift;
    return (ip_network(make_address(version(), value), m_prefix));
}

ip_range ip_network::to_range() const
{
    return (ip_range(first_host(true), last_host(true)));
}

static bool is_decimal(std::string_view str)
{
    return (!str.empty() && std::all_of(str.begin(), str.end(), [](auto c) {
        return (std::isdigit(static_cast<unsigned char>(c)));
    }));
}

ip_network parse_network(std::string_view str)
{
    auto slash = str.find('/');
    if (slash == std::string_view::npos
        || str.find('/', slash + 1) != std::string_view::npos) {
        throw parse_error("Invalid CIDR format: \"" + std::string(str) + "\"");
    }

    auto addr = parse_address(str.substr(0, slash));
    auto prefix_str = str.substr(slash + 1);
    if (!is_decimal(prefix_str) || prefix_str.size() > 3) {
        throw parse_error("Invalid prefix: \"" + std::string(prefix_str) + "\"");
    }

    unsigned prefix = 0;
    for (auto c : prefix_str) { prefix = prefix * 10 + (c - '0'); }
    if (prefix > addr.width()) {
        throw parse_error(to_string(addr.version()) + " prefix must be 0-"
                          + std::to_string(addr.width()) + ": "
                          + std::string(prefix_str));
    }

    return (ip_network(addr, prefix));
}

std::string to_string(const ip_network& network)
{
    return (to_string(network.address()) + "/"
            + std::to_string(network.prefix_length()));
}

int compare(const ip_network& lhs, const ip_network& rhs)
{
    if (lhs.address() < rhs.address())
        return (-1);
    else if (lhs.address() > rhs.address())
        return (1);
    else if (lhs.prefix_length() < rhs.prefix_length())
        return (-1);
    else if (lhs.prefix_length() > rhs.prefix_length())
        return (1);
    else
        return (0);
}

network_sequence::network_sequence(ip_version version,
                                   uint128_t first,
                                   uint128_t last,
                                   unsigned prefix)
    : m_version(version)
    , m_first(first)
    , m_last(last)
    , m_prefix(prefix)
{}

network_sequence::iterator network_sequence::begin() const
{
    return (iterator(this, false));
}

network_sequence::iterator network_sequence::end() const
{
    return (iterator(this, true));
}

address_count network_sequence::size() const
{
    auto shift = width(m_version) - m_prefix;
    if (shift == ipv6_width) { return (address_count{1}); }
    return (address_count::span(m_first >> shift, m_last >> shift));
}

network_sequence::iterator::iterator(const network_sequence* sequence,
                                     bool done)
    : m_sequence(sequence)
    , m_value(sequence->m_first)
    , m_done(done)
{}

ip_network network_sequence::iterator::operator*() const
{
    return (ip_network(make_address(m_sequence->m_version, m_value),
                       m_sequence->m_prefix));
}

network_sequence::iterator& network_sequence::iterator::operator++()
{
    if (m_done) { return (*this); }

    if (m_value == m_sequence->m_last) {
        m_done = true;
    } else {
        m_value +=
            host_mask(m_sequence->m_prefix, width(m_sequence->m_version)) + 1;
    }
    return (*this);
}

network_sequence::iterator network_sequence::iterator::operator++(int)
{
    auto tmp = *this;
    operator++();
    return (tmp);
}

bool network_sequence::iterator::operator==(const iterator& other) const
{
    if (m_sequence != other.m_sequence || m_done != other.m_done) {
        return (false);
    }
    return (m_done || m_value == other.m_value);
}

} // namespace ipkit::net
