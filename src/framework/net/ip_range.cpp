#include <cctype>

#include "net/errors.hpp"
#include "net/ip_network.hpp"
#include "net/ip_range.hpp"

namespace ipkit::net {

static const ip_address& validate_order(const ip_address& start,
                                        const ip_address& end)
{
    if (start.version() != end.version()) {
        throw version_mismatch_error("Range endpoints " + to_string(start)
                                     + " and " + to_string(end)
                                     + " have different versions");
    }
    if (start.value() > end.value()) {
        throw parse_error("Range start " + to_string(start)
                          + " is greater than end " + to_string(end));
    }
    return (start);
}

ip_range::ip_range(const ip_address& start, const ip_address& end)
    : m_start(validate_order(start, end))
    , m_end(end)
{}

ip_range::ip_range(std::string_view str)
    : ip_range(parse_range(str))
{}

address_count ip_range::size() const
{
    return (address_count::span(m_start.value(), m_end.value()));
}

bool ip_range::contains(const ip_address& addr) const
{
    return (addr.version() == version() && m_start.value() <= addr.value()
            && addr.value() <= m_end.value());
}

bool ip_range::contains(const ip_range& other) const
{
    return (other.version() == version()
            && m_start.value() <= other.start().value()
            && other.end().value() <= m_end.value());
}

bool ip_range::overlaps(const ip_range& other) const
{
    return (other.version() == version()
            && m_start.value() <= other.end().value()
            && other.start().value() <= m_end.value());
}

address_sequence ip_range::ips(std::optional<uint64_t> limit) const
{
    return (address_sequence(version(), {{m_start.value(), m_end.value()}},
                             limit));
}

std::vector<ip_network> ip_range::to_cidrs() const
{
    auto output = std::vector<ip_network>{};
    auto start = m_start.value();
    auto end = m_end.value();

    while (auto block = max_aligned_block(start, end, width(version()))) {
        output.emplace_back(make_address(version(), block->start),
                            block->prefix);

        auto last = broadcast_of(block->start, block->prefix,
                                 width(version()));
        if (last == end) { break; }
        start = last + 1;
    }

    return (output);
}

static std::string_view trim(std::string_view str)
{
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front())))
        str.remove_prefix(1);
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back())))
        str.remove_suffix(1);
    return (str);
}

ip_range parse_range(std::string_view str)
{
    auto dash = str.find('-');
    if (dash == std::string_view::npos
        || str.find('-', dash + 1) != std::string_view::npos) {
        throw parse_error("Invalid range format: \"" + std::string(str) + "\"");
    }

    auto start = parse_address(trim(str.substr(0, dash)));
    auto end = parse_address(trim(str.substr(dash + 1)));
    if (start.version() != end.version()) {
        throw parse_error("Range endpoints must be the same version: \""
                          + std::string(str) + "\"");
    }

    return (ip_range(start, end));
}

std::string to_string(const ip_range& range)
{
    return (to_string(range.start()) + "-" + to_string(range.end()));
}

} // namespace ipkit::net
