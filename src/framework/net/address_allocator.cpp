#include <algorithm>

#include "core/ik_log.h"
#include "net/address_allocator.hpp"
#include "net/errors.hpp"

namespace ipkit::net {

/* Largest integer a double represents exactly */
static constexpr uint64_t max_safe_integer = (uint64_t{1} << 53) - 1;

static const range_set& validate_taken(const ip_network& parent,
                                       const range_set& taken)
{
    auto span = parent.to_range();
    for (const auto& range : taken.ranges()) {
        if (!span.contains(range)) {
            throw parse_error("Taken range " + to_string(range)
                              + " is outside of " + to_string(parent));
        }
    }
    return (taken);
}

address_allocator::address_allocator(const ip_network& parent,
                                     const range_set& taken)
    : m_parent(parent)
    , m_taken(validate_taken(parent, taken))
{}

range_set address_allocator::free() const
{
    auto parent = range_set(std::vector<ip_range>{m_parent.to_range()});
    return (parent.subtract(m_taken));
}

std::optional<ip_address>
address_allocator::next_available(std::optional<ip_address> from) const
{
    auto start = from.value_or(m_parent.first_host());
    if (!m_parent.contains(start)) { return (std::nullopt); }

    for (const auto& range : free().ranges()) {
        if (range.end().value() < start.value()) { continue; }
        return (std::max(range.start(), start));
    }

    return (std::nullopt);
}

std::optional<ip_address> address_allocator::allocate_next()
{
    auto next = next_available();
    if (!next || !allocate_address(*next)) { return (std::nullopt); }
    return (next);
}

bool address_allocator::allocate_address(const ip_address& addr)
{
    if (!m_parent.contains(addr) || m_taken.contains(addr)) {
        IK_LOG(IK_LOG_DEBUG,
               "Address %s is not available in %s",
               to_string(addr).c_str(),
               to_string(m_parent).c_str());
        return (false);
    }

    m_taken = m_taken.union_with(
        range_set(std::vector<ip_range>{ip_range(addr, addr)}));
    IK_LOG(IK_LOG_TRACE,
           "Allocated %s from %s",
           to_string(addr).c_str(),
           to_string(m_parent).c_str());
    return (true);
}

bool address_allocator::allocate_network(const ip_network& network)
{
    if (network.version() != m_parent.version()
        || !m_parent.contains(network)) {
        IK_LOG(IK_LOG_DEBUG,
               "Network %s is not inside %s",
               to_string(network).c_str(),
               to_string(m_parent).c_str());
        return (false);
    }

    auto block = network.to_range();
    auto ranges = m_taken.ranges();
    if (std::any_of(ranges.begin(), ranges.end(), [&](const auto& range) {
            return (range.overlaps(block));
        })) {
        IK_LOG(IK_LOG_DEBUG,
               "Network %s overlaps taken addresses in %s",
               to_string(network).c_str(),
               to_string(m_parent).c_str());
        return (false);
    }

    m_taken = m_taken.union_with(range_set(std::vector<ip_range>{block}));
    IK_LOG(IK_LOG_TRACE,
           "Allocated %s from %s",
           to_string(network).c_str(),
           to_string(m_parent).c_str());
    return (true);
}

std::optional<ip_network>
address_allocator::next_available_network(unsigned prefix) const
{
    auto width = m_parent.width();
    if (prefix < m_parent.prefix_length() || prefix > width) {
        return (std::nullopt);
    }

    auto mask = host_mask(prefix, width);
    for (const auto& range : free().ranges()) {
        auto start = range.start().value();
        auto end = range.end().value();

        /* Round start up to the next block boundary */
        auto candidate = network_of(start, prefix, width);
        if (candidate != start) {
            candidate += mask + 1;
            if (candidate == 0 || candidate > end) { continue; }
        }

        if (end - candidate >= mask) {
            return (ip_network(make_address(m_parent.version(), candidate),
                               prefix));
        }
    }

    return (std::nullopt);
}

std::optional<ip_network>
address_allocator::allocate_next_network(unsigned prefix)
{
    auto next = next_available_network(prefix);
    if (!next || !allocate_network(*next)) { return (std::nullopt); }
    return (next);
}

std::vector<ip_network>
address_allocator::free_blocks(std::optional<unsigned> min_prefix,
                               size_t max_results) const
{
    auto min = min_prefix.value_or(m_parent.prefix_length());
    auto output = std::vector<ip_network>{};

    for (const auto& range : free().ranges()) {
        for (auto&& block : range.to_cidrs()) {
            if (output.size() == max_results) { return (output); }
            if (block.prefix_length() >= min) { output.push_back(block); }
        }
    }

    return (output);
}

address_count address_allocator::available_count() const
{
    return (free().size());
}

double address_allocator::utilization() const
{
    auto total = m_parent.size();
    auto used = m_taken.size();

    while (total > address_count{max_safe_integer}) {
        total >>= 1;
        used >>= 1;
    }

    return (used.to_double() / total.to_double());
}

} // namespace ipkit::net
