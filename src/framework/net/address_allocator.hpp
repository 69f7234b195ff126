#ifndef _IK_FRAMEWORK_NET_ADDRESS_ALLOCATOR_HPP_
#define _IK_FRAMEWORK_NET_ADDRESS_ALLOCATOR_HPP_

#include <optional>
#include <vector>

#include "net/ip_network.hpp"
#include "net/range_set.hpp"

namespace ipkit::net {

/**
 * First-fit address allocator for a parent network.
 *
 * Tracks taken addresses as a range_set; every successful allocation
 * replaces the taken set with a new, normalized one. Allocation failures
 * are reported through the return value, never by throwing.
 *
 * @note The allocator is not thread safe; callers sharing one between
 *   threads must serialize access.
 */
class address_allocator
{
public:
    /**
     * Throws parse_error if any taken range lies outside the parent network
     * or if taken is of a different IP version.
     */
    explicit address_allocator(const ip_network& parent,
                               const range_set& taken = range_set{});

    const ip_network& parent() const { return (m_parent); }
    const range_set& taken() const { return (m_taken); }

    /* Addresses of the parent not yet taken */
    range_set free() const;

    /**
     * Lowest free address at or above from; from defaults to the parent's
     * first usable host. A from outside the parent yields std::nullopt.
     */
    std::optional<ip_address>
    next_available(std::optional<ip_address> from = std::nullopt) const;

    /* Take the address returned by next_available() */
    std::optional<ip_address> allocate_next();

    /* Fails if addr is outside the parent or already taken */
    bool allocate_address(const ip_address& addr);

    /* Fails on version mismatch, a block outside the parent or any overlap */
    bool allocate_network(const ip_network& network);

    /**
     * Lowest free, aligned block of the given prefix length inside the
     * parent.
     */
    std::optional<ip_network> next_available_network(unsigned prefix) const;
    std::optional<ip_network> allocate_next_network(unsigned prefix);

    /**
     * Free space as CIDR blocks.
     *
     * @param[in] min_prefix
     *   Smallest prefix length (largest block) to report; blocks with a
     *   shorter prefix are skipped. Defaults to the parent prefix.
     * @param[in] max_results
     *   Maximum number of blocks returned.
     */
    std::vector<ip_network>
    free_blocks(std::optional<unsigned> min_prefix = std::nullopt,
                size_t max_results = 100) const;

    address_count available_count() const;

    /* Fraction of the parent that is taken, in [0, 1] */
    double utilization() const;

private:
    ip_network m_parent;
    range_set m_taken;
};

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_ADDRESS_ALLOCATOR_HPP_ */
