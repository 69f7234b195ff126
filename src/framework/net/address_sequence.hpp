#ifndef _IK_FRAMEWORK_NET_ADDRESS_SEQUENCE_HPP_
#define _IK_FRAMEWORK_NET_ADDRESS_SEQUENCE_HPP_

#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "net/ip_address.hpp"

namespace ipkit::net {

/**
 * Lazy, finite sequence of addresses covering one or more ascending
 * inclusive spans, optionally capped at a maximum number of addresses.
 *
 * Addresses are produced on demand; every call to begin() starts over.
 * Iterators refer to the sequence and must not outlive it.
 */
class address_sequence
{
public:
    using span = std::pair<uint128_t, uint128_t>;

    address_sequence(ip_version version,
                     std::vector<span> spans,
                     std::optional<uint64_t> limit = std::nullopt);

    class iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ip_address;
        using difference_type = std::ptrdiff_t;
        using pointer = const ip_address*;
        using reference = ip_address;

        iterator() = default;

        ip_address operator*() const;

        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const
        {
            return (!(*this == other));
        }

    private:
        friend class address_sequence;
        iterator(const address_sequence* sequence, size_t span_idx);

        const address_sequence* m_sequence = nullptr;
        size_t m_span = 0;
        uint128_t m_value = 0;
        uint64_t m_remaining = 0;
    };

    iterator begin() const;
    iterator end() const;

    bool empty() const { return (begin() == end()); }

private:
    ip_version m_version;
    std::vector<span> m_spans;
    uint64_t m_limit;
};

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_ADDRESS_SEQUENCE_HPP_ */
