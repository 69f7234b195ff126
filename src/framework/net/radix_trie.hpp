#ifndef _IK_FRAMEWORK_NET_RADIX_TRIE_HPP_
#define _IK_FRAMEWORK_NET_RADIX_TRIE_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/ik_log.h"
#include "net/errors.hpp"
#include "net/ip_network.hpp"

namespace ipkit::net {

/**
 * Binary trie over address bits, most significant bit first, for longest
 * prefix matching.
 *
 * Nodes live in an arena and refer to their children by index; released
 * nodes are recycled through a free list. A node carries an entry only at
 * the terminal position of an inserted network, and the entry keeps the
 * exact network so lookups never rebuild it from the search path.
 *
 * @note Not thread safe; concurrent mutation requires external locking.
 */
template <typename T> class radix_trie
{
public:
    struct match
    {
        ip_network network;
        T value;
    };

    explicit radix_trie(ip_version version)
        : m_version(version)
        , m_nodes(1)
    {}

    ip_version version() const { return (m_version); }

    /**
     * Insert or replace the value stored for a network.
     * Throws version_mismatch_error if the network's version differs from
     * the trie's.
     */
    void insert(const ip_network& network, T value)
    {
        check_version(network.version());

        auto key = network.network().value();
        auto idx = root;
        for (unsigned bit = 0; bit < network.prefix_length(); bit++) {
            auto branch = bit_at_msb(key, bit, width());
            auto child = m_nodes[idx].children[branch];
            if (child == none) {
                child = allocate_node();
                m_nodes[idx].children[branch] = child;
            }
            idx = child;
        }

        auto& entry = m_nodes[idx].entry;
        if (!entry) { m_size++; }
        entry.emplace(node_entry{
            ip_network(network.network(), network.prefix_length()),
            std::move(value)});

        IK_LOG(IK_LOG_TRACE, "Inserted %s", to_string(network).c_str());
    }

    /**
     * Remove the entry for a network, pruning nodes left without children
     * or an entry. Removing an absent network is a no-op.
     *
     * @return
     *   true if an entry was removed
     */
    bool remove(const ip_network& network)
    {
        check_version(network.version());

        /* Record the path; nodes have no parent links */
        auto key = network.network().value();
        auto path = std::vector<std::pair<uint32_t, unsigned>>{};
        path.reserve(network.prefix_length());

        auto idx = root;
        for (unsigned bit = 0; bit < network.prefix_length(); bit++) {
            auto branch = bit_at_msb(key, bit, width());
            auto child = m_nodes[idx].children[branch];
            if (child == none) { return (false); }
            path.emplace_back(idx, branch);
            idx = child;
        }

        if (!m_nodes[idx].entry) { return (false); }
        m_nodes[idx].entry.reset();
        m_size--;

        while (!path.empty() && is_leaf(idx)) {
            auto [parent, branch] = path.back();
            path.pop_back();
            m_nodes[parent].children[branch] = none;
            release_node(idx);
            idx = parent;
        }

        IK_LOG(IK_LOG_TRACE, "Removed %s", to_string(network).c_str());
        return (true);
    }

    /**
     * Find the most specific stored network containing addr.
     * Throws version_mismatch_error if addr's version differs from the
     * trie's.
     */
    std::optional<match> longest_match(const ip_address& addr) const
    {
        check_version(addr.version());

        auto key = addr.value();
        auto idx = root;
        auto best = std::optional<uint32_t>{};
        for (unsigned bit = 0;; bit++) {
            if (m_nodes[idx].entry) { best = idx; }
            if (bit == width()) { break; }

            auto child = m_nodes[idx].children[bit_at_msb(key, bit, width())];
            if (child == none) { break; }
            idx = child;
        }

        if (!best) { return (std::nullopt); }
        const auto& entry = *m_nodes[*best].entry;
        return (match{entry.network, entry.value});
    }

    /* Stored value for exactly this network, if any */
    std::optional<T> find(const ip_network& network) const
    {
        check_version(network.version());

        auto key = network.network().value();
        auto idx = root;
        for (unsigned bit = 0; bit < network.prefix_length(); bit++) {
            idx = m_nodes[idx].children[bit_at_msb(key, bit, width())];
            if (idx == none) { return (std::nullopt); }
        }

        if (!m_nodes[idx].entry) { return (std::nullopt); }
        return (m_nodes[idx].entry->value);
    }

    /* Every stored network, in pre-order (shorter prefixes first) */
    std::vector<ip_network> networks() const
    {
        auto output = std::vector<ip_network>{};
        output.reserve(m_size);

        auto stack = std::vector<uint32_t>{root};
        while (!stack.empty()) {
            auto idx = stack.back();
            stack.pop_back();

            const auto& node = m_nodes[idx];
            if (node.entry) { output.push_back(node.entry->network); }
            /* Push one before zero so the zero branch is visited first */
            for (auto branch : {1, 0}) {
                if (node.children[branch] != none) {
                    stack.push_back(node.children[branch]);
                }
            }
        }

        return (output);
    }

    size_t size() const { return (m_size); }
    bool empty() const { return (m_size == 0); }

private:
    static constexpr uint32_t root = 0;
    static constexpr uint32_t none = UINT32_MAX;

    struct node_entry
    {
        ip_network network;
        T value;
    };

    struct node
    {
        std::array<uint32_t, 2> children = {none, none};
        std::optional<node_entry> entry;
    };

    unsigned width() const { return (net::width(m_version)); }

    void check_version(ip_version version) const
    {
        if (version != m_version) {
            throw version_mismatch_error(to_string(version)
                                         + " operand used with "
                                         + to_string(m_version) + " trie");
        }
    }

    bool is_leaf(uint32_t idx) const
    {
        const auto& node = m_nodes[idx];
        return (!node.entry && node.children[0] == none
                && node.children[1] == none);
    }

    uint32_t allocate_node()
    {
        if (!m_free.empty()) {
            auto idx = m_free.back();
            m_free.pop_back();
            return (idx);
        }
        m_nodes.emplace_back();
        return (static_cast<uint32_t>(m_nodes.size() - 1));
    }

    void release_node(uint32_t idx)
    {
        m_nodes[idx] = node{};
        m_free.push_back(idx);
    }

    ip_version m_version;
    std::vector<node> m_nodes;
    std::vector<uint32_t> m_free;
    size_t m_size = 0;
};

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_RADIX_TRIE_HPP_ */
