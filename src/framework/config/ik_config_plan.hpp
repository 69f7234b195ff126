#ifndef _IK_CONFIG_PLAN_HPP_
#define _IK_CONFIG_PLAN_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"

#include "net/address_allocator.hpp"
#include "net/ip_network.hpp"
#include "net/radix_trie.hpp"
#include "net/range_set.hpp"

namespace ipkit::config {

/* An address pool and the addresses reserved out of it */
struct pool_config
{
    std::string id;
    net::ip_network network;
    net::range_set reserved;
};

struct route_config
{
    net::ip_network network;
    std::string next_hop;
};

struct plan
{
    std::vector<pool_config> pools;
    std::vector<route_config> routes;
};

/* Longest prefix match tables keyed by next hop, one per IP version */
struct route_tables
{
    net::radix_trie<std::string> ipv4 =
        net::radix_trie<std::string>(net::ip_version::v4);
    net::radix_trie<std::string> ipv6 =
        net::radix_trie<std::string>(net::ip_version::v6);

    std::optional<net::radix_trie<std::string>::match>
    lookup(const net::ip_address& addr) const
    {
        return (addr.is_ipv4() ? ipv4.longest_match(addr)
                               : ipv6.longest_match(addr));
    }
};

/*
 * Parse the "pools" and "routes" sections of a configuration.
 *
 * @param[in] root
 *   root node of a loaded configuration; a null node yields an empty plan
 *
 * @return
 *  the plan, or an error naming the first offending entry.
 */
tl::expected<plan, std::string> ik_config_parse_plan(const YAML::Node& root);

/* Look up a pool by id */
const pool_config* ik_config_find_pool(const plan&, std::string_view id);

/* Allocator over the pool network with its reserved addresses taken */
net::address_allocator ik_config_make_allocator(const pool_config&);

route_tables ik_config_make_route_tables(const std::vector<route_config>&);

} // namespace ipkit::config

#endif /* _IK_CONFIG_PLAN_HPP_ */
