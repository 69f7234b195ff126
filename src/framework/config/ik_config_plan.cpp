#include <algorithm>
#include <memory>
#include <regex>
#include <unordered_set>

#include "config/ik_config_plan.hpp"
#include "core/ik_log.h"

namespace ipkit::config {

/* Pool ids double as CLI arguments, so keep them shell friendly */
static tl::expected<void, std::string> validate_pool_id(const std::string& id)
{
    static const auto id_pattern = std::regex("[a-z0-9]+(-[a-z0-9]+)*");

    if (!std::regex_match(id, id_pattern)) {
        return (tl::make_unexpected(
            "Pool id \"" + id
            + "\" must be lower-case letters and digits, optionally joined "
              "by single hyphens"));
    }
    return {};
}

static std::optional<std::string> get_string(const YAML::Node& node,
                                             const std::string& key)
{
    if (!node[key] || !node[key].IsScalar()) { return (std::nullopt); }
    return (node[key].as<std::string>());
}

static tl::expected<pool_config, std::string>
parse_pool(const YAML::Node& node, size_t idx)
{
    auto where = "Pool " + std::to_string(idx);
    if (!node.IsMap()) {
        return (tl::make_unexpected(where + " must be a map"));
    }

    auto id = get_string(node, "id");
    if (!id) { return (tl::make_unexpected(where + " is missing an id")); }
    if (auto valid = validate_pool_id(*id); !valid) {
        return (tl::make_unexpected(valid.error()));
    }
    where = "Pool " + *id;

    auto network = get_string(node, "network");
    if (!network) {
        return (tl::make_unexpected(where + " is missing a network"));
    }

    try {
        auto config = pool_config{*id, net::parse_network(*network), {}};

        if (auto reserved = node["reserved"]) {
            if (!reserved.IsSequence()) {
                return (tl::make_unexpected(where
                                            + " reserved entries must be a "
                                              "list"));
            }
            for (const auto& item : reserved) {
                config.reserved = config.reserved.union_with(
                    net::parse_range_set(item.as<std::string>()));
            }
        }

        auto span = config.network.to_range();
        for (const auto& range : config.reserved.ranges()) {
            if (!span.contains(range)) {
                return (tl::make_unexpected(
                    where + " reserved entry " + to_string(range)
                    + " is outside of " + to_string(config.network)));
            }
        }

        return (config);
    } catch (const std::exception& e) {
        return (tl::make_unexpected(where + ": " + e.what()));
    }
}

static tl::expected<route_config, std::string>
parse_route(const YAML::Node& node, size_t idx)
{
    auto where = "Route " + std::to_string(idx);
    if (!node.IsMap()) {
        return (tl::make_unexpected(where + " must be a map"));
    }

    auto network = get_string(node, "network");
    if (!network) {
        return (tl::make_unexpected(where + " is missing a network"));
    }

    auto next_hop = get_string(node, "next-hop");
    if (!next_hop || next_hop->empty()) {
        return (tl::make_unexpected(where + " (" + *network
                                    + ") is missing a next-hop"));
    }

    try {
        return (route_config{net::parse_network(*network), *next_hop});
    } catch (const net::parse_error& e) {
        return (tl::make_unexpected(where + ": " + e.what()));
    }
}

tl::expected<plan, std::string> ik_config_parse_plan(const YAML::Node& root)
{
    auto output = plan{};
    if (!root || root.IsNull()) { return (output); }

    if (auto pools = root["pools"]) {
        if (!pools.IsSequence()) {
            return (tl::make_unexpected("\"pools\" must be a list"));
        }

        auto ids = std::unordered_set<std::string>{};
        for (size_t idx = 0; idx < pools.size(); idx++) {
            auto pool = parse_pool(pools[idx], idx);
            if (!pool) { return (tl::make_unexpected(pool.error())); }
            if (!ids.insert(pool->id).second) {
                return (tl::make_unexpected("Duplicate pool id " + pool->id));
            }
            output.pools.push_back(std::move(*pool));
        }
    }

    if (auto routes = root["routes"]) {
        if (!routes.IsSequence()) {
            return (tl::make_unexpected("\"routes\" must be a list"));
        }

        for (size_t idx = 0; idx < routes.size(); idx++) {
            auto route = parse_route(routes[idx], idx);
            if (!route) { return (tl::make_unexpected(route.error())); }
            output.routes.push_back(std::move(*route));
        }
    }

    IK_LOG(IK_LOG_DEBUG,
           "Parsed %zu pool%s and %zu route%s",
           output.pools.size(),
           output.pools.size() == 1 ? "" : "s",
           output.routes.size(),
           output.routes.size() == 1 ? "" : "s");

    return (output);
}

const pool_config* ik_config_find_pool(const plan& p, std::string_view id)
{
    auto found = std::find_if(p.pools.begin(),
                              p.pools.end(),
                              [&](const auto& pool) { return (pool.id == id); });
    return (found == p.pools.end() ? nullptr : std::addressof(*found));
}

net::address_allocator ik_config_make_allocator(const pool_config& pool)
{
    return (net::address_allocator(pool.network, pool.reserved));
}

route_tables ik_config_make_route_tables(const std::vector<route_config>& routes)
{
    auto tables = route_tables{};
    for (const auto& route : routes) {
        auto& trie = route.network.address().is_ipv4() ? tables.ipv4
                                                       : tables.ipv6;
        trie.insert(route.network, route.next_hop);
    }
    return (tables);
}

} // namespace ipkit::config
