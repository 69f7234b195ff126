#ifndef _IK_FRAMEWORK_NET_JSON_HPP_
#define _IK_FRAMEWORK_NET_JSON_HPP_

#include "nlohmann/json.hpp"

#include "net/address_allocator.hpp"
#include "net/ip_address.hpp"
#include "net/ip_network.hpp"
#include "net/ip_range.hpp"
#include "net/range_set.hpp"

/*
 * Values serialize to their canonical text and deserialize by parsing it;
 * malformed text throws parse_error.
 */
namespace ipkit::net {

void to_json(nlohmann::json&, const ip_address&);
void from_json(const nlohmann::json&, ip_address&);

void to_json(nlohmann::json&, const ip_network&);
void to_json(nlohmann::json&, const ip_range&);

/* Array of "start-end" strings */
void to_json(nlohmann::json&, const range_set&);
void from_json(const nlohmann::json&, range_set&);

/* Summary of a network: bounds, usable hosts and size */
nlohmann::json describe(const ip_network&);

/* Summary of an allocator: parent, taken ranges and utilization */
nlohmann::json describe(const address_allocator&);

} // namespace ipkit::net

namespace nlohmann {

/* Networks and ranges have no empty state to deserialize into */
template <> struct adl_serializer<ipkit::net::ip_network>
{
    static ipkit::net::ip_network from_json(const json& j);
    static void to_json(json& j, const ipkit::net::ip_network& network)
    {
        ipkit::net::to_json(j, network);
    }
};

template <> struct adl_serializer<ipkit::net::ip_range>
{
    static ipkit::net::ip_range from_json(const json& j);
    static void to_json(json& j, const ipkit::net::ip_range& range)
    {
        ipkit::net::to_json(j, range);
    }
};

} // namespace nlohmann

#endif /* _IK_FRAMEWORK_NET_JSON_HPP_ */
