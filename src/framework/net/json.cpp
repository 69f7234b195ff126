#include <algorithm>
#include <iterator>

#include "net/json.hpp"

namespace ipkit::net {

void to_json(nlohmann::json& j, const ip_address& addr) { j = to_string(addr); }

void from_json(const nlohmann::json& j, ip_address& addr)
{
    addr = parse_address(j.get<std::string>());
}

void to_json(nlohmann::json& j, const ip_network& network)
{
    j = to_string(network);
}

void to_json(nlohmann::json& j, const ip_range& range) { j = to_string(range); }

void to_json(nlohmann::json& j, const range_set& set)
{
    j = nlohmann::json::array();
    for (const auto& range : set.ranges()) { j.push_back(to_string(range)); }
}

void from_json(const nlohmann::json& j, range_set& set)
{
    auto ranges = std::vector<ip_range>{};
    std::transform(std::begin(j),
                   std::end(j),
                   std::back_inserter(ranges),
                   [](const auto& j_range) {
                       return (parse_range(j_range.template get<std::string>()));
                   });
    set = range_set(std::move(ranges));
}

nlohmann::json describe(const ip_network& network)
{
    /* Sizes may exceed 64 bits, so they are emitted as strings */
    auto canonical = ip_network(network.network(), network.prefix_length());
    auto j = nlohmann::json{{"network", to_string(canonical)},
                            {"version", to_string(network.version())},
                            {"prefix_length", network.prefix_length()},
                            {"netmask", to_string(network.netmask())},
                            {"first_address", to_string(network.network())},
                            {"last_address", to_string(network.last_address())},
                            {"size", to_string(network.size())}};

    if (network.address().is_ipv4()) {
        j["broadcast"] = to_string(network.broadcast());
    }

    /* Host bounds with the default edge handling always exist */
    j["first_host"] = to_string(network.first_host());
    j["last_host"] = to_string(network.last_host());

    return (j);
}

nlohmann::json describe(const address_allocator& allocator)
{
    return (nlohmann::json{
        {"parent", to_string(allocator.parent())},
        {"taken", allocator.taken()},
        {"available", to_string(allocator.available_count())},
        {"utilization", allocator.utilization()}});
}

} // namespace ipkit::net

namespace nlohmann {

ipkit::net::ip_network
adl_serializer<ipkit::net::ip_network>::from_json(const json& j)
{
    return (ipkit::net::parse_network(j.get<std::string>()));
}

ipkit::net::ip_range
adl_serializer<ipkit::net::ip_range>::from_json(const json& j)
{
    return (ipkit::net::parse_range(j.get<std::string>()));
}

} // namespace nlohmann
