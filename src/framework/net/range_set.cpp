#include <algorithm>
#include <cctype>

#include "net/errors.hpp"
#include "net/range_set.hpp"

namespace ipkit::net {

static void check_versions(const std::vector<ip_range>& ranges)
{
    if (ranges.empty()) { return; }

    auto version = ranges.front().version();
    if (std::any_of(ranges.begin(), ranges.end(), [&](const auto& range) {
            return (range.version() != version);
        })) {
        throw version_mismatch_error(
            "Range set members must all be the same IP version");
    }
}

static void check_versions(const range_set& lhs, const range_set& rhs)
{
    auto lhs_version = lhs.version();
    auto rhs_version = rhs.version();
    if (lhs_version && rhs_version && *lhs_version != *rhs_version) {
        throw version_mismatch_error("Cannot combine " + to_string(*lhs_version)
                                     + " and " + to_string(*rhs_version)
                                     + " range sets");
    }
}

/*
 * Sort by start and merge overlapping or adjacent ranges. All ranges must
 * be the same version.
 */
static std::vector<ip_range> normalize(std::vector<ip_range> ranges)
{
    std::sort(ranges.begin(), ranges.end(), [](const auto& a, const auto& b) {
        return (a.start().value() < b.start().value());
    });

    auto output = std::vector<ip_range>{};
    for (const auto& range : ranges) {
        if (output.empty()) {
            output.push_back(range);
            continue;
        }

        auto& last = output.back();
        auto start = range.start().value();
        auto last_end = last.end().value();
        /* start > last_end implies start - 1 cannot wrap */
        if (start <= last_end || start - 1 == last_end) {
            if (range.end().value() > last_end) {
                last = ip_range(last.start(), range.end());
            }
        } else {
            output.push_back(range);
        }
    }

    return (output);
}

range_set::range_set(std::vector<ip_range> ranges)
{
    check_versions(ranges);
    m_ranges = normalize(std::move(ranges));
}

range_set range_set::from_networks(const std::vector<ip_network>& networks)
{
    auto ranges = std::vector<ip_range>{};
    ranges.reserve(networks.size());
    std::transform(networks.begin(),
                   networks.end(),
                   std::back_inserter(ranges),
                   [](const auto& network) { return (network.to_range()); });
    return (range_set(std::move(ranges)));
}

range_set range_set::union_with(const range_set& other) const
{
    check_versions(*this, other);

    auto ranges = m_ranges;
    ranges.insert(ranges.end(), other.m_ranges.begin(), other.m_ranges.end());
    return (range_set(std::move(ranges)));
}

range_set range_set::intersect(const range_set& other) const
{
    check_versions(*this, other);

    auto ranges = std::vector<ip_range>{};
    for (const auto& lhs : m_ranges) {
        for (const auto& rhs : other.m_ranges) {
            if (!lhs.overlaps(rhs)) { continue; }
            ranges.emplace_back(std::max(lhs.start(), rhs.start()),
                                std::min(lhs.end(), rhs.end()));
        }
    }
    return (range_set(std::move(ranges)));
}

range_set range_set::subtract(const range_set& other) const
{
    check_versions(*this, other);

    auto result = m_ranges;
    for (const auto& sub : other.m_ranges) {
        auto next = std::vector<ip_range>{};
        for (const auto& range : result) {
            if (!range.overlaps(sub)) {
                next.push_back(range);
                continue;
            }

            auto start = range.start().value();
            auto end = range.end().value();
            auto sub_start = sub.start().value();
            auto sub_end = sub.end().value();
            if (sub_start > start) {
                next.emplace_back(range.start(),
                                  make_address(version().value(), sub_start - 1));
            }
            if (sub_end < end) {
                next.emplace_back(make_address(version().value(), sub_end + 1),
                                  range.end());
            }
        }
        result = std::move(next);
    }

    return (range_set(std::move(result)));
}

bool range_set::contains(const ip_address& addr) const
{
    return (std::any_of(m_ranges.begin(), m_ranges.end(), [&](const auto& range) {
        return (range.contains(addr));
    }));
}

bool range_set::contains(const ip_network& network) const
{
    auto span = network.to_range();
    return (std::any_of(m_ranges.begin(), m_ranges.end(), [&](const auto& range) {
        return (range.contains(span));
    }));
}

address_count range_set::size() const
{
    auto total = address_count{};
    for (const auto& range : m_ranges) { total += range.size(); }
    return (total);
}

std::optional<ip_version> range_set::version() const
{
    if (m_ranges.empty()) { return (std::nullopt); }
    return (m_ranges.front().version());
}

std::vector<ip_network> range_set::to_cidrs() const
{
    auto output = std::vector<ip_network>{};
    for (const auto& range : m_ranges) {
        auto cidrs = range.to_cidrs();
        output.insert(output.end(), cidrs.begin(), cidrs.end());
    }
    return (output);
}

address_sequence range_set::ips(std::optional<uint64_t> limit) const
{
    auto spans = std::vector<address_sequence::span>{};
    spans.reserve(m_ranges.size());
    for (const auto& range : m_ranges) {
        spans.emplace_back(range.start().value(), range.end().value());
    }
    return (address_sequence(version().value_or(ip_version::v4),
                             std::move(spans), limit));
}

static std::string_view trim(std::string_view str)
{
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front())))
        str.remove_prefix(1);
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back())))
        str.remove_suffix(1);
    return (str);
}

static ip_range parse_item(std::string_view item)
{
    if (item.find('/') != std::string_view::npos) {
        return (parse_network(item).to_range());
    }
    if (item.find('-') != std::string_view::npos) {
        return (parse_range(item));
    }
    auto addr = parse_address(item);
    return (ip_range(addr, addr));
}

range_set parse_range_set(std::string_view str)
{
    auto ranges = std::vector<ip_range>{};
    while (!str.empty()) {
        auto comma = str.find(',');
        auto item = trim(str.substr(0, comma));
        if (item.empty()) {
            throw parse_error("Empty item in address list");
        }
        ranges.push_back(parse_item(item));
        if (comma == std::string_view::npos) { break; }
        str.remove_prefix(comma + 1);
        if (trim(str).empty()) {
            throw parse_error("Empty item in address list");
        }
    }

    try {
        return (range_set(std::move(ranges)));
    } catch (const version_mismatch_error& e) {
        throw parse_error(e.what());
    }
}

std::string to_string(const range_set& set)
{
    auto output = std::string{};
    for (const auto& range : set.ranges()) {
        if (!output.empty()) { output += ", "; }
        output += to_string(range);
    }
    return (output);
}

} // namespace ipkit::net
