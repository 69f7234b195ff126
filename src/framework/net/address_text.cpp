#include <algorithm>
#include <cctype>
#include <vector>

#include "net/address_text.hpp"
#include "net/errors.hpp"

namespace ipkit::net {

static std::vector<std::string_view> split_string(std::string_view input,
                                                  char delimiter)
{
    std::vector<std::string_view> output;
    size_t cursor = 0;
    while (true) {
        auto pos = input.find(delimiter, cursor);
        if (pos == std::string_view::npos) {
            output.push_back(input.substr(cursor));
            break;
        }
        output.push_back(input.substr(cursor, pos - cursor));
        cursor = pos + 1;
    }
    return (output);
}

static std::string quote(std::string_view input)
{
    return ("\"" + std::string(input) + "\"");
}

static uint8_t parse_octet(std::string_view octet, std::string_view input)
{
    if (octet.empty()) {
        throw parse_error("Empty octet in IPv4 address " + quote(input));
    }
    if (octet.size() > 3
        || !std::all_of(octet.begin(), octet.end(), [](auto c) {
               return (std::isdigit(static_cast<unsigned char>(c)));
           })) {
        throw parse_error("Octet " + quote(octet)
                          + " is not a decimal number in " + quote(input));
    }
    if (octet.size() > 1 && octet.front() == '0') {
        throw parse_error("Octet " + quote(octet) + " has a leading zero in "
                          + quote(input));
    }

    unsigned value = 0;
    for (auto c : octet) { value = value * 10 + (c - '0'); }
    if (value > 255) {
        throw parse_error("Octet " + quote(octet) + " is out of range in "
                          + quote(input));
    }
    return (static_cast<uint8_t>(value));
}

uint32_t parse_ipv4_value(std::string_view input)
{
    auto octets = split_string(input, '.');
    if (octets.size() != 4) {
        throw parse_error("IPv4 address " + quote(input)
                          + " must have exactly 4 octets");
    }

    uint32_t value = 0;
    for (auto octet : octets) { value = (value << 8) | parse_octet(octet, input); }
    return (value);
}

std::string format_ipv4_value(uint32_t value)
{
    return (std::to_string((value >> 24) & 0xff) + "."
            + std::to_string((value >> 16) & 0xff) + "."
            + std::to_string((value >> 8) & 0xff) + "."
            + std::to_string(value & 0xff));
}

static uint16_t parse_hex_group(std::string_view group, std::string_view input)
{
    if (group.empty() || group.size() > 4
        || !std::all_of(group.begin(), group.end(), [](auto c) {
               return (std::isxdigit(static_cast<unsigned char>(c)));
           })) {
        throw parse_error("Group " + quote(group)
                          + " is not 1-4 hex digits in " + quote(input));
    }

    uint16_t value = 0;
    for (auto c : group) {
        auto digit = std::isdigit(static_cast<unsigned char>(c))
                         ? c - '0'
                         : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        value = static_cast<uint16_t>((value << 4) | digit);
    }
    return (value);
}

static void append_groups(std::vector<uint16_t>& groups,
                          std::string_view text,
                          std::string_view input)
{
    if (text.empty()) { return; }
    for (auto group : split_string(text, ':')) {
        groups.push_back(parse_hex_group(group, input));
    }
}

/*
 * Expand colon-hex text with at most one "::" into exactly count groups.
 */
static std::vector<uint16_t>
expand_groups(std::string_view text, size_t count, std::string_view input)
{
    std::vector<uint16_t> groups;

    auto compression = text.find("::");
    if (compression == std::string_view::npos) {
        append_groups(groups, text, input);
        if (groups.size() != count) {
            throw parse_error("IPv6 address " + quote(input) + " must have "
                              + std::to_string(count) + " groups, found "
                              + std::to_string(groups.size()));
        }
        return (groups);
    }

    if (text.find("::", compression + 2) != std::string_view::npos) {
        throw parse_error("IPv6 address " + quote(input)
                          + " has multiple :: compressions");
    }

    std::vector<uint16_t> tail;
    append_groups(groups, text.substr(0, compression), input);
    append_groups(tail, text.substr(compression + 2), input);

    /* "::" stands for at least one zero group */
    if (groups.size() + tail.size() >= count) {
        throw parse_error("IPv6 address " + quote(input)
                          + " has too many groups for :: compression");
    }

    groups.resize(count - tail.size(), 0);
    groups.insert(groups.end(), tail.begin(), tail.end());
    return (groups);
}

ipv6_groups parse_ipv6_groups(std::string_view input)
{
    if (input.find(":::") != std::string_view::npos) {
        throw parse_error("IPv6 address " + quote(input)
                          + " has too many consecutive colons");
    }

    auto last_colon = input.rfind(':');
    if (last_colon == std::string_view::npos) {
        throw parse_error(quote(input) + " is not an IPv6 address");
    }

    auto output = ipv6_groups{};
    auto tail = input.substr(last_colon + 1);
    if (tail.find('.') != std::string_view::npos) {
        /* Mixed notation: six hex groups followed by dotted-decimal */
        uint32_t ipv4 = 0;
        try {
            ipv4 = parse_ipv4_value(tail);
        } catch (const parse_error& e) {
            throw parse_error("Invalid IPv4 part " + quote(tail)
                              + " in mixed notation: " + e.what());
        }

        /* Keep a trailing "::", drop a lone separating colon */
        auto head = input.substr(0, last_colon + 1);
        if (head.size() < 2 || head.substr(head.size() - 2) != "::") {
            head.remove_suffix(1);
        }

        auto groups = expand_groups(head, 6, input);
        std::copy(groups.begin(), groups.end(), output.begin());
        output[6] = static_cast<uint16_t>(ipv4 >> 16);
        output[7] = static_cast<uint16_t>(ipv4 & 0xffff);
        return (output);
    }

    auto groups = expand_groups(input, 8, input);
    std::copy(groups.begin(), groups.end(), output.begin());
    return (output);
}

std::string format_ipv6_groups(const ipv6_groups& groups)
{
    auto all_zero = [&](size_t count) {
        return (std::all_of(groups.begin(), groups.begin() + count, [](auto g) {
            return (g == 0);
        }));
    };

    uint32_t low32 = (static_cast<uint32_t>(groups[6]) << 16) | groups[7];

    /* IPv4-mapped */
    if (all_zero(5) && groups[5] == 0xffff) {
        return ("::ffff:" + format_ipv4_value(low32));
    }

    /* IPv4-compatible, except :: and ::1 */
    if (all_zero(6) && low32 != 0 && low32 != 1) {
        return ("::" + format_ipv4_value(low32));
    }

    /* Longest run of two or more zero groups; the leftmost wins ties. */
    size_t best_start = groups.size();
    size_t best_length = 1;
    for (size_t idx = 0; idx < groups.size();) {
        if (groups[idx] != 0) {
            idx++;
            continue;
        }
        auto start = idx;
        while (idx < groups.size() && groups[idx] == 0) { idx++; }
        if (idx - start > best_length) {
            best_start = start;
            best_length = idx - start;
        }
    }

    static constexpr char hex_digits[] = "0123456789abcdef";
    auto format_group = [](uint16_t group) {
        std::string text;
        bool leading = true;
        for (int shift = 12; shift >= 0; shift -= 4) {
            auto nibble = (group >> shift) & 0xf;
            if (leading && nibble == 0 && shift != 0) { continue; }
            leading = false;
            text.push_back(hex_digits[nibble]);
        }
        return (text);
    };

    std::string output;
    for (size_t idx = 0; idx < groups.size(); idx++) {
        if (idx == best_start) {
            output += "::";
            idx += best_length - 1;
            continue;
        }
        if (!output.empty() && output.back() != ':') { output.push_back(':'); }
        output += format_group(groups[idx]);
    }
    return (output);
}

} // namespace ipkit::net
