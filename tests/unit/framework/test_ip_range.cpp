#include "catch2/catch.hpp"

#include "net/errors.hpp"
#include "net/ip_network.hpp"
#include "net/ip_range.hpp"

using namespace ipkit::net;

static std::vector<std::string> cidr_strings(const ip_range& range)
{
    auto output = std::vector<std::string>{};
    for (const auto& cidr : range.to_cidrs()) {
        output.push_back(to_string(cidr));
    }
    return (output);
}

TEST_CASE("ip_range functionality checks", "[ip_range]")
{
    SECTION("constructor functionality checks")
    {
        auto range = ip_range(ip_address("10.0.0.1"), ip_address("10.0.0.10"));
        REQUIRE(range.start() == ip_address("10.0.0.1"));
        REQUIRE(range.end() == ip_address("10.0.0.10"));
        REQUIRE(range.size() == address_count{10});

        REQUIRE_THROWS_AS(ip_range(ip_address("10.0.0.1"), ip_address("::1")),
                          version_mismatch_error);
        REQUIRE_THROWS_AS(
            ip_range(ip_address("10.0.0.10"), ip_address("10.0.0.1")),
            parse_error);
    }

    SECTION("parsing checks")
    {
        REQUIRE(parse_range("10.0.0.1-10.0.0.10")
                == parse_range("10.0.0.1 - 10.0.0.10"));
        REQUIRE(to_string(ip_range("2001:db8::1 - 2001:db8::ff"))
                == "2001:db8::1-2001:db8::ff");

        REQUIRE_THROWS_AS(parse_range("10.0.0.1"), parse_error);
        REQUIRE_THROWS_AS(parse_range("10.0.0.1 - ::1"), parse_error);
        REQUIRE_THROWS_AS(parse_range("10.0.0.9 - 10.0.0.1"), parse_error);
        REQUIRE_THROWS_AS(parse_range("10.0.0.1 - 10.0.0.2 - 10.0.0.3"),
                          parse_error);
        REQUIRE_THROWS_AS(parse_range("10.0.0.1 - "), parse_error);
    }

    SECTION("containment and overlap")
    {
        auto range = parse_range("10.0.0.10 - 10.0.0.20");

        REQUIRE(range.contains(ip_address("10.0.0.10")));
        REQUIRE(range.contains(ip_address("10.0.0.20")));
        REQUIRE(!range.contains(ip_address("10.0.0.21")));
        REQUIRE(!range.contains(ip_address("::a00:a")));
        REQUIRE(range.contains(parse_range("10.0.0.12 - 10.0.0.14")));
        REQUIRE(!range.contains(parse_range("10.0.0.12 - 10.0.0.24")));
        REQUIRE(range.overlaps(parse_range("10.0.0.20 - 10.0.0.24")));
        REQUIRE(!range.overlaps(parse_range("10.0.0.21 - 10.0.0.24")));
    }

    SECTION("enumeration with a limit")
    {
        auto range = parse_range("10.0.0.250 - 10.0.1.5");

        auto all = range.ips();
        REQUIRE(std::distance(all.begin(), all.end()) == 12);

        auto seq = range.ips(3);
        auto limited = std::vector<ip_address>(seq.begin(), seq.end());
        REQUIRE(limited.size() == 3);
        REQUIRE(to_string(limited.back()) == "10.0.0.252");

        REQUIRE(range.ips(0).empty());
    }

    SECTION("the last address of the space is reachable")
    {
        auto range = parse_range("ffff:ffff:ffff:ffff:ffff:ffff:ffff:fffe - "
                                 "ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff");
        auto seq = range.ips();
        REQUIRE(std::distance(seq.begin(), seq.end()) == 2);
    }
}

TEST_CASE("ip_range CIDR covering checks", "[ip_range]")
{
    SECTION("aligned ranges are a single block")
    {
        REQUIRE(cidr_strings(parse_range("10.0.0.0 - 10.0.0.255"))
                == std::vector<std::string>{"10.0.0.0/24"});
        REQUIRE(cidr_strings(parse_range("10.0.0.5 - 10.0.0.5"))
                == std::vector<std::string>{"10.0.0.5/32"});
    }

    SECTION("unaligned ranges")
    {
        REQUIRE(cidr_strings(parse_range("10.0.0.1 - 10.0.0.10"))
                == std::vector<std::string>{"10.0.0.1/32",
                                            "10.0.0.2/31",
                                            "10.0.0.4/30",
                                            "10.0.0.8/31",
                                            "10.0.0.10/32"});
        REQUIRE(cidr_strings(parse_range("192.168.0.0 - 192.168.2.255"))
                == std::vector<std::string>{"192.168.0.0/23", "192.168.2.0/24"});
    }

    SECTION("the whole address space")
    {
        REQUIRE(cidr_strings(parse_range("0.0.0.0 - 255.255.255.255"))
                == std::vector<std::string>{"0.0.0.0/0"});
        REQUIRE(cidr_strings(parse_range(
                    "::-ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"))
                == std::vector<std::string>{"::/0"});
        REQUIRE(cidr_strings(parse_range(
                    "::1-ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"))
                    .size()
                == 128);
    }

    SECTION("covering blocks sum to the range size")
    {
        auto range = parse_range("10.1.2.3 - 10.9.8.7");
        auto total = address_count{};
        for (const auto& cidr : range.to_cidrs()) { total += cidr.size(); }
        REQUIRE(total == range.size());
    }
}
