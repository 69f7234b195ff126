#include <unordered_set>

#include "catch2/catch.hpp"

#include "net/errors.hpp"
#include "net/ip_address.hpp"

using namespace ipkit::net;

TEST_CASE("ip_address functionality checks", "[ip_address]")
{
    SECTION("constructor functionality checks")
    {
        /* valid */
        auto ref = make_ipv4(0x0A000001); /* 10.0.0.1 */
        REQUIRE(ip_address("10.0.0.1") == ref);
        REQUIRE(ip_address{10, 0, 0, 1} == ref);

        std::vector<uint8_t> addr{10, 0, 0, 1};
        REQUIRE(ip_address(addr.data(), addr.size()) == ref);

        auto v6 = ip_address{0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0,
                             0,    0,    0,    0,    0, 0, 0, 1};
        REQUIRE(v6.is_ipv6());
        REQUIRE(v6 == ip_address("2001:db8::1"));

        /* invalid */
        REQUIRE_THROWS_AS(ip_address("203.0.113"), parse_error);
        REQUIRE_THROWS_AS(ip_address("203.0.113.0.1"), parse_error);
        REQUIRE_THROWS_AS((ip_address{224, 0, 0, 0, 1}), parse_error);
        REQUIRE_THROWS_AS(make_address(ip_version::v4, uint128_t{1} << 32),
                          parse_error);
    }

    SECTION("strict dotted decimal")
    {
        REQUIRE_THROWS_AS(parse_ipv4("192.168.01.1"), parse_error);
        REQUIRE_THROWS_AS(parse_ipv4("256.0.0.1"), parse_error);
        REQUIRE_THROWS_AS(parse_ipv4("1..1.1"), parse_error);
        REQUIRE_THROWS_AS(parse_ipv4("+1.1.1.1"), parse_error);
        REQUIRE_THROWS_AS(parse_ipv4(""), parse_error);
        REQUIRE(to_string(parse_ipv4("0.0.0.0")) == "0.0.0.0");
        REQUIRE(to_string(parse_ipv4("255.255.255.255")) == "255.255.255.255");
    }

    SECTION("version detection")
    {
        REQUIRE(parse_address("192.0.2.1").version() == ip_version::v4);
        REQUIRE(parse_address("::1").version() == ip_version::v6);
        REQUIRE(is_ipv4_string("192.0.2.1"));
        REQUIRE(!is_ipv4_string("192.0.2.01"));
        REQUIRE(!is_ipv4_string("::1"));
        REQUIRE(is_ipv6_string("2001:db8::1"));
        REQUIRE(is_ipv6_string("::ffff:192.0.2.1"));
        REQUIRE(!is_ipv6_string("::256.1.1.1"));
        REQUIRE(!is_ipv6_string("192.0.2.1"));
    }

    SECTION("access by index")
    {
        ip_address test{198, 51, 100, 10};

        REQUIRE(test[0] == 198);
        REQUIRE(test[1] == 51);
        REQUIRE(test[2] == 100);
        REQUIRE(test[3] == 10);
        REQUIRE_THROWS(test[4]);

        REQUIRE(test.to_bytes() == std::vector<uint8_t>{198, 51, 100, 10});
        REQUIRE(ip_address("2001:db8::1").to_bytes().size() == 16);
    }

    SECTION("classification checks")
    {
        REQUIRE(ip_address{127, 0, 0, 1}.is_loopback());
        REQUIRE(ip_address("::1").is_loopback());
        REQUIRE(!ip_address{192, 0, 2, 1}.is_loopback());

        REQUIRE(ip_address("224.0.0.1").is_multicast());
        REQUIRE(ip_address("ff02::1").is_multicast());
        REQUIRE(!ip_address("2001:db8::1").is_multicast());

        REQUIRE(ip_address("169.254.10.1").is_linklocal());
        REQUIRE(ip_address("fe80::1").is_linklocal());
        REQUIRE(ip_address("febf::1").is_linklocal());
        REQUIRE(!ip_address("fec0::1").is_linklocal());
    }

    SECTION("check comparison operators")
    {
        ip_address a{198, 0, 2, 1};
        ip_address b{198, 51, 100, 12};
        ip_address c("198.51.100.12");

        REQUIRE(a < b);
        REQUIRE(a <= b);
        REQUIRE(b <= c);
        REQUIRE(b > a);
        REQUIRE(b >= a);
        REQUIRE(b >= c);
        REQUIRE(b == c);
        REQUIRE(a != b);
    }

    SECTION("mixed version comparisons")
    {
        auto v4 = ip_address("0.0.0.1");
        auto v6 = ip_address("::1");

        REQUIRE(v4 != v6);
        REQUIRE(v4.value() == v6.value());
        REQUIRE_THROWS_AS(v4 < v6, version_mismatch_error);
        REQUIRE_THROWS_AS(compare(v4, v6), version_mismatch_error);
    }

    SECTION("check string conversion")
    {
        REQUIRE(to_string(ip_address{203, 0, 113, 1}) == "203.0.113.1");
        REQUIRE(to_string(make_ipv4(0xcb007103)) == "203.0.113.3");
        REQUIRE(to_string(ip_version::v6) == "IPv6");
    }

    SECTION("hashing")
    {
        auto addresses = std::unordered_set<ip_address>{
            ip_address("10.0.0.1"), ip_address("10.0.0.1"), ip_address("::1")};
        REQUIRE(addresses.size() == 2);
    }
}
