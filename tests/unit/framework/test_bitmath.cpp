#include "catch2/catch.hpp"

#include "net/address_count.hpp"
#include "net/bitmath.hpp"
#include "net/errors.hpp"

using namespace ipkit::net;

TEST_CASE("bit mask functionality checks", "[bitmath]")
{
    SECTION("prefix and host masks")
    {
        REQUIRE(prefix_mask(0, ipv4_width) == 0);
        REQUIRE(prefix_mask(24, ipv4_width) == 0xffffff00);
        REQUIRE(prefix_mask(32, ipv4_width) == 0xffffffff);
        REQUIRE(host_mask(24, ipv4_width) == 0xff);
        REQUIRE(host_mask(0, ipv4_width) == 0xffffffff);

        REQUIRE(prefix_mask(128, ipv6_width) == ~uint128_t{0});
        REQUIRE(host_mask(0, ipv6_width) == ~uint128_t{0});
        REQUIRE(prefix_mask(64, ipv6_width) == ~uint128_t{0} << 64);
    }

    SECTION("network and broadcast")
    {
        REQUIRE(network_of(0xc0a80142, 24, ipv4_width) == 0xc0a80100);
        REQUIRE(broadcast_of(0xc0a80142, 24, ipv4_width) == 0xc0a801ff);
        REQUIRE(broadcast_of(0, 0, ipv6_width) == ~uint128_t{0});
    }

    SECTION("bit testing from the most significant bit")
    {
        REQUIRE(bit_at_msb(0x80000000, 0, ipv4_width));
        REQUIRE(!bit_at_msb(0x80000000, 1, ipv4_width));
        REQUIRE(bit_at_msb(1, 31, ipv4_width));
        REQUIRE(bit_at_msb(1, 127, ipv6_width));
        REQUIRE_THROWS_AS(bit_at_msb(1, 32, ipv4_width), out_of_range_error);
    }

    SECTION("invalid widths and prefixes")
    {
        REQUIRE_THROWS_AS(all_ones(64), out_of_range_error);
        REQUIRE_THROWS_AS(prefix_mask(33, ipv4_width), out_of_range_error);
        REQUIRE_THROWS_AS(host_mask(129, ipv6_width), out_of_range_error);
    }
}

TEST_CASE("aligned block search checks", "[bitmath]")
{
    SECTION("largest block wins")
    {
        auto block = max_aligned_block(0, 0xffffffff, ipv4_width);
        REQUIRE(block);
        REQUIRE(block->prefix == 0);
        REQUIRE(block->start == 0);

        block = max_aligned_block(0, ~uint128_t{0}, ipv6_width);
        REQUIRE(block);
        REQUIRE(block->prefix == 0);
    }

    SECTION("alignment limits the block")
    {
        /* 10.0.0.1 is only aligned to itself */
        auto block = max_aligned_block(0x0a000001, 0x0a0000ff, ipv4_width);
        REQUIRE(block);
        REQUIRE(block->prefix == 32);

        /* 10.0.0.4 - 10.0.0.255 starts with a /30 */
        block = max_aligned_block(0x0a000004, 0x0a0000ff, ipv4_width);
        REQUIRE(block);
        REQUIRE(block->prefix == 30);
    }

    SECTION("range end limits the block")
    {
        auto block = max_aligned_block(0x0a000000, 0x0a000005, ipv4_width);
        REQUIRE(block);
        REQUIRE(block->prefix == 30);
    }

    SECTION("empty span")
    {
        REQUIRE(!max_aligned_block(5, 4, ipv4_width));
    }
}

TEST_CASE("address count checks", "[bitmath]")
{
    SECTION("decimal rendering")
    {
        REQUIRE(to_string(uint128_t{0}) == "0");
        REQUIRE(to_string(address_count{256}) == "256");
        REQUIRE(to_string(address_count::power_of_two(128))
                == "340282366920938463463374607431768211456");
        REQUIRE(to_string(address_count{~uint128_t{0}})
                == "340282366920938463463374607431768211455");
    }

    SECTION("spans")
    {
        REQUIRE(address_count::span(10, 10) == address_count{1});
        REQUIRE(address_count::span(0, ~uint128_t{0})
                == address_count::power_of_two(128));
        REQUIRE(!address_count::span(0, ~uint128_t{0}).fits_u128());
    }

    SECTION("arithmetic and comparison")
    {
        auto half = address_count::power_of_two(127);
        REQUIRE(half + half == address_count::power_of_two(128));
        REQUIRE(address_count::power_of_two(128) > address_count{~uint128_t{0}});
        REQUIRE((address_count::power_of_two(128) >> 1) == half);
        REQUIRE(address_count{512}.to_double() == 512.0);

        auto full = address_count::power_of_two(128);
        REQUIRE_THROWS_AS(full += full, out_of_range_error);
        REQUIRE_THROWS_AS(address_count::power_of_two(129), out_of_range_error);
    }
}
