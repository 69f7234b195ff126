#ifndef _IK_FRAMEWORK_NET_BITMATH_HPP_
#define _IK_FRAMEWORK_NET_BITMATH_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

namespace ipkit::net {

/**
 * Using 128 bit types makes arithmetic operations on IPv6 addresses
 * much easier to implement. IPv4 values use the low 32 bits.
 */
static_assert(std::is_integral_v<__int128>, "128 bit types must be integral");
using uint128_t = unsigned __int128;

constexpr unsigned ipv4_width = 32;
constexpr unsigned ipv6_width = 128;

/**
 * Verify that width is one of the supported address widths (32 or 128).
 * Throws out_of_range_error otherwise.
 */
void validate_width(unsigned width);

/**
 * All bits of the given width set.
 */
uint128_t all_ones(unsigned width);

/**
 * Mask with the top prefix bits of width set, the rest zero.
 * @param[in] prefix
 *   Number of leading one bits; must be in [0, width]
 * @param[in] width
 *   Address width in bits; must be 32 or 128
 */
uint128_t prefix_mask(unsigned prefix, unsigned width);

/**
 * Complement of prefix_mask(), confined to width bits.
 */
uint128_t host_mask(unsigned prefix, unsigned width);

uint128_t network_of(uint128_t value, unsigned prefix, unsigned width);
uint128_t broadcast_of(uint128_t value, unsigned prefix, unsigned width);

/**
 * Test the bit at position bit counted from the most significant bit of a
 * width-bit value; bit must be in [0, width).
 */
bool bit_at_msb(uint128_t value, unsigned bit, unsigned width);

struct aligned_block
{
    unsigned prefix;
    uint128_t start;
};

/**
 * Find the largest power-of-two sized block starting at start that is
 * aligned to its own size and ends at or before end.
 *
 * Prefix lengths are searched from the largest block (prefix 0) to the
 * smallest (prefix == width), so the first hit is the largest block.
 *
 * @return
 *   the block, or std::nullopt when end < start
 */
std::optional<aligned_block>
max_aligned_block(uint128_t start, uint128_t end, unsigned width);

/**
 * Render a 128 bit value in decimal.
 */
std::string to_string(uint128_t value);

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_BITMATH_HPP_ */
