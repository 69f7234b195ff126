#include <algorithm>

#include "net/bitmath.hpp"
#include "net/errors.hpp"

namespace ipkit::net {

void validate_width(unsigned width)
{
    if (width != ipv4_width && width != ipv6_width) {
        throw out_of_range_error(std::to_string(width)
                                 + " is not a valid address width (32 or 128)");
    }
}

static void validate_prefix(unsigned prefix, unsigned width)
{
    validate_width(width);
    if (prefix > width) {
        throw out_of_range_error(std::to_string(prefix) + " is larger than "
                                 + std::to_string(width));
    }
}

uint128_t all_ones(unsigned width)
{
    validate_width(width);
    return (width == ipv6_width ? ~uint128_t{0}
                                : (uint128_t{1} << width) - 1);
}

uint128_t prefix_mask(unsigned prefix, unsigned width)
{
    validate_prefix(prefix, width);

    /* Shifting a 128 bit value by 128 is undefined */
    if (prefix == 0) { return (0); }
    return ((all_ones(width) << (width - prefix)) & all_ones(width));
}

uint128_t host_mask(unsigned prefix, unsigned width)
{
    return (~prefix_mask(prefix, width) & all_ones(width));
}

uint128_t network_of(uint128_t value, unsigned prefix, unsigned width)
{
    return (value & prefix_mask(prefix, width));
}

uint128_t broadcast_of(uint128_t value, unsigned prefix, unsigned width)
{
    return ((value | host_mask(prefix, width)) & all_ones(width));
}

bool bit_at_msb(uint128_t value, unsigned bit, unsigned width)
{
    validate_width(width);
    if (bit >= width) {
        throw out_of_range_error(std::to_string(bit) + " is not between 0 and "
                                 + std::to_string(width - 1));
    }

    return ((value >> (width - 1 - bit)) & 1);
}

std::optional<aligned_block>
max_aligned_block(uint128_t start, uint128_t end, unsigned width)
{
    validate_width(width);
    if (end < start) { return (std::nullopt); }

    /*
     * The host mask of a prefix is the block size minus one, which keeps the
     * arithmetic in range even for the 2^128 sized /0 block.
     */
    for (unsigned prefix = 0; prefix <= width; prefix++) {
        auto mask = host_mask(prefix, width);
        if ((start & mask) == 0 && mask <= end - start) {
            return (aligned_block{prefix, start});
        }
    }

    /* Not reached; a /width block always fits. */
    return (aligned_block{width, start});
}

std::string to_string(uint128_t value)
{
    if (value == 0) { return ("0"); }

    std::string output;
    while (value) {
        output.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(output.begin(), output.end());
    return (output);
}

} // namespace ipkit::net
