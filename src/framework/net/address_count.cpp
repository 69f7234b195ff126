#include <algorithm>
#include <array>
#include <cmath>

#include "net/address_count.hpp"
#include "net/errors.hpp"

namespace ipkit::net {

address_count address_count::power_of_two(unsigned exponent)
{
    if (exponent > ipv6_width) {
        throw out_of_range_error(std::to_string(exponent) + " is larger than "
                                 + std::to_string(ipv6_width));
    }

    auto count = address_count{};
    if (exponent == ipv6_width) {
        count.m_high = true;
    } else {
        count.m_low = uint128_t{1} << exponent;
    }
    return (count);
}

address_count address_count::span(uint128_t first, uint128_t last)
{
    /* last - first + 1 carries into the high bit only for the full space */
    auto count = address_count{last - first};
    count += address_count{1};
    return (count);
}

double address_count::to_double() const
{
    auto value = static_cast<double>(m_low);
    return (m_high ? value + std::ldexp(1.0, ipv6_width) : value);
}

address_count& address_count::operator+=(const address_count& rhs)
{
    auto sum = m_low + rhs.m_low;
    auto carry = sum < m_low;
    if ((m_high && rhs.m_high) || ((m_high || rhs.m_high) && carry)) {
        throw out_of_range_error("address count exceeds 2^129 - 1");
    }
    m_high = m_high || rhs.m_high || carry;
    m_low = sum;
    return (*this);
}

address_count& address_count::operator>>=(unsigned shift)
{
    if (shift == 0) { return (*this); }

    if (shift > ipv6_width) {
        m_low = 0;
    } else if (shift == ipv6_width) {
        m_low = m_high ? 1 : 0;
    } else {
        m_low >>= shift;
        if (m_high) { m_low |= uint128_t{1} << (ipv6_width - shift); }
    }
    m_high = false;
    return (*this);
}

std::string to_string(const address_count& count)
{
    if (count.fits_u128()) { return (to_string(count.low())); }

    /* Long division by 10 over 32 bit limbs, most significant first. */
    auto limbs = std::array<uint32_t, 5>{
        1,
        static_cast<uint32_t>(count.low() >> 96),
        static_cast<uint32_t>(count.low() >> 64),
        static_cast<uint32_t>(count.low() >> 32),
        static_cast<uint32_t>(count.low())};

    auto is_zero = [&]() {
        return (std::all_of(
            limbs.begin(), limbs.end(), [](auto limb) { return (limb == 0); }));
    };

    std::string output;
    while (!is_zero()) {
        uint64_t remainder = 0;
        for (auto& limb : limbs) {
            auto current = (remainder << 32) | limb;
            limb = static_cast<uint32_t>(current / 10);
            remainder = current % 10;
        }
        output.push_back(static_cast<char>('0' + remainder));
    }
    std::reverse(output.begin(), output.end());
    return (output);
}

int compare(const address_count& lhs, const address_count& rhs)
{
    if (lhs.high() != rhs.high()) return (lhs.high() ? 1 : -1);
    if (lhs.low() < rhs.low())
        return (-1);
    else if (lhs.low() > rhs.low())
        return (1);
    else
        return (0);
}

} // namespace ipkit::net
