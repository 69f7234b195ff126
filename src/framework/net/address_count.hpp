#ifndef _IK_FRAMEWORK_NET_ADDRESS_COUNT_HPP_
#define _IK_FRAMEWORK_NET_ADDRESS_COUNT_HPP_

#include <ostream>
#include <string>

#include "net/bitmath.hpp"

namespace ipkit::net {

/**
 * Exact count of addresses.
 *
 * The IPv6 address space holds 2^128 addresses, one more than a 128 bit
 * integer can represent, so counts carry an extra high bit.
 */
class address_count
{
public:
    constexpr address_count() = default;
    constexpr address_count(uint128_t value)
        : m_low(value)
    {}

    /**
     * 2^exponent; exponent must not exceed 128.
     */
    static address_count power_of_two(unsigned exponent);

    /**
     * Number of values in the inclusive span [first, last].
     */
    static address_count span(uint128_t first, uint128_t last);

    bool fits_u128() const { return (!m_high); }
    uint128_t low() const { return (m_low); }
    bool high() const { return (m_high); }

    double to_double() const;

    address_count& operator+=(const address_count& rhs);
    address_count& operator>>=(unsigned shift);

private:
    uint128_t m_low = 0;
    bool m_high = false;
};

std::string to_string(const address_count&);

int compare(const address_count&, const address_count&);

inline address_count operator+(address_count lhs, const address_count& rhs)
{
    lhs += rhs;
    return (lhs);
}

inline address_count operator>>(address_count lhs, unsigned shift)
{
    lhs >>= shift;
    return (lhs);
}

inline bool operator==(const address_count& lhs, const address_count& rhs)
{
    return compare(lhs, rhs) == 0;
}
inline bool operator!=(const address_count& lhs, const address_count& rhs)
{
    return compare(lhs, rhs) != 0;
}
inline bool operator<(const address_count& lhs, const address_count& rhs)
{
    return compare(lhs, rhs) < 0;
}
inline bool operator>(const address_count& lhs, const address_count& rhs)
{
    return compare(lhs, rhs) > 0;
}
inline bool operator<=(const address_count& lhs, const address_count& rhs)
{
    return compare(lhs, rhs) <= 0;
}
inline bool operator>=(const address_count& lhs, const address_count& rhs)
{
    return compare(lhs, rhs) >= 0;
}

inline std::ostream& operator<<(std::ostream& os, const address_count& value)
{
    os << to_string(value);
    return (os);
}

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_ADDRESS_COUNT_HPP_ */
