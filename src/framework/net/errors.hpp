#ifndef _IK_FRAMEWORK_NET_ERRORS_HPP_
#define _IK_FRAMEWORK_NET_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace ipkit::net {

/**
 * Common base for every failure raised by the address library, so callers
 * may either catch a specific kind or the whole family.
 */
struct error
{
    virtual ~error() = default;
};

/**
 * Malformed textual, numeric or byte input at a parse boundary.
 */
struct parse_error
    : std::runtime_error
    , error
{
    explicit parse_error(const std::string& what)
        : std::runtime_error(what)
    {}
};

/**
 * IPv4 and IPv6 operands were combined in a single operation.
 */
struct version_mismatch_error
    : std::invalid_argument
    , error
{
    explicit version_mismatch_error(const std::string& what)
        : std::invalid_argument(what)
    {}
};

/**
 * A numeric argument (prefix length, bit index, bit width) is outside of
 * its valid domain.
 */
struct out_of_range_error
    : std::out_of_range
    , error
{
    explicit out_of_range_error(const std::string& what)
        : std::out_of_range(what)
    {}
};

/**
 * A well-typed operation is undefined for the given state.
 */
struct invariant_error
    : std::logic_error
    , error
{
    explicit invariant_error(const std::string& what)
        : std::logic_error(what)
    {}
};

} // namespace ipkit::net

#endif /* _IK_FRAMEWORK_NET_ERRORS_HPP_ */
