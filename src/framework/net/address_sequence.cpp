#include "net/address_sequence.hpp"

namespace ipkit::net {

address_sequence::address_sequence(ip_version version,
                                   std::vector<span> spans,
                                   std::optional<uint64_t> limit)
    : m_version(version)
    , m_spans(std::move(spans))
    , m_limit(limit.value_or(std::numeric_limits<uint64_t>::max()))
{}

address_sequence::iterator address_sequence::begin() const
{
    return (m_limit == 0 ? end() : iterator(this, 0));
}

address_sequence::iterator address_sequence::end() const
{
    return (iterator(this, m_spans.size()));
}

address_sequence::iterator::iterator(const address_sequence* sequence,
                                     size_t span_idx)
    : m_sequence(sequence)
    , m_span(span_idx)
    , m_remaining(sequence->m_limit)
{
    if (m_span < m_sequence->m_spans.size()) {
        m_value = m_sequence->m_spans[m_span].first;
    }
}

ip_address address_sequence::iterator::operator*() const
{
    return (make_address(m_sequence->m_version, m_value));
}

address_sequence::iterator& address_sequence::iterator::operator++()
{
    const auto& spans = m_sequence->m_spans;
    if (m_span >= spans.size()) { return (*this); }

    if (--m_remaining == 0) {
        m_span = spans.size();
        return (*this);
    }

    /* Step to the next span before the value could wrap past the end */
    if (m_value == spans[m_span].second) {
        if (++m_span < spans.size()) { m_value = spans[m_span].first; }
    } else {
        m_value++;
    }

    return (*this);
}

address_sequence::iterator address_sequence::iterator::operator++(int)
{
    auto tmp = *this;
    operator++();
    return (tmp);
}

bool address_sequence::iterator::operator==(const iterator& other) const
{
    if (m_sequence != other.m_sequence || m_span != other.m_span) {
        return (false);
    }

    /* All end iterators are equal regardless of their last value */
    return (m_sequence == nullptr || m_span >= m_sequence->m_spans.size()
            || m_value == other.m_value);
}

} // namespace ipkit::net
