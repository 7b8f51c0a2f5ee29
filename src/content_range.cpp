//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/content_range.hpp>
#include <httpext/rfc/range_rule.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <limits>

namespace httpext {

system::result<void>
content_range::
set_first(std::int64_t first) noexcept
{
    if(first < 0)
        HTTPEXT_RETURN_EC(
            error::range_is_suffix);
    if(last_bound_ && first > last_)
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    first_ = first;
    first_bound_ = true;
    return {};
}

system::result<void>
content_range::
set_last(std::int64_t last) noexcept
{
    // the suffix length must be representable
    if(last < -(std::numeric_limits<
            std::int64_t>::max)())
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    if(first_bound_ && last < first_)
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    last_ = last;
    last_bound_ = true;
    return {};
}

std::int64_t
content_range::
limit() const noexcept
{
    if(is_fixed())
        return last_ - first_;
    if(last_bound_ && last_ <= 0)
        return -last_;
    return range_unconstrained;
}

bool
content_range::
contains(std::int64_t offset) const noexcept
{
    if(offset < 0)
    {
        if(! first_bound_ || ! last_bound_)
            return false;
        // last_ >= -offset, without negating offset
        return offset >= -last_;
    }
    if(! first_bound_ || ! last_bound_)
        return false;
    return first_ <= offset && offset <= last_;
}

system::result<void>
content_range::
constrain(std::int64_t size) noexcept
{
    if(size < 0)
        HTTPEXT_RETURN_EC(
            error::range_invalid);

    // a last index with no first is not a suffix
    if(! first_bound_ && last_bound_ && last_ > 0)
        HTTPEXT_RETURN_EC(
            error::range_invalid);

    if(size == 0)
    {
        if(first_bound_)
            HTTPEXT_RETURN_EC(
                error::range_unsatisfiable_zero_length);
        // empty suffix of an empty collection,
        // the first index stays unbound
        last_ = 0;
        last_bound_ = true;
        return {};
    }

    if(! first_bound_)
    {
        if(! last_bound_)
        {
            // nothing bound selects everything
            first_ = 0;
            last_ = size - 1;
            first_bound_ = true;
            last_bound_ = true;
            return {};
        }
        // last_ holds the negated suffix length
        if(last_ == 0)
            HTTPEXT_RETURN_EC(
                error::range_outside_constraints);
        first_ = size + last_;
        if(first_ < 0)
            first_ = 0;
        last_ = size - 1;
        first_bound_ = true;
        return {};
    }

    if(first_ > size - 1)
        HTTPEXT_RETURN_EC(
            error::range_outside_constraints);

    if(! last_bound_ || last_ > size - 1)
    {
        last_ = size - 1;
        last_bound_ = true;
    }
    return {};
}

system::result<void>
content_range::
set_total(std::int64_t total) noexcept
{
    auto rv = constrain(total);
    if(rv.has_error())
        return rv;
    total_ = total;
    total_bound_ = true;
    return {};
}

system::result<std::string>
content_range::
format() const
{
    std::string max = "*";
    if(total_bound_)
        max = std::to_string(total_);

    std::string s(units_);
    s.push_back(' ');

    // unsatisfied-range
    if( (! first_bound_ && ! last_bound_) ||
        (total_bound_ && total_ == 0))
    {
        s.append("*/");
        s.append(max);
        return s;
    }

    if(first_bound_ != last_bound_)
        HTTPEXT_RETURN_EC(
            error::range_unbound);

    s.append(std::to_string(first_));
    s.push_back('-');
    s.append(std::to_string(last_));
    s.push_back('/');
    s.append(max);
    return s;
}

//------------------------------------------------

system::result<content_range>
make_content_range(
    core::string_view units,
    std::int64_t first,
    std::int64_t last)
{
    content_range r(units);
    auto rv = r.set_first(first);
    if(rv.has_error())
        return rv.error();
    rv = r.set_last(last);
    if(rv.has_error())
        return rv.error();
    return r;
}

system::result<content_range>
parse_range(core::string_view s)
{
    auto rv = grammar::parse(s, range_rule);
    if(rv.has_value())
        return rv;
    // input after a complete range
    if(rv.error() == grammar::error::leftover)
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    return rv.error();
}

} // httpext
