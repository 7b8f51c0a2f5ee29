//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/rfc/range_rule.hpp>
#include "src/rfc/detail/rules.hpp"

#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/token_rule.hpp>
#include <charconv>

namespace httpext {

namespace detail {

auto
range_value_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    auto const start = it;
    auto digits = grammar::parse(
        it, end, grammar::token_rule(
            grammar::digit_chars));
    if(! digits)
    {
        it = start;
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    }

    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(
        start, it, v);
    if(ec != std::errc() || ptr != it)
    {
        it = start;
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    }
    return v;
}

} // detail

//------------------------------------------------

namespace implementation_defined {

auto
range_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    auto units = grammar::parse(
        it, end, grammar::token_rule(
            detail::tchars));
    if(! units)
        HTTPEXT_RETURN_EC(
            error::range_invalid);

    if(it == end || *it != '=')
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    ++it;

    content_range r(*units);

    bool const suffix =
        it != end && *it == '-';
    if(suffix)
        ++it;
    auto first = grammar::parse(
        it, end, detail::range_value_rule);
    if(! first)
        return first.error();

    if(suffix && *first != 0)
    {
        // suffix-range
        auto rv = r.set_last(- *first);
        if(rv.has_error())
            return rv.error();
        if(it != end)
            HTTPEXT_RETURN_EC(
                error::range_is_suffix);
        return r;
    }

    auto rv = r.set_first(*first);
    if(rv.has_error())
        return rv.error();
    if(it == end)
        return r;

    if(*it != '-')
        HTTPEXT_RETURN_EC(
            error::range_invalid);
    ++it;
    if(it == end)
        return r;

    auto last = grammar::parse(
        it, end, detail::range_value_rule);
    if(! last)
        return last.error();
    rv = r.set_last(*last);
    if(rv.has_error())
        return rv.error();
    return r;
}

} // implementation_defined

} // httpext
