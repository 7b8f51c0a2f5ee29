//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_SRC_RFC_DETAIL_RULES_HPP
#define HTTPEXT_SRC_RFC_DETAIL_RULES_HPP

#include <httpext/detail/config.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/alnum_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <cstdint>

namespace httpext {
namespace detail {

/*  tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
          / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
          / DIGIT / ALPHA
*/
constexpr grammar::lut_chars tchars =
    grammar::lut_chars(grammar::alnum_chars) +
    grammar::lut_chars("!#$%&'*+-.^_`|~");

//------------------------------------------------

/*  range-value = 1*DIGIT

    The value must fit in a std::int64_t.
*/
struct range_value_rule_t
{
    using value_type = std::int64_t;

    system::result<value_type>
    parse(
        char const*& it,
        char const* end) const noexcept;
};

constexpr range_value_rule_t range_value_rule{};

} // detail
} // httpext

#endif
