//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_RFC_RANGE_RULE_HPP
#define HTTPEXT_RFC_RANGE_RULE_HPP

#include <httpext/detail/config.hpp>
#include <httpext/content_range.hpp>
#include <boost/system/result.hpp>

namespace httpext {

namespace implementation_defined {
struct range_rule_t
{
    using value_type = content_range;

    HTTPEXT_DECL
    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching a single range in a Range header

    @par Value Type
    @code
    using value_type = content_range;
    @endcode

    @par Example
    @code
    system::result< content_range > rv =
        grammar::parse( "bytes=0-499", range_rule );
    @endcode

    @par BNF
    @code
    range           = range-unit "=" range-spec
    range-unit      = token
    range-spec      = suffix-range
                    / first-pos [ "-" [ last-pos ] ]
    suffix-range    = "-" 1*DIGIT
    first-pos       = 1*DIGIT
    last-pos        = 1*DIGIT
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7233#section-3.1"
        >3.1. Range (rfc7233)</a>

    @see
        @ref content_range,
        @ref parse_range.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::range_rule_t range_rule{};

} // httpext

#endif
