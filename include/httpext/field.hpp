//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_FIELD_HPP
#define HTTPEXT_FIELD_HPP

#include <httpext/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <iosfwd>

namespace httpext {

/** Known HTTP field names.

    @see
        @ref to_string.
*/
enum class field : unsigned short
{
    unknown = 0,

    accept_ranges,
    access_control_allow_credentials,
    access_control_allow_headers,
    access_control_allow_methods,
    access_control_allow_origin,
    access_control_expose_headers,
    access_control_max_age,
    content_range,
    origin,
    range,
    vary
};

/** Return the canonical name of a field.
*/
HTTPEXT_DECL
core::string_view
to_string(field f) noexcept;

/** Write the canonical name of a field to a stream.
*/
HTTPEXT_DECL
std::ostream&
operator<<(std::ostream& os, field f);

} // httpext

#endif
