//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/field.hpp>
#include <ostream>

namespace httpext {

core::string_view
to_string(field f) noexcept
{
    switch(f)
    {
    case field::accept_ranges: return "Accept-Ranges";
    case field::access_control_allow_credentials: return "Access-Control-Allow-Credentials";
    case field::access_control_allow_headers: return "Access-Control-Allow-Headers";
    case field::access_control_allow_methods: return "Access-Control-Allow-Methods";
    case field::access_control_allow_origin: return "Access-Control-Allow-Origin";
    case field::access_control_expose_headers: return "Access-Control-Expose-Headers";
    case field::access_control_max_age: return "Access-Control-Max-Age";
    case field::content_range: return "Content-Range";
    case field::origin: return "Origin";
    case field::range: return "Range";
    case field::vary: return "Vary";
    default:
        break;
    }
    return "<unknown-field>";
}

std::ostream&
operator<<(std::ostream& os, field f)
{
    return os << to_string(f);
}

} // httpext
