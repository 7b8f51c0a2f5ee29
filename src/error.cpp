//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/error.hpp>

namespace httpext {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "httpext";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::ok: return "success";
    case error::range_is_suffix: return
        "first index in range is negative, indicating a suffix; "
        "no last index may be supplied";
    case error::range_invalid: return
        "first index in range must be <= last index";
    case error::range_unsatisfiable_zero_length: return
        "range can satisfy a zero-length set";
    case error::range_outside_constraints: return
        "range begins outside of the total number of elements";
    case error::range_unbound: return
        "range has one unbound index and cannot be formatted";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "httpext";
}

std::string
condition_cat_type::
message(int cv) const
{
    return message(cv, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int cv,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(cv))
    {
    case condition::range_not_satisfiable: return "range not satisfiable";
    case condition::malformed_range: return "malformed range";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int cv) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(cv))
    {
    case condition::range_not_satisfiable:
        return
            ec == error::range_unsatisfiable_zero_length ||
            ec == error::range_outside_constraints;

    case condition::malformed_range:
        return
            ec == error::range_is_suffix ||
            ec == error::range_invalid ||
            ec == error::range_unbound;

    default:
        return false;
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail
} // httpext
