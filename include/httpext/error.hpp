//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_ERROR_HPP
#define HTTPEXT_ERROR_HPP

#include <httpext/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace httpext {

/** Error codes returned by range operations.

    All of these indicate a problem with client input.
    None of them is retryable.
*/
enum class error
{
    /// Success
    ok = 0,

    /** A negative first index was combined with a last index.

        A negative first index indicates a suffix, and a
        suffix range cannot also supply a last index.
    */
    range_is_suffix,

    /** The range is structurally invalid.

        The first index is greater than the last index,
        the syntax is malformed, or input was left over.
    */
    range_invalid,

    /** A non-suffix range was requested from an empty collection.
    */
    range_unsatisfiable_zero_length,

    /** The range begins past the last element of the collection.
    */
    range_outside_constraints,

    /** Exactly one index of the range is bound.

        The range must be constrained before it
        can be formatted.
    */
    range_unbound
};

//------------------------------------------------

/** Error conditions corresponding to range errors.

    Each condition names the response a server
    should give for the errors it matches.
*/
enum class condition
{
    /** The range cannot be satisfied by the collection.

        This corresponds to HTTP 416 Range Not Satisfiable.
    */
    range_not_satisfiable = 1,

    /** The range expression is malformed.

        This corresponds to HTTP 400 Bad Request.
    */
    malformed_range
};

} // httpext

#include <httpext/impl/error.hpp>

#endif
