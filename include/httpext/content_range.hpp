//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_CONTENT_RANGE_HPP
#define HTTPEXT_CONTENT_RANGE_HPP

#include <httpext/detail/config.hpp>
#include <httpext/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <string>

namespace httpext {

/** Value returned by accessors of an unbound index.
*/
BOOST_INLINE_CONSTEXPR std::int64_t range_unconstrained = -1;

/** A single range over a collection.

    Holds the information carried by an HTTP Range
    header, and renders it as the body of a
    Content-Range header.

    Each index of the range is independently bound
    or unbound, which gives three shapes:

    @li A suffix range, "the last N items". Only the
        last index is bound, and holds `-N`.

    @li An open-ended range, "from `first` to the end".
        Only the first index is bound.

    @li A fixed range, the inclusive interval
        `[first, last]`. Both indexes are bound.

    Unbound indexes are resolved against the size of
    the collection by @ref constrain or @ref set_total.

    @par Example
    @code
    auto rv = parse_range( "bytes=-100" );
    if( rv.has_value() && rv->set_total( 200 ).has_value() )
    {
        // "bytes 100-199/200"
        std::string s = rv->format().value();
    }
    @endcode

    @par Thread Safety
    Distinct objects: Safe.
    Shared objects: Unsafe.

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7233"
        >Range Requests (rfc7233)</a>

    @see
        @ref parse_range,
        @ref make_content_range.
*/
class content_range
{
    std::string units_;
    std::int64_t first_ = 0;
    std::int64_t last_ = 0;
    std::int64_t total_ = 0;
    bool first_bound_ = false;
    bool last_bound_ = false;
    bool total_bound_ = false;

public:
    /** Constructor

        Default constructed ranges have empty
        units and no bound index.
    */
    content_range() = default;

    /** Constructor

        @param units The range unit, such as "bytes".
    */
    explicit
    content_range(
        core::string_view units)
        : units_(units)
    {
    }

    /** Return the range unit.
    */
    core::string_view
    units() const noexcept
    {
        return units_;
    }

    /** Bind the first index.

        @return An error if `first` is negative,
        or if the last index is bound and is less
        than `first`.

        @param first The zero-based first index.
    */
    HTTPEXT_DECL
    system::result<void>
    set_first(std::int64_t first) noexcept;

    /** Bind the last index.

        A negative value while the first index is
        unbound makes this a suffix range of
        `-last` items.

        @return An error if the first index is bound
        and is greater than `last`, or if `last` is
        less than `-INT64_MAX`.

        @param last The zero-based last index, or
        the negated suffix length.
    */
    HTTPEXT_DECL
    system::result<void>
    set_last(std::int64_t last) noexcept;

    /// Return the first index, or @ref range_unconstrained.
    std::int64_t
    first() const noexcept
    {
        if(! first_bound_)
            return range_unconstrained;
        return first_;
    }

    /// Return the last index, or @ref range_unconstrained.
    std::int64_t
    last() const noexcept
    {
        if(! last_bound_)
            return range_unconstrained;
        return last_;
    }

    /// Return the collection size, or @ref range_unconstrained.
    std::int64_t
    total() const noexcept
    {
        if(! total_bound_)
            return range_unconstrained;
        return total_;
    }

    /** Return the offset of the first item.

        @return The first index, or @ref range_unconstrained
        if it is not bound.
    */
    std::int64_t
    offset() const noexcept
    {
        return first();
    }

    /** Return the extent of the range.

        @return `last - first` for a fixed range,
        the suffix length for a suffix range, or
        @ref range_unconstrained otherwise.
    */
    HTTPEXT_DECL
    std::int64_t
    limit() const noexcept;

    /// Return true if the first index is unbound.
    bool
    is_suffix() const noexcept
    {
        return ! first_bound_;
    }

    /// Return true if both indexes are bound.
    bool
    is_fixed() const noexcept
    {
        return first_bound_ && last_bound_;
    }

    /// Return true if either index is unbound.
    bool
    is_unbounded() const noexcept
    {
        return ! first_bound_ || ! last_bound_;
    }

    /// Return true if the range starts at 0 and runs to the end.
    bool
    is_full_range() const noexcept
    {
        return first_bound_ && first_ == 0 && ! last_bound_;
    }

    /// Return true if the collection size is known.
    bool
    has_total() const noexcept
    {
        return total_bound_;
    }

    /** Return true if the range contains an offset.

        A negative offset counts from the end of the
        collection, and is contained if both indexes
        are bound and the last index is at least `-offset`.
        A non-negative offset is contained if both indexes
        are bound and it lies between them, inclusive.

        @param offset The offset to check.
    */
    HTTPEXT_DECL
    bool
    contains(std::int64_t offset) const noexcept;

    /** Resolve the range against a collection size.

        Unbound indexes are computed from `size`, and
        a last index past the end is clamped to it.
        Calling this again with the same size has
        no effect.

        @par Example
        @code
        content_range r( "items" );
        r.set_last( -10 );      // the last 10 items
        r.constrain( 25 );      // now [15, 24]
        @endcode

        @return An error if the range cannot be
        satisfied by a collection of `size` items:

        @li @ref error::range_unsatisfiable_zero_length
            if `size == 0` and the range is not a suffix.

        @li @ref error::range_outside_constraints
            if the first index is past the end, or the
            range is an empty suffix of a non-empty
            collection.

        @li @ref error::range_invalid
            if `size` is negative, or the first index
            is unbound and the last index is positive.

        @param size The number of items in the collection.
    */
    HTTPEXT_DECL
    system::result<void>
    constrain(std::int64_t size) noexcept;

    /** Resolve the range and record the collection size.

        This calls @ref constrain and, on success,
        records `total` for use by @ref format.

        @param total The number of items in the collection.
    */
    HTTPEXT_DECL
    system::result<void>
    set_total(std::int64_t total) noexcept;

    /** Return the range as a Content-Range value.

        The result has the form
        `<units> <first>-<last>/<total>`, where
        `<total>` is `*` if the size is not known.
        When neither index is bound, or when the
        collection is empty, the range part is a
        single `*` followed by `/<total>`.

        @return The formatted string, or
        @ref error::range_unbound if exactly one
        index is bound.

        @par BNF
        @code
        Content-Range       = byte-content-range
                            / other-content-range
        byte-content-range  = bytes-unit SP
                              ( byte-range-resp / unsatisfied-range )
        byte-range-resp     = byte-range "/" ( complete-length / "*" )
        unsatisfied-range   = "*" "/" complete-length
        @endcode

        @par Specification
        @li <a href="https://www.rfc-editor.org/rfc/rfc7233#section-4.2"
            >4.2. Content-Range (rfc7233)</a>
    */
    HTTPEXT_DECL
    system::result<std::string>
    format() const;
};

//------------------------------------------------

/** Return a fixed range.

    The indexes are bound in order through
    @ref content_range::set_first and
    @ref content_range::set_last, and the
    first error is returned.

    @param units The range unit.
    @param first The first index.
    @param last The last index.
*/
HTTPEXT_DECL
system::result<content_range>
make_content_range(
    core::string_view units,
    std::int64_t first,
    std::int64_t last);

/** Parse the value of an HTTP Range header.

    Only a single range is supported. Range
    parameters and multiple ranges are rejected.

    @par Example
    @code
    parse_range( "resources=-99" );  // last 99 resources
    parse_range( "resources=0-99" ); // 100 resources, [0, 99]
    parse_range( "resources=99-" );  // resources from 99 to the end
    @endcode

    @return The parsed range, or an error:

    @li @ref error::range_invalid if the input
        is malformed or the indexes are out of order.

    @li @ref error::range_is_suffix if a suffix
        range is followed by more input.

    @param s The header value.

    @see
        @ref range_rule.
*/
HTTPEXT_DECL
system::result<content_range>
parse_range(core::string_view s);

} // httpext

#endif
