//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_HTTP_ERROR_HPP
#define HTTPEXT_HTTP_ERROR_HPP

#include <httpext/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/system/error_code.hpp>
#include <string>

namespace httpext {

/** A structured error for an HTTP API.

    Holds the status code to send, a
    machine-readable identifier which is unique
    within the service, a human-readable message,
    and an optional detail value.

    A null detail is the same as no detail.

    @par Example
    @code
    http_error const not_found(
        404, "not_found", "The resource does not exist." );

    http_error e = not_found.with_detail(
        json::value{ { "path", "/items/7" } } );

    std::string body = json::serialize( e.to_json() );
    // {"id":"not_found","message":"The resource does not exist.","detail":{"path":"/items/7"}}
    @endcode
*/
class http_error
{
    unsigned status_ = 0;
    std::string id_;
    std::string message_;
    json::value detail_;

public:
    /** Constructor

        @param status The HTTP status code.
        @param id The unique identifier.
        @param message The human-readable message.
    */
    HTTPEXT_DECL
    http_error(
        unsigned status,
        core::string_view id,
        core::string_view message);

    /// Return the HTTP status code.
    unsigned
    status() const noexcept
    {
        return status_;
    }

    /// Return the unique identifier.
    core::string_view
    id() const noexcept
    {
        return id_;
    }

    /// Return the human-readable message.
    core::string_view
    message() const noexcept
    {
        return message_;
    }

    /// Return the detail, which may be null.
    json::value const&
    detail() const noexcept
    {
        return detail_;
    }

    /// Return true if a detail is present.
    bool
    has_detail() const noexcept
    {
        return ! detail_.is_null();
    }

    /** Return a copy of this error with a detail.

        @param detail The detail to attach.
    */
    HTTPEXT_DECL
    http_error
    with_detail(json::value detail) const;

    /** Return a one-line description.

        The string has the form
        `<message> (<detail>) <HTTP <status>:<id>>`,
        where the parenthesized detail, serialized
        as JSON, is present only if there is one.
    */
    HTTPEXT_DECL
    std::string
    to_string() const;

    /** Return true if two errors are the same.

        The id, status and message are compared.
        The detail is not.
    */
    HTTPEXT_DECL
    bool
    equal(http_error const& other) const noexcept;

    friend
    bool
    operator==(
        http_error const& e0,
        http_error const& e1) noexcept
    {
        return e0.equal(e1);
    }

    /** Return the error as JSON.

        The result is an object with the keys
        "id" and "message", and "detail" if
        there is one. The status is not included.
    */
    HTTPEXT_DECL
    json::value
    to_json() const;

    friend
    void
    tag_invoke(
        json::value_from_tag,
        json::value& jv,
        http_error const& e)
    {
        jv = e.to_json();
    }
};

//------------------------------------------------

/** Return the HTTP error for a range error.

    Errors matching @ref condition::range_not_satisfiable
    become 416 "range_not_satisfiable", and all others
    become 400 "bad_range". The message is the message
    of the error code.

    @param ec The error returned by a range operation.
*/
HTTPEXT_DECL
http_error
to_http_error(system::error_code const& ec);

} // httpext

#endif
