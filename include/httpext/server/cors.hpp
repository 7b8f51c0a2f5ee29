//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_SERVER_CORS_HPP
#define HTTPEXT_SERVER_CORS_HPP

#include <httpext/detail/config.hpp>
#include <httpext/server/route_params.hpp>
#include <boost/core/detail/string_view.hpp>
#include <chrono>
#include <initializer_list>
#include <string>
#include <vector>

namespace httpext {

/** A Cross-Origin Resource Sharing policy.

    The policy holds the allowed origins, methods
    and headers, and writes the matching
    `Access-Control-*` fields to a response.
    The output depends only on the policy and
    the request `Origin` field.

    @par Example
    @code
    cors_policy policy;
    policy.allow_origins({ "https://example.com" });
    policy.allow_methods({ "GET", "HEAD" });
    policy.expose_headers({ "Content-Range" });
    policy.max_age = std::chrono::hours( 1 );

    middleware_set m;
    m.use_handler( policy );
    @endcode

    @par Specification
    @li <a href="https://fetch.spec.whatwg.org/#http-cors-protocol"
        >CORS protocol (Fetch Standard)</a>
*/
class cors_policy
{
    std::vector<std::string> origins_;
    std::vector<std::string> methods_;
    std::vector<std::string> allow_headers_;
    std::vector<std::string> expose_headers_;
    bool allow_all_origins_ = false;
    bool allow_all_methods_ = false;
    bool allow_all_headers_ = false;

public:
    /// Max age for the preflight cache.
    std::chrono::seconds max_age{ 0 };

    /// If true, allow credentials.
    bool allow_credentials = false;

    /** Add origins to the allow list.

        This disables @ref allow_all_origins.
    */
    HTTPEXT_DECL
    void
    allow_origins(
        std::initializer_list<core::string_view> init);

    /// Allow any origin, clearing the allow list.
    HTTPEXT_DECL
    void
    allow_all_origins() noexcept;

    /** Add methods to the allow list.

        This disables @ref allow_all_methods.
    */
    HTTPEXT_DECL
    void
    allow_methods(
        std::initializer_list<core::string_view> init);

    /// Allow any method, clearing the allow list.
    HTTPEXT_DECL
    void
    allow_all_methods() noexcept;

    /** Add request headers to the allow list.

        This disables @ref allow_all_headers.
    */
    HTTPEXT_DECL
    void
    allow_headers(
        std::initializer_list<core::string_view> init);

    /// Allow any request header, clearing the allow list.
    HTTPEXT_DECL
    void
    allow_all_headers() noexcept;

    /// Add response headers exposed to the client.
    HTTPEXT_DECL
    void
    expose_headers(
        std::initializer_list<core::string_view> init);

    /// Return true if the origin is allowed.
    HTTPEXT_DECL
    bool
    origin_allowed(
        core::string_view origin) const noexcept;

    /** Write the CORS fields for a request.

        @param req The request whose `Origin` is checked.
        @param res The response receiving the fields.
    */
    HTTPEXT_DECL
    void
    write_headers(
        request const& req,
        response& res) const;

    /** Handle a request.

        Equivalent to `write_headers( rp.req, rp.res )`.
    */
    void
    operator()(route_params& rp) const
    {
        write_headers(rp.req, rp.res);
    }
};

} // httpext

#endif
