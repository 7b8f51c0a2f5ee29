//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_SERVER_ROUTE_PARAMS_HPP
#define HTTPEXT_SERVER_ROUTE_PARAMS_HPP

#include <httpext/detail/config.hpp>
#include <httpext/fields.hpp>
#include <string>

namespace httpext {

/** An incoming request as seen by a handler.
*/
struct request
{
    /// The request method, such as "GET".
    std::string method;

    /// The request target.
    std::string target;

    /// The request fields.
    fields headers;
};

/** The response being built by handlers.
*/
struct response
{
    /// The status code.
    unsigned status = 200;

    /// The response fields.
    fields headers;

    /// The response body.
    std::string body;
};

/** Parameters passed to a route handler.

    @par Thread Safety
    Distinct objects: Safe.
    Shared objects: Unsafe.
*/
struct route_params
{
    /// The request.
    request req;

    /// The response.
    response res;
};

} // httpext

#endif
