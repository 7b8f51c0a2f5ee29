//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTPEXT_SERVER_MIDDLEWARE_HPP
#define HTTPEXT_SERVER_MIDDLEWARE_HPP

#include <httpext/detail/config.hpp>
#include <httpext/server/route_params.hpp>
#include <functional>
#include <vector>

namespace httpext {

/** A function which handles a request.
*/
using handler = std::function<void(route_params&)>;

/** A function which wraps a handler.

    The returned handler decides whether, and
    when, to invoke the handler it wraps.
*/
using middleware = std::function<handler(handler)>;

/** An ordered set of middleware.

    Middleware run in the order they were added.
    The first middleware added is the first to
    see each request.

    @par Example
    @code
    middleware_set m;
    m.use_handler( cors_policy() );
    m.use( []( handler next ) -> handler
    {
        return [next]( route_params& rp )
        {
            rp.res.headers.set( field::accept_ranges, "bytes" );
            next( rp );
        };
    });

    handler h = m.apply( serve );
    @endcode
*/
class middleware_set
{
    std::vector<middleware> v_;

public:
    /// Return true if no middleware were added.
    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    /// Add a middleware to the end of the set.
    HTTPEXT_DECL
    void
    use(middleware m);

    /** Add a handler to the end of the set.

        The handler runs before the next
        middleware or handler in the chain.
    */
    HTTPEXT_DECL
    void
    use_handler(handler h);

    /** Wrap a handler with the middleware.

        @return A handler which runs every
        middleware in order and then `h`.
        If the set is empty, this is `h`.
    */
    HTTPEXT_DECL
    handler
    apply(handler h) const;
};

} // httpext

#endif
