//
// Copyright (c) 2026 The httpext authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <httpext/server/middleware.hpp>
#include <utility>

namespace httpext {

void
middleware_set::
use(middleware m)
{
    v_.emplace_back(std::move(m));
}

void
middleware_set::
use_handler(handler h)
{
    v_.emplace_back(
        [h = std::move(h)](handler next) -> handler
        {
            return [h, next = std::move(next)](
                route_params& rp)
            {
                h(rp);
                next(rp);
            };
        });
}

handler
middleware_set::
apply(handler h) const
{
    // wrap from the back so the front runs first
    for(auto it = v_.rbegin(); it != v_.rend(); ++it)
        h = (*it)(std::move(h));
    return h;
}

} // httpext
